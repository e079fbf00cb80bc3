// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIDUP_FILE_ACCESS_HPP
#define VIDUP_FILE_ACCESS_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace vidup {
namespace uploader {

/**
 * A file opened for ranged binary reads.
 *
 * One handle serves one chunk read; handles are never shared between threads.
 */
class IRangeReader {
public:
  virtual ~IRangeReader() = default;

  /**
   * Position the next read at an absolute byte offset.
   * @return false if the offset cannot be reached
   */
  virtual bool seek(uint64_t offset) = 0;

  /**
   * Read up to `length` bytes into `buffer`.
   * @return Number of bytes stored; less than `length` at end of file or on
   *         an I/O error
   */
  virtual uint64_t readInto(char* buffer, uint64_t length) = 0;
};

/**
 * Filesystem access behind FileByteSource, injectable for tests.
 */
class IFileAccess {
public:
  virtual ~IFileAccess() = default;

  /**
   * Size of a regular file; std::nullopt when the path is missing, is a
   * directory, or cannot be stat'ed
   */
  virtual std::optional<uint64_t> regularFileSize(const std::string& path) const = 0;

  /**
   * Open a file for binary reading. Returns nullptr when it cannot be opened.
   */
  virtual std::unique_ptr<IRangeReader> openForRead(const std::string& path) const = 0;
};

/**
 * IFileAccess over the local disk (std::filesystem + std::ifstream)
 */
class LocalFileAccess : public IFileAccess {
public:
  std::optional<uint64_t> regularFileSize(const std::string& path) const override;
  std::unique_ptr<IRangeReader> openForRead(const std::string& path) const override;
};

}  // namespace uploader
}  // namespace vidup

#endif  // VIDUP_FILE_ACCESS_HPP
