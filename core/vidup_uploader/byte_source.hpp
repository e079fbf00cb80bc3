// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIDUP_BYTE_SOURCE_HPP
#define VIDUP_BYTE_SOURCE_HPP

#include <cstdint>
#include <memory>
#include <string>

#include "file_access.hpp"

namespace vidup {
namespace uploader {

/**
 * Random-access source of the bytes being uploaded.
 *
 * read() may be called concurrently from several chunk workers.
 */
class ByteSource {
public:
  virtual ~ByteSource() = default;

  /**
   * Total length in bytes
   */
  virtual uint64_t size() const = 0;

  /**
   * Read bytes [offset, offset + length)
   *
   * @throws UploadError (kSourceRead) if the range is out of bounds or the
   *         underlying read comes up short
   */
  virtual std::string read(uint64_t offset, uint64_t length) const = 0;
};

/**
 * Byte source over an in-memory buffer
 */
class MemoryByteSource : public ByteSource {
public:
  explicit MemoryByteSource(std::string data)
      : data_(std::move(data)) {}

  uint64_t size() const override {
    return data_.size();
  }

  std::string read(uint64_t offset, uint64_t length) const override;

private:
  std::string data_;
};

/**
 * Byte source over a file on disk.
 *
 * The size is captured at construction. Each read() opens its own reader, so
 * concurrent reads share no file position.
 */
class FileByteSource : public ByteSource {
public:
  /**
   * @throws UploadError (kSourceRead) if the path is not a readable regular file
   */
  explicit FileByteSource(const std::string& path);

  FileByteSource(const std::string& path, std::shared_ptr<const IFileAccess> files);

  uint64_t size() const override {
    return size_;
  }

  std::string read(uint64_t offset, uint64_t length) const override;

  const std::string& path() const {
    return path_;
  }

private:
  std::string path_;
  std::shared_ptr<const IFileAccess> files_;
  uint64_t size_ = 0;
};

/**
 * A file handed to the upload engine: display name, the media type the caller
 * declared for it (may be empty), and its bytes.
 */
struct SourceFile {
  std::string name;
  std::string declared_mime_type;
  std::shared_ptr<const ByteSource> source;

  uint64_t size() const {
    return source ? source->size() : 0;
  }

  /**
   * Build a SourceFile for a path on disk, named after the path's filename.
   */
  static SourceFile fromPath(const std::string& path, const std::string& declared_mime_type = "");
};

}  // namespace uploader
}  // namespace vidup

#endif  // VIDUP_BYTE_SOURCE_HPP
