// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "file_access.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>

namespace vidup {
namespace uploader {

namespace {

class IfstreamRangeReader : public IRangeReader {
public:
  explicit IfstreamRangeReader(const std::string& path)
      : in_(path, std::ios::in | std::ios::binary) {}

  bool isOpen() const {
    return in_.is_open();
  }

  bool seek(uint64_t offset) override {
    in_.clear();
    in_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    return !in_.fail();
  }

  uint64_t readInto(char* buffer, uint64_t length) override {
    in_.read(buffer, static_cast<std::streamsize>(length));
    if (in_.bad()) {
      return 0;
    }
    return static_cast<uint64_t>(in_.gcount());
  }

private:
  std::ifstream in_;
};

}  // namespace

std::optional<uint64_t> LocalFileAccess::regularFileSize(const std::string& path) const {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return std::nullopt;
  }
  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    return std::nullopt;
  }
  return static_cast<uint64_t>(size);
}

std::unique_ptr<IRangeReader> LocalFileAccess::openForRead(const std::string& path) const {
  auto reader = std::make_unique<IfstreamRangeReader>(path);
  if (!reader->isOpen()) {
    return nullptr;
  }
  return reader;
}

}  // namespace uploader
}  // namespace vidup
