// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "byte_source.hpp"

#include <filesystem>

#include "upload_errors.hpp"

namespace vidup {
namespace uploader {

namespace {

void checkRange(uint64_t offset, uint64_t length, uint64_t size) {
  if (offset > size || length > size - offset) {
    throw UploadError(
      ErrorKind::kSourceRead, "Byte range [" + std::to_string(offset) + ", " +
                                std::to_string(offset + length) + ") exceeds source size " +
                                std::to_string(size)
    );
  }
}

}  // namespace

std::string MemoryByteSource::read(uint64_t offset, uint64_t length) const {
  checkRange(offset, length, data_.size());
  return data_.substr(static_cast<size_t>(offset), static_cast<size_t>(length));
}

FileByteSource::FileByteSource(const std::string& path)
    : FileByteSource(path, std::make_shared<LocalFileAccess>()) {}

FileByteSource::FileByteSource(const std::string& path, std::shared_ptr<const IFileAccess> files)
    : path_(path)
    , files_(std::move(files)) {
  const auto size = files_->regularFileSize(path_);
  if (!size) {
    throw UploadError(ErrorKind::kSourceRead, "File not found or not a regular file: " + path_);
  }
  size_ = *size;
}

std::string FileByteSource::read(uint64_t offset, uint64_t length) const {
  checkRange(offset, length, size_);

  auto reader = files_->openForRead(path_);
  if (!reader) {
    throw UploadError(ErrorKind::kSourceRead, "Cannot open file for reading: " + path_);
  }

  std::string buffer(static_cast<size_t>(length), '\0');
  if (length == 0) {
    return buffer;
  }

  if (!reader->seek(offset)) {
    throw UploadError(
      ErrorKind::kSourceRead, "Seek to offset " + std::to_string(offset) + " failed: " + path_
    );
  }

  // The file may have shrunk since construction.
  const uint64_t got = reader->readInto(&buffer[0], length);
  if (got != length) {
    throw UploadError(
      ErrorKind::kSourceRead, "Short read at offset " + std::to_string(offset) + ": expected " +
                                std::to_string(length) + " bytes, got " + std::to_string(got) +
                                " from " + path_
    );
  }

  return buffer;
}

SourceFile SourceFile::fromPath(const std::string& path, const std::string& declared_mime_type) {
  SourceFile file;
  file.name = std::filesystem::path(path).filename().string();
  file.declared_mime_type = declared_mime_type;
  file.source = std::make_shared<FileByteSource>(path);
  return file;
}

}  // namespace uploader
}  // namespace vidup
