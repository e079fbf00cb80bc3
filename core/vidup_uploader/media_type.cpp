// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "media_type.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>

#include "upload_errors.hpp"

namespace vidup {
namespace uploader {

namespace {

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

}  // namespace

const std::vector<std::string>& supportedMimeTypes() {
  static const std::vector<std::string> types = {
    "video/mp4", "video/webm", "video/quicktime", "video/x-msvideo", "video/x-matroska"
  };
  return types;
}

bool isSupportedMimeType(const std::string& mime_type) {
  const auto& types = supportedMimeTypes();
  return std::find(types.begin(), types.end(), toLower(mime_type)) != types.end();
}

std::string detectMimeType(const std::string& filename) {
  static const std::map<std::string, std::string> by_extension = {
    {".mp4", "video/mp4"},
    {".webm", "video/webm"},
    {".mov", "video/quicktime"},
    {".avi", "video/x-msvideo"},
    {".mkv", "video/x-matroska"},
  };

  auto ext = toLower(std::filesystem::path(filename).extension().string());
  auto it = by_extension.find(ext);
  if (it == by_extension.end()) {
    return kDefaultVideoMimeType;
  }
  return it->second;
}

std::string resolveMimeType(const std::string& declared, const std::string& filename) {
  if (declared.empty() || toLower(declared) == kGenericMimeType) {
    return detectMimeType(filename);
  }
  return toLower(declared);
}

std::string validateMediaType(const std::string& declared, const std::string& filename) {
  auto resolved = resolveMimeType(declared, filename);
  if (!isSupportedMimeType(resolved)) {
    throw UploadError(
      ErrorKind::kUnsupportedMediaType,
      "Unsupported media type '" + resolved + "' for file " + filename
    );
  }
  return resolved;
}

}  // namespace uploader
}  // namespace vidup
