// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIDUP_MEDIA_TYPE_HPP
#define VIDUP_MEDIA_TYPE_HPP

#include <string>
#include <vector>

namespace vidup {
namespace uploader {

constexpr const char* kGenericMimeType = "application/octet-stream";

// Assumed for files whose extension names no known container
constexpr const char* kDefaultVideoMimeType = "video/mp4";

/**
 * Media types accepted for upload
 */
const std::vector<std::string>& supportedMimeTypes();

bool isSupportedMimeType(const std::string& mime_type);

/**
 * Guess a media type from the filename extension (case-insensitive).
 * Unknown or missing extensions give kDefaultVideoMimeType.
 */
std::string detectMimeType(const std::string& filename);

/**
 * Effective media type of a file: the declared type, unless it is empty or
 * generic, in which case the extension-based guess.
 */
std::string resolveMimeType(const std::string& declared, const std::string& filename);

/**
 * Resolve and check against the allow-list.
 *
 * @return The resolved media type
 * @throws UploadError (kUnsupportedMediaType)
 */
std::string validateMediaType(const std::string& declared, const std::string& filename);

}  // namespace uploader
}  // namespace vidup

#endif  // VIDUP_MEDIA_TYPE_HPP
