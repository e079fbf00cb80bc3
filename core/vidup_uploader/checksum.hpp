// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIDUP_CHECKSUM_HPP
#define VIDUP_CHECKSUM_HPP

#include <cstddef>
#include <string>

namespace vidup {
namespace uploader {

/**
 * Compute the MD5 digest of a byte buffer as 32 lowercase hex characters.
 *
 * The digest accompanies every chunk request so the server can verify the
 * bytes it received. Callers recompute it for each attempt.
 *
 * @throws UploadError (kChecksum) if the digest cannot be computed
 */
std::string computeChecksum(const char* data, size_t size);

inline std::string computeChecksum(const std::string& bytes) {
  return computeChecksum(bytes.data(), bytes.size());
}

}  // namespace uploader
}  // namespace vidup

#endif  // VIDUP_CHECKSUM_HPP
