// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "checksum.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <memory>
#include <sstream>

#include "upload_errors.hpp"

namespace vidup {
namespace uploader {

namespace {

struct EvpContextDeleter {
  void operator()(EVP_MD_CTX* context) const {
    EVP_MD_CTX_free(context);
  }
};

}  // namespace

std::string computeChecksum(const char* data, size_t size) {
  std::unique_ptr<EVP_MD_CTX, EvpContextDeleter> context(EVP_MD_CTX_new());
  if (!context) {
    throw UploadError(ErrorKind::kChecksum, "Failed to create EVP digest context");
  }

  if (EVP_DigestInit_ex(context.get(), EVP_md5(), nullptr) != 1) {
    throw UploadError(ErrorKind::kChecksum, "Failed to initialize MD5 digest");
  }

  if (size > 0 && EVP_DigestUpdate(context.get(), data, size) != 1) {
    throw UploadError(ErrorKind::kChecksum, "Failed to update MD5 digest");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_length = 0;
  if (EVP_DigestFinal_ex(context.get(), hash, &hash_length) != 1) {
    throw UploadError(ErrorKind::kChecksum, "Failed to finalize MD5 digest");
  }

  std::ostringstream oss;
  for (unsigned int i = 0; i < hash_length; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return oss.str();
}

}  // namespace uploader
}  // namespace vidup
