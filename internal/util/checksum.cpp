#include "checksum.hpp"

#include <openssl/evp.h>

#include <cctype>
#include <stdexcept>

namespace blobstream::util {

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) throw std::runtime_error("EVP_MD_CTX_new failed");
  if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(ctx_);
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
}

Sha256::~Sha256() {
  EVP_MD_CTX_free(ctx_);
}

void Sha256::Update(const void* data, std::size_t size) {
  if (finalized_) throw std::logic_error("Sha256 already finalized");
  if (size == 0) return;
  if (EVP_DigestUpdate(ctx_, data, size) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
}

std::string Sha256::FinalHex() {
  if (finalized_) throw std::logic_error("Sha256 already finalized");
  finalized_ = true;

  unsigned char md_val[EVP_MAX_MD_SIZE];
  unsigned int  md_len = 0;
  if (EVP_DigestFinal_ex(ctx_, md_val, &md_len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           result;
  result.reserve(md_len * 2);
  for (unsigned int i = 0; i < md_len; ++i) {
    result.push_back(kHex[(md_val[i] >> 4) & 0x0F]);
    result.push_back(kHex[md_val[i] & 0x0F]);
  }
  return result;
}

std::string Sha256Hex(const void* data, std::size_t size) {
  Sha256 hasher;
  hasher.Update(data, size);
  return hasher.FinalHex();
}

bool IsHexDigest(std::string_view value) {
  if (value.size() != kSha256HexLength) return false;
  for (char c : value) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

bool DigestsEqual(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) return false;
  }
  return true;
}

} // namespace blobstream::util
