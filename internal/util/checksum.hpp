#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace blobstream::util {

// Length of a hex-encoded SHA-256 digest.
inline constexpr std::size_t kSha256HexLength = 64;

/*
  Incremental SHA-256 over OpenSSL EVP.

  Feed bytes with Update() as they arrive, then call FinalHex() once.
*/
class Sha256 {
 public:
  Sha256();
  ~Sha256();

  Sha256(const Sha256&)            = delete;
  Sha256& operator=(const Sha256&) = delete;

  void Update(const void* data, std::size_t size);

  // Lowercase hex digest. The hasher cannot be updated afterwards.
  std::string FinalHex();

 private:
  EVP_MD_CTX* ctx_;
  bool        finalized_ = false;
};

std::string Sha256Hex(const void* data, std::size_t size);

// True for exactly 64 hex characters (either case).
bool IsHexDigest(std::string_view value);

// Case-insensitive digest comparison.
bool DigestsEqual(std::string_view a, std::string_view b);

} // namespace blobstream::util
