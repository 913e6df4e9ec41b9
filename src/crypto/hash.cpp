#include "ecgroup/crypto/hash.hpp"

#include <array>
#include <stdexcept>

#include <openssl/sha.h>

namespace ecgroup {

const EVP_MD* HashAlgorithm(HashFunction hash) {
  switch (hash) {
    case HashFunction::kSha256:
      return EVP_sha256();
    case HashFunction::kSha384:
      return EVP_sha384();
    case HashFunction::kSha512:
      return EVP_sha512();
  }
  throw std::invalid_argument("Unknown hash function");
}

size_t HashOutputLength(HashFunction hash) {
  switch (hash) {
    case HashFunction::kSha256:
      return SHA256_DIGEST_LENGTH;
    case HashFunction::kSha384:
      return SHA384_DIGEST_LENGTH;
    case HashFunction::kSha512:
      return SHA512_DIGEST_LENGTH;
  }
  throw std::invalid_argument("Unknown hash function");
}

size_t HashBlockLength(HashFunction hash) {
  switch (hash) {
    case HashFunction::kSha256:
      return SHA256_CBLOCK;
    case HashFunction::kSha384:
    case HashFunction::kSha512:
      return SHA512_CBLOCK;
  }
  throw std::invalid_argument("Unknown hash function");
}

Bytes Digest(HashFunction hash, std::span<const uint8_t> data) {
  switch (hash) {
    case HashFunction::kSha256:
      return Sha256(data);
    case HashFunction::kSha384:
      return Sha384(data);
    case HashFunction::kSha512:
      return Sha512(data);
  }
  throw std::invalid_argument("Unknown hash function");
}

Bytes Sha256(std::span<const uint8_t> data) {
  std::array<uint8_t, SHA256_DIGEST_LENGTH> digest{};
  if (SHA256(data.data(), data.size(), digest.data()) == nullptr) {
    throw std::runtime_error("SHA256 failed");
  }
  return Bytes(digest.begin(), digest.end());
}

Bytes Sha384(std::span<const uint8_t> data) {
  std::array<uint8_t, SHA384_DIGEST_LENGTH> digest{};
  if (SHA384(data.data(), data.size(), digest.data()) == nullptr) {
    throw std::runtime_error("SHA384 failed");
  }
  return Bytes(digest.begin(), digest.end());
}

Bytes Sha512(std::span<const uint8_t> data) {
  std::array<uint8_t, SHA512_DIGEST_LENGTH> digest{};
  if (SHA512(data.data(), data.size(), digest.data()) == nullptr) {
    throw std::runtime_error("SHA512 failed");
  }
  return Bytes(digest.begin(), digest.end());
}

}  // namespace ecgroup
