#pragma once

#include <cstddef>
#include <span>

#include <openssl/evp.h>

#include "ecgroup/common/bytes.hpp"

namespace ecgroup {

enum class HashFunction {
  kSha256,
  kSha384,
  kSha512,
};

const EVP_MD* HashAlgorithm(HashFunction hash);
size_t HashOutputLength(HashFunction hash);
size_t HashBlockLength(HashFunction hash);

Bytes Digest(HashFunction hash, std::span<const uint8_t> data);

Bytes Sha256(std::span<const uint8_t> data);
Bytes Sha384(std::span<const uint8_t> data);
Bytes Sha512(std::span<const uint8_t> data);

}  // namespace ecgroup
