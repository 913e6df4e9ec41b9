#include "ecgroup/backend/ristretto255_curve.hpp"

#include <stdexcept>

#include <sodium.h>

#include "ecgroup/backend/sodium_runtime.hpp"
#include "ecgroup/common/errors.hpp"
#include "ecgroup/common/secure_zeroize.hpp"
#include "ecgroup/crypto/expand_message.hpp"

namespace ecgroup::backend {
namespace {

constexpr size_t kElementLength = crypto_core_ristretto255_BYTES;
constexpr size_t kScalarLength = crypto_core_ristretto255_SCALARBYTES;
constexpr size_t kUniformLength = crypto_core_ristretto255_HASHBYTES;

constexpr uint8_t kGenerator[kElementLength] = {
    0xe2, 0xf2, 0xae, 0x0a, 0x6a, 0xbc, 0x4e, 0x71, 0xa8, 0x84, 0xa9, 0x61, 0xc5, 0x00, 0x51, 0x5f,
    0x58, 0xe3, 0x0b, 0x6a, 0xa5, 0x82, 0xdd, 0x8d, 0xb6, 0xb6, 0x59, 0x45, 0xe0, 0x8d, 0x2d, 0x76,
};

void RequirePointLength(std::span<const uint8_t> point) {
  if (point.size() != kElementLength) {
    throw std::invalid_argument("ristretto255 element must be exactly 32 bytes");
  }
}

}  // namespace

Ristretto255Curve::Ristretto255Curve()
    : identity_(kElementLength, 0), generator_(std::begin(kGenerator), std::end(kGenerator)) {
  EnsureSodiumInitialized();
}

size_t Ristretto255Curve::element_length() const {
  return kElementLength;
}

const Bytes& Ristretto255Curve::identity() const {
  return identity_;
}

const Bytes& Ristretto255Curve::generator() const {
  return generator_;
}

bool Ristretto255Curve::identity_decodable() const {
  return true;
}

void Ristretto255Curve::ValidateNonIdentity(std::span<const uint8_t> encoded) const {
  RequirePointLength(encoded);
  if (crypto_core_ristretto255_is_valid_point(encoded.data()) != 1) {
    throw DecodingError(DecodingFailure::kInvalidEncoding, "invalid ristretto255 encoding");
  }
}

Bytes Ristretto255Curve::Add(std::span<const uint8_t> lhs, std::span<const uint8_t> rhs) const {
  RequirePointLength(lhs);
  RequirePointLength(rhs);
  Bytes out(kElementLength);
  if (crypto_core_ristretto255_add(out.data(), lhs.data(), rhs.data()) != 0) {
    throw std::runtime_error("crypto_core_ristretto255_add failed");
  }
  return out;
}

Bytes Ristretto255Curve::Subtract(std::span<const uint8_t> lhs,
                                  std::span<const uint8_t> rhs) const {
  RequirePointLength(lhs);
  RequirePointLength(rhs);
  Bytes out(kElementLength);
  if (crypto_core_ristretto255_sub(out.data(), lhs.data(), rhs.data()) != 0) {
    throw std::runtime_error("crypto_core_ristretto255_sub failed");
  }
  return out;
}

Bytes Ristretto255Curve::Negate(std::span<const uint8_t> point) const {
  return Subtract(identity_, point);
}

Bytes Ristretto255Curve::Multiply(std::span<const uint8_t> point,
                                  std::span<const uint8_t> scalar) const {
  RequirePointLength(point);
  if (scalar.size() != kScalarLength) {
    throw std::invalid_argument("ristretto255 scalar must be exactly 32 bytes");
  }
  if (IsIdentity(point) || sodium_is_zero(scalar.data(), scalar.size()) == 1) {
    return identity_;
  }

  // Non-zero scalar below the order times a non-identity element of prime order
  // never yields the identity, so a failure here is a library error.
  Bytes out(kElementLength);
  if (crypto_scalarmult_ristretto255(out.data(), scalar.data(), point.data()) != 0) {
    throw std::runtime_error("crypto_scalarmult_ristretto255 failed");
  }
  return out;
}

Bytes Ristretto255Curve::XCoordinate(std::span<const uint8_t> point) const {
  RequirePointLength(point);
  return Bytes(point.begin(), point.end());
}

Bytes Ristretto255Curve::HashToCurve(std::span<const uint8_t> message,
                                     std::span<const uint8_t> dst) const {
  Bytes uniform = ExpandMessageXmd(HashFunction::kSha512, message, dst, kUniformLength);
  Bytes out(kElementLength);
  const int status = crypto_core_ristretto255_from_hash(out.data(), uniform.data());
  SecureZeroize(&uniform);
  if (status != 0) {
    throw std::runtime_error("crypto_core_ristretto255_from_hash failed");
  }
  return out;
}

Bytes Ristretto255Curve::EncodeToCurve(std::span<const uint8_t> message,
                                       std::span<const uint8_t> dst) const {
  // The ristretto one-way map is already uniform; there is no separate encoding.
  return HashToCurve(message, dst);
}

}  // namespace ecgroup::backend
