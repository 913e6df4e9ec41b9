#include "ecgroup/backend/curve25519_scalar_field.hpp"

#include <algorithm>
#include <stdexcept>

#include <sodium.h>

#include "ecgroup/backend/sodium_runtime.hpp"

namespace ecgroup::backend {
namespace {

constexpr size_t kScalarLength = crypto_core_ed25519_SCALARBYTES;
constexpr size_t kWideLength = crypto_core_ed25519_NONREDUCEDSCALARBYTES;

// l in little-endian.
constexpr uint8_t kOrder[kScalarLength] = {
    0xed, 0xd3, 0xf5, 0x5c, 0x1a, 0x63, 0x12, 0x58, 0xd6, 0x9c, 0xf7, 0xa2, 0xde, 0xf9, 0xde, 0x14,
    0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x10,
};

void RequireScalarLength(std::span<const uint8_t> value) {
  if (value.size() != kScalarLength) {
    throw std::invalid_argument("curve25519 scalar must be exactly 32 bytes");
  }
}

}  // namespace

Curve25519ScalarField::Curve25519ScalarField() : order_(std::begin(kOrder), std::end(kOrder)) {
  EnsureSodiumInitialized();
}

size_t Curve25519ScalarField::length() const {
  return kScalarLength;
}

ByteOrder Curve25519ScalarField::byte_order() const {
  return ByteOrder::kLittleEndian;
}

const Bytes& Curve25519ScalarField::order() const {
  return order_;
}

size_t Curve25519ScalarField::wide_length() const {
  return kWideLength;
}

Bytes Curve25519ScalarField::Reduce(std::span<const uint8_t> wide) const {
  if (wide.size() > kWideLength) {
    throw std::invalid_argument("curve25519 wide scalar must be at most 64 bytes");
  }

  // Shorter inputs are zero-extended at the most significant end.
  unsigned char buffer[kWideLength] = {0};
  std::copy(wide.begin(), wide.end(), buffer);

  Bytes out(kScalarLength);
  crypto_core_ed25519_scalar_reduce(out.data(), buffer);
  sodium_memzero(buffer, sizeof(buffer));
  return out;
}

Bytes Curve25519ScalarField::Add(std::span<const uint8_t> lhs, std::span<const uint8_t> rhs) const {
  RequireScalarLength(lhs);
  RequireScalarLength(rhs);
  Bytes out(kScalarLength);
  crypto_core_ed25519_scalar_add(out.data(), lhs.data(), rhs.data());
  return out;
}

Bytes Curve25519ScalarField::Subtract(std::span<const uint8_t> lhs,
                                      std::span<const uint8_t> rhs) const {
  RequireScalarLength(lhs);
  RequireScalarLength(rhs);
  Bytes out(kScalarLength);
  crypto_core_ed25519_scalar_sub(out.data(), lhs.data(), rhs.data());
  return out;
}

Bytes Curve25519ScalarField::Multiply(std::span<const uint8_t> lhs,
                                      std::span<const uint8_t> rhs) const {
  RequireScalarLength(lhs);
  RequireScalarLength(rhs);
  Bytes out(kScalarLength);
  crypto_core_ed25519_scalar_mul(out.data(), lhs.data(), rhs.data());
  return out;
}

Bytes Curve25519ScalarField::Negate(std::span<const uint8_t> value) const {
  RequireScalarLength(value);
  Bytes out(kScalarLength);
  crypto_core_ed25519_scalar_negate(out.data(), value.data());
  return out;
}

Bytes Curve25519ScalarField::Invert(std::span<const uint8_t> value) const {
  RequireScalarLength(value);
  Bytes out(kScalarLength, 0);
  if (sodium_is_zero(value.data(), value.size()) == 1) {
    return out;
  }

  if (crypto_core_ed25519_scalar_invert(out.data(), value.data()) != 0) {
    throw std::runtime_error("crypto_core_ed25519_scalar_invert failed");
  }
  return out;
}

}  // namespace ecgroup::backend
