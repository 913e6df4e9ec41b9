#include "ecgroup/backend/edwards25519_curve.hpp"

#include <stdexcept>

#include <sodium.h>

#include "ecgroup/backend/map_to_curve.hpp"
#include "ecgroup/backend/sodium_runtime.hpp"
#include "ecgroup/common/errors.hpp"
#include "ecgroup/crypto/encoding.hpp"

namespace ecgroup::backend {
namespace {

constexpr size_t kElementLength = crypto_core_ed25519_BYTES;
constexpr size_t kScalarLength = crypto_core_ed25519_SCALARBYTES;
constexpr size_t kFieldExpandLength = 48;
constexpr size_t kCofactorDoublings = 3;

constexpr uint8_t kGenerator[kElementLength] = {
    0x58, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66,
    0x66, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66, 0x66,
};

void RequirePointLength(std::span<const uint8_t> point) {
  if (point.size() != kElementLength) {
    throw std::invalid_argument("edwards25519 element must be exactly 32 bytes");
  }
}

// Compressed form: y in little-endian, sign of x in the top bit.
Bytes EncodeAffine(const AffinePoint& point) {
  Bytes out = ToBigEndian(ExportBigEndian(point.y, kElementLength), ByteOrder::kLittleEndian);
  if (mpz_odd_p(point.x.get_mpz_t()) != 0) {
    out[kElementLength - 1] |= 0x80;
  }
  return out;
}

}  // namespace

Edwards25519Curve::Edwards25519Curve()
    : identity_(kElementLength, 0), generator_(std::begin(kGenerator), std::end(kGenerator)) {
  identity_[0] = 0x01;
  EnsureSodiumInitialized();
}

size_t Edwards25519Curve::element_length() const {
  return kElementLength;
}

const Bytes& Edwards25519Curve::identity() const {
  return identity_;
}

const Bytes& Edwards25519Curve::generator() const {
  return generator_;
}

bool Edwards25519Curve::identity_decodable() const {
  return false;
}

void Edwards25519Curve::ValidateNonIdentity(std::span<const uint8_t> encoded) const {
  RequirePointLength(encoded);
  // Rejects non-canonical y, off-curve points, small-order points and points outside
  // the prime-order subgroup.
  if (crypto_core_ed25519_is_valid_point(encoded.data()) != 1) {
    throw DecodingError(DecodingFailure::kInvalidEncoding, "invalid edwards25519 encoding");
  }
}

Bytes Edwards25519Curve::Add(std::span<const uint8_t> lhs, std::span<const uint8_t> rhs) const {
  RequirePointLength(lhs);
  RequirePointLength(rhs);
  Bytes out(kElementLength);
  if (crypto_core_ed25519_add(out.data(), lhs.data(), rhs.data()) != 0) {
    throw std::runtime_error("crypto_core_ed25519_add failed");
  }
  return out;
}

Bytes Edwards25519Curve::Subtract(std::span<const uint8_t> lhs,
                                  std::span<const uint8_t> rhs) const {
  RequirePointLength(lhs);
  RequirePointLength(rhs);
  Bytes out(kElementLength);
  if (crypto_core_ed25519_sub(out.data(), lhs.data(), rhs.data()) != 0) {
    throw std::runtime_error("crypto_core_ed25519_sub failed");
  }
  return out;
}

Bytes Edwards25519Curve::Negate(std::span<const uint8_t> point) const {
  return Subtract(identity_, point);
}

Bytes Edwards25519Curve::Multiply(std::span<const uint8_t> point,
                                  std::span<const uint8_t> scalar) const {
  RequirePointLength(point);
  if (scalar.size() != kScalarLength) {
    throw std::invalid_argument("edwards25519 scalar must be exactly 32 bytes");
  }
  if (IsIdentity(point) || sodium_is_zero(scalar.data(), scalar.size()) == 1) {
    return identity_;
  }

  Bytes out(kElementLength);
  if (crypto_scalarmult_ed25519_noclamp(out.data(), scalar.data(), point.data()) != 0) {
    throw std::runtime_error("crypto_scalarmult_ed25519_noclamp failed");
  }
  return out;
}

Bytes Edwards25519Curve::XCoordinate(std::span<const uint8_t> point) const {
  RequirePointLength(point);
  Bytes out(crypto_scalarmult_curve25519_BYTES, 0);
  if (IsIdentity(point)) {
    return out;
  }

  if (crypto_sign_ed25519_pk_to_curve25519(out.data(), point.data()) != 0) {
    throw std::runtime_error("crypto_sign_ed25519_pk_to_curve25519 failed");
  }
  return out;
}

Bytes Edwards25519Curve::ClearCofactor(std::span<const uint8_t> point) const {
  Bytes out(point.begin(), point.end());
  for (size_t i = 0; i < kCofactorDoublings; ++i) {
    out = Double(out);
  }
  return out;
}

Bytes Edwards25519Curve::HashToCurve(std::span<const uint8_t> message,
                                     std::span<const uint8_t> dst) const {
  const std::vector<mpz_class> u = HashToField(
      HashFunction::kSha512, message, dst, Curve25519FieldPrime(), kFieldExpandLength, 2);
  const Bytes q0 = EncodeAffine(MapToEdwards25519(u[0]));
  const Bytes q1 = EncodeAffine(MapToEdwards25519(u[1]));
  return ClearCofactor(Add(q0, q1));
}

Bytes Edwards25519Curve::EncodeToCurve(std::span<const uint8_t> message,
                                       std::span<const uint8_t> dst) const {
  const std::vector<mpz_class> u = HashToField(
      HashFunction::kSha512, message, dst, Curve25519FieldPrime(), kFieldExpandLength, 1);
  return ClearCofactor(EncodeAffine(MapToEdwards25519(u[0])));
}

}  // namespace ecgroup::backend
