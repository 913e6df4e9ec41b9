#include "ecgroup/backend/secp256k1_curve.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

extern "C" {
#include <secp256k1.h>
}

#include "ecgroup/backend/map_to_curve.hpp"
#include "ecgroup/common/errors.hpp"
#include "ecgroup/crypto/encoding.hpp"

namespace ecgroup::backend {
namespace {

constexpr size_t kFieldLength = 32;
constexpr size_t kElementLength = 33;
constexpr size_t kFieldExpandLength = 48;

constexpr uint8_t kGenerator[kElementLength] = {
    0x02, 0x79, 0xbe, 0x66, 0x7e, 0xf9, 0xdc, 0xbb, 0xac, 0x55, 0xa0, 0x62, 0x95, 0xce, 0x87, 0x0b, 0x07,
    0x02, 0x9b, 0xfc, 0xdb, 0x2d, 0xce, 0x28, 0xd9, 0x59, 0xf2, 0x81, 0x5b, 0x16, 0xf8, 0x17, 0x98,
};

secp256k1_context* GetSecpContext() {
  static secp256k1_context* ctx = []() {
    secp256k1_context* created = secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY);
    if (created == nullptr) {
      throw std::runtime_error("Failed to create secp256k1 context");
    }
    return created;
  }();
  return ctx;
}

void RequirePointLength(std::span<const uint8_t> point) {
  if (point.size() != kElementLength) {
    throw std::invalid_argument("secp256k1 element must be exactly 33 bytes");
  }
}

secp256k1_pubkey ParsePubkey(std::span<const uint8_t> encoded) {
  secp256k1_pubkey pubkey;
  if (secp256k1_ec_pubkey_parse(GetSecpContext(), &pubkey, encoded.data(), encoded.size()) != 1) {
    throw DecodingError(DecodingFailure::kInvalidEncoding, "invalid secp256k1 point encoding");
  }
  return pubkey;
}

Bytes SerializeCompressed(const secp256k1_pubkey& pubkey) {
  Bytes out(kElementLength);
  size_t out_len = out.size();
  if (secp256k1_ec_pubkey_serialize(
          GetSecpContext(), out.data(), &out_len, &pubkey, SECP256K1_EC_COMPRESSED) != 1 ||
      out_len != out.size()) {
    throw std::runtime_error("Failed to serialize secp256k1 point");
  }
  return out;
}

}  // namespace

Secp256k1Curve::Secp256k1Curve()
    : identity_(kElementLength, 0), generator_(std::begin(kGenerator), std::end(kGenerator)) {
  (void)GetSecpContext();
}

size_t Secp256k1Curve::element_length() const {
  return kElementLength;
}

const Bytes& Secp256k1Curve::identity() const {
  return identity_;
}

const Bytes& Secp256k1Curve::generator() const {
  return generator_;
}

bool Secp256k1Curve::identity_decodable() const {
  return true;
}

void Secp256k1Curve::ValidateNonIdentity(std::span<const uint8_t> encoded) const {
  if (encoded.size() != kElementLength) {
    throw DecodingError(DecodingFailure::kWrongLength, "invalid element length");
  }
  if (encoded[0] != 0x02 && encoded[0] != 0x03) {
    throw DecodingError(DecodingFailure::kInvalidEncoding, "invalid point encoding prefix");
  }

  const Bytes reencoded = SerializeCompressed(ParsePubkey(encoded));
  if (!std::equal(reencoded.begin(), reencoded.end(), encoded.begin(), encoded.end())) {
    throw DecodingError(DecodingFailure::kInvalidEncoding, "non-canonical point encoding");
  }
}

Bytes Secp256k1Curve::Add(std::span<const uint8_t> lhs, std::span<const uint8_t> rhs) const {
  RequirePointLength(lhs);
  RequirePointLength(rhs);
  if (IsIdentity(lhs)) {
    return Bytes(rhs.begin(), rhs.end());
  }
  if (IsIdentity(rhs)) {
    return Bytes(lhs.begin(), lhs.end());
  }

  const secp256k1_pubkey p = ParsePubkey(lhs);
  const secp256k1_pubkey q = ParsePubkey(rhs);
  const secp256k1_pubkey* inputs[2] = {&p, &q};
  secp256k1_pubkey combined;
  // The only failure mode of combine is a sum at infinity.
  if (secp256k1_ec_pubkey_combine(GetSecpContext(), &combined, inputs, 2) != 1) {
    return identity_;
  }
  return SerializeCompressed(combined);
}

Bytes Secp256k1Curve::Negate(std::span<const uint8_t> point) const {
  RequirePointLength(point);
  if (IsIdentity(point)) {
    return identity_;
  }

  secp256k1_pubkey pubkey = ParsePubkey(point);
  if (secp256k1_ec_pubkey_negate(GetSecpContext(), &pubkey) != 1) {
    throw std::runtime_error("secp256k1_ec_pubkey_negate failed");
  }
  return SerializeCompressed(pubkey);
}

Bytes Secp256k1Curve::Multiply(std::span<const uint8_t> point,
                               std::span<const uint8_t> scalar) const {
  RequirePointLength(point);
  if (scalar.size() != kFieldLength) {
    throw std::invalid_argument("secp256k1 scalar must be exactly 32 bytes");
  }
  if (IsIdentity(point) || std::all_of(scalar.begin(), scalar.end(), [](uint8_t b) { return b == 0; })) {
    return identity_;
  }

  secp256k1_pubkey pubkey = ParsePubkey(point);
  if (secp256k1_ec_pubkey_tweak_mul(GetSecpContext(), &pubkey, scalar.data()) != 1) {
    throw std::runtime_error("Point scalar multiplication failed");
  }
  return SerializeCompressed(pubkey);
}

Bytes Secp256k1Curve::XCoordinate(std::span<const uint8_t> point) const {
  RequirePointLength(point);
  return Bytes(point.begin() + 1, point.end());
}

namespace {

// Takes an affine point of secp256k1 through the uncompressed SEC1 form.
Bytes EncodeAffine(const AffinePoint& point, const Bytes& identity) {
  if (point.infinity) {
    return identity;
  }

  std::array<uint8_t, 1 + 2 * kFieldLength> uncompressed{};
  uncompressed[0] = 0x04;
  const Bytes x = ExportBigEndian(point.x, kFieldLength);
  const Bytes y = ExportBigEndian(point.y, kFieldLength);
  std::copy(x.begin(), x.end(), uncompressed.begin() + 1);
  std::copy(y.begin(), y.end(), uncompressed.begin() + 1 + kFieldLength);

  secp256k1_pubkey pubkey;
  if (secp256k1_ec_pubkey_parse(GetSecpContext(), &pubkey, uncompressed.data(), uncompressed.size()) != 1) {
    throw std::runtime_error("Mapped point is not on secp256k1");
  }
  return SerializeCompressed(pubkey);
}

AffinePoint MapToSecp256k1(const mpz_class& u) {
  return Secp256k1IsogenyMap(MapToCurveSimpleSwu(u, Secp256k1IsogenousCurve()));
}

}  // namespace

Bytes Secp256k1Curve::HashToCurve(std::span<const uint8_t> message,
                                  std::span<const uint8_t> dst) const {
  const std::vector<mpz_class> u = HashToField(
      HashFunction::kSha256, message, dst, Secp256k1FieldPrime(), kFieldExpandLength, 2);
  const Bytes q0 = EncodeAffine(MapToSecp256k1(u[0]), identity_);
  const Bytes q1 = EncodeAffine(MapToSecp256k1(u[1]), identity_);
  return Add(q0, q1);
}

Bytes Secp256k1Curve::EncodeToCurve(std::span<const uint8_t> message,
                                    std::span<const uint8_t> dst) const {
  const std::vector<mpz_class> u = HashToField(
      HashFunction::kSha256, message, dst, Secp256k1FieldPrime(), kFieldExpandLength, 1);
  return EncodeAffine(MapToSecp256k1(u[0]), identity_);
}

}  // namespace ecgroup::backend
