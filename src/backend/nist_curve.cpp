#include "ecgroup/backend/nist_curve.hpp"

#include <algorithm>
#include <stdexcept>

#include "ecgroup/common/errors.hpp"
#include "ecgroup/crypto/encoding.hpp"

namespace ecgroup::backend {
namespace {

BnCtxPtr NewBnCtx() {
  BnCtxPtr ctx(BN_CTX_new());
  if (ctx == nullptr) {
    throw std::runtime_error("BN_CTX_new failed");
  }
  return ctx;
}

BignumPtr NewBignum() {
  BignumPtr bn(BN_new());
  if (bn == nullptr) {
    throw std::runtime_error("BN_new failed");
  }
  return bn;
}

}  // namespace

mpz_class BignumToMpz(const BIGNUM* bn) {
  Bytes buffer(static_cast<size_t>(BN_num_bytes(bn)));
  if (!buffer.empty() && BN_bn2bin(bn, buffer.data()) != static_cast<int>(buffer.size())) {
    throw std::runtime_error("BN_bn2bin failed");
  }
  return ImportBigEndian(buffer);
}

BignumPtr MpzToBignum(const mpz_class& value) {
  const size_t width = (mpz_sizeinbase(value.get_mpz_t(), 2) + 7) / 8;
  const Bytes buffer = ExportBigEndian(value, width == 0 ? 1 : width);
  BignumPtr bn(BN_bin2bn(buffer.data(), static_cast<int>(buffer.size()), nullptr));
  if (bn == nullptr) {
    throw std::runtime_error("BN_bin2bn failed");
  }
  return bn;
}

NistCurve::NistCurve(const NistCurveParams& params)
    : params_(params), group_(EC_GROUP_new_by_curve_name(params.nid)) {
  if (group_ == nullptr) {
    throw std::runtime_error("EC_GROUP_new_by_curve_name failed");
  }

  BnCtxPtr ctx = NewBnCtx();
  BignumPtr p = NewBignum();
  BignumPtr a = NewBignum();
  BignumPtr b = NewBignum();
  if (EC_GROUP_get_curve(group_.get(), p.get(), a.get(), b.get(), ctx.get()) != 1) {
    throw std::runtime_error("EC_GROUP_get_curve failed");
  }

  sswu_.p = BignumToMpz(p.get());
  sswu_.a = BignumToMpz(a.get());
  sswu_.b = BignumToMpz(b.get());
  sswu_.z = sswu_.p + params_.sswu_z;
  order_ = BignumToMpz(EC_GROUP_get0_order(group_.get()));

  identity_.assign(1 + params_.field_length, 0);
  generator_ = SerializePoint(EC_GROUP_get0_generator(group_.get()), ctx.get());
}

size_t NistCurve::element_length() const {
  return 1 + params_.field_length;
}

const Bytes& NistCurve::identity() const {
  return identity_;
}

const Bytes& NistCurve::generator() const {
  return generator_;
}

bool NistCurve::identity_decodable() const {
  return true;
}

const mpz_class& NistCurve::order() const {
  return order_;
}

EcPointPtr NistCurve::NewPoint() const {
  EcPointPtr point(EC_POINT_new(group_.get()));
  if (point == nullptr) {
    throw std::runtime_error("EC_POINT_new failed");
  }
  return point;
}

EcPointPtr NistCurve::ParsePoint(std::span<const uint8_t> encoded, BN_CTX* ctx) const {
  EcPointPtr point = NewPoint();
  if (IsIdentity(encoded)) {
    if (EC_POINT_set_to_infinity(group_.get(), point.get()) != 1) {
      throw std::runtime_error("EC_POINT_set_to_infinity failed");
    }
    return point;
  }

  if (encoded.size() != element_length()) {
    throw DecodingError(DecodingFailure::kWrongLength, "invalid element length");
  }
  if (encoded[0] != 0x02 && encoded[0] != 0x03) {
    throw DecodingError(DecodingFailure::kInvalidEncoding, "invalid point encoding prefix");
  }
  // Rejects x >= p and x without a matching y.
  if (EC_POINT_oct2point(group_.get(), point.get(), encoded.data(), encoded.size(), ctx) != 1) {
    throw DecodingError(DecodingFailure::kInvalidEncoding, "invalid point encoding");
  }
  return point;
}

Bytes NistCurve::SerializePoint(const EC_POINT* point, BN_CTX* ctx) const {
  if (EC_POINT_is_at_infinity(group_.get(), point) == 1) {
    return identity_;
  }

  Bytes out(element_length());
  const size_t written = EC_POINT_point2oct(
      group_.get(), point, POINT_CONVERSION_COMPRESSED, out.data(), out.size(), ctx);
  if (written != out.size()) {
    throw std::runtime_error("EC_POINT_point2oct failed");
  }
  return out;
}

EcPointPtr NistCurve::FromAffine(const AffinePoint& affine, BN_CTX* ctx) const {
  EcPointPtr point = NewPoint();
  if (affine.infinity) {
    if (EC_POINT_set_to_infinity(group_.get(), point.get()) != 1) {
      throw std::runtime_error("EC_POINT_set_to_infinity failed");
    }
    return point;
  }

  const BignumPtr x = MpzToBignum(affine.x);
  const BignumPtr y = MpzToBignum(affine.y);
  if (EC_POINT_set_affine_coordinates(group_.get(), point.get(), x.get(), y.get(), ctx) != 1) {
    throw std::runtime_error("Mapped point is not on the curve");
  }
  return point;
}

void NistCurve::ValidateNonIdentity(std::span<const uint8_t> encoded) const {
  if (IsIdentity(encoded)) {
    throw DecodingError(DecodingFailure::kInvalidEncoding, "unexpected identity encoding");
  }

  BnCtxPtr ctx = NewBnCtx();
  const EcPointPtr point = ParsePoint(encoded, ctx.get());
  if (EC_POINT_is_on_curve(group_.get(), point.get(), ctx.get()) != 1) {
    throw DecodingError(DecodingFailure::kInvalidEncoding, "point is not on the curve");
  }

  const Bytes reencoded = SerializePoint(point.get(), ctx.get());
  if (!std::equal(reencoded.begin(), reencoded.end(), encoded.begin(), encoded.end())) {
    throw DecodingError(DecodingFailure::kInvalidEncoding, "non-canonical point encoding");
  }
}

Bytes NistCurve::Add(std::span<const uint8_t> lhs, std::span<const uint8_t> rhs) const {
  BnCtxPtr ctx = NewBnCtx();
  const EcPointPtr p = ParsePoint(lhs, ctx.get());
  const EcPointPtr q = ParsePoint(rhs, ctx.get());
  EcPointPtr r = NewPoint();
  if (EC_POINT_add(group_.get(), r.get(), p.get(), q.get(), ctx.get()) != 1) {
    throw std::runtime_error("EC_POINT_add failed");
  }
  return SerializePoint(r.get(), ctx.get());
}

Bytes NistCurve::Negate(std::span<const uint8_t> point) const {
  BnCtxPtr ctx = NewBnCtx();
  EcPointPtr p = ParsePoint(point, ctx.get());
  if (EC_POINT_invert(group_.get(), p.get(), ctx.get()) != 1) {
    throw std::runtime_error("EC_POINT_invert failed");
  }
  return SerializePoint(p.get(), ctx.get());
}

Bytes NistCurve::Double(std::span<const uint8_t> point) const {
  BnCtxPtr ctx = NewBnCtx();
  const EcPointPtr p = ParsePoint(point, ctx.get());
  EcPointPtr r = NewPoint();
  if (EC_POINT_dbl(group_.get(), r.get(), p.get(), ctx.get()) != 1) {
    throw std::runtime_error("EC_POINT_dbl failed");
  }
  return SerializePoint(r.get(), ctx.get());
}

Bytes NistCurve::Multiply(std::span<const uint8_t> point, std::span<const uint8_t> scalar) const {
  if (scalar.size() != params_.field_length) {
    throw std::invalid_argument("Scalar has the wrong length for this curve");
  }

  BnCtxPtr ctx = NewBnCtx();
  const EcPointPtr p = ParsePoint(point, ctx.get());
  BignumPtr k(BN_bin2bn(scalar.data(), static_cast<int>(scalar.size()), nullptr));
  if (k == nullptr) {
    throw std::runtime_error("BN_bin2bn failed");
  }

  EcPointPtr r = NewPoint();
  if (EC_POINT_mul(group_.get(), r.get(), nullptr, p.get(), k.get(), ctx.get()) != 1) {
    throw std::runtime_error("EC_POINT_mul failed");
  }
  return SerializePoint(r.get(), ctx.get());
}

Bytes NistCurve::XCoordinate(std::span<const uint8_t> point) const {
  if (point.size() != element_length()) {
    throw std::invalid_argument("Element has the wrong length for this curve");
  }
  return Bytes(point.begin() + 1, point.end());
}

Bytes NistCurve::HashToCurve(std::span<const uint8_t> message,
                             std::span<const uint8_t> dst) const {
  const std::vector<mpz_class> u =
      HashToField(params_.hash, message, dst, sswu_.p, params_.expand_length, 2);

  BnCtxPtr ctx = NewBnCtx();
  const EcPointPtr q0 = FromAffine(MapToCurveSimpleSwu(u[0], sswu_), ctx.get());
  const EcPointPtr q1 = FromAffine(MapToCurveSimpleSwu(u[1], sswu_), ctx.get());
  EcPointPtr r = NewPoint();
  if (EC_POINT_add(group_.get(), r.get(), q0.get(), q1.get(), ctx.get()) != 1) {
    throw std::runtime_error("EC_POINT_add failed");
  }
  return SerializePoint(r.get(), ctx.get());
}

Bytes NistCurve::EncodeToCurve(std::span<const uint8_t> message,
                               std::span<const uint8_t> dst) const {
  const std::vector<mpz_class> u =
      HashToField(params_.hash, message, dst, sswu_.p, params_.expand_length, 1);

  BnCtxPtr ctx = NewBnCtx();
  const EcPointPtr q = FromAffine(MapToCurveSimpleSwu(u[0], sswu_), ctx.get());
  return SerializePoint(q.get(), ctx.get());
}

}  // namespace ecgroup::backend
