#pragma once

#include <memory>

#include <gmpxx.h>
#include <openssl/bn.h>
#include <openssl/ec.h>

#include "ecgroup/backend/curve.hpp"
#include "ecgroup/backend/map_to_curve.hpp"
#include "ecgroup/crypto/hash.hpp"

namespace ecgroup::backend {

struct EcGroupDeleter {
  void operator()(EC_GROUP* group) const { EC_GROUP_free(group); }
};

struct EcPointDeleter {
  void operator()(EC_POINT* point) const { EC_POINT_free(point); }
};

struct BnCtxDeleter {
  void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); }
};

struct BignumDeleter {
  void operator()(BIGNUM* bn) const { BN_clear_free(bn); }
};

using EcGroupPtr = std::unique_ptr<EC_GROUP, EcGroupDeleter>;
using EcPointPtr = std::unique_ptr<EC_POINT, EcPointDeleter>;
using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;
using BignumPtr = std::unique_ptr<BIGNUM, BignumDeleter>;

mpz_class BignumToMpz(const BIGNUM* bn);
BignumPtr MpzToBignum(const mpz_class& value);

struct NistCurveParams {
  int nid;
  HashFunction hash;
  size_t field_length;
  size_t expand_length;
  int sswu_z;
};

// NIST prime curves (cofactor 1) backed by OpenSSL. Elements are SEC1 compressed
// points; the identity is encoded as |element_length()| zero bytes.
class NistCurve final : public Curve {
 public:
  explicit NistCurve(const NistCurveParams& params);

  size_t element_length() const override;
  const Bytes& identity() const override;
  const Bytes& generator() const override;
  bool identity_decodable() const override;

  void ValidateNonIdentity(std::span<const uint8_t> encoded) const override;

  Bytes Add(std::span<const uint8_t> lhs, std::span<const uint8_t> rhs) const override;
  Bytes Negate(std::span<const uint8_t> point) const override;
  Bytes Double(std::span<const uint8_t> point) const override;
  Bytes Multiply(std::span<const uint8_t> point, std::span<const uint8_t> scalar) const override;

  // Big-endian affine x, |field_length| bytes. Zero for the identity.
  Bytes XCoordinate(std::span<const uint8_t> point) const override;

  Bytes HashToCurve(std::span<const uint8_t> message, std::span<const uint8_t> dst) const override;
  Bytes EncodeToCurve(std::span<const uint8_t> message, std::span<const uint8_t> dst) const override;

  const mpz_class& order() const;

 private:
  EcPointPtr NewPoint() const;
  EcPointPtr ParsePoint(std::span<const uint8_t> encoded, BN_CTX* ctx) const;
  Bytes SerializePoint(const EC_POINT* point, BN_CTX* ctx) const;
  EcPointPtr FromAffine(const AffinePoint& point, BN_CTX* ctx) const;

  NistCurveParams params_;
  EcGroupPtr group_;
  SswuParameters sswu_;
  mpz_class order_;
  Bytes identity_;
  Bytes generator_;
};

}  // namespace ecgroup::backend
