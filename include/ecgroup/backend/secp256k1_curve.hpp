#pragma once

#include "ecgroup/backend/curve.hpp"

namespace ecgroup::backend {

// secp256k1 backed by libsecp256k1. The library has no encoding for the point at
// infinity, so the identity is tracked here as 33 zero bytes.
class Secp256k1Curve final : public Curve {
 public:
  Secp256k1Curve();

  size_t element_length() const override;
  const Bytes& identity() const override;
  const Bytes& generator() const override;
  bool identity_decodable() const override;

  void ValidateNonIdentity(std::span<const uint8_t> encoded) const override;

  Bytes Add(std::span<const uint8_t> lhs, std::span<const uint8_t> rhs) const override;
  Bytes Negate(std::span<const uint8_t> point) const override;
  Bytes Multiply(std::span<const uint8_t> point, std::span<const uint8_t> scalar) const override;

  Bytes XCoordinate(std::span<const uint8_t> point) const override;

  Bytes HashToCurve(std::span<const uint8_t> message, std::span<const uint8_t> dst) const override;
  Bytes EncodeToCurve(std::span<const uint8_t> message, std::span<const uint8_t> dst) const override;

 private:
  Bytes identity_;
  Bytes generator_;
};

}  // namespace ecgroup::backend
