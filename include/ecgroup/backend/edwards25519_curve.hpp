#pragma once

#include "ecgroup/backend/curve.hpp"

namespace ecgroup::backend {

// The prime-order subgroup of edwards25519, backed by libsodium. The identity is
// representable but refused on decode.
class Edwards25519Curve final : public Curve {
 public:
  Edwards25519Curve();

  size_t element_length() const override;
  const Bytes& identity() const override;
  const Bytes& generator() const override;
  bool identity_decodable() const override;

  void ValidateNonIdentity(std::span<const uint8_t> encoded) const override;

  Bytes Add(std::span<const uint8_t> lhs, std::span<const uint8_t> rhs) const override;
  Bytes Subtract(std::span<const uint8_t> lhs, std::span<const uint8_t> rhs) const override;
  Bytes Negate(std::span<const uint8_t> point) const override;
  Bytes Multiply(std::span<const uint8_t> point, std::span<const uint8_t> scalar) const override;

  // Montgomery u-coordinate, (1 + y) / (1 - y). The identity maps to zero.
  Bytes XCoordinate(std::span<const uint8_t> point) const override;

  Bytes HashToCurve(std::span<const uint8_t> message, std::span<const uint8_t> dst) const override;
  Bytes EncodeToCurve(std::span<const uint8_t> message, std::span<const uint8_t> dst) const override;

 private:
  Bytes ClearCofactor(std::span<const uint8_t> point) const;

  Bytes identity_;
  Bytes generator_;
};

}  // namespace ecgroup::backend
