#pragma once

#include "ecgroup/backend/scalar_field.hpp"

namespace ecgroup::backend {

// Scalars modulo l = 2^252 + 27742317777372353535851937790883648493, little-endian,
// backed by libsodium. Shared by Ristretto255 and Edwards25519.
class Curve25519ScalarField final : public ScalarField {
 public:
  Curve25519ScalarField();

  size_t length() const override;
  ByteOrder byte_order() const override;
  const Bytes& order() const override;
  size_t wide_length() const override;

  Bytes Reduce(std::span<const uint8_t> wide) const override;

  Bytes Add(std::span<const uint8_t> lhs, std::span<const uint8_t> rhs) const override;
  Bytes Subtract(std::span<const uint8_t> lhs, std::span<const uint8_t> rhs) const override;
  Bytes Multiply(std::span<const uint8_t> lhs, std::span<const uint8_t> rhs) const override;
  Bytes Negate(std::span<const uint8_t> value) const override;
  Bytes Invert(std::span<const uint8_t> value) const override;

 private:
  Bytes order_;
};

}  // namespace ecgroup::backend
