#pragma once

#include <gmpxx.h>

#include "ecgroup/backend/scalar_field.hpp"

namespace ecgroup::backend {

// Scalars modulo an arbitrary prime order, big-endian, backed by GMP. Used for the
// short Weierstrass groups.
class PrimeOrderScalarField final : public ScalarField {
 public:
  PrimeOrderScalarField(const mpz_class& order, size_t length, size_t wide_length);

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
  mpz_class NormalizeToQ(const mpz_class& input) const;
  Bytes Export(const mpz_class& value) const;

  mpz_class q_;
  size_t length_;
  size_t wide_length_;
  Bytes order_;
};

}  // namespace ecgroup::backend
