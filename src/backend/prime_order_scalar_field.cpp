#include "ecgroup/backend/prime_order_scalar_field.hpp"

#include <stdexcept>

namespace ecgroup::backend {
namespace {

mpz_class ImportCanonical(std::span<const uint8_t> bytes, size_t length) {
  if (bytes.size() != length) {
    throw std::invalid_argument("Canonical scalar has the wrong length");
  }
  return ImportBigEndian(bytes);
}

}  // namespace

PrimeOrderScalarField::PrimeOrderScalarField(const mpz_class& order,
                                             size_t length,
                                             size_t wide_length)
    : q_(order), length_(length), wide_length_(wide_length) {
  if (q_ <= 1) {
    throw std::invalid_argument("Scalar field order must be greater than one");
  }
  order_ = ExportBigEndian(q_, length_);
}

size_t PrimeOrderScalarField::length() const {
  return length_;
}

ByteOrder PrimeOrderScalarField::byte_order() const {
  return ByteOrder::kBigEndian;
}

const Bytes& PrimeOrderScalarField::order() const {
  return order_;
}

size_t PrimeOrderScalarField::wide_length() const {
  return wide_length_;
}

mpz_class PrimeOrderScalarField::NormalizeToQ(const mpz_class& input) const {
  mpz_class normalized = input % q_;
  if (normalized < 0) {
    normalized += q_;
  }
  return normalized;
}

Bytes PrimeOrderScalarField::Export(const mpz_class& value) const {
  return ExportBigEndian(NormalizeToQ(value), length_);
}

Bytes PrimeOrderScalarField::Reduce(std::span<const uint8_t> wide) const {
  return Export(ImportBigEndian(wide));
}

Bytes PrimeOrderScalarField::Add(std::span<const uint8_t> lhs, std::span<const uint8_t> rhs) const {
  return Export(ImportCanonical(lhs, length_) + ImportCanonical(rhs, length_));
}

Bytes PrimeOrderScalarField::Subtract(std::span<const uint8_t> lhs,
                                      std::span<const uint8_t> rhs) const {
  return Export(ImportCanonical(lhs, length_) - ImportCanonical(rhs, length_));
}

Bytes PrimeOrderScalarField::Multiply(std::span<const uint8_t> lhs,
                                      std::span<const uint8_t> rhs) const {
  return Export(ImportCanonical(lhs, length_) * ImportCanonical(rhs, length_));
}

Bytes PrimeOrderScalarField::Negate(std::span<const uint8_t> value) const {
  return Export(-ImportCanonical(value, length_));
}

Bytes PrimeOrderScalarField::Invert(std::span<const uint8_t> value) const {
  const mpz_class x = NormalizeToQ(ImportCanonical(value, length_));
  mpz_class inverse;
  if (mpz_invert(inverse.get_mpz_t(), x.get_mpz_t(), q_.get_mpz_t()) == 0) {
    // Only zero has no inverse modulo a prime.
    inverse = 0;
  }
  return Export(inverse);
}

}  // namespace ecgroup::backend
