#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include "ecgroup/common/bytes.hpp"
#include "ecgroup/crypto/encoding.hpp"

namespace ecgroup::backend {

// Arithmetic modulo a prime group order, on fixed-length canonical encodings in the
// provider's native byte order. Inputs are assumed canonical; outputs always are.
class ScalarField {
 public:
  virtual ~ScalarField() = default;

  virtual size_t length() const = 0;
  virtual ByteOrder byte_order() const = 0;
  // Group order in the native byte order, |length()| bytes.
  virtual const Bytes& order() const = 0;
  // Number of uniform bytes consumed by Reduce() to get a bias-free scalar.
  virtual size_t wide_length() const = 0;

  // Interprets |wide| in the native byte order and reduces it modulo the order.
  virtual Bytes Reduce(std::span<const uint8_t> wide) const = 0;

  virtual Bytes Add(std::span<const uint8_t> lhs, std::span<const uint8_t> rhs) const = 0;
  virtual Bytes Subtract(std::span<const uint8_t> lhs, std::span<const uint8_t> rhs) const = 0;
  virtual Bytes Multiply(std::span<const uint8_t> lhs, std::span<const uint8_t> rhs) const = 0;
  virtual Bytes Negate(std::span<const uint8_t> value) const = 0;
  // Inverse modulo the order. Zero maps to zero on every provider.
  virtual Bytes Invert(std::span<const uint8_t> value) const = 0;
};

}  // namespace ecgroup::backend
