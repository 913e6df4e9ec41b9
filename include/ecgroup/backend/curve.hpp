#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include "ecgroup/common/bytes.hpp"

namespace ecgroup::backend {

// Group law of one prime-order group, on canonical fixed-length encodings. Inputs
// are assumed valid (produced by this curve or accepted by ValidateNonIdentity);
// outputs are always canonical.
class Curve {
 public:
  virtual ~Curve() = default;

  virtual size_t element_length() const = 0;
  virtual const Bytes& identity() const = 0;
  virtual const Bytes& generator() const = 0;
  // Whether Decode may return the identity. Curves answering false still encode it.
  virtual bool identity_decodable() const = 0;

  // Throws DecodingError(kInvalidEncoding) unless |encoded| is the canonical encoding
  // of a non-identity element of the prime-order subgroup.
  virtual void ValidateNonIdentity(std::span<const uint8_t> encoded) const = 0;

  virtual Bytes Add(std::span<const uint8_t> lhs, std::span<const uint8_t> rhs) const = 0;
  virtual Bytes Negate(std::span<const uint8_t> point) const = 0;
  virtual Bytes Subtract(std::span<const uint8_t> lhs, std::span<const uint8_t> rhs) const;
  virtual Bytes Double(std::span<const uint8_t> point) const;
  // |scalar| is a canonical encoding from the group's scalar field.
  virtual Bytes Multiply(std::span<const uint8_t> point, std::span<const uint8_t> scalar) const = 0;

  // Alternate coordinate of the point. Not invertible: decoding it may give another point.
  virtual Bytes XCoordinate(std::span<const uint8_t> point) const = 0;

  // Random-oracle and non-uniform hash-to-curve of RFC 9380 for this curve.
  virtual Bytes HashToCurve(std::span<const uint8_t> message, std::span<const uint8_t> dst) const = 0;
  virtual Bytes EncodeToCurve(std::span<const uint8_t> message,
                              std::span<const uint8_t> dst) const = 0;

  bool IsIdentity(std::span<const uint8_t> point) const;
};

}  // namespace ecgroup::backend
