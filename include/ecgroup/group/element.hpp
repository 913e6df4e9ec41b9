#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "ecgroup/common/bytes.hpp"
#include "ecgroup/group/group.hpp"

namespace ecgroup {

struct GroupDescriptor;
class Scalar;

// An element of a prime-order group: the identity or a member of the prime-order
// subgroup, held in canonical encoding.
//
// Mutators change the receiver and return it for chaining. A null element operand
// to Add or Subtract throws NilParameterError; a null scalar in Multiply gives the
// identity. An operand from another group throws CastMismatchError.
class Element {
 public:
  explicit Element(Group group);

  Element(const Element& other) = default;
  // A moved-from element is the identity.
  Element(Element&& other);
  Element& operator=(const Element& other) = default;
  Element& operator=(Element&& other);

  Group group() const;

  Element& Base();
  Element& Identity();

  Element& Add(const Element* other);
  Element& Add(const Element& other) { return Add(&other); }
  Element& Subtract(const Element* other);
  Element& Subtract(const Element& other) { return Subtract(&other); }
  Element& Double();
  Element& Negate();

  Element& Multiply(const Scalar* scalar);
  Element& Multiply(const Scalar& scalar) { return Multiply(&scalar); }
  // Multiplies by the inverse of |scalar|. Throws NilParameterError on null.
  Element& InvertMultiply(const Scalar* scalar);
  Element& InvertMultiply(const Scalar& scalar) { return InvertMultiply(&scalar); }

  bool Equal(const Element* other) const;
  bool Equal(const Element& other) const { return Equal(&other); }
  bool IsIdentity() const;

  // Null sets the identity.
  Element& Set(const Element* other);
  Element& Set(const Element& other) { return Set(&other); }

  Element Copy() const;

  Bytes Encode() const;
  // One coordinate of the point (the Montgomery u for edwards25519, the affine x for
  // Weierstrass curves). It does not determine the point: decoding it back is not
  // guaranteed to give this element.
  Bytes XCoordinate() const;
  // Throws DecodingError on a wrong length, an invalid or non-canonical encoding, or
  // the identity on groups that refuse it. The receiver is left unchanged on failure.
  void Decode(std::span<const uint8_t> data);

  std::string Hex() const;
  void DecodeHex(std::string_view hex);
  std::string MarshalJson() const;
  void UnmarshalJson(std::string_view json);
  Bytes MarshalBinary() const;
  void UnmarshalBinary(std::span<const uint8_t> data);

 private:
  friend class Group;

  Element(const GroupDescriptor* descriptor, Bytes value);

  const GroupDescriptor& RequireSameGroup(uint8_t other_id) const;

  const GroupDescriptor* descriptor_;
  Bytes value_;
};

}  // namespace ecgroup
