#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "ecgroup/common/bytes.hpp"
#include "ecgroup/crypto/random.hpp"
#include "ecgroup/group/group.hpp"

namespace ecgroup {

struct GroupDescriptor;

// An integer modulo the order of its group, held in canonical form.
//
// Mutators change the receiver and return it for chaining. Binary operators take a
// pointer so that a null operand can be given; null is absorbed: Add and Subtract
// leave the receiver unchanged, Multiply and Set zero it, Pow gives one, Equal and
// LessOrEqual return false. An operand from another group throws CastMismatchError.
class Scalar {
 public:
  explicit Scalar(Group group);

  Scalar(const Scalar& other) = default;
  // A moved-from scalar is zero.
  Scalar(Scalar&& other);
  Scalar& operator=(const Scalar& other) = default;
  Scalar& operator=(Scalar&& other);
  ~Scalar();

  Group group() const;

  Scalar& Zero();
  Scalar& One();
  Scalar& MinusOne();

  // Uniform non-zero scalar. Wide input is reduced, so there is no modular bias.
  Scalar& Random();
  Scalar& Random(const EntropySource& entropy);

  Scalar& Add(const Scalar* other);
  Scalar& Add(const Scalar& other) { return Add(&other); }
  Scalar& Subtract(const Scalar* other);
  Scalar& Subtract(const Scalar& other) { return Subtract(&other); }
  Scalar& Multiply(const Scalar* other);
  Scalar& Multiply(const Scalar& other) { return Multiply(&other); }
  Scalar& Pow(const Scalar* exponent);
  Scalar& Pow(const Scalar& exponent) { return Pow(&exponent); }

  // Zero inverts to zero.
  Scalar& Invert();

  bool Equal(const Scalar* other) const;
  bool Equal(const Scalar& other) const { return Equal(&other); }
  // Compares the values as unsigned integers.
  bool LessOrEqual(const Scalar* other) const;
  bool LessOrEqual(const Scalar& other) const { return LessOrEqual(&other); }
  bool IsZero() const;

  Scalar& Set(const Scalar* other);
  Scalar& Set(const Scalar& other) { return Set(&other); }
  Scalar& SetUInt64(uint64_t value);
  // Throws ValueOverflowError when the value does not fit in 64 bits.
  uint64_t UInt64() const;

  Scalar Copy() const;

  // Fixed-length canonical encoding, in the group's native byte order.
  Bytes Encode() const;
  // Throws DecodingError on a wrong length or a value not below the order. The
  // receiver is left unchanged on failure.
  void Decode(std::span<const uint8_t> data);

  std::string Hex() const;
  void DecodeHex(std::string_view hex);
  std::string MarshalJson() const;
  void UnmarshalJson(std::string_view json);
  Bytes MarshalBinary() const;
  void UnmarshalBinary(std::span<const uint8_t> data);

 private:
  friend class Element;
  friend class Group;

  Scalar(const GroupDescriptor* descriptor, Bytes value);

  const GroupDescriptor& RequireSameGroup(const Scalar& other) const;

  const GroupDescriptor* descriptor_;
  Bytes value_;
};

}  // namespace ecgroup
