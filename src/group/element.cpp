#include "ecgroup/group/element.hpp"

#include <utility>

#include <openssl/crypto.h>

#include "ecgroup/common/errors.hpp"
#include "ecgroup/crypto/encoding.hpp"
#include "ecgroup/group/registry.hpp"
#include "ecgroup/group/scalar.hpp"

namespace ecgroup {

Element::Element(Group group)
    : descriptor_(&RequireGroupDescriptor(group.id())), value_(descriptor_->curve.identity()) {}

Element::Element(const GroupDescriptor* descriptor, Bytes value)
    : descriptor_(descriptor), value_(std::move(value)) {}

Element::Element(Element&& other) : descriptor_(other.descriptor_), value_(std::move(other.value_)) {
  other.value_ = descriptor_->curve.identity();
}

Element& Element::operator=(Element&& other) {
  if (this != &other) {
    descriptor_ = other.descriptor_;
    value_ = std::move(other.value_);
    other.value_ = descriptor_->curve.identity();
  }
  return *this;
}

Group Element::group() const {
  return Group(descriptor_->id);
}

const GroupDescriptor& Element::RequireSameGroup(uint8_t other_id) const {
  if (other_id != descriptor_->id) {
    throw CastMismatchError("cannot mix operands of different groups");
  }
  return *descriptor_;
}

Element& Element::Base() {
  value_ = descriptor_->curve.generator();
  return *this;
}

Element& Element::Identity() {
  value_ = descriptor_->curve.identity();
  return *this;
}

Element& Element::Add(const Element* other) {
  if (other == nullptr) {
    throw NilParameterError("element Add: nil element");
  }
  value_ = RequireSameGroup(other->descriptor_->id).curve.Add(value_, other->value_);
  return *this;
}

Element& Element::Subtract(const Element* other) {
  if (other == nullptr) {
    throw NilParameterError("element Subtract: nil element");
  }
  value_ = RequireSameGroup(other->descriptor_->id).curve.Subtract(value_, other->value_);
  return *this;
}

Element& Element::Double() {
  value_ = descriptor_->curve.Double(value_);
  return *this;
}

Element& Element::Negate() {
  value_ = descriptor_->curve.Negate(value_);
  return *this;
}

Element& Element::Multiply(const Scalar* scalar) {
  if (scalar == nullptr) {
    return Identity();
  }
  value_ = RequireSameGroup(scalar->descriptor_->id).curve.Multiply(value_, scalar->value_);
  return *this;
}

Element& Element::InvertMultiply(const Scalar* scalar) {
  if (scalar == nullptr) {
    throw NilParameterError("element InvertMultiply: nil scalar");
  }
  RequireSameGroup(scalar->descriptor_->id);
  const Scalar inverse = scalar->Copy().Invert();
  return Multiply(&inverse);
}

bool Element::Equal(const Element* other) const {
  if (other == nullptr) {
    return false;
  }
  RequireSameGroup(other->descriptor_->id);
  return CRYPTO_memcmp(value_.data(), other->value_.data(), value_.size()) == 0;
}

bool Element::IsIdentity() const {
  return descriptor_->curve.IsIdentity(value_);
}

Element& Element::Set(const Element* other) {
  if (other == nullptr) {
    return Identity();
  }
  RequireSameGroup(other->descriptor_->id);
  if (other != this) {
    value_ = other->value_;
  }
  return *this;
}

Element Element::Copy() const {
  return Element(descriptor_, value_);
}

Bytes Element::Encode() const {
  return value_;
}

Bytes Element::XCoordinate() const {
  return descriptor_->curve.XCoordinate(value_);
}

void Element::Decode(std::span<const uint8_t> data) {
  const backend::Curve& curve = descriptor_->curve;
  if (data.size() != curve.element_length()) {
    throw DecodingError(DecodingFailure::kWrongLength, "element Decode: invalid element length");
  }

  if (curve.IsIdentity(data)) {
    if (!curve.identity_decodable()) {
      throw DecodingError(DecodingFailure::kIdentity, "element Decode: identity element is not allowed");
    }
  } else {
    try {
      curve.ValidateNonIdentity(data);
    } catch (const DecodingError& ex) {
      throw DecodingError(ex.reason(), std::string("element Decode: ") + ex.what());
    }
  }
  value_.assign(data.begin(), data.end());
}

std::string Element::Hex() const {
  return HexEncode(value_);
}

void Element::DecodeHex(std::string_view hex) {
  Decode(HexDecode(hex));
}

std::string Element::MarshalJson() const {
  return QuoteJsonString(Hex());
}

void Element::UnmarshalJson(std::string_view json) {
  DecodeHex(UnquoteJsonString(json));
}

Bytes Element::MarshalBinary() const {
  return Encode();
}

void Element::UnmarshalBinary(std::span<const uint8_t> data) {
  try {
    Decode(data);
  } catch (const DecodingError& ex) {
    throw DecodingError(ex.reason(), std::string("element UnmarshalBinary: ") + ex.what());
  }
}

}  // namespace ecgroup
