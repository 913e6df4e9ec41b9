#include "ecgroup/group/group.hpp"

#include <iomanip>
#include <sstream>

#include "ecgroup/common/errors.hpp"
#include "ecgroup/crypto/expand_message.hpp"
#include "ecgroup/group/element.hpp"
#include "ecgroup/group/registry.hpp"
#include "ecgroup/group/scalar.hpp"

namespace ecgroup {
namespace {

void RequireDst(std::span<const uint8_t> dst) {
  if (dst.empty()) {
    throw EmptyDstError("zero-length DST");
  }
}

}  // namespace

bool Group::Available() const {
  return IsRegisteredGroupId(id_);
}

std::string Group::String() const {
  return std::string(RequireGroupDescriptor(id_).ciphersuite);
}

Scalar Group::NewScalar() const {
  return Scalar(*this);
}

Element Group::NewElement() const {
  return Element(*this);
}

Element Group::Base() const {
  const GroupDescriptor& descriptor = RequireGroupDescriptor(id_);
  return Element(&descriptor, descriptor.curve.generator());
}

HashFunction Group::HashFunc() const {
  return RequireGroupDescriptor(id_).hash;
}

size_t Group::ScalarLength() const {
  return RequireGroupDescriptor(id_).scalars.length();
}

size_t Group::ElementLength() const {
  return RequireGroupDescriptor(id_).curve.element_length();
}

Bytes Group::Order() const {
  return RequireGroupDescriptor(id_).scalars.order();
}

std::string Group::MakeDST(std::string_view app, uint8_t version) const {
  const GroupDescriptor& descriptor = RequireGroupDescriptor(id_);
  std::ostringstream out;
  out << app << "-V" << std::setw(2) << std::setfill('0') << static_cast<unsigned>(version)
      << "-CS" << std::setw(2) << std::setfill('0')
      << static_cast<unsigned>(descriptor.ciphersuite_index) << '-' << descriptor.ciphersuite;
  return out.str();
}

Scalar Group::HashToScalar(std::span<const uint8_t> input, std::span<const uint8_t> dst) const {
  RequireDst(dst);
  const GroupDescriptor& descriptor = RequireGroupDescriptor(id_);
  const backend::ScalarField& field = descriptor.scalars;
  const Bytes uniform = ExpandMessageXmd(descriptor.hash, input, dst, field.wide_length());
  return Scalar(&descriptor, field.Reduce(uniform));
}

Element Group::HashToGroup(std::span<const uint8_t> input, std::span<const uint8_t> dst) const {
  RequireDst(dst);
  const GroupDescriptor& descriptor = RequireGroupDescriptor(id_);
  return Element(&descriptor, descriptor.curve.HashToCurve(input, dst));
}

Element Group::EncodeToGroup(std::span<const uint8_t> input, std::span<const uint8_t> dst) const {
  RequireDst(dst);
  const GroupDescriptor& descriptor = RequireGroupDescriptor(id_);
  return Element(&descriptor, descriptor.curve.EncodeToCurve(input, dst));
}

Element Group::MultiplyBytes(std::span<const uint8_t> scalar,
                             std::span<const uint8_t> element) const {
  Scalar s = NewScalar();
  s.Decode(scalar);
  Element e = NewElement();
  e.Decode(element);
  e.Multiply(s);
  return e;
}

}  // namespace ecgroup
