#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "ecgroup/backend/curve.hpp"
#include "ecgroup/backend/scalar_field.hpp"
#include "ecgroup/crypto/hash.hpp"

namespace ecgroup {

// Everything one group identifier resolves to. Descriptors and their backends are
// built on first lookup and then only read.
struct GroupDescriptor {
  uint8_t id;
  uint8_t ciphersuite_index;
  std::string_view ciphersuite;
  HashFunction hash;
  const backend::ScalarField& scalars;
  const backend::Curve& curve;
};

// Largest assigned identifier. Identifiers above it are never available.
inline constexpr uint8_t kMaxGroupId = 7;

// 2 is reserved for decaf448, which has no backend.
constexpr bool IsRegisteredGroupId(uint8_t id) {
  return id == 1 || (id >= 3 && id <= kMaxGroupId);
}

// Null for unassigned or reserved identifiers.
const GroupDescriptor* FindGroupDescriptor(uint8_t id);

// Throws InvalidGroupError for unassigned or reserved identifiers.
const GroupDescriptor& RequireGroupDescriptor(uint8_t id);

}  // namespace ecgroup
