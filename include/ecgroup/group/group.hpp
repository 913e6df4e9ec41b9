#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "ecgroup/common/bytes.hpp"
#include "ecgroup/crypto/hash.hpp"

namespace ecgroup {

class Scalar;
class Element;

// Stable wire identifiers. Gaps are curves without a backend.
enum class GroupId : uint8_t {
  kRistretto255Sha512 = 1,
  kDecaf448Shake256 = 2,
  kP256Sha256 = 3,
  kP384Sha384 = 4,
  kP521Sha512 = 5,
  kEdwards25519Sha512 = 6,
  kSecp256k1Sha256 = 7,
};

// A group selected by identifier. Cheap to copy; every call other than id() and
// Available() throws InvalidGroupError when the identifier is unavailable.
class Group {
 public:
  constexpr Group(GroupId id) : id_(static_cast<uint8_t>(id)) {}
  constexpr explicit Group(uint8_t id) : id_(id) {}

  constexpr uint8_t id() const { return id_; }

  bool Available() const;

  // Ciphersuite name, e.g. "P256_XMD:SHA-256_SSWU_RO_".
  std::string String() const;

  Scalar NewScalar() const;
  Element NewElement() const;
  Element Base() const;

  HashFunction HashFunc() const;
  size_t ScalarLength() const;
  size_t ElementLength() const;

  // Group order in the canonical byte order of the group's scalars.
  Bytes Order() const;

  // "<app>-V<vv>-CS<cc>-<ciphersuite>" with two-digit version and ciphersuite index.
  std::string MakeDST(std::string_view app, uint8_t version) const;

  // The three hash functions below throw EmptyDstError on an empty |dst|.
  Scalar HashToScalar(std::span<const uint8_t> input, std::span<const uint8_t> dst) const;
  // Random-oracle encoding: the output is indistinguishable from a uniform element.
  Element HashToGroup(std::span<const uint8_t> input, std::span<const uint8_t> dst) const;
  // Non-uniform encoding (one map evaluation). Same as HashToGroup for ristretto255.
  Element EncodeToGroup(std::span<const uint8_t> input, std::span<const uint8_t> dst) const;

  // Decodes both inputs and returns element * scalar. Throws DecodingError.
  Element MultiplyBytes(std::span<const uint8_t> scalar, std::span<const uint8_t> element) const;

  bool operator==(const Group& other) const = default;

 private:
  uint8_t id_;
};

inline constexpr Group kRistretto255Sha512(GroupId::kRistretto255Sha512);
inline constexpr Group kP256Sha256(GroupId::kP256Sha256);
inline constexpr Group kP384Sha384(GroupId::kP384Sha384);
inline constexpr Group kP521Sha512(GroupId::kP521Sha512);
inline constexpr Group kEdwards25519Sha512(GroupId::kEdwards25519Sha512);
inline constexpr Group kSecp256k1Sha256(GroupId::kSecp256k1Sha256);

}  // namespace ecgroup
