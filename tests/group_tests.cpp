#include <cstdint>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "ecgroup/common/bytes.hpp"
#include "ecgroup/common/errors.hpp"
#include "ecgroup/crypto/encoding.hpp"
#include "ecgroup/ecgroup.hpp"

namespace {

using ecgroup::Bytes;
using ecgroup::DecodingError;
using ecgroup::Element;
using ecgroup::Group;
using ecgroup::GroupId;
using ecgroup::HashFunction;
using ecgroup::HexEncode;
using ecgroup::InvalidGroupError;
using ecgroup::Scalar;

struct GroupFacts {
  Group group;
  std::string name;
  HashFunction hash;
  size_t scalar_length;
  size_t element_length;
  std::string identity_hex;
  std::string base_hex;
  std::string order_hex;
};

const std::vector<GroupFacts>& AllGroupFacts() {
  static const std::vector<GroupFacts> facts = {
      {ecgroup::kRistretto255Sha512, "ristretto255_XMD:SHA-512_R255MAP_RO_", HashFunction::kSha512, 32, 32,
       std::string(64, '0'), "e2f2ae0a6abc4e71a884a961c500515f58e30b6aa582dd8db6a65945e08d2d76",
       "edd3f55c1a631258d69cf7a2def9de1400000000000000000000000000000010"},
      {ecgroup::kP256Sha256, "P256_XMD:SHA-256_SSWU_RO_", HashFunction::kSha256, 32, 33, std::string(66, '0'),
       "036b17d1f2e12c4247f8bce6e563a440f277037d812deb33a0f4a13945d898c296",
       "ffffffff00000000ffffffffffffffffbce6faada7179e84f3b9cac2fc632551"},
      {ecgroup::kP384Sha384, "P384_XMD:SHA-384_SSWU_RO_", HashFunction::kSha384, 48, 49, std::string(98, '0'),
       "03aa87ca22be8b05378eb1c71ef320ad746e1d3b628ba79b9859f741e082542a385502f25dbf55296c3a545e3872760ab7",
       "ffffffffffffffffffffffffffffffffffffffffffffffffc7634d81f4372ddf581a0db248b0a77aecec196accc52973"},
      {ecgroup::kP521Sha512, "P521_XMD:SHA-512_SSWU_RO_", HashFunction::kSha512, 66, 67, std::string(134, '0'),
       "0200c6858e06b70404e9cd9e3ecb662395b4429c648139053fb521f828af606b4d3dbaa14b5e77efe75928fe1dc127a2ffa8de3348b3c1856a429bf97e7e31c2e5bd66",
       "01fffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffa51868783bf2f966b7fcc0148f709a5d03bb5c9b8899c47aebb6fb71e91386409"},
      {ecgroup::kEdwards25519Sha512, "edwards25519_XMD:SHA-512_ELL2_RO_", HashFunction::kSha512, 32, 32,
       "01" + std::string(62, '0'), "5866666666666666666666666666666666666666666666666666666666666666",
       "edd3f55c1a631258d69cf7a2def9de1400000000000000000000000000000010"},
      {ecgroup::kSecp256k1Sha256, "secp256k1_XMD:SHA-256_SSWU_RO_", HashFunction::kSha256, 32, 33,
       std::string(66, '0'), "0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798",
       "fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141"},
  };
  return facts;
}

void Expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error("Test failed: " + message);
  }
}

void ExpectInvalidGroup(const std::function<void()>& fn, const std::string& message) {
  try {
    fn();
  } catch (const InvalidGroupError&) {
    return;
  }
  throw std::runtime_error("Expected InvalidGroupError: " + message);
}

void TestGroupFacts() {
  for (const auto& facts : AllGroupFacts()) {
    const Group& group = facts.group;
    Expect(group.Available(), facts.name + " must be available");
    Expect(group.String() == facts.name, "ciphersuite name of " + facts.name);
    Expect(group.HashFunc() == facts.hash, "hash function of " + facts.name);
    Expect(group.ScalarLength() == facts.scalar_length, "scalar length of " + facts.name);
    Expect(group.ElementLength() == facts.element_length, "element length of " + facts.name);
    Expect(HexEncode(group.Order()) == facts.order_hex, "order of " + facts.name);
    Expect(group.Base().Hex() == facts.base_hex, "generator of " + facts.name);
  }
}

void TestOrderIsACopy() {
  const Group group = ecgroup::kP256Sha256;
  Bytes order = group.Order();
  order[0] = 0;
  Expect(group.Order()[0] == 0xff, "Order must return an independent copy");
}

void TestNewValues() {
  for (const auto& facts : AllGroupFacts()) {
    const Scalar zero = facts.group.NewScalar();
    Expect(zero.Encode() == Bytes(facts.scalar_length, 0), "NewScalar encodes to zeros for " + facts.name);
    Expect(zero.IsZero(), "NewScalar is zero for " + facts.name);

    const Element identity = facts.group.NewElement();
    Expect(identity.Hex() == facts.identity_hex, "NewElement encodes to the identity for " + facts.name);
    Expect(identity.IsIdentity(), "NewElement is the identity for " + facts.name);
    Expect(identity.group() == facts.group, "NewElement belongs to its group");
    Expect(zero.group() == facts.group, "NewScalar belongs to its group");
  }
}

void TestMakeDst() {
  Expect(ecgroup::kRistretto255Sha512.MakeDST("app", 1) == "app-V01-CS01-ristretto255_XMD:SHA-512_R255MAP_RO_",
         "ristretto255 DST");
  Expect(ecgroup::kP256Sha256.MakeDST("app", 1) == "app-V01-CS03-P256_XMD:SHA-256_SSWU_RO_", "P-256 DST");
  Expect(ecgroup::kP384Sha384.MakeDST("x", 12) == "x-V12-CS04-P384_XMD:SHA-384_SSWU_RO_", "P-384 DST");
  Expect(ecgroup::kP521Sha512.MakeDST("x", 0) == "x-V00-CS05-P521_XMD:SHA-512_SSWU_RO_", "P-521 DST");
  Expect(ecgroup::kEdwards25519Sha512.MakeDST("x", 3) == "x-V03-CS06-edwards25519_XMD:SHA-512_ELL2_RO_",
         "edwards25519 DST");
  Expect(ecgroup::kSecp256k1Sha256.MakeDST("x", 99) == "x-V99-CS07-secp256k1_XMD:SHA-256_SSWU_RO_",
         "secp256k1 DST");
}

void TestUnavailableGroups() {
  std::vector<uint8_t> ids = {0, 2, 8, 9, 42, 255};
  for (uint8_t id : ids) {
    const Group group(id);
    const std::string label = "group " + std::to_string(static_cast<unsigned>(id));
    Expect(!group.Available(), label + " must be unavailable");
    ExpectInvalidGroup([&]() { (void)group.String(); }, "String on " + label);
    ExpectInvalidGroup([&]() { (void)group.NewScalar(); }, "NewScalar on " + label);
    ExpectInvalidGroup([&]() { (void)group.NewElement(); }, "NewElement on " + label);
    ExpectInvalidGroup([&]() { (void)group.Base(); }, "Base on " + label);
    ExpectInvalidGroup([&]() { (void)group.ScalarLength(); }, "ScalarLength on " + label);
    ExpectInvalidGroup([&]() { (void)group.ElementLength(); }, "ElementLength on " + label);
    ExpectInvalidGroup([&]() { (void)group.Order(); }, "Order on " + label);
    ExpectInvalidGroup([&]() { (void)group.MakeDST("app", 1); }, "MakeDST on " + label);
    ExpectInvalidGroup([&]() { (void)group.HashToScalar(Bytes{1}, Bytes{1}); }, "HashToScalar on " + label);
  }
  Expect(!Group(GroupId::kDecaf448Shake256).Available(), "decaf448 is reserved");
}

void TestMultiplyBytes() {
  for (const auto& facts : AllGroupFacts()) {
    const Group& group = facts.group;
    Scalar s = group.NewScalar();
    s.SetUInt64(5);
    const Element expected = group.Base().Multiply(s);
    const Element product = group.MultiplyBytes(s.Encode(), group.Base().Encode());
    Expect(product.Equal(expected), "MultiplyBytes must match Multiply for " + facts.name);

    bool rejected = false;
    try {
      (void)group.MultiplyBytes(Bytes(facts.scalar_length + 1, 0), group.Base().Encode());
    } catch (const DecodingError&) {
      rejected = true;
    }
    Expect(rejected, "MultiplyBytes must reject a malformed scalar for " + facts.name);
  }
}

void TestGroupEquality() {
  Expect(Group(static_cast<uint8_t>(3)) == ecgroup::kP256Sha256, "groups compare by identifier");
  Expect(!(ecgroup::kP256Sha256 == ecgroup::kP384Sha384), "distinct identifiers are distinct groups");
  Expect(ecgroup::kSecp256k1Sha256.id() == 7, "secp256k1 identifier");
}

}  // namespace

int main() {
  try {
    TestGroupFacts();
    TestOrderIsACopy();
    TestNewValues();
    TestMakeDst();
    TestUnavailableGroups();
    TestMultiplyBytes();
    TestGroupEquality();
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << '\n';
    return 1;
  }

  std::cout << "Group tests passed" << '\n';
  return 0;
}
