#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <gmpxx.h>

#include "ecgroup/backend/map_to_curve.hpp"
#include "ecgroup/common/bytes.hpp"
#include "ecgroup/ecgroup.hpp"

namespace {

using ecgroup::AsByteSpan;
using ecgroup::Element;
using ecgroup::HashFunction;
namespace backend = ecgroup::backend;

// Built during static initialization of this file, before main and in no particular
// order relative to the library's own translation units.
const mpz_class kEarlySecp256k1Prime = backend::Secp256k1FieldPrime();
const mpz_class kEarlyCurve25519Prime = backend::Curve25519FieldPrime();
const std::vector<mpz_class> kEarlyField =
    backend::HashToField(HashFunction::kSha256, AsByteSpan("abc"), AsByteSpan("DST"),
                         backend::Secp256k1FieldPrime(), 48, 1);
const Element kEarlySecp256k1Hash = ecgroup::kSecp256k1Sha256.HashToGroup(
    AsByteSpan(""), AsByteSpan("QUUX-V01-CS02-with-secp256k1_XMD:SHA-256_SSWU_RO_"));
const Element kEarlyEdwards25519Hash = ecgroup::kEdwards25519Sha512.HashToGroup(
    AsByteSpan(""), AsByteSpan("QUUX-V01-CS02-with-edwards25519_XMD:SHA-512_ELL2_RO_"));

void Expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error("Test failed: " + message);
  }
}

void TestEarlyFieldConstants() {
  Expect(kEarlySecp256k1Prime ==
             mpz_class("0xFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFEFFFFFC2F"),
         "secp256k1 field prime read before main");
  Expect(kEarlyCurve25519Prime ==
             mpz_class("0x7FFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFED"),
         "curve25519 field prime read before main");
}

void TestEarlyHashToField() {
  const std::vector<mpz_class> now = backend::HashToField(
      HashFunction::kSha256, AsByteSpan("abc"), AsByteSpan("DST"), backend::Secp256k1FieldPrime(), 48, 1);
  Expect(kEarlyField.size() == 1, "hash_to_field count before main");
  Expect(kEarlyField == now, "hash_to_field before main matches the result after");
  Expect(kEarlyField[0] > 0 && kEarlyField[0] < backend::Secp256k1FieldPrime(), "field element is reduced");
}

void TestEarlyHashToGroup() {
  Expect(kEarlySecp256k1Hash.Hex() == "03c1cae290e291aee617ebaef1be6d73861479c48b841eaba9b7b5852ddfeb1346",
         "secp256k1 HashToGroup before main");
  Expect(kEarlyEdwards25519Hash.Hex() == "21dc15e10253796df23a7699c8a383ea624cce88c52431f6be220b1a56c8a609",
         "edwards25519 HashToGroup before main");
}

}  // namespace

int main() {
  try {
    TestEarlyFieldConstants();
    TestEarlyHashToField();
    TestEarlyHashToGroup();
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << '\n';
    return 1;
  }

  std::cout << "Static initialization tests passed" << '\n';
  return 0;
}
