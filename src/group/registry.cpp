#include "ecgroup/group/registry.hpp"

#include <string>

#include <openssl/obj_mac.h>

#include "ecgroup/backend/curve25519_scalar_field.hpp"
#include "ecgroup/backend/edwards25519_curve.hpp"
#include "ecgroup/backend/nist_curve.hpp"
#include "ecgroup/backend/prime_order_scalar_field.hpp"
#include "ecgroup/backend/ristretto255_curve.hpp"
#include "ecgroup/backend/secp256k1_curve.hpp"
#include "ecgroup/common/errors.hpp"

namespace ecgroup {
namespace {

using backend::Curve25519ScalarField;
using backend::Edwards25519Curve;
using backend::NistCurve;
using backend::NistCurveParams;
using backend::PrimeOrderScalarField;
using backend::Ristretto255Curve;
using backend::Secp256k1Curve;

const Curve25519ScalarField& Curve25519Scalars() {
  static const Curve25519ScalarField field;
  return field;
}

const GroupDescriptor& Ristretto255Sha512() {
  static const Ristretto255Curve curve;
  static const GroupDescriptor descriptor{
      .id = 1,
      .ciphersuite_index = 1,
      .ciphersuite = "ristretto255_XMD:SHA-512_R255MAP_RO_",
      .hash = HashFunction::kSha512,
      .scalars = Curve25519Scalars(),
      .curve = curve,
  };
  return descriptor;
}

const GroupDescriptor& P256Sha256() {
  static const NistCurve curve(NistCurveParams{
      .nid = NID_X9_62_prime256v1,
      .hash = HashFunction::kSha256,
      .field_length = 32,
      .expand_length = 48,
      .sswu_z = -10,
  });
  static const PrimeOrderScalarField field(curve.order(), 32, 48);
  static const GroupDescriptor descriptor{
      .id = 3,
      .ciphersuite_index = 3,
      .ciphersuite = "P256_XMD:SHA-256_SSWU_RO_",
      .hash = HashFunction::kSha256,
      .scalars = field,
      .curve = curve,
  };
  return descriptor;
}

const GroupDescriptor& P384Sha384() {
  static const NistCurve curve(NistCurveParams{
      .nid = NID_secp384r1,
      .hash = HashFunction::kSha384,
      .field_length = 48,
      .expand_length = 72,
      .sswu_z = -12,
  });
  static const PrimeOrderScalarField field(curve.order(), 48, 72);
  static const GroupDescriptor descriptor{
      .id = 4,
      .ciphersuite_index = 4,
      .ciphersuite = "P384_XMD:SHA-384_SSWU_RO_",
      .hash = HashFunction::kSha384,
      .scalars = field,
      .curve = curve,
  };
  return descriptor;
}

const GroupDescriptor& P521Sha512() {
  static const NistCurve curve(NistCurveParams{
      .nid = NID_secp521r1,
      .hash = HashFunction::kSha512,
      .field_length = 66,
      .expand_length = 98,
      .sswu_z = -4,
  });
  static const PrimeOrderScalarField field(curve.order(), 66, 98);
  static const GroupDescriptor descriptor{
      .id = 5,
      .ciphersuite_index = 5,
      .ciphersuite = "P521_XMD:SHA-512_SSWU_RO_",
      .hash = HashFunction::kSha512,
      .scalars = field,
      .curve = curve,
  };
  return descriptor;
}

const GroupDescriptor& Edwards25519Sha512() {
  static const Edwards25519Curve curve;
  static const GroupDescriptor descriptor{
      .id = 6,
      .ciphersuite_index = 6,
      .ciphersuite = "edwards25519_XMD:SHA-512_ELL2_RO_",
      .hash = HashFunction::kSha512,
      .scalars = Curve25519Scalars(),
      .curve = curve,
  };
  return descriptor;
}

const GroupDescriptor& Secp256k1Sha256() {
  static const Secp256k1Curve curve;
  static const PrimeOrderScalarField field(
      mpz_class("0xFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFEBAAEDCE6AF48A03BBFD25E8CD0364141"), 32, 48);
  static const GroupDescriptor descriptor{
      .id = 7,
      .ciphersuite_index = 7,
      .ciphersuite = "secp256k1_XMD:SHA-256_SSWU_RO_",
      .hash = HashFunction::kSha256,
      .scalars = field,
      .curve = curve,
  };
  return descriptor;
}

}  // namespace

const GroupDescriptor* FindGroupDescriptor(uint8_t id) {
  if (!IsRegisteredGroupId(id)) {
    return nullptr;
  }

  switch (id) {
    case 1:
      return &Ristretto255Sha512();
    case 3:
      return &P256Sha256();
    case 4:
      return &P384Sha384();
    case 5:
      return &P521Sha512();
    case 6:
      return &Edwards25519Sha512();
    case 7:
      return &Secp256k1Sha256();
    default:
      return nullptr;
  }
}

const GroupDescriptor& RequireGroupDescriptor(uint8_t id) {
  const GroupDescriptor* descriptor = FindGroupDescriptor(id);
  if (descriptor == nullptr) {
    throw InvalidGroupError("invalid group identifier: " + std::to_string(static_cast<unsigned>(id)));
  }
  return *descriptor;
}

}  // namespace ecgroup
