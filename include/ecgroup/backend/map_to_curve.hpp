#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include <gmpxx.h>

#include "ecgroup/crypto/hash.hpp"

namespace ecgroup::backend {

struct AffinePoint {
  mpz_class x;
  mpz_class y;
  bool infinity = false;
};

// hash_to_field of RFC 9380 section 5.2 for GF(p) (extension degree 1), using
// expand_message_xmd and |expand_length| bytes per element.
std::vector<mpz_class> HashToField(HashFunction hash,
                                   std::span<const uint8_t> message,
                                   std::span<const uint8_t> dst,
                                   const mpz_class& p,
                                   size_t expand_length,
                                   size_t count);

// Short Weierstrass curve y^2 = x^3 + a*x + b over GF(p) with its SSWU constant Z.
// The simplified SWU map below needs p = 3 mod 4, a != 0 and b != 0.
struct SswuParameters {
  mpz_class p;
  mpz_class a;
  mpz_class b;
  mpz_class z;
};

AffinePoint MapToCurveSimpleSwu(const mpz_class& u, const SswuParameters& params);

// E': the curve 3-isogenous to secp256k1 that SSWU maps onto, and the isogeny back.
const mpz_class& Secp256k1FieldPrime();
const SswuParameters& Secp256k1IsogenousCurve();
AffinePoint Secp256k1IsogenyMap(const AffinePoint& point);

// Elligator 2 onto curve25519 followed by the rational map to edwards25519.
// The result is on the curve but not necessarily in the prime-order subgroup.
const mpz_class& Curve25519FieldPrime();
AffinePoint MapToEdwards25519(const mpz_class& u);

}  // namespace ecgroup::backend
