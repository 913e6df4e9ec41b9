#include "ecgroup/backend/map_to_curve.hpp"

#include <stdexcept>

#include "ecgroup/common/secure_zeroize.hpp"
#include "ecgroup/crypto/encoding.hpp"
#include "ecgroup/crypto/expand_message.hpp"

namespace ecgroup::backend {
namespace {

// RFC 9380 appendix E.1, lowest degree first. The denominators are monic.
struct Secp256k1IsogenyCoefficients {
  mpz_class x_num[4];
  mpz_class x_den[2];
  mpz_class y_num[4];
  mpz_class y_den[3];
};

const Secp256k1IsogenyCoefficients& IsogenyCoefficients() {
  static const Secp256k1IsogenyCoefficients coefficients{
      .x_num = {
          mpz_class("0x8E38E38E38E38E38E38E38E38E38E38E38E38E38E38E38E38E38E38DAAAAA8C7"),
          mpz_class("0x07D3D4C80BC321D5B9F315CEA7FD44C5D595D2FC0BF63B92DFFF1044F17C6581"),
          mpz_class("0x534C328D23F234E6E2A413DECA25CAECE4506144037C40314ECBD0B53D9DD262"),
          mpz_class("0x8E38E38E38E38E38E38E38E38E38E38E38E38E38E38E38E38E38E38DAAAAA88C"),
      },
      .x_den = {
          mpz_class("0xD35771193D94918A9CA34CCBB7B640DD86CD409542F8487D9FE6B745781EB49B"),
          mpz_class("0xEDADC6F64383DC1DF7C4B2D51B54225406D36B641F5E41BBC52A56612A8C6D14"),
      },
      .y_num = {
          mpz_class("0x4BDA12F684BDA12F684BDA12F684BDA12F684BDA12F684BDA12F684B8E38E23C"),
          mpz_class("0xC75E0C32D5CB7C0FA9D0A54B12A0A6D5647AB046D686DA6FDFFC90FC201D71A3"),
          mpz_class("0x29A6194691F91A73715209EF6512E576722830A201BE2018A765E85A9ECEE931"),
          mpz_class("0x2F684BDA12F684BDA12F684BDA12F684BDA12F684BDA12F684BDA12F38E38D84"),
      },
      .y_den = {
          mpz_class("0xFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFEFFFFF93B"),
          mpz_class("0x7A06534BB8BDB49FD5E9E6632722C2989467C1BFC8E8D978DFB425D2685C2573"),
          mpz_class("0x6484AA716545CA2CF3A70C3FA8FE337E0A3D21162F0D6299A7BF8192BFD2A76F"),
      },
  };
  return coefficients;
}

// Montgomery coefficient of curve25519 (K = 1).
const mpz_class& Curve25519J() {
  static const mpz_class j(486662);
  return j;
}

// sqrt(-486664) mod p with sgn0 = 0.
const mpz_class& Edwards25519MapC1() {
  static const mpz_class c1("0x0F26EDF460A006BBD27B08DC03FC4F7EC5A1D3D14B7D1A82CC6E04AAFF457E06");
  return c1;
}

mpz_class Mod(const mpz_class& a, const mpz_class& p) {
  mpz_class r = a % p;
  if (r < 0) {
    r += p;
  }
  return r;
}

mpz_class PowMod(const mpz_class& base, const mpz_class& exp, const mpz_class& p) {
  mpz_class r;
  mpz_powm(r.get_mpz_t(), base.get_mpz_t(), exp.get_mpz_t(), p.get_mpz_t());
  return r;
}

// inv0 of RFC 9380 section 4: the inverse, or 0 for 0.
mpz_class Inv0(const mpz_class& a, const mpz_class& p) {
  const mpz_class reduced = Mod(a, p);
  if (reduced == 0) {
    return 0;
  }
  mpz_class r;
  if (mpz_invert(r.get_mpz_t(), reduced.get_mpz_t(), p.get_mpz_t()) == 0) {
    throw std::runtime_error("Field element has no inverse");
  }
  return r;
}

bool Sgn0(const mpz_class& a) {
  return mpz_odd_p(a.get_mpz_t()) != 0;
}

// Square root for p = 3 mod 4. Returns false when |a| is not a square.
bool SqrtThreeModFour(const mpz_class& a, const mpz_class& p, mpz_class* out) {
  const mpz_class candidate = PowMod(a, (p + 1) / 4, p);
  if (Mod(candidate * candidate, p) != Mod(a, p)) {
    return false;
  }
  *out = candidate;
  return true;
}

// Square root for p = 5 mod 8 (Atkin). Returns false when |a| is not a square.
bool SqrtFiveModEight(const mpz_class& a, const mpz_class& p, mpz_class* out) {
  const mpz_class reduced = Mod(a, p);
  mpz_class candidate = PowMod(reduced, (p + 3) / 8, p);
  if (Mod(candidate * candidate, p) == reduced) {
    *out = candidate;
    return true;
  }

  const mpz_class sqrt_minus_one = PowMod(mpz_class(2), (p - 1) / 4, p);
  candidate = Mod(candidate * sqrt_minus_one, p);
  if (Mod(candidate * candidate, p) == reduced) {
    *out = candidate;
    return true;
  }
  return false;
}

mpz_class EvaluatePolynomial(const mpz_class* coefficients,
                             size_t count,
                             bool monic,
                             const mpz_class& x,
                             const mpz_class& p) {
  // Horner, highest degree first. A monic polynomial has an implicit leading 1.
  mpz_class acc = monic ? mpz_class(1) : coefficients[count - 1];
  const size_t start = monic ? count : count - 1;
  for (size_t i = start; i > 0; --i) {
    acc = Mod(acc * x + coefficients[i - 1], p);
  }
  return acc;
}

}  // namespace

std::vector<mpz_class> HashToField(HashFunction hash,
                                   std::span<const uint8_t> message,
                                   std::span<const uint8_t> dst,
                                   const mpz_class& p,
                                   size_t expand_length,
                                   size_t count) {
  Bytes uniform = ExpandMessageXmd(hash, message, dst, expand_length * count);

  std::vector<mpz_class> out;
  out.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    const std::span<const uint8_t> chunk(uniform.data() + i * expand_length, expand_length);
    out.push_back(Mod(ImportBigEndian(chunk), p));
  }

  SecureZeroize(&uniform);
  return out;
}

AffinePoint MapToCurveSimpleSwu(const mpz_class& u, const SswuParameters& params) {
  const mpz_class& p = params.p;
  const mpz_class& a = params.a;
  const mpz_class& b = params.b;
  const mpz_class& z = params.z;

  const mpz_class u2 = Mod(u * u, p);
  const mpz_class zu2 = Mod(z * u2, p);
  const mpz_class tv1 = Inv0(zu2 * zu2 + zu2, p);

  mpz_class x1;
  if (tv1 == 0) {
    x1 = Mod(b * Inv0(z * a, p), p);
  } else {
    x1 = Mod(-b * Inv0(a, p) * (1 + tv1), p);
  }

  const mpz_class gx1 = Mod(x1 * x1 * x1 + a * x1 + b, p);
  const mpz_class x2 = Mod(zu2 * x1, p);
  const mpz_class gx2 = Mod(x2 * x2 * x2 + a * x2 + b, p);

  AffinePoint out;
  if (SqrtThreeModFour(gx1, p, &out.y)) {
    out.x = x1;
  } else if (SqrtThreeModFour(gx2, p, &out.y)) {
    out.x = x2;
  } else {
    // One of gx1, gx2 is always square.
    throw std::runtime_error("SSWU map found no square root");
  }

  if (Sgn0(Mod(u, p)) != Sgn0(out.y)) {
    out.y = Mod(-out.y, p);
  }
  return out;
}

const mpz_class& Secp256k1FieldPrime() {
  static const mpz_class p("0xFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFEFFFFFC2F");
  return p;
}

const SswuParameters& Secp256k1IsogenousCurve() {
  static const SswuParameters params{
      .p = Secp256k1FieldPrime(),
      .a = mpz_class("0x3F8731ABDD661ADCA08A5558F0F5D272E953D363CB6F0E5D405447C01A444533"),
      .b = mpz_class(1771),
      .z = Secp256k1FieldPrime() - 11,
  };
  return params;
}

AffinePoint Secp256k1IsogenyMap(const AffinePoint& point) {
  if (point.infinity) {
    return point;
  }

  const mpz_class& p = Secp256k1FieldPrime();
  const Secp256k1IsogenyCoefficients& k = IsogenyCoefficients();
  const mpz_class x_num = EvaluatePolynomial(k.x_num, 4, false, point.x, p);
  const mpz_class x_den = EvaluatePolynomial(k.x_den, 2, true, point.x, p);
  const mpz_class y_num = EvaluatePolynomial(k.y_num, 4, false, point.x, p);
  const mpz_class y_den = EvaluatePolynomial(k.y_den, 3, true, point.x, p);

  AffinePoint out;
  if (x_den == 0 || y_den == 0) {
    out.infinity = true;
    return out;
  }
  out.x = Mod(x_num * Inv0(x_den, p), p);
  out.y = Mod(point.y * y_num * Inv0(y_den, p), p);
  return out;
}

const mpz_class& Curve25519FieldPrime() {
  static const mpz_class p("0x7FFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFED");
  return p;
}

AffinePoint MapToEdwards25519(const mpz_class& u) {
  const mpz_class& p = Curve25519FieldPrime();
  const mpz_class& j = Curve25519J();

  // Elligator 2 with Z = 2.
  mpz_class x1 = Mod(-j * Inv0(1 + 2 * u * u, p), p);
  if (x1 == 0) {
    x1 = Mod(-j, p);
  }
  const mpz_class gx1 = Mod(x1 * x1 * x1 + j * x1 * x1 + x1, p);
  const mpz_class x2 = Mod(-x1 - j, p);
  const mpz_class gx2 = Mod(x2 * x2 * x2 + j * x2 * x2 + x2, p);

  mpz_class s;
  mpz_class t;
  if (SqrtFiveModEight(gx1, p, &t)) {
    s = x1;
    if (!Sgn0(t)) {
      t = Mod(-t, p);
    }
  } else if (SqrtFiveModEight(gx2, p, &t)) {
    s = x2;
    if (Sgn0(t)) {
      t = Mod(-t, p);
    }
  } else {
    throw std::runtime_error("Elligator 2 map found no square root");
  }

  // Rational map (s, t) -> (v, w); exceptional inputs go to the identity.
  AffinePoint out;
  if (Mod(t * (s + 1), p) == 0) {
    out.x = 0;
    out.y = 1;
    return out;
  }
  out.x = Mod(Edwards25519MapC1() * s * Inv0(t, p), p);
  out.y = Mod((s - 1) * Inv0(s + 1, p), p);
  return out;
}

}  // namespace ecgroup::backend
