#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <gmpxx.h>

#include "ecgroup/common/bytes.hpp"
#include "ecgroup/common/errors.hpp"
#include "ecgroup/crypto/encoding.hpp"
#include "ecgroup/crypto/expand_message.hpp"
#include "ecgroup/crypto/hash.hpp"
#include "ecgroup/crypto/random.hpp"

namespace {

using ecgroup::AsByteSpan;
using ecgroup::ByteOrder;
using ecgroup::Bytes;
using ecgroup::CompareBigEndian;
using ecgroup::Csprng;
using ecgroup::DecodingError;
using ecgroup::DecodingFailure;
using ecgroup::Digest;
using ecgroup::EmptyDstError;
using ecgroup::ExpandMessageXmd;
using ecgroup::ExportBigEndian;
using ecgroup::FromBigEndian;
using ecgroup::HashFunction;
using ecgroup::HexDecode;
using ecgroup::HexEncode;
using ecgroup::ImportBigEndian;
using ecgroup::QuoteJsonString;
using ecgroup::Sha256;
using ecgroup::ToBigEndian;
using ecgroup::UnquoteJsonString;

void Expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error("Test failed: " + message);
  }
}

void ExpectThrow(const std::function<void()>& fn, const std::string& message) {
  try {
    fn();
  } catch (const std::exception&) {
    return;
  }
  throw std::runtime_error("Expected exception: " + message);
}

void TestHexEncoding() {
  const Bytes data = {0x00, 0x01, 0xab, 0xff};
  Expect(HexEncode(data) == "0001abff", "hex encoding must be lowercase and zero padded");
  Expect(HexDecode("0001ABff") == data, "hex decoding must accept both cases");
  Expect(HexDecode("").empty(), "empty hex decodes to no bytes");

  try {
    (void)HexDecode("abc");
    throw std::runtime_error("Expected exception: odd-length hex");
  } catch (const DecodingError& ex) {
    Expect(ex.reason() == DecodingFailure::kInvalidHex, "odd-length hex reports invalid hex");
  }
  ExpectThrow([]() { (void)HexDecode("zz"); }, "non-hex characters must be rejected");
}

void TestJsonQuoting() {
  Expect(QuoteJsonString("0a0b") == "\"0a0b\"", "JSON form is the quoted string");
  Expect(UnquoteJsonString("\"0a0b\"") == "0a0b", "unquoting strips the quotes");
  Expect(UnquoteJsonString("0a0b") == "0a0b", "unquoted input is passed through");
}

void TestBigEndianConversions() {
  const std::vector<mpz_class> values = {
      mpz_class(0), mpz_class(1), mpz_class(255), mpz_class(256),
      mpz_class("123456789012345678901234567890")};
  for (const auto& value : values) {
    const Bytes encoded = ExportBigEndian(value, 16);
    Expect(encoded.size() == 16, "export must produce the requested width");
    Expect(ImportBigEndian(encoded) == value, "import must invert export");
  }

  Expect(ExportBigEndian(mpz_class(0x0102), 4) == Bytes({0x00, 0x00, 0x01, 0x02}),
         "export must left-pad with zeros");
  ExpectThrow([]() { (void)ExportBigEndian(mpz_class(0x010203), 2); },
              "export must reject values wider than the requested width");
  ExpectThrow([]() { (void)ExportBigEndian(mpz_class(-1), 2); },
              "export must reject negative values");

  const Bytes little = {0x01, 0x02, 0x03};
  Expect(ToBigEndian(little, ByteOrder::kLittleEndian) == Bytes({0x03, 0x02, 0x01}),
         "little-endian input must be reversed");
  Expect(ToBigEndian(little, ByteOrder::kBigEndian) == little, "big-endian input is copied");
  Expect(FromBigEndian(ToBigEndian(little, ByteOrder::kLittleEndian), ByteOrder::kLittleEndian) == little,
         "byte order normalization must be reversible");

  Expect(CompareBigEndian(Bytes({0x00, 0xff}), Bytes({0x01, 0x00})) < 0, "compare must be lexicographic");
  Expect(CompareBigEndian(Bytes({0x01, 0x00}), Bytes({0x00, 0xff})) > 0, "compare must be lexicographic");
  Expect(CompareBigEndian(Bytes({0x01, 0x00}), Bytes({0x01, 0x00})) == 0, "equal magnitudes compare equal");
  ExpectThrow([]() { (void)CompareBigEndian(Bytes({0x01}), Bytes({0x00, 0x01})); },
              "compare must reject operands of different lengths");
}

void TestSha256() {
  Expect(HexEncode(Sha256(AsByteSpan("abc"))) ==
             "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
         "SHA-256 of abc");
  Expect(HexEncode(Digest(HashFunction::kSha384, AsByteSpan("abc"))) ==
             "cb00753f45a35e8bb5a03d699ac65007272c32ab0eded1631a8b605a43ff5bed"
             "8086072ba1e7cc2358baeca134c825a7",
         "SHA-384 of abc");
  Expect(HexEncode(Digest(HashFunction::kSha512, AsByteSpan("abc"))) ==
             "ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a"
             "2192992a274fc1a836ba3c23a3feebbd454d4423643ce80e2a9ac94fa54ca49f",
         "SHA-512 of abc");
  Expect(Digest(HashFunction::kSha256, AsByteSpan("abc")) == Sha256(AsByteSpan("abc")),
         "Digest dispatches on the hash function");
}

void TestExpandMessageXmdVectors() {
  const std::string dst256 = "QUUX-V01-CS02-with-expander-SHA256-128";
  Expect(HexEncode(ExpandMessageXmd(HashFunction::kSha256, AsByteSpan(""), AsByteSpan(dst256), 0x20)) ==
             "68a985b87eb6b46952128911f2a4412bbc302a9d759667f87f7a21d803f07235",
         "expand_message_xmd SHA-256, empty message");
  Expect(HexEncode(ExpandMessageXmd(HashFunction::kSha256, AsByteSpan("abc"), AsByteSpan(dst256), 0x20)) ==
             "d8ccab23b5985ccea865c6c97b6e5b8350e794e603b4b97902f53a8a0d605615",
         "expand_message_xmd SHA-256, abc");
  Expect(HexEncode(ExpandMessageXmd(
             HashFunction::kSha256, AsByteSpan("abcdef0123456789"), AsByteSpan(dst256), 0x80)) ==
             "ef904a29bffc4cf9ee82832451c946ac3c8f8058ae97d8d629831a74c6572bd9"
             "ebd0df635cd1f208e2038e760c4994984ce73f0d55ea9f22af83ba4734569d4b"
             "c95e18350f740c07eef653cbb9f87910d833751825f0ebefa1abe5420bb52be1"
             "4cf489b37fe1a72f7de2d10be453b2c9d9eb20c7e3f6edc5a60629178d9478df",
         "expand_message_xmd SHA-256, multi-block output");

  const std::string dst512 = "QUUX-V01-CS02-with-expander-SHA512-256";
  Expect(HexEncode(ExpandMessageXmd(HashFunction::kSha512, AsByteSpan(""), AsByteSpan(dst512), 0x20)) ==
             "6b9a7312411d92f921c6f68ca0b6380730a1a4d982c507211a90964c394179ba",
         "expand_message_xmd SHA-512, empty message");
}

void TestExpandMessageXmdLimits() {
  ExpectThrow([]() { (void)ExpandMessageXmd(HashFunction::kSha256, AsByteSpan("abc"), AsByteSpan(""), 32); },
              "empty DST must be rejected");
  try {
    (void)ExpandMessageXmd(HashFunction::kSha512, AsByteSpan("abc"), AsByteSpan(""), 64);
    throw std::runtime_error("Expected exception: empty DST");
  } catch (const EmptyDstError&) {
  }

  ExpectThrow([]() { (void)ExpandMessageXmd(HashFunction::kSha256, AsByteSpan("abc"), AsByteSpan("dst"), 256 * 32); },
              "output longer than 255 blocks must be rejected");

  const std::string long_dst(300, 'a');
  const Bytes hashed_dst = Sha256(AsByteSpan("H2C-OVERSIZE-DST-" + long_dst));
  const Bytes via_long = ExpandMessageXmd(HashFunction::kSha256, AsByteSpan("abc"), AsByteSpan(long_dst), 32);
  const Bytes via_hashed = ExpandMessageXmd(HashFunction::kSha256, AsByteSpan("abc"), hashed_dst, 32);
  Expect(via_long == via_hashed, "oversize DST must be replaced by its hash");
  Expect(HexEncode(via_long) == "70a19f343d2212a968303dfa919049b56982c2f8078234c7bff17150f4300811",
         "oversize DST output");
}

void TestCsprng() {
  Bytes a(32, 0);
  Bytes b(32, 0);
  Csprng::Fill(a);
  Csprng::Fill(b);
  Expect(a != b, "Two random samples should differ");

  Bytes c(16, 0);
  Csprng::System()(c);
  Expect(c != Bytes(16, 0), "System entropy source must fill the buffer");
}

}  // namespace

int main() {
  try {
    TestHexEncoding();
    TestJsonQuoting();
    TestBigEndianConversions();
    TestSha256();
    TestExpandMessageXmdVectors();
    TestExpandMessageXmdLimits();
    TestCsprng();
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << '\n';
    return 1;
  }

  std::cout << "Crypto primitives tests passed" << '\n';
  return 0;
}
