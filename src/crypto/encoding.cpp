#include "ecgroup/crypto/encoding.hpp"

#include <algorithm>
#include <stdexcept>

#include "ecgroup/common/errors.hpp"

namespace ecgroup {
namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

int HexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

}  // namespace

std::string HexEncode(std::span<const uint8_t> data) {
  std::string out;
  out.reserve(data.size() * 2);
  for (uint8_t b : data) {
    out.push_back(kHexDigits[b >> 4]);
    out.push_back(kHexDigits[b & 0x0F]);
  }
  return out;
}

Bytes HexDecode(std::string_view hex) {
  if (hex.size() % 2 != 0) {
    throw DecodingError(DecodingFailure::kInvalidHex, "odd length hex string");
  }

  Bytes out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    const int hi = HexValue(hex[i]);
    const int lo = HexValue(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      throw DecodingError(DecodingFailure::kInvalidHex, "invalid hex character");
    }
    out.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return out;
}

std::string QuoteJsonString(std::string_view value) {
  std::string out;
  out.reserve(value.size() + 2);
  out.push_back('"');
  out.append(value);
  out.push_back('"');
  return out;
}

std::string UnquoteJsonString(std::string_view json) {
  std::string out;
  out.reserve(json.size());
  for (char c : json) {
    if (c != '"') {
      out.push_back(c);
    }
  }
  return out;
}

mpz_class ImportBigEndian(std::span<const uint8_t> bytes) {
  mpz_class out;
  if (bytes.empty()) {
    return out;
  }
  mpz_import(out.get_mpz_t(), bytes.size(), 1, sizeof(uint8_t), 1, 0, bytes.data());
  return out;
}

Bytes ExportBigEndian(const mpz_class& value, size_t width) {
  if (value < 0) {
    throw std::invalid_argument("mpz value must be non-negative");
  }

  Bytes out(width, 0);
  if (value == 0) {
    return out;
  }

  const size_t needed = (mpz_sizeinbase(value.get_mpz_t(), 2) + 7) / 8;
  if (needed > width) {
    throw std::invalid_argument("mpz value does not fit the requested width");
  }

  size_t count = 0;
  mpz_export(out.data() + (width - needed), &count, 1, sizeof(uint8_t), 1, 0, value.get_mpz_t());
  if (count != needed) {
    throw std::runtime_error("mpz_export wrote an unexpected length");
  }
  return out;
}

Bytes ToBigEndian(std::span<const uint8_t> bytes, ByteOrder order) {
  Bytes out(bytes.begin(), bytes.end());
  if (order == ByteOrder::kLittleEndian) {
    std::reverse(out.begin(), out.end());
  }
  return out;
}

Bytes FromBigEndian(std::span<const uint8_t> bytes, ByteOrder order) {
  return ToBigEndian(bytes, order);
}

int CompareBigEndian(std::span<const uint8_t> lhs, std::span<const uint8_t> rhs) {
  if (lhs.size() != rhs.size()) {
    throw std::invalid_argument("Magnitudes must have the same length");
  }

  for (size_t i = 0; i < lhs.size(); ++i) {
    if (lhs[i] != rhs[i]) {
      return lhs[i] < rhs[i] ? -1 : 1;
    }
  }
  return 0;
}

}  // namespace ecgroup
