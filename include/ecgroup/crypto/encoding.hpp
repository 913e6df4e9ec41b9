#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include <gmpxx.h>

#include "ecgroup/common/bytes.hpp"

namespace ecgroup {

enum class ByteOrder {
  kBigEndian,
  kLittleEndian,
};

std::string HexEncode(std::span<const uint8_t> data);
Bytes HexDecode(std::string_view hex);

// JSON form of a value is its quoted lowercase hex encoding.
std::string QuoteJsonString(std::string_view value);
std::string UnquoteJsonString(std::string_view json);

mpz_class ImportBigEndian(std::span<const uint8_t> bytes);
Bytes ExportBigEndian(const mpz_class& value, size_t width);

// Byte-order normalization. The returned copy is big-endian (resp. in |order|); the
// input is never modified.
Bytes ToBigEndian(std::span<const uint8_t> bytes, ByteOrder order);
Bytes FromBigEndian(std::span<const uint8_t> bytes, ByteOrder order);

// Three-way comparison of two equal-length big-endian magnitudes.
int CompareBigEndian(std::span<const uint8_t> lhs, std::span<const uint8_t> rhs);

}  // namespace ecgroup
