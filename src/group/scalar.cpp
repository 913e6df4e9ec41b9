#include "ecgroup/group/scalar.hpp"

#include <algorithm>
#include <utility>

#include <openssl/crypto.h>

#include "ecgroup/common/errors.hpp"
#include "ecgroup/common/secure_zeroize.hpp"
#include "ecgroup/crypto/encoding.hpp"
#include "ecgroup/group/registry.hpp"

namespace ecgroup {
namespace {

constexpr size_t kUInt64Bytes = sizeof(uint64_t);

bool AllZero(std::span<const uint8_t> bytes) {
  return std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; });
}

Bytes FromUInt64(const backend::ScalarField& field, uint64_t value) {
  Bytes big_endian(field.length(), 0);
  for (size_t i = 0; i < kUInt64Bytes; ++i) {
    big_endian[big_endian.size() - 1 - i] = static_cast<uint8_t>(value >> (8 * i));
  }
  return FromBigEndian(big_endian, field.byte_order());
}

// Index of the first set bit in a big-endian magnitude, counted from the most
// significant bit. Returns the bit length of |bytes| when it is zero.
size_t LeadingZeroBits(std::span<const uint8_t> bytes) {
  size_t count = 0;
  for (uint8_t byte : bytes) {
    if (byte == 0) {
      count += 8;
      continue;
    }
    for (uint8_t mask = 0x80; (byte & mask) == 0; mask >>= 1) {
      ++count;
    }
    break;
  }
  return count;
}

}  // namespace

Scalar::Scalar(Group group) : descriptor_(&RequireGroupDescriptor(group.id())) {
  value_.assign(descriptor_->scalars.length(), 0);
}

Scalar::Scalar(const GroupDescriptor* descriptor, Bytes value)
    : descriptor_(descriptor), value_(std::move(value)) {}

Scalar::Scalar(Scalar&& other) : descriptor_(other.descriptor_), value_(std::move(other.value_)) {
  other.value_.assign(value_.size(), 0);
}

Scalar& Scalar::operator=(Scalar&& other) {
  if (this != &other) {
    SecureZeroize(&value_);
    descriptor_ = other.descriptor_;
    value_ = std::move(other.value_);
    other.value_.assign(value_.size(), 0);
  }
  return *this;
}

Scalar::~Scalar() {
  SecureZeroize(&value_);
}

Group Scalar::group() const {
  return Group(descriptor_->id);
}

const GroupDescriptor& Scalar::RequireSameGroup(const Scalar& other) const {
  if (other.descriptor_->id != descriptor_->id) {
    throw CastMismatchError("cannot mix scalars of different groups");
  }
  return *descriptor_;
}

Scalar& Scalar::Zero() {
  std::fill(value_.begin(), value_.end(), 0);
  return *this;
}

Scalar& Scalar::One() {
  value_ = FromUInt64(descriptor_->scalars, 1);
  return *this;
}

Scalar& Scalar::MinusOne() {
  value_ = descriptor_->scalars.Negate(FromUInt64(descriptor_->scalars, 1));
  return *this;
}

Scalar& Scalar::Random() {
  return Random(Csprng::System());
}

Scalar& Scalar::Random(const EntropySource& entropy) {
  if (!entropy) {
    throw NilParameterError("entropy source is empty");
  }

  const backend::ScalarField& field = descriptor_->scalars;
  Bytes wide(field.wide_length());
  // Zero has probability about 2^-250 per draw.
  do {
    entropy(wide);
    value_ = field.Reduce(wide);
  } while (AllZero(value_));

  SecureZeroize(&wide);
  return *this;
}

Scalar& Scalar::Add(const Scalar* other) {
  if (other == nullptr) {
    return *this;
  }
  value_ = RequireSameGroup(*other).scalars.Add(value_, other->value_);
  return *this;
}

Scalar& Scalar::Subtract(const Scalar* other) {
  if (other == nullptr) {
    return *this;
  }
  value_ = RequireSameGroup(*other).scalars.Subtract(value_, other->value_);
  return *this;
}

Scalar& Scalar::Multiply(const Scalar* other) {
  if (other == nullptr) {
    return Zero();
  }
  value_ = RequireSameGroup(*other).scalars.Multiply(value_, other->value_);
  return *this;
}

// Montgomery ladder keeping (result, result * base), from the most significant set
// bit of the exponent down.
Scalar& Scalar::Pow(const Scalar* exponent) {
  if (exponent == nullptr) {
    return One();
  }

  const backend::ScalarField& field = RequireSameGroup(*exponent).scalars;
  Bytes bits = ToBigEndian(exponent->value_, field.byte_order());
  if (AllZero(bits)) {
    SecureZeroize(&bits);
    return One();
  }

  Bytes result = FromUInt64(field, 1);
  Bytes result_times_base = value_;
  const size_t total_bits = 8 * bits.size();
  for (size_t i = LeadingZeroBits(bits); i < total_bits; ++i) {
    const bool bit = ((bits[i / 8] >> (7 - i % 8)) & 1) != 0;
    if (bit) {
      result = field.Multiply(result, result_times_base);
      result_times_base = field.Multiply(result_times_base, result_times_base);
    } else {
      result_times_base = field.Multiply(result, result_times_base);
      result = field.Multiply(result, result);
    }
  }

  SecureZeroize(&result_times_base);
  SecureZeroize(&bits);
  SecureZeroize(&value_);
  value_ = std::move(result);
  return *this;
}

Scalar& Scalar::Invert() {
  value_ = descriptor_->scalars.Invert(value_);
  return *this;
}

bool Scalar::Equal(const Scalar* other) const {
  if (other == nullptr) {
    return false;
  }
  RequireSameGroup(*other);
  return CRYPTO_memcmp(value_.data(), other->value_.data(), value_.size()) == 0;
}

bool Scalar::LessOrEqual(const Scalar* other) const {
  if (other == nullptr) {
    return false;
  }
  const ByteOrder order = RequireSameGroup(*other).scalars.byte_order();
  return CompareBigEndian(ToBigEndian(value_, order), ToBigEndian(other->value_, order)) <= 0;
}

bool Scalar::IsZero() const {
  return AllZero(value_);
}

Scalar& Scalar::Set(const Scalar* other) {
  if (other == nullptr) {
    return Zero();
  }
  RequireSameGroup(*other);
  if (other != this) {
    value_ = other->value_;
  }
  return *this;
}

Scalar& Scalar::SetUInt64(uint64_t value) {
  // Every supported order exceeds 2^64, so no reduction is needed.
  value_ = FromUInt64(descriptor_->scalars, value);
  return *this;
}

uint64_t Scalar::UInt64() const {
  const Bytes big_endian = ToBigEndian(value_, descriptor_->scalars.byte_order());
  const size_t high = big_endian.size() - kUInt64Bytes;
  if (!AllZero(std::span<const uint8_t>(big_endian).first(high))) {
    throw ValueOverflowError("scalar is too big to be uint64");
  }

  uint64_t out = 0;
  for (size_t i = high; i < big_endian.size(); ++i) {
    out = (out << 8) | big_endian[i];
  }
  return out;
}

Scalar Scalar::Copy() const {
  return Scalar(descriptor_, value_);
}

Bytes Scalar::Encode() const {
  return value_;
}

void Scalar::Decode(std::span<const uint8_t> data) {
  const backend::ScalarField& field = descriptor_->scalars;
  if (data.size() != field.length()) {
    throw DecodingError(DecodingFailure::kWrongLength, "scalar Decode: invalid scalar length");
  }
  const ByteOrder order = field.byte_order();
  if (CompareBigEndian(ToBigEndian(data, order), ToBigEndian(field.order(), order)) >= 0) {
    throw DecodingError(DecodingFailure::kInvalidEncoding, "scalar Decode: invalid scalar encoding");
  }
  value_.assign(data.begin(), data.end());
}

std::string Scalar::Hex() const {
  return HexEncode(value_);
}

void Scalar::DecodeHex(std::string_view hex) {
  Bytes decoded = HexDecode(hex);
  try {
    Decode(decoded);
  } catch (const DecodingError&) {
    SecureZeroize(&decoded);
    throw;
  }
  SecureZeroize(&decoded);
}

std::string Scalar::MarshalJson() const {
  return QuoteJsonString(Hex());
}

void Scalar::UnmarshalJson(std::string_view json) {
  DecodeHex(UnquoteJsonString(json));
}

Bytes Scalar::MarshalBinary() const {
  return Encode();
}

void Scalar::UnmarshalBinary(std::span<const uint8_t> data) {
  try {
    Decode(data);
  } catch (const DecodingError& ex) {
    throw DecodingError(ex.reason(), std::string("scalar UnmarshalBinary: ") + ex.what());
  }
}

}  // namespace ecgroup
