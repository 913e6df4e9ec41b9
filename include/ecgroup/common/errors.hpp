#pragma once

#include <stdexcept>
#include <string>

namespace ecgroup {

// Identifier outside the registered group table. Raised by every call that needs a
// backend, since it can only come from a programming error.
class InvalidGroupError : public std::logic_error {
 public:
  explicit InvalidGroupError(const std::string& message) : std::logic_error(message) {}
};

// Operand of a binary operator belongs to another group than the receiver.
class CastMismatchError : public std::logic_error {
 public:
  explicit CastMismatchError(const std::string& message) : std::logic_error(message) {}
};

class NilParameterError : public std::invalid_argument {
 public:
  explicit NilParameterError(const std::string& message) : std::invalid_argument(message) {}
};

enum class DecodingFailure {
  kWrongLength,
  kInvalidEncoding,
  kIdentity,
  kInvalidHex,
};

class DecodingError : public std::invalid_argument {
 public:
  DecodingError(DecodingFailure reason, const std::string& message)
      : std::invalid_argument(message), reason_(reason) {}

  DecodingFailure reason() const noexcept { return reason_; }

 private:
  DecodingFailure reason_;
};

class ValueOverflowError : public std::out_of_range {
 public:
  explicit ValueOverflowError(const std::string& message) : std::out_of_range(message) {}
};

class EmptyDstError : public std::invalid_argument {
 public:
  explicit EmptyDstError(const std::string& message) : std::invalid_argument(message) {}
};

}  // namespace ecgroup
