#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>

#include "ecgroup/common/bytes.hpp"

namespace ecgroup {

// Fills the whole span with random bytes, or throws.
using EntropySource = std::function<void(std::span<uint8_t>)>;

class Csprng {
 public:
  static void Fill(std::span<uint8_t> out);

  // Source backed by the OpenSSL DRBG.
  static const EntropySource& System();
};

}  // namespace ecgroup
