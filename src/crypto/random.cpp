#include "ecgroup/crypto/random.hpp"

#include <climits>
#include <stdexcept>

#include <openssl/rand.h>

namespace ecgroup {

void Csprng::Fill(std::span<uint8_t> out) {
  if (out.empty()) {
    return;
  }
  if (out.size() > static_cast<size_t>(INT_MAX)) {
    throw std::invalid_argument("Random request exceeds int length");
  }

  if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
}

const EntropySource& Csprng::System() {
  static const EntropySource source = [](std::span<uint8_t> out) { Csprng::Fill(out); };
  return source;
}

}  // namespace ecgroup
