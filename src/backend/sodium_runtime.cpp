#include "ecgroup/backend/sodium_runtime.hpp"

#include <stdexcept>

#include <sodium.h>

namespace ecgroup::backend {

void EnsureSodiumInitialized() {
  static const int status = sodium_init();
  if (status < 0) {
    throw std::runtime_error("sodium_init failed");
  }
}

}  // namespace ecgroup::backend
