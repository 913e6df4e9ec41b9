#pragma once

namespace ecgroup::backend {

// Runs sodium_init() once per process; throws if libsodium cannot start.
void EnsureSodiumInitialized();

}  // namespace ecgroup::backend
