#pragma once

#include <cstddef>
#include <span>

#include "ecgroup/common/bytes.hpp"
#include "ecgroup/crypto/hash.hpp"

namespace ecgroup {

// expand_message_xmd of RFC 9380, section 5.3.1. Throws EmptyDstError on an empty
// DST; DSTs longer than 255 bytes are hashed down as in section 5.3.3.
Bytes ExpandMessageXmd(HashFunction hash,
                       std::span<const uint8_t> message,
                       std::span<const uint8_t> dst,
                       size_t length);

}  // namespace ecgroup
