#pragma once

#include "puzzlemint/common.hpp"
#include <optional>

namespace puzzlemint::crypto {

/**
 * BLAKE3 cryptographic hash function wrapper
 */
class Blake3 {
public:
    /**
     * Hash data using BLAKE3
     * @param data The data to hash
     * @return 32-byte hash
     */
    static Hash256 hash(const bytes& data);

    /**
     * Hash a string using BLAKE3
     */
    static Hash256 hash(const std::string& str);

    /**
     * Hash an identity followed by a little-endian 64-bit counter
     */
    static Hash256 hash_with_counter(const Identity& identity, uint64_t counter);
};

} // namespace puzzlemint::crypto
