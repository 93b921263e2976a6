#pragma once

#include "puzzlemint/common.hpp"

namespace puzzlemint::crypto {

/**
 * Random number generation (CSPRNG, libsodium)
 */
class Random {
public:
    /**
     * Fill an existing buffer with random bytes
     */
    static void generate_into(byte* buffer, size_t size);

    /**
     * Fresh random identity (asset ids, test accounts)
     */
    static Identity generate_identity();
};

/**
 * Constant-time comparison of two identities
 */
bool constant_time_equal(const Identity& a, const Identity& b);

} // namespace puzzlemint::crypto
