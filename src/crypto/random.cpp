#include "random.hpp"
#include <sodium.h>
#include <stdexcept>

namespace puzzlemint::crypto {

namespace {
    // Ensure libsodium is initialized before first use
    struct SodiumInitializer {
        SodiumInitializer() {
            if (sodium_init() < 0) {
                throw std::runtime_error("Failed to initialize libsodium");
            }
        }
    };

    void ensure_sodium() {
        static SodiumInitializer instance;
    }
}

void Random::generate_into(byte* buffer, size_t size) {
    ensure_sodium();
    randombytes_buf(buffer, size);
}

Identity Random::generate_identity() {
    Identity identity;
    generate_into(identity.id.data(), identity.id.size());
    return identity;
}

bool constant_time_equal(const Identity& a, const Identity& b) {
    ensure_sodium();
    return sodium_memcmp(a.id.data(), b.id.data(), a.id.size()) == 0;
}

} // namespace puzzlemint::crypto
