#include "blake3.hpp"
#include <blake3.h>

namespace puzzlemint::crypto {

Hash256 Blake3::hash(const bytes& data) {
    Hash256 result;
    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, data.data(), data.size());
    blake3_hasher_finalize(&hasher, result.data(), result.size());
    return result;
}

Hash256 Blake3::hash(const std::string& str) {
    bytes data(str.begin(), str.end());
    return hash(data);
}

Hash256 Blake3::hash_with_counter(const Identity& identity, uint64_t counter) {
    bytes message(identity.id.begin(), identity.id.end());
    for (int i = 0; i < 8; ++i) {
        message.push_back(static_cast<byte>(counter >> (i * 8)));
    }
    return hash(message);
}

} // namespace puzzlemint::crypto
