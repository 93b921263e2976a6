#include "puzzlemint/common.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace puzzlemint {

std::string hash_to_hex(const Hash256& hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto b : hash) {
        oss << std::setw(2) << static_cast<int>(b);
    }
    return oss.str();
}

std::optional<Hash256> try_hex_to_hash(const std::string& hex) {
    Hash256 hash;
    if (hex.length() != hash.size() * 2) {
        return std::nullopt;
    }
    for (char c : hex) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }
    for (size_t i = 0; i < hash.size(); ++i) {
        hash[i] = static_cast<byte>(std::stoul(hex.substr(i * 2, 2), nullptr, 16));
    }
    return hash;
}

Hash256 hex_to_hash(const std::string& hex) {
    auto hash = try_hex_to_hash(hex);
    if (!hash) {
        throw std::runtime_error("Invalid hex string: " + hex);
    }
    return *hash;
}

// Identity implementation
std::string Identity::to_string() const {
    return hash_to_hex(id);
}

Identity Identity::from_string(const std::string& str) {
    return Identity(hex_to_hash(str));
}

std::optional<Identity> Identity::parse(const std::string& str) {
    auto raw = try_hex_to_hash(str);
    if (!raw) {
        return std::nullopt;
    }
    return Identity(*raw);
}

} // namespace puzzlemint
