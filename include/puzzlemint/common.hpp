#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <optional>

// PuzzleMint Library Version
#define PUZZLEMINT_VERSION_STRING "0.1.0"

// Utility macros
#define PUZZLEMINT_DISALLOW_COPY(TypeName) \
    TypeName(const TypeName&) = delete; \
    TypeName& operator=(const TypeName&) = delete

// Constants
namespace puzzlemint {
namespace constants {

// Identity and digest sizes
constexpr size_t IDENTITY_SIZE = 32;
constexpr size_t BLAKE3_HASH_SIZE = 32;

// Puzzle generation (canonical attribute-bearing formula)
constexpr uint64_t SLOT_WINDOW = 1000;
constexpr uint64_t TYPE_MODIFIER = 100;
constexpr uint64_t COMMIT_MULTIPLIER = 31;
constexpr uint64_t COMMIT_INCREMENT = 17;
constexpr int COMMIT_ROUNDS = 3;

// Rarity buckets over (timestamp mod 100)
constexpr int64_t RARITY_MODULUS = 100;
constexpr int64_t LEGENDARY_CEILING = 10;
constexpr int64_t EPIC_CEILING = 30;
constexpr int64_t RARE_CEILING = 60;

// Slot clock defaults
constexpr uint64_t DEFAULT_SLOT_DURATION_MS = 400;

} // namespace constants
} // namespace puzzlemint

// Core types
namespace puzzlemint {

// Basic types
using byte = uint8_t;
using bytes = std::vector<byte>;

template<size_t N>
using fixed_bytes = std::array<byte, N>;

using Hash256 = fixed_bytes<constants::BLAKE3_HASH_SIZE>;

/**
 * Identity - opaque 32-byte account reference.
 * Only equality and hex rendering are meaningful.
 */
struct Identity {
    fixed_bytes<constants::IDENTITY_SIZE> id{};

    Identity() = default;
    explicit Identity(const fixed_bytes<constants::IDENTITY_SIZE>& raw) : id(raw) {}

    std::string to_string() const;
    static Identity from_string(const std::string& str);
    static std::optional<Identity> parse(const std::string& str);

    bool operator==(const Identity& other) const { return id == other.id; }
    bool operator!=(const Identity& other) const { return id != other.id; }
    bool operator<(const Identity& other) const { return id < other.id; }
};

// Utility functions
std::string hash_to_hex(const Hash256& hash);
Hash256 hex_to_hash(const std::string& hex);
std::optional<Hash256> try_hex_to_hash(const std::string& hex);

} // namespace puzzlemint
