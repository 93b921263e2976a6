#pragma once

#include "puzzlemint/common.hpp"
#include "puzzlemint/error.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace puzzlemint::core {

/**
 * PuzzleType - Kind of puzzle embedded in an asset.
 * Values double as the creation selector byte.
 */
enum class PuzzleType : uint8_t {
    MathFactor = 0,   // Find any divisor of puzzle_number
    HashRiddle = 1,   // Find the preimage of solution_hash
    Pattern = 2       // Same commitment check as HashRiddle
};

/**
 * Rarity - Tier assigned at solve time
 */
enum class Rarity : uint8_t {
    Legendary,
    Epic,
    Rare,
    Common
};

std::string puzzle_type_to_string(PuzzleType type);
std::optional<PuzzleType> puzzle_type_from_string(const std::string& name);

/**
 * Map a creation selector to a puzzle type
 * @return InvalidPuzzleType for anything but 0, 1, 2
 */
Result<PuzzleType> puzzle_type_from_selector(uint8_t selector);

std::string rarity_to_string(Rarity rarity);
std::optional<Rarity> rarity_from_string(const std::string& name);

/**
 * Commitment over a 64-bit value: three rounds of x -> x*31 + 17 in
 * wrapping arithmetic, rendered as lowercase hex without padding.
 */
std::string compute_commitment(uint64_t value);

/**
 * PuzzleInstance - Typed puzzle state owned by one asset.
 *
 * Everything above `solved` is fixed at creation. The post-solve fields are
 * either all empty (unsolved) or all set (solved).
 */
struct PuzzleInstance {
    PuzzleType puzzle_type = PuzzleType::MathFactor;
    uint8_t difficulty = 0;
    uint64_t puzzle_number = 0;
    std::string solution_hash;
    uint64_t mint_slot = 0;     // entropy slot at creation
    std::optional<Hash256> seed; // BLAKE3(minter || mint_slot); absent if minted without one

    bool solved = false;
    std::optional<Identity> solver;
    std::optional<uint64_t> solution;
    std::optional<int64_t> solved_at;
    std::optional<Rarity> rarity;

    /**
     * True when the post-solve fields agree with `solved`
     */
    bool is_consistent() const;

    bool operator==(const PuzzleInstance& other) const;
    bool operator!=(const PuzzleInstance& other) const { return !(*this == other); }
};

} // namespace puzzlemint::core
