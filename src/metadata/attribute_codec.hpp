#pragma once

#include "puzzlemint/common.hpp"
#include "puzzlemint/error.hpp"
#include "core/puzzle/puzzle.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace puzzlemint::metadata {

/**
 * Attribute - One key/value pair of asset metadata
 */
struct Attribute {
    std::string key;
    std::string value;

    bool operator==(const Attribute& other) const {
        return key == other.key && value == other.value;
    }
    bool operator!=(const Attribute& other) const { return !(*this == other); }
};

// Ordered, unique-keyed wire form persisted by the asset ledger
using AttributeList = std::vector<Attribute>;

// Ordered key -> value updates; applied front to back
using AttributeUpdates = std::vector<std::pair<std::string, std::string>>;

// Keys owned by the puzzle schema
namespace keys {
    constexpr const char* PUZZLE_TYPE = "puzzle_type";
    constexpr const char* DIFFICULTY = "difficulty";
    constexpr const char* PUZZLE_NUMBER = "puzzle_number";
    constexpr const char* SOLUTION_HASH = "solution_hash";
    constexpr const char* SOLVED = "solved";
    constexpr const char* MINT_SLOT = "mint_slot";
    constexpr const char* SEED = "seed";

    // Written by the solve transition
    constexpr const char* SOLVER = "solver";
    constexpr const char* SOLUTION = "solution";
    constexpr const char* SOLVE_TIMESTAMP = "solve_timestamp";
    constexpr const char* RARITY = "rarity";

    // Optional caller metadata revealed on solve
    constexpr const char* HIDDEN_TRAIT = "hidden_trait";
} // namespace keys

/**
 * AttributeCodec - Boundary between PuzzleInstance and AttributeList.
 *
 * encode() emits schema keys in a fixed order. decode() validates and
 * parses them. Keys outside the schema are never read or dropped by
 * merge_update().
 */
class AttributeCodec {
public:
    /**
     * Canonical attribute list for a puzzle
     */
    static AttributeList encode(const core::PuzzleInstance& puzzle);

    /**
     * Parse a puzzle out of an attribute list
     *
     * Errors:
     *   PuzzleNotFound          - puzzle_type, puzzle_number or solution_hash absent
     *   AttributeNotFound       - another required key absent
     *   InvalidPuzzleType       - unknown puzzle_type name
     *   FailedToParsePuzzleData - malformed value, duplicate key, or
     *                             post-solve keys on an unsolved puzzle
     */
    static Result<core::PuzzleInstance> decode(const AttributeList& attributes);

    /**
     * Replace matching keys in place, append the rest, keep everything else
     */
    static AttributeList merge_update(const AttributeList& attributes,
                                      const AttributeUpdates& updates);

    /**
     * Value of the first pair with this key
     */
    static std::optional<std::string> find(const AttributeList& attributes,
                                           const std::string& key);

    /**
     * True for keys the puzzle schema owns (including post-solve keys)
     */
    static bool is_schema_key(const std::string& key);
};

} // namespace puzzlemint::metadata
