#pragma once

#include "puzzlemint/common.hpp"
#include "core/puzzle/puzzle.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace puzzlemint::core {

/**
 * MintedEvent - Emitted when a puzzle asset is created
 */
struct MintedEvent {
    Identity asset_id;
    PuzzleType puzzle_type = PuzzleType::MathFactor;
    uint64_t puzzle_number = 0;
    Identity minter;

    nlohmann::json to_json() const;
};

/**
 * SolvedEvent - Emitted on the single successful solve of an asset
 */
struct SolvedEvent {
    Identity asset_id;
    Identity solver;
    int64_t solve_timestamp = 0;
    Rarity rarity = Rarity::Common;

    nlohmann::json to_json() const;
};

/**
 * UriUpdatedEvent - Emitted when an asset's display URI changes
 */
struct UriUpdatedEvent {
    Identity asset_id;
    std::string uri;

    nlohmann::json to_json() const;
};

} // namespace puzzlemint::core
