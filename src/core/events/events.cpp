#include "events.hpp"

namespace puzzlemint::core {

nlohmann::json MintedEvent::to_json() const {
    return {
        {"event", "puzzle_minted"},
        {"asset", asset_id.to_string()},
        {"puzzle_type", puzzle_type_to_string(puzzle_type)},
        {"puzzle_number", puzzle_number},
        {"minter", minter.to_string()},
    };
}

nlohmann::json SolvedEvent::to_json() const {
    return {
        {"event", "puzzle_solved"},
        {"asset", asset_id.to_string()},
        {"solver", solver.to_string()},
        {"solution_time", solve_timestamp},
        {"rarity", rarity_to_string(rarity)},
    };
}

nlohmann::json UriUpdatedEvent::to_json() const {
    return {
        {"event", "uri_updated"},
        {"asset", asset_id.to_string()},
        {"uri", uri},
    };
}

} // namespace puzzlemint::core
