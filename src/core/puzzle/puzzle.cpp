#include "puzzle.hpp"
#include <sstream>

namespace puzzlemint::core {

std::string puzzle_type_to_string(PuzzleType type) {
    switch (type) {
        case PuzzleType::MathFactor: return "math_factor";
        case PuzzleType::HashRiddle: return "hash_riddle";
        case PuzzleType::Pattern: return "pattern";
    }
    return "unknown";
}

std::optional<PuzzleType> puzzle_type_from_string(const std::string& name) {
    if (name == "math_factor") return PuzzleType::MathFactor;
    if (name == "hash_riddle") return PuzzleType::HashRiddle;
    if (name == "pattern") return PuzzleType::Pattern;
    return std::nullopt;
}

Result<PuzzleType> puzzle_type_from_selector(uint8_t selector) {
    switch (selector) {
        case 0: return Result<PuzzleType>::Ok(PuzzleType::MathFactor);
        case 1: return Result<PuzzleType>::Ok(PuzzleType::HashRiddle);
        case 2: return Result<PuzzleType>::Ok(PuzzleType::Pattern);
        default:
            return Result<PuzzleType>::Err(Error(
                ErrorCode::InvalidPuzzleType,
                "Unrecognized puzzle type selector",
                "selector=" + std::to_string(selector)));
    }
}

std::string rarity_to_string(Rarity rarity) {
    switch (rarity) {
        case Rarity::Legendary: return "Legendary";
        case Rarity::Epic: return "Epic";
        case Rarity::Rare: return "Rare";
        case Rarity::Common: return "Common";
    }
    return "Common";
}

std::optional<Rarity> rarity_from_string(const std::string& name) {
    if (name == "Legendary") return Rarity::Legendary;
    if (name == "Epic") return Rarity::Epic;
    if (name == "Rare") return Rarity::Rare;
    if (name == "Common") return Rarity::Common;
    return std::nullopt;
}

std::string compute_commitment(uint64_t value) {
    uint64_t state = value;
    for (int i = 0; i < constants::COMMIT_ROUNDS; ++i) {
        // unsigned overflow wraps modulo 2^64
        state = state * constants::COMMIT_MULTIPLIER + constants::COMMIT_INCREMENT;
    }
    std::ostringstream oss;
    oss << std::hex << state;
    return oss.str();
}

bool PuzzleInstance::is_consistent() const {
    bool any = solver.has_value() || solution.has_value() ||
               solved_at.has_value() || rarity.has_value();
    bool all = solver.has_value() && solution.has_value() &&
               solved_at.has_value() && rarity.has_value();
    return solved ? all : !any;
}

bool PuzzleInstance::operator==(const PuzzleInstance& other) const {
    return puzzle_type == other.puzzle_type &&
           difficulty == other.difficulty &&
           puzzle_number == other.puzzle_number &&
           solution_hash == other.solution_hash &&
           mint_slot == other.mint_slot &&
           seed == other.seed &&
           solved == other.solved &&
           solver == other.solver &&
           solution == other.solution &&
           solved_at == other.solved_at &&
           rarity == other.rarity;
}

} // namespace puzzlemint::core
