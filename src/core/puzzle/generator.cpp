#include "generator.hpp"
#include "crypto/blake3.hpp"
#include "utils/logger.hpp"

namespace puzzlemint::core {

Result<PuzzleInstance> PuzzleGenerator::generate(
    const Identity& requester,
    uint8_t type_selector,
    uint8_t difficulty,
    const EntropySnapshot& snapshot
) {
    auto type = puzzle_type_from_selector(type_selector);
    if (type.is_err()) {
        PUZZLEMINT_LOG_WARN("Puzzle generation rejected: {}", type.error().to_string());
        return Result<PuzzleInstance>::Err(type.error());
    }

    PuzzleInstance puzzle;
    puzzle.puzzle_type = type.value();
    puzzle.difficulty = difficulty;
    puzzle.puzzle_number = compute_puzzle_number(snapshot.slot, puzzle.puzzle_type, difficulty);
    puzzle.solution_hash = compute_commitment(puzzle.puzzle_number);
    puzzle.mint_slot = snapshot.slot;
    puzzle.seed = crypto::Blake3::hash_with_counter(requester, snapshot.slot);
    puzzle.solved = false;

    PUZZLEMINT_LOG_INFO("Generated puzzle: type={}, difficulty={}, number={}, slot={}",
                        puzzle_type_to_string(puzzle.puzzle_type), difficulty,
                        puzzle.puzzle_number, snapshot.slot);

    return Result<PuzzleInstance>::Ok(std::move(puzzle));
}

uint64_t PuzzleGenerator::compute_puzzle_number(
    uint64_t slot,
    PuzzleType type,
    uint8_t difficulty
) {
    uint64_t base = ((slot % constants::SLOT_WINDOW) + 1) *
                    (static_cast<uint64_t>(difficulty) + 1);
    uint64_t modifier = (static_cast<uint64_t>(type) + 1) * constants::TYPE_MODIFIER;
    return base + modifier;
}

} // namespace puzzlemint::core
