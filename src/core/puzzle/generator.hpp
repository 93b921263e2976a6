#pragma once

#include "puzzlemint/common.hpp"
#include "puzzlemint/error.hpp"
#include "core/entropy/entropy.hpp"
#include "puzzle.hpp"
#include <cstdint>

namespace puzzlemint::core {

/**
 * PuzzleGenerator - Deterministic puzzle derivation from entropy.
 *
 * puzzle_number = ((slot mod 1000) + 1) * (difficulty + 1) + (type + 1) * 100
 * solution_hash = compute_commitment(puzzle_number)
 *
 * The same (requester, selector, difficulty, snapshot) always yields the same
 * instance. Persisting it is the caller's job.
 */
class PuzzleGenerator {
public:
    /**
     * Generate a fresh, unsolved puzzle
     * @param requester Identity minting the asset
     * @param type_selector 0 = math_factor, 1 = hash_riddle, 2 = pattern
     * @param difficulty Scales the puzzle number
     * @param snapshot Entropy at mint time
     * @return Puzzle, or InvalidPuzzleType for an unknown selector
     */
    static Result<PuzzleInstance> generate(
        const Identity& requester,
        uint8_t type_selector,
        uint8_t difficulty,
        const EntropySnapshot& snapshot
    );

    /**
     * The number a puzzle is built around
     */
    static uint64_t compute_puzzle_number(
        uint64_t slot,
        PuzzleType type,
        uint8_t difficulty
    );
};

} // namespace puzzlemint::core
