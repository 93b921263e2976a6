#pragma once

#include "puzzlemint/error.hpp"
#include "puzzle.hpp"
#include <cstdint>

namespace puzzlemint::core {

/**
 * SolutionVerifier - Per-type check of a candidate against a puzzle's
 * stored commitment. Never mutates the puzzle.
 */
class SolutionVerifier {
public:
    /**
     * @return true/false for a known type, InvalidPuzzleType otherwise
     */
    static Result<bool> verify(const PuzzleInstance& puzzle, uint64_t candidate);

private:
    static bool verify_factor(uint64_t puzzle_number, uint64_t candidate);
    static bool verify_commitment(const std::string& solution_hash, uint64_t candidate);
};

} // namespace puzzlemint::core
