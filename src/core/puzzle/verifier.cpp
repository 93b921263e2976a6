#include "verifier.hpp"
#include "utils/logger.hpp"

namespace puzzlemint::core {

Result<bool> SolutionVerifier::verify(const PuzzleInstance& puzzle, uint64_t candidate) {
    bool accepted = false;

    switch (puzzle.puzzle_type) {
        case PuzzleType::MathFactor:
            accepted = verify_factor(puzzle.puzzle_number, candidate);
            break;
        case PuzzleType::HashRiddle:
        case PuzzleType::Pattern:
            accepted = verify_commitment(puzzle.solution_hash, candidate);
            break;
        default:
            PUZZLEMINT_LOG_ERROR("Verification failed: unknown puzzle type {}",
                                 static_cast<int>(puzzle.puzzle_type));
            return Result<bool>::Err(Error(
                ErrorCode::InvalidPuzzleType,
                "Cannot verify unknown puzzle type",
                "type=" + std::to_string(static_cast<int>(puzzle.puzzle_type))));
    }

    PUZZLEMINT_LOG_DEBUG("Verified candidate {} for {} puzzle: {}",
                         candidate, puzzle_type_to_string(puzzle.puzzle_type),
                         accepted ? "accepted" : "rejected");
    return Result<bool>::Ok(accepted);
}

bool SolutionVerifier::verify_factor(uint64_t puzzle_number, uint64_t candidate) {
    // 1 and the number itself are accepted too
    return candidate > 0 && puzzle_number % candidate == 0;
}

bool SolutionVerifier::verify_commitment(const std::string& solution_hash, uint64_t candidate) {
    return compute_commitment(candidate) == solution_hash;
}

} // namespace puzzlemint::core
