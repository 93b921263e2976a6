#include "state_machine.hpp"
#include "generator.hpp"
#include "rarity.hpp"
#include "verifier.hpp"
#include "utils/logger.hpp"

namespace puzzlemint::core {

using metadata::AttributeCodec;
using metadata::AttributeList;
using metadata::AttributeUpdates;

PuzzleState state_of(const PuzzleInstance& puzzle) {
    return puzzle.solved ? PuzzleState::Solved : PuzzleState::Unsolved;
}

PuzzleStateMachine::PuzzleStateMachine(StateMachineOptions options)
    : options_(std::move(options))
{
    // Extra mint metadata may not shadow puzzle keys
    AttributeList filtered;
    for (const auto& attr : options_.mint_metadata) {
        if (AttributeCodec::is_schema_key(attr.key)) {
            PUZZLEMINT_LOG_WARN("Ignoring mint metadata key '{}': reserved for puzzle state", attr.key);
            continue;
        }
        filtered.push_back(attr);
    }
    options_.mint_metadata = std::move(filtered);
}

Result<CreateOutcome> PuzzleStateMachine::create(
    const Identity& asset_id,
    const Identity& minter,
    uint8_t type_selector,
    uint8_t difficulty,
    const EntropySnapshot& snapshot
) const {
    using R = Result<CreateOutcome>;

    PUZZLEMINT_TRY_UNWRAP(R, puzzle,
        PuzzleGenerator::generate(minter, type_selector, difficulty, snapshot));

    AttributeUpdates extra;
    for (const auto& attr : options_.mint_metadata) {
        extra.emplace_back(attr.key, attr.value);
    }

    CreateOutcome outcome;
    outcome.attributes = AttributeCodec::merge_update(AttributeCodec::encode(puzzle), extra);
    outcome.event.asset_id = asset_id;
    outcome.event.puzzle_type = puzzle.puzzle_type;
    outcome.event.puzzle_number = puzzle.puzzle_number;
    outcome.event.minter = minter;
    outcome.puzzle = std::move(puzzle);

    return R::Ok(std::move(outcome));
}

Result<SolveOutcome> PuzzleStateMachine::solve(
    const AttributeList& attributes,
    const security::AssetOwnerRecord& owner_record,
    const std::optional<security::HoldingRecord>& holding,
    const SolveRequest& request,
    const EntropySnapshot& snapshot
) const {
    using R = Result<SolveOutcome>;
    const std::string asset = owner_record.asset_id.to_string();

    auto decoded = AttributeCodec::decode(attributes);
    if (decoded.is_err()) {
        PUZZLEMINT_LOG_WARN("Solve rejected for {}: {}", asset, decoded.error().to_string());
        return R::Err(decoded.error());
    }
    PuzzleInstance puzzle = std::move(decoded.value());

    if (state_of(puzzle) == PuzzleState::Solved) {
        PUZZLEMINT_LOG_WARN("Solve rejected for {}: already solved", asset);
        return R::Err(Error(ErrorCode::AlreadySolved, "Puzzle is in its terminal state",
                            "asset=" + asset));
    }

    if (!security::OwnershipGuard::verify_owner(request.claimed, owner_record, holding)) {
        PUZZLEMINT_LOG_WARN("Solve rejected for {}: {} is not the owner",
                            asset, request.claimed.to_string());
        return R::Err(Error(ErrorCode::NotNftOwner, "Caller does not own the asset",
                            "caller=" + request.claimed.to_string()));
    }

    PUZZLEMINT_TRY_UNWRAP(R, accepted, SolutionVerifier::verify(puzzle, request.candidate));
    if (!accepted) {
        PUZZLEMINT_LOG_WARN("Solve rejected for {}: incorrect solution {}", asset, request.candidate);
        return R::Err(Error(ErrorCode::IncorrectSolution, "Candidate does not satisfy the puzzle",
                            "candidate=" + std::to_string(request.candidate)));
    }

    Rarity rarity = RarityAssigner::assign(snapshot.timestamp);

    puzzle.solved = true;
    puzzle.solver = request.claimed;
    puzzle.solution = request.candidate;
    puzzle.solved_at = snapshot.timestamp;
    puzzle.rarity = rarity;

    AttributeUpdates updates = {
        {metadata::keys::SOLVED, "true"},
        {metadata::keys::SOLVER, request.claimed.to_string()},
        {metadata::keys::SOLUTION, std::to_string(request.candidate)},
        {metadata::keys::SOLVE_TIMESTAMP, std::to_string(snapshot.timestamp)},
        {metadata::keys::RARITY, rarity_to_string(rarity)},
    };
    if (options_.reveal_hidden_trait &&
        AttributeCodec::find(attributes, metadata::keys::HIDDEN_TRAIT)) {
        updates.emplace_back(metadata::keys::HIDDEN_TRAIT, rarity_to_string(rarity) + " Solver");
    }

    SolveOutcome outcome;
    outcome.attributes = AttributeCodec::merge_update(attributes, updates);
    outcome.new_uri = request.new_uri;
    outcome.event.asset_id = owner_record.asset_id;
    outcome.event.solver = request.claimed;
    outcome.event.solve_timestamp = snapshot.timestamp;
    outcome.event.rarity = rarity;
    outcome.puzzle = std::move(puzzle);

    PUZZLEMINT_LOG_INFO("Puzzle solved: asset={}, solver={}, rarity={}",
                        asset, request.claimed.to_string(), rarity_to_string(rarity));

    return R::Ok(std::move(outcome));
}

} // namespace puzzlemint::core
