#pragma once

#include "puzzlemint/common.hpp"
#include "puzzlemint/error.hpp"
#include "core/entropy/entropy.hpp"
#include "core/events/events.hpp"
#include "metadata/attribute_codec.hpp"
#include "security/ownership.hpp"
#include "puzzle.hpp"
#include <optional>
#include <string>

namespace puzzlemint::core {

/**
 * PuzzleState - Unsolved is initial, Solved is terminal
 */
enum class PuzzleState {
    Unsolved,
    Solved
};

PuzzleState state_of(const PuzzleInstance& puzzle);

struct StateMachineOptions {
    // Non-schema pairs appended to every new asset (e.g. hidden_trait = "???")
    metadata::AttributeList mint_metadata;

    // Rewrite an existing hidden_trait to "<Rarity> Solver" on solve
    bool reveal_hidden_trait = true;
};

struct CreateOutcome {
    PuzzleInstance puzzle;
    metadata::AttributeList attributes;
    MintedEvent event;
};

struct SolveRequest {
    Identity claimed;
    uint64_t candidate = 0;
    std::optional<std::string> new_uri;
};

struct SolveOutcome {
    PuzzleInstance puzzle;
    metadata::AttributeList attributes;
    std::optional<std::string> new_uri;
    SolvedEvent event;
};

/**
 * PuzzleStateMachine - The create and solve transitions.
 *
 * Both are pure functions of their inputs: no I/O, no shared state. solve()
 * re-validates `solved == false` against the attributes it is given, so a
 * retry must start from a fresh ledger read. On error nothing is produced.
 */
class PuzzleStateMachine {
public:
    explicit PuzzleStateMachine(StateMachineOptions options = {});

    /**
     * Generate and encode a new puzzle for `asset_id`
     */
    Result<CreateOutcome> create(
        const Identity& asset_id,
        const Identity& minter,
        uint8_t type_selector,
        uint8_t difficulty,
        const EntropySnapshot& snapshot
    ) const;

    /**
     * Attempt the Unsolved -> Solved transition.
     *
     * Checks in order: decode, AlreadySolved, NotNftOwner, IncorrectSolution.
     * Rarity comes from snapshot.timestamp.
     */
    Result<SolveOutcome> solve(
        const metadata::AttributeList& attributes,
        const security::AssetOwnerRecord& owner_record,
        const std::optional<security::HoldingRecord>& holding,
        const SolveRequest& request,
        const EntropySnapshot& snapshot
    ) const;

    const StateMachineOptions& options() const { return options_; }

private:
    StateMachineOptions options_;
};

} // namespace puzzlemint::core
