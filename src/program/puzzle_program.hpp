#pragma once

#include "puzzlemint/common.hpp"
#include "puzzlemint/error.hpp"
#include "core/entropy/entropy.hpp"
#include "core/events/events.hpp"
#include "core/puzzle/state_machine.hpp"
#include "ledger/asset_ledger.hpp"
#include "security/ownership.hpp"
#include "program_config.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace puzzlemint::program {

struct MintRequest {
    std::string display_name;
    std::string display_uri;
    uint8_t puzzle_type_selector = 0;
    uint8_t difficulty = 0;
};

struct MintReceipt {
    Identity asset_id;
    core::MintedEvent event;
};

/**
 * PuzzleProgram - Create, solve and metadata-update entry points.
 *
 * Holds the program's update-authority capability and uses it to sign every
 * ledger change it makes. Each call reads fresh ledger state; a failed call
 * persists nothing.
 */
class PuzzleProgram {
public:
    PuzzleProgram(const ProgramConfig& config,
                  ledger::AssetLedger& ledger,
                  core::EntropySource& entropy);

    /**
     * Create a puzzle asset owned by `minter`
     */
    Result<MintReceipt> mint(const Identity& minter, const MintRequest& request);

    /**
     * Attempt to solve `asset_id` as `caller`.
     * A supplied URI is committed together with the solved attributes.
     */
    Result<core::SolvedEvent> solve(const Identity& asset_id,
                                    const Identity& caller,
                                    uint64_t candidate,
                                    const std::optional<std::string>& new_uri = std::nullopt);

    /**
     * Metadata-only URI change; caller must present the asset's update authority
     */
    Result<core::UriUpdatedEvent> update_uri(const security::UpdateAuthority& caller,
                                             const Identity& asset_id,
                                             const std::string& new_uri);

    const Identity& program_id() const { return program_id_; }
    const security::UpdateAuthority& authority() const { return authority_; }

private:
    Identity program_id_;
    security::UpdateAuthority authority_;
    ledger::AssetLedger& ledger_;
    core::EntropySource& entropy_;
    core::PuzzleStateMachine machine_;
};

} // namespace puzzlemint::program
