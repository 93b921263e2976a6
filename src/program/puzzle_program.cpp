#include "puzzle_program.hpp"
#include "crypto/random.hpp"
#include "utils/logger.hpp"

namespace puzzlemint::program {

PuzzleProgram::PuzzleProgram(const ProgramConfig& config,
                             ledger::AssetLedger& ledger,
                             core::EntropySource& entropy)
    : program_id_(config.program_id)
    , authority_(config.update_authority)
    , ledger_(ledger)
    , entropy_(entropy)
    , machine_(config.state_machine_options())
{
    PUZZLEMINT_LOG_INFO("PuzzleProgram {} ready", program_id_.to_string());
}

Result<MintReceipt> PuzzleProgram::mint(const Identity& minter, const MintRequest& request) {
    using R = Result<MintReceipt>;

    Identity asset_id = crypto::Random::generate_identity();
    core::EntropySnapshot snapshot = entropy_.snapshot();

    PUZZLEMINT_TRY_UNWRAP(R, created,
        machine_.create(asset_id, minter, request.puzzle_type_selector,
                        request.difficulty, snapshot));

    ledger::AssetRecord record;
    record.asset_id = asset_id;
    record.name = request.display_name;
    record.uri = request.display_uri;
    record.owner = minter;
    record.update_authority = authority_.identity();
    record.holding = security::HoldingRecord{minter, asset_id, 1};
    record.attributes = std::move(created.attributes);

    auto stored = ledger_.create(std::move(record), authority_);
    if (stored.is_err()) {
        PUZZLEMINT_LOG_ERROR("Mint failed to persist asset {}: {}",
                             asset_id.to_string(), stored.error().to_string());
        return R::Err(stored.error());
    }

    PUZZLEMINT_LOG_INFO("Puzzle asset minted: {}", created.event.to_json().dump());
    return R::Ok(MintReceipt{asset_id, created.event});
}

Result<core::SolvedEvent> PuzzleProgram::solve(const Identity& asset_id,
                                               const Identity& caller,
                                               uint64_t candidate,
                                               const std::optional<std::string>& new_uri) {
    using R = Result<core::SolvedEvent>;

    auto record = ledger_.get(asset_id);
    if (!record) {
        PUZZLEMINT_LOG_WARN("Solve rejected: unknown asset {}", asset_id.to_string());
        return R::Err(Error(ErrorCode::InvalidAssetData, "Asset not found in ledger",
                            "asset=" + asset_id.to_string()));
    }

    core::SolveRequest request{caller, candidate, new_uri};
    PUZZLEMINT_TRY_UNWRAP(R, outcome,
        machine_.solve(record->attributes, record->owner_record(), record->holding,
                       request, entropy_.snapshot()));

    ledger::AssetCommit commit;
    commit.asset_id = asset_id;
    commit.expected_version = record->version;
    commit.attributes = std::move(outcome.attributes);
    commit.uri = outcome.new_uri;

    auto committed = ledger_.commit(commit, authority_);
    if (committed.is_err()) {
        PUZZLEMINT_LOG_WARN("Solve of {} not committed: {}",
                            asset_id.to_string(), committed.error().to_string());
        return R::Err(committed.error());
    }

    if (outcome.new_uri) {
        PUZZLEMINT_LOG_INFO("URI updated to: {}", *outcome.new_uri);
    }
    PUZZLEMINT_LOG_INFO("Puzzle asset solved: {}", outcome.event.to_json().dump());
    return R::Ok(outcome.event);
}

Result<core::UriUpdatedEvent> PuzzleProgram::update_uri(const security::UpdateAuthority& caller,
                                                        const Identity& asset_id,
                                                        const std::string& new_uri) {
    using R = Result<core::UriUpdatedEvent>;

    auto record = ledger_.get(asset_id);
    if (!record) {
        return R::Err(Error(ErrorCode::InvalidAssetData, "Asset not found in ledger",
                            "asset=" + asset_id.to_string()));
    }

    PUZZLEMINT_TRY(R, security::OwnershipGuard::verify_update_authority(caller, record->owner_record()));
    PUZZLEMINT_TRY(R, ledger_.update_uri(asset_id, new_uri, caller));

    core::UriUpdatedEvent event{asset_id, new_uri};
    PUZZLEMINT_LOG_INFO("Asset metadata updated: {}", event.to_json().dump());
    return R::Ok(std::move(event));
}

} // namespace puzzlemint::program
