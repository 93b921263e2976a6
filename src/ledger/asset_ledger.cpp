#include "asset_ledger.hpp"
#include "utils/logger.hpp"

namespace puzzlemint::ledger {

namespace {
    Error unknown_asset(const Identity& asset_id) {
        return Error(ErrorCode::InvalidAssetData, "Asset not found in ledger",
                     "asset=" + asset_id.to_string());
    }
}

Result<void> InMemoryAssetLedger::create(AssetRecord record,
                                         const security::UpdateAuthority& authority) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (assets_.count(record.asset_id) > 0) {
        return Result<void>::Err(Error(ErrorCode::InvalidArgument, "Asset id already exists",
                                       "asset=" + record.asset_id.to_string()));
    }
    PUZZLEMINT_TRY(Result<void>,
        security::OwnershipGuard::verify_update_authority(authority, record.owner_record()));

    record.version = 1;
    PUZZLEMINT_LOG_DEBUG("Ledger: created asset {} owned by {}",
                         record.asset_id.to_string(), record.owner.to_string());
    Identity id = record.asset_id;
    assets_.emplace(id, std::move(record));
    return Result<void>::Ok();
}

std::optional<AssetRecord> InMemoryAssetLedger::get(const Identity& asset_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = assets_.find(asset_id);
    if (it == assets_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Result<uint64_t> InMemoryAssetLedger::commit(const AssetCommit& commit,
                                             const security::UpdateAuthority& authority) {
    using R = Result<uint64_t>;
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = assets_.find(commit.asset_id);
    if (it == assets_.end()) {
        return R::Err(unknown_asset(commit.asset_id));
    }
    AssetRecord& record = it->second;

    PUZZLEMINT_TRY(R, security::OwnershipGuard::verify_update_authority(authority, record.owner_record()));

    if (record.version != commit.expected_version) {
        PUZZLEMINT_LOG_WARN("Ledger: stale commit for {} (expected v{}, current v{})",
                            commit.asset_id.to_string(), commit.expected_version, record.version);
        return R::Err(Error(ErrorCode::LedgerConflict, "Commit computed against stale state",
                            "expected=" + std::to_string(commit.expected_version) +
                            " current=" + std::to_string(record.version)));
    }

    record.attributes = commit.attributes;
    if (commit.uri) {
        record.uri = *commit.uri;
    }
    ++record.version;

    PUZZLEMINT_LOG_DEBUG("Ledger: committed asset {} at v{}", commit.asset_id.to_string(), record.version);
    return R::Ok(record.version);
}

Result<void> InMemoryAssetLedger::update_uri(const Identity& asset_id,
                                             const std::string& uri,
                                             const security::UpdateAuthority& authority) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = assets_.find(asset_id);
    if (it == assets_.end()) {
        return Result<void>::Err(unknown_asset(asset_id));
    }
    PUZZLEMINT_TRY(Result<void>,
        security::OwnershipGuard::verify_update_authority(authority, it->second.owner_record()));

    it->second.uri = uri;
    ++it->second.version;
    return Result<void>::Ok();
}

Result<void> InMemoryAssetLedger::transfer(const Identity& asset_id,
                                           const Identity& from,
                                           const Identity& to) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = assets_.find(asset_id);
    if (it == assets_.end()) {
        return Result<void>::Err(unknown_asset(asset_id));
    }
    AssetRecord& record = it->second;

    if (record.owner != from) {
        return Result<void>::Err(Error(ErrorCode::NotNftOwner, "Transfer from non-owner",
                                       "from=" + from.to_string()));
    }

    record.owner = to;
    if (record.holding) {
        record.holding->holder = to;
    }
    ++record.version;

    PUZZLEMINT_LOG_INFO("Ledger: asset {} transferred {} -> {}",
                        asset_id.to_string(), from.to_string(), to.to_string());
    return Result<void>::Ok();
}

size_t InMemoryAssetLedger::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return assets_.size();
}

} // namespace puzzlemint::ledger
