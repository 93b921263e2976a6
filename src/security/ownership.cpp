#include "ownership.hpp"
#include "crypto/random.hpp"
#include "utils/logger.hpp"

namespace puzzlemint::security {

bool OwnershipGuard::verify_owner(
    const Identity& claimed,
    const AssetOwnerRecord& record,
    const std::optional<HoldingRecord>& holding
) {
    if (!crypto::constant_time_equal(claimed, record.owner)) {
        PUZZLEMINT_LOG_DEBUG("Ownership check failed: {} is not owner of {}",
                             claimed.to_string(), record.asset_id.to_string());
        return false;
    }

    if (holding) {
        if (!crypto::constant_time_equal(holding->holder, claimed)) {
            PUZZLEMINT_LOG_DEBUG("Ownership check failed: holding belongs to {}",
                                 holding->holder.to_string());
            return false;
        }
        if (holding->balance < 1) {
            PUZZLEMINT_LOG_DEBUG("Ownership check failed: empty holding for {}",
                                 claimed.to_string());
            return false;
        }
        if (holding->asset_id != record.asset_id) {
            PUZZLEMINT_LOG_DEBUG("Ownership check failed: holding references {}",
                                 holding->asset_id.to_string());
            return false;
        }
    }

    return true;
}

Result<void> OwnershipGuard::verify_update_authority(
    const UpdateAuthority& authority,
    const AssetOwnerRecord& record
) {
    if (!crypto::constant_time_equal(authority.identity(), record.update_authority)) {
        PUZZLEMINT_LOG_WARN("Update rejected for asset {}: {} is not the update authority",
                            record.asset_id.to_string(), authority.identity().to_string());
        return Result<void>::Err(Error(
            ErrorCode::UnauthorizedUpdate,
            "Caller is not the asset's update authority",
            "asset=" + record.asset_id.to_string()));
    }
    return Result<void>::Ok();
}

} // namespace puzzlemint::security
