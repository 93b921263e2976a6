#pragma once

#include "puzzlemint/common.hpp"
#include "puzzlemint/error.hpp"
#include <cstdint>
#include <optional>

namespace puzzlemint::security {

/**
 * AssetOwnerRecord - Who owns an asset and who may update its metadata
 */
struct AssetOwnerRecord {
    Identity asset_id;
    Identity owner;
    Identity update_authority;
};

/**
 * HoldingRecord - Separate token-holding record backing ownership.
 * Optional: assets whose owner field is authoritative don't carry one.
 */
struct HoldingRecord {
    Identity holder;
    Identity asset_id;
    uint64_t balance = 0;
};

/**
 * UpdateAuthority - Capability to sign metadata updates.
 *
 * Issued once from configuration and passed explicitly to whoever commits
 * asset changes; nothing looks it up ambiently.
 */
class UpdateAuthority {
public:
    explicit UpdateAuthority(const Identity& identity) : identity_(identity) {}

    const Identity& identity() const { return identity_; }

private:
    Identity identity_;
};

/**
 * OwnershipGuard - Gates solves on ownership and metadata updates on authority
 */
class OwnershipGuard {
public:
    /**
     * True iff `claimed` is the recorded owner and, when a holding record is
     * supplied, it belongs to `claimed`, has balance >= 1 and references the
     * same asset. Never errors; the caller chooses NotNftOwner.
     */
    static bool verify_owner(
        const Identity& claimed,
        const AssetOwnerRecord& record,
        const std::optional<HoldingRecord>& holding = std::nullopt
    );

    /**
     * Authorize a metadata-only update
     * @return UnauthorizedUpdate when the capability is not the record's authority
     */
    static Result<void> verify_update_authority(
        const UpdateAuthority& authority,
        const AssetOwnerRecord& record
    );
};

} // namespace puzzlemint::security
