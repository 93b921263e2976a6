#pragma once

#include "puzzlemint/common.hpp"
#include "puzzlemint/error.hpp"
#include "metadata/attribute_codec.hpp"
#include "security/ownership.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace puzzlemint::ledger {

/**
 * AssetRecord - Everything the ledger stores for one asset
 */
struct AssetRecord {
    Identity asset_id;
    std::string name;
    std::string uri;
    Identity owner;
    Identity update_authority;
    std::optional<security::HoldingRecord> holding;
    metadata::AttributeList attributes;
    uint64_t version = 0;  // bumped by every accepted change

    security::AssetOwnerRecord owner_record() const {
        return security::AssetOwnerRecord{asset_id, owner, update_authority};
    }
};

/**
 * AssetCommit - Attribute replacement guarded by the version it was computed from
 */
struct AssetCommit {
    Identity asset_id;
    uint64_t expected_version = 0;
    metadata::AttributeList attributes;
    std::optional<std::string> uri;
};

/**
 * AssetLedger - Store of asset records.
 *
 * Implementations apply each accepted call atomically and reject a commit
 * whose expected_version is stale, so of two racing solves only one lands.
 */
class AssetLedger {
public:
    virtual ~AssetLedger() = default;

    /**
     * Register a new asset (version starts at 1)
     * @return InvalidArgument if the id exists, UnauthorizedUpdate if the
     *         record names a different update authority than the signer
     */
    virtual Result<void> create(AssetRecord record,
                                const security::UpdateAuthority& authority) = 0;

    /**
     * Copy of the current record, or nullopt if unknown
     */
    virtual std::optional<AssetRecord> get(const Identity& asset_id) const = 0;

    /**
     * Replace attributes (and optionally the URI) in one step
     * @return New version, or InvalidAssetData / UnauthorizedUpdate / LedgerConflict
     */
    virtual Result<uint64_t> commit(const AssetCommit& commit,
                                    const security::UpdateAuthority& authority) = 0;

    /**
     * Metadata-only URI change
     */
    virtual Result<void> update_uri(const Identity& asset_id,
                                    const std::string& uri,
                                    const security::UpdateAuthority& authority) = 0;

    /**
     * Move ownership (and any holding) from `from` to `to`
     */
    virtual Result<void> transfer(const Identity& asset_id,
                                  const Identity& from,
                                  const Identity& to) = 0;

    virtual size_t size() const = 0;
};

/**
 * InMemoryAssetLedger - Mutex-guarded map; reference collaborator
 */
class InMemoryAssetLedger : public AssetLedger {
public:
    InMemoryAssetLedger() = default;
    PUZZLEMINT_DISALLOW_COPY(InMemoryAssetLedger);

    Result<void> create(AssetRecord record,
                        const security::UpdateAuthority& authority) override;
    std::optional<AssetRecord> get(const Identity& asset_id) const override;
    Result<uint64_t> commit(const AssetCommit& commit,
                            const security::UpdateAuthority& authority) override;
    Result<void> update_uri(const Identity& asset_id,
                            const std::string& uri,
                            const security::UpdateAuthority& authority) override;
    Result<void> transfer(const Identity& asset_id,
                          const Identity& from,
                          const Identity& to) override;
    size_t size() const override;

private:
    mutable std::mutex mutex_;
    std::map<Identity, AssetRecord> assets_;
};

} // namespace puzzlemint::ledger
