#include "rarity.hpp"

namespace puzzlemint::core {

Rarity RarityAssigner::assign(int64_t timestamp) {
    // Euclidean remainder keeps pre-epoch timestamps in [0, 100)
    int64_t bucket = timestamp % constants::RARITY_MODULUS;
    if (bucket < 0) {
        bucket += constants::RARITY_MODULUS;
    }

    if (bucket < constants::LEGENDARY_CEILING) {
        return Rarity::Legendary;
    } else if (bucket < constants::EPIC_CEILING) {
        return Rarity::Epic;
    } else if (bucket < constants::RARE_CEILING) {
        return Rarity::Rare;
    }
    return Rarity::Common;
}

} // namespace puzzlemint::core
