#pragma once

#include "puzzle.hpp"
#include <cstdint>

namespace puzzlemint::core {

/**
 * RarityAssigner - Buckets a solve timestamp into a tier.
 *
 *   t mod 100 in [0, 10)  -> Legendary
 *             in [10, 30) -> Epic
 *             in [30, 60) -> Rare
 *             otherwise   -> Common
 *
 * Not secure against adversaries: the submitter can time the solve.
 */
class RarityAssigner {
public:
    static Rarity assign(int64_t timestamp);
};

} // namespace puzzlemint::core
