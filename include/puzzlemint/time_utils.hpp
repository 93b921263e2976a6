#pragma once

#include "puzzlemint/common.hpp"
#include <chrono>

namespace puzzlemint {
namespace time {

using Clock = std::chrono::system_clock;

// Unix seconds; signed so pre-epoch solve times stay representable
int64_t timestamp_seconds();

// Unix milliseconds, the unit slots are measured in
uint64_t timestamp_milliseconds();

/**
 * SlotClock - monotonic slot counter derived from wall-clock time.
 *
 * slot = (now_ms - genesis_ms) / slot_duration_ms, clamped at 0 before genesis.
 * The counter never decreases for a given clock instance, even if the
 * system clock steps backwards.
 */
class SlotClock {
public:
    explicit SlotClock(uint64_t genesis_timestamp_ms = 0,
                       uint64_t slot_duration_ms = constants::DEFAULT_SLOT_DURATION_MS);

    // Current slot
    uint64_t current_slot();

    // Slot for a specific timestamp (milliseconds)
    uint64_t slot_for_timestamp(uint64_t timestamp_ms) const;

    // Start time (milliseconds) of a slot
    uint64_t slot_start_time(uint64_t slot) const;

    uint64_t slot_duration() const { return slot_duration_ms_; }
    uint64_t genesis() const { return genesis_ms_; }

private:
    uint64_t genesis_ms_;
    uint64_t slot_duration_ms_;
    uint64_t last_slot_ = 0;
};

} // namespace time
} // namespace puzzlemint
