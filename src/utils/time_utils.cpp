#include "puzzlemint/time_utils.hpp"
#include <stdexcept>

namespace puzzlemint {
namespace time {

int64_t timestamp_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        Clock::now().time_since_epoch()
    ).count();
}

uint64_t timestamp_milliseconds() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now().time_since_epoch()
    ).count());
}

// SlotClock implementation
SlotClock::SlotClock(uint64_t genesis_timestamp_ms, uint64_t slot_duration_ms)
    : genesis_ms_(genesis_timestamp_ms)
    , slot_duration_ms_(slot_duration_ms)
{
    if (slot_duration_ms_ == 0) {
        throw std::invalid_argument("Slot duration must be positive");
    }
}

uint64_t SlotClock::current_slot() {
    uint64_t slot = slot_for_timestamp(timestamp_milliseconds());
    if (slot > last_slot_) {
        last_slot_ = slot;
    }
    return last_slot_;
}

uint64_t SlotClock::slot_for_timestamp(uint64_t timestamp_ms) const {
    if (timestamp_ms <= genesis_ms_) {
        return 0;
    }
    return (timestamp_ms - genesis_ms_) / slot_duration_ms_;
}

uint64_t SlotClock::slot_start_time(uint64_t slot) const {
    return genesis_ms_ + slot * slot_duration_ms_;
}

} // namespace time
} // namespace puzzlemint
