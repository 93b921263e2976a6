#include "entropy.hpp"

namespace puzzlemint::core {

SystemEntropySource::SystemEntropySource(time::SlotClock clock)
    : clock_(std::move(clock))
{}

EntropySnapshot SystemEntropySource::snapshot() {
    std::lock_guard<std::mutex> lock(mutex_);
    EntropySnapshot snap;
    snap.slot = clock_.current_slot();
    snap.timestamp = time::timestamp_seconds();
    return snap;
}

void FixedEntropySource::advance(uint64_t slots, int64_t seconds) {
    current_.slot += slots;
    current_.timestamp += seconds;
}

} // namespace puzzlemint::core
