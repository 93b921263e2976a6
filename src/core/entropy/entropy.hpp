#pragma once

#include "puzzlemint/common.hpp"
#include "puzzlemint/time_utils.hpp"
#include <cstdint>
#include <mutex>

namespace puzzlemint::core {

/**
 * EntropySnapshot - Slot counter and wall time read together.
 * Non-adversarial randomness: a submitter can observe and steer both.
 */
struct EntropySnapshot {
    uint64_t slot = 0;
    int64_t timestamp = 0;  // Unix seconds
};

/**
 * EntropySource - Read-only supplier of entropy snapshots
 */
class EntropySource {
public:
    virtual ~EntropySource() = default;

    /**
     * Take a snapshot. Slots returned by one source never decrease.
     */
    virtual EntropySnapshot snapshot() = 0;
};

/**
 * SystemEntropySource - Wall clock plus a SlotClock
 */
class SystemEntropySource : public EntropySource {
public:
    explicit SystemEntropySource(time::SlotClock clock);

    EntropySnapshot snapshot() override;

private:
    std::mutex mutex_;
    time::SlotClock clock_;
};

/**
 * FixedEntropySource - Caller-controlled snapshots (replays, tests)
 */
class FixedEntropySource : public EntropySource {
public:
    explicit FixedEntropySource(EntropySnapshot initial = {}) : current_(initial) {}

    EntropySnapshot snapshot() override { return current_; }

    void set(EntropySnapshot snapshot) { current_ = snapshot; }

    /**
     * Move forward by the given number of slots and seconds
     */
    void advance(uint64_t slots, int64_t seconds);

private:
    EntropySnapshot current_;
};

} // namespace puzzlemint::core
