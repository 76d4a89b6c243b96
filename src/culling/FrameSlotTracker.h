#pragma once

#include <cassert>
#include <cstdint>
#include <vector>

/**
 * FrameSlotTracker - completion bookkeeping for N frames in flight
 *
 * Each slot remembers the timeline value its last submission signals. A slot
 * may be recorded into again only once the completed timeline value has
 * reached that value. Holds no GPU objects; FrameSynchronizer feeds it the
 * timeline semaphore's counter.
 *
 * Frame loop:
 *   uint32_t slot = tracker.currentSlot();
 *   wait until timeline >= tracker.waitValue(slot);
 *   tracker.acquire(slot, completed);
 *   ... record ...
 *   tracker.markSubmitted(slot, signalValue);
 *   tracker.advance();
 */
class FrameSlotTracker {
public:
    static constexpr uint32_t DEFAULT_FRAME_COUNT = 3;

    explicit FrameSlotTracker(uint32_t frameCount = DEFAULT_FRAME_COUNT)
        : submittedValues_(frameCount == 0 ? 1 : frameCount, 0) {}

    uint32_t frameCount() const { return static_cast<uint32_t>(submittedValues_.size()); }
    uint32_t currentSlot() const { return current_; }

    // Timeline value that must complete before slot can be reused (0 = never submitted)
    uint64_t waitValue(uint32_t slot) const { return submittedValues_[slot]; }

    bool isReusable(uint32_t slot, uint64_t completedValue) const {
        return completedValue >= submittedValues_[slot];
    }

    // Begin recording into slot. Reuse before completion is a contract violation.
    void acquire(uint32_t slot, uint64_t completedValue) {
        assert(slot < frameCount() && "Frame slot out of range");
        assert(isReusable(slot, completedValue) && "Frame slot reused before its GPU work completed");
        (void)completedValue;
        acquired_ = true;
        acquiredSlot_ = slot;
    }

    bool isAcquired() const { return acquired_; }

    // Timeline values must increase monotonically across submissions
    void markSubmitted(uint32_t slot, uint64_t signalValue) {
        assert(acquired_ && acquiredSlot_ == slot && "Submitting a slot that was not acquired");
        assert(signalValue > lastSignalValue_ && "Timeline values must increase");
        submittedValues_[slot] = signalValue;
        lastSignalValue_ = signalValue;
        acquired_ = false;
    }

    // Give up the acquired slot without submitting (e.g. frame aborted)
    void release() { acquired_ = false; }

    void advance() {
        current_ = (current_ + 1) % frameCount();
    }

    uint64_t lastSignalValue() const { return lastSignalValue_; }

    // All submitted work has completed
    bool isIdle(uint64_t completedValue) const { return completedValue >= lastSignalValue_; }

private:
    std::vector<uint64_t> submittedValues_;
    uint32_t current_ = 0;
    uint32_t acquiredSlot_ = 0;
    uint64_t lastSignalValue_ = 0;
    bool acquired_ = false;
};
