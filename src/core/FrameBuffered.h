#pragma once

// ============================================================================
// FrameBuffered.h - N copies of a per-frame resource, one per frame in flight
// ============================================================================
//
// Holds the storage only. Which copy is safe to touch is decided by the
// owner (see FrameSlotTracker), so access is always by explicit slot index.
//
//    struct FrameSlot { DrawCommandBuffer commands; VmaBuffer uniforms; };
//    FrameBuffered<FrameSlot> slots;
//    slots.resize(3);
//    slots[tracker.currentSlot()].commands.recordReset(cmd, false);
//
// T may be move-only.

#include <cstdint>
#include <vector>
#include <cassert>

template<typename T>
class FrameBuffered {
public:
    FrameBuffered() = default;

    // Default-constructs T for each frame, dropping any existing copies
    void resize(uint32_t frameCount) {
        resources_.clear();
        resources_.resize(frameCount);
    }

    uint32_t frameCount() const { return static_cast<uint32_t>(resources_.size()); }

    // Access with wraparound
    T& at(uint32_t frameIndex) {
        assert(!resources_.empty() && "FrameBuffered not initialized");
        return resources_[frameIndex % resources_.size()];
    }

    const T& at(uint32_t frameIndex) const {
        assert(!resources_.empty() && "FrameBuffered not initialized");
        return resources_[frameIndex % resources_.size()];
    }

    T& operator[](uint32_t index) {
        assert(index < resources_.size() && "Index out of bounds");
        return resources_[index];
    }

    const T& operator[](uint32_t index) const {
        assert(index < resources_.size() && "Index out of bounds");
        return resources_[index];
    }

private:
    std::vector<T> resources_;
};
