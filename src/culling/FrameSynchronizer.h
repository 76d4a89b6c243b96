#pragma once

#include <vulkan/vulkan.hpp>
#include <vulkan/vulkan_raii.hpp>
#include <vk_mem_alloc.h>
#include <cstdint>
#include <memory>

#include "CapacityPolicy.h"
#include "CullTypes.h"
#include "DrawCommandBuffer.h"
#include "FrameSlotTracker.h"
#include "core/FrameBuffered.h"
#include "core/vulkan/TimelineSemaphore.h"

enum class FrameStatus {
    Ready,
    Timeout,            // Slot's previous submission did not complete within the timeout
    DeviceLost,
    NotInitialized
};

const char* toString(FrameStatus status);

/**
 * FrameSynchronizer - frames in flight for the culling pipeline
 *
 * Each frame slot owns a DrawCommandBuffer. Every submission signals the next
 * value of one timeline semaphore; beginFrame() blocks on the host until the
 * current slot's last value has been reached, then hands the slot out for
 * recording. Nothing a previous frame may still read is touched before that.
 *
 * Frame loop:
 *   if (sync->beginFrame() != FrameStatus::Ready) -> fatal
 *   sync->prepareCapacity(liveCount, policy);
 *   ... record reset, dispatch ...
 *   sync->recordComputeToDrawBarrier(cmd);
 *   ... record draw ...
 *   auto signal = sync->endFrame(objectCount);
 *   queue.submit2(... signal ...);
 */
class FrameSynchronizer {
public:
    struct ConstructToken { explicit ConstructToken() = default; };
    explicit FrameSynchronizer(ConstructToken) {}

    struct InitInfo {
        const vk::raii::Device* raiiDevice = nullptr;
        VmaAllocator allocator = VK_NULL_HANDLE;
        uint32_t framesInFlight = FrameSlotTracker::DEFAULT_FRAME_COUNT;
        uint32_t initialCapacity = 1024;
        uint64_t timeoutNs = 5'000'000'000ull;
    };

    static std::unique_ptr<FrameSynchronizer> create(const InitInfo& info);

    ~FrameSynchronizer() = default;

    // Non-copyable, non-movable
    FrameSynchronizer(const FrameSynchronizer&) = delete;
    FrameSynchronizer& operator=(const FrameSynchronizer&) = delete;
    FrameSynchronizer(FrameSynchronizer&&) = delete;
    FrameSynchronizer& operator=(FrameSynchronizer&&) = delete;

    // Wait for the current slot to become reusable and acquire it
    FrameStatus beginFrame();

    uint32_t currentSlot() const { return tracker_.currentSlot(); }
    uint32_t frameCount() const { return tracker_.frameCount(); }
    bool isFrameActive() const { return tracker_.isAcquired(); }

    DrawCommandBuffer& currentCommands() { return slots_[tracker_.currentSlot()].commands; }
    const DrawCommandBuffer& currentCommands() const { return slots_[tracker_.currentSlot()].commands; }

    // Grow the acquired slot's command storage if liveCount does not fit
    DrawCommandBuffer::GrowResult prepareCapacity(uint32_t liveCount, const CapacityPolicy& policy);

    // Compute/transfer writes -> indirect reads and host reads, on both buffers of the slot
    void recordComputeToDrawBarrier(vk::CommandBuffer cmd) const;

    /**
     * Close the acquired slot. Returns the timeline signal to attach to the
     * queue submission (vkQueueSubmit2) and advances to the next slot.
     * objectCount is the number of objects dispatched, kept for statistics.
     */
    vk::SemaphoreSubmitInfo endFrame(uint32_t objectCount,
        vk::PipelineStageFlags2 stageMask = vk::PipelineStageFlagBits2::eAllCommands);

    // Drop the acquired slot without submitting
    void abortFrame();

    // Wait for all submitted frames
    FrameStatus waitIdle();

    // Statistics of the most recent frame whose completion has been observed
    const CullingStats& getLastCompletedStats() const { return lastCompletedStats_; }

    vk::Semaphore getTimelineSemaphore() const { return timeline_.get(); }
    uint64_t lastSignalValue() const { return tracker_.lastSignalValue(); }

private:
    struct FrameSlot {
        DrawCommandBuffer commands;
        uint32_t submittedObjects = 0;
        uint32_t submittedCapacity = 0;
        bool hasPendingStats = false;
    };

    bool initInternal(const InitInfo& info);

    // Host wait on the timeline, mapping failures to a FrameStatus
    FrameStatus waitForValue(uint64_t value);

    void collectStats(FrameSlot& slot);

    const vk::raii::Device* raiiDevice_ = nullptr;
    uint64_t timeoutNs_ = 0;

    TimelineSemaphore timeline_;
    FrameSlotTracker tracker_;
    FrameBuffered<FrameSlot> slots_;

    CullingStats lastCompletedStats_{};
};
