#include "FrameSynchronizer.h"
#include "core/vulkan/BarrierHelpers.h"
#include <SDL3/SDL_log.h>

const char* toString(FrameStatus status) {
    switch (status) {
        case FrameStatus::Ready: return "Ready";
        case FrameStatus::Timeout: return "Timeout";
        case FrameStatus::DeviceLost: return "DeviceLost";
        case FrameStatus::NotInitialized: return "NotInitialized";
    }
    return "Unknown";
}

std::unique_ptr<FrameSynchronizer> FrameSynchronizer::create(const InitInfo& info) {
    auto sync = std::make_unique<FrameSynchronizer>(ConstructToken{});
    if (!sync->initInternal(info)) {
        return nullptr;
    }
    return sync;
}

bool FrameSynchronizer::initInternal(const InitInfo& info) {
    raiiDevice_ = info.raiiDevice;
    timeoutNs_ = info.timeoutNs;

    if (!raiiDevice_) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "FrameSynchronizer requires raiiDevice");
        return false;
    }
    if (info.allocator == VK_NULL_HANDLE) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "FrameSynchronizer requires allocator");
        return false;
    }

    if (!timeline_.init(*raiiDevice_)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "FrameSynchronizer: Failed to create timeline semaphore");
        return false;
    }

    tracker_ = FrameSlotTracker(info.framesInFlight);

    slots_.resize(tracker_.frameCount());
    for (uint32_t i = 0; i < slots_.frameCount(); ++i) {
        if (!slots_[i].commands.init(info.allocator, info.initialCapacity)) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                "FrameSynchronizer: Failed to create draw command buffer for slot %u", i);
            return false;
        }
    }

    SDL_Log("FrameSynchronizer: Initialized with %u frames in flight, capacity %u",
            tracker_.frameCount(), info.initialCapacity);
    return true;
}

FrameStatus FrameSynchronizer::waitForValue(uint64_t value) {
    if (!timeline_.isInitialized()) {
        return FrameStatus::NotInitialized;
    }
    try {
        vk::Result result = timeline_.waitFor(value, timeoutNs_);
        if (result == vk::Result::eTimeout) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                "FrameSynchronizer: Timed out after %llu ns waiting for timeline value %llu",
                static_cast<unsigned long long>(timeoutNs_),
                static_cast<unsigned long long>(value));
            return FrameStatus::Timeout;
        }
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "FrameSynchronizer: Wait for timeline value %llu failed: %s",
            static_cast<unsigned long long>(value), e.what());
        return FrameStatus::DeviceLost;
    }

    return FrameStatus::Ready;
}

FrameStatus FrameSynchronizer::beginFrame() {
    if (tracker_.isAcquired()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
            "FrameSynchronizer: beginFrame called twice, dropping unsubmitted slot %u", tracker_.currentSlot());
        tracker_.release();
    }

    uint32_t slotIndex = tracker_.currentSlot();
    uint64_t waitValue = tracker_.waitValue(slotIndex);

    FrameStatus status = waitForValue(waitValue);
    if (status != FrameStatus::Ready) {
        return status;
    }

    collectStats(slots_[slotIndex]);

    // The wait succeeded, so the completed value is at least waitValue
    tracker_.acquire(slotIndex, waitValue);
    return FrameStatus::Ready;
}

void FrameSynchronizer::collectStats(FrameSlot& slot) {
    if (!slot.hasPendingStats) {
        return;
    }
    slot.hasPendingStats = false;

    auto counters = slot.commands.readCounters();
    if (!counters) {
        return;
    }

    CullingStats stats;
    stats.totalObjects = slot.submittedObjects;
    stats.visibleObjects = counters->drawCount;
    stats.requestedObjects = counters->requestedCount;
    stats.capacity = slot.submittedCapacity;

    if (stats.overflowed()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
            "FrameSynchronizer: %u visible objects exceeded capacity %u, output was clamped",
            stats.requestedObjects, stats.capacity);
    }

    lastCompletedStats_ = stats;
}

DrawCommandBuffer::GrowResult FrameSynchronizer::prepareCapacity(uint32_t liveCount, const CapacityPolicy& policy) {
    if (!tracker_.isAcquired()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "FrameSynchronizer: prepareCapacity called outside beginFrame/endFrame");
        return DrawCommandBuffer::GrowResult::Failed;
    }
    return currentCommands().ensureCapacity(liveCount, policy);
}

void FrameSynchronizer::recordComputeToDrawBarrier(vk::CommandBuffer cmd) const {
    const DrawCommandBuffer& commands = currentCommands();
    BarrierHelpers::computeToIndirectDraw(cmd, commands.getCommandBuffer(), commands.getCounterBuffer());
    BarrierHelpers::computeToHost(cmd, commands.getCounterBuffer());
}

vk::SemaphoreSubmitInfo FrameSynchronizer::endFrame(uint32_t objectCount, vk::PipelineStageFlags2 stageMask) {
    if (!tracker_.isAcquired()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "FrameSynchronizer: endFrame without beginFrame");
        return vk::SemaphoreSubmitInfo{};
    }

    uint32_t slotIndex = tracker_.currentSlot();
    FrameSlot& slot = slots_[slotIndex];

    slot.submittedObjects = objectCount;
    slot.submittedCapacity = slot.commands.capacity();
    slot.hasPendingStats = true;

    TimelineSemaphore::Signal signal = timeline_.signalNext(stageMask);
    tracker_.markSubmitted(slotIndex, signal.value);
    tracker_.advance();

    return signal.submitInfo;
}

void FrameSynchronizer::abortFrame() {
    tracker_.release();
}

FrameStatus FrameSynchronizer::waitIdle() {
    FrameStatus status = waitForValue(timeline_.lastSignaled());
    if (status != FrameStatus::Ready) {
        return status;
    }

    // Oldest submission first so the newest stats win
    for (uint32_t i = 0; i < slots_.frameCount(); ++i) {
        collectStats(slots_.at(tracker_.currentSlot() + i));
    }
    return FrameStatus::Ready;
}
