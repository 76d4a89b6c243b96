#pragma once

// ============================================================================
// TimelineSemaphore.h - Frame completion counter on a Vulkan 1.2 timeline semaphore
// ============================================================================
//
// Every frame submission signals the next counter value. A frame slot records
// the value its submission signals and waits for it before the slot's buffers
// are rewritten. Value 0 is the initial counter and means "never submitted".
//

#include <vulkan/vulkan.hpp>
#include <vulkan/vulkan_raii.hpp>
#include <optional>
#include <cstdint>

class TimelineSemaphore {
public:
    // A reserved counter value and the vkQueueSubmit2 entry that signals it
    struct Signal {
        uint64_t value = 0;
        vk::SemaphoreSubmitInfo submitInfo;
    };

    TimelineSemaphore() = default;
    ~TimelineSemaphore() = default;

    TimelineSemaphore(const TimelineSemaphore&) = delete;
    TimelineSemaphore& operator=(const TimelineSemaphore&) = delete;

    TimelineSemaphore(TimelineSemaphore&&) noexcept = default;
    TimelineSemaphore& operator=(TimelineSemaphore&&) noexcept = default;

    // Device must have the timelineSemaphore feature enabled
    bool init(const vk::raii::Device& device);

    bool isInitialized() const { return semaphore_.has_value() && device_ != nullptr; }

    vk::Semaphore get() const { return semaphore_ ? **semaphore_ : vk::Semaphore{}; }

    // Last value handed out by signalNext (0 before the first frame)
    uint64_t lastSignaled() const { return lastSignaled_; }

    /**
     * Reserve the value for one frame submission.
     * The caller must submit submitInfo as a signal semaphore, or the
     * value is never reached and waits on it time out.
     */
    Signal signalNext(vk::PipelineStageFlags2 stageMask = vk::PipelineStageFlagBits2::eAllCommands);

    /**
     * Block until the counter reaches value. Value 0 returns eSuccess
     * immediately.
     * @return eSuccess or eTimeout. Throws vk::SystemError on device loss.
     */
    vk::Result waitFor(uint64_t value, uint64_t timeoutNs) const;

private:
    const vk::raii::Device* device_ = nullptr;
    std::optional<vk::raii::Semaphore> semaphore_;
    uint64_t lastSignaled_ = 0;
};
