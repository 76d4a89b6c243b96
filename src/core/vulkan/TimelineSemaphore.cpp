#include "TimelineSemaphore.h"
#include <SDL3/SDL_log.h>

bool TimelineSemaphore::init(const vk::raii::Device& device) {
    if (semaphore_.has_value()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
            "TimelineSemaphore: Reinitializing, pending frame values are dropped");
        semaphore_.reset();
    }

    device_ = &device;
    lastSignaled_ = 0;

    auto typeInfo = vk::SemaphoreTypeCreateInfo{}
        .setSemaphoreType(vk::SemaphoreType::eTimeline)
        .setInitialValue(0);

    auto createInfo = vk::SemaphoreCreateInfo{}
        .setPNext(&typeInfo);

    try {
        semaphore_.emplace(device, createInfo);
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "TimelineSemaphore: Failed to create frame counter: %s", e.what());
        device_ = nullptr;
        return false;
    }

    return true;
}

TimelineSemaphore::Signal TimelineSemaphore::signalNext(vk::PipelineStageFlags2 stageMask) {
    Signal signal;
    signal.value = ++lastSignaled_;
    signal.submitInfo = vk::SemaphoreSubmitInfo{}
        .setSemaphore(get())
        .setValue(signal.value)
        .setStageMask(stageMask);
    return signal;
}

vk::Result TimelineSemaphore::waitFor(uint64_t value, uint64_t timeoutNs) const {
    if (!semaphore_) {
        return vk::Result::eErrorInitializationFailed;
    }
    if (value == 0) {
        return vk::Result::eSuccess;
    }

    auto waitInfo = vk::SemaphoreWaitInfo{}
        .setSemaphores(**semaphore_)
        .setValues(value);

    return device_->waitSemaphores(waitInfo, timeoutNs);
}
