#include "DrawCommandBuffer.h"
#include "core/vulkan/VmaBufferFactory.h"
#include <SDL3/SDL_log.h>
#include <cstring>

bool DrawCommandBuffer::allocate(VmaAllocator allocator, uint32_t capacity,
                                 VmaBuffer& outCommands, VmaBuffer& outCounters) {
    vk::DeviceSize commandBytes = static_cast<vk::DeviceSize>(capacity) * commandStride();

    if (!VmaBufferFactory::createIndirectBuffer(allocator, commandBytes, outCommands)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "DrawCommandBuffer: Failed to allocate command array for %u commands", capacity);
        return false;
    }

    if (!VmaBufferFactory::createIndirectCountBuffer(allocator, sizeof(GPUCullCounters), outCounters)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "DrawCommandBuffer: Failed to allocate counter block");
        return false;
    }

    return true;
}

bool DrawCommandBuffer::init(VmaAllocator allocator, uint32_t capacity) {
    if (capacity == 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "DrawCommandBuffer: capacity must be non-zero");
        return false;
    }

    VmaBuffer commands;
    VmaBuffer counters;
    if (!allocate(allocator, capacity, commands, counters)) {
        return false;
    }

    allocator_ = allocator;
    commands_ = std::move(commands);
    counters_ = std::move(counters);
    capacity_ = capacity;
    return true;
}

void DrawCommandBuffer::destroy() {
    commands_.reset();
    counters_.reset();
    capacity_ = 0;
}

DrawCommandBuffer::GrowResult DrawCommandBuffer::ensureCapacity(uint32_t liveCount, const CapacityPolicy& policy) {
    if (!policy.needsGrowth(capacity_, liveCount)) {
        return GrowResult::Unchanged;
    }

    uint32_t newCapacity = policy.requiredCapacity(capacity_, liveCount);

    // Allocate the replacements first so a failure leaves the slot usable
    VmaBuffer commands;
    VmaBuffer counters;
    if (!allocate(allocator_, newCapacity, commands, counters)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
            "DrawCommandBuffer: Growth to %u failed, keeping capacity %u (%u live objects)",
            newCapacity, capacity_, liveCount);
        return GrowResult::Failed;
    }

    SDL_Log("DrawCommandBuffer: Grew capacity %u -> %u (%u live objects)",
            capacity_, newCapacity, liveCount);

    commands_ = std::move(commands);
    counters_ = std::move(counters);
    capacity_ = newCapacity;
    return GrowResult::Grown;
}

void DrawCommandBuffer::recordReset(vk::CommandBuffer cmd, bool zeroCommands) const {
    cmd.fillBuffer(counters_.buffer(), 0, sizeof(GPUCullCounters), 0);
    if (zeroCommands) {
        cmd.fillBuffer(commands_.buffer(), 0, VK_WHOLE_SIZE, 0);
    }
}

std::optional<GPUCullCounters> DrawCommandBuffer::readCounters() const {
    const void* mapped = counters_.mappedData();
    if (!mapped) {
        return std::nullopt;
    }

    if (!counters_.invalidate(0, sizeof(GPUCullCounters))) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "DrawCommandBuffer: Failed to invalidate counter block");
        return std::nullopt;
    }

    GPUCullCounters counters{};
    std::memcpy(&counters, mapped, sizeof(GPUCullCounters));
    return counters;
}
