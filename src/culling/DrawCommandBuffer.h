#pragma once

#include <vulkan/vulkan.hpp>
#include <vk_mem_alloc.h>
#include <cstdint>
#include <optional>

#include "CapacityPolicy.h"
#include "CullTypes.h"
#include "core/vulkan/VmaBuffer.h"

/**
 * DrawCommandBuffer - compacted draw output of one frame slot
 *
 * Owns two buffers:
 *   commands  capacity * VkDrawIndirectCommand, written by the compute stage,
 *             read by the indirect draw (device local)
 *   counters  GPUCullCounters, reset by vkCmdFillBuffer before every dispatch,
 *             drawCount doubles as the indirect count (host readable for stats)
 *
 * The owner must only call ensureCapacity() on a slot whose previous
 * submission has completed; growth replaces both buffers.
 */
class DrawCommandBuffer {
public:
    enum class GrowResult {
        Unchanged,
        Grown,
        Failed      // Old buffers kept; the frame runs clamped
    };

    DrawCommandBuffer() = default;
    ~DrawCommandBuffer() = default;

    // Non-copyable, movable (stored per frame slot)
    DrawCommandBuffer(const DrawCommandBuffer&) = delete;
    DrawCommandBuffer& operator=(const DrawCommandBuffer&) = delete;
    DrawCommandBuffer(DrawCommandBuffer&&) noexcept = default;
    DrawCommandBuffer& operator=(DrawCommandBuffer&&) noexcept = default;

    bool init(VmaAllocator allocator, uint32_t capacity);
    void destroy();

    bool isInitialized() const { return capacity_ > 0; }

    // Grow to policy.requiredCapacity() when liveCount does not fit
    GrowResult ensureCapacity(uint32_t liveCount, const CapacityPolicy& policy);

    // Zero the counters (and the whole command array when zeroCommands is set,
    // for the vkCmdDrawIndirect fallback). Follow with
    // BarrierHelpers::fillBufferToCompute before the dispatch.
    void recordReset(vk::CommandBuffer cmd, bool zeroCommands) const;

    vk::Buffer getCommandBuffer() const { return commands_.buffer(); }
    vk::Buffer getCounterBuffer() const { return counters_.buffer(); }
    uint32_t capacity() const { return capacity_; }

    static constexpr vk::DeviceSize commandStride() { return sizeof(GPUDrawCommand); }

    // Counter block as last written by the device. Only meaningful after the
    // submission that wrote it has completed.
    std::optional<GPUCullCounters> readCounters() const;

private:
    static bool allocate(VmaAllocator allocator, uint32_t capacity,
                         VmaBuffer& outCommands, VmaBuffer& outCounters);

    VmaAllocator allocator_ = VK_NULL_HANDLE;
    VmaBuffer commands_;
    VmaBuffer counters_;
    uint32_t capacity_ = 0;
};
