#pragma once

#include <vulkan/vulkan.hpp>
#include <cstdint>

#include "IndirectDrawPlan.h"

class DrawCommandBuffer;

/**
 * IndirectDrawExecutor - issues the compacted draw list
 *
 * With drawIndirectCount the command count is read on the device from the
 * counter block, so the host never waits on the culling result:
 *   vkCmdDrawIndirectCount(commands, 0, counters, 0, min(capacity, maxDrawIndirectCount), stride)
 *
 * Without it the whole command array is drawn with vkCmdDrawIndirect. The
 * array must then have been zero-filled before the dispatch (requiresZeroFill)
 * so unused entries have instanceCount = 0 and draw nothing.
 *
 * The graphics pipeline, vertex buffers and render pass are bound by the caller.
 */
class IndirectDrawExecutor {
public:
    IndirectDrawExecutor() = default;
    explicit IndirectDrawExecutor(const IndirectDrawPlan& plan);

    IndirectDrawMode getMode() const { return plan_.mode; }
    const IndirectDrawPlan& getPlan() const { return plan_; }
    bool requiresZeroFill() const { return plan_.requiresZeroFill(); }

    // Record the draw for the culled output of one frame slot.
    // Must follow the compute -> indirect barrier.
    void record(vk::CommandBuffer cmd, const DrawCommandBuffer& commands) const;

private:
    IndirectDrawPlan plan_;
};
