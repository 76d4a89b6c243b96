#include "IndirectDrawExecutor.h"
#include "DrawCommandBuffer.h"
#include <SDL3/SDL_log.h>

IndirectDrawExecutor::IndirectDrawExecutor(const IndirectDrawPlan& plan)
    : plan_(plan) {
    if (plan_.mode == IndirectDrawMode::SingleDrawIndirect) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
            "IndirectDrawExecutor: multiDrawIndirect not available, issuing one draw per command");
    }
    SDL_Log("IndirectDrawExecutor: Using %s (maxDrawCount %u)", toString(plan_.mode), plan_.maxDrawCount);
}

void IndirectDrawExecutor::record(vk::CommandBuffer cmd, const DrawCommandBuffer& commands) const {
    uint32_t capacity = commands.capacity();
    if (capacity == 0) {
        return;
    }

    const auto stride = static_cast<uint32_t>(DrawCommandBuffer::commandStride());

    switch (plan_.mode) {
        case IndirectDrawMode::DrawIndirectCount:
            // Count is min(counters.drawCount, maxDrawCount)
            cmd.drawIndirectCount(
                commands.getCommandBuffer(), 0,     // Indirect command buffer
                commands.getCounterBuffer(), 0,     // Count buffer (drawCount is the first word)
                plan_.drawCountFor(capacity),
                stride);
            return;

        case IndirectDrawMode::MultiDrawIndirect:
            cmd.drawIndirect(commands.getCommandBuffer(), 0, plan_.drawCountFor(capacity), stride);
            return;

        case IndirectDrawMode::SingleDrawIndirect:
            for (uint32_t i = 0; i < capacity; ++i) {
                cmd.drawIndirect(commands.getCommandBuffer(),
                                 static_cast<vk::DeviceSize>(i) * stride, 1, stride);
            }
            return;
    }
}
