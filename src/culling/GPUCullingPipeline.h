#pragma once

#include <vulkan/vulkan.hpp>
#include <vulkan/vulkan_raii.hpp>
#include <vk_mem_alloc.h>
#include <glm/glm.hpp>
#include <memory>

#include "CullTypes.h"
#include "CullingConfig.h"
#include "FrameSynchronizer.h"
#include "Frustum.h"
#include "IndirectDrawExecutor.h"
#include "IndirectDrawPlan.h"
#include "VisibilityCullPass.h"

struct CullSnapshot;

// Outcome of recording one culling dispatch
struct CullFrameResult {
    bool recorded = false;          // Dispatch (or empty reset) recorded
    bool capacityExceeded = false;  // More objects than draw slots or dispatch limits; output is clamped
    uint32_t capacity = 0;
    uint32_t objectCount = 0;
    uint32_t culledObjectCount = 0; // Objects actually tested on the device
};

/**
 * GPUCullingPipeline - frustum culling and indirect draw for one object class
 *
 * Ties the per-frame pieces together:
 *   FrameSynchronizer    slot reuse, timeline semaphore, draw command storage
 *   VisibilityCullPass   object upload + compute dispatch
 *   IndirectDrawExecutor vkCmdDrawIndirectCount (or zero-filled fallback)
 *
 * Usage:
 *   auto culling = GPUCullingPipeline::create(info);
 *   if (culling->beginFrame() != FrameStatus::Ready) -> fatal
 *   culling->recordCulling(cmd, *registry.snapshot(), proj * view);
 *   ... begin rendering, bind graphics pipeline and vertex buffers ...
 *   culling->recordDraw(cmd);
 *   auto signal = culling->endFrame();   // attach to vkQueueSubmit2
 */
class GPUCullingPipeline {
public:
    // Passkey for controlled construction
    struct ConstructToken { explicit ConstructToken() = default; };
    explicit GPUCullingPipeline(ConstructToken) {}

    struct InitInfo {
        const vk::raii::Device* raiiDevice = nullptr;
        VmaAllocator allocator = VK_NULL_HANDLE;

        // Enabled device features and limits
        CullDeviceLimits deviceLimits;

        CullingConfig config;
        DepthRange depthRange = DepthRange::ZeroToOne;
    };

    static std::unique_ptr<GPUCullingPipeline> create(const InitInfo& info);

    ~GPUCullingPipeline() = default;

    // Non-copyable, non-movable
    GPUCullingPipeline(const GPUCullingPipeline&) = delete;
    GPUCullingPipeline& operator=(const GPUCullingPipeline&) = delete;
    GPUCullingPipeline(GPUCullingPipeline&&) = delete;
    GPUCullingPipeline& operator=(GPUCullingPipeline&&) = delete;

    // Block until the next frame slot is reusable
    FrameStatus beginFrame();

    /**
     * Record counter reset, object upload, culling dispatch and the
     * compute -> indirect barrier for the acquired slot.
     * Grows the slot's draw command storage first if the snapshot does not fit.
     */
    CullFrameResult recordCulling(vk::CommandBuffer cmd,
                                  const CullSnapshot& snapshot,
                                  const glm::mat4& viewProj);

    // Record the indirect draw (inside the caller's render pass)
    void recordDraw(vk::CommandBuffer cmd) const;

    // Signal for the frame's queue submission; advances to the next slot
    vk::SemaphoreSubmitInfo endFrame(
        vk::PipelineStageFlags2 stageMask = vk::PipelineStageFlagBits2::eAllCommands);

    void abortFrame();

    FrameStatus waitIdle();

    // Buffers of the acquired slot, for callers issuing their own draws
    vk::Buffer getCommandBuffer() const { return sync_->currentCommands().getCommandBuffer(); }
    vk::Buffer getCounterBuffer() const { return sync_->currentCommands().getCounterBuffer(); }
    uint32_t getCapacity() const { return sync_->currentCommands().capacity(); }

    const CullingStats& getLastCompletedStats() const { return sync_->getLastCompletedStats(); }
    const CullingConfig& getConfig() const { return config_; }
    IndirectDrawMode getDrawMode() const { return executor_.getMode(); }
    vk::Semaphore getTimelineSemaphore() const { return sync_->getTimelineSemaphore(); }

private:
    bool initInternal(const InitInfo& info);

    CullingConfig config_;
    CapacityPolicy drawCapacity_;   // config_ growth bounded by the draw plan
    DepthRange depthRange_ = DepthRange::ZeroToOne;

    std::unique_ptr<FrameSynchronizer> sync_;
    std::unique_ptr<VisibilityCullPass> cullPass_;
    IndirectDrawExecutor executor_;

    uint32_t recordedObjectCount_ = 0;
};
