#include "GPUCullingPipeline.h"
#include "BoundingVolumeRegistry.h"
#include <SDL3/SDL_log.h>

std::unique_ptr<GPUCullingPipeline> GPUCullingPipeline::create(const InitInfo& info) {
    auto pipeline = std::make_unique<GPUCullingPipeline>(ConstructToken{});
    if (!pipeline->initInternal(info)) {
        return nullptr;
    }
    return pipeline;
}

bool GPUCullingPipeline::initInternal(const InitInfo& info) {
    config_ = info.config;
    if (!config_.validate()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "GPUCullingPipeline: Using corrected culling config");
    }
    depthRange_ = info.depthRange;

    if (!info.raiiDevice || info.allocator == VK_NULL_HANDLE) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "GPUCullingPipeline requires raiiDevice and allocator");
        return false;
    }

    IndirectDrawPlan plan = IndirectDrawPlan::select(info.deviceLimits, config_.preferDrawIndirectCount);
    executor_ = IndirectDrawExecutor(plan);

    drawCapacity_ = config_.capacityPolicy();
    drawCapacity_.maxCapacity = plan.capacityLimit();
    if (config_.initialCapacity > drawCapacity_.maxCapacity) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
            "GPUCullingPipeline: initialCapacity %u exceeds the device draw limit %u",
            config_.initialCapacity, drawCapacity_.maxCapacity);
    }

    FrameSynchronizer::InitInfo syncInfo{};
    syncInfo.raiiDevice = info.raiiDevice;
    syncInfo.allocator = info.allocator;
    syncInfo.framesInFlight = config_.framesInFlight;
    syncInfo.initialCapacity = drawCapacity_.requiredCapacity(0, 0);
    syncInfo.timeoutNs = config_.fenceTimeoutNs;

    sync_ = FrameSynchronizer::create(syncInfo);
    if (!sync_) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "GPUCullingPipeline: Failed to create frame synchronizer");
        return false;
    }

    VisibilityCullPass::InitInfo passInfo{};
    passInfo.raiiDevice = info.raiiDevice;
    passInfo.allocator = info.allocator;
    passInfo.shaderPath = config_.shaderPath;
    passInfo.framesInFlight = sync_->frameCount();
    passInfo.workgroupSize = config_.workgroupSize;
    passInfo.maxWorkGroupCountX = info.deviceLimits.maxComputeWorkGroupCountX;
    passInfo.objectCapacity = config_.capacityPolicy();

    cullPass_ = VisibilityCullPass::create(passInfo);
    if (!cullPass_) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "GPUCullingPipeline: Failed to create visibility cull pass");
        return false;
    }

    SDL_Log("GPUCullingPipeline: Initialized (%u frames, capacity %u)",
            sync_->frameCount(), syncInfo.initialCapacity);
    return true;
}

FrameStatus GPUCullingPipeline::beginFrame() {
    FrameStatus status = sync_->beginFrame();
    if (status != FrameStatus::Ready) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "GPUCullingPipeline: beginFrame failed: %s", toString(status));
    }
    recordedObjectCount_ = 0;
    return status;
}

CullFrameResult GPUCullingPipeline::recordCulling(vk::CommandBuffer cmd,
                                                  const CullSnapshot& snapshot,
                                                  const glm::mat4& viewProj) {
    CullFrameResult result;
    result.objectCount = snapshot.size();

    if (!sync_->isFrameActive()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "GPUCullingPipeline: recordCulling called outside beginFrame/endFrame");
        return result;
    }

    // The slot is idle here, so its buffers may be replaced
    auto growth = sync_->prepareCapacity(snapshot.size(), drawCapacity_);

    const DrawCommandBuffer& commands = sync_->currentCommands();
    result.capacity = commands.capacity();

    Frustum frustum = Frustum::fromViewProjection(viewProj, depthRange_);

    auto culled = cullPass_->recordCulling(cmd, sync_->currentSlot(), snapshot, frustum,
                                           commands, executor_.requiresZeroFill());
    result.recorded = culled.has_value();
    if (!culled) {
        // Still draw nothing rather than the slot's previous output
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "GPUCullingPipeline: Culling dispatch not recorded, drawing an empty list");
        commands.recordReset(cmd, executor_.requiresZeroFill());
        recordedObjectCount_ = 0;
    } else {
        result.culledObjectCount = *culled;
        recordedObjectCount_ = *culled;
    }

    result.capacityExceeded = growth == DrawCommandBuffer::GrowResult::Failed ||
                              snapshot.size() > commands.capacity() ||
                              (result.recorded && result.culledObjectCount < snapshot.size());
    if (result.capacityExceeded) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
            "GPUCullingPipeline: %u objects exceed capacity (%u draw slots, %u culled), output will be clamped",
            snapshot.size(), commands.capacity(), result.culledObjectCount);
    }

    sync_->recordComputeToDrawBarrier(cmd);
    return result;
}

void GPUCullingPipeline::recordDraw(vk::CommandBuffer cmd) const {
    if (!sync_->isFrameActive()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "GPUCullingPipeline: recordDraw called outside beginFrame/endFrame");
        return;
    }
    executor_.record(cmd, sync_->currentCommands());
}

vk::SemaphoreSubmitInfo GPUCullingPipeline::endFrame(vk::PipelineStageFlags2 stageMask) {
    return sync_->endFrame(recordedObjectCount_, stageMask);
}

void GPUCullingPipeline::abortFrame() {
    sync_->abortFrame();
}

FrameStatus GPUCullingPipeline::waitIdle() {
    return sync_->waitIdle();
}
