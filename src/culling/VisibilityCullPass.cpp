#include "VisibilityCullPass.h"
#include "BoundingVolumeRegistry.h"
#include "DrawCommandBuffer.h"
#include "Frustum.h"
#include "IndirectDrawPlan.h"
#include "core/vulkan/VmaBufferFactory.h"
#include "core/vulkan/BarrierHelpers.h"
#include "core/vulkan/DescriptorSetLayoutBuilder.h"
#include "core/vulkan/PipelineLayoutBuilder.h"
#include "core/pipeline/ComputePipelineBuilder.h"
#include "shaders/bindings.h"
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <array>
#include <cstring>

std::unique_ptr<VisibilityCullPass> VisibilityCullPass::create(const InitInfo& info) {
    auto pass = std::make_unique<VisibilityCullPass>(ConstructToken{});
    if (!pass->initInternal(info)) {
        return nullptr;
    }
    return pass;
}

bool VisibilityCullPass::initInternal(const InitInfo& info) {
    raiiDevice_ = info.raiiDevice;
    allocator_ = info.allocator;
    shaderPath_ = info.shaderPath;
    framesInFlight_ = info.framesInFlight;
    workgroupSize_ = info.workgroupSize;
    maxWorkGroupCountX_ = info.maxWorkGroupCountX;
    objectCapacity_ = info.objectCapacity;

    if (!raiiDevice_) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "VisibilityCullPass requires raiiDevice");
        return false;
    }
    if (framesInFlight_ == 0 || workgroupSize_ == 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "VisibilityCullPass: Invalid frames in flight (%u) or workgroup size (%u)",
            framesInFlight_, workgroupSize_);
        return false;
    }

    if (!createPipeline()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "VisibilityCullPass: Failed to create pipeline");
        return false;
    }

    if (!createDescriptorPool()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "VisibilityCullPass: Failed to create descriptor pool");
        return false;
    }

    if (!createSlotResources()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "VisibilityCullPass: Failed to create frame resources");
        return false;
    }

    SDL_Log("VisibilityCullPass: Initialized with %u frames, workgroup size %u",
            framesInFlight_, workgroupSize_);
    return true;
}

bool VisibilityCullPass::createPipeline() {
    constexpr auto compute = vk::ShaderStageFlagBits::eCompute;

    if (!DescriptorSetLayoutBuilder()
            .addBinding(BindingBuilder::uniformBuffer(Bindings::VISIBILITY_CULL_UNIFORMS, compute))
            .addBinding(BindingBuilder::storageBuffer(Bindings::VISIBILITY_CULL_OBJECTS, compute))
            .addBinding(BindingBuilder::storageBuffer(Bindings::VISIBILITY_CULL_COMMANDS, compute))
            .addBinding(BindingBuilder::storageBuffer(Bindings::VISIBILITY_CULL_COUNTER, compute))
            .buildInto(*raiiDevice_, descSetLayout_)) {
        return false;
    }

    // No push constants
    if (!PipelineLayoutBuilder(*raiiDevice_)
            .addDescriptorSetLayout(**descSetLayout_)
            .buildInto(pipelineLayout_)) {
        return false;
    }

    return ComputePipelineBuilder(*raiiDevice_)
        .setShader(shaderPath_ + "/visibility_cull.comp.spv")
        .setPipelineLayout(**pipelineLayout_)
        .addSpecConstant(Bindings::VISIBILITY_CULL_WORKGROUP_SIZE_SPEC, workgroupSize_)
        .buildInto(pipeline_);
}

bool VisibilityCullPass::createDescriptorPool() {
    std::array<vk::DescriptorPoolSize, 2> poolSizes = {{
        vk::DescriptorPoolSize{}
            .setType(vk::DescriptorType::eUniformBuffer)
            .setDescriptorCount(framesInFlight_),
        vk::DescriptorPoolSize{}
            .setType(vk::DescriptorType::eStorageBuffer)
            .setDescriptorCount(framesInFlight_ * 3)
    }};

    auto poolInfo = vk::DescriptorPoolCreateInfo{}
        .setMaxSets(framesInFlight_)
        .setPoolSizes(poolSizes);

    try {
        descriptorPool_.emplace(*raiiDevice_, poolInfo);
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "VisibilityCullPass: vkCreateDescriptorPool failed: %s", e.what());
        return false;
    }
    return true;
}

bool VisibilityCullPass::createSlotResources() {
    std::vector<vk::DescriptorSetLayout> layouts(framesInFlight_, **descSetLayout_);
    auto allocInfo = vk::DescriptorSetAllocateInfo{}
        .setDescriptorPool(**descriptorPool_)
        .setSetLayouts(layouts);

    // Sets are released together with the pool
    std::vector<vk::DescriptorSet> sets;
    try {
        sets = vk::Device(**raiiDevice_).allocateDescriptorSets(allocInfo);
    } catch (const vk::SystemError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "VisibilityCullPass: Failed to allocate descriptor sets: %s", e.what());
        return false;
    }

    slots_.resize(framesInFlight_);
    for (uint32_t i = 0; i < framesInFlight_; ++i) {
        SlotResources& slot = slots_[i];
        slot.descriptorSet = sets[i];

        if (!VmaBufferFactory::createUniformBuffer(allocator_, sizeof(VisibilityCullUniforms), slot.uniforms)) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                "VisibilityCullPass: Failed to create uniform buffer for slot %u", i);
            return false;
        }

        // Start at the initial capacity so the binding is valid with zero objects
        if (!ensureObjectCapacity(slot, objectCapacity_.initialCapacity)) {
            return false;
        }
    }

    return true;
}

bool VisibilityCullPass::ensureObjectCapacity(SlotResources& slot, uint32_t objectCount) {
    if (slot.objects && !objectCapacity_.needsGrowth(slot.objectCapacity, objectCount)) {
        return true;
    }

    uint32_t newCapacity = objectCapacity_.requiredCapacity(slot.objectCapacity, objectCount);
    VmaBuffer objects;
    if (!VmaBufferFactory::createStorageBufferHostWritable(
            allocator_, static_cast<vk::DeviceSize>(newCapacity) * sizeof(GPUCullObject), objects)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "VisibilityCullPass: Failed to allocate object buffer for %u objects", newCapacity);
        return false;
    }

    if (slot.objects) {
        SDL_Log("VisibilityCullPass: Grew object buffer %u -> %u", slot.objectCapacity, newCapacity);
    }

    slot.objects = std::move(objects);
    slot.objectCapacity = newCapacity;
    return true;
}

bool VisibilityCullPass::uploadObjects(SlotResources& slot, const CullSnapshot& snapshot, uint32_t objectCount) {
    if (objectCount == 0) {
        return true;
    }

    void* mapped = slot.objects.mappedData();
    if (!mapped) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "VisibilityCullPass: Object buffer is not mapped");
        return false;
    }

    vk::DeviceSize bytes = static_cast<vk::DeviceSize>(objectCount) * sizeof(GPUCullObject);
    std::memcpy(mapped, snapshot.objects.data(), static_cast<size_t>(bytes));
    return slot.objects.flush(0, bytes);
}

bool VisibilityCullPass::writeUniforms(SlotResources& slot, const Frustum& frustum,
                                       uint32_t objectCount, uint32_t capacity) {
    void* mapped = slot.uniforms.mappedData();
    if (!mapped) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "VisibilityCullPass: Uniform buffer is not mapped");
        return false;
    }

    VisibilityCullUniforms uniforms{};
    for (uint32_t i = 0; i < Frustum::Count; ++i) {
        uniforms.frustumPlanes[i] = frustum.planes[i];
    }
    uniforms.objectCount = objectCount;
    uniforms.capacity = capacity;

    std::memcpy(mapped, &uniforms, sizeof(VisibilityCullUniforms));
    return slot.uniforms.flush(0, sizeof(VisibilityCullUniforms));
}

void VisibilityCullPass::updateDescriptorSet(const SlotResources& slot, const DrawCommandBuffer& output) {
    std::array<vk::DescriptorBufferInfo, 4> bufferInfos = {{
        {slot.uniforms.buffer(), 0, sizeof(VisibilityCullUniforms)},
        {slot.objects.buffer(), 0, VK_WHOLE_SIZE},
        {output.getCommandBuffer(), 0, VK_WHOLE_SIZE},
        {output.getCounterBuffer(), 0, sizeof(GPUCullCounters)}
    }};

    std::array<vk::WriteDescriptorSet, 4> writes = {{
        vk::WriteDescriptorSet{}
            .setDstSet(slot.descriptorSet)
            .setDstBinding(Bindings::VISIBILITY_CULL_UNIFORMS)
            .setDescriptorType(vk::DescriptorType::eUniformBuffer)
            .setDescriptorCount(1)
            .setPBufferInfo(&bufferInfos[0]),
        vk::WriteDescriptorSet{}
            .setDstSet(slot.descriptorSet)
            .setDstBinding(Bindings::VISIBILITY_CULL_OBJECTS)
            .setDescriptorType(vk::DescriptorType::eStorageBuffer)
            .setDescriptorCount(1)
            .setPBufferInfo(&bufferInfos[1]),
        vk::WriteDescriptorSet{}
            .setDstSet(slot.descriptorSet)
            .setDstBinding(Bindings::VISIBILITY_CULL_COMMANDS)
            .setDescriptorType(vk::DescriptorType::eStorageBuffer)
            .setDescriptorCount(1)
            .setPBufferInfo(&bufferInfos[2]),
        vk::WriteDescriptorSet{}
            .setDstSet(slot.descriptorSet)
            .setDstBinding(Bindings::VISIBILITY_CULL_COUNTER)
            .setDescriptorType(vk::DescriptorType::eStorageBuffer)
            .setDescriptorCount(1)
            .setPBufferInfo(&bufferInfos[3])
    }};

    raiiDevice_->updateDescriptorSets(writes, nullptr);
}

std::optional<uint32_t> VisibilityCullPass::recordCulling(vk::CommandBuffer cmd,
                                                          uint32_t frameSlot,
                                                          const CullSnapshot& snapshot,
                                                          const Frustum& frustum,
                                                          const DrawCommandBuffer& output,
                                                          bool zeroCommands) {
    if (frameSlot >= framesInFlight_) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "VisibilityCullPass::recordCulling: Invalid frame slot %u (max %u)", frameSlot, framesInFlight_);
        return std::nullopt;
    }

    SlotResources& slot = slots_[frameSlot];

    // A failed growth keeps the previous buffer, so cull what still fits
    if (!ensureObjectCapacity(slot, snapshot.size()) && !slot.objects) {
        return std::nullopt;
    }

    uint32_t objectCount = std::min({snapshot.size(), slot.objectCapacity,
                                     maxDispatchObjects(workgroupSize_, maxWorkGroupCountX_)});
    if (objectCount < snapshot.size()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
            "VisibilityCullPass: Culling %u of %u objects (object capacity %u, dispatch limit %u groups)",
            objectCount, snapshot.size(), slot.objectCapacity, maxWorkGroupCountX_);
    }

    if (!uploadObjects(slot, snapshot, objectCount)) {
        return std::nullopt;
    }

    if (!writeUniforms(slot, frustum, objectCount, output.capacity())) {
        return std::nullopt;
    }
    updateDescriptorSet(slot, output);

    // The counters are reset even when nothing is dispatched
    output.recordReset(cmd, zeroCommands);
    BarrierHelpers::fillBufferToCompute(cmd, output.getCommandBuffer(), output.getCounterBuffer());

    if (objectCount == 0) {
        return objectCount;
    }

    uint32_t groupCount = (objectCount + workgroupSize_ - 1) / workgroupSize_;
    cmd.bindPipeline(vk::PipelineBindPoint::eCompute, **pipeline_);
    cmd.bindDescriptorSets(vk::PipelineBindPoint::eCompute,
                           **pipelineLayout_, 0, slot.descriptorSet, {});
    cmd.dispatch(groupCount, 1, 1);
    return objectCount;
}
