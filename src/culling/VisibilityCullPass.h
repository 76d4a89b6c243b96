#pragma once

#include <vulkan/vulkan.hpp>
#include <vulkan/vulkan_raii.hpp>
#include <vk_mem_alloc.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "CapacityPolicy.h"
#include "CullTypes.h"
#include "core/FrameBuffered.h"
#include "core/vulkan/VmaBuffer.h"

struct CullSnapshot;
struct Frustum;
class DrawCommandBuffer;

/**
 * VisibilityCullPass - compute stage of the culling pipeline
 *
 * Uploads a registry snapshot, tests every AABB against the frustum in
 * visibility_cull.comp and compacts survivors into a DrawCommandBuffer.
 *
 * Per frame slot it owns the uniform buffer, the object upload buffer and
 * the descriptor set, so a slot can be recorded while others are in flight.
 * Callers must only pass a slot the FrameSynchronizer has acquired.
 *
 * Usage:
 *   1. create() - Factory method to initialize
 *   2. recordCulling() - Upload, reset counters, dispatch
 *   3. Barrier + indirect draw from the DrawCommandBuffer
 */
class VisibilityCullPass {
public:
    // Passkey for controlled construction
    struct ConstructToken { explicit ConstructToken() = default; };
    explicit VisibilityCullPass(ConstructToken) {}

    struct InitInfo {
        const vk::raii::Device* raiiDevice = nullptr;
        VmaAllocator allocator = VK_NULL_HANDLE;
        std::string shaderPath;
        uint32_t framesInFlight = 3;
        uint32_t workgroupSize = 64;
        uint32_t maxWorkGroupCountX = 65535;    // VkPhysicalDeviceLimits::maxComputeWorkGroupCount[0]
        CapacityPolicy objectCapacity;          // Growth of the object upload buffers
    };

    static std::unique_ptr<VisibilityCullPass> create(const InitInfo& info);

    ~VisibilityCullPass() = default;

    // Non-copyable, non-movable
    VisibilityCullPass(const VisibilityCullPass&) = delete;
    VisibilityCullPass& operator=(const VisibilityCullPass&) = delete;
    VisibilityCullPass(VisibilityCullPass&&) = delete;
    VisibilityCullPass& operator=(VisibilityCullPass&&) = delete;

    /**
     * Record the counter reset and the culling dispatch into cmd.
     * With zero objects the counters are still reset and no dispatch is recorded.
     * zeroCommands also clears the whole command array (vkCmdDrawIndirect fallback).
     * Does not record the compute -> indirect barrier.
     *
     * Only the first N snapshot objects are culled when the object buffer cannot
     * grow or the dispatch would exceed maxWorkGroupCountX.
     * @return number of objects culled, or nullopt if nothing could be uploaded
     */
    std::optional<uint32_t> recordCulling(vk::CommandBuffer cmd,
                       uint32_t frameSlot,
                       const CullSnapshot& snapshot,
                       const Frustum& frustum,
                       const DrawCommandBuffer& output,
                       bool zeroCommands);

    uint32_t getWorkgroupSize() const { return workgroupSize_; }
    uint32_t getObjectCapacity(uint32_t frameSlot) const { return slots_[frameSlot].objectCapacity; }

private:
    struct SlotResources {
        VmaBuffer uniforms;
        VmaBuffer objects;
        uint32_t objectCapacity = 0;
        vk::DescriptorSet descriptorSet;
    };

    bool initInternal(const InitInfo& info);

    bool createPipeline();
    bool createDescriptorPool();
    bool createSlotResources();

    bool ensureObjectCapacity(SlotResources& slot, uint32_t objectCount);
    bool uploadObjects(SlotResources& slot, const CullSnapshot& snapshot, uint32_t objectCount);
    bool writeUniforms(SlotResources& slot, const Frustum& frustum,
                       uint32_t objectCount, uint32_t capacity);
    void updateDescriptorSet(const SlotResources& slot, const DrawCommandBuffer& output);

    const vk::raii::Device* raiiDevice_ = nullptr;
    VmaAllocator allocator_ = VK_NULL_HANDLE;
    std::string shaderPath_;
    uint32_t framesInFlight_ = 0;
    uint32_t workgroupSize_ = 64;
    uint32_t maxWorkGroupCountX_ = 65535;
    CapacityPolicy objectCapacity_;

    // Compute pipeline
    std::optional<vk::raii::DescriptorSetLayout> descSetLayout_;
    std::optional<vk::raii::PipelineLayout> pipelineLayout_;
    std::optional<vk::raii::Pipeline> pipeline_;
    std::optional<vk::raii::DescriptorPool> descriptorPool_;

    FrameBuffered<SlotResources> slots_;
};
