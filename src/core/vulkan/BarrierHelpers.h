#pragma once

#include <vulkan/vulkan.hpp>
#include <array>

/**
 * BarrierHelpers - Pipeline barrier patterns for the culling pipeline
 *
 * They operate on vk::CommandBuffer (vulkan-hpp wrapper).
 *
 * Frame order:
 *   fillBuffer(counters)             transfer write
 *   fillBufferToCompute(...)         transfer  -> compute read/write
 *   dispatch                         shader write
 *   computeToIndirectDraw(...)       compute   -> draw indirect read
 *   drawIndirectCount
 */
namespace BarrierHelpers {

inline vk::BufferMemoryBarrier wholeBufferBarrier(vk::Buffer buffer,
                                                  vk::AccessFlags srcAccess,
                                                  vk::AccessFlags dstAccess) {
    return vk::BufferMemoryBarrier{}
        .setSrcAccessMask(srcAccess)
        .setDstAccessMask(dstAccess)
        .setSrcQueueFamilyIndex(VK_QUEUE_FAMILY_IGNORED)
        .setDstQueueFamilyIndex(VK_QUEUE_FAMILY_IGNORED)
        .setBuffer(buffer)
        .setOffset(0)
        .setSize(VK_WHOLE_SIZE);
}

/**
 * Barrier after vkCmdFillBuffer resets before the compute dispatch touches
 * the same buffers (atomics read and write the counters)
 */
inline void fillBufferToCompute(vk::CommandBuffer cmd, vk::Buffer commandBuffer, vk::Buffer counterBuffer) {
    std::array<vk::BufferMemoryBarrier, 2> barriers = {{
        wholeBufferBarrier(commandBuffer,
            vk::AccessFlagBits::eTransferWrite,
            vk::AccessFlagBits::eShaderWrite),
        wholeBufferBarrier(counterBuffer,
            vk::AccessFlagBits::eTransferWrite,
            vk::AccessFlagBits::eShaderRead | vk::AccessFlagBits::eShaderWrite)
    }};

    cmd.pipelineBarrier(
        vk::PipelineStageFlagBits::eTransfer,
        vk::PipelineStageFlagBits::eComputeShader,
        {}, {}, barriers, {});
}

/**
 * Barrier after compute writes before the indirect draw reads commands and count.
 * Also covers the transfer stage for the zero-commands case where the
 * dispatch is skipped and only the reset wrote the buffers.
 */
inline void computeToIndirectDraw(vk::CommandBuffer cmd, vk::Buffer commandBuffer, vk::Buffer counterBuffer) {
    std::array<vk::BufferMemoryBarrier, 2> barriers = {{
        wholeBufferBarrier(commandBuffer,
            vk::AccessFlagBits::eShaderWrite | vk::AccessFlagBits::eTransferWrite,
            vk::AccessFlagBits::eIndirectCommandRead),
        wholeBufferBarrier(counterBuffer,
            vk::AccessFlagBits::eShaderWrite | vk::AccessFlagBits::eTransferWrite,
            vk::AccessFlagBits::eIndirectCommandRead)
    }};

    cmd.pipelineBarrier(
        vk::PipelineStageFlagBits::eComputeShader | vk::PipelineStageFlagBits::eTransfer,
        vk::PipelineStageFlagBits::eDrawIndirect,
        {}, {}, barriers, {});
}

/**
 * Make device writes to the counters available to host reads once the
 * frame's completion has been observed
 */
inline void computeToHost(vk::CommandBuffer cmd, vk::Buffer counterBuffer) {
    auto barrier = wholeBufferBarrier(counterBuffer,
        vk::AccessFlagBits::eShaderWrite | vk::AccessFlagBits::eTransferWrite,
        vk::AccessFlagBits::eHostRead);

    cmd.pipelineBarrier(
        vk::PipelineStageFlagBits::eComputeShader | vk::PipelineStageFlagBits::eTransfer,
        vk::PipelineStageFlagBits::eHost,
        {}, {}, barrier, {});
}

} // namespace BarrierHelpers
