#pragma once

#include "VmaBuffer.h"

// ============================================================================
// Buffer Builder - Fluent API for creating VMA buffers
// ============================================================================

class BufferBuilder {
public:
    explicit BufferBuilder(VmaAllocator allocator)
        : allocator_(allocator) {
        allocInfo_.usage = VMA_MEMORY_USAGE_AUTO;
    }

    BufferBuilder& setSize(vk::DeviceSize size) {
        bufferInfo_.setSize(size);
        return *this;
    }

    // Usage flags
    BufferBuilder& asUniform() {
        bufferInfo_.setUsage(bufferInfo_.usage | vk::BufferUsageFlagBits::eUniformBuffer);
        return *this;
    }

    BufferBuilder& asStorage() {
        bufferInfo_.setUsage(bufferInfo_.usage | vk::BufferUsageFlagBits::eStorageBuffer);
        return *this;
    }

    BufferBuilder& asIndirect() {
        bufferInfo_.setUsage(bufferInfo_.usage | vk::BufferUsageFlagBits::eIndirectBuffer);
        return *this;
    }

    BufferBuilder& asTransferDst() {
        bufferInfo_.setUsage(bufferInfo_.usage | vk::BufferUsageFlagBits::eTransferDst);
        return *this;
    }

    // Memory access patterns
    BufferBuilder& hostVisible() {
        allocInfo_.flags |= VMA_ALLOCATION_CREATE_HOST_ACCESS_SEQUENTIAL_WRITE_BIT |
                           VMA_ALLOCATION_CREATE_MAPPED_BIT;
        return *this;
    }

    BufferBuilder& hostReadable() {
        allocInfo_.flags |= VMA_ALLOCATION_CREATE_HOST_ACCESS_RANDOM_BIT |
                           VMA_ALLOCATION_CREATE_MAPPED_BIT;
        return *this;
    }

    BufferBuilder& deviceLocal() {
        allocInfo_.requiredFlags = VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT;
        return *this;
    }

    bool build(VmaBuffer& outBuffer) const {
        auto info = bufferInfo_;
        info.setSharingMode(vk::SharingMode::eExclusive);
        return VmaBuffer::create(allocator_, info, allocInfo_, outBuffer);
    }

private:
    VmaAllocator allocator_;
    vk::BufferCreateInfo bufferInfo_{};
    VmaAllocationCreateInfo allocInfo_{};
};

// ============================================================================
// Buffer Factory - Convenience functions for the culling pipeline's buffers
// ============================================================================

namespace VmaBufferFactory {

inline bool createUniformBuffer(VmaAllocator allocator, vk::DeviceSize size, VmaBuffer& outBuffer) {
    return BufferBuilder(allocator).setSize(size).asUniform().hostVisible().build(outBuffer);
}

inline bool createStorageBufferHostWritable(VmaAllocator allocator, vk::DeviceSize size, VmaBuffer& outBuffer) {
    return BufferBuilder(allocator).setSize(size).asStorage().hostVisible().build(outBuffer);
}

// Compute-written, indirect-read command storage
inline bool createIndirectBuffer(VmaAllocator allocator, vk::DeviceSize size, VmaBuffer& outBuffer) {
    return BufferBuilder(allocator).setSize(size).asIndirect().asStorage().asTransferDst().deviceLocal().build(outBuffer);
}

// Compute-written counters, read by the indirect count and by the host for statistics
inline bool createIndirectCountBuffer(VmaAllocator allocator, vk::DeviceSize size, VmaBuffer& outBuffer) {
    return BufferBuilder(allocator).setSize(size).asIndirect().asStorage().asTransferDst().hostReadable().build(outBuffer);
}

} // namespace VmaBufferFactory
