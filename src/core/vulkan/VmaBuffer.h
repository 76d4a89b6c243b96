#pragma once

#include <vulkan/vulkan.hpp>
#include <vk_mem_alloc.h>
#include <SDL3/SDL_log.h>
#include <memory>

// ============================================================================
// VmaBufferDeleter - Deleter for VMA-allocated buffers
// ============================================================================

struct VmaBufferDeleter {
    VmaAllocator allocator = VK_NULL_HANDLE;
    VmaAllocation allocation = VK_NULL_HANDLE;

    using pointer = VkBuffer;

    void operator()(VkBuffer buffer) const noexcept {
        if (buffer != VK_NULL_HANDLE && allocator != VK_NULL_HANDLE) {
            vmaDestroyBuffer(allocator, buffer, allocation);
        }
    }
};

using UniqueVmaBuffer = std::unique_ptr<std::remove_pointer_t<VkBuffer>, VmaBufferDeleter>;

// ============================================================================
// VmaBuffer - RAII wrapper for VkBuffer + VmaAllocation
// ============================================================================
//
// Buffers created with VMA_ALLOCATION_CREATE_MAPPED_BIT stay persistently
// mapped; mappedData() returns the pointer. Host reads/writes of non-coherent
// memory must go through invalidate()/flush().
//
class VmaBuffer : public UniqueVmaBuffer {
public:
    using UniqueVmaBuffer::UniqueVmaBuffer;

    VmaBuffer() = default;

    VmaBuffer(UniqueVmaBuffer&& other, vk::DeviceSize size) noexcept
        : UniqueVmaBuffer(std::move(other)), size_(size) {}

    VmaBuffer(VmaBuffer&& other) noexcept
        : UniqueVmaBuffer(std::move(other)), size_(other.size_) {
        other.size_ = 0;
    }

    VmaBuffer& operator=(VmaBuffer&& other) noexcept {
        UniqueVmaBuffer::operator=(std::move(other));
        size_ = other.size_;
        other.size_ = 0;
        return *this;
    }

    static bool create(VmaAllocator allocator,
                       const vk::BufferCreateInfo& bufferInfo,
                       const VmaAllocationCreateInfo& allocInfo,
                       VmaBuffer& outBuffer) {
        VkBuffer buffer = VK_NULL_HANDLE;
        VmaAllocation allocation = VK_NULL_HANDLE;

        VkResult vkResult = vmaCreateBuffer(allocator,
            reinterpret_cast<const VkBufferCreateInfo*>(&bufferInfo),
            &allocInfo, &buffer, &allocation, nullptr);
        if (vkResult != VK_SUCCESS) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                "VmaBuffer::create failed: %d (size %llu)", vkResult,
                static_cast<unsigned long long>(bufferInfo.size));
            return false;
        }

        outBuffer = VmaBuffer(UniqueVmaBuffer(buffer, {allocator, allocation}), bufferInfo.size);
        return true;
    }

    VmaAllocator allocator() const { return get_deleter().allocator; }
    VmaAllocation getAllocation() const { return get_deleter().allocation; }
    vk::DeviceSize size() const { return size_; }

    vk::Buffer buffer() const { return vk::Buffer(get()); }

    // Persistent mapping (nullptr if the allocation was not created mapped)
    void* mappedData() const {
        if (allocator() == VK_NULL_HANDLE || getAllocation() == VK_NULL_HANDLE) {
            return nullptr;
        }
        VmaAllocationInfo info{};
        vmaGetAllocationInfo(allocator(), getAllocation(), &info);
        return info.pMappedData;
    }

    // Make host writes visible to the device (no-op for coherent memory)
    bool flush(vk::DeviceSize offset = 0, vk::DeviceSize size = VK_WHOLE_SIZE) const {
        return vmaFlushAllocation(allocator(), getAllocation(), offset, size) == VK_SUCCESS;
    }

    // Make device writes visible to the host (no-op for coherent memory)
    bool invalidate(vk::DeviceSize offset = 0, vk::DeviceSize size = VK_WHOLE_SIZE) const {
        return vmaInvalidateAllocation(allocator(), getAllocation(), offset, size) == VK_SUCCESS;
    }

private:
    vk::DeviceSize size_ = 0;
};
