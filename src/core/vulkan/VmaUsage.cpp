// Vulkan Memory Allocator implementation unit
#define VMA_IMPLEMENTATION
#include <vk_mem_alloc.h>
