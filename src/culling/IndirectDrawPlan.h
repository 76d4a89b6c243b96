#pragma once

#include <algorithm>
#include <cstdint>
#include <limits>

// Enabled device features and limits the culling pipeline depends on
struct CullDeviceLimits {
    bool hasDrawIndirectCount = false;          // VkPhysicalDeviceVulkan12Features::drawIndirectCount
    bool hasMultiDrawIndirect = false;          // VkPhysicalDeviceFeatures::multiDrawIndirect
    uint32_t maxDrawIndirectCount = 1;          // VkPhysicalDeviceLimits::maxDrawIndirectCount
    uint32_t maxComputeWorkGroupCountX = 65535; // VkPhysicalDeviceLimits::maxComputeWorkGroupCount[0]
};

enum class IndirectDrawMode {
    DrawIndirectCount,      // vkCmdDrawIndirectCount, count read from the counter block
    MultiDrawIndirect,      // One vkCmdDrawIndirect over the zero-filled array
    SingleDrawIndirect      // One vkCmdDrawIndirect per command, zero-filled array
};

inline const char* toString(IndirectDrawMode mode) {
    switch (mode) {
        case IndirectDrawMode::DrawIndirectCount: return "vkCmdDrawIndirectCount";
        case IndirectDrawMode::MultiDrawIndirect: return "vkCmdDrawIndirect (multi)";
        case IndirectDrawMode::SingleDrawIndirect: return "vkCmdDrawIndirect (per command)";
    }
    return "unknown";
}

/**
 * IndirectDrawPlan - how the compacted command array is drawn on this device
 *
 * Without multiDrawIndirect both vkCmdDrawIndirect and vkCmdDrawIndirectCount
 * are limited to a drawCount of 0 or 1, so only the per-command path is legal.
 * Otherwise every call is bounded by maxDrawIndirectCount, and draw command
 * storage must not grow past that bound or the tail would never be drawn.
 */
struct IndirectDrawPlan {
    IndirectDrawMode mode = IndirectDrawMode::SingleDrawIndirect;
    uint32_t maxDrawCount = 1;  // Largest drawCount a single indirect call may pass

    bool requiresZeroFill() const { return mode != IndirectDrawMode::DrawIndirectCount; }

    // drawCount (or maxDrawCount) for one call over an array of capacity commands
    uint32_t drawCountFor(uint32_t capacity) const { return std::min(capacity, maxDrawCount); }

    // Largest command array every entry of which can be drawn
    uint32_t capacityLimit() const {
        return mode == IndirectDrawMode::SingleDrawIndirect
            ? std::numeric_limits<uint32_t>::max()
            : maxDrawCount;
    }

    static IndirectDrawPlan select(const CullDeviceLimits& limits, bool preferDrawIndirectCount) {
        IndirectDrawPlan plan;
        if (!limits.hasMultiDrawIndirect) {
            plan.mode = IndirectDrawMode::SingleDrawIndirect;
            plan.maxDrawCount = 1;
            return plan;
        }

        plan.maxDrawCount = std::max(limits.maxDrawIndirectCount, 1u);
        plan.mode = limits.hasDrawIndirectCount && preferDrawIndirectCount
            ? IndirectDrawMode::DrawIndirectCount
            : IndirectDrawMode::MultiDrawIndirect;
        return plan;
    }
};

// Objects a single one-dimensional dispatch can cover
inline uint32_t maxDispatchObjects(uint32_t workgroupSize, uint32_t maxWorkGroupCountX) {
    uint64_t total = static_cast<uint64_t>(workgroupSize) * maxWorkGroupCountX;
    return static_cast<uint32_t>(std::min<uint64_t>(total, std::numeric_limits<uint32_t>::max()));
}
