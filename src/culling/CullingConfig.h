#pragma once

#include <cstdint>
#include <string>

#include "CapacityPolicy.h"

// Resource parameters for the culling pipeline
struct CullingConfig {
    uint32_t framesInFlight = 3;
    uint32_t initialCapacity = 1024;        // Draw commands per frame slot
    float growthFactor = 2.0f;
    uint32_t workgroupSize = 64;            // visibility_cull.comp local_size_x
    uint64_t fenceTimeoutNs = 5'000'000'000ull;
    std::string shaderPath = "shaders";     // Directory holding visibility_cull.comp.spv
    bool preferDrawIndirectCount = true;    // Fall back to zero-filled vkCmdDrawIndirect if false/unsupported

    CapacityPolicy capacityPolicy() const {
        CapacityPolicy policy;
        policy.initialCapacity = initialCapacity;
        policy.growthFactor = growthFactor;
        return policy;
    }

    // Clamp out-of-range values to usable ones, logging each correction.
    // Returns true if the config was already valid.
    bool validate();

    static CullingConfig defaults() { return CullingConfig{}; }

    // Missing keys keep their defaults; unreadable files or parse errors return defaults
    static CullingConfig loadFromJson(const std::string& jsonPath);
    static CullingConfig loadFromJsonString(const std::string& jsonString);
};
