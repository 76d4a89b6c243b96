#pragma once

#include <glm/glm.hpp>
#include <cstdint>

// Axis-aligned bounding box in world space
struct CullAABB {
    glm::vec3 min{0.0f};
    glm::vec3 max{0.0f};

    glm::vec3 getCenter() const { return (min + max) * 0.5f; }
    glm::vec3 getHalfExtent() const { return (max - min) * 0.5f; }

    // min <= max on every axis (a point is valid)
    bool isValid() const {
        return min.x <= max.x && min.y <= max.y && min.z <= max.z;
    }
};

// Non-indexed draw parameters for one renderable
struct DrawParams {
    uint32_t vertexCount = 0;
    uint32_t instanceCount = 1;
    uint32_t firstVertex = 0;
    uint32_t firstInstance = 0;
};

// Per-object data for the visibility compute stage
// Must match CullObject in visibility_cull.comp
struct alignas(16) GPUCullObject {
    glm::vec4 aabbMin;          // xyz = min corner (world space), w = unused
    glm::vec4 aabbMax;          // xyz = max corner (world space), w = unused
    uint32_t vertexCount;
    uint32_t instanceCount;
    uint32_t firstVertex;
    uint32_t firstInstance;
};
static_assert(sizeof(GPUCullObject) == 48, "GPUCullObject size mismatch with shader");

// Indirect draw command (matches VkDrawIndirectCommand)
struct GPUDrawCommand {
    uint32_t vertexCount;
    uint32_t instanceCount;
    uint32_t firstVertex;
    uint32_t firstInstance;
};
static_assert(sizeof(GPUDrawCommand) == 16, "GPUDrawCommand size mismatch");

// Counter block written by the compute stage
// drawCount is the indirect count; requestedCount includes reservations past capacity
struct GPUCullCounters {
    uint32_t drawCount;
    uint32_t requestedCount;
};
static_assert(sizeof(GPUCullCounters) == 8, "GPUCullCounters size mismatch");

// Visibility cull uniforms (std140, matches shader block)
struct alignas(16) VisibilityCullUniforms {
    glm::vec4 frustumPlanes[6];     // xyz = unit normal, w = distance
    uint32_t objectCount;
    uint32_t capacity;
    uint32_t pad0;
    uint32_t pad1;
};
static_assert(sizeof(VisibilityCullUniforms) == 112, "VisibilityCullUniforms size mismatch");

inline GPUCullObject makeCullObject(const CullAABB& bounds, const DrawParams& params) {
    GPUCullObject obj{};
    obj.aabbMin = glm::vec4(bounds.min, 0.0f);
    obj.aabbMax = glm::vec4(bounds.max, 0.0f);
    obj.vertexCount = params.vertexCount;
    obj.instanceCount = params.instanceCount;
    obj.firstVertex = params.firstVertex;
    obj.firstInstance = params.firstInstance;
    return obj;
}

inline GPUDrawCommand makeDrawCommand(const GPUCullObject& obj) {
    return GPUDrawCommand{obj.vertexCount, obj.instanceCount, obj.firstVertex, obj.firstInstance};
}

// Per-dispatch statistics
struct CullingStats {
    uint32_t totalObjects = 0;
    uint32_t visibleObjects = 0;     // Commands written (== drawCount)
    uint32_t requestedObjects = 0;   // Objects that passed the test
    uint32_t capacity = 0;

    bool overflowed() const { return requestedObjects > capacity; }
};
