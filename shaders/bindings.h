// Single source of truth for shader bindings
// This file is designed to be included by both C++ and GLSL code
// C++: #include "shaders/bindings.h"
// GLSL: #include "bindings.h"

#ifndef BINDINGS_H
#define BINDINGS_H

// =============================================================================
// Visibility Cull Compute Descriptor Set (Set 0)
// =============================================================================

#define BINDING_VISIBILITY_CULL_UNIFORMS   0   // VisibilityCullUniforms (frustum planes, counts)
#define BINDING_VISIBILITY_CULL_OBJECTS    1   // Cull objects (bounds + draw params), read-only
#define BINDING_VISIBILITY_CULL_COMMANDS   2   // Compacted draw commands (VkDrawIndirectCommand)
#define BINDING_VISIBILITY_CULL_COUNTER    3   // Counter block: drawCount, requestedCount

// Specialization constants
#define SPEC_VISIBILITY_CULL_WORKGROUP_SIZE 0  // local_size_x

#ifdef __cplusplus

#include <cstdint>

namespace Bindings {

constexpr uint32_t VISIBILITY_CULL_UNIFORMS = BINDING_VISIBILITY_CULL_UNIFORMS;
constexpr uint32_t VISIBILITY_CULL_OBJECTS  = BINDING_VISIBILITY_CULL_OBJECTS;
constexpr uint32_t VISIBILITY_CULL_COMMANDS = BINDING_VISIBILITY_CULL_COMMANDS;
constexpr uint32_t VISIBILITY_CULL_COUNTER  = BINDING_VISIBILITY_CULL_COUNTER;

constexpr uint32_t VISIBILITY_CULL_WORKGROUP_SIZE_SPEC = SPEC_VISIBILITY_CULL_WORKGROUP_SIZE;

} // namespace Bindings

#endif // __cplusplus

#endif // BINDINGS_H
