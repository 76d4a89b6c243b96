#pragma once

#include <glm/glm.hpp>
#include <array>

#include "CullTypes.h"

// Clip-space depth convention of the projection the planes are extracted from
enum class DepthRange {
    ZeroToOne,          // Vulkan / D3D
    NegativeOneToOne    // OpenGL
};

/**
 * Frustum - six planes in world space
 *
 * Plane order: left, right, bottom, top, near, far.
 * Each plane is (nx, ny, nz, d) with a unit normal pointing into the frustum,
 * so a point p is inside the half-space when dot(n, p) + d >= 0.
 */
struct Frustum {
    enum Side : uint32_t {
        Left = 0,
        Right,
        Bottom,
        Top,
        Near,
        Far,
        Count
    };

    std::array<glm::vec4, Count> planes{};

    // Gribb-Hartmann extraction from a column-major view-projection matrix.
    // viewProj must be invertible; this is not checked.
    static Frustum fromViewProjection(const glm::mat4& viewProj,
                                      DepthRange depthRange = DepthRange::ZeroToOne);

    // Signed distance from the plane to a point (world units for normalized planes)
    static float signedDistance(const glm::vec4& plane, const glm::vec3& point) {
        return glm::dot(glm::vec3(plane), point) + plane.w;
    }

    bool containsPoint(const glm::vec3& point) const;

    // Conservative box test, identical to visibility_cull.comp.
    // Never rejects a box that overlaps the frustum; may accept boxes near
    // frustum corners that are actually outside.
    bool isAABBVisible(const glm::vec3& aabbMin, const glm::vec3& aabbMax) const {
        glm::vec3 center = (aabbMin + aabbMax) * 0.5f;
        glm::vec3 halfExtent = (aabbMax - aabbMin) * 0.5f;

        for (const glm::vec4& plane : planes) {
            glm::vec3 normal(plane);
            float r = glm::dot(halfExtent, glm::abs(normal));
            float d = glm::dot(center, normal) + plane.w;
            if (d < -r) {
                return false;
            }
        }
        return true;
    }

    bool isAABBVisible(const CullAABB& box) const {
        return isAABBVisible(box.min, box.max);
    }
};
