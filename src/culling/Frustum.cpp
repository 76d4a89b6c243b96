#include "Frustum.h"

namespace {

glm::vec4 row(const glm::mat4& m, int r) {
    return glm::vec4(m[0][r], m[1][r], m[2][r], m[3][r]);
}

glm::vec4 normalizePlane(const glm::vec4& plane) {
    float len = glm::length(glm::vec3(plane));
    if (len > 0.0001f) {
        return plane / len;
    }
    return plane;
}

} // namespace

Frustum Frustum::fromViewProjection(const glm::mat4& viewProj, DepthRange depthRange) {
    const glm::vec4 r0 = row(viewProj, 0);
    const glm::vec4 r1 = row(viewProj, 1);
    const glm::vec4 r2 = row(viewProj, 2);
    const glm::vec4 r3 = row(viewProj, 3);

    Frustum frustum;
    frustum.planes[Left]   = r3 + r0;
    frustum.planes[Right]  = r3 - r0;
    frustum.planes[Bottom] = r3 + r1;
    frustum.planes[Top]    = r3 - r1;

    // Clip z >= 0 for [0,1] depth, z >= -w for [-1,1]
    frustum.planes[Near] = depthRange == DepthRange::ZeroToOne ? r2 : r3 + r2;
    frustum.planes[Far]  = r3 - r2;

    for (glm::vec4& plane : frustum.planes) {
        plane = normalizePlane(plane);
    }
    return frustum;
}

bool Frustum::containsPoint(const glm::vec3& point) const {
    for (const glm::vec4& plane : planes) {
        if (signedDistance(plane, point) < 0.0f) {
            return false;
        }
    }
    return true;
}
