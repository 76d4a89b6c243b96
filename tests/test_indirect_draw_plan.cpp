#include <doctest/doctest.h>
#include <limits>

#include "culling/CapacityPolicy.h"
#include "culling/IndirectDrawPlan.h"

static CullDeviceLimits makeLimits(bool drawIndirectCount, bool multiDrawIndirect, uint32_t maxDrawIndirectCount) {
    CullDeviceLimits limits;
    limits.hasDrawIndirectCount = drawIndirectCount;
    limits.hasMultiDrawIndirect = multiDrawIndirect;
    limits.maxDrawIndirectCount = maxDrawIndirectCount;
    return limits;
}

TEST_SUITE("IndirectDrawPlan") {
    TEST_CASE("draw indirect count with multi draw") {
        IndirectDrawPlan plan = IndirectDrawPlan::select(makeLimits(true, true, 1u << 20), true);
        CHECK(plan.mode == IndirectDrawMode::DrawIndirectCount);
        CHECK_FALSE(plan.requiresZeroFill());
        CHECK(plan.maxDrawCount == (1u << 20));
        CHECK(plan.drawCountFor(1024) == 1024);
    }

    TEST_CASE("draw indirect count without multi draw falls back to per-command draws") {
        IndirectDrawPlan plan = IndirectDrawPlan::select(makeLimits(true, false, 1), true);
        CHECK(plan.mode == IndirectDrawMode::SingleDrawIndirect);
        CHECK(plan.requiresZeroFill());
        CHECK(plan.maxDrawCount == 1);
        CHECK(plan.drawCountFor(1024) == 1);
        CHECK(plan.capacityLimit() == std::numeric_limits<uint32_t>::max());
    }

    TEST_CASE("no indirect count uses a zero-filled multi draw") {
        IndirectDrawPlan plan = IndirectDrawPlan::select(makeLimits(false, true, 65535), true);
        CHECK(plan.mode == IndirectDrawMode::MultiDrawIndirect);
        CHECK(plan.requiresZeroFill());
        CHECK(plan.drawCountFor(1024) == 1024);
    }

    TEST_CASE("preference can disable indirect count") {
        IndirectDrawPlan plan = IndirectDrawPlan::select(makeLimits(true, true, 65535), false);
        CHECK(plan.mode == IndirectDrawMode::MultiDrawIndirect);
    }

    TEST_CASE("neither feature") {
        IndirectDrawPlan plan = IndirectDrawPlan::select(makeLimits(false, false, 1), true);
        CHECK(plan.mode == IndirectDrawMode::SingleDrawIndirect);
        CHECK(plan.requiresZeroFill());
    }

    TEST_CASE("maxDrawCount never exceeds maxDrawIndirectCount") {
        IndirectDrawPlan plan = IndirectDrawPlan::select(makeLimits(true, true, 4096), true);
        CHECK(plan.drawCountFor(1024) == 1024);
        CHECK(plan.drawCountFor(4096) == 4096);
        CHECK(plan.drawCountFor(8192) == 4096);
        CHECK(plan.capacityLimit() == 4096);
    }

    TEST_CASE("zero maxDrawIndirectCount is treated as one") {
        IndirectDrawPlan plan = IndirectDrawPlan::select(makeLimits(true, true, 0), true);
        CHECK(plan.maxDrawCount == 1);
    }

    TEST_CASE("draw capacity growth stops at the draw limit") {
        IndirectDrawPlan plan = IndirectDrawPlan::select(makeLimits(true, true, 4096), true);
        CapacityPolicy policy;
        policy.maxCapacity = plan.capacityLimit();

        uint32_t capacity = policy.requiredCapacity(1024, 100'000);
        CHECK(capacity == 4096);
        CHECK(plan.drawCountFor(capacity) == capacity);
        CHECK_FALSE(policy.needsGrowth(capacity, 100'000));
    }
}

TEST_SUITE("maxDispatchObjects") {
    TEST_CASE("workgroup size times group limit") {
        CHECK(maxDispatchObjects(64, 65535) == 64u * 65535u);
        CHECK(maxDispatchObjects(256, 1) == 256);
    }

    TEST_CASE("saturates instead of wrapping") {
        CHECK(maxDispatchObjects(1024, std::numeric_limits<uint32_t>::max()) ==
              std::numeric_limits<uint32_t>::max());
    }
}
