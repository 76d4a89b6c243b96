#include <doctest/doctest.h>
#include <glm/glm.hpp>
#include <thread>
#include <vector>

#include "culling/BoundingVolumeRegistry.h"

static CullAABB makeBox(float x, float y, float z, float halfSize = 1.0f) {
    CullAABB box;
    box.min = glm::vec3(x, y, z) - glm::vec3(halfSize);
    box.max = glm::vec3(x, y, z) + glm::vec3(halfSize);
    return box;
}

static DrawParams makeParams(uint32_t firstVertex, uint32_t vertexCount = 36) {
    DrawParams params;
    params.vertexCount = vertexCount;
    params.firstVertex = firstVertex;
    return params;
}

TEST_SUITE("BoundingVolumeRegistry") {
    TEST_CASE("empty registry") {
        BoundingVolumeRegistry registry;
        CHECK(registry.liveCount() == 0);
        CHECK(registry.version() == 0);

        auto snapshot = registry.snapshot();
        REQUIRE(snapshot != nullptr);
        CHECK(snapshot->empty());
        CHECK(snapshot->size() == 0);
    }

    TEST_CASE("add returns distinct valid handles") {
        BoundingVolumeRegistry registry;
        ObjectHandle a = registry.add(makeBox(0, 0, -5), makeParams(0));
        ObjectHandle b = registry.add(makeBox(1, 0, -5), makeParams(36));

        CHECK(a.isValid());
        CHECK(b.isValid());
        CHECK(a != b);
        CHECK(registry.contains(a));
        CHECK(registry.contains(b));
        CHECK(registry.liveCount() == 2);
    }

    TEST_CASE("snapshot carries bounds and draw parameters") {
        BoundingVolumeRegistry registry;
        DrawParams params;
        params.vertexCount = 24;
        params.instanceCount = 3;
        params.firstVertex = 100;
        params.firstInstance = 7;
        ObjectHandle h = registry.add(makeBox(2, 3, 4, 0.5f), params);

        auto snapshot = registry.snapshot();
        REQUIRE(snapshot->size() == 1);
        const GPUCullObject& obj = snapshot->objects[0];
        CHECK(obj.aabbMin.x == doctest::Approx(1.5f));
        CHECK(obj.aabbMin.y == doctest::Approx(2.5f));
        CHECK(obj.aabbMin.z == doctest::Approx(3.5f));
        CHECK(obj.aabbMax.x == doctest::Approx(2.5f));
        CHECK(obj.aabbMax.y == doctest::Approx(3.5f));
        CHECK(obj.aabbMax.z == doctest::Approx(4.5f));
        CHECK(obj.vertexCount == 24);
        CHECK(obj.instanceCount == 3);
        CHECK(obj.firstVertex == 100);
        CHECK(obj.firstInstance == 7);
        CHECK(snapshot->handles[0] == h);
    }

    TEST_CASE("update changes bounds") {
        BoundingVolumeRegistry registry;
        ObjectHandle h = registry.add(makeBox(0, 0, 0), makeParams(0));
        CHECK(registry.update(h, makeBox(10, 0, 0)));

        auto snapshot = registry.snapshot();
        REQUIRE(snapshot->size() == 1);
        CHECK(snapshot->objects[0].aabbMin.x == doctest::Approx(9.0f));
        CHECK(snapshot->objects[0].aabbMax.x == doctest::Approx(11.0f));
    }

    TEST_CASE("updateDrawParams changes draw parameters") {
        BoundingVolumeRegistry registry;
        ObjectHandle h = registry.add(makeBox(0, 0, 0), makeParams(0));
        CHECK(registry.updateDrawParams(h, makeParams(72, 12)));

        auto snapshot = registry.snapshot();
        REQUIRE(snapshot->size() == 1);
        CHECK(snapshot->objects[0].firstVertex == 72);
        CHECK(snapshot->objects[0].vertexCount == 12);
    }

    TEST_CASE("remove invalidates the handle") {
        BoundingVolumeRegistry registry;
        ObjectHandle h = registry.add(makeBox(0, 0, 0), makeParams(0));
        CHECK(registry.remove(h));
        CHECK_FALSE(registry.contains(h));
        CHECK(registry.liveCount() == 0);

        CHECK_FALSE(registry.remove(h));
        CHECK_FALSE(registry.update(h, makeBox(1, 1, 1)));
        CHECK_FALSE(registry.updateDrawParams(h, makeParams(1)));
    }

    TEST_CASE("recycled slot does not accept stale handle") {
        BoundingVolumeRegistry registry;
        ObjectHandle old = registry.add(makeBox(0, 0, 0), makeParams(0));
        REQUIRE(registry.remove(old));

        ObjectHandle recycled = registry.add(makeBox(5, 5, 5), makeParams(36));
        CHECK(recycled.index == old.index);
        CHECK(recycled.generation != old.generation);
        CHECK(registry.contains(recycled));
        CHECK_FALSE(registry.contains(old));

        CHECK_FALSE(registry.update(old, makeBox(9, 9, 9)));
        CHECK_FALSE(registry.remove(old));
        CHECK(registry.contains(recycled));
    }

    TEST_CASE("unknown handles are rejected") {
        BoundingVolumeRegistry registry;
        registry.add(makeBox(0, 0, 0), makeParams(0));

        ObjectHandle invalid;
        CHECK_FALSE(invalid.isValid());
        CHECK_FALSE(registry.contains(invalid));
        CHECK_FALSE(registry.update(invalid, makeBox(1, 1, 1)));

        ObjectHandle outOfRange{42, 0};
        CHECK_FALSE(registry.remove(outOfRange));
        CHECK(registry.liveCount() == 1);
    }

    TEST_CASE("inverted bounds are rejected") {
        BoundingVolumeRegistry registry;
        CullAABB inverted;
        inverted.min = glm::vec3(1.0f, 0.0f, 0.0f);
        inverted.max = glm::vec3(0.0f, 1.0f, 1.0f);

        ObjectHandle rejected = registry.add(inverted, makeParams(0));
        CHECK_FALSE(rejected.isValid());
        CHECK(registry.liveCount() == 0);

        ObjectHandle h = registry.add(makeBox(0, 0, 0), makeParams(0));
        uint64_t version = registry.version();
        CHECK_FALSE(registry.update(h, inverted));
        CHECK(registry.version() == version);
    }

    TEST_CASE("point bounds are accepted") {
        BoundingVolumeRegistry registry;
        CullAABB point;
        point.min = glm::vec3(1.0f, 2.0f, 3.0f);
        point.max = point.min;
        CHECK(registry.add(point, makeParams(0)).isValid());
    }

    TEST_CASE("snapshot is isolated from later mutation") {
        BoundingVolumeRegistry registry;
        ObjectHandle a = registry.add(makeBox(0, 0, 0), makeParams(0));
        registry.add(makeBox(1, 0, 0), makeParams(36));

        auto before = registry.snapshot();
        REQUIRE(before->size() == 2);

        registry.update(a, makeBox(50, 0, 0));
        registry.remove(a);
        registry.add(makeBox(2, 0, 0), makeParams(72));

        CHECK(before->size() == 2);
        CHECK(before->objects[0].aabbMin.x == doctest::Approx(-1.0f));
        CHECK(before->handles[0] == a);

        auto after = registry.snapshot();
        CHECK(after->size() == 2);
        CHECK(after->version > before->version);
    }

    TEST_CASE("snapshot is reused while unchanged") {
        BoundingVolumeRegistry registry;
        registry.add(makeBox(0, 0, 0), makeParams(0));

        auto first = registry.snapshot();
        auto second = registry.snapshot();
        CHECK(first.get() == second.get());

        registry.add(makeBox(1, 0, 0), makeParams(36));
        auto third = registry.snapshot();
        CHECK(third.get() != first.get());
    }

    TEST_CASE("snapshot keeps live entries in slot order") {
        BoundingVolumeRegistry registry;
        ObjectHandle a = registry.add(makeBox(0, 0, 0), makeParams(0));
        ObjectHandle b = registry.add(makeBox(1, 0, 0), makeParams(1));
        ObjectHandle c = registry.add(makeBox(2, 0, 0), makeParams(2));

        registry.remove(b);

        auto snapshot = registry.snapshot();
        REQUIRE(snapshot->size() == 2);
        CHECK(snapshot->handles[0] == a);
        CHECK(snapshot->handles[1] == c);
        CHECK(snapshot->objects[0].firstVertex == 0);
        CHECK(snapshot->objects[1].firstVertex == 2);
    }

    TEST_CASE("version increments on every successful mutation") {
        BoundingVolumeRegistry registry;
        uint64_t v0 = registry.version();
        ObjectHandle h = registry.add(makeBox(0, 0, 0), makeParams(0));
        uint64_t v1 = registry.version();
        CHECK(v1 > v0);

        registry.update(h, makeBox(1, 1, 1));
        uint64_t v2 = registry.version();
        CHECK(v2 > v1);

        CHECK_FALSE(registry.update(ObjectHandle{}, makeBox(1, 1, 1)));
        CHECK(registry.version() == v2);
    }

    TEST_CASE("clear removes everything and invalidates handles") {
        BoundingVolumeRegistry registry;
        ObjectHandle a = registry.add(makeBox(0, 0, 0), makeParams(0));
        ObjectHandle b = registry.add(makeBox(1, 0, 0), makeParams(1));

        registry.clear();
        CHECK(registry.liveCount() == 0);
        CHECK_FALSE(registry.contains(a));
        CHECK_FALSE(registry.contains(b));
        CHECK(registry.snapshot()->empty());

        ObjectHandle c = registry.add(makeBox(2, 0, 0), makeParams(2));
        CHECK(registry.contains(c));
        CHECK(c != a);
        CHECK(c != b);
        CHECK(registry.liveCount() == 1);
    }

    TEST_CASE("concurrent adds from several threads") {
        BoundingVolumeRegistry registry;
        constexpr int threadCount = 4;
        constexpr int perThread = 250;

        std::vector<std::thread> threads;
        for (int t = 0; t < threadCount; ++t) {
            threads.emplace_back([&registry, t] {
                for (int i = 0; i < perThread; ++i) {
                    ObjectHandle h = registry.add(makeBox(static_cast<float>(t), static_cast<float>(i), 0),
                                                  makeParams(static_cast<uint32_t>(t * perThread + i)));
                    if (i % 2 == 0) {
                        registry.remove(h);
                    }
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        CHECK(registry.liveCount() == threadCount * perThread / 2);
        CHECK(registry.snapshot()->size() == threadCount * perThread / 2);
    }
}
