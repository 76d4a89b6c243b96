#include <doctest/doctest.h>
#include <atomic>
#include <cstdint>
#include <vector>

#include "core/threading/TaskScheduler.h"

TEST_SUITE("TaskScheduler") {
    TEST_CASE("parallelFor visits every index once") {
        TaskScheduler scheduler;
        scheduler.initialize(3);

        std::vector<std::atomic<uint32_t>> hits(1000);
        scheduler.parallelFor(1000, 37, [&](uint32_t begin, uint32_t end) {
            for (uint32_t i = begin; i < end; ++i) {
                hits[i].fetch_add(1);
            }
        });

        for (const auto& hit : hits) {
            CHECK(hit.load() == 1);
        }
    }

    TEST_CASE("parallelFor with zero count does nothing") {
        TaskScheduler scheduler;
        scheduler.initialize(2);
        bool called = false;
        scheduler.parallelFor(0, 16, [&](uint32_t, uint32_t) { called = true; });
        CHECK_FALSE(called);
    }

    TEST_CASE("submit runs inline before initialize") {
        TaskScheduler scheduler;
        CHECK_FALSE(scheduler.isRunning());

        TaskGroup group;
        int value = 0;
        scheduler.submit([&] { value = 42; }, &group);
        CHECK(group.isComplete());
        CHECK(value == 42);
    }

    TEST_CASE("task group waits for all submitted tasks") {
        TaskScheduler scheduler;
        scheduler.initialize(4);
        CHECK(scheduler.getThreadCount() == 4);

        TaskGroup group;
        std::atomic<uint32_t> sum{0};
        for (uint32_t i = 1; i <= 100; ++i) {
            scheduler.submit([&sum, i] { sum.fetch_add(i); }, &group);
        }
        group.wait();
        CHECK(sum.load() == 5050);
        CHECK(scheduler.getCurrentThreadId() == -1);

        scheduler.shutdown();
        CHECK_FALSE(scheduler.isRunning());
    }

    TEST_CASE("a single worker runs tasks in submission order") {
        TaskScheduler scheduler;
        scheduler.initialize(1);

        TaskGroup group;
        std::vector<uint32_t> order;
        for (uint32_t i = 0; i < 64; ++i) {
            scheduler.submit([&order, i] { order.push_back(i); }, &group);
        }
        group.wait();

        REQUIRE(order.size() == 64);
        for (uint32_t i = 0; i < 64; ++i) {
            CHECK(order[i] == i);
        }
    }
}
