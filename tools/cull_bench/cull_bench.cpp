// Culling benchmark
// Scatters random boxes around an orbiting camera and runs the visibility
// kernel protocol on the host (CpuCullDispatcher), reporting timing and
// visibility statistics per frame.

#include <SDL3/SDL_log.h>
#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/constants.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <random>
#include <string>
#include <vector>

#include "culling/BoundingVolumeRegistry.h"
#include "culling/CapacityPolicy.h"
#include "culling/CpuCullDispatcher.h"
#include "culling/CullingConfig.h"
#include "culling/Frustum.h"
#include "core/threading/TaskScheduler.h"

struct BenchConfig {
    uint32_t objectCount = 100000;
    uint32_t frames = 120;
    uint32_t threads = 0;          // 0 = hardware concurrency - 1
    float worldExtent = 2000.0f;   // Boxes are scattered in [-extent, extent]
    float maxBoxSize = 20.0f;
    float churn = 0.01f;           // Fraction of objects moved per frame
    unsigned int seed = 42;
    std::string configPath;        // Optional culling config JSON
};

void printUsage(const char* programName) {
    SDL_Log("Usage: %s [options]", programName);
    SDL_Log("");
    SDL_Log("Options:");
    SDL_Log("  --objects <n>        Number of objects (default: 100000)");
    SDL_Log("  --frames <n>         Frames to simulate (default: 120)");
    SDL_Log("  --threads <n>        Worker threads, 0 = auto (default: 0)");
    SDL_Log("  --extent <f>         World half-extent (default: 2000)");
    SDL_Log("  --churn <f>          Fraction of objects moved per frame (default: 0.01)");
    SDL_Log("  --seed <n>           Random seed (default: 42)");
    SDL_Log("  --config <path>      Culling config JSON (capacity, growth factor)");
    SDL_Log("  --help               Show this help");
}

CullAABB randomBox(std::mt19937& rng, float extent, float maxSize) {
    std::uniform_real_distribution<float> posDist(-extent, extent);
    std::uniform_real_distribution<float> sizeDist(0.0f, maxSize);

    glm::vec3 center(posDist(rng), posDist(rng) * 0.05f, posDist(rng));
    glm::vec3 halfSize(sizeDist(rng), sizeDist(rng), sizeDist(rng));
    halfSize *= 0.5f;

    CullAABB box;
    box.min = center - halfSize;
    box.max = center + halfSize;
    return box;
}

int main(int argc, char* argv[]) {
    BenchConfig bench;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--objects" && i + 1 < argc) {
            bench.objectCount = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if (arg == "--frames" && i + 1 < argc) {
            bench.frames = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if (arg == "--threads" && i + 1 < argc) {
            bench.threads = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if (arg == "--extent" && i + 1 < argc) {
            bench.worldExtent = std::stof(argv[++i]);
        } else if (arg == "--churn" && i + 1 < argc) {
            bench.churn = std::clamp(std::stof(argv[++i]), 0.0f, 1.0f);
        } else if (arg == "--seed" && i + 1 < argc) {
            bench.seed = static_cast<unsigned int>(std::stoul(argv[++i]));
        } else if (arg == "--config" && i + 1 < argc) {
            bench.configPath = argv[++i];
        } else {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Unknown option: %s", arg.c_str());
            printUsage(argv[0]);
            return 1;
        }
    }

    CullingConfig cullConfig = bench.configPath.empty()
        ? CullingConfig::defaults()
        : CullingConfig::loadFromJson(bench.configPath);
    if (!cullConfig.validate()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Culling config had out-of-range values, corrected");
    }
    CapacityPolicy policy = cullConfig.capacityPolicy();

    SDL_Log("Culling Benchmark");
    SDL_Log("=================");
    SDL_Log("Objects: %u", bench.objectCount);
    SDL_Log("Frames: %u", bench.frames);
    SDL_Log("World extent: %.1f", bench.worldExtent);
    SDL_Log("Churn: %.3f", bench.churn);
    SDL_Log("Initial capacity: %u (growth %.2f)", policy.initialCapacity, policy.growthFactor);

    TaskScheduler scheduler;
    scheduler.initialize(bench.threads);
    SDL_Log("Worker threads: %u", scheduler.getThreadCount());

    std::mt19937 rng(bench.seed);
    BoundingVolumeRegistry registry;
    std::vector<ObjectHandle> handles;
    handles.reserve(bench.objectCount);

    for (uint32_t i = 0; i < bench.objectCount; ++i) {
        DrawParams params;
        params.vertexCount = 36;
        params.firstInstance = i;
        handles.push_back(registry.add(randomBox(rng, bench.worldExtent, bench.maxBoxSize), params));
    }

    CpuCullDispatcher dispatcher(scheduler);
    std::vector<GPUDrawCommand> commands;
    uint32_t capacity = 0;

    std::uniform_int_distribution<size_t> handleDist(0, handles.empty() ? 0 : handles.size() - 1);
    const auto movesPerFrame = static_cast<uint32_t>(bench.churn * static_cast<float>(bench.objectCount));

    glm::mat4 proj = glm::perspectiveRH_ZO(glm::radians(60.0f), 16.0f / 9.0f, 0.1f, bench.worldExtent);

    double totalCullMs = 0.0;
    double totalSnapshotMs = 0.0;
    double minCullMs = 1e30;
    double maxCullMs = 0.0;
    uint64_t totalVisible = 0;
    uint32_t overflowFrames = 0;

    for (uint32_t frame = 0; frame < bench.frames; ++frame) {
        for (uint32_t m = 0; m < movesPerFrame && !handles.empty(); ++m) {
            ObjectHandle h = handles[handleDist(rng)];
            if (!registry.update(h, randomBox(rng, bench.worldExtent, bench.maxBoxSize))) {
                SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Registry rejected update of a live handle");
                return 1;
            }
        }

        // Camera orbits the origin at mid height
        float angle = glm::two_pi<float>() * static_cast<float>(frame) / static_cast<float>(std::max(bench.frames, 1u));
        glm::vec3 eye(std::cos(angle) * bench.worldExtent * 0.5f, 50.0f, std::sin(angle) * bench.worldExtent * 0.5f);
        glm::mat4 view = glm::lookAt(eye, glm::vec3(0.0f), glm::vec3(0.0f, 1.0f, 0.0f));
        Frustum frustum = Frustum::fromViewProjection(proj * view);

        auto snapStart = std::chrono::high_resolution_clock::now();
        auto snapshot = registry.snapshot();
        auto snapEnd = std::chrono::high_resolution_clock::now();

        uint32_t required = policy.requiredCapacity(capacity, snapshot->size());
        if (required != capacity) {
            capacity = required;
            commands.assign(capacity, GPUDrawCommand{});
        }

        GPUCullCounters counters{};
        auto cullStart = std::chrono::high_resolution_clock::now();
        CullingStats stats = dispatcher.dispatch(*snapshot, frustum, commands, counters);
        auto cullEnd = std::chrono::high_resolution_clock::now();

        double snapMs = std::chrono::duration<double, std::milli>(snapEnd - snapStart).count();
        double cullMs = std::chrono::duration<double, std::milli>(cullEnd - cullStart).count();
        totalSnapshotMs += snapMs;
        totalCullMs += cullMs;
        minCullMs = std::min(minCullMs, cullMs);
        maxCullMs = std::max(maxCullMs, cullMs);
        totalVisible += stats.visibleObjects;
        if (stats.overflowed()) {
            overflowFrames++;
        }
    }

    scheduler.shutdown();

    if (bench.frames == 0) {
        SDL_Log("No frames simulated");
        return 0;
    }

    double frames = static_cast<double>(bench.frames);
    double avgCullMs = totalCullMs / frames;
    double objectsPerSec = avgCullMs > 0.0 ? bench.objectCount / (avgCullMs / 1000.0) : 0.0;

    SDL_Log("");
    SDL_Log("Results");
    SDL_Log("-------");
    SDL_Log("Snapshot: %.3f ms avg", totalSnapshotMs / frames);
    SDL_Log("Cull: %.3f ms avg, %.3f ms min, %.3f ms max", avgCullMs, minCullMs, maxCullMs);
    SDL_Log("Throughput: %.1f M objects/s", objectsPerSec / 1e6);
    SDL_Log("Visible: %.1f avg (%.2f%%)", static_cast<double>(totalVisible) / frames,
            bench.objectCount > 0 ? 100.0 * static_cast<double>(totalVisible) / frames / bench.objectCount : 0.0);
    SDL_Log("Final capacity: %u", capacity);
    SDL_Log("Overflow frames: %u", overflowFrames);

    return 0;
}
