#include "CpuCullDispatcher.h"
#include "BoundingVolumeRegistry.h"
#include "core/threading/TaskScheduler.h"
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <atomic>

CpuCullDispatcher::CpuCullDispatcher(TaskScheduler& scheduler, uint32_t batchSize)
    : scheduler_(scheduler)
    , batchSize_(std::max(batchSize, 1u)) {}

CullingStats CpuCullDispatcher::dispatch(const CullSnapshot& snapshot,
                                         const Frustum& frustum,
                                         std::vector<GPUDrawCommand>& commands,
                                         GPUCullCounters& counters) const {
    const uint32_t objectCount = snapshot.size();
    const uint32_t capacity = static_cast<uint32_t>(commands.size());

    std::atomic<uint32_t> drawCount{0};
    std::atomic<uint32_t> requestedCount{0};

    scheduler_.parallelFor(objectCount, batchSize_, [&](uint32_t begin, uint32_t end) {
        for (uint32_t i = begin; i < end; ++i) {
            const GPUCullObject& obj = snapshot.objects[i];
            if (!frustum.isAABBVisible(glm::vec3(obj.aabbMin), glm::vec3(obj.aabbMax))) {
                continue;
            }

            uint32_t slot = requestedCount.fetch_add(1, std::memory_order_relaxed);
            if (slot >= capacity) {
                continue;
            }

            commands[slot] = makeDrawCommand(obj);
            drawCount.fetch_add(1, std::memory_order_relaxed);
        }
    });
    // parallelFor returns after every batch completed; TaskGroup::wait orders the writes

    counters.drawCount = drawCount.load();
    counters.requestedCount = requestedCount.load();

    CullingStats stats;
    stats.totalObjects = objectCount;
    stats.visibleObjects = counters.drawCount;
    stats.requestedObjects = counters.requestedCount;
    stats.capacity = capacity;

    if (stats.overflowed()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
            "CpuCullDispatcher: capacity exceeded (%u visible, capacity %u), output clamped",
            stats.requestedObjects, capacity);
    }
    return stats;
}
