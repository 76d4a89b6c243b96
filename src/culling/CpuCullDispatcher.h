#pragma once

#include <cstdint>
#include <vector>

#include "CullTypes.h"
#include "Frustum.h"

class TaskScheduler;
struct CullSnapshot;

/**
 * CpuCullDispatcher - host execution of the visibility compute stage
 *
 * Runs the same protocol as visibility_cull.comp on a TaskScheduler: every
 * object is tested independently, survivors reserve an output slot with an
 * atomic fetch-add and write their command there. Reservations at or past the
 * command array's size are counted but not written.
 *
 * Used where no device is available (tools, tests) and as the reference the
 * GPU path is checked against. Output order is not deterministic.
 */
class CpuCullDispatcher {
public:
    // Objects per task; a multiple of the GPU workgroup size
    static constexpr uint32_t DEFAULT_BATCH_SIZE = 64 * 16;

    explicit CpuCullDispatcher(TaskScheduler& scheduler, uint32_t batchSize = DEFAULT_BATCH_SIZE);

    // commands.size() is the capacity. Counters are reset before the dispatch.
    // Returns the dispatch statistics; stats.overflowed() signals capacity-exceeded.
    CullingStats dispatch(const CullSnapshot& snapshot,
                          const Frustum& frustum,
                          std::vector<GPUDrawCommand>& commands,
                          GPUCullCounters& counters) const;

private:
    TaskScheduler& scheduler_;
    uint32_t batchSize_;
};
