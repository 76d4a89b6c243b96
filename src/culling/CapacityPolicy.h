#pragma once

#include <algorithm>
#include <cstdint>
#include <limits>

/**
 * CapacityPolicy - geometric growth for draw command storage
 *
 * Capacity never shrinks. When the live object count exceeds the current
 * capacity, the capacity is multiplied by growthFactor until it fits or
 * reaches maxCapacity. Objects past maxCapacity are left to overflow.
 */
struct CapacityPolicy {
    uint32_t initialCapacity = 1024;
    float growthFactor = 2.0f;
    uint32_t maxCapacity = std::numeric_limits<uint32_t>::max();

    // Capacity to allocate so that liveCount objects fit, bounded by maxCapacity.
    // Returns currentCapacity unchanged when no growth is needed or possible.
    uint32_t requiredCapacity(uint32_t currentCapacity, uint32_t liveCount) const {
        const uint32_t limit = std::max(maxCapacity, 1u);
        uint32_t capacity = std::max({currentCapacity, std::min(initialCapacity, limit), 1u});
        if (liveCount <= capacity || capacity >= limit) {
            return capacity;
        }

        const float factor = std::max(growthFactor, 1.1f);

        while (capacity < liveCount) {
            double next = static_cast<double>(capacity) * factor;
            if (next >= static_cast<double>(limit)) {
                return limit;
            }
            // Always make progress even for factors close to 1
            capacity = std::max(capacity + 1, static_cast<uint32_t>(next));
        }
        return std::min(capacity, limit);
    }

    bool needsGrowth(uint32_t currentCapacity, uint32_t liveCount) const {
        return liveCount > currentCapacity && currentCapacity < maxCapacity;
    }
};
