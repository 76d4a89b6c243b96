#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include "CullTypes.h"

// Stable reference to a registry entry. A recycled slot bumps its generation,
// so handles to removed objects never alias a newer object.
struct ObjectHandle {
    static constexpr uint32_t INVALID_INDEX = ~0u;

    uint32_t index = INVALID_INDEX;
    uint32_t generation = 0;

    bool isValid() const { return index != INVALID_INDEX; }

    bool operator==(const ObjectHandle& other) const {
        return index == other.index && generation == other.generation;
    }
    bool operator!=(const ObjectHandle& other) const { return !(*this == other); }
};

/**
 * CullSnapshot - immutable view of the registry for one culling dispatch
 *
 * objects[i] is the GPU-ready record owned by handles[i]. Entries appear in
 * ascending slot order, so live objects keep their relative order between
 * snapshots as long as they are not removed.
 */
struct CullSnapshot {
    uint64_t version = 0;
    std::vector<GPUCullObject> objects;
    std::vector<ObjectHandle> handles;

    uint32_t size() const { return static_cast<uint32_t>(objects.size()); }
    bool empty() const { return objects.empty(); }
};

/**
 * BoundingVolumeRegistry - host-side table of renderable objects
 *
 * Thread-safe: scene management may add/update/remove from any thread while
 * the renderer holds snapshots. Snapshots are copied on creation, so later
 * mutation never tears a snapshot an in-flight dispatch is reading.
 *
 * Usage:
 *   ObjectHandle h = registry.add(bounds, drawParams);
 *   registry.update(h, newBounds);
 *   auto snapshot = registry.snapshot();   // once per frame
 *   registry.remove(h);
 */
class BoundingVolumeRegistry {
public:
    BoundingVolumeRegistry() = default;
    ~BoundingVolumeRegistry() = default;

    // Non-copyable (owns a mutex)
    BoundingVolumeRegistry(const BoundingVolumeRegistry&) = delete;
    BoundingVolumeRegistry& operator=(const BoundingVolumeRegistry&) = delete;

    // Returns an invalid handle if bounds are inverted
    ObjectHandle add(const CullAABB& bounds, const DrawParams& params);

    // Invalid-handle errors are logged and reported by returning false
    bool update(ObjectHandle handle, const CullAABB& bounds);
    bool updateDrawParams(ObjectHandle handle, const DrawParams& params);
    bool remove(ObjectHandle handle);

    bool contains(ObjectHandle handle) const;
    uint32_t liveCount() const;

    // Incremented on every successful mutation
    uint64_t version() const;

    void clear();

    // Consistent copy of all live entries. Returns the previous snapshot
    // when nothing changed since it was taken.
    std::shared_ptr<const CullSnapshot> snapshot();

private:
    struct Slot {
        CullAABB bounds;
        DrawParams params;
        uint32_t generation = 0;
        bool live = false;
    };

    bool isLiveLocked(ObjectHandle handle) const;
    void markDirtyLocked();

    mutable std::mutex mutex_;
    std::vector<Slot> slots_;
    std::vector<uint32_t> freeSlots_;
    uint32_t liveCount_ = 0;
    uint64_t version_ = 0;

    std::shared_ptr<const CullSnapshot> cachedSnapshot_;
};
