#include "BoundingVolumeRegistry.h"
#include <SDL3/SDL_log.h>

ObjectHandle BoundingVolumeRegistry::add(const CullAABB& bounds, const DrawParams& params) {
    if (!bounds.isValid()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
            "BoundingVolumeRegistry::add: inverted bounds rejected");
        return ObjectHandle{};
    }

    std::lock_guard<std::mutex> lock(mutex_);

    uint32_t index;
    if (!freeSlots_.empty()) {
        index = freeSlots_.back();
        freeSlots_.pop_back();
    } else {
        index = static_cast<uint32_t>(slots_.size());
        slots_.emplace_back();
    }

    Slot& slot = slots_[index];
    slot.bounds = bounds;
    slot.params = params;
    slot.live = true;

    ++liveCount_;
    markDirtyLocked();

    return ObjectHandle{index, slot.generation};
}

bool BoundingVolumeRegistry::update(ObjectHandle handle, const CullAABB& bounds) {
    if (!bounds.isValid()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
            "BoundingVolumeRegistry::update: inverted bounds rejected for object %u", handle.index);
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!isLiveLocked(handle)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
            "BoundingVolumeRegistry::update: invalid handle (index=%u, generation=%u)",
            handle.index, handle.generation);
        return false;
    }

    slots_[handle.index].bounds = bounds;
    markDirtyLocked();
    return true;
}

bool BoundingVolumeRegistry::updateDrawParams(ObjectHandle handle, const DrawParams& params) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!isLiveLocked(handle)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
            "BoundingVolumeRegistry::updateDrawParams: invalid handle (index=%u, generation=%u)",
            handle.index, handle.generation);
        return false;
    }

    slots_[handle.index].params = params;
    markDirtyLocked();
    return true;
}

bool BoundingVolumeRegistry::remove(ObjectHandle handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!isLiveLocked(handle)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
            "BoundingVolumeRegistry::remove: invalid handle (index=%u, generation=%u)",
            handle.index, handle.generation);
        return false;
    }

    Slot& slot = slots_[handle.index];
    slot.live = false;
    ++slot.generation;
    freeSlots_.push_back(handle.index);

    --liveCount_;
    markDirtyLocked();
    return true;
}

bool BoundingVolumeRegistry::contains(ObjectHandle handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return isLiveLocked(handle);
}

uint32_t BoundingVolumeRegistry::liveCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return liveCount_;
}

uint64_t BoundingVolumeRegistry::version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return version_;
}

void BoundingVolumeRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (liveCount_ == 0) {
        return;
    }

    // Keep generations so outstanding handles stay detectably stale
    freeSlots_.clear();
    for (uint32_t i = static_cast<uint32_t>(slots_.size()); i-- > 0;) {
        Slot& slot = slots_[i];
        if (slot.live) {
            slot.live = false;
            ++slot.generation;
        }
        freeSlots_.push_back(i);
    }

    liveCount_ = 0;
    markDirtyLocked();
}

std::shared_ptr<const CullSnapshot> BoundingVolumeRegistry::snapshot() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (cachedSnapshot_ && cachedSnapshot_->version == version_) {
        return cachedSnapshot_;
    }

    auto snap = std::make_shared<CullSnapshot>();
    snap->version = version_;
    snap->objects.reserve(liveCount_);
    snap->handles.reserve(liveCount_);

    for (uint32_t i = 0; i < slots_.size(); ++i) {
        const Slot& slot = slots_[i];
        if (!slot.live) continue;
        snap->objects.push_back(makeCullObject(slot.bounds, slot.params));
        snap->handles.push_back(ObjectHandle{i, slot.generation});
    }

    cachedSnapshot_ = std::move(snap);
    return cachedSnapshot_;
}

bool BoundingVolumeRegistry::isLiveLocked(ObjectHandle handle) const {
    return handle.index < slots_.size() &&
           slots_[handle.index].live &&
           slots_[handle.index].generation == handle.generation;
}

void BoundingVolumeRegistry::markDirtyLocked() {
    ++version_;
}
