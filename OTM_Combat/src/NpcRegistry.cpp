#include "../include/otm/combat/NpcRegistry.h"

#include <mutex>
#include <utility>

namespace otm::combat {

NpcHandle NpcRegistry::create(NpcTemplate tmpl, const RoomId& originRoom, FloorNumber floor, bool respawns) {
    std::unique_lock lock(mutex_);
    if (!free_.empty()) {
        const NpcHandle handle = free_.back();
        free_.pop_back();
        npcs_[handle] = std::make_shared<Npc>(handle, std::move(tmpl), originRoom, floor, respawns);
        return handle;
    }
    const auto handle = static_cast<NpcHandle>(npcs_.size());
    npcs_.push_back(std::make_shared<Npc>(handle, std::move(tmpl), originRoom, floor, respawns));
    return handle;
}

std::shared_ptr<Npc> NpcRegistry::get(NpcHandle handle) const {
    std::shared_lock lock(mutex_);
    if (handle >= npcs_.size()) {
        return nullptr;
    }
    return npcs_[handle];
}

bool NpcRegistry::release(NpcHandle handle) {
    std::unique_lock lock(mutex_);
    if (handle >= npcs_.size() || !npcs_[handle] || npcs_[handle]->isAlive()) {
        return false;
    }
    npcs_[handle].reset();
    free_.push_back(handle);
    return true;
}

std::vector<NpcHandle> NpcRegistry::handles() const {
    std::shared_lock lock(mutex_);
    std::vector<NpcHandle> result;
    result.reserve(npcs_.size() - free_.size());
    for (const auto& npc : npcs_) {
        if (npc) {
            result.push_back(npc->handle());
        }
    }
    return result;
}

std::size_t NpcRegistry::size() const {
    std::shared_lock lock(mutex_);
    return npcs_.size() - free_.size();
}

std::size_t NpcRegistry::capacity() const {
    std::shared_lock lock(mutex_);
    return npcs_.size();
}

std::size_t NpcRegistry::liveCountOnFloor(FloorNumber floor) const {
    std::shared_lock lock(mutex_);
    std::size_t count = 0;
    for (const auto& npc : npcs_) {
        if (npc && npc->floor() == floor && npc->isAlive()) {
            ++count;
        }
    }
    return count;
}

} // namespace otm::combat
