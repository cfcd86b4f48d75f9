#include "../include/otm/combat/RespawnQueue.h"

#include <algorithm>

namespace otm::combat {

bool RespawnQueue::enqueue(const Npc& npc, shared::TimePoint now, shared::RandomSource& rng, int minimumSeconds) {
    const auto deadline = npc.computeRespawnDeadline(now, rng, minimumSeconds);
    if (!deadline) {
        return false;
    }

    std::scoped_lock lock(mutex_);
    const bool queued = std::any_of(entries_.begin(), entries_.end(),
        [&](const RespawnEntry& e) { return e.npc == npc.handle(); });
    if (queued) {
        return false;
    }
    entries_.push_back(RespawnEntry{ npc.handle(), *deadline });
    return true;
}

std::vector<RespawnEntry> RespawnQueue::takeDue(shared::TimePoint now) {
    std::scoped_lock lock(mutex_);
    std::vector<RespawnEntry> due;
    auto it = std::stable_partition(entries_.begin(), entries_.end(),
        [&](const RespawnEntry& e) { return e.deadline > now; });
    due.assign(it, entries_.end());
    entries_.erase(it, entries_.end());
    return due;
}

bool RespawnQueue::contains(shared::NpcHandle handle) const {
    std::scoped_lock lock(mutex_);
    return std::any_of(entries_.begin(), entries_.end(),
        [&](const RespawnEntry& e) { return e.npc == handle; });
}

std::size_t RespawnQueue::size() const {
    std::scoped_lock lock(mutex_);
    return entries_.size();
}

} // namespace otm::combat
