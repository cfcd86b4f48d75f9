#pragma once

#include <cstddef>
#include <mutex>
#include <vector>

#include "../../../../OTM_Shared/include/otm/shared/Types.h"
#include "../../../../OTM_Shared/include/otm/shared/Random.h"
#include "Npc.h"

namespace otm::combat {

struct RespawnEntry {
    shared::NpcHandle npc{ shared::InvalidNpcHandle };
    shared::TimePoint deadline{};
};

/**
 * Dead NPCs waiting to reappear. The deadline is fixed when the entry is
 * queued. Enqueue (from combat) and drain (from the respawn sweep) may race,
 * so every access takes the queue lock.
 */
class RespawnQueue {
public:
    // Computes median +/- jitter from the NPC. Returns false (nothing queued)
    // when respawn is disabled for the NPC or it is already queued.
    bool enqueue(const Npc& npc, shared::TimePoint now, shared::RandomSource& rng, int minimumSeconds);

    // Removes and returns every entry whose deadline is <= now
    std::vector<RespawnEntry> takeDue(shared::TimePoint now);

    bool contains(shared::NpcHandle handle) const;
    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<RespawnEntry> entries_;
};

} // namespace otm::combat
