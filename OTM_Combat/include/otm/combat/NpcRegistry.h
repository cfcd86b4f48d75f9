#pragma once

#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <vector>

#include "Npc.h"

namespace otm::combat {

/**
 * NpcRegistry
 *
 * Arena owning every NPC instance. Handles are indices into the arena. A
 * respawning NPC keeps its handle through death and respawn. The slot of an
 * NPC that died for good is released and handed to the next create(), so the
 * arena stays bounded while population top-ups come and go.
 *
 * Instances are shared: a worker holding the pointer from get() keeps the
 * NPC alive even if its slot is released and reused meanwhile.
 */
class NpcRegistry {
public:
    NpcHandle create(NpcTemplate tmpl, const RoomId& originRoom, FloorNumber floor, bool respawns = true);

    // nullptr for unknown or released handles
    std::shared_ptr<Npc> get(NpcHandle handle) const;

    // Frees the slot of a dead NPC for reuse. Refuses living NPCs.
    bool release(NpcHandle handle);

    // Handles of occupied slots
    std::vector<NpcHandle> handles() const;

    // Occupied slots
    std::size_t size() const;

    // Slots ever allocated, occupied or free
    std::size_t capacity() const;

    std::size_t liveCountOnFloor(FloorNumber floor) const;

private:
    mutable std::shared_mutex mutex_;
    std::vector<std::shared_ptr<Npc>> npcs_;
    std::vector<NpcHandle> free_;
};

} // namespace otm::combat
