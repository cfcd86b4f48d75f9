#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../../../../OTM_Shared/include/otm/shared/Random.h"
#include "NpcRegistry.h"
#include "World.h"
#include "WorldLoader.h"

namespace otm::combat {

/**
 * MobSpawner
 *
 * The single creation path for NPC instances: initial world spawns and
 * population top-ups both come through here.
 */
class MobSpawner {
public:
    MobSpawner(World& world, NpcRegistry& npcs, const NpcTemplateStore& templates, shared::RandomSource& rng);
    virtual ~MobSpawner() = default;

    std::optional<shared::NpcHandle> spawn(const std::string& templateId, const shared::RoomId& roomId, bool respawns = true);

    // Returns the number of NPCs created
    int spawnInitial(const std::vector<SpawnPoint>& spawns);

    // Places up to count floor-appropriate mobs in random eligible rooms of the
    // floor. Top-up mobs do not respawn. Returns the number actually created.
    virtual int spawnAdditional(shared::FloorNumber floor, int count);

private:
    World& world_;
    NpcRegistry& npcs_;
    const NpcTemplateStore& templates_;
    shared::RandomSource& rng_;
};

} // namespace otm::combat
