#pragma once

#include "../../../../OTM_Shared/include/otm/shared/Config.h"
#include "../../../../OTM_Shared/include/otm/shared/Random.h"
#include "BossTracker.h"
#include "ItemCatalog.h"
#include "MessageSink.h"
#include "NpcRegistry.h"
#include "RespawnQueue.h"
#include "SessionRegistry.h"
#include "World.h"

namespace otm::combat {

/**
 * Everything the engine processes share. Owned by the hosting server and
 * outlives the engine. loot and bosses may be null when those services are
 * not available; the steps that need them are skipped.
 */
struct EngineContext {
    const shared::EngineConfig& config;
    World& world;
    NpcRegistry& npcs;
    SessionRegistry& sessions;
    MessageSink& sink;
    shared::RandomSource& rng;
    RespawnQueue& respawns;
    LootCatalog* loot{ nullptr };
    BossTracker* bosses{ nullptr };
};

} // namespace otm::combat
