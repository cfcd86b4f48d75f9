#pragma once

#include "EngineContext.h"
#include "MobSpawner.h"
#include "PeriodicWorker.h"

namespace otm::combat {

/**
 * PopulationController
 *
 * Scales each floor's live-mob target with online players:
 *   playersPerFloor = online / floors
 *   multiplier      = clamp(playersPerFloor * targetMobsPerPlayer / baseMobsPerFloor, 1, 10)
 *   target          = int(baseMobsPerFloor * multiplier)
 * Floors under target get up to maxSpawnsPerFloor new mobs per sweep.
 */
class PopulationController : public PeriodicWorker {
public:
    PopulationController(boost::asio::io_context& ioContext, EngineContext& ctx, MobSpawner& spawner);

    // Per-floor headcount target for the given load; 0 when nobody is online
    static int targetPerFloor(const shared::PopulationConfig& config, std::size_t online, int floors);

    // Returns the number of spawns requested
    int sweep();

protected:
    void runTick() override;

private:
    EngineContext& ctx_;
    MobSpawner& spawner_;
};

} // namespace otm::combat
