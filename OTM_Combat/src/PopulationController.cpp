#include "../include/otm/combat/PopulationController.h"

#include "../../OTM_Shared/include/otm/shared/Logger.h"

#include <algorithm>

namespace otm::combat {

PopulationController::PopulationController(boost::asio::io_context& ioContext, EngineContext& ctx, MobSpawner& spawner)
    : PeriodicWorker(ioContext, "PopulationController",
                     std::chrono::milliseconds(ctx.config.population.enabled ? ctx.config.population.intervalMs : 0))
    , ctx_(ctx)
    , spawner_(spawner) {
}

void PopulationController::runTick() {
    sweep();
}

int PopulationController::targetPerFloor(const shared::PopulationConfig& config, std::size_t online, int floors) {
    if (online == 0 || floors <= 0 || config.baseMobsPerFloor <= 0.0) {
        return 0;
    }
    const double playersPerFloor = static_cast<double>(online) / static_cast<double>(floors);
    const double desired = playersPerFloor * config.targetMobsPerPlayer;
    const double multiplier = std::clamp(desired / config.baseMobsPerFloor, 1.0, 10.0);
    return static_cast<int>(config.baseMobsPerFloor * multiplier);
}

int PopulationController::sweep() {
    const auto& cfg = ctx_.config.population;
    if (!cfg.enabled) {
        return 0;
    }

    const std::size_t online = ctx_.sessions.onlineCount();
    const int floors = ctx_.world.floorCount();
    if (online == 0 || floors <= 0) {
        return 0;
    }

    const int target = targetPerFloor(cfg, online, floors);
    int requested = 0;
    int spawned = 0;

    for (int floor = 1; floor <= floors; ++floor) {
        if (ctx_.world.roomsOnFloor(floor).empty()) {
            continue;
        }
        const int live = static_cast<int>(ctx_.npcs.liveCountOnFloor(floor));
        if (live >= target) {
            continue;
        }
        const int needed = std::min(target - live, cfg.maxSpawnsPerFloor);
        if (needed <= 0) {
            continue;
        }
        requested += needed;
        spawned += spawner_.spawnAdditional(floor, needed);
    }

    if (requested > 0) {
        shared::logDebug("population", std::string{"Population sweep: online="} + std::to_string(online) +
                         ", floors=" + std::to_string(floors) +
                         ", targetPerFloor=" + std::to_string(target) +
                         ", requested=" + std::to_string(requested) +
                         ", spawned=" + std::to_string(spawned));
    }
    return requested;
}

} // namespace otm::combat
