#include "../include/otm/combat/RespawnScheduler.h"

#include "../../OTM_Shared/include/otm/shared/Logger.h"

namespace otm::combat {

RespawnScheduler::RespawnScheduler(boost::asio::io_context& ioContext, EngineContext& ctx)
    : PeriodicWorker(ioContext, "RespawnScheduler", std::chrono::milliseconds(ctx.config.respawn.sweepMs))
    , ctx_(ctx) {
}

void RespawnScheduler::runTick() {
    sweep(shared::Clock::now());
}

std::size_t RespawnScheduler::sweep(shared::TimePoint now) {
    const auto due = ctx_.respawns.takeDue(now);
    std::size_t respawned = 0;

    for (const auto& entry : due) {
        const auto npc = ctx_.npcs.get(entry.npc);
        if (npc == nullptr) {
            shared::logWarn("respawn", std::string{"Dropping respawn for unknown handle="} + std::to_string(entry.npc));
            continue;
        }

        Room* origin = ctx_.world.findRoom(npc->originRoom());
        if (origin == nullptr) {
            shared::logWarn("respawn", std::string{"Cannot respawn NPC - room not found: npc="} + npc->name() +
                            ", room=" + npc->originRoom());
            continue;
        }

        npc->reset();
        ctx_.world.placeNpc(*npc, *origin);
        origin->broadcast(ctx_.sink, npc->name() + " appears in the area.");
        ++respawned;

        shared::logInfo("respawn", std::string{"NPC respawned: npc="} + npc->name() +
                        ", handle=" + std::to_string(npc->handle()) +
                        ", room=" + origin->id());
    }
    return respawned;
}

} // namespace otm::combat
