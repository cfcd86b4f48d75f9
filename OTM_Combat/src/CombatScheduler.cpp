#include "../include/otm/combat/CombatScheduler.h"

#include "../../OTM_Shared/include/otm/shared/Logger.h"

namespace otm::combat {

CombatScheduler::CombatScheduler(boost::asio::io_context& ioContext, EngineContext& ctx,
                                 CombatResolver& resolver, AggressionScanner& aggression)
    : PeriodicWorker(ioContext, "CombatScheduler", std::chrono::milliseconds(ctx.config.combat.tickMs))
    , ctx_(ctx)
    , resolver_(resolver)
    , aggression_(aggression) {
}

void CombatScheduler::runTick() {
    tick(shared::Clock::now());
}

void CombatScheduler::tick(shared::TimePoint now) {
    const auto players = ctx_.sessions.snapshot();

    int playerAttacks = 0;
    for (const auto& player : players) {
        if (player->isInCombat()) {
            resolver_.resolvePlayerAttack(*player, now);
            ++playerAttacks;
        }
    }

    int npcAttacks = 0;
    for (const auto handle : ctx_.npcs.handles()) {
        const auto npc = ctx_.npcs.get(handle);
        if (npc != nullptr && npc->isInCombat()) {
            resolver_.resolveNpcAttack(*npc, now);
            ++npcAttacks;
        }
    }

    int aggroStarts = 0;
    for (const auto& player : players) {
        if (aggression_.scan(*player)) {
            ++aggroStarts;
        }
    }

    if (playerAttacks > 0 || npcAttacks > 0 || aggroStarts > 0) {
        shared::logDebug("combat", std::string{"Combat tick: players="} + std::to_string(players.size()) +
                         ", playerAttacks=" + std::to_string(playerAttacks) +
                         ", npcAttacks=" + std::to_string(npcAttacks) +
                         ", aggroStarts=" + std::to_string(aggroStarts));
    }
}

} // namespace otm::combat
