#include "../include/otm/combat/AggressionScanner.h"

#include "../../OTM_Shared/include/otm/shared/Logger.h"

namespace otm::combat {

AggressionScanner::AggressionScanner(EngineContext& ctx)
    : ctx_(ctx) {
}

bool AggressionScanner::scan(PlayerSession& player) {
    if (ctx_.config.combat.pilgrimMode) {
        return false;
    }
    if (player.isInCombat() || !player.isAlive()) {
        return false;
    }

    Room* room = ctx_.world.findRoom(player.room());
    if (room == nullptr) {
        return false;
    }

    for (const auto handle : room->npcs()) {
        const auto npc = ctx_.npcs.get(handle);
        if (npc == nullptr || !npc->isAggressive()) {
            continue;
        }
        // Idle excludes fighting, fleeing and dead NPCs
        if (npc->state() != NpcState::Idle || !npc->isAlive()) {
            continue;
        }
        if (!npc->engage(player.name())) {
            continue;
        }
        player.startCombat(handle);

        ctx_.sink.sendMessage(player.name(), "\n" + npc->name() + " attacks you!\n");
        room->broadcast(ctx_.sink, npc->name() + " attacks " + player.name() + "!", { player.name() });

        shared::logInfo("aggro", std::string{"Aggressive NPC engaged: npc="} + npc->name() +
                        ", handle=" + std::to_string(handle) +
                        ", player=" + player.name() +
                        ", room=" + room->id());
        return true;
    }
    return false;
}

} // namespace otm::combat
