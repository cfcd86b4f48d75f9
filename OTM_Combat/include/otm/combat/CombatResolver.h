#pragma once

#include <string>

#include "DeathResolver.h"
#include "EngineContext.h"

namespace otm::combat {

/**
 * CombatResolver
 *
 * One attack exchange at a time: a player's swing at their target NPC, or an
 * NPC's retaliation against its highest-threat attacker. Also owns the
 * player-issued engage and retreat commands.
 *
 * Stale references (target gone, left the room, disconnected) end the
 * affected combat and never throw.
 */
class CombatResolver {
public:
    CombatResolver(EngineContext& ctx, DeathResolver& deaths);

    void resolvePlayerAttack(PlayerSession& player, shared::TimePoint now);
    void resolveNpcAttack(Npc& npc, shared::TimePoint now);

    // Reply text for the issuing player
    std::string engage(PlayerSession& player, const std::string& npcName);
    std::string retreat(PlayerSession& player);

private:
    // Moves the NPC through a random horizontal exit. False if it has nowhere to go.
    bool fleeNpc(Npc& npc, Room& room);

    void notifyFighters(const Npc& npc, const std::string& exclude, const std::string& text);

    EngineContext& ctx_;
    DeathResolver& deaths_;
};

} // namespace otm::combat
