#pragma once

#include <memory>
#include <string>
#include <vector>

#include "EngineContext.h"

namespace otm::combat {

/**
 * DeathResolver
 *
 * Runs synchronously the moment an NPC or player reaches zero health.
 *
 * NPC death order:
 *   capture attackers -> split XP/gold -> reward each connected attacker ->
 *   loot -> boss key and area clear -> death broadcast -> remove -> queue respawn
 *   (or release the registry slot when the NPC never comes back)
 *
 * Splits use integer division across all captured attackers, including any
 * that disconnected mid-fight; the remainder is dropped.
 */
class DeathResolver {
public:
    explicit DeathResolver(EngineContext& ctx);

    // No-op if the NPC was already dead (a second lethal hit in the same tick).
    // The caller keeps its own pointer from NpcRegistry::get() alive across the call.
    void handleNpcDeath(Npc& npc, Room& room, shared::TimePoint now);

    void handlePlayerDeath(PlayerSession& victim, Npc& killer, Room& room);

    static int splitShare(int total, std::size_t attackerCount);

private:
    void rewardAttacker(PlayerSession& attacker, const Npc& npc, int xpEach, std::size_t attackerCount);
    void distributeGold(const Npc& npc, const std::vector<std::shared_ptr<PlayerSession>>& connected, std::size_t attackerCount);
    void dropLoot(const Npc& npc, Room& room, const std::vector<std::shared_ptr<PlayerSession>>& connected);
    void dropBossKey(const Npc& npc, Room& room, const std::vector<std::shared_ptr<PlayerSession>>& connected);
    void recordAreaClear(const Npc& npc, const std::vector<std::shared_ptr<PlayerSession>>& connected);

    EngineContext& ctx_;
};

} // namespace otm::combat
