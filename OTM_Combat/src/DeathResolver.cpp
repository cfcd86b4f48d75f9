#include "../include/otm/combat/DeathResolver.h"

#include "../../OTM_Shared/include/otm/shared/Logger.h"

#include <utility>

namespace otm::combat {

using shared::logDebug;
using shared::logInfo;
using shared::logWarn;
using shared::logError;

namespace {
    std::string joinNames(const std::vector<std::string>& names) {
        std::string joined;
        for (std::size_t i = 0; i < names.size(); ++i) {
            if (i > 0) {
                joined += ", ";
            }
            joined += names[i];
        }
        return joined;
    }
}

DeathResolver::DeathResolver(EngineContext& ctx)
    : ctx_(ctx) {
}

int DeathResolver::splitShare(int total, std::size_t attackerCount) {
    if (attackerCount <= 1) {
        return total;
    }
    return total / static_cast<int>(attackerCount);
}

void DeathResolver::handleNpcDeath(Npc& npc, Room& room, shared::TimePoint now) {
    auto captured = npc.markDead();
    if (!captured) {
        logDebug("death", std::string{"Ignoring repeated death: npc="} + npc.name() +
                 ", handle=" + std::to_string(npc.handle()));
        return;
    }
    const std::vector<std::string> attackers = std::move(*captured);
    const std::size_t attackerCount = attackers.size();

    const int totalXp = npc.experience();
    const int xpEach = splitShare(totalXp, attackerCount);

    logInfo("death", std::string{"NPC defeated: npc="} + npc.name() +
            ", handle=" + std::to_string(npc.handle()) +
            ", room=" + room.id() +
            ", attackers=[" + joinNames(attackers) + "]" +
            ", xpTotal=" + std::to_string(totalXp) +
            ", xpEach=" + std::to_string(xpEach));

    std::vector<std::shared_ptr<PlayerSession>> connected;
    std::vector<std::string> connectedNames;
    for (const auto& name : attackers) {
        auto attacker = ctx_.sessions.find(name);
        if (!attacker) {
            logDebug("death", std::string{"Attacker disconnected before reward: player="} + name +
                     ", npc=" + npc.name());
            continue;
        }
        rewardAttacker(*attacker, npc, xpEach, attackerCount);
        connected.push_back(attacker);
        connectedNames.push_back(name);
    }

    if (ctx_.loot != nullptr) {
        distributeGold(npc, connected, attackerCount);
        dropLoot(npc, room, connected);
    } else {
        logDebug("death", std::string{"No loot catalog, skipping gold and loot for npc="} + npc.name());
    }

    if (npc.isBoss()) {
        dropBossKey(npc, room, connected);
        if (!npc.stats().finalBossOfArea.empty()) {
            recordAreaClear(npc, connected);
        }
    }

    npc.endCombat();

    if (connectedNames.size() == 1) {
        room.broadcast(ctx_.sink, connectedNames.front() + " has slain " + npc.name() + "!");
    } else if (connectedNames.size() > 1) {
        room.broadcast(ctx_.sink, joinNames(connectedNames) + " have slain " + npc.name() + "!");
    } else {
        room.broadcast(ctx_.sink, npc.name() + " dies.");
    }

    room.removeNpc(npc.handle());

    if (ctx_.respawns.enqueue(npc, now, ctx_.rng, ctx_.config.respawn.minimumSeconds)) {
        logInfo("respawn", std::string{"Queued respawn: npc="} + npc.name() +
                ", handle=" + std::to_string(npc.handle()) +
                ", origin=" + npc.originRoom() +
                ", queueSize=" + std::to_string(ctx_.respawns.size()));
    } else {
        // gone for good; the slot goes back to the registry
        const bool released = ctx_.npcs.release(npc.handle());
        logDebug("respawn", std::string{"No respawn for npc="} + npc.name() +
                 ", handle=" + std::to_string(npc.handle()) +
                 ", released=" + (released ? "1" : "0"));
    }
}

void DeathResolver::rewardAttacker(PlayerSession& attacker, const Npc& npc, int xpEach, std::size_t attackerCount) {
    if (attacker.isTargeting(npc.handle())) {
        attacker.endCombat();
    }
    attacker.recordKill();
    const auto levelUps = attacker.gainExperience(xpEach);

    const std::string& name = attacker.name();
    if (attackerCount <= 1) {
        ctx_.sink.sendMessage(name, "\nYou have slain " + npc.name() + "!\n");
        ctx_.sink.sendMessage(name, "You gain " + std::to_string(xpEach) + " experience points.\n");
    } else {
        ctx_.sink.sendMessage(name, "\nYour group has slain " + npc.name() + "!\n");
        ctx_.sink.sendMessage(name, "You gain " + std::to_string(xpEach) + " experience points (split " +
                              std::to_string(attackerCount) + " ways).\n");
    }

    for (const auto& lu : levelUps) {
        ctx_.sink.sendMessage(name, "\n*** LEVEL UP! ***\n");
        ctx_.sink.sendMessage(name, "You are now level " + std::to_string(lu.newLevel) + "!\n");
        ctx_.sink.sendMessage(name, "Max Health increased by " + std::to_string(lu.hpGain) +
                              " (now " + std::to_string(attacker.maxHealth()) + ")\n");
        ctx_.sink.sendMessage(name, "Max Mana increased by " + std::to_string(lu.manaGain) +
                              " (now " + std::to_string(attacker.maxMana()) + ")\n");
        ctx_.sink.sendMessage(name, "You feel completely refreshed!\n");
        logInfo("death", std::string{"Level up: player="} + name + ", level=" + std::to_string(lu.newLevel));
    }
}

void DeathResolver::distributeGold(const Npc& npc, const std::vector<std::shared_ptr<PlayerSession>>& connected,
                                   std::size_t attackerCount) {
    const int gold = ctx_.loot->rollGold(npc);
    if (gold <= 0) {
        return;
    }
    const int goldEach = splitShare(gold, attackerCount);
    for (const auto& attacker : connected) {
        attacker->addGold(goldEach);
        if (attackerCount <= 1) {
            ctx_.sink.sendMessage(attacker->name(), "You loot " + std::to_string(goldEach) + " gold.\n");
        } else {
            ctx_.sink.sendMessage(attacker->name(), "You loot " + std::to_string(goldEach) + " gold (split " +
                                  std::to_string(attackerCount) + " ways).\n");
        }
    }
}

void DeathResolver::dropLoot(const Npc& npc, Room& room, const std::vector<std::shared_ptr<PlayerSession>>& connected) {
    const auto itemIds = ctx_.loot->rollLoot(npc);
    std::vector<std::string> droppedNames;
    for (const auto& itemId : itemIds) {
        auto item = ctx_.loot->findItem(itemId);
        if (!item) {
            logWarn("death", std::string{"Unknown item in loot drop: item="} + itemId + ", npc=" + npc.name());
            continue;
        }
        droppedNames.push_back(item->name);
        room.addItem(std::move(*item));
    }
    if (droppedNames.empty()) {
        return;
    }
    const std::string lootMsg = npc.name() + " dropped: " + joinNames(droppedNames) + "\n";
    for (const auto& attacker : connected) {
        ctx_.sink.sendMessage(attacker->name(), lootMsg);
    }
}

void DeathResolver::dropBossKey(const Npc& npc, Room& room, const std::vector<std::shared_ptr<PlayerSession>>& connected) {
    Item key = makeBossKey(npc.floor());
    const std::string msg = "\n*** " + npc.name() + " dropped a " + key.name + "! ***\n";
    logInfo("death", std::string{"Boss key dropped: npc="} + npc.name() +
            ", floor=" + std::to_string(npc.floor()) +
            ", key=" + key.id +
            ", room=" + room.id());
    room.addItem(std::move(key));
    for (const auto& attacker : connected) {
        ctx_.sink.sendMessage(attacker->name(), msg);
    }
}

void DeathResolver::recordAreaClear(const Npc& npc, const std::vector<std::shared_ptr<PlayerSession>>& connected) {
    const std::string& areaId = npc.stats().finalBossOfArea;
    if (ctx_.bosses == nullptr) {
        logDebug("death", std::string{"No boss tracker, skipping area clear for area="} + areaId);
        return;
    }
    const shared::AreaTitleConfig* titles = ctx_.config.findTitles(areaId);
    const bool wasUnlocked = ctx_.bosses->isFullyUnlocked();

    for (const auto& attacker : connected) {
        const BossKillResult result = ctx_.bosses->recordKill(areaId, attacker->name());
        if (!result.ok()) {
            logWarn("death", std::string{"Failed to record boss kill: area="} + areaId +
                    ", player=" + attacker->name() + ", error=" + result.error);
            continue;
        }

        if (result.firstKill) {
            for (const auto& session : ctx_.sessions.snapshot()) {
                ctx_.sink.sendMessage(session->name(), "\n*** " + attacker->name() + " has defeated " + npc.name() +
                                      " for the first time! ***\n");
            }
        }

        if (titles == nullptr) {
            continue;
        }
        const std::string& title = result.firstKill ? titles->firstClear : titles->sharedClear;
        if (!title.empty()) {
            attacker->addTitle(title);
            ctx_.sink.sendMessage(attacker->name(), "You have earned the title: " + title + "\n");
            logInfo("death", std::string{"Title awarded: player="} + attacker->name() +
                    ", title=" + title + ", area=" + areaId +
                    ", firstClear=" + (result.firstKill ? "true" : "false"));
        }
    }

    if (!wasUnlocked && ctx_.bosses->isFullyUnlocked()) {
        logInfo("death", std::string{"Final area unlocked by clear of area="} + areaId);
        for (const auto& session : ctx_.sessions.snapshot()) {
            ctx_.sink.sendMessage(session->name(), "\n*** A distant seal shatters. The final ascent is open! ***\n");
        }
    }
}

void DeathResolver::handlePlayerDeath(PlayerSession& victim, Npc& killer, Room& room) {
    logInfo("death", std::string{"Player died: player="} + victim.name() +
            ", killedBy=" + killer.name() +
            ", room=" + room.id());

    victim.recordDeath();
    victim.endCombat();
    killer.disengage(victim.name());

    Room* respawnRoom = ctx_.world.startingRoom();
    const std::string respawnName = respawnRoom ? respawnRoom->name() : std::string{"the starting room"};

    ctx_.sink.sendMessage(victim.name(), "\n\n*** YOU HAVE DIED ***\n");
    ctx_.sink.sendMessage(victim.name(), "You will respawn at " + respawnName + ".\n\n");

    room.broadcast(ctx_.sink, victim.name() + " has been slain by " + killer.name() + "!", { victim.name() });

    victim.restoreFull();

    if (respawnRoom == nullptr) {
        logError("death", std::string{"Starting room missing, leaving player in place: player="} + victim.name() +
                 ", startingRoom=" + ctx_.world.startingRoomId());
        return;
    }
    ctx_.world.movePlayer(victim, respawnRoom->id());
    ctx_.sink.sendMessage(victim.name(), ctx_.world.describeRoom(*respawnRoom, ctx_.npcs, victim.name()) + "\n");
}

} // namespace otm::combat
