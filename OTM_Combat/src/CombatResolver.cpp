#include "../include/otm/combat/CombatResolver.h"

#include "../../OTM_Shared/include/otm/shared/Logger.h"

namespace otm::combat {

using shared::logDebug;
using shared::logInfo;
using shared::logWarn;

CombatResolver::CombatResolver(EngineContext& ctx, DeathResolver& deaths)
    : ctx_(ctx)
    , deaths_(deaths) {
}

void CombatResolver::notifyFighters(const Npc& npc, const std::string& exclude, const std::string& text) {
    for (const auto& name : npc.attackers()) {
        if (name == exclude) {
            continue;
        }
        if (ctx_.sessions.find(name)) {
            ctx_.sink.sendMessage(name, text);
        }
    }
}

void CombatResolver::resolvePlayerAttack(PlayerSession& player, shared::TimePoint now) {
    const auto target = player.combatTarget();
    if (!target) {
        return;
    }

    Room* room = ctx_.world.findRoom(player.room());
    if (room == nullptr) {
        logWarn("combat", std::string{"Player in unknown room, skipping attack: player="} + player.name() +
                ", room=" + player.room());
        return;
    }

    // the handle must still name a living NPC in this room that is fighting this player
    const auto npc = ctx_.npcs.get(*target);
    if (npc == nullptr || !npc->isAlive() || !room->hasNpc(*target) || !npc->isEngagedWith(player.name())) {
        logDebug("combat", std::string{"Combat target vanished: player="} + player.name() +
                 ", handle=" + std::to_string(*target) + ", room=" + room->id());
        player.endCombat();
        ctx_.sink.sendMessage(player.name(), "\nYour opponent has vanished!\n");
        return;
    }

    const bool ranged = player.hasRangedWeapon();
    const char* verb = ranged ? "shoot at" : "swing at";
    const char* verbOther = ranged ? "shoots at" : "swings at";

    const AttackRoll roll = player.rollAttack(ctx_.rng);
    const int ac = npc->armorClass();
    const bool hit = roll.total >= ac;

    logDebug("combat", std::string{"Player attack roll: player="} + player.name() +
             ", npc=" + npc->name() +
             ", roll=" + std::to_string(roll.total) +
             ", breakdown=" + roll.breakdown() +
             ", ac=" + std::to_string(ac) +
             ", hit=" + (hit ? "1" : "0"));

    if (!hit) {
        ctx_.sink.sendMessage(player.name(), "\nYou " + std::string{verb} + " " + npc->name() + "... (" +
                              roll.breakdown() + " vs AC " + std::to_string(ac) + ") Miss!\n");
        notifyFighters(*npc, player.name(),
                       "\n" + player.name() + " " + verbOther + " " + npc->name() + " and misses!\n");
        return;
    }

    // sneak attack: first damage this attacker lands on this NPC
    const bool sneakAttack = npc->threatOf(player.name()) == 0;
    const int rawDamage = player.rollDamageAgainst(npc->mobType(), sneakAttack, ctx_.rng);
    const int dealt = npc->takeDamage(rawDamage);
    npc->addThreat(player.name(), dealt);

    const int hp = npc->health();
    const int maxHp = npc->maxHealth();

    logDebug("combat", std::string{"Player damage dealt: player="} + player.name() +
             ", npc=" + npc->name() +
             ", damage=" + std::to_string(dealt) +
             ", sneak=" + (sneakAttack ? "1" : "0") +
             ", hp=" + std::to_string(hp) + "/" + std::to_string(maxHp));

    ctx_.sink.sendMessage(player.name(), "\nYou " + std::string{verb} + " " + npc->name() + "... (" +
                          roll.breakdown() + " vs AC " + std::to_string(ac) + ") Hit!\nYou deal " +
                          std::to_string(dealt) + " damage! (" + std::to_string(hp) + "/" +
                          std::to_string(maxHp) + " HP)\n");
    notifyFighters(*npc, player.name(),
                   "\n" + player.name() + " hits " + npc->name() + " for " + std::to_string(dealt) +
                   " damage! (" + std::to_string(hp) + "/" + std::to_string(maxHp) + " HP)\n");

    if (hp == 0) {
        deaths_.handleNpcDeath(*npc, *room, now);
    }
}

bool CombatResolver::fleeNpc(Npc& npc, Room& room) {
    const auto exits = room.horizontalExits();
    if (exits.empty()) {
        return false;
    }
    const Exit& exit = exits[ctx_.rng.nextInt(0, static_cast<int>(exits.size()) - 1)];
    if (ctx_.world.findRoom(exit.target) == nullptr) {
        return false;
    }

    const auto fighters = npc.attackers();
    npc.beginFlee();

    for (const auto& name : fighters) {
        auto fighter = ctx_.sessions.find(name);
        if (fighter && fighter->isTargeting(npc.handle())) {
            fighter->endCombat();
        }
    }

    room.broadcast(ctx_.sink, npc.name() + " flees " + exit.direction + "!");
    ctx_.world.moveNpc(npc, exit.target);

    logInfo("combat", std::string{"NPC fled: npc="} + npc.name() +
            ", handle=" + std::to_string(npc.handle()) +
            ", from=" + room.id() +
            ", to=" + exit.target +
            ", hp=" + std::to_string(npc.health()) + "/" + std::to_string(npc.maxHealth()));
    return true;
}

void CombatResolver::resolveNpcAttack(Npc& npc, shared::TimePoint now) {
    if (!npc.isInCombat()) {
        return;
    }
    if (npc.isStunned(now)) {
        logDebug("combat", std::string{"NPC stunned, skipping attack: npc="} + npc.name());
        return;
    }

    Room* room = ctx_.world.findRoom(npc.currentRoom());
    if (room == nullptr) {
        logWarn("combat", std::string{"NPC in unknown room, skipping attack: npc="} + npc.name() +
                ", handle=" + std::to_string(npc.handle()) + ", room=" + npc.currentRoom());
        return;
    }

    if (npc.shouldFlee(now, ctx_.rng, ctx_.config.combat.fleeChance) && fleeNpc(npc, *room)) {
        return;
    }

    const std::string targetName = npc.highestThreatTarget();
    if (targetName.empty()) {
        npc.endCombat();
        return;
    }

    auto target = ctx_.sessions.find(targetName);
    if (!target || !target->isAlive()) {
        logDebug("combat", std::string{"Dropping missing target: npc="} + npc.name() + ", target=" + targetName);
        npc.disengage(targetName);
        if (target && target->isTargeting(npc.handle())) {
            target->endCombat();
        }
        return;
    }

    if (target->room() != room->id()) {
        logDebug("combat", std::string{"Combat target left room: npc="} + npc.name() +
                 ", target=" + targetName +
                 ", npcRoom=" + room->id() +
                 ", targetRoom=" + target->room());
        npc.disengage(targetName);
        if (target->isTargeting(npc.handle())) {
            target->endCombat();
        }
        return;
    }

    const int rawDamage = npc.rollAttackDamage(ctx_.rng);
    const int taken = target->takeDamage(rawDamage);

    logDebug("combat", std::string{"NPC attack: npc="} + npc.name() +
             ", target=" + targetName +
             ", damage=" + std::to_string(taken) +
             ", hp=" + std::to_string(target->health()) + "/" + std::to_string(target->maxHealth()));

    for (const auto& fighterName : npc.attackers()) {
        if (fighterName == targetName) {
            ctx_.sink.sendMessage(fighterName, npc.name() + " hits you for " + std::to_string(taken) +
                                  " damage! (" + std::to_string(target->health()) + "/" +
                                  std::to_string(target->maxHealth()) + " HP)\n");
        } else if (ctx_.sessions.find(fighterName)) {
            ctx_.sink.sendMessage(fighterName, npc.name() + " hits " + targetName + " for " +
                                  std::to_string(taken) + " damage!\n");
        }
    }

    if (!target->isAlive()) {
        deaths_.handlePlayerDeath(*target, npc, *room);
    }
}

std::string CombatResolver::engage(PlayerSession& player, const std::string& npcName) {
    if (ctx_.config.combat.pilgrimMode) {
        return "This server is in pilgrim mode - exploration only!";
    }
    if (player.isInCombat()) {
        return "You are already fighting!";
    }
    if (npcName.empty()) {
        return "Usage: attack <target>";
    }

    Room* room = ctx_.world.findRoom(player.room());
    if (room == nullptr) {
        logWarn("combat", std::string{"engage from unknown room: player="} + player.name() + ", room=" + player.room());
        return "You are not in a valid room.";
    }

    const auto npc = ctx_.world.findNpcInRoom(*room, npcName, ctx_.npcs);
    if (npc == nullptr) {
        return "You don't see '" + npcName + "' here.";
    }
    if (!npc->isAttackable()) {
        return "You cannot attack " + npc->name() + "!";
    }

    const bool joining = npc->isInCombat();
    if (!npc->engage(player.name())) {
        return "You don't see '" + npcName + "' here.";
    }
    player.startCombat(npc->handle());

    logInfo("combat", std::string{"Combat engaged: player="} + player.name() +
            ", npc=" + npc->name() +
            ", handle=" + std::to_string(npc->handle()) +
            ", room=" + room->id() +
            ", joining=" + (joining ? "1" : "0"));

    if (joining) {
        room->broadcast(ctx_.sink, player.name() + " joins the fight against " + npc->name() + "!", { player.name() });
        return "You join the fight against " + npc->name() + "!\n\nType 'flee' to escape.";
    }
    room->broadcast(ctx_.sink, player.name() + " attacks " + npc->name() + "!", { player.name() });
    return "You attack " + npc->name() + "!\n\nCombat initiated! Type 'flee' to escape.";
}

std::string CombatResolver::retreat(PlayerSession& player) {
    if (!player.isInCombat()) {
        return "You aren't fighting anyone!";
    }

    Room* room = ctx_.world.findRoom(player.room());
    if (room == nullptr) {
        player.endCombat();
        logWarn("combat", std::string{"retreat from unknown room: player="} + player.name() + ", room=" + player.room());
        return "You are not in a valid room.";
    }

    const auto target = player.combatTarget();
    player.endCombat();
    const auto npc = target ? ctx_.npcs.get(*target) : nullptr;
    if (npc == nullptr || !npc->isAlive() || !room->hasNpc(*target)) {
        return "Your opponent has vanished!";
    }
    npc->disengage(player.name());

    const auto& exits = room->exits();
    if (exits.empty()) {
        return "You can't escape - there are no exits!";
    }
    const Exit& exit = exits[ctx_.rng.nextInt(0, static_cast<int>(exits.size()) - 1)];

    room->broadcast(ctx_.sink, player.name() + " flees from combat " + exit.direction + "!", { player.name() });
    if (!ctx_.world.movePlayer(player, exit.target)) {
        return "Flee failed - exit is blocked!";
    }

    logInfo("combat", std::string{"Player fled: player="} + player.name() +
            ", npc=" + npc->name() + ", to=" + exit.target);

    Room* dest = ctx_.world.findRoom(exit.target);
    return "You flee " + exit.direction + "!\n\n" + ctx_.world.describeRoom(*dest, ctx_.npcs, player.name());
}

} // namespace otm::combat
