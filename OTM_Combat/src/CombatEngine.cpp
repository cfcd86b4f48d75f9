#include "../include/otm/combat/CombatEngine.h"

#include "../../OTM_Shared/include/otm/shared/Logger.h"

#include <utility>

namespace otm::combat {

CombatEngine::CombatEngine(boost::asio::io_context& ioContext, EngineContext& ctx, MobSpawner& spawner)
    : ctx_(ctx)
    , deaths_(ctx)
    , resolver_(ctx, deaths_)
    , aggression_(ctx)
    , combat_(ioContext, ctx, resolver_, aggression_)
    , respawn_(ioContext, ctx)
    , population_(ioContext, ctx, spawner) {
}

void CombatEngine::start() {
    shared::logInfo("engine", std::string{"Starting combat engine: rooms="} + std::to_string(ctx_.world.rooms().size()) +
                    ", npcs=" + std::to_string(ctx_.npcs.size()) +
                    ", floors=" + std::to_string(ctx_.world.floorCount()));
    combat_.start();
    respawn_.start();
    population_.start();
}

void CombatEngine::stop() {
    combat_.stop();
    respawn_.stop();
    population_.stop();
}

bool CombatEngine::connectPlayer(std::shared_ptr<PlayerSession> session) {
    if (!session) {
        return false;
    }
    Room* room = ctx_.world.findRoom(session->room());
    if (room == nullptr) {
        room = ctx_.world.startingRoom();
    }
    if (room == nullptr) {
        shared::logError("engine", std::string{"No room for connecting player="} + session->name());
        return false;
    }

    PlayerSession& player = *session;
    if (!ctx_.sessions.add(std::move(session))) {
        return false;
    }
    ctx_.world.placePlayer(player, *room);
    room->broadcast(ctx_.sink, player.name() + " has arrived.", { player.name() });
    return true;
}

void CombatEngine::disconnectPlayer(const std::string& playerName) {
    auto session = ctx_.sessions.find(playerName);
    if (!session) {
        return;
    }
    // NPC threat entries are left in place; the next NPC attack drops them
    session->endCombat();
    if (Room* room = ctx_.world.findRoom(session->room())) {
        room->removePlayer(playerName);
    }
    ctx_.sessions.remove(playerName);
}

std::string CombatEngine::attack(const std::string& playerName, const std::string& npcName) {
    auto session = ctx_.sessions.find(playerName);
    if (!session) {
        return {};
    }
    return resolver_.engage(*session, npcName);
}

std::string CombatEngine::flee(const std::string& playerName) {
    auto session = ctx_.sessions.find(playerName);
    if (!session) {
        return {};
    }
    return resolver_.retreat(*session);
}

} // namespace otm::combat
