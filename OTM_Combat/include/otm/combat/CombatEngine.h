#pragma once

#include <memory>
#include <string>
#include <utility>

#include <boost/asio.hpp>

#include "AggressionScanner.h"
#include "CombatResolver.h"
#include "CombatScheduler.h"
#include "DeathResolver.h"
#include "EngineContext.h"
#include "MobSpawner.h"
#include "PopulationController.h"
#include "RespawnScheduler.h"

namespace otm::combat {

/**
 * CombatEngine
 *
 * Wires the resolvers and the three background workers over a shared
 * EngineContext and exposes the player-facing entry points the hosting
 * server calls (connect, disconnect, attack, flee).
 */
class CombatEngine {
public:
    CombatEngine(boost::asio::io_context& ioContext, EngineContext& ctx, MobSpawner& spawner);

    void start();
    void stop();

    // Registers the session and places it in its room (the starting room if unset)
    bool connectPlayer(std::shared_ptr<PlayerSession> session);

    // Ends the player's fight and removes them from their room
    void disconnectPlayer(const std::string& playerName);

    std::string attack(const std::string& playerName, const std::string& npcName);
    std::string flee(const std::string& playerName);

    CombatScheduler& combatScheduler() { return combat_; }
    RespawnScheduler& respawnScheduler() { return respawn_; }
    PopulationController& populationController() { return population_; }
    CombatResolver& resolver() { return resolver_; }
    DeathResolver& deaths() { return deaths_; }

private:
    EngineContext& ctx_;
    DeathResolver deaths_;
    CombatResolver resolver_;
    AggressionScanner aggression_;
    CombatScheduler combat_;
    RespawnScheduler respawn_;
    PopulationController population_;
};

} // namespace otm::combat
