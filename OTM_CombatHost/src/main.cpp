#include <csignal>
#include <exception>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio.hpp>

#include "../../OTM_Shared/include/otm/shared/Logger.h"
#include "../../OTM_Shared/include/otm/shared/Config.h"
#include "../../OTM_Shared/include/otm/shared/Random.h"
#include "../../OTM_Combat/include/otm/combat/BossTracker.h"
#include "../../OTM_Combat/include/otm/combat/CombatEngine.h"
#include "../../OTM_Combat/include/otm/combat/ItemCatalog.h"
#include "../../OTM_Combat/include/otm/combat/MessageSink.h"
#include "../../OTM_Combat/include/otm/combat/MobSpawner.h"
#include "../../OTM_Combat/include/otm/combat/WorldLoader.h"

namespace {
    // Helper to parse command-line arguments in format: --key=value
    bool parseArgument(const std::string& arg, const std::string& prefix, std::string& outValue) {
        if (arg.size() > prefix.size() && arg.substr(0, prefix.size()) == prefix) {
            outValue = arg.substr(prefix.size());
            return true;
        }
        return false;
    }

    // Stand-in transport: player-bound text goes to the log
    class ConsoleSink : public otm::combat::MessageSink {
    public:
        void sendMessage(const std::string& playerName, const std::string& text) override {
            otm::shared::logInfo("session", std::string{"-> "} + playerName + ": " + text);
        }
    };

    std::unique_ptr<otm::combat::InMemoryBossTracker> makeBossTracker(const otm::shared::EngineConfig& config) {
        std::vector<std::string> prerequisites;
        std::string capstone;
        for (const auto& area : config.titles) {
            if (area.capstone) {
                capstone = area.areaId;
            } else {
                prerequisites.push_back(area.areaId);
            }
        }
        return std::make_unique<otm::combat::InMemoryBossTracker>(std::move(prerequisites), std::move(capstone));
    }
}

int main(int argc, char* argv[]) {
    try {
        otm::shared::initLogger("OTM_CombatHost");

        std::string configPath = "config/engine_config.json";
        std::string worldPath = "config/world.json";
        std::string templatesPath = "config/npc_templates.json";
        std::string itemsPath = "config/items.json";
        unsigned int threads = 2;
        std::vector<std::string> demoPlayers;

        otm::shared::logInfo("Main", std::string{"Parsing "} + std::to_string(argc - 1) + " command-line argument(s)");

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            std::string value;

            if (parseArgument(arg, "--config=", value)) {
                configPath = value;
            }
            else if (parseArgument(arg, "--world=", value)) {
                worldPath = value;
            }
            else if (parseArgument(arg, "--templates=", value)) {
                templatesPath = value;
            }
            else if (parseArgument(arg, "--items=", value)) {
                itemsPath = value;
            }
            else if (parseArgument(arg, "--threads=", value)) {
                try {
                    threads = static_cast<unsigned int>(std::stoul(value));
                    if (threads == 0) {
                        threads = 1;
                    }
                } catch (const std::exception& e) {
                    otm::shared::logError("Main", std::string{"Failed to parse --threads value '"} + value + "': " + e.what());
                    return 1;
                }
            }
            else if (parseArgument(arg, "--player=", value)) {
                demoPlayers.push_back(value);
            }
            else {
                otm::shared::logWarn("Main", std::string{"Unknown command-line argument: "} + arg);
            }
        }

        const auto config = otm::shared::loadEngineConfig(configPath);
        otm::shared::setLogLevel(otm::shared::parseLogLevel(config.logLevel));

        otm::combat::World world;
        const auto spawns = otm::combat::loadWorld(worldPath, world);
        world.setStartingRoom(config.startingRoom);
        if (world.startingRoom() == nullptr) {
            otm::shared::logError("Main", std::string{"Starting room not found in world: "} + config.startingRoom);
            return 1;
        }

        otm::combat::NpcTemplateStore templates;
        if (!templates.loadFromFile(templatesPath)) {
            otm::shared::logError("Main", "No NPC templates loaded; cannot populate world");
            return 1;
        }

        otm::shared::MtRandomSource rng;
        otm::combat::JsonItemCatalog items(rng);
        otm::combat::LootCatalog* loot = &items;
        if (!items.loadFromFile(itemsPath)) {
            otm::shared::logWarn("Main", "Item catalog unavailable; loot and gold drops disabled");
            loot = nullptr;
        }

        auto bosses = makeBossTracker(config);

        otm::combat::NpcRegistry npcs;
        otm::combat::SessionRegistry sessions;
        otm::combat::RespawnQueue respawns;
        ConsoleSink sink;

        otm::combat::EngineContext ctx{ config, world, npcs, sessions, sink, rng, respawns, loot, bosses.get() };

        otm::combat::MobSpawner spawner(world, npcs, templates, rng);
        spawner.spawnInitial(spawns);

        boost::asio::io_context ioContext;
        auto workGuard = boost::asio::make_work_guard(ioContext);

        otm::combat::CombatEngine engine(ioContext, ctx, spawner);

        for (const auto& name : demoPlayers) {
            auto session = std::make_shared<otm::combat::PlayerSession>(
                name, otm::combat::PlayerClass::Warrior, otm::combat::AbilityScores{ 14, 12, 14, 10, 10, 10 });
            engine.connectPlayer(session);
        }

        boost::asio::signal_set signals(ioContext, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signalNumber) {
            if (ec) {
                return;
            }
            otm::shared::logInfo("Main", std::string{"Signal "} + std::to_string(signalNumber) + " received, shutting down");
            engine.stop();
            workGuard.reset();
        });

        engine.start();

        std::vector<std::thread> pool;
        for (unsigned int i = 1; i < threads; ++i) {
            pool.emplace_back([&ioContext]() { ioContext.run(); });
        }
        ioContext.run();
        for (auto& t : pool) {
            t.join();
        }

        otm::shared::logInfo("Main", "Combat host stopped");
    } catch (const std::exception& ex) {
        otm::shared::logError("Main", std::string("Fatal exception: ") + ex.what());
        otm::shared::logError("Main", "CombatHost cannot start.");
        return 1;
    } catch (...) {
        otm::shared::logError("Main", "Unknown fatal exception occurred.");
        return 1;
    }
    return 0;
}
