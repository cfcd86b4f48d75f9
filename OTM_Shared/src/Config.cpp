#include "../include/otm/shared/Config.h"
#include "../include/otm/shared/Logger.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace otm::shared {

namespace {
    // Helper: safely get a JSON value with type checking and default
    template<typename T>
    T getOrDefault(const json& j, const std::string& key, const T& defaultValue) {
        if (j.contains(key)) {
            try {
                return j[key].get<T>();
            } catch (const json::exception& e) {
                logWarn("Config", std::string{"Failed to parse key '"} + key + "': " + e.what() + " (using default)");
                return defaultValue;
            }
        }
        return defaultValue;
    }

    // Helper: safely get a required JSON value
    template<typename T>
    T getRequired(const json& j, const std::string& key, const std::string& configName) {
        if (!j.contains(key)) {
            std::string msg = std::string{"Missing required field '"} + key + "' in " + configName;
            logError("Config", msg);
            throw std::runtime_error(msg);
        }
        try {
            return j[key].get<T>();
        } catch (const json::exception& e) {
            std::string msg = std::string{"Failed to parse required field '"} + key + "' in " + configName + ": " + e.what();
            logError("Config", msg);
            throw std::runtime_error(msg);
        }
    }

    const json& section(const json& root, const std::string& key) {
        static const json empty = json::object();
        if (root.contains(key) && root[key].is_object()) {
            return root[key];
        }
        return empty;
    }

    [[noreturn]] void fail(const std::string& msg) {
        logError("Config", msg);
        throw std::runtime_error(msg);
    }
}

const AreaTitleConfig* EngineConfig::findTitles(const std::string& areaId) const {
    for (const auto& t : titles) {
        if (t.areaId == areaId) {
            return &t;
        }
    }
    return nullptr;
}

EngineConfig parseEngineConfig(const std::string& jsonText, const std::string& sourceName) {
    json j;
    try {
        j = json::parse(jsonText);
    } catch (const json::exception& e) {
        fail(std::string{"Failed to parse EngineConfig JSON from "} + sourceName + ": " + e.what());
    }

    EngineConfig cfg;

    const json& combat = section(j, "combat");
    cfg.combat.tickMs = getOrDefault<Milliseconds>(combat, "tick_ms", 3000);
    cfg.combat.fleeChance = getOrDefault<double>(combat, "flee_chance", 1.0);
    cfg.combat.pilgrimMode = getOrDefault<bool>(combat, "pilgrim_mode", false);

    const json& respawn = section(j, "respawn");
    cfg.respawn.sweepMs = getOrDefault<Milliseconds>(respawn, "sweep_ms", 5000);
    cfg.respawn.minimumSeconds = getOrDefault<int>(respawn, "minimum_seconds", 1);

    const json& population = section(j, "population");
    cfg.population.enabled = getOrDefault<bool>(population, "enabled", true);
    cfg.population.intervalMs = getOrDefault<Milliseconds>(population, "interval_ms", 30000);
    cfg.population.targetMobsPerPlayer = getOrDefault<double>(population, "target_mobs_per_player", 5.0);
    cfg.population.baseMobsPerFloor = getOrDefault<double>(population, "base_mobs_per_floor", 15.0);
    cfg.population.maxSpawnsPerFloor = getOrDefault<int>(population, "max_spawns_per_floor", 5);

    if (!j.contains("world") || !j["world"].is_object()) {
        fail(std::string{"Missing 'world' section in "} + sourceName);
    }
    cfg.startingRoom = getRequired<std::string>(j["world"], "starting_room", sourceName);

    cfg.logLevel = getOrDefault<std::string>(section(j, "logging"), "level", "INFO");

    if (j.contains("titles") && j["titles"].is_array()) {
        for (const auto& t : j["titles"]) {
            AreaTitleConfig title;
            title.areaId = getRequired<std::string>(t, "area_id", sourceName);
            title.firstClear = getOrDefault<std::string>(t, "first_clear", "");
            title.sharedClear = getOrDefault<std::string>(t, "shared_clear", "");
            title.capstone = getOrDefault<bool>(t, "capstone", false);
            cfg.titles.push_back(title);
        }
    }

    // Validation
    if (cfg.startingRoom.empty()) {
        fail(std::string{"starting_room must not be empty in "} + sourceName);
    }
    if (cfg.combat.fleeChance < 0.0 || cfg.combat.fleeChance > 1.0) {
        logWarn("Config", std::string{"combat.flee_chance out of range ("} + std::to_string(cfg.combat.fleeChance) +
                "), clamping to [0,1]");
        cfg.combat.fleeChance = cfg.combat.fleeChance < 0.0 ? 0.0 : 1.0;
    }
    if (cfg.respawn.minimumSeconds < 1) {
        logWarn("Config", "respawn.minimum_seconds < 1, using 1");
        cfg.respawn.minimumSeconds = 1;
    }
    if (cfg.population.baseMobsPerFloor <= 0.0) {
        fail(std::string{"population.base_mobs_per_floor must be positive in "} + sourceName);
    }
    if (cfg.population.maxSpawnsPerFloor < 0) {
        logWarn("Config", "population.max_spawns_per_floor < 0, using 0");
        cfg.population.maxSpawnsPerFloor = 0;
    }

    logInfo("Config", std::string{"EngineConfig loaded: combatTickMs="} + std::to_string(cfg.combat.tickMs) +
            ", respawnSweepMs=" + std::to_string(cfg.respawn.sweepMs) +
            ", populationEnabled=" + (cfg.population.enabled ? "true" : "false") +
            ", pilgrimMode=" + (cfg.combat.pilgrimMode ? "true" : "false") +
            ", startingRoom=" + cfg.startingRoom +
            ", titles=" + std::to_string(cfg.titles.size()));
    return cfg;
}

EngineConfig loadEngineConfig(const std::string& path) {
    logInfo("Config", std::string{"Loading EngineConfig from: "} + path);

    std::ifstream file(path);
    if (!file.is_open()) {
        fail(std::string{"Failed to open EngineConfig file: "} + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseEngineConfig(buffer.str(), path);
}

} // namespace otm::shared
