#include "../include/otm/combat/WorldLoader.h"

#include "../../OTM_Shared/include/otm/shared/Logger.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;
using otm::shared::logInfo;
using otm::shared::logWarn;
using otm::shared::logError;

namespace otm::combat {

namespace {

/**
 * Helper: Parse NPC template from JSON object
 */
bool parseNpcTemplate(const json& j, NpcTemplate& out) {
    try {
        out.templateId = j.value("id", std::string{});
        out.name = j.value("name", std::string{});
        out.description = j.value("description", std::string{});
        out.level = j.value("level", 1);

        // Combat stats
        out.maxHealth = j.value("health", 10);
        out.armor = j.value("armor", 0);
        out.minDamage = j.value("min_damage", 1);
        out.maxDamage = j.value("max_damage", out.minDamage);
        out.experience = j.value("experience", 0);
        out.goldMin = j.value("gold_min", 0);
        out.goldMax = j.value("gold_max", 0);

        // Behavior flags
        out.aggressive = j.value("aggressive", false);
        out.attackable = j.value("attackable", true);
        out.unique = j.value("unique", false);
        out.boss = j.value("boss", false);
        out.finalBossOfArea = j.value("final_boss_of_area", std::string{});

        const std::string mobType = j.value("mob_type", std::string{"humanoid"});
        if (auto parsed = parseMobType(mobType)) {
            out.mobType = *parsed;
        } else {
            logWarn("world", std::string{"Template "} + out.templateId + " has unknown mob_type '" + mobType +
                    "', using humanoid");
            out.mobType = MobType::Humanoid;
        }
        out.fleeThreshold = j.value("flee_threshold", defaultFleeThreshold(out.mobType));

        // Respawn timing
        out.respawnMedianSec = j.value("respawn_median", 0);
        out.respawnVariationSec = j.value("respawn_variation", 0);

        out.minFloor = j.value("min_floor", 1);
        out.maxFloor = j.value("max_floor", out.minFloor);

        if (j.contains("loot") && j["loot"].is_array()) {
            for (const auto& entry : j["loot"]) {
                LootEntry loot;
                loot.itemId = entry.value("item", std::string{});
                loot.dropChance = entry.value("chance", 0.0);
                if (!loot.itemId.empty()) {
                    out.loot.push_back(loot);
                }
            }
        }
        return true;
    } catch (const json::exception& e) {
        logError("world", std::string{"Failed to parse NPC template: "} + e.what());
        return false;
    }
}

json parseOrThrow(const std::string& jsonText, const std::string& sourceName) {
    try {
        return json::parse(jsonText);
    } catch (const json::exception& e) {
        std::string msg = std::string{"Failed to parse JSON from "} + sourceName + ": " + e.what();
        logError("world", msg);
        throw std::runtime_error(msg);
    }
}

} // anonymous namespace

bool NpcTemplateStore::loadFromFile(const std::string& path) {
    logInfo("world", std::string{"Loading NPC templates from: "} + path);

    std::ifstream file(path);
    if (!file.is_open()) {
        logError("world", std::string{"Failed to open NPC templates file: "} + path);
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return loadFromString(buffer.str(), path);
}

bool NpcTemplateStore::loadFromString(const std::string& jsonText, const std::string& sourceName) {
    json j;
    try {
        j = json::parse(jsonText);
    } catch (const json::exception& e) {
        logError("world", std::string{"Failed to parse JSON from "} + sourceName + ": " + e.what());
        return false;
    }

    if (!j.contains("templates") || !j["templates"].is_array()) {
        logError("world", "NPC templates file does not contain 'templates' array");
        return false;
    }

    int loadedCount = 0;
    int skippedCount = 0;

    for (const auto& templateJson : j["templates"]) {
        NpcTemplate tmpl;
        if (!parseNpcTemplate(templateJson, tmpl)) {
            skippedCount++;
            continue;
        }

        if (tmpl.templateId.empty() || tmpl.name.empty()) {
            logWarn("world", "Skipping NPC template with empty id or name");
            skippedCount++;
            continue;
        }

        if (templates_.count(tmpl.templateId) > 0) {
            logWarn("world", std::string{"Duplicate template id="} + tmpl.templateId + ", skipping");
            skippedCount++;
            continue;
        }

        if (tmpl.maxHealth <= 0) {
            logWarn("world", std::string{"NPC template "} + tmpl.templateId +
                    " has invalid health " + std::to_string(tmpl.maxHealth) + ", using 10");
            tmpl.maxHealth = 10;
        }

        if (tmpl.minDamage > tmpl.maxDamage) {
            logWarn("world", std::string{"NPC template "} + tmpl.templateId + " has min_damage > max_damage, swapping");
            std::swap(tmpl.minDamage, tmpl.maxDamage);
        }

        if (tmpl.respawnMedianSec < 0 || tmpl.respawnVariationSec < 0) {
            logWarn("world", std::string{"NPC template "} + tmpl.templateId + " has negative respawn timing, disabling respawn");
            tmpl.respawnMedianSec = 0;
            tmpl.respawnVariationSec = 0;
        }

        shared::logDebug("world", std::string{"  Loaded NPC template: id="} + tmpl.templateId +
                         ", name=\"" + tmpl.name + "\"" +
                         ", level=" + std::to_string(tmpl.level) +
                         ", hp=" + std::to_string(tmpl.maxHealth) +
                         ", type=" + toString(tmpl.mobType) +
                         (tmpl.boss ? ", boss" : ""));
        add(std::move(tmpl));
        loadedCount++;
    }

    logInfo("world", std::string{"Loaded "} + std::to_string(loadedCount) + " NPC template(s)" +
            (skippedCount > 0 ? " (" + std::to_string(skippedCount) + " skipped)" : ""));
    return loadedCount > 0;
}

void NpcTemplateStore::add(NpcTemplate tmpl) {
    std::string id = tmpl.templateId;
    if (templates_.count(id) == 0) {
        order_.push_back(id);
    }
    templates_[id] = std::move(tmpl);
}

const NpcTemplate* NpcTemplateStore::find(const std::string& templateId) const {
    auto it = templates_.find(templateId);
    return it == templates_.end() ? nullptr : &it->second;
}

std::vector<const NpcTemplate*> NpcTemplateStore::forFloor(shared::FloorNumber floor) const {
    std::vector<const NpcTemplate*> result;
    for (const auto& id : order_) {
        const NpcTemplate& tmpl = templates_.at(id);
        if (!tmpl.boss && !tmpl.unique && floor >= tmpl.minFloor && floor <= tmpl.maxFloor) {
            result.push_back(&tmpl);
        }
    }
    return result;
}

std::vector<SpawnPoint> loadWorldFromString(const std::string& jsonText, const std::string& sourceName, World& world) {
    const json j = parseOrThrow(jsonText, sourceName);

    if (!j.contains("rooms") || !j["rooms"].is_array() || j["rooms"].empty()) {
        std::string msg = std::string{"World file has no 'rooms' array: "} + sourceName;
        logError("world", msg);
        throw std::runtime_error(msg);
    }

    struct PendingExit {
        Room* room;
        std::string direction;
        shared::RoomId target;
    };
    std::vector<PendingExit> pendingExits;

    try {
        for (const auto& roomJson : j["rooms"]) {
            const std::string id = roomJson.at("id").get<std::string>();
            Room* room = world.addRoom(id,
                                       roomJson.value("name", id),
                                       roomJson.value("description", std::string{}),
                                       roomJson.value("floor", 0),
                                       parseRoomKind(roomJson.value("kind", std::string{"normal"})));
            if (room == nullptr) {
                logWarn("world", std::string{"Duplicate room id="} + id + ", skipping");
                continue;
            }
            if (roomJson.contains("exits") && roomJson["exits"].is_object()) {
                for (const auto& [direction, target] : roomJson["exits"].items()) {
                    pendingExits.push_back(PendingExit{ room, direction, target.get<std::string>() });
                }
            }
        }
    } catch (const json::exception& e) {
        std::string msg = std::string{"Malformed room in "} + sourceName + ": " + e.what();
        logError("world", msg);
        throw std::runtime_error(msg);
    }

    for (const auto& exit : pendingExits) {
        if (world.findRoom(exit.target) == nullptr) {
            logWarn("world", std::string{"Room "} + exit.room->id() + " exit " + exit.direction +
                    " leads to unknown room " + exit.target + ", dropping");
            continue;
        }
        exit.room->addExit(exit.direction, exit.target);
    }

    std::vector<SpawnPoint> spawns;
    if (j.contains("spawns") && j["spawns"].is_array()) {
        for (const auto& spawnJson : j["spawns"]) {
            SpawnPoint spawn;
            spawn.templateId = spawnJson.value("template", std::string{});
            spawn.room = spawnJson.value("room", std::string{});
            const int count = spawnJson.value("count", 1);
            if (spawn.templateId.empty() || world.findRoom(spawn.room) == nullptr) {
                logWarn("world", std::string{"Skipping spawn template="} + spawn.templateId + ", room=" + spawn.room);
                continue;
            }
            for (int i = 0; i < count; ++i) {
                spawns.push_back(spawn);
            }
        }
    }

    logInfo("world", std::string{"World loaded: rooms="} + std::to_string(world.rooms().size()) +
            ", floors=" + std::to_string(world.floorCount()) +
            ", spawns=" + std::to_string(spawns.size()));
    return spawns;
}

std::vector<SpawnPoint> loadWorld(const std::string& path, World& world) {
    logInfo("world", std::string{"Loading world from: "} + path);

    std::ifstream file(path);
    if (!file.is_open()) {
        std::string msg = std::string{"Failed to open world file: "} + path;
        logError("world", msg);
        throw std::runtime_error(msg);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return loadWorldFromString(buffer.str(), path, world);
}

} // namespace otm::combat
