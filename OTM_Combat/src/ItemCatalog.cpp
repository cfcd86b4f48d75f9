#include "../include/otm/combat/ItemCatalog.h"

#include "../../OTM_Shared/include/otm/shared/Logger.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <utility>

using json = nlohmann::json;
using otm::shared::logInfo;
using otm::shared::logWarn;
using otm::shared::logError;

namespace otm::combat {

std::string bossKeyId(FloorNumber floor) {
    return "boss_key_floor_" + std::to_string(floor);
}

Item makeBossKey(FloorNumber floor) {
    Item key;
    key.id = bossKeyId(floor);
    key.name = "Boss Key (Floor " + std::to_string(floor) + ")";
    key.type = "key";
    key.description = "A heavy key taken from the guardian of floor " + std::to_string(floor) + ".";
    return key;
}

JsonItemCatalog::JsonItemCatalog(shared::RandomSource& rng)
    : rng_(rng) {
}

bool JsonItemCatalog::loadFromFile(const std::string& path) {
    logInfo("items", std::string{"Loading item catalog from: "} + path);

    std::ifstream file(path);
    if (!file.is_open()) {
        logError("items", std::string{"Failed to open item catalog: "} + path);
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return loadFromString(buffer.str(), path);
}

bool JsonItemCatalog::loadFromString(const std::string& jsonText, const std::string& sourceName) {
    json j;
    try {
        j = json::parse(jsonText);
    } catch (const json::exception& e) {
        logError("items", std::string{"Failed to parse JSON from "} + sourceName + ": " + e.what());
        return false;
    }

    if (!j.contains("items") || !j["items"].is_array()) {
        logError("items", std::string{"Item catalog does not contain 'items' array: "} + sourceName);
        return false;
    }

    int loaded = 0;
    int skipped = 0;
    for (const auto& entry : j["items"]) {
        try {
            Item item;
            item.id = entry.value("id", std::string{});
            item.name = entry.value("name", item.id);
            item.type = entry.value("type", std::string{"misc"});
            item.description = entry.value("description", std::string{});
            if (item.id.empty()) {
                logWarn("items", "Skipping item with empty id");
                ++skipped;
                continue;
            }
            addItem(std::move(item));
            ++loaded;
        } catch (const json::exception& e) {
            logWarn("items", std::string{"Skipping malformed item: "} + e.what());
            ++skipped;
        }
    }

    logInfo("items", std::string{"Loaded "} + std::to_string(loaded) + " item(s)" +
            (skipped > 0 ? " (" + std::to_string(skipped) + " skipped)" : ""));
    return true;
}

void JsonItemCatalog::addItem(Item item) {
    std::scoped_lock lock(mutex_);
    std::string id = item.id;
    items_[id] = std::move(item);
}

std::optional<Item> JsonItemCatalog::findItem(const std::string& itemId) const {
    std::scoped_lock lock(mutex_);
    auto it = items_.find(itemId);
    if (it == items_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> JsonItemCatalog::rollLoot(const Npc& npc) {
    return npc.rollLoot(rng_);
}

int JsonItemCatalog::rollGold(const Npc& npc) {
    return npc.rollGold(rng_);
}

std::size_t JsonItemCatalog::size() const {
    std::scoped_lock lock(mutex_);
    return items_.size();
}

} // namespace otm::combat
