#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "../../../../OTM_Shared/include/otm/shared/Random.h"
#include "Npc.h"

namespace otm::combat {

struct Item {
    std::string id;
    std::string name;
    std::string type;       // "weapon", "armor", "consumable", "key", ...
    std::string description;
};

Item makeBossKey(FloorNumber floor);
std::string bossKeyId(FloorNumber floor);

/**
 * Item definitions plus the loot and gold rolls for a slain NPC.
 */
class LootCatalog {
public:
    virtual ~LootCatalog() = default;

    virtual std::optional<Item> findItem(const std::string& itemId) const = 0;
    virtual std::vector<std::string> rollLoot(const Npc& npc) = 0;
    virtual int rollGold(const Npc& npc) = 0;
};

/**
 * JsonItemCatalog
 *
 * Items loaded from items.json:
 *   { "items": [ { "id": "rusty_sword", "name": "a rusty sword", "type": "weapon" }, ... ] }
 * Rolls use the NPC's own loot table and gold range.
 */
class JsonItemCatalog : public LootCatalog {
public:
    explicit JsonItemCatalog(shared::RandomSource& rng);

    // Returns false when the file is missing or malformed; entries without an id are skipped
    bool loadFromFile(const std::string& path);
    bool loadFromString(const std::string& jsonText, const std::string& sourceName);
    void addItem(Item item);

    std::optional<Item> findItem(const std::string& itemId) const override;
    std::vector<std::string> rollLoot(const Npc& npc) override;
    int rollGold(const Npc& npc) override;

    std::size_t size() const;

private:
    shared::RandomSource& rng_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Item> items_;
};

} // namespace otm::combat
