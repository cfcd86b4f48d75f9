#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "../../../../OTM_Shared/include/otm/shared/Types.h"
#include "Npc.h"
#include "World.h"

namespace otm::combat {

/**
 * NpcTemplateStore
 *
 * NPC stat blocks keyed by template id, loaded from npc_templates.json:
 *
 *   { "templates": [ { "id": "cave_rat", "name": "Cave Rat", "health": 12,
 *                      "min_damage": 1, "max_damage": 3, "mob_type": "beast",
 *                      "respawn_median": 60, "respawn_variation": 15,
 *                      "loot": [ { "item": "rat_tail", "chance": 40 } ] } ] }
 */
class NpcTemplateStore {
public:
    bool loadFromFile(const std::string& path);
    bool loadFromString(const std::string& jsonText, const std::string& sourceName);

    void add(NpcTemplate tmpl);

    const NpcTemplate* find(const std::string& templateId) const;

    // Non-boss templates whose floor range covers the floor
    std::vector<const NpcTemplate*> forFloor(shared::FloorNumber floor) const;

    std::size_t size() const { return templates_.size(); }

private:
    std::unordered_map<std::string, NpcTemplate> templates_;
    std::vector<std::string> order_;
};

struct SpawnPoint {
    std::string templateId;
    shared::RoomId room;
};

// Rooms and initial spawns from world.json. Throws std::runtime_error on
// unreadable or malformed input; exits to unknown rooms are dropped with a warning.
std::vector<SpawnPoint> loadWorld(const std::string& path, World& world);
std::vector<SpawnPoint> loadWorldFromString(const std::string& jsonText, const std::string& sourceName, World& world);

} // namespace otm::combat
