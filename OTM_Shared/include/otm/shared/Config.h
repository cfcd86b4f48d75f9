#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include "Types.h"

namespace otm::shared {

struct CombatConfig {
    Milliseconds tickMs{ 3000 };
    double fleeChance{ 1.0 };     // probability an NPC below its threshold flees on a tick
    bool pilgrimMode{ false };    // server-wide: no combat at all
};

struct RespawnConfig {
    Milliseconds sweepMs{ 5000 };
    int minimumSeconds{ 1 };
};

struct PopulationConfig {
    bool enabled{ true };
    Milliseconds intervalMs{ 30000 };
    double targetMobsPerPlayer{ 5.0 };
    double baseMobsPerFloor{ 15.0 };
    int maxSpawnsPerFloor{ 5 };
};

/**
 * Titles granted for defeating the final boss of an area.
 * firstClear goes to whoever lands the server-first kill, sharedClear to later clears.
 * The capstone area stays locked until every other listed area has been cleared.
 */
struct AreaTitleConfig {
    std::string areaId;
    std::string firstClear;
    std::string sharedClear;
    bool capstone{ false };
};

struct EngineConfig {
    CombatConfig combat;
    RespawnConfig respawn;
    PopulationConfig population;

    RoomId startingRoom;
    std::string logLevel{ "INFO" };

    std::vector<AreaTitleConfig> titles;

    const AreaTitleConfig* findTitles(const std::string& areaId) const;
};

// Throws std::runtime_error on unreadable files, malformed JSON or missing required fields
EngineConfig loadEngineConfig(const std::string& path);
EngineConfig parseEngineConfig(const std::string& jsonText, const std::string& sourceName);

} // namespace otm::shared
