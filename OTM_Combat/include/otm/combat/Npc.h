#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../../../../OTM_Shared/include/otm/shared/Types.h"
#include "../../../../OTM_Shared/include/otm/shared/Random.h"
#include "ThreatTable.h"

namespace otm::combat {

using shared::FloorNumber;
using shared::NpcHandle;
using shared::RoomId;
using shared::TimePoint;

enum class MobType {
    Beast,
    Humanoid,
    Undead,
    Demon,
    Construct,
    Giant
};

enum class NpcState {
    Idle,
    InCombat,
    Fleeing,
    DeadPendingRespawn
};

const char* toString(MobType type);
const char* toString(NpcState state);
std::optional<MobType> parseMobType(const std::string& name);

// Fraction of max health at or below which a mob of this type tries to flee (0 = never)
double defaultFleeThreshold(MobType type);

struct LootEntry {
    std::string itemId;
    double dropChance{ 0.0 };   // percent, 0-100
};

/**
 * NpcTemplate
 *
 * Immutable stat block shared by every instance spawned from it.
 */
struct NpcTemplate {
    std::string templateId;
    std::string name;
    std::string description;

    int level{ 1 };
    int maxHealth{ 10 };
    int armor{ 0 };
    int minDamage{ 1 };
    int maxDamage{ 2 };
    int experience{ 0 };
    int goldMin{ 0 };
    int goldMax{ 0 };

    bool aggressive{ false };
    bool attackable{ true };
    bool unique{ false };
    bool boss{ false };
    std::string finalBossOfArea;   // non-empty when killing this boss clears an area

    MobType mobType{ MobType::Humanoid };
    double fleeThreshold{ 0.12 };

    int respawnMedianSec{ 0 };     // 0 disables respawn
    int respawnVariationSec{ 0 };

    // Floors this template may be placed on by the population spawner
    int minFloor{ 1 };
    int maxFloor{ 1 };

    std::vector<LootEntry> loot;
};

/**
 * Npc
 *
 * One monster instance. Reset in place on respawn, so its handle and name
 * stay valid for outside bookkeeping while it keeps coming back.
 *
 * All members are guarded by an internal mutex; methods never call back into
 * other entities while holding it.
 */
class Npc {
public:
    Npc(NpcHandle handle, NpcTemplate tmpl, RoomId originRoom, FloorNumber floor, bool respawns = true);

    NpcHandle handle() const { return handle_; }
    const std::string& name() const { return template_.name; }
    const NpcTemplate& stats() const { return template_; }
    const RoomId& originRoom() const { return originRoom_; }
    FloorNumber floor() const { return floor_; }
    bool isBoss() const { return template_.boss; }
    bool isAggressive() const { return template_.aggressive; }
    bool isAttackable() const { return template_.attackable; }
    MobType mobType() const { return template_.mobType; }
    int maxHealth() const { return template_.maxHealth; }
    int armorClass() const { return 10 + template_.armor; }
    int experience() const { return template_.experience; }

    RoomId currentRoom() const;
    void setCurrentRoom(const RoomId& roomId);

    NpcState state() const;
    bool isAlive() const;
    bool isInCombat() const;
    int health() const;

    // Combat
    bool engage(const std::string& attacker);
    void disengage(const std::string& attacker);
    void endCombat();
    bool isEngagedWith(const std::string& attacker) const;
    std::vector<std::string> attackers() const;
    int threatOf(const std::string& attacker) const;
    void addThreat(const std::string& attacker, int amount);
    std::string highestThreatTarget() const;

    // Armor-reduced damage (minimum 1), health clamped at 0. Returns damage actually taken.
    int takeDamage(int rawDamage);
    int rollAttackDamage(shared::RandomSource& rng) const;

    // Lifecycle
    // Alive -> DeadPendingRespawn exactly once; returns the attacker list captured
    // before combat state is cleared, or nullopt if already dead.
    std::optional<std::vector<std::string>> markDead();
    void beginFlee();
    void reset();

    // nullopt when respawn is disabled for this instance
    std::optional<TimePoint> computeRespawnDeadline(TimePoint now, shared::RandomSource& rng, int minimumSeconds) const;

    void stun(std::chrono::seconds duration, TimePoint now);
    void root(std::chrono::seconds duration, TimePoint now);
    bool isStunned(TimePoint now) const;
    bool isRooted(TimePoint now) const;

    bool shouldFlee(TimePoint now, shared::RandomSource& rng, double fleeChance) const;

    std::vector<std::string> rollLoot(shared::RandomSource& rng) const;
    int rollGold(shared::RandomSource& rng) const;

private:
    const NpcHandle handle_;
    const NpcTemplate template_;
    const RoomId originRoom_;
    const FloorNumber floor_;
    const bool respawns_;

    mutable std::mutex mutex_;
    RoomId currentRoom_;
    NpcState state_{ NpcState::Idle };
    int health_{ 0 };
    ThreatTable threat_;
    TimePoint stunEnd_{};
    TimePoint rootEnd_{};
};

} // namespace otm::combat
