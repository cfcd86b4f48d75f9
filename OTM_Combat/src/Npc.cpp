#include "../include/otm/combat/Npc.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace otm::combat {

const char* toString(MobType type) {
    switch (type) {
        case MobType::Beast:     return "beast";
        case MobType::Humanoid:  return "humanoid";
        case MobType::Undead:    return "undead";
        case MobType::Demon:     return "demon";
        case MobType::Construct: return "construct";
        case MobType::Giant:     return "giant";
    }
    return "unknown";
}

const char* toString(NpcState state) {
    switch (state) {
        case NpcState::Idle:               return "Idle";
        case NpcState::InCombat:           return "InCombat";
        case NpcState::Fleeing:            return "Fleeing";
        case NpcState::DeadPendingRespawn: return "DeadPendingRespawn";
    }
    return "Unknown";
}

std::optional<MobType> parseMobType(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "beast") return MobType::Beast;
    if (lower == "humanoid") return MobType::Humanoid;
    if (lower == "undead") return MobType::Undead;
    if (lower == "demon") return MobType::Demon;
    if (lower == "construct") return MobType::Construct;
    if (lower == "giant") return MobType::Giant;
    return std::nullopt;
}

double defaultFleeThreshold(MobType type) {
    switch (type) {
        case MobType::Undead:    return 0.0;
        case MobType::Construct: return 0.0;
        case MobType::Demon:     return 0.05;
        case MobType::Giant:     return 0.10;
        case MobType::Beast:     return 0.15;
        case MobType::Humanoid:  return 0.12;
    }
    return 0.12;
}

Npc::Npc(NpcHandle handle, NpcTemplate tmpl, RoomId originRoom, FloorNumber floor, bool respawns)
    : handle_(handle)
    , template_(std::move(tmpl))
    , originRoom_(std::move(originRoom))
    , floor_(floor)
    , respawns_(respawns)
    , currentRoom_(originRoom_)
    , health_(template_.maxHealth) {
}

RoomId Npc::currentRoom() const {
    std::scoped_lock lock(mutex_);
    return currentRoom_;
}

void Npc::setCurrentRoom(const RoomId& roomId) {
    std::scoped_lock lock(mutex_);
    currentRoom_ = roomId;
}

NpcState Npc::state() const {
    std::scoped_lock lock(mutex_);
    return state_;
}

bool Npc::isAlive() const {
    std::scoped_lock lock(mutex_);
    return state_ != NpcState::DeadPendingRespawn && health_ > 0;
}

bool Npc::isInCombat() const {
    std::scoped_lock lock(mutex_);
    return state_ == NpcState::InCombat;
}

int Npc::health() const {
    std::scoped_lock lock(mutex_);
    return health_;
}

bool Npc::engage(const std::string& attacker) {
    std::scoped_lock lock(mutex_);
    if (state_ == NpcState::DeadPendingRespawn || attacker.empty()) {
        return false;
    }
    threat_.engage(attacker);
    state_ = NpcState::InCombat;
    return true;
}

void Npc::disengage(const std::string& attacker) {
    std::scoped_lock lock(mutex_);
    threat_.remove(attacker);
    if (threat_.empty() && state_ == NpcState::InCombat) {
        state_ = NpcState::Idle;
    }
}

void Npc::endCombat() {
    std::scoped_lock lock(mutex_);
    threat_.clear();
    if (state_ == NpcState::InCombat) {
        state_ = NpcState::Idle;
    }
}

bool Npc::isEngagedWith(const std::string& attacker) const {
    std::scoped_lock lock(mutex_);
    return threat_.contains(attacker);
}

std::vector<std::string> Npc::attackers() const {
    std::scoped_lock lock(mutex_);
    return threat_.attackers();
}

int Npc::threatOf(const std::string& attacker) const {
    std::scoped_lock lock(mutex_);
    return threat_.threatOf(attacker);
}

void Npc::addThreat(const std::string& attacker, int amount) {
    std::scoped_lock lock(mutex_);
    if (state_ == NpcState::DeadPendingRespawn) {
        return;
    }
    threat_.addThreat(attacker, amount);
}

std::string Npc::highestThreatTarget() const {
    std::scoped_lock lock(mutex_);
    return threat_.highestThreatTarget();
}

int Npc::takeDamage(int rawDamage) {
    std::scoped_lock lock(mutex_);
    int actual = rawDamage - template_.armor;
    if (actual < 1) {
        actual = 1;
    }
    health_ -= actual;
    if (health_ < 0) {
        health_ = 0;
    }
    return actual;
}

int Npc::rollAttackDamage(shared::RandomSource& rng) const {
    const int lo = std::max(0, template_.minDamage);
    const int hi = std::max(lo, template_.maxDamage);
    return rng.nextInt(lo, hi);
}

std::optional<std::vector<std::string>> Npc::markDead() {
    std::scoped_lock lock(mutex_);
    if (state_ == NpcState::DeadPendingRespawn) {
        return std::nullopt;
    }
    std::vector<std::string> captured = threat_.attackers();
    threat_.clear();
    health_ = 0;
    state_ = NpcState::DeadPendingRespawn;
    return captured;
}

void Npc::beginFlee() {
    std::scoped_lock lock(mutex_);
    if (state_ == NpcState::DeadPendingRespawn) {
        return;
    }
    threat_.clear();
    state_ = NpcState::Fleeing;
}

void Npc::reset() {
    std::scoped_lock lock(mutex_);
    health_ = template_.maxHealth;
    threat_.clear();
    stunEnd_ = TimePoint{};
    rootEnd_ = TimePoint{};
    currentRoom_ = originRoom_;
    state_ = NpcState::Idle;
}

std::optional<TimePoint> Npc::computeRespawnDeadline(TimePoint now, shared::RandomSource& rng, int minimumSeconds) const {
    if (!respawns_ || template_.respawnMedianSec <= 0) {
        return std::nullopt;
    }

    int variation = 0;
    if (template_.respawnVariationSec > 0) {
        variation = rng.nextInt(-template_.respawnVariationSec, template_.respawnVariationSec);
    }

    int seconds = template_.respawnMedianSec + variation;
    if (seconds < minimumSeconds) {
        seconds = minimumSeconds;
    }
    return now + std::chrono::seconds(seconds);
}

void Npc::stun(std::chrono::seconds duration, TimePoint now) {
    std::scoped_lock lock(mutex_);
    stunEnd_ = now + duration;
}

void Npc::root(std::chrono::seconds duration, TimePoint now) {
    std::scoped_lock lock(mutex_);
    rootEnd_ = now + duration;
}

bool Npc::isStunned(TimePoint now) const {
    std::scoped_lock lock(mutex_);
    return now < stunEnd_;
}

bool Npc::isRooted(TimePoint now) const {
    std::scoped_lock lock(mutex_);
    return now < rootEnd_;
}

bool Npc::shouldFlee(TimePoint now, shared::RandomSource& rng, double fleeChance) const {
    {
        std::scoped_lock lock(mutex_);
        if (template_.boss || template_.fleeThreshold <= 0.0) {
            return false;
        }
        if (state_ != NpcState::InCombat || now < rootEnd_) {
            return false;
        }
        if (template_.maxHealth <= 0 || health_ <= 0) {
            return false;
        }
        const double hpFraction = static_cast<double>(health_) / static_cast<double>(template_.maxHealth);
        if (hpFraction > template_.fleeThreshold) {
            return false;
        }
    }

    if (fleeChance >= 1.0) {
        return true;
    }
    return rng.nextDouble() < fleeChance;
}

std::vector<std::string> Npc::rollLoot(shared::RandomSource& rng) const {
    std::vector<std::string> dropped;
    for (const auto& entry : template_.loot) {
        if (template_.boss) {
            dropped.push_back(entry.itemId);
            continue;
        }
        const double roll = rng.nextDouble() * 100.0;
        if (roll < entry.dropChance) {
            dropped.push_back(entry.itemId);
        }
    }
    return dropped;
}

int Npc::rollGold(shared::RandomSource& rng) const {
    if (template_.goldMax <= 0) {
        return 0;
    }
    if (template_.goldMin >= template_.goldMax) {
        return template_.goldMin;
    }
    return rng.nextInt(template_.goldMin, template_.goldMax);
}

} // namespace otm::combat
