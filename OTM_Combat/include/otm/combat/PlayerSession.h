#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../../../../OTM_Shared/include/otm/shared/Types.h"
#include "../../../../OTM_Shared/include/otm/shared/Random.h"
#include "Npc.h"

namespace otm::combat {

enum class PlayerClass {
    Warrior,
    Mage,
    Cleric,
    Rogue,
    Ranger,
    Paladin
};

enum class Ability {
    Strength,
    Dexterity,
    Constitution,
    Intelligence,
    Wisdom,
    Charisma
};

struct ClassDefinition {
    PlayerClass id;
    const char* name;
    int hitDie;
    int manaPerLevel;
    std::optional<Ability> castingAbility;
};

const ClassDefinition& classDefinition(PlayerClass cls);
std::optional<PlayerClass> parsePlayerClass(const std::string& name);

inline constexpr int MaxPlayerLevel = 50;

// Total XP needed to reach a level: 100 * level^1.5 (0 for level 1)
int xpForLevel(int level);

struct AbilityScores {
    int strength{ 10 };
    int dexterity{ 10 };
    int constitution{ 10 };
    int intelligence{ 10 };
    int wisdom{ 10 };
    int charisma{ 10 };

    int score(Ability ability) const;
};

enum class WeaponStyle {
    Melee,
    Finesse,
    Ranged
};

struct Weapon {
    std::string name;
    shared::DiceSpec damage;
    WeaponStyle style{ WeaponStyle::Melee };
};

struct AttackRoll {
    int total{ 0 };
    int natural{ 0 };
    int modifier{ 0 };
    const char* stat{ "STR" };

    // "d20+3(STR) = 17"
    std::string breakdown() const;
};

struct LevelUpInfo {
    int newLevel{ 0 };
    int hpGain{ 0 };
    int manaGain{ 0 };
};

/**
 * PlayerSession
 *
 * Live state of one connected character as seen by the combat engine.
 * Loading and saving the character belongs to the hosting server.
 *
 * combatTarget() holds the registry handle of the NPC being fought and is
 * set exactly while the player is in combat.
 */
class PlayerSession {
public:
    PlayerSession(std::string name, PlayerClass cls, AbilityScores abilities, int level = 1);

    const std::string& name() const { return name_; }
    PlayerClass playerClass() const { return class_; }
    const AbilityScores& abilities() const { return abilities_; }

    shared::RoomId room() const;
    void setRoom(const shared::RoomId& roomId);

    int health() const;
    int maxHealth() const;
    int mana() const;
    int maxMana() const;
    int level() const;
    int experience() const;
    int gold() const;
    int kills() const;
    int deaths() const;
    int armor() const;
    bool isAlive() const;

    void setMaxHealth(int maxHealth);
    void setMaxMana(int maxMana);
    void setHealth(int health);
    void setArmor(int armor);
    void setWeapon(std::optional<Weapon> weapon);
    bool hasRangedWeapon() const;

    // Combat state
    bool isInCombat() const;
    std::optional<NpcHandle> combatTarget() const;
    bool isTargeting(NpcHandle npc) const;
    void startCombat(NpcHandle npc);
    void endCombat();

    AttackRoll rollAttack(shared::RandomSource& rng) const;
    int rollDamageAgainst(MobType targetType, bool sneakAttack, shared::RandomSource& rng) const;

    // Armor-reduced damage (minimum 1), health clamped at 0. Returns damage actually taken.
    int takeDamage(int rawDamage);
    void restoreFull();

    std::vector<LevelUpInfo> gainExperience(int xp);
    void addGold(int amount);
    void recordKill();
    void recordDeath();

    void addTitle(const std::string& title);
    std::vector<std::string> titles() const;

private:
    int modifierLocked(Ability ability) const;
    LevelUpInfo levelUpLocked();

    const std::string name_;
    const PlayerClass class_;
    const AbilityScores abilities_;

    mutable std::mutex mutex_;
    shared::RoomId room_;
    int health_{ 0 };
    int maxHealth_{ 0 };
    int mana_{ 0 };
    int maxMana_{ 0 };
    int level_{ 1 };
    int experience_{ 0 };
    int gold_{ 0 };
    int kills_{ 0 };
    int deaths_{ 0 };
    int armor_{ 0 };
    std::optional<Weapon> weapon_;
    std::optional<NpcHandle> combatTarget_;
    std::vector<std::string> titles_;
};

} // namespace otm::combat
