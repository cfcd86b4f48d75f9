#include "../include/otm/combat/PlayerSession.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <utility>

namespace otm::combat {

namespace {
    const std::array<ClassDefinition, 6> kClasses{ {
        { PlayerClass::Warrior, "Warrior", 10, 0, std::nullopt },
        { PlayerClass::Mage,    "Mage",     6, 5, Ability::Intelligence },
        { PlayerClass::Cleric,  "Cleric",   8, 4, Ability::Wisdom },
        { PlayerClass::Rogue,   "Rogue",    8, 2, Ability::Intelligence },
        { PlayerClass::Ranger,  "Ranger",  10, 3, Ability::Wisdom },
        { PlayerClass::Paladin, "Paladin", 10, 3, Ability::Charisma },
    } };

    const shared::DiceSpec kUnarmed{ 1, 4, 0 };
}

const ClassDefinition& classDefinition(PlayerClass cls) {
    for (const auto& def : kClasses) {
        if (def.id == cls) {
            return def;
        }
    }
    return kClasses.front();
}

std::optional<PlayerClass> parsePlayerClass(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto& def : kClasses) {
        std::string defName = def.name;
        std::transform(defName.begin(), defName.end(), defName.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (defName == lower) {
            return def.id;
        }
    }
    return std::nullopt;
}

int xpForLevel(int level) {
    if (level <= 1) {
        return 0;
    }
    return static_cast<int>(100.0 * std::pow(static_cast<double>(level), 1.5));
}

int AbilityScores::score(Ability ability) const {
    switch (ability) {
        case Ability::Strength:     return strength;
        case Ability::Dexterity:    return dexterity;
        case Ability::Constitution: return constitution;
        case Ability::Intelligence: return intelligence;
        case Ability::Wisdom:       return wisdom;
        case Ability::Charisma:     return charisma;
    }
    return 10;
}

std::string AttackRoll::breakdown() const {
    std::string mod = modifier >= 0 ? "+" + std::to_string(modifier) : std::to_string(modifier);
    return "d20" + mod + "(" + stat + ") = " + std::to_string(total);
}

PlayerSession::PlayerSession(std::string name, PlayerClass cls, AbilityScores abilities, int level)
    : name_(std::move(name))
    , class_(cls)
    , abilities_(abilities) {
    const auto& def = classDefinition(class_);
    maxHealth_ = std::max(1, def.hitDie + modifierLocked(Ability::Constitution));
    int mana = def.manaPerLevel * 2;
    if (def.castingAbility) {
        mana += modifierLocked(*def.castingAbility);
    }
    maxMana_ = def.manaPerLevel > 0 ? std::max(0, mana) : 0;

    const int target = std::clamp(level, 1, MaxPlayerLevel);
    while (level_ < target) {
        levelUpLocked();
    }
    experience_ = xpForLevel(level_);
    health_ = maxHealth_;
    mana_ = maxMana_;
}

shared::RoomId PlayerSession::room() const {
    std::scoped_lock lock(mutex_);
    return room_;
}

void PlayerSession::setRoom(const shared::RoomId& roomId) {
    std::scoped_lock lock(mutex_);
    room_ = roomId;
}

int PlayerSession::health() const { std::scoped_lock lock(mutex_); return health_; }
int PlayerSession::maxHealth() const { std::scoped_lock lock(mutex_); return maxHealth_; }
int PlayerSession::mana() const { std::scoped_lock lock(mutex_); return mana_; }
int PlayerSession::maxMana() const { std::scoped_lock lock(mutex_); return maxMana_; }
int PlayerSession::level() const { std::scoped_lock lock(mutex_); return level_; }
int PlayerSession::experience() const { std::scoped_lock lock(mutex_); return experience_; }
int PlayerSession::gold() const { std::scoped_lock lock(mutex_); return gold_; }
int PlayerSession::kills() const { std::scoped_lock lock(mutex_); return kills_; }
int PlayerSession::deaths() const { std::scoped_lock lock(mutex_); return deaths_; }
int PlayerSession::armor() const { std::scoped_lock lock(mutex_); return armor_; }

bool PlayerSession::isAlive() const {
    std::scoped_lock lock(mutex_);
    return health_ > 0;
}

void PlayerSession::setMaxHealth(int maxHealth) {
    std::scoped_lock lock(mutex_);
    maxHealth_ = std::max(1, maxHealth);
    health_ = std::min(health_, maxHealth_);
}

void PlayerSession::setMaxMana(int maxMana) {
    std::scoped_lock lock(mutex_);
    maxMana_ = std::max(0, maxMana);
    mana_ = std::min(mana_, maxMana_);
}

void PlayerSession::setHealth(int health) {
    std::scoped_lock lock(mutex_);
    health_ = std::clamp(health, 0, maxHealth_);
}

void PlayerSession::setArmor(int armor) {
    std::scoped_lock lock(mutex_);
    armor_ = std::max(0, armor);
}

void PlayerSession::setWeapon(std::optional<Weapon> weapon) {
    std::scoped_lock lock(mutex_);
    weapon_ = std::move(weapon);
}

bool PlayerSession::hasRangedWeapon() const {
    std::scoped_lock lock(mutex_);
    return weapon_ && weapon_->style == WeaponStyle::Ranged;
}

bool PlayerSession::isInCombat() const {
    std::scoped_lock lock(mutex_);
    return combatTarget_.has_value();
}

std::optional<NpcHandle> PlayerSession::combatTarget() const {
    std::scoped_lock lock(mutex_);
    return combatTarget_;
}

bool PlayerSession::isTargeting(NpcHandle npc) const {
    std::scoped_lock lock(mutex_);
    return combatTarget_ == npc;
}

void PlayerSession::startCombat(NpcHandle npc) {
    std::scoped_lock lock(mutex_);
    combatTarget_ = npc;
}

void PlayerSession::endCombat() {
    std::scoped_lock lock(mutex_);
    combatTarget_.reset();
}

int PlayerSession::modifierLocked(Ability ability) const {
    return shared::abilityModifier(abilities_.score(ability));
}

AttackRoll PlayerSession::rollAttack(shared::RandomSource& rng) const {
    AttackRoll roll;
    {
        std::scoped_lock lock(mutex_);
        const int strMod = modifierLocked(Ability::Strength);
        const int dexMod = modifierLocked(Ability::Dexterity);
        roll.modifier = strMod;
        roll.stat = "STR";
        if (weapon_ && weapon_->style == WeaponStyle::Ranged) {
            roll.modifier = dexMod;
            roll.stat = "DEX";
        } else if (weapon_ && weapon_->style == WeaponStyle::Finesse && dexMod > strMod) {
            roll.modifier = dexMod;
            roll.stat = "DEX";
        }
    }
    roll.natural = shared::rollD20(rng);
    roll.total = roll.natural + roll.modifier;
    return roll;
}

int PlayerSession::rollDamageAgainst(MobType targetType, bool sneakAttack, shared::RandomSource& rng) const {
    std::optional<Weapon> weapon;
    int strMod = 0;
    int dexMod = 0;
    int level = 1;
    {
        std::scoped_lock lock(mutex_);
        weapon = weapon_;
        strMod = modifierLocked(Ability::Strength);
        dexMod = modifierLocked(Ability::Dexterity);
        level = level_;
    }

    const bool ranged = weapon && weapon->style == WeaponStyle::Ranged;

    int base = 0;
    if (weapon) {
        int mod = strMod;
        if (ranged || (weapon->style == WeaponStyle::Finesse && dexMod > strMod)) {
            mod = dexMod;
        }
        base = shared::rollDice(rng, weapon->damage, mod);
    } else {
        base = shared::rollDice(rng, kUnarmed, strMod);
    }
    base = std::max(1, base);

    int bonus = 0;
    switch (class_) {
        case PlayerClass::Warrior:
            if (!ranged) {
                bonus += level / 3;
            }
            break;
        case PlayerClass::Ranger:
            if (ranged) {
                bonus += 2 + level / 3;
            }
            if (targetType == MobType::Beast) {
                bonus += std::max(1, (base + bonus) / 4);
            }
            break;
        case PlayerClass::Paladin:
            if (targetType == MobType::Undead || targetType == MobType::Demon) {
                bonus += 2;
            }
            break;
        case PlayerClass::Rogue:
            if (sneakAttack) {
                bonus += shared::rollDice(rng, 1 + level / 5, 6);
            }
            break;
        case PlayerClass::Mage:
        case PlayerClass::Cleric:
            break;
    }

    return std::max(1, base + bonus);
}

int PlayerSession::takeDamage(int rawDamage) {
    std::scoped_lock lock(mutex_);
    int actual = rawDamage - armor_;
    if (actual < 1) {
        actual = 1;
    }
    health_ -= actual;
    if (health_ < 0) {
        health_ = 0;
    }
    return actual;
}

void PlayerSession::restoreFull() {
    std::scoped_lock lock(mutex_);
    health_ = maxHealth_;
    mana_ = maxMana_;
}

LevelUpInfo PlayerSession::levelUpLocked() {
    ++level_;
    const auto& def = classDefinition(class_);

    const int hpGain = std::max(1, def.hitDie / 2 + 1 + modifierLocked(Ability::Constitution));
    int manaGain = def.manaPerLevel;
    if (def.castingAbility) {
        manaGain += modifierLocked(*def.castingAbility);
    }
    manaGain = std::max(0, manaGain);

    maxHealth_ += hpGain;
    maxMana_ += manaGain;
    health_ = maxHealth_;
    mana_ = maxMana_;

    return LevelUpInfo{ level_, hpGain, manaGain };
}

std::vector<LevelUpInfo> PlayerSession::gainExperience(int xp) {
    std::scoped_lock lock(mutex_);
    std::vector<LevelUpInfo> levelUps;
    if (xp <= 0) {
        return levelUps;
    }
    experience_ += xp;
    while (level_ < MaxPlayerLevel && experience_ >= xpForLevel(level_ + 1)) {
        levelUps.push_back(levelUpLocked());
    }
    return levelUps;
}

void PlayerSession::addGold(int amount) {
    std::scoped_lock lock(mutex_);
    if (amount > 0) {
        gold_ += amount;
    }
}

void PlayerSession::recordKill() {
    std::scoped_lock lock(mutex_);
    ++kills_;
}

void PlayerSession::recordDeath() {
    std::scoped_lock lock(mutex_);
    ++deaths_;
}

void PlayerSession::addTitle(const std::string& title) {
    std::scoped_lock lock(mutex_);
    if (title.empty()) {
        return;
    }
    if (std::find(titles_.begin(), titles_.end(), title) == titles_.end()) {
        titles_.push_back(title);
    }
}

std::vector<std::string> PlayerSession::titles() const {
    std::scoped_lock lock(mutex_);
    return titles_;
}

} // namespace otm::combat
