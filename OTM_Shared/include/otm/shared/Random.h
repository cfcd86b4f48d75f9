#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <string>

namespace otm::shared {

/**
 * RandomSource
 *
 * Every roll in the engine (attack d20, damage dice, loot, respawn jitter,
 * flee checks, spawn placement) goes through this interface so tests can
 * script outcomes.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Uniform integer in [lo, hi]; returns lo when hi <= lo
    virtual int nextInt(int lo, int hi) = 0;

    // Uniform real in [0, 1)
    virtual double nextDouble() = 0;
};

/**
 * Thread-safe mt19937 source shared by all engine workers.
 */
class MtRandomSource : public RandomSource {
public:
    MtRandomSource();
    explicit MtRandomSource(std::uint32_t seed);

    int nextInt(int lo, int hi) override;
    double nextDouble() override;

private:
    std::mutex mutex_;
    std::mt19937 rng_;
};

// Dice notation: NdM, NdM+K, NdM-K
struct DiceSpec {
    int count{ 1 };
    int sides{ 4 };
    int bonus{ 0 };
};

std::optional<DiceSpec> parseDice(const std::string& notation);

int rollDice(RandomSource& rng, int count, int sides);
int rollDice(RandomSource& rng, const DiceSpec& dice, int extraBonus = 0);
int rollD20(RandomSource& rng);

// floor((score - 10) / 2)
int abilityModifier(int score);

} // namespace otm::shared
