#include "../include/otm/shared/Random.h"

#include <cctype>

namespace otm::shared {

MtRandomSource::MtRandomSource()
    : rng_(std::random_device{}()) {
}

MtRandomSource::MtRandomSource(std::uint32_t seed)
    : rng_(seed) {
}

int MtRandomSource::nextInt(int lo, int hi) {
    if (hi <= lo) {
        return lo;
    }
    std::scoped_lock lock(mutex_);
    std::uniform_int_distribution<int> dist(lo, hi);
    return dist(rng_);
}

double MtRandomSource::nextDouble() {
    std::scoped_lock lock(mutex_);
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(rng_);
}

namespace {
    bool readNumber(const std::string& s, std::size_t& pos, int& out) {
        const std::size_t start = pos;
        int value = 0;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            value = value * 10 + (s[pos] - '0');
            ++pos;
        }
        if (pos == start) {
            return false;
        }
        out = value;
        return true;
    }
}

std::optional<DiceSpec> parseDice(const std::string& notation) {
    DiceSpec dice;
    std::size_t pos = 0;

    if (!readNumber(notation, pos, dice.count)) {
        return std::nullopt;
    }
    if (pos >= notation.size() || (notation[pos] != 'd' && notation[pos] != 'D')) {
        return std::nullopt;
    }
    ++pos;
    if (!readNumber(notation, pos, dice.sides) || dice.sides == 0) {
        return std::nullopt;
    }

    if (pos < notation.size()) {
        const char sign = notation[pos];
        if (sign != '+' && sign != '-') {
            return std::nullopt;
        }
        ++pos;
        int bonus = 0;
        if (!readNumber(notation, pos, bonus) || pos != notation.size()) {
            return std::nullopt;
        }
        dice.bonus = (sign == '-') ? -bonus : bonus;
    }
    return dice;
}

int rollDice(RandomSource& rng, int count, int sides) {
    int total = 0;
    for (int i = 0; i < count; ++i) {
        total += rng.nextInt(1, sides);
    }
    return total;
}

int rollDice(RandomSource& rng, const DiceSpec& dice, int extraBonus) {
    return rollDice(rng, dice.count, dice.sides) + dice.bonus + extraBonus;
}

int rollD20(RandomSource& rng) {
    return rng.nextInt(1, 20);
}

int abilityModifier(int score) {
    const int diff = score - 10;
    if (diff >= 0) {
        return diff / 2;
    }
    return (diff - 1) / 2;
}

} // namespace otm::shared
