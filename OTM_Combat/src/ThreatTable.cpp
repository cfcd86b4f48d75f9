#include "../include/otm/combat/ThreatTable.h"

#include <algorithm>

namespace otm::combat {

std::vector<ThreatEntry>::iterator ThreatTable::find(const std::string& attacker) {
    return std::find_if(entries_.begin(), entries_.end(),
                        [&](const ThreatEntry& e) { return e.attacker == attacker; });
}

std::vector<ThreatEntry>::const_iterator ThreatTable::find(const std::string& attacker) const {
    return std::find_if(entries_.begin(), entries_.end(),
                        [&](const ThreatEntry& e) { return e.attacker == attacker; });
}

bool ThreatTable::engage(const std::string& attacker) {
    if (attacker.empty() || find(attacker) != entries_.end()) {
        return false;
    }
    entries_.push_back(ThreatEntry{ attacker, 0 });
    return true;
}

void ThreatTable::addThreat(const std::string& attacker, int amount) {
    if (attacker.empty() || amount < 0) {
        return;
    }
    auto it = find(attacker);
    if (it == entries_.end()) {
        entries_.push_back(ThreatEntry{ attacker, amount });
        return;
    }
    it->threat += amount;
}

bool ThreatTable::remove(const std::string& attacker) {
    auto it = find(attacker);
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

void ThreatTable::clear() {
    entries_.clear();
}

bool ThreatTable::contains(const std::string& attacker) const {
    return find(attacker) != entries_.end();
}

int ThreatTable::threatOf(const std::string& attacker) const {
    auto it = find(attacker);
    return it == entries_.end() ? 0 : it->threat;
}

std::string ThreatTable::highestThreatTarget() const {
    const ThreatEntry* best = nullptr;
    for (const auto& entry : entries_) {
        // strict '>' keeps the earliest engaged attacker on ties
        if (best == nullptr || entry.threat > best->threat) {
            best = &entry;
        }
    }
    return best ? best->attacker : std::string{};
}

std::vector<std::string> ThreatTable::attackers() const {
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& entry : entries_) {
        names.push_back(entry.attacker);
    }
    return names;
}

} // namespace otm::combat
