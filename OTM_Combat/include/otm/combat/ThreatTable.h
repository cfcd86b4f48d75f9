#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace otm::combat {

struct ThreatEntry {
    std::string attacker;
    int threat{ 0 };
};

/**
 * ThreatTable
 *
 * Per-NPC list of engaged attackers and their accumulated threat, kept in
 * engagement order. The entry list doubles as the NPC's target list, so the
 * set of targets and the set of threat keys can never diverge.
 *
 * Not synchronized; the owning Npc guards it.
 */
class ThreatTable {
public:
    // Adds the attacker with zero threat. Returns false if already engaged.
    bool engage(const std::string& attacker);

    // Adds threat, engaging the attacker first if needed. Negative amounts are ignored.
    void addThreat(const std::string& attacker, int amount);

    bool remove(const std::string& attacker);
    void clear();

    bool contains(const std::string& attacker) const;
    int threatOf(const std::string& attacker) const;

    // Highest threat wins; ties go to whoever engaged first. Empty if no attackers.
    std::string highestThreatTarget() const;

    std::vector<std::string> attackers() const;

    bool empty() const { return entries_.empty(); }
    std::size_t size() const { return entries_.size(); }

private:
    std::vector<ThreatEntry>::iterator find(const std::string& attacker);
    std::vector<ThreatEntry>::const_iterator find(const std::string& attacker) const;

    std::vector<ThreatEntry> entries_;
};

} // namespace otm::combat
