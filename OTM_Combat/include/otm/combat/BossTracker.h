#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace otm::combat {

struct BossKillResult {
    bool firstKill{ false };
    std::string error;      // non-empty when the kill could not be recorded

    bool ok() const { return error.empty(); }
};

/**
 * Server-wide record of which areas have had their final boss defeated.
 */
class BossTracker {
public:
    virtual ~BossTracker() = default;

    virtual BossKillResult recordKill(const std::string& areaId, const std::string& playerName) = 0;

    // True once every prerequisite area has been cleared
    virtual bool isFullyUnlocked() const = 0;
};

/**
 * InMemoryBossTracker
 *
 * Prerequisite areas unlock the capstone area once each has a first kill.
 * Kills in the capstone area are rejected until then.
 */
class InMemoryBossTracker : public BossTracker {
public:
    InMemoryBossTracker(std::vector<std::string> prerequisiteAreas, std::string capstoneArea);

    BossKillResult recordKill(const std::string& areaId, const std::string& playerName) override;
    bool isFullyUnlocked() const override;

    // Empty if the area has not been cleared
    std::string firstKiller(const std::string& areaId) const;

private:
    const std::vector<std::string> prerequisites_;
    const std::string capstone_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> firstKills_;
    bool unlocked_{ false };
};

} // namespace otm::combat
