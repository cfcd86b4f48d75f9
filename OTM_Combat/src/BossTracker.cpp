#include "../include/otm/combat/BossTracker.h"

#include "../../OTM_Shared/include/otm/shared/Logger.h"

#include <algorithm>
#include <utility>

namespace otm::combat {

InMemoryBossTracker::InMemoryBossTracker(std::vector<std::string> prerequisiteAreas, std::string capstoneArea)
    : prerequisites_(std::move(prerequisiteAreas))
    , capstone_(std::move(capstoneArea))
    , unlocked_(prerequisites_.empty()) {
}

BossKillResult InMemoryBossTracker::recordKill(const std::string& areaId, const std::string& playerName) {
    std::scoped_lock lock(mutex_);

    const bool known = areaId == capstone_ ||
        std::find(prerequisites_.begin(), prerequisites_.end(), areaId) != prerequisites_.end();
    if (!known) {
        return BossKillResult{ false, "unknown area: " + areaId };
    }
    if (areaId == capstone_ && !unlocked_) {
        return BossKillResult{ false, "area locked: " + areaId };
    }

    auto [it, inserted] = firstKills_.emplace(areaId, playerName);
    if (!inserted) {
        return BossKillResult{ false, {} };
    }

    shared::logInfo("bosses", std::string{"First clear recorded: area="} + areaId + ", player=" + playerName);

    if (!unlocked_) {
        const bool allCleared = std::all_of(prerequisites_.begin(), prerequisites_.end(),
            [this](const std::string& id) { return firstKills_.count(id) > 0; });
        if (allCleared) {
            unlocked_ = true;
            shared::logInfo("bosses", std::string{"All prerequisite areas cleared, unlocking: "} + capstone_);
        }
    }
    return BossKillResult{ true, {} };
}

bool InMemoryBossTracker::isFullyUnlocked() const {
    std::scoped_lock lock(mutex_);
    return unlocked_;
}

std::string InMemoryBossTracker::firstKiller(const std::string& areaId) const {
    std::scoped_lock lock(mutex_);
    auto it = firstKills_.find(areaId);
    return it == firstKills_.end() ? std::string{} : it->second;
}

} // namespace otm::combat
