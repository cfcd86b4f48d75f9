#include "../include/otm/combat/SessionRegistry.h"

#include "../../OTM_Shared/include/otm/shared/Logger.h"

#include <mutex>
#include <utility>

namespace otm::combat {

bool SessionRegistry::add(std::shared_ptr<PlayerSession> session) {
    if (!session) {
        return false;
    }
    const std::string name = session->name();
    std::unique_lock lock(mutex_);
    auto [it, inserted] = sessions_.emplace(name, std::move(session));
    if (!inserted) {
        shared::logWarn("sessions", std::string{"Rejecting duplicate session: player="} + name);
        return false;
    }
    shared::logInfo("sessions", std::string{"Session registered: player="} + name +
                    ", online=" + std::to_string(sessions_.size()));
    return true;
}

bool SessionRegistry::remove(const std::string& name) {
    std::unique_lock lock(mutex_);
    const bool erased = sessions_.erase(name) > 0;
    if (erased) {
        shared::logInfo("sessions", std::string{"Session removed: player="} + name +
                        ", online=" + std::to_string(sessions_.size()));
    }
    return erased;
}

std::shared_ptr<PlayerSession> SessionRegistry::find(const std::string& name) const {
    std::shared_lock lock(mutex_);
    auto it = sessions_.find(name);
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<std::shared_ptr<PlayerSession>> SessionRegistry::snapshot() const {
    std::shared_lock lock(mutex_);
    std::vector<std::shared_ptr<PlayerSession>> result;
    result.reserve(sessions_.size());
    for (const auto& [name, session] : sessions_) {
        result.push_back(session);
    }
    return result;
}

std::size_t SessionRegistry::onlineCount() const {
    std::shared_lock lock(mutex_);
    return sessions_.size();
}

} // namespace otm::combat
