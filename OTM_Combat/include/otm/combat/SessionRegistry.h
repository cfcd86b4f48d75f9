#pragma once

#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "PlayerSession.h"

namespace otm::combat {

/**
 * SessionRegistry
 *
 * Connected player sessions, owned by the hosting server and shared with the
 * engine. Lookups, broadcasts and snapshots take the lock shared; connect and
 * disconnect take it exclusively.
 *
 * Sessions are handed out as shared_ptr so a tick that snapshotted a player
 * can finish its step even if that player disconnects mid-tick.
 */
class SessionRegistry {
public:
    // Returns false if a session with the same name is already registered
    bool add(std::shared_ptr<PlayerSession> session);
    bool remove(const std::string& name);

    std::shared_ptr<PlayerSession> find(const std::string& name) const;

    // Registration order is not preserved; callers must not depend on it
    std::vector<std::shared_ptr<PlayerSession>> snapshot() const;

    std::size_t onlineCount() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<PlayerSession>> sessions_;
};

} // namespace otm::combat
