#pragma once

#include "EngineContext.h"

namespace otm::combat {

/**
 * Starts at most one fight per player per call: the first aggressive, idle,
 * living NPC in the player's room attacks them. Disabled in pilgrim mode.
 */
class AggressionScanner {
public:
    explicit AggressionScanner(EngineContext& ctx);

    // True if combat was initiated
    bool scan(PlayerSession& player);

private:
    EngineContext& ctx_;
};

} // namespace otm::combat
