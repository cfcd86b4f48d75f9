#pragma once

#include "AggressionScanner.h"
#include "CombatResolver.h"
#include "EngineContext.h"
#include "PeriodicWorker.h"

namespace otm::combat {

/**
 * CombatScheduler
 *
 * Per tick, in order:
 *   1. snapshot connected sessions
 *   2. every in-combat player attacks their target
 *   3. every in-combat NPC attacks once
 *   4. aggression scan for each snapshotted player
 *
 * Player attacks always land before NPC retaliation, so an NPC killed in
 * step 2 never swings in step 3.
 */
class CombatScheduler : public PeriodicWorker {
public:
    CombatScheduler(boost::asio::io_context& ioContext, EngineContext& ctx,
                    CombatResolver& resolver, AggressionScanner& aggression);

    void tick(shared::TimePoint now);

protected:
    void runTick() override;

private:
    EngineContext& ctx_;
    CombatResolver& resolver_;
    AggressionScanner& aggression_;
};

} // namespace otm::combat
