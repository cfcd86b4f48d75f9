#pragma once

#include <cstddef>

#include "EngineContext.h"
#include "PeriodicWorker.h"

namespace otm::combat {

/**
 * Sweeps the respawn queue and returns elapsed NPCs, reset, to their origin
 * room. An empty queue is a no-op.
 */
class RespawnScheduler : public PeriodicWorker {
public:
    RespawnScheduler(boost::asio::io_context& ioContext, EngineContext& ctx);

    // Returns the number of NPCs re-materialized
    std::size_t sweep(shared::TimePoint now);

protected:
    void runTick() override;

private:
    EngineContext& ctx_;
};

} // namespace otm::combat
