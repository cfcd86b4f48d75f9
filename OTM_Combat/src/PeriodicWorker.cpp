#include "../include/otm/combat/PeriodicWorker.h"

#include "../../OTM_Shared/include/otm/shared/Logger.h"

#include <exception>
#include <utility>

namespace otm::combat {

PeriodicWorker::PeriodicWorker(boost::asio::io_context& ioContext, std::string name, std::chrono::milliseconds interval)
    : name_(std::move(name))
    , interval_(interval)
    , strand_(boost::asio::make_strand(ioContext))
    , timer_(strand_) {
}

void PeriodicWorker::start() {
    if (interval_.count() <= 0) {
        shared::logInfo("engine", name_ + " disabled (interval=0)");
        return;
    }
    if (stopping_.load() || running_.exchange(true)) {
        return;
    }
    shared::logInfo("engine", name_ + " started: intervalMs=" + std::to_string(interval_.count()));
    boost::asio::post(strand_, [this]() { scheduleNextTick(); });
}

void PeriodicWorker::stop() {
    if (stopping_.exchange(true)) {
        return;
    }
    shared::logInfo("engine", name_ + " stopping");
    boost::asio::post(strand_, [this]() {
        timer_.cancel();
        running_ = false;
    });
}

void PeriodicWorker::scheduleNextTick() {
    if (stopping_.load()) {
        running_ = false;
        return;
    }
    timer_.expires_after(interval_);
    timer_.async_wait([this](const boost::system::error_code& ec) {
        onTick(ec);
    });
}

void PeriodicWorker::onTick(const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted) {
        shared::logInfo("engine", name_ + " timer cancelled (shutting down)");
        running_ = false;
        return;
    }

    if (ec) {
        shared::logError("engine", name_ + " timer error: " + ec.message());
        running_ = false;
        return;
    }

    if (stopping_.load()) {
        running_ = false;
        return;
    }

    try {
        runTick();
    } catch (const std::exception& e) {
        shared::logError("engine", name_ + " tick failed: " + e.what());
    }

    scheduleNextTick();
}

} // namespace otm::combat
