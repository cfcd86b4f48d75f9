#pragma once

#include <atomic>
#include <chrono>
#include <string>
#include <utility>

#include <boost/asio.hpp>

namespace otm::combat {

/**
 * PeriodicWorker
 *
 * Fixed-interval background process on its own strand and steady_timer.
 * Ticks never overlap. stop() is one-shot: a tick already running finishes,
 * no further tick starts. A zero interval leaves the worker disabled.
 *
 * The io_context must be stopped or drained before the worker is destroyed.
 */
class PeriodicWorker {
public:
    PeriodicWorker(boost::asio::io_context& ioContext, std::string name, std::chrono::milliseconds interval);
    virtual ~PeriodicWorker() = default;

    PeriodicWorker(const PeriodicWorker&) = delete;
    PeriodicWorker& operator=(const PeriodicWorker&) = delete;

    void start();
    void stop();

    bool isRunning() const { return running_.load(); }
    bool isStopping() const { return stopping_.load(); }
    const std::string& name() const { return name_; }
    std::chrono::milliseconds interval() const { return interval_; }

protected:
    virtual void runTick() = 0;

private:
    void scheduleNextTick();
    void onTick(const boost::system::error_code& ec);

    const std::string name_;
    const std::chrono::milliseconds interval_;
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::steady_timer timer_;
    std::atomic<bool> running_{ false };
    std::atomic<bool> stopping_{ false };
};

} // namespace otm::combat
