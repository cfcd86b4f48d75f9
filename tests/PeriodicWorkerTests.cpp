#define BOOST_TEST_MODULE PeriodicWorkerTests
#include <boost/test/unit_test.hpp>

#include <boost/asio.hpp>

#include <atomic>
#include <chrono>
#include <stdexcept>

#include "../OTM_Combat/include/otm/combat/PeriodicWorker.h"

using otm::combat::PeriodicWorker;
using std::chrono::milliseconds;

namespace {
    class CountingWorker : public PeriodicWorker {
    public:
        CountingWorker(boost::asio::io_context& io, milliseconds interval, bool throws = false)
            : PeriodicWorker(io, "CountingWorker", interval)
            , throws_(throws) {
        }

        int ticks() const { return ticks_.load(); }

    protected:
        void runTick() override {
            ++ticks_;
            if (throws_) {
                throw std::runtime_error("tick blew up");
            }
        }

    private:
        const bool throws_;
        std::atomic<int> ticks_{ 0 };
    };
}

BOOST_AUTO_TEST_SUITE(PeriodicWorkerTests)

BOOST_AUTO_TEST_CASE(TicksRepeatUntilStopped)
{
    boost::asio::io_context io;
    CountingWorker worker(io, milliseconds(2));

    worker.start();
    BOOST_CHECK(worker.isRunning());
    io.run_for(milliseconds(200));
    BOOST_CHECK_GE(worker.ticks(), 2);

    worker.stop();
    io.restart();
    io.run();

    const int ticksAtStop = worker.ticks();
    BOOST_CHECK(!worker.isRunning());
    BOOST_CHECK(worker.isStopping());

    io.restart();
    io.run_for(milliseconds(20));
    BOOST_CHECK_EQUAL(worker.ticks(), ticksAtStop);
}

BOOST_AUTO_TEST_CASE(StopBeforeFirstTick)
{
    boost::asio::io_context io;
    CountingWorker worker(io, milliseconds(2));

    worker.start();
    worker.stop();
    io.run();

    BOOST_CHECK_EQUAL(worker.ticks(), 0);
    BOOST_CHECK(!worker.isRunning());
}

BOOST_AUTO_TEST_CASE(ZeroIntervalLeavesWorkerDisabled)
{
    boost::asio::io_context io;
    CountingWorker worker(io, milliseconds(0));

    worker.start();
    BOOST_CHECK(!worker.isRunning());
    io.run();
    BOOST_CHECK_EQUAL(worker.ticks(), 0);
}

BOOST_AUTO_TEST_CASE(StopIsOneShot)
{
    boost::asio::io_context io;
    CountingWorker worker(io, milliseconds(2));

    worker.stop();
    worker.stop();
    worker.start();
    io.run();

    BOOST_CHECK(!worker.isRunning());
    BOOST_CHECK_EQUAL(worker.ticks(), 0);
}

BOOST_AUTO_TEST_CASE(FailingTickDoesNotKillWorker)
{
    boost::asio::io_context io;
    CountingWorker worker(io, milliseconds(1), true);

    worker.start();
    io.run_for(milliseconds(200));
    BOOST_CHECK_GE(worker.ticks(), 2);

    worker.stop();
    io.restart();
    io.run();
    BOOST_CHECK(!worker.isRunning());
}

BOOST_AUTO_TEST_SUITE_END()
