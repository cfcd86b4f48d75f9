#define BOOST_TEST_MODULE CombatEngineTests
#include <boost/test/unit_test.hpp>

#include <boost/asio.hpp>

#include <memory>

#include "TestSupport.h"
#include "../OTM_Combat/include/otm/combat/CombatEngine.h"

using namespace otm::combat;
using otm::test::EngineFixture;
using otm::test::makeTemplate;

namespace {
    class EngineTestFixture : public EngineFixture {
    public:
        EngineTestFixture()
            : spawner(world, npcs, templates, rng)
            , engine(io, ctx, spawner) {
        }

        std::shared_ptr<PlayerSession> makePlayer(const std::string& name) {
            return std::make_shared<PlayerSession>(name, PlayerClass::Warrior, AbilityScores{});
        }

        NpcTemplateStore templates;
        boost::asio::io_context io;
        MobSpawner spawner;
        CombatEngine engine;
    };
}

BOOST_FIXTURE_TEST_SUITE(CombatEngineTests, EngineTestFixture)

BOOST_AUTO_TEST_CASE(ConnectPlacesPlayerInStartingRoom)
{
    auto bob = makePlayer("Bob");
    BOOST_REQUIRE(engine.connectPlayer(bob));
    auto alice = makePlayer("Alice");
    BOOST_REQUIRE(engine.connectPlayer(alice));

    BOOST_CHECK_EQUAL(alice->room(), "town");
    BOOST_CHECK(world.findRoom("town")->hasPlayer("Alice"));
    BOOST_CHECK(sink.received("Bob", "Alice has arrived."));
    BOOST_CHECK(!sink.received("Alice", "Alice has arrived."));
    BOOST_CHECK_EQUAL(sessions.onlineCount(), 2u);
}

BOOST_AUTO_TEST_CASE(ConnectKeepsKnownRoom)
{
    auto alice = makePlayer("Alice");
    alice->setRoom("yard");
    BOOST_REQUIRE(engine.connectPlayer(alice));
    BOOST_CHECK(world.findRoom("yard")->hasPlayer("Alice"));
}

BOOST_AUTO_TEST_CASE(DuplicateConnectRejected)
{
    BOOST_CHECK(engine.connectPlayer(makePlayer("Alice")));
    BOOST_CHECK(!engine.connectPlayer(makePlayer("Alice")));
    BOOST_CHECK(!engine.connectPlayer(nullptr));
    BOOST_CHECK_EQUAL(sessions.onlineCount(), 1u);
}

BOOST_AUTO_TEST_CASE(AttackAndFleeByName)
{
    Npc& goblin = addNpc(makeTemplate("Goblin", 20), "arena");
    auto alice = makePlayer("Alice");
    alice->setRoom("arena");
    engine.connectPlayer(alice);

    const std::string reply = engine.attack("Alice", "Goblin");
    BOOST_CHECK(reply.find("You attack Goblin!") != std::string::npos);
    BOOST_CHECK(goblin.isEngagedWith("Alice"));

    rng.pushInts({ 0 });
    const std::string fled = engine.flee("Alice");
    BOOST_CHECK(fled.rfind("You flee up!", 0) == 0);
    BOOST_CHECK_EQUAL(alice->room(), "loft");

    BOOST_CHECK(engine.attack("Nobody", "Goblin").empty());
    BOOST_CHECK(engine.flee("Nobody").empty());
}

BOOST_AUTO_TEST_CASE(DisconnectLeavesThreatForNextNpcTurn)
{
    auto tmpl = makeTemplate("Goblin", 20);
    tmpl.experience = 90;
    Npc& goblin = addNpc(tmpl, "arena");
    auto alice = makePlayer("Alice");
    auto bob = makePlayer("Bob");
    alice->setRoom("arena");
    bob->setRoom("arena");
    engine.connectPlayer(alice);
    engine.connectPlayer(bob);
    engine.attack("Alice", "Goblin");
    engine.attack("Bob", "Goblin");

    engine.disconnectPlayer("Alice");

    BOOST_CHECK(sessions.find("Alice") == nullptr);
    BOOST_CHECK(!world.findRoom("arena")->hasPlayer("Alice"));
    BOOST_CHECK(!alice->isInCombat());
    BOOST_CHECK(goblin.isEngagedWith("Alice"));

    engine.deaths().handleNpcDeath(goblin, *world.findRoom("arena"), now);
    BOOST_CHECK_EQUAL(bob->experience(), 45);
    BOOST_CHECK_EQUAL(alice->experience(), 0);
}

BOOST_AUTO_TEST_CASE(StartAndStopDrainCleanly)
{
    config.combat.tickMs = 5;
    config.respawn.sweepMs = 5;
    config.population.intervalMs = 5;
    CombatEngine fast(io, ctx, spawner);

    fast.start();
    BOOST_CHECK(fast.combatScheduler().isRunning());
    io.run_for(std::chrono::milliseconds(30));
    fast.stop();
    io.restart();
    io.run();

    BOOST_CHECK(!fast.combatScheduler().isRunning());
    BOOST_CHECK(!fast.respawnScheduler().isRunning());
    BOOST_CHECK(!fast.populationController().isRunning());
}

BOOST_AUTO_TEST_SUITE_END()
