#define BOOST_TEST_MODULE DeathResolverTests
#include <boost/test/unit_test.hpp>

#include <algorithm>

#include "TestSupport.h"

using namespace otm::combat;
using otm::test::EngineFixture;
using otm::test::makeTemplate;

namespace {
    bool hasItem(const Room& room, const std::string& itemId) {
        const auto items = room.items();
        return std::any_of(items.begin(), items.end(), [&](const Item& item) { return item.id == itemId; });
    }

    NpcTemplate archivist() {
        auto tmpl = makeTemplate("The Archivist", 200, 500);
        tmpl.boss = true;
        tmpl.finalBossOfArea = "human";
        tmpl.loot.push_back(LootEntry{ "tome", 5.0 });
        return tmpl;
    }
}

// ==================== Reward split ====================

BOOST_FIXTURE_TEST_SUITE(RewardSplitTests, EngineFixture)

BOOST_AUTO_TEST_CASE(SplitShareDropsRemainder)
{
    BOOST_CHECK_EQUAL(DeathResolver::splitShare(100, 3), 33);
    BOOST_CHECK_EQUAL(DeathResolver::splitShare(100, 1), 100);
    BOOST_CHECK_EQUAL(DeathResolver::splitShare(100, 0), 100);
    BOOST_CHECK_EQUAL(DeathResolver::splitShare(2, 3), 0);
}

BOOST_AUTO_TEST_CASE(ThreeAttackersShareXpAndGold)
{
    auto tmpl = makeTemplate("Troll", 30, 100);
    tmpl.goldMin = 10;
    tmpl.goldMax = 10;
    Npc& troll = addNpc(tmpl, "arena");
    auto alice = addPlayer("Alice", "arena");
    auto bob = addPlayer("Bob", "arena");
    auto carol = addPlayer("Carol", "arena");
    engage(*alice, troll);
    engage(*bob, troll);
    engage(*carol, troll);

    deaths.handleNpcDeath(troll, *world.findRoom("arena"), now);

    for (const auto& player : { alice, bob, carol }) {
        BOOST_CHECK_EQUAL(player->experience(), 33);
        BOOST_CHECK_EQUAL(player->gold(), 3);
        BOOST_CHECK_EQUAL(player->kills(), 1);
        BOOST_CHECK(!player->isInCombat());
        BOOST_CHECK(sink.received(player->name(), "Your group has slain Troll!"));
        BOOST_CHECK(sink.received(player->name(), "You gain 33 experience points (split 3 ways)."));
    }
    BOOST_CHECK(sink.received("Alice", "Alice, Bob, Carol have slain Troll!"));

    const int distributed = alice->experience() + bob->experience() + carol->experience();
    BOOST_CHECK_LE(distributed, 100);
    BOOST_CHECK_EQUAL(100 - distributed, 100 % 3);
}

BOOST_AUTO_TEST_CASE(DisconnectedAttackerStillCountsInDivisor)
{
    Npc& troll = addNpc(makeTemplate("Troll", 30, 100), "arena");
    auto alice = addPlayer("Alice", "arena");
    auto bob = addPlayer("Bob", "arena");
    engage(*alice, troll);
    engage(*bob, troll);
    sessions.remove("Bob");

    deaths.handleNpcDeath(troll, *world.findRoom("arena"), now);

    BOOST_CHECK_EQUAL(alice->experience(), 50);
    BOOST_CHECK_EQUAL(bob->experience(), 0);
}

BOOST_AUTO_TEST_CASE(SoloKillLevelsUp)
{
    Npc& troll = addNpc(makeTemplate("Troll", 30, 300), "arena");
    auto alice = addPlayer("Alice", "arena");
    alice->setHealth(2);
    engage(*alice, troll);

    deaths.handleNpcDeath(troll, *world.findRoom("arena"), now);

    BOOST_CHECK_EQUAL(alice->level(), 2);
    BOOST_CHECK_EQUAL(alice->health(), alice->maxHealth());
    BOOST_CHECK(sink.received("Alice", "You have slain Troll!"));
    BOOST_CHECK(sink.received("Alice", "You gain 300 experience points."));
    BOOST_CHECK(sink.received("Alice", "*** LEVEL UP! ***"));
    BOOST_CHECK(sink.received("Alice", "You are now level 2!"));
    BOOST_CHECK(sink.received("Alice", "Alice has slain Troll!"));
}

BOOST_AUTO_TEST_CASE(SecondDeathIsIgnored)
{
    Npc& troll = addNpc(makeTemplate("Troll", 30, 100), "arena");
    auto alice = addPlayer("Alice", "arena");
    engage(*alice, troll);

    Room& arena = *world.findRoom("arena");
    deaths.handleNpcDeath(troll, arena, now);
    deaths.handleNpcDeath(troll, arena, now);

    BOOST_CHECK_EQUAL(alice->experience(), 100);
    BOOST_CHECK_EQUAL(alice->kills(), 1);
}

BOOST_AUTO_TEST_CASE(DeathRemovesNpcFromRoom)
{
    Npc& troll = addNpc(makeTemplate("Troll", 30, 100), "arena");
    Room& arena = *world.findRoom("arena");
    deaths.handleNpcDeath(troll, arena, now);

    BOOST_CHECK(!arena.hasNpc(troll.handle()));
    BOOST_CHECK(troll.state() == NpcState::DeadPendingRespawn);
    BOOST_CHECK(world.findNpcInRoom(arena, "Troll", npcs) == nullptr);
}

BOOST_AUTO_TEST_CASE(KillOnlyEndsFightsAgainstThatNpc)
{
    Npc& troll = addNpc(makeTemplate("Troll", 30, 100), "arena");
    Npc& ogre = addNpc(makeTemplate("Ogre", 40), "arena");
    auto alice = addPlayer("Alice", "arena");
    auto bob = addPlayer("Bob", "arena");
    engage(*alice, troll);
    engage(*bob, troll);
    // Bob is still on the troll's list but now swings at the ogre
    engage(*bob, ogre);

    deaths.handleNpcDeath(troll, *world.findRoom("arena"), now);

    BOOST_CHECK(!alice->isInCombat());
    BOOST_CHECK(bob->isTargeting(ogre.handle()));
    BOOST_CHECK_EQUAL(bob->experience(), 50);
    BOOST_CHECK_EQUAL(bob->kills(), 1);
}

BOOST_AUTO_TEST_CASE(DeathWithNoConnectedAttackerIsStillAnnounced)
{
    Npc& troll = addNpc(makeTemplate("Troll", 30, 100), "arena");
    troll.engage("Ghost");
    addPlayer("Carol", "arena");

    deaths.handleNpcDeath(troll, *world.findRoom("arena"), now);

    BOOST_CHECK(sink.received("Carol", "Troll dies."));
    BOOST_CHECK(!sink.received("Carol", "slain"));
}

BOOST_AUTO_TEST_CASE(NpcThatNeverReturnsFreesItsSlot)
{
    Npc& troll = addNpc(makeTemplate("Troll", 30, 100), "arena");
    const auto handle = troll.handle();
    deaths.handleNpcDeath(troll, *world.findRoom("arena"), now);

    BOOST_CHECK(npcs.get(handle) == nullptr);
    BOOST_CHECK_EQUAL(npcs.size(), 0u);
    BOOST_CHECK(!respawns.contains(handle));
}

BOOST_AUTO_TEST_SUITE_END()

// ==================== Loot ====================

BOOST_FIXTURE_TEST_SUITE(LootDropTests, EngineFixture)

BOOST_AUTO_TEST_CASE(LootLandsInRoom)
{
    auto tmpl = makeTemplate("Rat", 5, 10);
    tmpl.loot.push_back(LootEntry{ "rat_tail", 50.0 });
    tmpl.loot.push_back(LootEntry{ "no_such_item", 100.0 });
    Npc& rat = addNpc(tmpl, "arena");
    auto alice = addPlayer("Alice", "arena");
    engage(*alice, rat);

    rng.pushDoubles({ 0.1, 0.1 });
    Room& arena = *world.findRoom("arena");
    deaths.handleNpcDeath(rat, arena, now);

    BOOST_CHECK(hasItem(arena, "rat_tail"));
    BOOST_CHECK(!hasItem(arena, "no_such_item"));
    BOOST_CHECK(sink.received("Alice", "Rat dropped: a rat tail"));
}

BOOST_AUTO_TEST_CASE(MissingCatalogStillAwardsXp)
{
    auto tmpl = makeTemplate("Rat", 5, 10);
    tmpl.goldMin = 4;
    tmpl.goldMax = 4;
    tmpl.loot.push_back(LootEntry{ "rat_tail", 100.0 });
    Npc& rat = addNpc(tmpl, "arena");
    auto alice = addPlayer("Alice", "arena");
    engage(*alice, rat);

    ctx.loot = nullptr;
    Room& arena = *world.findRoom("arena");
    deaths.handleNpcDeath(rat, arena, now);

    BOOST_CHECK_EQUAL(alice->experience(), 10);
    BOOST_CHECK_EQUAL(alice->gold(), 0);
    BOOST_CHECK(arena.items().empty());
}

BOOST_AUTO_TEST_SUITE_END()

// ==================== Bosses ====================

BOOST_FIXTURE_TEST_SUITE(BossDeathTests, EngineFixture)

BOOST_AUTO_TEST_CASE(BossDropsKeyAndAllLoot)
{
    Npc& boss = addNpc(archivist(), "arena");
    auto alice = addPlayer("Alice", "arena");
    engage(*alice, boss);

    Room& arena = *world.findRoom("arena");
    deaths.handleNpcDeath(boss, arena, now);

    BOOST_CHECK(hasItem(arena, "tome"));
    BOOST_CHECK(hasItem(arena, bossKeyId(1)));
    BOOST_CHECK(sink.received("Alice", "dropped a Boss Key (Floor 1)!"));
}

BOOST_AUTO_TEST_CASE(FirstClearEarnsFirstTitle)
{
    Npc& boss = addNpc(archivist(), "arena");
    auto alice = addPlayer("Alice", "arena");
    auto bob = addPlayer("Bob", "town");
    engage(*alice, boss);

    deaths.handleNpcDeath(boss, *world.findRoom("arena"), now);

    const auto titles = alice->titles();
    BOOST_REQUIRE_EQUAL(titles.size(), 1u);
    BOOST_CHECK_EQUAL(titles.front(), "Archivist's End");
    BOOST_CHECK_EQUAL(bosses.firstKiller("human"), "Alice");
    BOOST_CHECK(sink.received("Bob", "Alice has defeated The Archivist for the first time!"));
    BOOST_CHECK(sink.received("Bob", "The final ascent is open!"));
    BOOST_CHECK(bosses.isFullyUnlocked());
}

BOOST_AUTO_TEST_CASE(LaterClearEarnsSharedTitle)
{
    BOOST_REQUIRE(bosses.recordKill("human", "Zed").ok());

    Npc& boss = addNpc(archivist(), "arena");
    auto alice = addPlayer("Alice", "arena");
    engage(*alice, boss);

    deaths.handleNpcDeath(boss, *world.findRoom("arena"), now);

    const auto titles = alice->titles();
    BOOST_REQUIRE_EQUAL(titles.size(), 1u);
    BOOST_CHECK_EQUAL(titles.front(), "Spire Conqueror");
    BOOST_CHECK(!sink.received("Alice", "for the first time"));
}

BOOST_AUTO_TEST_CASE(CapstoneLockedUntilPrerequisitesCleared)
{
    InMemoryBossTracker tracker({ "human", "elf" }, "unified");

    BossKillResult locked = tracker.recordKill("unified", "Alice");
    BOOST_CHECK(!locked.ok());
    BOOST_CHECK(!tracker.recordKill("dwarf", "Alice").ok());

    BOOST_CHECK(tracker.recordKill("human", "Alice").firstKill);
    BOOST_CHECK(!tracker.recordKill("human", "Bob").firstKill);
    BOOST_CHECK(!tracker.isFullyUnlocked());

    BOOST_CHECK(tracker.recordKill("elf", "Bob").firstKill);
    BOOST_CHECK(tracker.isFullyUnlocked());

    BossKillResult capstone = tracker.recordKill("unified", "Alice");
    BOOST_CHECK(capstone.ok());
    BOOST_CHECK(capstone.firstKill);
}

BOOST_AUTO_TEST_SUITE_END()
