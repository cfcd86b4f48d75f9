#define BOOST_TEST_MODULE WorldLoaderTests
#include <boost/test/unit_test.hpp>

#include <stdexcept>

#include "TestSupport.h"
#include "../OTM_Combat/include/otm/combat/WorldLoader.h"

using namespace otm::combat;
using otm::test::RecordingSink;
using otm::test::ScriptedRandom;
using otm::test::makeTemplate;

namespace {
    const char* kWorldJson = R"({
        "rooms": [
            { "id": "town", "name": "Town Square", "description": "Busy.", "floor": 0, "kind": "safe",
              "exits": { "up": "hall" } },
            { "id": "hall", "name": "Great Hall", "description": "Dusty.", "floor": 1,
              "exits": { "down": "town", "east": "vault", "west": "void" } },
            { "id": "vault", "name": "Vault", "floor": 1, "kind": "boss",
              "exits": { "west": "hall" } },
            { "id": "hall", "name": "Duplicate Hall", "floor": 9 }
        ],
        "spawns": [
            { "template": "cave_rat", "room": "hall", "count": 3 },
            { "template": "archivist", "room": "vault" },
            { "template": "cave_rat", "room": "nowhere" }
        ]
    })";

    const char* kTemplatesJson = R"({
        "templates": [
            { "id": "cave_rat", "name": "Cave Rat", "health": 12, "min_damage": 4, "max_damage": 1,
              "mob_type": "beast", "respawn_median": 60, "respawn_variation": 15, "max_floor": 3,
              "loot": [ { "item": "rat_tail", "chance": 40 }, { "chance": 10 } ] },
            { "id": "archivist", "name": "The Archivist", "health": 0, "boss": true,
              "final_boss_of_area": "human", "mob_type": "undead", "respawn_median": -5 },
            { "id": "cave_rat", "name": "Second Rat" },
            { "id": "", "name": "Nameless" },
            { "id": "wisp", "name": "Wisp", "mob_type": "sprite", "min_floor": 2, "max_floor": 2 }
        ]
    })";
}

// ==================== World file ====================

BOOST_AUTO_TEST_SUITE(WorldFileTests)

BOOST_AUTO_TEST_CASE(RoomsExitsAndSpawnsLoaded)
{
    World world;
    const auto spawns = loadWorldFromString(kWorldJson, "test-world", world);

    BOOST_CHECK_EQUAL(world.rooms().size(), 3u);
    BOOST_CHECK_EQUAL(world.floorCount(), 1);

    Room* hall = world.findRoom("hall");
    BOOST_REQUIRE(hall != nullptr);
    BOOST_CHECK_EQUAL(hall->name(), "Great Hall");
    BOOST_CHECK_EQUAL(hall->floor(), 1);

    // exit to an unknown room is dropped
    BOOST_REQUIRE_EQUAL(hall->exits().size(), 2u);
    const auto horizontal = hall->horizontalExits();
    BOOST_REQUIRE_EQUAL(horizontal.size(), 1u);
    BOOST_CHECK_EQUAL(horizontal.front().direction, "east");
    BOOST_CHECK_EQUAL(horizontal.front().target, "vault");

    BOOST_CHECK(world.findRoom("town")->kind() == RoomKind::Safe);
    BOOST_CHECK(world.findRoom("vault")->kind() == RoomKind::Boss);
    BOOST_CHECK_EQUAL(world.findRoom("vault")->name(), "Vault");

    BOOST_REQUIRE_EQUAL(spawns.size(), 4u);
    BOOST_CHECK_EQUAL(spawns[0].templateId, "cave_rat");
    BOOST_CHECK_EQUAL(spawns[3].templateId, "archivist");
    BOOST_CHECK_EQUAL(spawns[3].room, "vault");
}

BOOST_AUTO_TEST_CASE(MalformedWorldThrows)
{
    World world;
    BOOST_CHECK_THROW(loadWorldFromString("{ broken", "broken", world), std::runtime_error);
    BOOST_CHECK_THROW(loadWorldFromString(R"({ "rooms": [] })", "empty", world), std::runtime_error);
    BOOST_CHECK_THROW(loadWorldFromString(R"({ "rooms": [ { "name": "No Id" } ] })", "noid", world),
                      std::runtime_error);
    BOOST_CHECK_THROW(loadWorld("does/not/exist.json", world), std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()

// ==================== NPC templates ====================

BOOST_AUTO_TEST_SUITE(NpcTemplateStoreTests)

BOOST_AUTO_TEST_CASE(TemplatesLoadedAndRepaired)
{
    NpcTemplateStore store;
    BOOST_REQUIRE(store.loadFromString(kTemplatesJson, "test-templates"));
    BOOST_CHECK_EQUAL(store.size(), 3u);

    const NpcTemplate* rat = store.find("cave_rat");
    BOOST_REQUIRE(rat != nullptr);
    BOOST_CHECK_EQUAL(rat->name, "Cave Rat");
    BOOST_CHECK_EQUAL(rat->minDamage, 1);
    BOOST_CHECK_EQUAL(rat->maxDamage, 4);
    BOOST_CHECK(rat->mobType == MobType::Beast);
    BOOST_CHECK_EQUAL(rat->fleeThreshold, defaultFleeThreshold(MobType::Beast));
    BOOST_CHECK_EQUAL(rat->respawnMedianSec, 60);
    BOOST_REQUIRE_EQUAL(rat->loot.size(), 1u);
    BOOST_CHECK_EQUAL(rat->loot.front().itemId, "rat_tail");

    const NpcTemplate* boss = store.find("archivist");
    BOOST_REQUIRE(boss != nullptr);
    BOOST_CHECK_EQUAL(boss->maxHealth, 10);
    BOOST_CHECK_EQUAL(boss->respawnMedianSec, 0);
    BOOST_CHECK_EQUAL(boss->finalBossOfArea, "human");
    BOOST_CHECK_EQUAL(boss->fleeThreshold, 0.0);

    const NpcTemplate* wisp = store.find("wisp");
    BOOST_REQUIRE(wisp != nullptr);
    BOOST_CHECK(wisp->mobType == MobType::Humanoid);
}

BOOST_AUTO_TEST_CASE(FloorSelectionSkipsBossesAndOutOfRange)
{
    NpcTemplateStore store;
    BOOST_REQUIRE(store.loadFromString(kTemplatesJson, "test-templates"));

    const auto floorOne = store.forFloor(1);
    BOOST_REQUIRE_EQUAL(floorOne.size(), 1u);
    BOOST_CHECK_EQUAL(floorOne.front()->templateId, "cave_rat");

    BOOST_CHECK_EQUAL(store.forFloor(2).size(), 2u);
    BOOST_CHECK(store.forFloor(4).empty());
}

BOOST_AUTO_TEST_CASE(BadTemplateFilesRejected)
{
    NpcTemplateStore store;
    BOOST_CHECK(!store.loadFromString("{ nope", "broken"));
    BOOST_CHECK(!store.loadFromString(R"({ "mobs": [] })", "wrong-key"));
    BOOST_CHECK(!store.loadFromString(R"({ "templates": [] })", "empty"));
    BOOST_CHECK(!store.loadFromFile("does/not/exist.json"));
}

BOOST_AUTO_TEST_SUITE_END()

// ==================== Items ====================

BOOST_AUTO_TEST_SUITE(ItemCatalogTests)

BOOST_AUTO_TEST_CASE(ItemsLoadedById)
{
    ScriptedRandom rng;
    JsonItemCatalog catalog(rng);
    BOOST_REQUIRE(catalog.loadFromString(R"({ "items": [
        { "id": "rat_tail", "name": "a rat tail", "type": "junk" },
        { "id": "potion" },
        { "name": "no id" }
    ] })", "test-items"));

    BOOST_CHECK_EQUAL(catalog.size(), 2u);
    auto tail = catalog.findItem("rat_tail");
    BOOST_REQUIRE(tail.has_value());
    BOOST_CHECK_EQUAL(tail->name, "a rat tail");
    auto potion = catalog.findItem("potion");
    BOOST_REQUIRE(potion.has_value());
    BOOST_CHECK_EQUAL(potion->name, "potion");
    BOOST_CHECK_EQUAL(potion->type, "misc");
    BOOST_CHECK(!catalog.findItem("sword").has_value());
}

BOOST_AUTO_TEST_CASE(BadItemFilesRejected)
{
    ScriptedRandom rng;
    JsonItemCatalog catalog(rng);
    BOOST_CHECK(!catalog.loadFromString("[", "broken"));
    BOOST_CHECK(!catalog.loadFromString(R"({ "things": [] })", "wrong-key"));
    BOOST_CHECK(!catalog.loadFromFile("does/not/exist.json"));
}

BOOST_AUTO_TEST_CASE(BossKeyNamedForFloor)
{
    const Item key = makeBossKey(3);
    BOOST_CHECK_EQUAL(key.id, bossKeyId(3));
    BOOST_CHECK_EQUAL(key.name, "Boss Key (Floor 3)");
    BOOST_CHECK_EQUAL(key.type, "key");
}

BOOST_AUTO_TEST_SUITE_END()

// ==================== Rooms ====================

BOOST_AUTO_TEST_SUITE(RoomTests)

BOOST_AUTO_TEST_CASE(BroadcastSkipsExcluded)
{
    RecordingSink sink;
    Room room("hall", "Hall", "", 1, RoomKind::Normal);
    room.addPlayer("Alice");
    room.addPlayer("Bob");
    room.addPlayer("Alice");
    BOOST_CHECK_EQUAL(room.players().size(), 2u);

    room.broadcast(sink, "A bell rings.", { "Alice" });
    BOOST_CHECK(!sink.received("Alice", "A bell rings."));
    BOOST_CHECK(sink.received("Bob", "A bell rings."));
}

BOOST_AUTO_TEST_CASE(DescribeListsOccupantsAndItems)
{
    World world;
    NpcRegistry npcs;
    Room* hall = world.addRoom("hall", "Great Hall", "Dusty.", 1);
    world.addRoom("vault", "Vault", "", 1);
    hall->addExit("east", "vault");
    BOOST_CHECK(world.addRoom("hall", "Again", "", 1) == nullptr);

    const auto rat = npcs.create(makeTemplate("Cave Rat", 5), "hall", 1);
    const auto dead = npcs.create(makeTemplate("Dead Rat", 5), "hall", 1);
    world.placeNpc(*npcs.get(rat), *hall);
    world.placeNpc(*npcs.get(dead), *hall);
    npcs.get(dead)->markDead();
    hall->addPlayer("Alice");
    hall->addPlayer("Bob");
    hall->addItem(makeBossKey(1));

    const std::string text = world.describeRoom(*hall, npcs, "Alice");
    BOOST_CHECK(text.find("Great Hall") != std::string::npos);
    BOOST_CHECK(text.find("Exits: east") != std::string::npos);
    BOOST_CHECK(text.find("Cave Rat is here.") != std::string::npos);
    BOOST_CHECK(text.find("Dead Rat") == std::string::npos);
    BOOST_CHECK(text.find("Bob is here.") != std::string::npos);
    BOOST_CHECK(text.find("Alice is here.") == std::string::npos);
    BOOST_CHECK(text.find("You see: Boss Key (Floor 1)") != std::string::npos);

    BOOST_CHECK(world.findNpcInRoom(*hall, "cave rat", npcs) == npcs.get(rat));
    BOOST_CHECK(world.findNpcInRoom(*hall, "Dead Rat", npcs) == nullptr);
}

BOOST_AUTO_TEST_SUITE_END()
