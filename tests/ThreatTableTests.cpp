#define BOOST_TEST_MODULE ThreatTableTests
#include <boost/test/unit_test.hpp>

#include "../OTM_Combat/include/otm/combat/ThreatTable.h"

using otm::combat::ThreatTable;

BOOST_AUTO_TEST_SUITE(ThreatTableTests)

BOOST_AUTO_TEST_CASE(EmptyTableHasNoTarget)
{
    ThreatTable table;
    BOOST_CHECK(table.empty());
    BOOST_CHECK(table.highestThreatTarget().empty());
    BOOST_CHECK_EQUAL(table.threatOf("Alice"), 0);
}

BOOST_AUTO_TEST_CASE(EngageAddsZeroThreatOnce)
{
    ThreatTable table;
    BOOST_CHECK(table.engage("Alice"));
    BOOST_CHECK(!table.engage("Alice"));
    BOOST_CHECK_EQUAL(table.size(), 1u);
    BOOST_CHECK_EQUAL(table.threatOf("Alice"), 0);
    BOOST_CHECK(table.contains("Alice"));
}

BOOST_AUTO_TEST_CASE(AddThreatEngagesUnknownAttacker)
{
    ThreatTable table;
    table.addThreat("Bob", 7);
    BOOST_CHECK(table.contains("Bob"));
    BOOST_CHECK_EQUAL(table.threatOf("Bob"), 7);

    table.addThreat("Bob", 3);
    BOOST_CHECK_EQUAL(table.threatOf("Bob"), 10);
}

BOOST_AUTO_TEST_CASE(NegativeThreatIgnored)
{
    ThreatTable table;
    table.addThreat("Bob", 5);
    table.addThreat("Bob", -20);
    BOOST_CHECK_EQUAL(table.threatOf("Bob"), 5);
}

BOOST_AUTO_TEST_CASE(HighestThreatWins)
{
    ThreatTable table;
    table.engage("Alice");
    table.engage("Bob");
    table.addThreat("Alice", 4);
    table.addThreat("Bob", 9);
    BOOST_CHECK_EQUAL(table.highestThreatTarget(), "Bob");

    table.addThreat("Alice", 6);
    BOOST_CHECK_EQUAL(table.highestThreatTarget(), "Alice");
}

BOOST_AUTO_TEST_CASE(TiesGoToEarliestEngager)
{
    ThreatTable table;
    table.engage("Carol");
    table.engage("Alice");
    table.engage("Bob");
    BOOST_CHECK_EQUAL(table.highestThreatTarget(), "Carol");

    table.addThreat("Bob", 5);
    table.addThreat("Alice", 5);
    BOOST_CHECK_EQUAL(table.highestThreatTarget(), "Alice");
}

BOOST_AUTO_TEST_CASE(RemoveDropsTargetAndThreatTogether)
{
    ThreatTable table;
    table.addThreat("Alice", 10);
    table.addThreat("Bob", 2);

    BOOST_CHECK(table.remove("Alice"));
    BOOST_CHECK(!table.remove("Alice"));
    BOOST_CHECK(!table.contains("Alice"));
    BOOST_CHECK_EQUAL(table.threatOf("Alice"), 0);
    BOOST_CHECK_EQUAL(table.highestThreatTarget(), "Bob");

    const auto attackers = table.attackers();
    BOOST_REQUIRE_EQUAL(attackers.size(), 1u);
    BOOST_CHECK_EQUAL(attackers.front(), "Bob");
}

BOOST_AUTO_TEST_CASE(AttackersKeepEngagementOrder)
{
    ThreatTable table;
    table.engage("Carol");
    table.addThreat("Alice", 50);
    table.engage("Bob");

    const auto attackers = table.attackers();
    BOOST_REQUIRE_EQUAL(attackers.size(), 3u);
    BOOST_CHECK_EQUAL(attackers[0], "Carol");
    BOOST_CHECK_EQUAL(attackers[1], "Alice");
    BOOST_CHECK_EQUAL(attackers[2], "Bob");

    table.clear();
    BOOST_CHECK(table.empty());
}

BOOST_AUTO_TEST_SUITE_END()
