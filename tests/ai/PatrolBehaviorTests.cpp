/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

/**
 * @file PatrolBehaviorTests.cpp
 * @brief Tests for the per-faction patrol strategies
 */

#define BOOST_TEST_MODULE PatrolBehaviorTests
#include <boost/test/unit_test.hpp>

#include "../common/TestMaps.hpp"
#include "ai/AlertSystem.hpp"
#include "ai/BehaviorConfig.hpp"
#include "ai/behaviors/PatrolBehavior.hpp"
#include "world/TileMap.hpp"
#include <cmath>
#include <random>
#include <vector>

using namespace SentinelEngine;

namespace {
constexpr float DT = 0.1f;
} // namespace

struct PatrolFixture
{
    PatrolFixture()
        : map(TestMaps::fromAscii(TestMaps::walledRoom(12, 10))),
          rng(99)
    {
    }

    NPCSimulationRecord makeRecord(const std::string& faction, std::vector<GridPosition> route,
                                   GridPosition spawn = GridPosition{2, 2})
    {
        auto npc = TestMaps::makeNPC("npc", faction, spawn, Facing::South, std::move(route));
        return NPCSimulationRecord::fromStaticData(npc, *map);
    }

    void tick(NPCSimulationRecord& npc, const AlertRecord& alert = AlertRecord{})
    {
        PatrolContext context{*map, config, DT, rng};
        updatePatrol(npc, alert, context);
    }

    std::shared_ptr<const TileMap> map;
    PatrolBehaviorConfig config;
    std::mt19937 rng;
};

// ============================================================================
// STRATEGY LOOKUP TESTS
// ============================================================================

BOOST_AUTO_TEST_SUITE(StrategyLookupTests)

BOOST_AUTO_TEST_CASE(TestFactionTable)
{
    BOOST_CHECK(patrolStrategyForFaction("steel_syndicate") == PatrolStrategy::Sweep);
    BOOST_CHECK(patrolStrategyForFaction("ember_colonies") == PatrolStrategy::Wander);
    BOOST_CHECK(patrolStrategyForFaction("ghost_protocol") == PatrolStrategy::StaticWatch);
    BOOST_CHECK(patrolStrategyForFaction("covenant") == PatrolStrategy::RitualCircuit);
}

BOOST_AUTO_TEST_CASE(TestUnknownFactionFallsBackToSimple)
{
    BOOST_CHECK(patrolStrategyForFaction("") == PatrolStrategy::Simple);
    BOOST_CHECK(patrolStrategyForFaction("Steel_Syndicate") == PatrolStrategy::Simple);
    BOOST_CHECK(patrolStrategyForFaction("traders") == PatrolStrategy::Simple);
}

BOOST_AUTO_TEST_CASE(TestStrategyNames)
{
    BOOST_CHECK_EQUAL(std::string(patrolStrategyName(PatrolStrategy::StaticWatch)), "static_watch");
    BOOST_CHECK_EQUAL(std::string(patrolStrategyName(PatrolStrategy::RitualCircuit)), "ritual_circuit");
}

BOOST_FIXTURE_TEST_CASE(TestRecordFromStaticData, PatrolFixture)
{
    NPCSimulationRecord record = makeRecord("covenant", {{2, 2}, {6, 2}}, GridPosition{3, 4});
    BOOST_CHECK(record.position == map->gridToWorld(3, 4));
    BOOST_CHECK(record.strategy == PatrolStrategy::RitualCircuit);
    BOOST_CHECK_EQUAL(record.pathIndex, 0u);
    BOOST_CHECK_EQUAL(record.waitTimer, 0.0f);
    BOOST_CHECK_EQUAL(record.data.patrolRoute.size(), 2u);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// WAYPOINT TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(WaypointTests, PatrolFixture)

BOOST_AUTO_TEST_CASE(TestSimpleLoopWithWait)
{
    NPCSimulationRecord npc = makeRecord("", {{2, 2}, {5, 2}});

    // Standing on node 0: dwell then head for node 1
    tick(npc);
    BOOST_CHECK_EQUAL(npc.pathIndex, 1u);
    BOOST_CHECK_CLOSE(npc.waitTimer, config.simpleWait, 0.001f);

    const Vector2D start = npc.position;
    for (int i = 0; i < 9; ++i) {
        tick(npc);
        BOOST_CHECK(npc.position == start);
    }

    // Walks to node 1 and turns back
    bool returned = false;
    for (int i = 0; i < 100 && !returned; ++i) {
        tick(npc);
        BOOST_CHECK_CLOSE(npc.position.getY(), start.getY(), 0.001f);
        returned = npc.pathIndex == 0;
    }
    BOOST_CHECK(returned);
    BOOST_CHECK_LT(Vector2D::distance(npc.position, map->gridToWorld(5, 2)), config.waypointReachedRadius);
    BOOST_CHECK_EQUAL(npc.facing, Facing::East);
    BOOST_CHECK_CLOSE(npc.waitTimer, config.simpleWait, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestSweepDwellsLonger)
{
    NPCSimulationRecord npc = makeRecord("steel_syndicate", {{2, 2}, {5, 2}});
    tick(npc);
    BOOST_CHECK_CLOSE(npc.waitTimer, config.sweepWait, 0.001f);
    BOOST_CHECK_GT(config.sweepWait, config.simpleWait);
}

BOOST_AUTO_TEST_CASE(TestRitualCircuitNeverDwells)
{
    NPCSimulationRecord npc = makeRecord("covenant", {{2, 2}, {4, 2}, {4, 4}});
    tick(npc);
    BOOST_CHECK_EQUAL(npc.pathIndex, 1u);
    BOOST_CHECK_EQUAL(npc.waitTimer, 0.0f);

    // Leaves on the very next tick
    const Vector2D start = npc.position;
    tick(npc);
    BOOST_CHECK(npc.position != start);

    size_t visited = 0;
    size_t lastIndex = npc.pathIndex;
    for (int i = 0; i < 300; ++i) {
        tick(npc);
        BOOST_CHECK_EQUAL(npc.waitTimer, 0.0f);
        if (npc.pathIndex != lastIndex) {
            ++visited;
            lastIndex = npc.pathIndex;
        }
    }
    // Several full laps of the three-node loop
    BOOST_CHECK_GE(visited, 6u);
}

BOOST_AUTO_TEST_CASE(TestEmptyRouteStaysPut)
{
    NPCSimulationRecord npc = makeRecord("steel_syndicate", {});
    const Vector2D start = npc.position;
    for (int i = 0; i < 20; ++i) {
        tick(npc);
    }
    BOOST_CHECK(npc.position == start);
    BOOST_CHECK_EQUAL(npc.pathIndex, 0u);
}

BOOST_AUTO_TEST_CASE(TestWanderTargetsStayNearAnchor)
{
    NPCSimulationRecord npc = makeRecord("ember_colonies", {{5, 5}, {7, 5}});
    const float maxOffset = map->getTileSize() * config.wanderOffsetTiles;

    for (int sample = 0; sample < 50; ++sample) {
        const size_t anchorIndex = npc.pathIndex;
        npc.position = map->gridToWorld(1, 1);
        npc.waitTimer = 0.0f;
        npc.wanderTarget.reset();
        tick(npc);
        BOOST_REQUIRE(npc.wanderTarget.has_value());

        Vector2D anchor = map->gridToWorld(npc.data.patrolRoute[anchorIndex]);
        BOOST_CHECK_LE(std::fabs(npc.wanderTarget->getX() - anchor.getX()), maxOffset);
        BOOST_CHECK_LE(std::fabs(npc.wanderTarget->getY() - anchor.getY()), maxOffset);
        npc.pathIndex = (anchorIndex + 1) % npc.data.patrolRoute.size();
    }
}

BOOST_AUTO_TEST_CASE(TestWanderWalksSlower)
{
    NPCSimulationRecord npc = makeRecord("ember_colonies", {{8, 8}}, GridPosition{2, 2});
    const Vector2D start = npc.position;
    tick(npc);

    BOOST_REQUIRE(npc.wanderTarget.has_value());
    const float moved = Vector2D::distance(start, npc.position);
    BOOST_CHECK_LE(moved, config.moveSpeed * config.wanderSpeedMultiplier * DT + 0.01f);
}

BOOST_AUTO_TEST_CASE(TestWanderDwellIsRandomisedWithinBounds)
{
    NPCSimulationRecord npc = makeRecord("ember_colonies", {{5, 5}});
    npc.wanderTarget = npc.position;
    tick(npc);

    BOOST_CHECK(!npc.wanderTarget.has_value());
    BOOST_CHECK_GE(npc.waitTimer, config.wanderWaitMin);
    BOOST_CHECK_LE(npc.waitTimer, config.wanderWaitMin + config.wanderWaitSpread);
}

BOOST_AUTO_TEST_CASE(TestStaticWatchTeleports)
{
    NPCSimulationRecord npc = makeRecord("ghost_protocol", {{2, 2}, {8, 6}, {3, 7}});

    tick(npc);
    BOOST_CHECK_EQUAL(npc.pathIndex, 1u);
    BOOST_CHECK(npc.position == map->gridToWorld(8, 6));
    BOOST_CHECK_CLOSE(npc.waitTimer, config.staticWatchWait, 0.001f);

    // Holds position for the full wait, then jumps again
    int ticks = 0;
    while (npc.pathIndex == 1 && ticks < 200) {
        BOOST_CHECK(npc.position == map->gridToWorld(8, 6));
        tick(npc);
        ++ticks;
    }
    BOOST_CHECK_GE(ticks, 50);
    BOOST_CHECK_LE(ticks, 52);
    BOOST_CHECK_EQUAL(npc.pathIndex, 2u);
    BOOST_CHECK(npc.position == map->gridToWorld(3, 7));
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// ALERT CONTRACT TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(AlertContractTests, PatrolFixture)

BOOST_AUTO_TEST_CASE(TestCombatFreezesMovement)
{
    for (const char* faction : {"", "steel_syndicate", "ember_colonies", "ghost_protocol", "covenant"}) {
        NPCSimulationRecord npc = makeRecord(faction, {{2, 2}, {8, 2}});
        AlertRecord alert;
        alert.state = AlertState::Combat;
        alert.targetPosition = map->gridToWorld(8, 8);

        const Vector2D start = npc.position;
        for (int i = 0; i < 20; ++i) {
            tick(npc, alert);
        }
        BOOST_CHECK(npc.position == start);
        BOOST_CHECK_EQUAL(npc.pathIndex, 0u);
    }
}

BOOST_AUTO_TEST_CASE(TestInvestigatingRunsToTarget)
{
    for (const char* faction : {"", "ember_colonies", "ghost_protocol"}) {
        NPCSimulationRecord npc = makeRecord(faction, {{2, 2}, {2, 8}});
        AlertRecord alert;
        alert.state = AlertState::Investigating;
        alert.targetPosition = map->gridToWorld(9, 2);

        const Vector2D start = npc.position;
        tick(npc, alert);
        const float runStep = config.moveSpeed * config.investigateSpeedMultiplier * DT;
        BOOST_CHECK_CLOSE(Vector2D::distance(start, npc.position), runStep, 0.01f);
        BOOST_CHECK_EQUAL(npc.facing, Facing::East);
        BOOST_CHECK_EQUAL(npc.pathIndex, 0u);

        for (int i = 0; i < 50; ++i) {
            tick(npc, alert);
        }
        BOOST_CHECK_LT(Vector2D::distance(npc.position, *alert.targetPosition), 1.0f);
    }
}

BOOST_AUTO_TEST_CASE(TestInvestigatingWithoutTargetPatrols)
{
    NPCSimulationRecord npc = makeRecord("", {{2, 2}, {5, 2}});
    AlertRecord alert;
    alert.state = AlertState::Investigating;

    tick(npc, alert);
    BOOST_CHECK_EQUAL(npc.pathIndex, 1u);
    BOOST_CHECK_CLOSE(npc.waitTimer, config.simpleWait, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestMoveTowardNeverOvershoots)
{
    NPCSimulationRecord npc = makeRecord("", {});
    Vector2D target(npc.position.getX(), npc.position.getY() + 5.0f);

    PatrolContext context{*map, config, 1.0f, rng};
    moveToward(npc, target, config.moveSpeed, context);
    BOOST_CHECK(npc.position == target);
    BOOST_CHECK_EQUAL(npc.facing, Facing::South);
}

BOOST_AUTO_TEST_CASE(TestMoveTowardRespectsWalls)
{
    NPCSimulationRecord npc = makeRecord("", {}, GridPosition{1, 1});
    PatrolContext context{*map, config, 1.0f, rng};
    moveToward(npc, Vector2D(-100.0f, 48.0f), config.moveSpeed, context);

    BOOST_CHECK_GE(npc.position.getX() - config.entityRadius, 32.0f);
    BOOST_CHECK_EQUAL(npc.facing, Facing::West);
}

BOOST_AUTO_TEST_SUITE_END()
