/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

/**
 * @file TileCollisionTests.cpp
 * @brief Tests for swept circle movement, line of sight and bounds clamping
 */

#define BOOST_TEST_MODULE TileCollisionTests
#include <boost/test/unit_test.hpp>

#include "../common/TestMaps.hpp"
#include "collisions/AABB.hpp"
#include "collisions/TileCollision.hpp"
#include "world/TileMap.hpp"
#include <random>
#include <vector>

using namespace SentinelEngine;

constexpr float RADIUS = 10.0f;

// ============================================================================
// AABB TESTS
// ============================================================================

BOOST_AUTO_TEST_SUITE(AABBTests)

BOOST_AUTO_TEST_CASE(TestCellBox)
{
    AABB box = AABB::fromCell(2, 1, 32.0f);
    BOOST_CHECK_CLOSE(box.left(), 64.0f, 0.001f);
    BOOST_CHECK_CLOSE(box.right(), 96.0f, 0.001f);
    BOOST_CHECK_CLOSE(box.top(), 32.0f, 0.001f);
    BOOST_CHECK_CLOSE(box.bottom(), 64.0f, 0.001f);
    BOOST_CHECK(box.contains(Vector2D(80.0f, 48.0f)));
    BOOST_CHECK(!box.contains(Vector2D(10.0f, 48.0f)));
}

BOOST_AUTO_TEST_CASE(TestCircleTouchingEdgeDoesNotOverlap)
{
    AABB box = AABB::fromCell(1, 1, 32.0f);
    BOOST_CHECK(!box.overlapsCircle(Vector2D(22.0f, 48.0f), 10.0f));
    BOOST_CHECK(box.overlapsCircle(Vector2D(23.0f, 48.0f), 10.0f));
}

BOOST_AUTO_TEST_CASE(TestSegmentCrossing)
{
    AABB box = AABB::fromCell(1, 0, 32.0f);
    BOOST_CHECK(box.segmentIntersects(Vector2D(0.0f, 16.0f), Vector2D(100.0f, 16.0f)));
    BOOST_CHECK(!box.segmentIntersects(Vector2D(0.0f, 50.0f), Vector2D(100.0f, 50.0f)));
    BOOST_CHECK_CLOSE(box.segmentDistanceSquared(Vector2D(0.0f, 42.0f), Vector2D(100.0f, 42.0f)), 100.0f, 0.01f);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// MOVEMENT TESTS
// ============================================================================

BOOST_AUTO_TEST_SUITE(MovementTests)

BOOST_AUTO_TEST_CASE(TestFreeMoveIsUnchanged)
{
    auto map = TestMaps::fromAscii(TestMaps::walledRoom(6, 6));
    Vector2D from(60.0f, 60.0f);
    Vector2D to(100.0f, 90.0f);

    MovementResult result = TileCollision::resolveMovement(*map, from, to, RADIUS);
    BOOST_CHECK(!result.collided);
    BOOST_CHECK(result.position == to);
}

BOOST_AUTO_TEST_CASE(TestWallSlideKeepsFreeAxis)
{
    // East wall starts at x = 160
    auto map = TestMaps::fromAscii(TestMaps::walledRoom(6, 6));
    Vector2D from(140.0f, 80.0f);
    Vector2D to(170.0f, 110.0f);

    MovementResult result = TileCollision::resolveMovement(*map, from, to, RADIUS);
    BOOST_CHECK(result.collided);
    BOOST_CHECK(result.slidY);
    BOOST_CHECK(!result.slidX);
    BOOST_CHECK_CLOSE(result.position.getX(), 140.0f, 0.001f);
    BOOST_CHECK_CLOSE(result.position.getY(), 110.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestLongerSlideWinsWhenBothAreFree)
{
    auto map = TestMaps::fromAscii({"#####",
                                    "#...#",
                                    "#.#.#",
                                    "#...#",
                                    "#####"});
    Vector2D from(48.0f, 48.0f);

    // Aimed into the pillar: X covers 42 px, Y only 27
    MovementResult result = TileCollision::resolveMovement(*map, from, Vector2D(90.0f, 75.0f), RADIUS);
    BOOST_CHECK(result.collided);
    BOOST_CHECK(result.slidX);
    BOOST_CHECK_CLOSE(result.position.getX(), 90.0f, 0.001f);
    BOOST_CHECK_CLOSE(result.position.getY(), 48.0f, 0.001f);

    result = TileCollision::resolveMovement(*map, from, Vector2D(75.0f, 90.0f), RADIUS);
    BOOST_CHECK(result.slidY);
    BOOST_CHECK_CLOSE(result.position.getX(), 48.0f, 0.001f);
    BOOST_CHECK_CLOSE(result.position.getY(), 90.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestBlockedCornerStaysPut)
{
    auto map = TestMaps::fromAscii(TestMaps::walledRoom(4, 4));
    Vector2D from(45.0f, 45.0f);

    // Into the north-west corner: both axes blocked
    MovementResult result = TileCollision::resolveMovement(*map, from, Vector2D(10.0f, 10.0f), RADIUS);
    BOOST_CHECK(result.collided);
    BOOST_CHECK(result.position == from);
}

BOOST_AUTO_TEST_CASE(TestNoTunnellingThroughThinWall)
{
    auto map = TestMaps::fromAscii({"#######",
                                    "#..#..#",
                                    "#..#..#",
                                    "#######"});
    Vector2D from(48.0f, 48.0f);

    for (float distance : {60.0f, 150.0f, 500.0f, 5000.0f}) {
        MovementResult result = TileCollision::resolveMovement(
            *map, from, Vector2D(from.getX() + distance, 48.0f), RADIUS);
        BOOST_CHECK(result.collided);
        BOOST_CHECK_LE(result.position.getX() + RADIUS, 96.0f);
        BOOST_CHECK(TileCollision::isPositionFree(*map, result.position, RADIUS));
    }
}

BOOST_AUTO_TEST_CASE(TestRandomMovesNeverEndInsideSolidTiles)
{
    auto map = TestMaps::fromAscii({"##########",
                                    "#........#",
                                    "#..F..#..#",
                                    "#..#.....#",
                                    "#......~.#",
                                    "#.h......#",
                                    "#....##..#",
                                    "#........#",
                                    "##########"});

    std::mt19937 rng(4242);
    std::uniform_real_distribution<float> coord(0.0f, 320.0f);
    std::uniform_real_distribution<float> step(-120.0f, 120.0f);

    Vector2D position = map->gridToWorld(1, 1);
    BOOST_REQUIRE(TileCollision::isPositionFree(*map, position, RADIUS));

    int collisions = 0;
    for (int i = 0; i < 5000; ++i) {
        Vector2D target(position.getX() + step(rng), position.getY() + step(rng));
        MovementResult result = TileCollision::resolveMovement(*map, position, target, RADIUS);
        if (result.collided) {
            ++collisions;
        }
        position = result.position;
        BOOST_REQUIRE(TileCollision::isPositionFree(*map, position, RADIUS));

        // Occasionally jump to a fresh free spot to cover more of the map
        if (i % 100 == 0) {
            Vector2D jump(coord(rng), coord(rng));
            if (TileCollision::isPositionFree(*map, jump, RADIUS)) {
                position = jump;
            }
        }
    }
    BOOST_CHECK_GT(collisions, 0);
}

BOOST_AUTO_TEST_CASE(TestOverlappingStartMayMoveAway)
{
    auto map = TestMaps::fromAscii(TestMaps::walledRoom(5, 5));
    // 5 px into the west wall
    Vector2D from(37.0f, 80.0f);
    BOOST_CHECK(!TileCollision::isPositionFree(*map, from, RADIUS));

    MovementResult away = TileCollision::resolveMovement(*map, from, Vector2D(60.0f, 80.0f), RADIUS);
    BOOST_CHECK(!away.collided);

    MovementResult deeper = TileCollision::resolveMovement(*map, from, Vector2D(30.0f, 80.0f), RADIUS);
    BOOST_CHECK(deeper.collided);
}

BOOST_AUTO_TEST_CASE(TestOverlappingStartCannotCrossWallColumn)
{
    // Full-height wall at column 5 (x 160..192)
    auto map = TestMaps::fromAscii({"###########",
                                    "#....#....#",
                                    "#....#....#",
                                    "#....#....#",
                                    "###########"});
    const Vector2D from(150.0f, 80.0f);

    // Resting against the wall at radius 10, then swept with a wider radius
    BOOST_CHECK(TileCollision::isPositionFree(*map, from, RADIUS));
    const float wideRadius = 32.0f / 3.0f;
    BOOST_CHECK(!TileCollision::isPositionFree(*map, from, wideRadius));

    BOOST_CHECK(TileCollision::sweepBlocked(*map, from, Vector2D(240.0f, 80.0f), wideRadius));
    MovementResult crossing = TileCollision::resolveMovement(*map, from, Vector2D(240.0f, 80.0f), wideRadius);
    BOOST_CHECK(crossing.collided);
    BOOST_CHECK_LT(crossing.position.getX(), 160.0f);

    MovementResult back = TileCollision::resolveMovement(*map, from, Vector2D(120.0f, 80.0f), wideRadius);
    BOOST_CHECK(!back.collided);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// LINE OF SIGHT TESTS
// ============================================================================

BOOST_AUTO_TEST_SUITE(LineOfSightTests)

BOOST_AUTO_TEST_CASE(TestOpenRoom)
{
    auto map = TestMaps::fromAscii(TestMaps::walledRoom(8, 6));
    BOOST_CHECK(TileCollision::hasLineOfSight(*map, GridPosition{1, 1}, GridPosition{6, 4}));
    BOOST_CHECK(TileCollision::hasLineOfSight(*map, GridPosition{6, 4}, GridPosition{1, 1}));
    BOOST_CHECK(TileCollision::hasLineOfSight(*map, GridPosition{3, 3}, GridPosition{3, 3}));
}

BOOST_AUTO_TEST_CASE(TestWallBlocks)
{
    auto map = TestMaps::fromAscii({"#######",
                                    "#..#..#",
                                    "#.....#",
                                    "#######"});
    BOOST_CHECK(!TileCollision::hasLineOfSight(*map, GridPosition{1, 1}, GridPosition{5, 1}));
    BOOST_CHECK(TileCollision::hasLineOfSight(*map, GridPosition{1, 2}, GridPosition{5, 2}));
    BOOST_CHECK(!TileCollision::hasLineOfSight(*map, map->gridToWorld(2, 1), map->gridToWorld(4, 1)));
}

BOOST_AUTO_TEST_CASE(TestLowWallAndCoverDoNotBlockSight)
{
    auto map = TestMaps::fromAscii({"#######",
                                    "#.lFh.#",
                                    "#######"});
    BOOST_CHECK(TileCollision::hasLineOfSight(*map, GridPosition{1, 1}, GridPosition{5, 1}));
}

BOOST_AUTO_TEST_CASE(TestEndpointsNeverBlock)
{
    auto map = TestMaps::fromAscii({"#####",
                                    "#...#",
                                    "#####"});
    // From inside the wall at (0,1) to the floor and back
    BOOST_CHECK(TileCollision::hasLineOfSight(*map, GridPosition{0, 1}, GridPosition{3, 1}));
    BOOST_CHECK(TileCollision::hasLineOfSight(*map, GridPosition{3, 1}, GridPosition{4, 1}));
    // A wall cell between two wall endpoints still blocks
    BOOST_CHECK(!TileCollision::hasLineOfSight(*map, GridPosition{0, 0}, GridPosition{0, 2}));
}

BOOST_AUTO_TEST_CASE(TestOffMapCellsBlock)
{
    auto map = TestMaps::fromAscii({"...",
                                    "..."});
    BOOST_CHECK(!TileCollision::hasLineOfSight(*map, GridPosition{-1, 0}, GridPosition{-3, 0}));
    BOOST_CHECK(TileCollision::hasLineOfSight(*map, GridPosition{0, 0}, GridPosition{2, 1}));
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// BOUNDS TESTS
// ============================================================================

BOOST_AUTO_TEST_SUITE(BoundsTests)

BOOST_AUTO_TEST_CASE(TestClampToBounds)
{
    auto map = TestMaps::fromAscii(TestMaps::walledRoom(5, 4));
    Vector2D clamped = TileCollision::clampToBounds(*map, Vector2D(-5.0f, 500.0f), RADIUS);
    BOOST_CHECK_CLOSE(clamped.getX(), RADIUS, 0.001f);
    BOOST_CHECK_CLOSE(clamped.getY(), 128.0f - RADIUS, 0.001f);

    Vector2D inside(70.0f, 60.0f);
    BOOST_CHECK(TileCollision::clampToBounds(*map, inside, RADIUS) == inside);
}

BOOST_AUTO_TEST_CASE(TestTinyMapClampsToCentre)
{
    auto map = TestMaps::fromAscii({"."}, 16.0f);
    Vector2D clamped = TileCollision::clampToBounds(*map, Vector2D(100.0f, -100.0f), RADIUS);
    BOOST_CHECK_CLOSE(clamped.getX(), 8.0f, 0.001f);
    BOOST_CHECK_CLOSE(clamped.getY(), 8.0f, 0.001f);
}

BOOST_AUTO_TEST_SUITE_END()
