/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

/**
 * @file TileMapTests.cpp
 * @brief Unit tests for TileMap and MapLoader
 *
 * Tests cover:
 * - Tile property table
 * - World <-> grid conversions
 * - Out-of-bounds lookups behaving like solid wall
 * - Map document validation
 */

#define BOOST_TEST_MODULE TileMapTests
#include <boost/test/unit_test.hpp>

#include "../common/TestMaps.hpp"
#include "world/MapLoader.hpp"
#include "world/TileMap.hpp"
#include "world/TileTypes.hpp"
#include <string>

using namespace SentinelEngine;

// ============================================================================
// TILE PROPERTY TESTS
// ============================================================================

BOOST_AUTO_TEST_SUITE(TilePropertyTests)

BOOST_AUTO_TEST_CASE(TestFloorIsOpen)
{
    const auto& floor = getTileProperties(TileType::FLOOR);
    BOOST_CHECK(floor.walkable);
    BOOST_CHECK(!floor.blocksSight);
    BOOST_CHECK_EQUAL(floor.coverValue, 0);
}

BOOST_AUTO_TEST_CASE(TestWallBlocksEverything)
{
    const auto& wall = getTileProperties(TileType::WALL);
    BOOST_CHECK(!wall.walkable);
    BOOST_CHECK(wall.blocksSight);
    BOOST_CHECK(wall.blocksProjectiles);
    BOOST_CHECK_EQUAL(wall.coverValue, 2);
}

BOOST_AUTO_TEST_CASE(TestLowWallCanBeSeenOver)
{
    const auto& low = getTileProperties(TileType::WALL_LOW);
    BOOST_CHECK(!low.walkable);
    BOOST_CHECK(!low.blocksSight);
    BOOST_CHECK_EQUAL(low.coverValue, 1);
}

BOOST_AUTO_TEST_CASE(TestCoverTiles)
{
    BOOST_CHECK_EQUAL(getTileProperties(TileType::COVER_FULL).coverValue, 2);
    BOOST_CHECK_EQUAL(getTileProperties(TileType::COVER_HALF).coverValue, 1);
    BOOST_CHECK_EQUAL(getTileProperties(TileType::DEBRIS).movementCost, 2);
    BOOST_CHECK(getTileProperties(TileType::DEBRIS).walkable);
}

BOOST_AUTO_TEST_CASE(TestTileIdRange)
{
    BOOST_CHECK(tileTypeFromId(0) == TileType::FLOOR);
    BOOST_CHECK(tileTypeFromId(14) == TileType::CONTAINER);
    BOOST_CHECK(!tileTypeFromId(-1).has_value());
    BOOST_CHECK(!tileTypeFromId(TILE_TYPE_COUNT).has_value());
}

BOOST_AUTO_TEST_CASE(TestFacingFromDirection)
{
    BOOST_CHECK_EQUAL(facingFromDirection(5.0f, 1.0f), Facing::East);
    BOOST_CHECK_EQUAL(facingFromDirection(-5.0f, 1.0f), Facing::West);
    BOOST_CHECK_EQUAL(facingFromDirection(1.0f, -5.0f), Facing::North);
    BOOST_CHECK_EQUAL(facingFromDirection(1.0f, 5.0f), Facing::South);
    // Ties go vertical, zero faces south
    BOOST_CHECK_EQUAL(facingFromDirection(3.0f, 3.0f), Facing::South);
    BOOST_CHECK_EQUAL(facingFromDirection(0.0f, 0.0f), Facing::South);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// GRID TESTS
// ============================================================================

struct RoomFixture
{
    RoomFixture()
        : map(TestMaps::fromAscii({"#####",
                                   "#.F.#",
                                   "#.h.#",
                                   "#####"}))
    {
    }

    std::shared_ptr<const TileMap> map;
};

BOOST_FIXTURE_TEST_SUITE(GridTests, RoomFixture)

BOOST_AUTO_TEST_CASE(TestDimensions)
{
    BOOST_CHECK_EQUAL(map->getWidth(), 5);
    BOOST_CHECK_EQUAL(map->getHeight(), 4);
    BOOST_CHECK_CLOSE(map->getPixelWidth(), 160.0f, 0.001f);
    BOOST_CHECK_CLOSE(map->getPixelHeight(), 128.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestLookups)
{
    BOOST_CHECK(map->getTile(0, 0) == TileType::WALL);
    BOOST_CHECK(map->getTile(1, 1) == TileType::FLOOR);
    BOOST_CHECK(map->getTile(2, 1) == TileType::COVER_FULL);
    BOOST_CHECK(map->isWalkable(1, 1));
    BOOST_CHECK(!map->isWalkable(2, 1));
    BOOST_CHECK_EQUAL(map->getCoverValue(2, 1), 2);
    BOOST_CHECK_EQUAL(map->getCoverValue(2, 2), 1);
}

BOOST_AUTO_TEST_CASE(TestOutOfBoundsActsAsWall)
{
    BOOST_CHECK(!map->getTile(-1, 0).has_value());
    BOOST_CHECK(!map->getTile(5, 0).has_value());
    BOOST_CHECK(!map->getTile(0, 4).has_value());

    BOOST_CHECK(!map->isWalkable(-1, 2));
    BOOST_CHECK(map->blocksSight(10, 10));
    BOOST_CHECK(map->blocksProjectiles(-3, -3));
    BOOST_CHECK_EQUAL(map->getMovementCost(99, 0), 0);
}

BOOST_AUTO_TEST_CASE(TestWorldToGrid)
{
    GridPosition cell = map->worldToGrid(Vector2D(80.0f, 50.0f));
    BOOST_CHECK_EQUAL(cell.col, 2);
    BOOST_CHECK_EQUAL(cell.row, 1);

    // Exact cell boundary belongs to the next cell
    cell = map->worldToGrid(Vector2D(32.0f, 64.0f));
    BOOST_CHECK_EQUAL(cell.col, 1);
    BOOST_CHECK_EQUAL(cell.row, 2);

    // Negative coordinates floor, not truncate
    cell = map->worldToGrid(Vector2D(-1.0f, -40.0f));
    BOOST_CHECK_EQUAL(cell.col, -1);
    BOOST_CHECK_EQUAL(cell.row, -2);
}

BOOST_AUTO_TEST_CASE(TestGridToWorld)
{
    Vector2D centre = map->gridToWorld(2, 3);
    BOOST_CHECK_CLOSE(centre.getX(), 80.0f, 0.001f);
    BOOST_CHECK_CLOSE(centre.getY(), 112.0f, 0.001f);

    Vector2D corner = map->gridToWorldTopLeft(2, 3);
    BOOST_CHECK_CLOSE(corner.getX(), 64.0f, 0.001f);
    BOOST_CHECK_CLOSE(corner.getY(), 96.0f, 0.001f);

    GridPosition back = map->worldToGrid(centre);
    BOOST_CHECK(back == (GridPosition{2, 3}));
}

BOOST_AUTO_TEST_CASE(TestCoverValueAt)
{
    BOOST_CHECK_EQUAL(map->getCoverValueAt(map->gridToWorld(2, 1)), 2);
    BOOST_CHECK_EQUAL(map->getCoverValueAt(map->gridToWorld(2, 2)), 1);
    BOOST_CHECK_EQUAL(map->getCoverValueAt(map->gridToWorld(1, 1)), 0);
    // Off-map positions offer no cover
    BOOST_CHECK_EQUAL(map->getCoverValueAt(Vector2D(-50.0f, -50.0f)), 0);
}

BOOST_AUTO_TEST_CASE(TestShortTileListIsPaddedWithWalls)
{
    TileMap padded(3, 2, 16.0f, {TileType::FLOOR, TileType::FLOOR});
    BOOST_CHECK(padded.getTile(1, 0) == TileType::FLOOR);
    BOOST_CHECK(padded.getTile(2, 0) == TileType::WALL);
    BOOST_CHECK(padded.getTile(2, 1) == TileType::WALL);
    BOOST_CHECK_CLOSE(padded.getTileSize(), 16.0f, 0.001f);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// MAP LOADER TESTS
// ============================================================================

BOOST_AUTO_TEST_SUITE(MapLoaderTests)

const std::string VALID_MAP = R"({
  "id": "yard", "name": "Yard", "width": 3, "height": 2, "tileSize": 24,
  "tiles": [[1, 0, 9], [1, 0, 8]],
  "npcs": [
    { "id": "guard", "faction": "steel_syndicate", "position": {"col": 1, "row": 0},
      "patrolRoute": [{"col": 1, "row": 0}, {"col": 1, "row": 1}],
      "facing": "west", "fleeOnApproach": true, "glanceInterval": 2.5 }
  ],
  "spawnPoints": [
    { "id": "a", "position": {"col": 1, "row": 1} },
    { "id": "b", "position": {"col": 1, "row": 0}, "facing": "north", "isDefault": true }
  ]
})";

BOOST_AUTO_TEST_CASE(TestLoadValidMap)
{
    MapLoader loader;
    auto data = loader.loadFromString(VALID_MAP);
    BOOST_REQUIRE(data.has_value());

    BOOST_CHECK_EQUAL(data->id, "yard");
    BOOST_CHECK_EQUAL(data->width, 3);
    BOOST_CHECK_EQUAL(data->height, 2);
    BOOST_CHECK_CLOSE(data->tileSize, 24.0f, 0.001f);
    BOOST_REQUIRE_EQUAL(data->tiles.size(), 6u);
    BOOST_CHECK(data->tiles[2] == TileType::COVER_HALF);
    BOOST_CHECK(data->tiles[5] == TileType::COVER_FULL);

    BOOST_REQUIRE_EQUAL(data->npcs.size(), 1u);
    const auto& npc = data->npcs.front();
    BOOST_CHECK_EQUAL(npc.faction, "steel_syndicate");
    BOOST_CHECK_EQUAL(npc.name, "guard");
    BOOST_CHECK_EQUAL(npc.facing, Facing::West);
    BOOST_CHECK(npc.fleeOnApproach);
    BOOST_REQUIRE(npc.glanceInterval.has_value());
    BOOST_CHECK_CLOSE(*npc.glanceInterval, 2.5f, 0.001f);
    BOOST_CHECK(!npc.lingerTimer.has_value());
    BOOST_CHECK_EQUAL(npc.patrolRoute.size(), 2u);

    const SpawnPoint* spawn = data->getDefaultSpawn();
    BOOST_REQUIRE(spawn != nullptr);
    BOOST_CHECK_EQUAL(spawn->id, "b");
    BOOST_CHECK_EQUAL(spawn->facing, Facing::North);
}

BOOST_AUTO_TEST_CASE(TestDefaultSpawnFallsBackToFirst)
{
    LocalMapData data;
    BOOST_CHECK(data.getDefaultSpawn() == nullptr);

    data.spawnPoints.push_back(SpawnPoint{"first", GridPosition{1, 1}, Facing::East, false});
    data.spawnPoints.push_back(SpawnPoint{"second", GridPosition{2, 2}, Facing::East, false});
    BOOST_REQUIRE(data.getDefaultSpawn() != nullptr);
    BOOST_CHECK_EQUAL(data.getDefaultSpawn()->id, "first");
}

BOOST_AUTO_TEST_CASE(TestRejectsMissingDimensions)
{
    MapLoader loader;
    BOOST_CHECK(!loader.loadFromString(R"({"tiles": [[0]]})").has_value());
    BOOST_CHECK(!loader.getLastError().empty());
}

BOOST_AUTO_TEST_CASE(TestRejectsRowCountMismatch)
{
    MapLoader loader;
    auto data = loader.loadFromString(R"({"width": 2, "height": 2, "tiles": [[0, 0]]})");
    BOOST_CHECK(!data.has_value());
    BOOST_CHECK(loader.getLastError().find("height") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(TestRejectsRowWidthMismatch)
{
    MapLoader loader;
    BOOST_CHECK(!loader.loadFromString(R"({"width": 2, "height": 1, "tiles": [[0, 0, 0]]})").has_value());
}

BOOST_AUTO_TEST_CASE(TestRejectsUnknownTileId)
{
    MapLoader loader;
    BOOST_CHECK(!loader.loadFromString(R"({"width": 2, "height": 1, "tiles": [[0, 42]]})").has_value());
    BOOST_CHECK(!loader.loadFromString(R"({"width": 2, "height": 1, "tiles": [[0, "x"]]})").has_value());
}

BOOST_AUTO_TEST_CASE(TestRejectsNPCWithoutId)
{
    MapLoader loader;
    auto data = loader.loadFromString(
        R"({"width": 1, "height": 1, "tiles": [[0]], "npcs": [{"position": {"col": 0, "row": 0}}]})");
    BOOST_CHECK(!data.has_value());
}

BOOST_AUTO_TEST_CASE(TestRejectsBadGridPosition)
{
    MapLoader loader;
    auto data = loader.loadFromString(
        R"({"width": 1, "height": 1, "tiles": [[0]], "npcs": [{"id": "x", "position": {"col": 0}}]})");
    BOOST_CHECK(!data.has_value());
}

BOOST_AUTO_TEST_CASE(TestRejectsNonIntegralNumbers)
{
    MapLoader loader;
    BOOST_CHECK(!loader.loadFromString(R"({"width": 2.5, "height": 1, "tiles": [[0, 0]]})").has_value());
    BOOST_CHECK(loader.getLastError().find("width") != std::string::npos);

    // Tile id 1.7 must not load as a wall
    BOOST_CHECK(!loader.loadFromString(R"({"width": 2, "height": 1, "tiles": [[0, 1.7]]})").has_value());

    auto data = loader.loadFromString(
        R"({"width": 3, "height": 1, "tiles": [[0, 0, 0]], "npcs": [{"id": "x", "position": {"col": 2.9, "row": 0}}]})");
    BOOST_CHECK(!data.has_value());
    BOOST_CHECK(loader.getLastError().find("col") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(TestRejectsOutOfRangeDimensions)
{
    MapLoader loader;
    BOOST_CHECK(!loader.loadFromString(R"({"width": 1e20, "height": 1, "tiles": [[0]]})").has_value());
    BOOST_CHECK(!loader.loadFromString(R"({"width": 1, "height": -1e20, "tiles": [[0]]})").has_value());
    BOOST_CHECK(!loader.loadFromString(R"({"width": 100000, "height": 100000, "tiles": []})").has_value());
    BOOST_CHECK(!loader.getLastError().empty());

    // Whole numbers written with a fraction part still load
    BOOST_CHECK(loader.loadFromString(R"({"width": 2.0, "height": 1, "tiles": [[0, 1]]})").has_value());
}

BOOST_AUTO_TEST_CASE(TestRejectsMalformedJson)
{
    MapLoader loader;
    BOOST_CHECK(!loader.loadFromString("{ \"width\": ").has_value());
    BOOST_CHECK(!loader.loadFromString("[1, 2, 3]").has_value());
}

BOOST_AUTO_TEST_SUITE_END()
