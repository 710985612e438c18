/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TEST_MAPS_HPP
#define TEST_MAPS_HPP

/**
 * @file TestMaps.hpp
 * @brief Small tile maps built from ASCII art for the unit tests
 *
 * Legend: '.' floor, '#' wall, 'l' low wall, 'F' full cover, 'h' half cover,
 * '~' water, 'd' debris. Rows must all be the same length.
 *
 * Usage:
 *   auto map = TestMaps::fromAscii({"#####",
 *                                   "#...#",
 *                                   "#####"});
 */

#include "world/LocalMapData.hpp"
#include "world/TileMap.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace TestMaps {

inline SentinelEngine::TileType tileFromChar(char c)
{
    using SentinelEngine::TileType;
    switch (c) {
        case '#': return TileType::WALL;
        case 'l': return TileType::WALL_LOW;
        case 'F': return TileType::COVER_FULL;
        case 'h': return TileType::COVER_HALF;
        case '~': return TileType::WATER;
        case 'd': return TileType::DEBRIS;
        default: return TileType::FLOOR;
    }
}

inline SentinelEngine::LocalMapData dataFromAscii(const std::vector<std::string>& rows,
                                                  float tileSize = 32.0f)
{
    SentinelEngine::LocalMapData data;
    data.id = "test_map";
    data.name = "Test Map";
    data.height = static_cast<int>(rows.size());
    data.width = rows.empty() ? 0 : static_cast<int>(rows.front().size());
    data.tileSize = tileSize;
    for (const auto& row : rows) {
        for (char c : row) {
            data.tiles.push_back(tileFromChar(c));
        }
    }
    return data;
}

inline std::shared_ptr<const SentinelEngine::TileMap> fromAscii(const std::vector<std::string>& rows,
                                                                float tileSize = 32.0f)
{
    return std::make_shared<const SentinelEngine::TileMap>(dataFromAscii(rows, tileSize));
}

// Walled rectangle with an open floor inside
inline std::vector<std::string> walledRoom(int width, int height)
{
    std::vector<std::string> rows;
    for (int row = 0; row < height; ++row) {
        std::string line;
        for (int col = 0; col < width; ++col) {
            const bool edge = row == 0 || col == 0 || row == height - 1 || col == width - 1;
            line.push_back(edge ? '#' : '.');
        }
        rows.push_back(line);
    }
    return rows;
}

inline SentinelEngine::NPCStaticData makeNPC(const std::string& id, const std::string& faction,
                                             SentinelEngine::GridPosition spawn,
                                             SentinelEngine::Facing facing = SentinelEngine::Facing::South,
                                             std::vector<SentinelEngine::GridPosition> route = {})
{
    SentinelEngine::NPCStaticData npc;
    npc.id = id;
    npc.name = id;
    npc.faction = faction;
    npc.spawn = spawn;
    npc.facing = facing;
    npc.patrolRoute = std::move(route);
    return npc;
}

} // namespace TestMaps

#endif // TEST_MAPS_HPP
