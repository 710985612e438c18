/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef LOCAL_MAP_DATA_HPP
#define LOCAL_MAP_DATA_HPP

#include "world/TileTypes.hpp"
#include <optional>
#include <string>
#include <vector>

namespace SentinelEngine {

/**
 * @brief Authored data for one NPC placed on a local map.
 * Never mutated by the simulation.
 */
struct NPCStaticData {
    std::string id;
    std::string name;
    std::string faction;                  // Empty = unaffiliated
    std::string disposition{"neutral"};
    GridPosition spawn;
    std::vector<GridPosition> patrolRoute; // Closed loop; empty = stationary
    Facing facing{Facing::South};
    bool fleeOnApproach{false};
    std::optional<float> glanceInterval;  // Seconds between glances (randomized if unset)
    std::optional<float> lingerTimer;     // Seconds of lingering before a shift
};

struct SpawnPoint {
    std::string id;
    GridPosition position;
    Facing facing{Facing::South};
    bool isDefault{false};
};

struct LocalMapData {
    std::string id;
    std::string name;
    int width{0};   // In tiles
    int height{0};  // In tiles
    float tileSize{DEFAULT_TILE_SIZE};
    std::vector<TileType> tiles; // Row-major, width * height
    std::vector<NPCStaticData> npcs;
    std::vector<SpawnPoint> spawnPoints;

    // Default spawn, falling back to the first one listed
    const SpawnPoint* getDefaultSpawn() const {
        for (const auto& spawn : spawnPoints) {
            if (spawn.isDefault) {
                return &spawn;
            }
        }
        return spawnPoints.empty() ? nullptr : &spawnPoints.front();
    }
};

} // namespace SentinelEngine

#endif // LOCAL_MAP_DATA_HPP
