/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef MAP_LOADER_HPP
#define MAP_LOADER_HPP

#include "world/LocalMapData.hpp"
#include <optional>
#include <string>

namespace SentinelEngine {

class JsonValue;

/**
 * @brief Builds LocalMapData from a JSON map document.
 *
 * Expected shape:
 * @code
 * {
 *   "id": "safehouse", "name": "Safehouse", "width": 10, "height": 8, "tileSize": 32,
 *   "tiles": [[1,1,1,...], ...],                     // rows of tile ids
 *   "npcs": [{ "id": "guard_1", "faction": "steel_syndicate",
 *              "position": {"col": 2, "row": 3},
 *              "patrolRoute": [{"col": 2, "row": 3}, {"col": 6, "row": 3}],
 *              "facing": "east", "fleeOnApproach": false,
 *              "glanceInterval": 3.0, "lingerTimer": 8.0 }],
 *   "spawnPoints": [{ "id": "entry", "position": {"col": 1, "row": 1},
 *                     "facing": "south", "isDefault": true }]
 * }
 * @endcode
 */
class MapLoader {
public:
    std::optional<LocalMapData> loadFromFile(const std::string& path);
    std::optional<LocalMapData> loadFromString(const std::string& json);

    const std::string& getLastError() const { return m_lastError; }

private:
    std::optional<LocalMapData> buildFromJson(const JsonValue& root);
    bool readTiles(const JsonValue& root, LocalMapData& data);
    bool readNPCs(const JsonValue& root, LocalMapData& data);
    bool readSpawnPoints(const JsonValue& root, LocalMapData& data);
    bool readGridPosition(const JsonValue& value, GridPosition& out, const std::string& context);
    void setError(const std::string& message);

    std::string m_lastError;
};

} // namespace SentinelEngine

#endif // MAP_LOADER_HPP
