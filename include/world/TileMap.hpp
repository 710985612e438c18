/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TILE_MAP_HPP
#define TILE_MAP_HPP

#include "utils/Vector2D.hpp"
#include "world/TileTypes.hpp"
#include <optional>
#include <vector>

namespace SentinelEngine {

struct LocalMapData;

/**
 * @brief Immutable tile grid snapshot answering all spatial tile queries.
 *
 * Lookups outside the grid never fail: they report OUT_OF_BOUNDS_PROPERTIES
 * (non-walkable, sight-blocking) so boundary mistakes degrade to "can't walk there".
 */
class TileMap {
public:
    TileMap(int width, int height, float tileSize, std::vector<TileType> tiles);
    explicit TileMap(const LocalMapData& data);

    int getWidth() const { return m_width; }
    int getHeight() const { return m_height; }
    float getTileSize() const { return m_tileSize; }
    float getPixelWidth() const { return m_width * m_tileSize; }
    float getPixelHeight() const { return m_height * m_tileSize; }

    bool inBounds(int col, int row) const {
        return col >= 0 && row >= 0 && col < m_width && row < m_height;
    }

    std::optional<TileType> getTile(int col, int row) const;
    const TileProperties& getProperties(int col, int row) const;

    bool isWalkable(int col, int row) const { return getProperties(col, row).walkable; }
    bool blocksSight(int col, int row) const { return getProperties(col, row).blocksSight; }
    bool blocksProjectiles(int col, int row) const { return getProperties(col, row).blocksProjectiles; }
    int getMovementCost(int col, int row) const { return getProperties(col, row).movementCost; }
    int getCoverValue(int col, int row) const { return getProperties(col, row).coverValue; }

    // Cover at the tile containing a world point
    int getCoverValueAt(const Vector2D& worldPos) const;

    GridPosition worldToGrid(const Vector2D& worldPos) const;
    // Center of the cell
    Vector2D gridToWorld(int col, int row) const;
    Vector2D gridToWorld(const GridPosition& pos) const { return gridToWorld(pos.col, pos.row); }
    Vector2D gridToWorldTopLeft(int col, int row) const;

private:
    int m_width;
    int m_height;
    float m_tileSize;
    std::vector<TileType> m_tiles;
};

} // namespace SentinelEngine

#endif // TILE_MAP_HPP
