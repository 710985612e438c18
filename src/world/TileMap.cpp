/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/TileMap.hpp"
#include "world/LocalMapData.hpp"
#include <cmath>
#include <utility>

namespace SentinelEngine {

TileMap::TileMap(int width, int height, float tileSize, std::vector<TileType> tiles)
    : m_width(width < 0 ? 0 : width),
      m_height(height < 0 ? 0 : height),
      m_tileSize(tileSize > 0.0f ? tileSize : DEFAULT_TILE_SIZE),
      m_tiles(std::move(tiles)) {
    // Short grids are padded with walls so every in-bounds cell is addressable
    m_tiles.resize(static_cast<size_t>(m_width) * static_cast<size_t>(m_height), TileType::WALL);
}

TileMap::TileMap(const LocalMapData& data)
    : TileMap(data.width, data.height, data.tileSize, data.tiles) {}

std::optional<TileType> TileMap::getTile(int col, int row) const {
    if (!inBounds(col, row)) {
        return std::nullopt;
    }
    return m_tiles[static_cast<size_t>(row) * static_cast<size_t>(m_width) + static_cast<size_t>(col)];
}

const TileProperties& TileMap::getProperties(int col, int row) const {
    auto tile = getTile(col, row);
    if (!tile) {
        return OUT_OF_BOUNDS_PROPERTIES;
    }
    return getTileProperties(*tile);
}

int TileMap::getCoverValueAt(const Vector2D& worldPos) const {
    GridPosition cell = worldToGrid(worldPos);
    // Off-map positions offer no cover
    if (!inBounds(cell.col, cell.row)) {
        return 0;
    }
    return getCoverValue(cell.col, cell.row);
}

GridPosition TileMap::worldToGrid(const Vector2D& worldPos) const {
    return GridPosition{static_cast<int>(std::floor(worldPos.getX() / m_tileSize)),
                        static_cast<int>(std::floor(worldPos.getY() / m_tileSize))};
}

Vector2D TileMap::gridToWorld(int col, int row) const {
    return Vector2D(col * m_tileSize + m_tileSize * 0.5f, row * m_tileSize + m_tileSize * 0.5f);
}

Vector2D TileMap::gridToWorldTopLeft(int col, int row) const {
    return Vector2D(col * m_tileSize, row * m_tileSize);
}

} // namespace SentinelEngine
