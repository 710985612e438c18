/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/TileCollision.hpp"
#include "collisions/AABB.hpp"
#include "world/TileMap.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace SentinelEngine {
namespace TileCollision {

namespace {

constexpr float OVERLAP_EPSILON_SQ = 1e-3f;

struct CellRange {
    int minCol, maxCol, minRow, maxRow;
};

CellRange sweptCells(const TileMap& map, const Vector2D& from, const Vector2D& to, float radius) {
    const float ts = map.getTileSize();
    return CellRange{
        static_cast<int>(std::floor((std::min(from.getX(), to.getX()) - radius) / ts)),
        static_cast<int>(std::floor((std::max(from.getX(), to.getX()) + radius) / ts)),
        static_cast<int>(std::floor((std::min(from.getY(), to.getY()) - radius) / ts)),
        static_cast<int>(std::floor((std::max(from.getY(), to.getY()) + radius) / ts))};
}

} // namespace

bool isPositionFree(const TileMap& map, const Vector2D& position, float radius) {
    CellRange cells = sweptCells(map, position, position, radius);
    for (int row = cells.minRow; row <= cells.maxRow; ++row) {
        for (int col = cells.minCol; col <= cells.maxCol; ++col) {
            if (map.isWalkable(col, row)) {
                continue;
            }
            if (AABB::fromCell(col, row, map.getTileSize()).overlapsCircle(position, radius)) {
                return false;
            }
        }
    }
    return true;
}

bool sweepBlocked(const TileMap& map, const Vector2D& from, const Vector2D& to, float radius) {
    const float radiusSq = radius * radius;
    CellRange cells = sweptCells(map, from, to, radius);

    for (int row = cells.minRow; row <= cells.maxRow; ++row) {
        for (int col = cells.minCol; col <= cells.maxCol; ++col) {
            if (map.isWalkable(col, row)) {
                continue;
            }

            AABB box = AABB::fromCell(col, row, map.getTileSize());
            if (box.segmentDistanceSquared(from, to) >= radiusSq) {
                continue;
            }

            // Already overlapping at the start: allow the move only if no point
            // of the path gets closer to the cell than the start does
            float startSq = Vector2D::distanceSquared(from, box.closestPoint(from));
            if (startSq < radiusSq && box.segmentDistanceSquared(from, to) >= startSq - OVERLAP_EPSILON_SQ) {
                continue;
            }
            return true;
        }
    }
    return false;
}

MovementResult resolveMovement(const TileMap& map, const Vector2D& from, const Vector2D& to, float radius) {
    MovementResult result;
    result.position = to;

    if (!sweepBlocked(map, from, to, radius)) {
        return result;
    }
    result.collided = true;

    const Vector2D slideX(to.getX(), from.getY());
    const Vector2D slideY(from.getX(), to.getY());
    const bool canSlideX = !sweepBlocked(map, from, slideX, radius);
    const bool canSlideY = !sweepBlocked(map, from, slideY, radius);

    if (canSlideX && !canSlideY) {
        result.position = slideX;
        result.slidX = true;
    } else if (canSlideY && !canSlideX) {
        result.position = slideY;
        result.slidY = true;
    } else if (canSlideX && canSlideY) {
        float dxSlide = std::fabs(slideX.getX() - from.getX());
        float dySlide = std::fabs(slideY.getY() - from.getY());
        if (dxSlide > dySlide) {
            result.position = slideX;
            result.slidX = true;
        } else {
            result.position = slideY;
            result.slidY = true;
        }
    } else {
        result.position = from;
    }

    return result;
}

bool hasLineOfSight(const TileMap& map, const GridPosition& a, const GridPosition& b) {
    int x0 = a.col;
    int y0 = a.row;
    const int x1 = b.col;
    const int y1 = b.row;

    const int dx = std::abs(x1 - x0);
    const int dy = std::abs(y1 - y0);
    const int sx = x0 < x1 ? 1 : -1;
    const int sy = y0 < y1 ? 1 : -1;
    int err = dx - dy;

    while (true) {
        bool isEndpoint = (x0 == a.col && y0 == a.row) || (x0 == b.col && y0 == b.row);
        if (!isEndpoint && map.blocksSight(x0, y0)) {
            return false;
        }

        if (x0 == x1 && y0 == y1) {
            break;
        }

        int e2 = 2 * err;
        if (e2 > -dy) {
            err -= dy;
            x0 += sx;
        }
        if (e2 < dx) {
            err += dx;
            y0 += sy;
        }
    }
    return true;
}

bool hasLineOfSight(const TileMap& map, const Vector2D& a, const Vector2D& b) {
    return hasLineOfSight(map, map.worldToGrid(a), map.worldToGrid(b));
}

Vector2D clampToBounds(const TileMap& map, const Vector2D& position, float radius) {
    auto clampAxis = [radius](float value, float extent) {
        if (extent <= radius * 2.0f) {
            return extent * 0.5f;
        }
        return std::clamp(value, radius, extent - radius);
    };
    return Vector2D(clampAxis(position.getX(), map.getPixelWidth()),
                    clampAxis(position.getY(), map.getPixelHeight()));
}

} // namespace TileCollision
} // namespace SentinelEngine
