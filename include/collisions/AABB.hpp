/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AABB_HPP
#define AABB_HPP

#include "utils/Vector2D.hpp"

namespace SentinelEngine {

struct AABB {
    Vector2D center;   // world center
    Vector2D halfSize; // half extents (w/2, h/2)

    AABB() = default;
    AABB(float cx, float cy, float hw, float hh) : center(cx, cy), halfSize(hw, hh) {}

    // Box covering one grid cell
    static AABB fromCell(int col, int row, float tileSize) {
        float half = tileSize * 0.5f;
        return AABB(col * tileSize + half, row * tileSize + half, half, half);
    }

    float left() const { return center.getX() - halfSize.getX(); }
    float right() const { return center.getX() + halfSize.getX(); }
    float top() const { return center.getY() - halfSize.getY(); }
    float bottom() const { return center.getY() + halfSize.getY(); }

    bool intersects(const AABB& other) const;
    bool contains(const Vector2D& p) const;
    Vector2D closestPoint(const Vector2D& p) const;

    // Strict: a circle exactly touching an edge does not overlap
    bool overlapsCircle(const Vector2D& c, float radius) const;

    // Squared distance between segment [a,b] and this box (0 if they cross)
    float segmentDistanceSquared(const Vector2D& a, const Vector2D& b) const;
    bool segmentIntersects(const Vector2D& a, const Vector2D& b) const;
};

} // namespace SentinelEngine

#endif // AABB_HPP
