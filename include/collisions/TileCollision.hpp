/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TILE_COLLISION_HPP
#define TILE_COLLISION_HPP

#include "utils/Vector2D.hpp"
#include "world/TileTypes.hpp"

namespace SentinelEngine {

class TileMap;

struct MovementResult {
    Vector2D position;     // Resolved position
    bool collided{false};  // The direct move was blocked
    bool slidX{false};     // Resolved by keeping only the X component
    bool slidY{false};     // Resolved by keeping only the Y component
};

/**
 * @brief Stateless spatial queries over a TileMap.
 *
 * Movement is a swept circle: every non-walkable cell inside the swept
 * bounding box is tested against the whole segment, so large displacements
 * cannot tunnel through one-cell walls.
 */
namespace TileCollision {

// Circle at rest overlaps no non-walkable cell
bool isPositionFree(const TileMap& map, const Vector2D& position, float radius);

// Moving a circle of 'radius' along from->to touches a non-walkable cell
bool sweepBlocked(const TileMap& map, const Vector2D& from, const Vector2D& to, float radius);

/**
 * Resolve a desired move. If the direct sweep is blocked, try the X-only and
 * Y-only slides; take the free one, or the longer one when both are free,
 * or stay put when neither is.
 */
MovementResult resolveMovement(const TileMap& map, const Vector2D& from, const Vector2D& to, float radius);

// Bresenham walk between the cells containing a and b; endpoint cells never block
bool hasLineOfSight(const TileMap& map, const Vector2D& a, const Vector2D& b);
bool hasLineOfSight(const TileMap& map, const GridPosition& a, const GridPosition& b);

// Keep a circle of 'radius' fully inside the map rectangle
Vector2D clampToBounds(const TileMap& map, const Vector2D& position, float radius);

} // namespace TileCollision

} // namespace SentinelEngine

#endif // TILE_COLLISION_HPP
