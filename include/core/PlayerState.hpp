/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PLAYER_STATE_HPP
#define PLAYER_STATE_HPP

#include "utils/Vector2D.hpp"
#include "world/TileTypes.hpp"

namespace SentinelEngine {

/**
 * @brief Exploration-time player state shared by the controllers.
 *
 * Owned by SimulationContext; controllers hold it through a weak_ptr and
 * only CombatController writes to it (position write-back after an encounter).
 */
struct PlayerState {
    Vector2D position;
    Facing facing{Facing::South};
    float radius{10.0f};
    float speed{240.0f};        // Px/s
    float idleSeconds{0.0f};    // Time since the last movement input
};

} // namespace SentinelEngine

#endif // PLAYER_STATE_HPP
