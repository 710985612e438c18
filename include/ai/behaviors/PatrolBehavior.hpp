/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PATROL_BEHAVIOR_HPP
#define PATROL_BEHAVIOR_HPP

#include "ai/BehaviorConfig.hpp"
#include "utils/Vector2D.hpp"
#include "world/LocalMapData.hpp"
#include "world/TileTypes.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>

namespace SentinelEngine {

class TileMap;
struct AlertRecord;

// Closed set of per-faction patrol strategies
enum class PatrolStrategy : uint8_t {
  Simple,        // Walk the route, 1 s dwell per node
  Sweep,         // Walk the route, longer inspection dwell
  Wander,        // Walk to a random point near each node, random dwell
  StaticWatch,   // Teleport between nodes, long dwell
  RitualCircuit  // Walk the route without dwelling
};

PatrolStrategy patrolStrategyForFaction(std::string_view faction);
const char* patrolStrategyName(PatrolStrategy strategy);

/**
 * @brief Mutable simulation state of one NPC outside combat.
 *
 * Owned by PatrolController; 'data' is a copy of the authored NPC entry and
 * is never modified.
 */
struct NPCSimulationRecord {
  std::string id;
  Vector2D position;
  Facing facing{Facing::South};
  size_t pathIndex{0};
  float waitTimer{0.0f};                 // Seconds of dwell remaining
  std::optional<Vector2D> wanderTarget;  // Wander strategy only
  PatrolStrategy strategy{PatrolStrategy::Simple};
  NPCStaticData data;

  static NPCSimulationRecord fromStaticData(const NPCStaticData& npc, const TileMap& map);
};

struct PatrolContext {
  const TileMap& map;
  const PatrolBehaviorConfig& config;
  float deltaTime;
  std::mt19937& rng;
};

/**
 * @brief Advance one NPC by one tick according to its strategy.
 *
 * Combat: no movement. Investigating: run toward the investigation target.
 * Patrolling: the strategy's waypoint contract.
 */
void updatePatrol(NPCSimulationRecord& npc, const AlertRecord& alert, const PatrolContext& context);

// Collision-resolved step toward 'target' at 'speed' px/s; updates facing
void moveToward(NPCSimulationRecord& npc, const Vector2D& target, float speed,
                const PatrolContext& context);

} // namespace SentinelEngine

#endif // PATROL_BEHAVIOR_HPP
