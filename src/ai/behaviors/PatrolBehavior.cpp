/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/behaviors/PatrolBehavior.hpp"
#include "ai/AlertSystem.hpp"
#include "collisions/TileCollision.hpp"
#include "world/TileMap.hpp"
#include <algorithm>
#include <array>
#include <utility>

namespace SentinelEngine {

namespace {

constexpr std::array<std::pair<std::string_view, PatrolStrategy>, 4> FACTION_STRATEGIES{{
    {"steel_syndicate", PatrolStrategy::Sweep},
    {"ember_colonies", PatrolStrategy::Wander},
    {"ghost_protocol", PatrolStrategy::StaticWatch},
    {"covenant", PatrolStrategy::RitualCircuit},
}};

float randomUnit(std::mt19937& rng) {
  std::uniform_real_distribution<float> dist(0.0f, 1.0f);
  return dist(rng);
}

bool hasReached(const Vector2D& current, const Vector2D& target, const PatrolBehaviorConfig& config) {
  return Vector2D::distance(current, target) < config.waypointReachedRadius;
}

Vector2D currentWaypoint(const NPCSimulationRecord& npc, const TileMap& map) {
  return map.gridToWorld(npc.data.patrolRoute[npc.pathIndex]);
}

void advanceIndex(NPCSimulationRecord& npc) {
  npc.pathIndex = (npc.pathIndex + 1) % npc.data.patrolRoute.size();
}

// Shared walk-dwell-advance loop for the walking strategies
void walkRoute(NPCSimulationRecord& npc, const PatrolContext& context, float dwell, bool useWait) {
  if (npc.data.patrolRoute.empty()) {
    return;
  }

  if (useWait && npc.waitTimer > 0.0f) {
    npc.waitTimer -= context.deltaTime;
    return;
  }

  Vector2D target = currentWaypoint(npc, context.map);
  if (hasReached(npc.position, target, context.config)) {
    if (useWait) {
      npc.waitTimer = dwell;
    }
    advanceIndex(npc);
  } else {
    moveToward(npc, target, context.config.moveSpeed, context);
  }
}

void updateSimple(NPCSimulationRecord& npc, const AlertRecord& alert, const PatrolContext& context) {
  if (alert.state == AlertState::Combat) {
    return;
  }

  if (alert.state == AlertState::Investigating && alert.targetPosition) {
    moveToward(npc, *alert.targetPosition,
               context.config.moveSpeed * context.config.investigateSpeedMultiplier, context);
    return;
  }

  walkRoute(npc, context, context.config.simpleWait, true);
}

void updateWander(NPCSimulationRecord& npc, const PatrolContext& context) {
  const auto& route = npc.data.patrolRoute;
  if (route.empty()) {
    return;
  }

  if (npc.waitTimer > 0.0f) {
    npc.waitTimer -= context.deltaTime;
    return;
  }

  if (!npc.wanderTarget) {
    Vector2D anchor = currentWaypoint(npc, context.map);
    float span = context.map.getTileSize() * context.config.wanderOffsetTiles * 2.0f;
    float offsetX = (randomUnit(context.rng) - 0.5f) * span;
    float offsetY = (randomUnit(context.rng) - 0.5f) * span;
    npc.wanderTarget = anchor + Vector2D(offsetX, offsetY);
  }

  if (hasReached(npc.position, *npc.wanderTarget, context.config)) {
    npc.waitTimer = context.config.wanderWaitMin + randomUnit(context.rng) * context.config.wanderWaitSpread;
    advanceIndex(npc);
    npc.wanderTarget.reset();
  } else {
    moveToward(npc, *npc.wanderTarget,
               context.config.moveSpeed * context.config.wanderSpeedMultiplier, context);
  }
}

void updateStaticWatch(NPCSimulationRecord& npc, const PatrolContext& context) {
  if (npc.data.patrolRoute.empty()) {
    return;
  }

  if (npc.waitTimer > 0.0f) {
    npc.waitTimer -= context.deltaTime;
    return;
  }

  advanceIndex(npc);
  npc.position = currentWaypoint(npc, context.map);
  npc.waitTimer = context.config.staticWatchWait;
}

} // namespace

PatrolStrategy patrolStrategyForFaction(std::string_view faction) {
  for (const auto& [name, strategy] : FACTION_STRATEGIES) {
    if (name == faction) {
      return strategy;
    }
  }
  return PatrolStrategy::Simple;
}

const char* patrolStrategyName(PatrolStrategy strategy) {
  switch (strategy) {
    case PatrolStrategy::Simple: return "simple";
    case PatrolStrategy::Sweep: return "sweep";
    case PatrolStrategy::Wander: return "wander";
    case PatrolStrategy::StaticWatch: return "static_watch";
    case PatrolStrategy::RitualCircuit: return "ritual_circuit";
  }
  return "simple";
}

NPCSimulationRecord NPCSimulationRecord::fromStaticData(const NPCStaticData& npc, const TileMap& map) {
  NPCSimulationRecord record;
  record.id = npc.id;
  record.position = map.gridToWorld(npc.spawn);
  record.facing = npc.facing;
  record.strategy = patrolStrategyForFaction(npc.faction);
  record.data = npc;
  return record;
}

void moveToward(NPCSimulationRecord& npc, const Vector2D& target, float speed,
                const PatrolContext& context) {
  Vector2D delta = target - npc.position;
  float dist = delta.length();
  if (dist < 1.0f) {
    return;
  }

  // Never step past the target in one tick
  float step = std::min(speed * std::max(0.0f, context.deltaTime), dist);
  Vector2D move = delta * (step / dist);
  npc.facing = facingFromDirection(move.getX(), move.getY());

  MovementResult result = TileCollision::resolveMovement(
      context.map, npc.position, npc.position + move, context.config.entityRadius);
  npc.position = result.position;
}

void updatePatrol(NPCSimulationRecord& npc, const AlertRecord& alert, const PatrolContext& context) {
  // Every strategy falls back to simple movement once alert escalates
  if (alert.state != AlertState::Patrolling) {
    updateSimple(npc, alert, context);
    return;
  }

  switch (npc.strategy) {
    case PatrolStrategy::Simple:
      walkRoute(npc, context, context.config.simpleWait, true);
      break;
    case PatrolStrategy::Sweep:
      walkRoute(npc, context, context.config.sweepWait, true);
      break;
    case PatrolStrategy::Wander:
      updateWander(npc, context);
      break;
    case PatrolStrategy::StaticWatch:
      updateStaticWatch(npc, context);
      break;
    case PatrolStrategy::RitualCircuit:
      walkRoute(npc, context, 0.0f, false);
      break;
  }
}

} // namespace SentinelEngine
