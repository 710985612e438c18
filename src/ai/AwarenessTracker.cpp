/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/AwarenessTracker.hpp"
#include "collisions/TileCollision.hpp"
#include "core/Logger.hpp"
#include "world/TileMap.hpp"
#include <algorithm>
#include <format>

namespace SentinelEngine {

namespace {
// Timestamps start far enough back that nothing is active and cooldowns have elapsed
constexpr double LONG_AGO = -1.0e6;
} // namespace

Facing facingToward(const Vector2D& target, const Vector2D& from) {
  return facingFromDirection(target.getX() - from.getX(), target.getY() - from.getY());
}

Vector2D offsetAway(const Vector2D& source, const Vector2D& from, float magnitude) {
  Vector2D delta = source - from;
  float dist = delta.length();
  if (dist <= 0.0f) {
    dist = 1.0f;
  }
  return delta * (magnitude / dist);
}

AwarenessTracker::AwarenessTracker(const AwarenessConfig& config, float detectionRange, uint32_t seed)
    : m_config(config), m_detectionRange(detectionRange), m_rng(seed) {}

void AwarenessTracker::advanceClock(float deltaTime) {
  m_now += std::max(0.0f, deltaTime);
}

float AwarenessTracker::getLingerRange() const {
  return std::min(m_detectionRange * 0.75f, m_config.interactionRange * 1.4f);
}

AwarenessState AwarenessTracker::createState(const NPCStaticData& npc) {
  AwarenessState state;
  if (npc.glanceInterval) {
    state.glanceInterval = *npc.glanceInterval;
  } else {
    std::uniform_real_distribution<float> spread(0.0f, m_config.glanceIntervalSpread);
    state.glanceInterval = m_config.glanceIntervalMin + spread(m_rng);
  }
  state.nextGlanceAt = m_now + state.glanceInterval;
  state.glanceUntil = LONG_AGO;
  state.shiftUntil = LONG_AGO;
  state.fleeUntil = LONG_AGO;
  state.lastShiftAt = LONG_AGO;
  state.lastFleeAt = LONG_AGO;
  return state;
}

const AwarenessState& AwarenessTracker::update(const NPCStaticData& npc, const Vector2D& npcPos,
                                               const Vector2D& playerPos, float idleSeconds, bool alert,
                                               const TileMap& map, float deltaTime) {
  auto it = m_states.find(npc.id);
  if (it == m_states.end()) {
    it = m_states.emplace(npc.id, createState(npc)).first;
  }
  AwarenessState& state = it->second;

  const float dt = std::max(0.0f, deltaTime);
  const float dist = Vector2D::distance(playerPos, npcPos);
  const bool inRange = dist <= m_detectionRange;
  const bool hasSight = inRange && TileCollision::hasLineOfSight(map, npcPos, playerPos);

  state.alert = alert;

  if (hasSight) {
    state.proximitySeconds += dt;
  } else {
    state.proximitySeconds = std::max(0.0f, state.proximitySeconds - dt * m_config.proximityDecayMultiplier);
  }

  const bool wasAware = state.aware;
  state.aware = state.proximitySeconds >= m_config.awareThreshold;
  if (state.aware && !wasAware) {
    AWARENESS_DEBUG(std::format("{} noticed the player", npc.id));
  }

  if (state.aware && dist <= getLingerRange() && idleSeconds >= m_config.idleLingerGate) {
    state.lingerSeconds += dt;
  } else {
    state.lingerSeconds = std::max(0.0f, state.lingerSeconds - dt);
  }

  // Glance
  if (state.aware && m_now >= state.nextGlanceAt) {
    state.glanceUntil = m_now + m_config.glanceDuration;
    state.nextGlanceAt = m_now + state.glanceInterval;
  }
  if (m_now <= state.glanceUntil) {
    state.facingOverride = facingToward(playerPos, npcPos);
  } else {
    state.facingOverride.reset();
  }

  // Linger-driven shift
  const float lingerThreshold = npc.lingerTimer.value_or(m_config.lingerThreshold);
  if (state.aware && state.lingerSeconds >= lingerThreshold &&
      m_now - state.lastShiftAt > m_config.shiftCooldown) {
    state.shiftOffset = offsetAway(npcPos, playerPos, m_config.shiftMagnitude);
    state.shiftUntil = m_now + m_config.shiftDuration;
    state.lastShiftAt = m_now;
  }

  // Flee on approach
  if (npc.fleeOnApproach && hasSight &&
      dist <= m_config.interactionRange * m_config.fleeRangeFactor &&
      m_now - state.lastFleeAt > m_config.fleeCooldown) {
    state.fleeOffset = offsetAway(npcPos, playerPos, m_config.fleeMagnitude);
    state.fleeUntil = m_now + m_config.fleeDuration;
    state.lastFleeAt = m_now;
    AWARENESS_DEBUG(std::format("{} flinched away from the player", npc.id));
  }

  if (m_now > state.shiftUntil) {
    state.shiftOffset = Vector2D();
  }
  if (m_now > state.fleeUntil) {
    state.fleeOffset = Vector2D();
  }

  if (m_now <= state.fleeUntil) {
    state.positionOffset = state.fleeOffset;
  } else if (m_now <= state.shiftUntil) {
    state.positionOffset = state.shiftOffset;
  } else {
    state.positionOffset = Vector2D();
  }

  return state;
}

const AwarenessState* AwarenessTracker::find(const std::string& npcId) const {
  auto it = m_states.find(npcId);
  return it != m_states.end() ? &it->second : nullptr;
}

void AwarenessTracker::retain(const std::vector<std::string>& activeIds) {
  for (auto it = m_states.begin(); it != m_states.end();) {
    if (std::find(activeIds.begin(), activeIds.end(), it->first) == activeIds.end()) {
      it = m_states.erase(it);
    } else {
      ++it;
    }
  }
}

bool AwarenessTracker::anyAware() const {
  return std::any_of(m_states.begin(), m_states.end(),
                     [](const auto& entry) { return entry.second.aware || entry.second.alert; });
}

bool AwarenessTracker::anyGlancing() const {
  return std::any_of(m_states.begin(), m_states.end(),
                     [this](const auto& entry) { return entry.second.glanceUntil > m_now; });
}

} // namespace SentinelEngine
