/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AWARENESS_TRACKER_HPP
#define AWARENESS_TRACKER_HPP

#include "ai/BehaviorConfig.hpp"
#include "utils/Vector2D.hpp"
#include "world/LocalMapData.hpp"
#include "world/TileTypes.hpp"
#include <boost/container/flat_map.hpp>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace SentinelEngine {

class TileMap;

/**
 * @brief Ambient awareness of one NPC. Times are tracker-clock seconds.
 */
struct AwarenessState {
  bool aware{false};
  bool alert{false};                   // Mirrors an escalated alert state
  float proximitySeconds{0.0f};
  float lingerSeconds{0.0f};

  double glanceUntil{0.0};
  double nextGlanceAt{0.0};
  float glanceInterval{0.0f};
  std::optional<Facing> facingOverride;

  double shiftUntil{0.0};
  Vector2D shiftOffset;
  double lastShiftAt{0.0};

  double fleeUntil{0.0};
  Vector2D fleeOffset;
  double lastFleeAt{0.0};

  Vector2D positionOffset;             // Applied to the rendered position only
};

/**
 * @brief Proximity, glance, linger-shift and flee-on-approach bookkeeping.
 *
 * Never moves an NPC; the offsets and facing override are presentation only.
 * Time advances only through advanceClock(), so a paused simulation freezes
 * every timer.
 */
class AwarenessTracker {
public:
  AwarenessTracker(const AwarenessConfig& config, float detectionRange, uint32_t seed);

  void advanceClock(float deltaTime);
  double now() const { return m_now; }

  /**
   * @brief Update one NPC against the current player position.
   * @param idleSeconds How long the player has been standing still
   * @param alert Whether the NPC's alert state has escalated
   */
  const AwarenessState& update(const NPCStaticData& npc, const Vector2D& npcPos,
                               const Vector2D& playerPos, float idleSeconds, bool alert,
                               const TileMap& map, float deltaTime);

  const AwarenessState* find(const std::string& npcId) const;

  // Drop states for NPCs not in 'activeIds'
  void retain(const std::vector<std::string>& activeIds);

  bool anyAware() const;
  bool anyGlancing() const;

  float getLingerRange() const;
  size_t size() const { return m_states.size(); }
  void clear() { m_states.clear(); }

private:
  AwarenessState createState(const NPCStaticData& npc);

  AwarenessConfig m_config;
  float m_detectionRange;
  double m_now{0.0};
  std::mt19937 m_rng;
  boost::container::flat_map<std::string, AwarenessState> m_states;
};

// Cardinal facing from 'from' toward 'target'; ties go vertical
Facing facingToward(const Vector2D& target, const Vector2D& from);

// Offset of 'magnitude' px pointing from 'from' to 'source'
Vector2D offsetAway(const Vector2D& source, const Vector2D& from, float magnitude);

} // namespace SentinelEngine

#endif // AWARENESS_TRACKER_HPP
