/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ALERT_SYSTEM_HPP
#define ALERT_SYSTEM_HPP

#include "ai/BehaviorConfig.hpp"
#include "core/TimeOfDay.hpp"
#include "utils/Vector2D.hpp"
#include "world/TileTypes.hpp"
#include <boost/container/flat_map.hpp>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace SentinelEngine {

class TileMap;

enum class AlertState : uint8_t {
    Patrolling,
    Investigating,
    Combat
};

const char* alertStateName(AlertState state);

inline std::ostream& operator<<(std::ostream& os, AlertState state) {
    return os << alertStateName(state);
}

struct AlertRecord {
    AlertState state{AlertState::Patrolling};
    float alertLevel{0.0f};                    // Clamped [0, 100]
    std::optional<Vector2D> lastSeenPosition;
    std::optional<Vector2D> targetPosition;    // Investigation target
    float investigationTimer{0.0f};            // Seconds remaining
    bool playerVisible{false};                 // Result of the last detection check
};

/**
 * @brief Per-NPC alert state machine: patrolling -> investigating -> combat.
 *
 * Records live in a flat_map keyed by NPC id and are created on first
 * access. Only the owning PatrolController mutates them.
 */
class AlertSystem {
public:
    explicit AlertSystem(const AlertConfig& config = AlertConfig{});

    // Creates a patrolling record on first access
    const AlertRecord& getAlertRecord(const std::string& npcId);
    const AlertRecord* findAlertRecord(const std::string& npcId) const;

    float getDetectionRange(TimeOfDay timeOfDay) const;

    /**
     * @brief Visibility predicate: in range, line of sight, and inside the facing cone
     */
    bool isPlayerVisible(const TileMap& map, const Vector2D& npcPos, Facing npcFacing,
                         const Vector2D& playerPos, TimeOfDay timeOfDay) const;

    /**
     * @brief Advance one NPC's record by deltaTime seconds
     * @return The state after this tick
     */
    AlertState update(const std::string& npcId, const Vector2D& npcPos, Facing npcFacing,
                      const Vector2D& playerPos, const TileMap& map, float deltaTime,
                      TimeOfDay timeOfDay);

    // Ids of every NPC currently in 'state'
    std::vector<std::string> getNPCsInState(AlertState state) const;

    // Back to a calm patrolling record
    void resetNPC(const std::string& npcId);
    void removeNPC(const std::string& npcId);
    void clear() { m_records.clear(); }
    size_t size() const { return m_records.size(); }

    const AlertConfig& getConfig() const { return m_config; }

private:
    AlertConfig m_config;
    boost::container::flat_map<std::string, AlertRecord> m_records;
};

} // namespace SentinelEngine

#endif // ALERT_SYSTEM_HPP
