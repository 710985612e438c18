/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/AlertSystem.hpp"
#include "collisions/TileCollision.hpp"
#include "core/Logger.hpp"
#include "world/TileMap.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace SentinelEngine {

namespace {
constexpr float PI = 3.14159265358979f;
constexpr float MAX_ALERT_LEVEL = 100.0f;
} // namespace

const char* alertStateName(AlertState state) {
    switch (state) {
        case AlertState::Patrolling: return "patrolling";
        case AlertState::Investigating: return "investigating";
        case AlertState::Combat: return "combat";
    }
    return "patrolling";
}

AlertSystem::AlertSystem(const AlertConfig& config) : m_config(config) {}

const AlertRecord& AlertSystem::getAlertRecord(const std::string& npcId) {
    return m_records[npcId];
}

const AlertRecord* AlertSystem::findAlertRecord(const std::string& npcId) const {
    auto it = m_records.find(npcId);
    return it != m_records.end() ? &it->second : nullptr;
}

float AlertSystem::getDetectionRange(TimeOfDay timeOfDay) const {
    float range = m_config.detectionRange;
    if (isLowLight(timeOfDay)) {
        range *= m_config.nightRangeMultiplier;
    }
    return range;
}

bool AlertSystem::isPlayerVisible(const TileMap& map, const Vector2D& npcPos, Facing npcFacing,
                                  const Vector2D& playerPos, TimeOfDay timeOfDay) const {
    if (Vector2D::distance(npcPos, playerPos) >= getDetectionRange(timeOfDay)) {
        return false;
    }
    if (!TileCollision::hasLineOfSight(map, npcPos, playerPos)) {
        return false;
    }

    float angleToPlayer = (playerPos - npcPos).angle();
    float angleDiff = std::fabs(angleToPlayer - facingAngle(npcFacing));
    if (angleDiff > PI) {
        angleDiff = 2.0f * PI - angleDiff;
    }
    return angleDiff < m_config.detectionConeAngle * 0.5f;
}

AlertState AlertSystem::update(const std::string& npcId, const Vector2D& npcPos, Facing npcFacing,
                               const Vector2D& playerPos, const TileMap& map, float deltaTime,
                               TimeOfDay timeOfDay) {
    AlertRecord& record = m_records[npcId];
    const float dt = std::max(0.0f, deltaTime);

    const bool visible = isPlayerVisible(map, npcPos, npcFacing, playerPos, timeOfDay);
    record.playerVisible = visible;

    if (visible) {
        record.alertLevel = std::min(MAX_ALERT_LEVEL, record.alertLevel + m_config.buildRate * dt);
        record.lastSeenPosition = playerPos;
    } else {
        record.alertLevel = std::max(0.0f, record.alertLevel - m_config.decayRate * dt);
    }

    switch (record.state) {
        case AlertState::Patrolling:
            if (record.alertLevel >= m_config.investigateThreshold) {
                record.state = AlertState::Investigating;
                record.targetPosition = record.lastSeenPosition.value_or(playerPos);
                record.investigationTimer = m_config.investigationDuration;
                ALERT_DEBUG(std::format("{} investigating (level {:.1f})", npcId, record.alertLevel));
            }
            break;

        case AlertState::Investigating:
            if (record.alertLevel >= m_config.combatThreshold) {
                record.state = AlertState::Combat;
                ALERT_INFO(std::format("{} entered combat", npcId));
            } else if (record.alertLevel <= 0.0f && record.investigationTimer <= 0.0f) {
                record.state = AlertState::Patrolling;
                record.targetPosition.reset();
                ALERT_DEBUG(std::format("{} gave up investigating", npcId));
            } else if (!visible) {
                // Only counts down while the player is out of sight
                record.investigationTimer -= dt;
            }
            break;

        case AlertState::Combat:
            if (record.alertLevel <= 0.0f) {
                record.state = AlertState::Investigating;
                record.investigationTimer = m_config.investigationDuration;
                ALERT_DEBUG(std::format("{} lost the player, investigating", npcId));
            }
            break;
    }

    return record.state;
}

std::vector<std::string> AlertSystem::getNPCsInState(AlertState state) const {
    std::vector<std::string> ids;
    for (const auto& [id, record] : m_records) {
        if (record.state == state) {
            ids.push_back(id);
        }
    }
    return ids;
}

void AlertSystem::resetNPC(const std::string& npcId) {
    m_records[npcId] = AlertRecord{};
}

void AlertSystem::removeNPC(const std::string& npcId) {
    m_records.erase(npcId);
}

} // namespace SentinelEngine
