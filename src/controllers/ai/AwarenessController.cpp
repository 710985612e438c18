/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/ai/AwarenessController.hpp"
#include "controllers/ai/PatrolController.hpp"
#include "core/PlayerState.hpp"
#include "world/TileMap.hpp"
#include <utility>
#include <vector>

using namespace SentinelEngine;

namespace {
constexpr float GLANCE_AMBIENT_SHIFT = 0.055f;
constexpr float AWARE_AMBIENT_SHIFT = 0.03f;
} // namespace

AwarenessController::AwarenessController(std::shared_ptr<const TileMap> map,
                                         const AwarenessConfig& config,
                                         float detectionRange,
                                         uint32_t seed)
    : mp_map(std::move(map)),
      m_tracker(config, detectionRange, seed)
{
}

void AwarenessController::update(float deltaTime)
{
    auto player = mp_player.lock();
    if (!player || !mp_map || !mp_patrol) {
        return;
    }

    m_tracker.advanceClock(deltaTime);

    std::vector<std::string> activeIds;
    activeIds.reserve(mp_patrol->getNPCCount());

    for (const auto& [id, record] : mp_patrol->getRecords()) {
        activeIds.push_back(id);
        const bool alert = mp_patrol->getAlertState(id) != AlertState::Patrolling;
        m_tracker.update(record.data, record.position, player->position,
                         player->idleSeconds, alert, *mp_map, deltaTime);
    }

    m_tracker.retain(activeIds);
}

const AwarenessState* AwarenessController::getState(const std::string& npcId) const
{
    return m_tracker.find(npcId);
}

float AwarenessController::getAmbientShift() const
{
    if (m_tracker.anyGlancing()) {
        return GLANCE_AMBIENT_SHIFT;
    }
    return m_tracker.anyAware() ? AWARE_AMBIENT_SHIFT : 0.0f;
}
