/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/SimulationContext.hpp"
#include "collisions/TileCollision.hpp"
#include "combat/CombatRules.hpp"
#include "controllers/ai/AwarenessController.hpp"
#include "controllers/combat/CombatController.hpp"
#include "core/Logger.hpp"
#include "core/PlayerState.hpp"
#include "world/TileMap.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace SentinelEngine {

namespace {
constexpr float HOURS_PER_DAY = 24.0f;
constexpr float COMBAT_ALERT_LEVEL = 100.0f;
} // namespace

SimulationContext::SimulationContext(const LocalMapData& mapData, const SimulationConfig& config)
    : m_mapData(mapData),
      m_config(config),
      m_map(std::make_shared<const TileMap>(mapData)),
      m_player(std::make_shared<PlayerState>())
{
    setHour(config.startHour);

    m_player->radius = config.playerRadius;
    m_player->speed = config.playerSpeed;
    if (const SpawnPoint* spawn = mapData.getDefaultSpawn()) {
        m_player->position = m_map->gridToWorld(spawn->position);
        m_player->facing = spawn->facing;
    } else {
        m_player->position = Vector2D(m_map->getPixelWidth() * 0.5f, m_map->getPixelHeight() * 0.5f);
        SIM_WARN(std::format("Map '{}' has no spawn points, starting at the centre", mapData.id));
    }

    // Registration order is update order
    mp_patrol = &m_controllers.add<PatrolController>(m_map, config.alert, config.patrol, config.seed);
    mp_awareness = &m_controllers.add<AwarenessController>(m_map, config.awareness,
                                                            config.alert.detectionRange, config.seed + 1);
    mp_combat = &m_controllers.add<CombatController>(m_map, config.combat, config.seed + 2);

    mp_patrol->setPlayer(m_player);
    mp_awareness->setPlayer(m_player);
    mp_awareness->setPatrolController(mp_patrol);
    mp_combat->setPlayer(m_player);
    mp_combat->setPatrolController(mp_patrol);

    for (const auto& npc : mapData.npcs) {
        mp_patrol->registerNPC(npc);
    }
    mp_patrol->setTimeOfDay(getTimeOfDay());

    SIM_INFO(std::format("Loaded '{}' ({}x{}, {} NPCs)", mapData.id, m_map->getWidth(),
                         m_map->getHeight(), mp_patrol->getNPCCount()));
}

SimulationContext::~SimulationContext()
{
    SIM_DEBUG(std::format("Unloading '{}' after {} ticks", m_mapData.id, m_tickCount));
}

const PlayerState& SimulationContext::getPlayer() const
{
    return *m_player;
}

void SimulationContext::setPlayerPosition(const Vector2D& position)
{
    m_player->position = TileCollision::clampToBounds(*m_map, position, m_player->radius);
    m_player->idleSeconds = 0.0f;
}

void SimulationContext::setHour(float hour)
{
    float wrapped = std::fmod(hour, HOURS_PER_DAY);
    if (wrapped < 0.0f) {
        wrapped += HOURS_PER_DAY;
    }
    m_hour = wrapped;
}

void SimulationContext::pause()
{
    if (m_paused) {
        return;
    }
    m_paused = true;
    m_controllers.suspendAll();
    SIM_DEBUG("Paused");
}

void SimulationContext::resume()
{
    if (!m_paused) {
        return;
    }
    m_paused = false;
    m_controllers.resumeAll();
    SIM_DEBUG("Resumed");
}

void SimulationContext::tick(float deltaTime, const Vector2D& moveDirection)
{
    if (m_paused) {
        return;
    }

    // NaN compares false against everything, so test it explicitly
    float dt = std::isnan(deltaTime) ? 0.0f : std::clamp(deltaTime, 0.0f, m_config.maxTickDelta);

    if (m_config.gameHoursPerSecond != 0.0f) {
        setHour(m_hour + dt * m_config.gameHoursPerSecond);
    }
    mp_patrol->setTimeOfDay(getTimeOfDay());

    movePlayer(moveDirection, dt);

    m_controllers.updateAll(dt);

    m_elapsed += dt;
    ++m_tickCount;
}

void SimulationContext::movePlayer(const Vector2D& moveDirection, float deltaTime)
{
    // The encounter owns the player's position until it is cleared
    if (mp_combat->isActive() || moveDirection.lengthSquared() <= 0.0f) {
        m_player->idleSeconds += deltaTime;
        return;
    }

    Vector2D step = moveDirection.normalized() * (m_player->speed * deltaTime);
    Vector2D desired = TileCollision::clampToBounds(*m_map, m_player->position + step, m_player->radius);
    MovementResult result = TileCollision::resolveMovement(*m_map, m_player->position, desired, m_player->radius);

    m_player->position = result.position;
    m_player->facing = facingFromDirection(moveDirection.getX(), moveDirection.getY());
    m_player->idleSeconds = 0.0f;
}

std::vector<NPCRenderSnapshot> SimulationContext::getNPCRenderSnapshots() const
{
    std::vector<NPCRenderSnapshot> snapshots = mp_patrol->getRenderSnapshots();
    const auto& combatants = mp_combat->getCombatants();

    for (auto& snapshot : snapshots) {
        if (mp_combat->isActive()) {
            if (const Combatant* combatant = CombatRules::findCombatant(combatants, snapshot.id)) {
                snapshot.position = combatant->position;
                snapshot.facing = combatant->facing;
                snapshot.alertState = AlertState::Combat;
                snapshot.alertLevel = COMBAT_ALERT_LEVEL;
                snapshot.inCombat = true;
                continue;
            }
        }

        if (const AwarenessState* awareness = mp_awareness->getState(snapshot.id)) {
            snapshot.position += awareness->positionOffset;
            if (awareness->facingOverride) {
                snapshot.facing = *awareness->facingOverride;
            }
        }
    }
    return snapshots;
}

} // namespace SentinelEngine
