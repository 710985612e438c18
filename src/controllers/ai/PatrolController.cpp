/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/ai/PatrolController.hpp"
#include "core/Logger.hpp"
#include "core/PlayerState.hpp"
#include "world/TileMap.hpp"
#include <format>
#include <utility>

using namespace SentinelEngine;

PatrolController::PatrolController(std::shared_ptr<const TileMap> map,
                                   const AlertConfig& alertConfig,
                                   const PatrolBehaviorConfig& patrolConfig,
                                   uint32_t seed)
    : mp_map(std::move(map)),
      m_patrolConfig(patrolConfig),
      m_alertSystem(alertConfig),
      m_rng(seed)
{
}

bool PatrolController::registerNPC(const NPCStaticData& npc)
{
    if (!mp_map) {
        PATROL_ERROR("Cannot register NPC without a map");
        return false;
    }
    if (m_records.count(npc.id) > 0) {
        PATROL_WARN(std::format("NPC '{}' already registered", npc.id));
        return false;
    }

    NPCSimulationRecord record = NPCSimulationRecord::fromStaticData(npc, *mp_map);
    PATROL_DEBUG(std::format("Registered {} ({}, {} strategy)", npc.id,
                             npc.faction.empty() ? "unaffiliated" : npc.faction,
                             patrolStrategyName(record.strategy)));
    m_records.emplace(npc.id, std::move(record));
    m_alertSystem.getAlertRecord(npc.id);
    return true;
}

void PatrolController::removeNPC(const std::string& npcId)
{
    m_records.erase(npcId);
    m_alertSystem.removeNPC(npcId);
    m_held.erase(npcId);
}

void PatrolController::update(float deltaTime)
{
    auto player = mp_player.lock();
    if (!player || !mp_map) {
        return;
    }

    const TileMap& map = *mp_map;
    PatrolContext context{map, m_patrolConfig, deltaTime, m_rng};

    for (auto& [id, record] : m_records) {
        if (m_held.count(id) > 0) {
            continue;
        }

        m_alertSystem.update(id, record.position, record.facing, player->position,
                             map, deltaTime, m_timeOfDay);

        const AlertRecord* alert = m_alertSystem.findAlertRecord(id);
        if (alert) {
            updatePatrol(record, *alert, context);
        }
    }
}

const NPCSimulationRecord* PatrolController::getNPC(const std::string& npcId) const
{
    auto it = m_records.find(npcId);
    return it != m_records.end() ? &it->second : nullptr;
}

AlertState PatrolController::getAlertState(const std::string& npcId) const
{
    const AlertRecord* alert = m_alertSystem.findAlertRecord(npcId);
    return alert ? alert->state : AlertState::Patrolling;
}

void PatrolController::holdNPC(const std::string& npcId)
{
    m_held.insert(npcId);
}

void PatrolController::releaseNPC(const std::string& npcId)
{
    m_held.erase(npcId);
}

bool PatrolController::isHeld(const std::string& npcId) const
{
    return m_held.count(npcId) > 0;
}

void PatrolController::writeBack(const std::string& npcId, const Vector2D& position,
                                 Facing facing, bool resetAlert)
{
    auto it = m_records.find(npcId);
    if (it == m_records.end()) {
        PATROL_WARN(std::format("Write-back for unknown NPC '{}'", npcId));
        return;
    }

    it->second.position = position;
    it->second.facing = facing;
    it->second.wanderTarget.reset();
    if (resetAlert) {
        m_alertSystem.resetNPC(npcId);
    }
}

std::vector<NPCRenderSnapshot> PatrolController::getRenderSnapshots() const
{
    std::vector<NPCRenderSnapshot> snapshots;
    snapshots.reserve(m_records.size());

    for (const auto& [id, record] : m_records) {
        NPCRenderSnapshot snapshot;
        snapshot.id = id;
        snapshot.name = record.data.name.empty() ? id : record.data.name;
        snapshot.faction = record.data.faction;
        snapshot.position = record.position;
        snapshot.facing = record.facing;
        if (const AlertRecord* alert = m_alertSystem.findAlertRecord(id)) {
            snapshot.alertState = alert->state;
            snapshot.alertLevel = alert->alertLevel;
        }
        snapshot.inCombat = m_held.count(id) > 0;
        snapshots.push_back(std::move(snapshot));
    }
    return snapshots;
}
