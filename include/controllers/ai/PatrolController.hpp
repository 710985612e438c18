/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PATROL_CONTROLLER_HPP
#define PATROL_CONTROLLER_HPP

/**
 * @file PatrolController.hpp
 * @brief Frame-updatable controller for NPC alert and patrol movement
 *
 * PatrolController handles:
 * - NPC Simulation Records (one per authored NPC, keyed by id)
 * - The AlertSystem that escalates NPCs toward combat
 * - Per-faction patrol strategies, run after the alert update each tick
 * - Read-only render snapshots for the presentation layer
 *
 * NPCs taking part in an encounter are "held": CombatController owns their
 * position until the encounter ends and writes it back here.
 *
 * Ownership: ControllerRegistry owns the controller instance.
 */

#include "ai/AlertSystem.hpp"
#include "ai/BehaviorConfig.hpp"
#include "ai/behaviors/PatrolBehavior.hpp"
#include "controllers/ControllerBase.hpp"
#include "controllers/IUpdatable.hpp"
#include "core/TimeOfDay.hpp"
#include <boost/container/flat_map.hpp>
#include <boost/container/flat_set.hpp>
#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace SentinelEngine {
class TileMap;
struct PlayerState;
}

/**
 * @brief Per-frame view of one NPC for rendering
 */
struct NPCRenderSnapshot
{
    std::string id;
    std::string name;
    std::string faction;
    Vector2D position;
    SentinelEngine::Facing facing{SentinelEngine::Facing::South};
    SentinelEngine::AlertState alertState{SentinelEngine::AlertState::Patrolling};
    float alertLevel{0.0f};
    bool inCombat{false};
};

class PatrolController : public ControllerBase, public IUpdatable
{
public:
    using RecordMap = boost::container::flat_map<std::string, SentinelEngine::NPCSimulationRecord>;

    PatrolController(std::shared_ptr<const SentinelEngine::TileMap> map,
                     const SentinelEngine::AlertConfig& alertConfig,
                     const SentinelEngine::PatrolBehaviorConfig& patrolConfig,
                     uint32_t seed);
    ~PatrolController() override = default;

    PatrolController(PatrolController&&) noexcept = default;
    PatrolController& operator=(PatrolController&&) noexcept = default;

    [[nodiscard]] std::string_view getName() const override { return "PatrolController"; }

    /**
     * @brief Run alert then patrol for every NPC that is not held
     * @param deltaTime Clamped tick length in seconds
     */
    void update(float deltaTime) override;

    // --- Configuration ---

    void setPlayer(std::shared_ptr<SentinelEngine::PlayerState> player) { mp_player = player; }
    void setTimeOfDay(SentinelEngine::TimeOfDay timeOfDay) { m_timeOfDay = timeOfDay; }
    [[nodiscard]] SentinelEngine::TimeOfDay getTimeOfDay() const { return m_timeOfDay; }

    // --- NPC records ---

    /**
     * @brief Create the simulation record for an authored NPC
     * @return false if an NPC with the same id is already registered
     */
    bool registerNPC(const SentinelEngine::NPCStaticData& npc);
    void removeNPC(const std::string& npcId);

    [[nodiscard]] const SentinelEngine::NPCSimulationRecord* getNPC(const std::string& npcId) const;
    [[nodiscard]] const RecordMap& getRecords() const { return m_records; }
    [[nodiscard]] size_t getNPCCount() const { return m_records.size(); }

    [[nodiscard]] SentinelEngine::AlertState getAlertState(const std::string& npcId) const;
    [[nodiscard]] const SentinelEngine::AlertSystem& getAlertSystem() const { return m_alertSystem; }

    // --- Encounter hand-off ---

    // Held NPCs are skipped by update() until released
    void holdNPC(const std::string& npcId);
    void releaseNPC(const std::string& npcId);
    [[nodiscard]] bool isHeld(const std::string& npcId) const;

    /**
     * @brief Copy an encounter's final position back into the record
     * @param resetAlert Also return the NPC's alert record to patrolling
     */
    void writeBack(const std::string& npcId, const Vector2D& position,
                   SentinelEngine::Facing facing, bool resetAlert);

    /**
     * @brief Build render snapshots for every NPC, ordered by id
     */
    [[nodiscard]] std::vector<NPCRenderSnapshot> getRenderSnapshots() const;

private:
    std::shared_ptr<const SentinelEngine::TileMap> mp_map;
    std::weak_ptr<SentinelEngine::PlayerState> mp_player;

    SentinelEngine::PatrolBehaviorConfig m_patrolConfig;
    SentinelEngine::AlertSystem m_alertSystem;
    RecordMap m_records;
    boost::container::flat_set<std::string> m_held;

    SentinelEngine::TimeOfDay m_timeOfDay{SentinelEngine::TimeOfDay::Midday};
    std::mt19937 m_rng;
};

#endif // PATROL_CONTROLLER_HPP
