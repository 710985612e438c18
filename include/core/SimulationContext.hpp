/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIMULATION_CONTEXT_HPP
#define SIMULATION_CONTEXT_HPP

/**
 * @file SimulationContext.hpp
 * @brief Everything one loaded local map simulates, owned in one place
 *
 * Created on map load, destroyed on unload. Owns the immutable TileMap, the
 * player state and the ControllerRegistry (Patrol -> Awareness -> Combat).
 * There is no global state: hosts hold a SimulationContext and call tick()
 * once per frame from a single thread.
 */

#include "controllers/ControllerRegistry.hpp"
#include "controllers/ai/PatrolController.hpp"
#include "core/SimulationConfig.hpp"
#include "core/TimeOfDay.hpp"
#include "utils/Vector2D.hpp"
#include "world/LocalMapData.hpp"
#include <cstdint>
#include <memory>
#include <vector>

class AwarenessController;
class CombatController;

namespace SentinelEngine {

class TileMap;
struct PlayerState;

class SimulationContext {
public:
    SimulationContext(const LocalMapData& mapData, const SimulationConfig& config);
    ~SimulationContext();

    // Controllers keep pointers into the context
    SimulationContext(const SimulationContext&) = delete;
    SimulationContext& operator=(const SimulationContext&) = delete;
    SimulationContext(SimulationContext&&) = delete;
    SimulationContext& operator=(SimulationContext&&) = delete;

    /**
     * @brief Advance the simulation by one frame
     * @param deltaTime Elapsed seconds; clamped to [0, maxTickDelta]
     * @param moveDirection Player movement intent outside combat (any length, zero = idle)
     *
     * Does nothing while paused.
     */
    void tick(float deltaTime, const Vector2D& moveDirection = Vector2D());

    // Suspend every controller; no timer advances until resume()
    void pause();
    void resume();
    bool isPaused() const { return m_paused; }

    const TileMap& getMap() const { return *m_map; }
    const LocalMapData& getMapData() const { return m_mapData; }
    const SimulationConfig& getConfig() const { return m_config; }

    const PlayerState& getPlayer() const;
    // Teleport the player (clamped to the map); resets idle time
    void setPlayerPosition(const Vector2D& position);

    PatrolController& getPatrol() { return *mp_patrol; }
    const PatrolController& getPatrol() const { return *mp_patrol; }
    AwarenessController& getAwareness() { return *mp_awareness; }
    const AwarenessController& getAwareness() const { return *mp_awareness; }
    CombatController& getCombat() { return *mp_combat; }
    const CombatController& getCombat() const { return *mp_combat; }

    float getHour() const { return m_hour; }
    void setHour(float hour);
    TimeOfDay getTimeOfDay() const { return timeOfDayFromHour(m_hour); }

    double getElapsedSeconds() const { return m_elapsed; }
    uint64_t getTickCount() const { return m_tickCount; }

    /**
     * @brief Render snapshots with awareness offsets and combat overrides applied
     */
    std::vector<NPCRenderSnapshot> getNPCRenderSnapshots() const;

private:
    void movePlayer(const Vector2D& moveDirection, float deltaTime);

    LocalMapData m_mapData;
    SimulationConfig m_config;
    std::shared_ptr<const TileMap> m_map;
    std::shared_ptr<PlayerState> m_player;

    ControllerRegistry m_controllers;
    PatrolController* mp_patrol{nullptr};
    AwarenessController* mp_awareness{nullptr};
    CombatController* mp_combat{nullptr};

    bool m_paused{false};
    float m_hour{12.0f};
    double m_elapsed{0.0};
    uint64_t m_tickCount{0};
};

} // namespace SentinelEngine

#endif // SIMULATION_CONTEXT_HPP
