/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AWARENESS_CONTROLLER_HPP
#define AWARENESS_CONTROLLER_HPP

/**
 * @file AwarenessController.hpp
 * @brief Frame-updatable controller for ambient NPC awareness
 *
 * Reads NPC positions from the PatrolController and feeds an
 * AwarenessTracker. Output is presentation only: facing overrides while
 * glancing and small position offsets (shift, flee on approach).
 *
 * Ownership: ControllerRegistry owns the controller instance.
 */

#include "ai/AwarenessTracker.hpp"
#include "controllers/ControllerBase.hpp"
#include "controllers/IUpdatable.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace SentinelEngine {
class TileMap;
struct PlayerState;
}

class PatrolController;

class AwarenessController : public ControllerBase, public IUpdatable
{
public:
    AwarenessController(std::shared_ptr<const SentinelEngine::TileMap> map,
                        const SentinelEngine::AwarenessConfig& config,
                        float detectionRange,
                        uint32_t seed);
    ~AwarenessController() override = default;

    AwarenessController(AwarenessController&&) noexcept = default;
    AwarenessController& operator=(AwarenessController&&) noexcept = default;

    [[nodiscard]] std::string_view getName() const override { return "AwarenessController"; }

    void update(float deltaTime) override;

    void setPlayer(std::shared_ptr<SentinelEngine::PlayerState> player) { mp_player = player; }

    /**
     * @brief Source of NPC positions and alert states
     * @note Non-owning; both controllers live in the same registry
     */
    void setPatrolController(const PatrolController* patrol) { mp_patrol = patrol; }

    [[nodiscard]] const SentinelEngine::AwarenessState* getState(const std::string& npcId) const;
    [[nodiscard]] bool anyAware() const { return m_tracker.anyAware(); }

    /**
     * @brief Ambient tension cue: 0.055 while any NPC glances, 0.03 while any is aware, else 0
     */
    [[nodiscard]] float getAmbientShift() const;

    [[nodiscard]] const SentinelEngine::AwarenessTracker& getTracker() const { return m_tracker; }

private:
    std::shared_ptr<const SentinelEngine::TileMap> mp_map;
    std::weak_ptr<SentinelEngine::PlayerState> mp_player;
    const PatrolController* mp_patrol{nullptr};
    SentinelEngine::AwarenessTracker m_tracker;
};

#endif // AWARENESS_CONTROLLER_HPP
