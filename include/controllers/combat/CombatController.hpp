/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COMBAT_CONTROLLER_HPP
#define COMBAT_CONTROLLER_HPP

/**
 * @file CombatController.hpp
 * @brief Frame-updatable controller for turn-based encounters
 *
 * CombatController handles:
 * - Encounter initiation from NPCs whose alert state reached combat
 * - The turn state machine: none -> initiating -> player_turn <-> npc_turn
 *   -> resolving -> ended, back to none on clearCombat()
 * - Player input events (action, target, map click)
 * - NPC turn planning and resolution
 * - The persistent per-NPC injury ledger and encounter cooldown
 *
 * This is a frame-updatable controller (implements IUpdatable) because the
 * encounter cooldown runs on simulation time and the NPC turn resolves on the
 * tick after the player acts. A suspended controller never resolves a turn.
 *
 * Ownership: ControllerRegistry owns the controller instance.
 */

#include "combat/CombatConfig.hpp"
#include "combat/CombatRules.hpp"
#include "combat/CombatTypes.hpp"
#include "controllers/ControllerBase.hpp"
#include "controllers/IUpdatable.hpp"
#include <boost/container/flat_map.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace SentinelEngine {
class TileMap;
struct PlayerState;
}

class PatrolController;

class CombatController : public ControllerBase, public IUpdatable
{
public:
    using OutcomeCallback = std::function<void(const SentinelEngine::CombatOutcome&)>;
    using InjuryLedger = boost::container::flat_map<std::string, SentinelEngine::InjuryList>;

    CombatController(std::shared_ptr<const SentinelEngine::TileMap> map,
                     const SentinelEngine::CombatConfig& config,
                     uint32_t seed);
    ~CombatController() override = default;

    CombatController(CombatController&&) noexcept = default;
    CombatController& operator=(CombatController&&) noexcept = default;

    [[nodiscard]] std::string_view getName() const override { return "CombatController"; }

    /**
     * @brief Advance the encounter clock, start an encounter or resolve the NPC turn
     * @param deltaTime Clamped tick length in seconds
     */
    void update(float deltaTime) override;

    // --- Configuration ---

    void setPlayer(std::shared_ptr<SentinelEngine::PlayerState> player) { mp_player = player; }

    /**
     * @brief Source of engageable NPCs and target of position write-back
     * @note Non-owning; both controllers live in the same registry
     */
    void setPatrolController(PatrolController* patrol) { mp_patrol = patrol; }

    void setOutcomeCallback(OutcomeCallback callback) { m_onOutcome = std::move(callback); }

    /**
     * @brief Replace the uniform [0, 1) roll used for hits, injuries and talk
     * @note Pass an empty function to return to the seeded generator
     */
    void setRollSource(SentinelEngine::CombatRules::RollSource source) { m_rollSource = std::move(source); }
    void setRandomSeed(uint32_t seed) { m_rng.seed(seed); }

    // --- Input events (player_turn only) ---

    /**
     * @brief Select an action; flee resolves immediately, and a targeted action
     *        resolves immediately if a target is already selected
     * @return true if an action was resolved
     */
    bool selectAction(SentinelEngine::CombatActionType action);

    /**
     * @brief Select a target; resolves the selected action if it needs one
     * @return true if an action was resolved
     */
    bool selectTarget(const std::string& targetId);

    void clearSelection();

    /**
     * @brief Destination for a selected move/interact
     * @return true if an action was resolved
     */
    bool mapClick(const Vector2D& point);

    /**
     * @brief Leave an ended (or abandoned) encounter and return to none
     */
    void clearCombat();

    // --- State queries ---

    [[nodiscard]] bool isActive() const { return m_state != SentinelEngine::CombatState::None; }
    [[nodiscard]] SentinelEngine::CombatState getState() const { return m_state; }
    [[nodiscard]] int getRound() const { return m_round; }
    [[nodiscard]] const SentinelEngine::CombatantList& getCombatants() const { return m_combatants; }
    [[nodiscard]] const std::vector<SentinelEngine::CombatIntent>& getIntents() const { return m_intents; }
    [[nodiscard]] std::optional<SentinelEngine::CombatActionType> getSelectedAction() const { return m_selectedAction; }
    [[nodiscard]] const std::optional<std::string>& getSelectedTargetId() const { return m_selectedTargetId; }
    [[nodiscard]] const std::optional<SentinelEngine::CombatOutcome>& getOutcome() const { return m_outcome; }
    [[nodiscard]] const std::optional<SentinelEngine::CombatActionResult>& getLastResult() const { return m_lastResult; }

    // Targets for the selected action; empty if it takes none
    [[nodiscard]] std::vector<SentinelEngine::CombatTargetInfo> getTargetOptions() const;

    // Nullopt while no encounter exists
    [[nodiscard]] std::optional<SentinelEngine::CombatRenderState> getRenderState() const;

    // Seconds until another encounter may start (0 if ready)
    [[nodiscard]] float getCooldownRemaining() const;

    // --- Injury ledger ---

    [[nodiscard]] const InjuryLedger& getInjuryLedger() const { return m_injuryLedger; }
    void setLedgerInjuries(const std::string& combatantId, const SentinelEngine::InjuryList& injuries);
    void clearInjuryLedger() { m_injuryLedger.clear(); }

private:
    bool tryInitiate();
    bool executePlayerAction(SentinelEngine::CombatActionType type,
                             std::optional<std::string> targetId,
                             std::optional<Vector2D> targetPosition);
    void resolveNpcTurn();
    void enterPlayerTurn();
    void finalize(SentinelEngine::CombatOutcome outcome);
    void writeBack();
    bool isLedgerDowned(const std::string& npcId) const;
    float roll();

    std::shared_ptr<const SentinelEngine::TileMap> mp_map;
    std::weak_ptr<SentinelEngine::PlayerState> mp_player;
    PatrolController* mp_patrol{nullptr};
    SentinelEngine::CombatConfig m_config;

    SentinelEngine::CombatState m_state{SentinelEngine::CombatState::None};
    int m_round{0};
    SentinelEngine::CombatantList m_combatants;
    std::vector<SentinelEngine::CombatIntent> m_intents;
    std::optional<SentinelEngine::CombatActionType> m_selectedAction;
    std::optional<std::string> m_selectedTargetId;
    std::optional<SentinelEngine::CombatOutcome> m_outcome;
    std::optional<SentinelEngine::CombatActionResult> m_lastResult;

    InjuryLedger m_injuryLedger;
    OutcomeCallback m_onOutcome;

    // Encounter timing (simulation seconds)
    double m_clock{0.0};  // Simulation seconds; double so long sessions keep advancing
    std::optional<double> m_lastEncounterEnd;

    SentinelEngine::CombatRules::RollSource m_rollSource;
    std::mt19937 m_rng;
};

#endif // COMBAT_CONTROLLER_HPP
