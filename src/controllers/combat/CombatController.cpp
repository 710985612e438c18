/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/combat/CombatController.hpp"
#include "controllers/ai/PatrolController.hpp"
#include "core/Logger.hpp"
#include "core/PlayerState.hpp"
#include "world/TileMap.hpp"
#include <algorithm>
#include <format>

using namespace SentinelEngine;

namespace {

struct EngageCandidate
{
    const NPCSimulationRecord* record;
    float distance;
};

} // namespace

CombatController::CombatController(std::shared_ptr<const TileMap> map,
                                   const CombatConfig& config,
                                   uint32_t seed)
    : mp_map(std::move(map)),
      m_config(config),
      m_rng(seed)
{
}

float CombatController::roll()
{
    if (m_rollSource) {
        return m_rollSource();
    }
    std::uniform_real_distribution<float> dist(0.0f, 1.0f);
    return dist(m_rng);
}

void CombatController::update(float deltaTime)
{
    m_clock += std::max(0.0f, deltaTime);

    switch (m_state) {
        case CombatState::None:
            tryInitiate();
            break;
        case CombatState::NpcTurn:
            resolveNpcTurn();
            break;
        default:
            break;
    }
}

float CombatController::getCooldownRemaining() const
{
    if (!m_lastEncounterEnd) {
        return 0.0f;
    }
    const double remaining = m_config.encounterCooldown - (m_clock - *m_lastEncounterEnd);
    return static_cast<float>(std::max(0.0, remaining));
}

bool CombatController::isLedgerDowned(const std::string& npcId) const
{
    auto it = m_injuryLedger.find(npcId);
    return it != m_injuryLedger.end() &&
           static_cast<int>(it->second.size()) >= m_config.npcDownedThreshold;
}

bool CombatController::tryInitiate()
{
    auto player = mp_player.lock();
    if (!player || !mp_patrol || !mp_map) {
        return false;
    }
    if (getCooldownRemaining() > 0.0f) {
        return false;
    }

    std::vector<EngageCandidate> candidates;
    for (const auto& [id, record] : mp_patrol->getRecords()) {
        if (mp_patrol->getAlertState(id) != AlertState::Combat || isLedgerDowned(id)) {
            continue;
        }
        candidates.push_back({&record, Vector2D::distance(player->position, record.position)});
    }
    if (candidates.empty()) {
        return false;
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const EngageCandidate& a, const EngageCandidate& b) { return a.distance < b.distance; });
    const size_t maxNpcs = static_cast<size_t>(std::max(1, m_config.maxCombatants - 1));
    if (candidates.size() > maxNpcs) {
        candidates.resize(maxNpcs);
    }

    m_state = CombatState::Initiating;
    m_combatants.clear();
    m_outcome.reset();
    m_lastResult.reset();
    m_selectedAction.reset();

    Combatant playerCombatant;
    playerCombatant.id = PLAYER_COMBATANT_ID;
    playerCombatant.name = "Player";
    playerCombatant.isPlayer = true;
    playerCombatant.position = player->position;
    playerCombatant.facing = player->facing;
    if (auto it = m_injuryLedger.find(PLAYER_COMBATANT_ID); it != m_injuryLedger.end()) {
        playerCombatant.injuries = it->second;
    }
    m_combatants.push_back(std::move(playerCombatant));

    for (const auto& candidate : candidates) {
        const NPCSimulationRecord& record = *candidate.record;
        Combatant npc;
        npc.id = record.id;
        npc.name = record.data.name.empty() ? record.id : record.data.name;
        npc.faction = record.data.faction;
        npc.position = record.position;
        npc.facing = record.facing;
        if (auto it = m_injuryLedger.find(record.id); it != m_injuryLedger.end()) {
            npc.injuries = it->second;
        }
        mp_patrol->holdNPC(record.id);
        m_combatants.push_back(std::move(npc));
    }

    m_round = 1;
    m_selectedTargetId = CombatRules::nearestEnemyId(m_combatants, player->position);

    COMBAT_INFO(std::format("Encounter started with {} NPC(s)", m_combatants.size() - 1));
    enterPlayerTurn();
    return true;
}

void CombatController::enterPlayerTurn()
{
    m_state = CombatState::PlayerTurn;
    m_intents.clear();
    if (!mp_map || !CombatRules::findPlayer(m_combatants)) {
        return;
    }
    for (const auto& combatant : m_combatants) {
        if (!combatant.isPlayer && combatant.isActive()) {
            m_intents.push_back(CombatRules::planNpcIntent(combatant, m_combatants, *mp_map, m_config));
        }
    }
}

bool CombatController::selectAction(CombatActionType action)
{
    if (m_state != CombatState::PlayerTurn) {
        return false;
    }
    if (action == CombatActionType::Flee) {
        return executePlayerAction(action, std::nullopt, std::nullopt);
    }

    m_selectedAction = action;
    if (m_selectedTargetId && actionRequiresTarget(action)) {
        return executePlayerAction(action, m_selectedTargetId, std::nullopt);
    }
    return false;
}

bool CombatController::selectTarget(const std::string& targetId)
{
    m_selectedTargetId = targetId;
    if (m_state == CombatState::PlayerTurn && m_selectedAction && actionRequiresTarget(*m_selectedAction)) {
        return executePlayerAction(*m_selectedAction, targetId, std::nullopt);
    }
    return false;
}

void CombatController::clearSelection()
{
    m_selectedAction.reset();
    m_selectedTargetId.reset();
}

bool CombatController::mapClick(const Vector2D& point)
{
    if (m_state != CombatState::PlayerTurn) {
        return false;
    }
    if (!m_selectedAction || !actionRequiresPosition(*m_selectedAction)) {
        return false;
    }
    return executePlayerAction(*m_selectedAction, std::nullopt, point);
}

bool CombatController::executePlayerAction(CombatActionType type,
                                           std::optional<std::string> targetId,
                                           std::optional<Vector2D> targetPosition)
{
    if (!mp_map) {
        return false;
    }

    CombatAction action;
    action.type = type;
    action.actorId = PLAYER_COMBATANT_ID;
    action.targetId = std::move(targetId);
    action.targetPosition = targetPosition;

    m_state = CombatState::Resolving;
    auto resolution = CombatRules::resolveAction(*mp_map, m_config, m_combatants, action, m_round,
                                                 [this]() { return roll(); });

    if (!resolution.result.applied) {
        // Stale target or missing argument: the turn is not spent
        COMBAT_DEBUG(std::format("Ignored player {} (no valid target)", combatActionName(type)));
        m_state = CombatState::PlayerTurn;
        clearSelection();
        return false;
    }

    m_combatants = std::move(resolution.combatants);
    m_lastResult = resolution.result;

    if (auto outcome = CombatRules::evaluateOutcome(m_combatants, resolution.result, m_round)) {
        finalize(std::move(*outcome));
        return true;
    }

    m_selectedAction.reset();
    m_selectedTargetId.reset();
    m_state = CombatState::NpcTurn;
    return true;
}

void CombatController::resolveNpcTurn()
{
    if (!mp_map) {
        return;
    }

    // Snapshot the acting order; NPCs downed mid-turn are skipped by resolveAction
    std::vector<std::string> actors;
    for (const auto& combatant : m_combatants) {
        if (!combatant.isPlayer && combatant.isActive()) {
            actors.push_back(combatant.id);
        }
    }

    for (const auto& actorId : actors) {
        const Combatant* npc = CombatRules::findCombatant(m_combatants, actorId);
        if (!npc || !npc->isActive()) {
            continue;
        }

        CombatIntent intent = CombatRules::planNpcIntent(*npc, m_combatants, *mp_map, m_config);
        CombatAction action;
        action.type = intent.action;
        action.actorId = actorId;
        action.targetId = intent.targetId;
        action.targetPosition = intent.targetPosition;

        auto resolution = CombatRules::resolveAction(*mp_map, m_config, m_combatants, action, m_round,
                                                     [this]() { return roll(); });
        m_combatants = std::move(resolution.combatants);
        m_lastResult = resolution.result;

        if (auto outcome = CombatRules::evaluateOutcome(m_combatants, resolution.result, m_round)) {
            finalize(std::move(*outcome));
            return;
        }
    }

    if (m_round >= m_config.maxRounds) {
        COMBAT_INFO(std::format("Round limit {} reached, remaining NPCs disengage", m_config.maxRounds));
        for (auto& combatant : m_combatants) {
            if (!combatant.isPlayer && combatant.isActive()) {
                combatant.status = CombatantStatus::Fled;
            }
        }
        if (auto outcome = CombatRules::evaluateOutcome(m_combatants, CombatActionResult{}, m_round)) {
            finalize(std::move(*outcome));
        }
        return;
    }

    ++m_round;
    enterPlayerTurn();
}

void CombatController::finalize(CombatOutcome outcome)
{
    m_state = CombatState::Ended;
    m_selectedAction.reset();
    m_selectedTargetId.reset();
    m_intents.clear();
    m_lastEncounterEnd = m_clock;
    m_outcome = std::move(outcome);

    for (const auto& [id, injuries] : m_outcome->injuries) {
        m_injuryLedger[id] = injuries;
    }

    writeBack();

    COMBAT_INFO(std::format("Encounter ended: {} after {} round(s)",
                            combatOutcomeName(m_outcome->outcome), m_outcome->rounds));

    if (m_onOutcome) {
        m_onOutcome(*m_outcome);
    }
}

void CombatController::writeBack()
{
    if (auto player = mp_player.lock()) {
        if (const Combatant* combatant = CombatRules::findPlayer(m_combatants)) {
            player->position = combatant->position;
            player->facing = combatant->facing;
        }
    }

    if (!mp_patrol) {
        return;
    }

    const bool peaceful = m_outcome.has_value() && m_outcome->outcome == CombatOutcomeType::TalkSuccess;
    for (const auto& combatant : m_combatants) {
        if (combatant.isPlayer) {
            continue;
        }
        // Anyone who left the fight, or a talked-down group, calms down
        const bool calm = peaceful || !combatant.isActive();
        mp_patrol->writeBack(combatant.id, combatant.position, combatant.facing, calm);

        // Downed NPCs stay where they fell
        if (combatant.status != CombatantStatus::Down) {
            mp_patrol->releaseNPC(combatant.id);
        }
    }
}

void CombatController::clearCombat()
{
    if (m_state != CombatState::None && m_state != CombatState::Ended) {
        // Abandoned mid-encounter: hand everyone back unchanged
        writeBack();
        m_lastEncounterEnd = m_clock;
        COMBAT_WARN("Encounter cleared before it ended");
    }

    m_state = CombatState::None;
    m_round = 0;
    m_combatants.clear();
    m_intents.clear();
    m_selectedAction.reset();
    m_selectedTargetId.reset();
    m_outcome.reset();
    m_lastResult.reset();
}

void CombatController::setLedgerInjuries(const std::string& combatantId, const InjuryList& injuries)
{
    if (injuries.empty()) {
        m_injuryLedger.erase(combatantId);
    } else {
        m_injuryLedger[combatantId] = injuries;
    }
}

std::vector<CombatTargetInfo> CombatController::getTargetOptions() const
{
    if (!mp_map || !m_selectedAction) {
        return {};
    }
    return CombatRules::getTargetOptions(*mp_map, m_config, m_combatants, *m_selectedAction);
}

std::optional<CombatRenderState> CombatController::getRenderState() const
{
    if (m_state == CombatState::None) {
        return std::nullopt;
    }

    CombatRenderState render;
    render.active = true;
    render.state = m_state;
    render.round = m_round;
    render.combatants = m_combatants;
    render.selectedAction = m_selectedAction;
    render.selectedTargetId = m_selectedTargetId;
    render.intents = m_intents;

    if (m_state == CombatState::PlayerTurn) {
        render.activeCombatantId = PLAYER_COMBATANT_ID;
    } else {
        for (const auto& combatant : m_combatants) {
            if (!combatant.isPlayer && combatant.isActive()) {
                render.activeCombatantId = combatant.id;
                break;
            }
        }
    }

    if (render.activeCombatantId && mp_map) {
        if (const Combatant* active = CombatRules::findCombatant(m_combatants, *render.activeCombatantId)) {
            render.movementRange = CombatRules::getMovementRange(*active, m_config, mp_map->getTileSize());
        }
    }
    return render;
}
