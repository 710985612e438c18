/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "combat/CombatTypes.hpp"

namespace SentinelEngine {

const char* combatStateName(CombatState state) {
    switch (state) {
        case CombatState::None: return "none";
        case CombatState::Initiating: return "initiating";
        case CombatState::PlayerTurn: return "player_turn";
        case CombatState::NpcTurn: return "npc_turn";
        case CombatState::Resolving: return "resolving";
        case CombatState::Ended: return "ended";
    }
    return "none";
}

const char* combatActionName(CombatActionType action) {
    switch (action) {
        case CombatActionType::Move: return "move";
        case CombatActionType::Fire: return "fire";
        case CombatActionType::Strike: return "strike";
        case CombatActionType::Suppress: return "suppress";
        case CombatActionType::Interact: return "interact";
        case CombatActionType::Talk: return "talk";
        case CombatActionType::Flee: return "flee";
    }
    return "move";
}

const char* injuryTypeName(InjuryType type) {
    switch (type) {
        case InjuryType::ImpairedMovement: return "impaired_movement";
        case InjuryType::ReducedAccuracy: return "reduced_accuracy";
        case InjuryType::GearDamage: return "gear_damage";
        case InjuryType::Scarred: return "scarred";
    }
    return "scarred";
}

const char* combatantStatusName(CombatantStatus status) {
    switch (status) {
        case CombatantStatus::Active: return "active";
        case CombatantStatus::Fled: return "fled";
        case CombatantStatus::Down: return "down";
    }
    return "active";
}

const char* combatOutcomeName(CombatOutcomeType outcome) {
    switch (outcome) {
        case CombatOutcomeType::PlayerFled: return "player_fled";
        case CombatOutcomeType::NpcFled: return "npc_fled";
        case CombatOutcomeType::PlayerDown: return "player_down";
        case CombatOutcomeType::NpcDown: return "npc_down";
        case CombatOutcomeType::TalkSuccess: return "talk_success";
    }
    return "npc_down";
}

const char* actionOutcomeName(ActionOutcome outcome) {
    switch (outcome) {
        case ActionOutcome::None: return "none";
        case ActionOutcome::TalkSuccess: return "talk_success";
        case ActionOutcome::TalkFailed: return "talk_failed";
        case ActionOutcome::Fled: return "fled";
    }
    return "none";
}

std::optional<CombatActionType> combatActionFromName(const std::string& name) {
    if (name == "move") return CombatActionType::Move;
    if (name == "fire") return CombatActionType::Fire;
    if (name == "strike") return CombatActionType::Strike;
    if (name == "suppress") return CombatActionType::Suppress;
    if (name == "interact") return CombatActionType::Interact;
    if (name == "talk") return CombatActionType::Talk;
    if (name == "flee") return CombatActionType::Flee;
    return std::nullopt;
}

bool actionRequiresTarget(CombatActionType action) {
    return action == CombatActionType::Fire || action == CombatActionType::Strike ||
           action == CombatActionType::Suppress || action == CombatActionType::Talk;
}

bool actionRequiresPosition(CombatActionType action) {
    return action == CombatActionType::Move || action == CombatActionType::Interact;
}

} // namespace SentinelEngine
