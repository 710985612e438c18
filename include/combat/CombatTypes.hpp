/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COMBAT_TYPES_HPP
#define COMBAT_TYPES_HPP

#include "utils/Vector2D.hpp"
#include "world/TileTypes.hpp"
#include <boost/container/flat_map.hpp>
#include <boost/container/small_vector.hpp>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace SentinelEngine {

inline constexpr const char* PLAYER_COMBATANT_ID = "player";

enum class CombatState : uint8_t {
    None,
    Initiating,
    PlayerTurn,
    NpcTurn,
    Resolving,
    Ended
};

enum class CombatActionType : uint8_t {
    Move,
    Fire,
    Strike,
    Suppress,
    Interact,
    Talk,
    Flee
};

enum class InjuryType : uint8_t {
    ImpairedMovement,
    ReducedAccuracy,
    GearDamage,
    Scarred
};

enum class CombatantStatus : uint8_t {
    Active,
    Fled,
    Down
};

enum class CombatOutcomeType : uint8_t {
    PlayerFled,
    NpcFled,
    PlayerDown,
    NpcDown,
    TalkSuccess
};

// Per-action result tag, distinct from the encounter outcome
enum class ActionOutcome : uint8_t {
    None,
    TalkSuccess,
    TalkFailed,
    Fled
};

struct InjuryEffect {
    InjuryType type{InjuryType::Scarred};
    int severity{1};                // 1 or 2
    std::string description;
    float accuracyPenalty{0.0f};
    float movementPenalty{0.0f};

    bool operator==(const InjuryEffect& other) const {
        return type == other.type && severity == other.severity;
    }
};

// Injuries never exceed one entry per InjuryType
using InjuryList = boost::container::small_vector<InjuryEffect, 4>;

struct TemporaryEffects {
    std::optional<int> suppressedUntilRound;
    float defenseBonus{0.0f};
    std::optional<int> defenseUntilRound;
};

struct Combatant {
    std::string id;
    std::string name;
    bool isPlayer{false};
    std::string faction;            // Empty = none
    Vector2D position;
    Facing facing{Facing::South};
    InjuryList injuries;
    CombatantStatus status{CombatantStatus::Active};
    TemporaryEffects temporaryEffects;

    bool isActive() const { return status == CombatantStatus::Active; }
};

using CombatantList = std::vector<Combatant>;

struct CombatIntent {
    std::string npcId;
    CombatActionType action{CombatActionType::Move};
    std::optional<std::string> targetId;
    std::optional<Vector2D> targetPosition;
    std::string rationale;
};

struct CombatAction {
    CombatActionType type{CombatActionType::Move};
    std::string actorId;
    std::optional<std::string> targetId;
    std::optional<Vector2D> targetPosition;
};

struct CombatActionResult {
    CombatAction action;
    bool applied{false};            // false = stale actor/target or missing argument
    std::optional<bool> hit;
    std::optional<Vector2D> movedTo;
    std::optional<InjuryEffect> injuryApplied;
    bool suppressed{false};
    ActionOutcome outcome{ActionOutcome::None};
    std::optional<std::string> targetId;
};

using FactionImpact = boost::container::flat_map<std::string, int>;
using InjurySnapshot = boost::container::flat_map<std::string, InjuryList>;

struct CombatOutcome {
    CombatOutcomeType outcome{CombatOutcomeType::NpcDown};
    FactionImpact factionImpact;
    InjurySnapshot injuries;
    int rounds{0};
};

struct CombatTargetInfo {
    std::string id;
    std::string name;
    std::string faction;
    float distance{0.0f};           // Tiles
    int coverValue{0};
    bool inRange{false};
};

/**
 * @brief Read-only per-frame view of an encounter for the rendering layer
 */
struct CombatRenderState {
    bool active{false};
    CombatState state{CombatState::None};
    int round{0};
    std::optional<std::string> activeCombatantId;
    CombatantList combatants;
    std::optional<CombatActionType> selectedAction;
    std::optional<std::string> selectedTargetId;
    float movementRange{0.0f};      // Px
    std::vector<CombatIntent> intents;
    std::string playerId{PLAYER_COMBATANT_ID};
};

const char* combatStateName(CombatState state);
const char* combatActionName(CombatActionType action);
const char* injuryTypeName(InjuryType type);
const char* combatantStatusName(CombatantStatus status);
const char* combatOutcomeName(CombatOutcomeType outcome);
const char* actionOutcomeName(ActionOutcome outcome);

std::optional<CombatActionType> combatActionFromName(const std::string& name);

// Fire, strike, suppress and talk
bool actionRequiresTarget(CombatActionType action);
// Move and interact
bool actionRequiresPosition(CombatActionType action);

inline std::ostream& operator<<(std::ostream& os, CombatState state) {
    return os << combatStateName(state);
}

inline std::ostream& operator<<(std::ostream& os, CombatActionType action) {
    return os << combatActionName(action);
}

inline std::ostream& operator<<(std::ostream& os, CombatOutcomeType outcome) {
    return os << combatOutcomeName(outcome);
}

inline std::ostream& operator<<(std::ostream& os, CombatantStatus status) {
    return os << combatantStatusName(status);
}

inline std::ostream& operator<<(std::ostream& os, InjuryType type) {
    return os << injuryTypeName(type);
}

} // namespace SentinelEngine

#endif // COMBAT_TYPES_HPP
