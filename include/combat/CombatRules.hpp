/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COMBAT_RULES_HPP
#define COMBAT_RULES_HPP

/**
 * @file CombatRules.hpp
 * @brief Stateless rules of the turn-based combat engine
 *
 * Every function here is pure apart from the RollSource it is handed:
 * resolution takes a roster by const reference and returns the updated copy,
 * so the CombatController decides when a result is committed.
 */

#include "combat/CombatConfig.hpp"
#include "combat/CombatTypes.hpp"
#include "utils/Vector2D.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace SentinelEngine {

class TileMap;

namespace CombatRules {

// Uniform roll in [0, 1)
using RollSource = std::function<float()>;

struct Resolution {
    CombatantList combatants;
    CombatActionResult result;
};

float distanceTiles(const Vector2D& from, const Vector2D& to, float tileSize);
float getActionRangeTiles(CombatActionType action, const CombatConfig& config);

float getAccuracyPenalty(const InjuryList& injuries);
float getMovementPenalty(const InjuryList& injuries);

/**
 * @brief Movement budget in px for one move/interact action
 *
 * moveRange * (1 - min(maxPenalty, summed movement penalties)), never below
 * minMovementRangeTiles.
 */
float getMovementRange(const Combatant& combatant, const CombatConfig& config, float tileSize);

/**
 * @brief Chance for 'attacker' to hit 'target' with a fire/strike/suppress
 * @return Always within [minHitChance, maxHitChance]
 */
float calculateHitChance(const TileMap& map, const CombatConfig& config, const Combatant& attacker,
                         const Combatant& target, CombatActionType action, int round);

float calculateTalkChance(const CombatConfig& config, const Combatant& actor, const Combatant& target);

InjuryEffect createInjury(InjuryType type, int severity = 1);

/**
 * @brief Add 'injury' to 'target', or raise the severity (max 2) of an
 *        existing entry of the same type
 * @return The resulting entry
 */
InjuryEffect applyInjury(Combatant& target, const InjuryEffect& injury);

bool isDown(const Combatant& combatant, const CombatConfig& config);

// Strike favours movement damage, ranged attacks favour gear damage
InjuryType pickInjuryType(CombatActionType action, float roll);

const Combatant* findCombatant(const CombatantList& combatants, const std::string& id);
const Combatant* findPlayer(const CombatantList& combatants);
size_t countActiveNpcs(const CombatantList& combatants);

/**
 * @brief Resolve one action against a roster
 *
 * A missing or inactive actor, a missing argument, or an inactive target
 * leaves the roster untouched and reports applied == false.
 */
Resolution resolveAction(const TileMap& map, const CombatConfig& config, const CombatantList& combatants,
                         const CombatAction& action, int round, const RollSource& roll);

CombatIntent planNpcIntent(const Combatant& npc, const CombatantList& combatants, const TileMap& map,
                           const CombatConfig& config);

/**
 * @brief Best cover cell centre within coverSearchRadiusTiles of 'from'
 *
 * Score = distance to self - weight * distance to player (tiles); lowest wins.
 */
std::optional<Vector2D> findNearestCover(const TileMap& map, const CombatConfig& config,
                                         const Vector2D& from, const Vector2D& playerPos);

// Terminal outcome after 'result', or nullopt if the encounter continues
std::optional<CombatOutcome> evaluateOutcome(const CombatantList& combatants,
                                             const CombatActionResult& result, int round);

FactionImpact computeFactionImpact(const CombatantList& combatants, CombatOutcomeType outcome);

// Injury lists of every combatant with at least one injury
InjurySnapshot buildInjurySnapshot(const CombatantList& combatants);

std::vector<CombatTargetInfo> getTargetOptions(const TileMap& map, const CombatConfig& config,
                                               const CombatantList& combatants, CombatActionType action);

std::optional<std::string> nearestEnemyId(const CombatantList& combatants, const Vector2D& playerPos);

} // namespace CombatRules

} // namespace SentinelEngine

#endif // COMBAT_RULES_HPP
