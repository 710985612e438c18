/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "combat/CombatRules.hpp"
#include "collisions/TileCollision.hpp"
#include "world/TileMap.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace SentinelEngine {
namespace CombatRules {

namespace {

struct InjuryTemplate {
    const char* description;
    float accuracyPenalty;
    float movementPenalty;
};

InjuryTemplate injuryTemplate(InjuryType type) {
    switch (type) {
        case InjuryType::ImpairedMovement: return {"Impaired movement", 0.0f, 0.2f};
        case InjuryType::ReducedAccuracy: return {"Reduced accuracy", 0.15f, 0.0f};
        case InjuryType::GearDamage: return {"Gear damage", 0.1f, 0.0f};
        case InjuryType::Scarred: return {"Visible scars", 0.0f, 0.0f};
    }
    return {"Visible scars", 0.0f, 0.0f};
}

Combatant* findMutable(CombatantList& combatants, const std::string& id) {
    auto it = std::find_if(combatants.begin(), combatants.end(),
                           [&id](const Combatant& c) { return c.id == id; });
    return it != combatants.end() ? &*it : nullptr;
}

float baseHitChance(CombatActionType action, const CombatConfig& config) {
    switch (action) {
        case CombatActionType::Strike: return config.strikeBaseChance;
        case CombatActionType::Suppress: return config.suppressBaseChance;
        default: return config.fireBaseChance;
    }
}

void resolveMovement(const TileMap& map, const CombatConfig& config, Combatant& actor,
                     const CombatAction& action, int round, CombatActionResult& result) {
    const float tileSize = map.getTileSize();
    const Vector2D target = *action.targetPosition;
    const float dx = target.getX() - actor.position.getX();
    const float dy = target.getY() - actor.position.getY();
    float distance = std::sqrt(dx * dx + dy * dy);
    if (distance <= 0.0f) {
        distance = 1.0f;
    }

    const float clampedDistance = std::min(getMovementRange(actor, config, tileSize), distance);
    Vector2D desired(actor.position.getX() + (dx / distance) * clampedDistance,
                     actor.position.getY() + (dy / distance) * clampedDistance);

    const float radius = tileSize * config.movementRadiusFraction;
    desired = TileCollision::clampToBounds(map, desired, radius);
    MovementResult moved = TileCollision::resolveMovement(map, actor.position, desired, radius);

    actor.position = moved.position;
    actor.facing = facingFromDirection(dx, dy);

    if (action.type == CombatActionType::Interact) {
        int cover = map.getCoverValueAt(actor.position);
        if (cover > 0) {
            actor.temporaryEffects.defenseBonus =
                cover >= 2 ? config.fullCoverDefenseBonus : config.halfCoverDefenseBonus;
            actor.temporaryEffects.defenseUntilRound = round + 1;
        }
    }

    result.movedTo = moved.position;
    result.applied = true;
}

} // namespace

float distanceTiles(const Vector2D& from, const Vector2D& to, float tileSize) {
    return Vector2D::distance(from, to) / tileSize;
}

float getActionRangeTiles(CombatActionType action, const CombatConfig& config) {
    switch (action) {
        case CombatActionType::Strike: return config.strikeRangeTiles;
        case CombatActionType::Suppress: return config.suppressRangeTiles;
        case CombatActionType::Move:
        case CombatActionType::Interact: return config.moveRangeTiles;
        default: return config.fireRangeTiles;
    }
}

float getAccuracyPenalty(const InjuryList& injuries) {
    float sum = 0.0f;
    for (const auto& injury : injuries) {
        sum += injury.accuracyPenalty;
    }
    return sum;
}

float getMovementPenalty(const InjuryList& injuries) {
    float sum = 0.0f;
    for (const auto& injury : injuries) {
        sum += injury.movementPenalty;
    }
    return sum;
}

float getMovementRange(const Combatant& combatant, const CombatConfig& config, float tileSize) {
    float penalty = std::min(config.maxMovementPenalty, getMovementPenalty(combatant.injuries));
    float range = config.moveRangeTiles * tileSize * (1.0f - penalty);
    return std::max(tileSize * config.minMovementRangeTiles, range);
}

float calculateHitChance(const TileMap& map, const CombatConfig& config, const Combatant& attacker,
                         const Combatant& target, CombatActionType action, int round) {
    const float distance = distanceTiles(attacker.position, target.position, map.getTileSize());
    const int cover = map.getCoverValueAt(target.position);
    const float coverPenalty = cover >= 2 ? config.fullCoverPenalty
                             : cover == 1 ? config.halfCoverPenalty
                             : 0.0f;

    const float distancePenalty = action == CombatActionType::Strike
        ? std::max(0.0f, distance - config.meleeFreeRangeTiles) * config.meleeFalloffPerTile
        : std::max(0.0f, distance - config.rangedFreeRangeTiles) * config.rangedFalloffPerTile;

    const auto& attackerFx = attacker.temporaryEffects;
    const float suppressedPenalty =
        attackerFx.suppressedUntilRound && *attackerFx.suppressedUntilRound >= round
            ? config.suppressedPenalty : 0.0f;

    const auto& targetFx = target.temporaryEffects;
    const float defenseBonus =
        targetFx.defenseUntilRound && *targetFx.defenseUntilRound >= round
            ? targetFx.defenseBonus : 0.0f;

    float chance = baseHitChance(action, config) - distancePenalty - coverPenalty
                 - getAccuracyPenalty(attacker.injuries) - suppressedPenalty - defenseBonus;
    return std::clamp(chance, config.minHitChance, config.maxHitChance);
}

float calculateTalkChance(const CombatConfig& config, const Combatant& actor, const Combatant& target) {
    float chance = config.talkBaseChance;
    if (!target.injuries.empty()) {
        chance += config.talkInjuredTargetBonus;
    }
    if (!actor.injuries.empty()) {
        chance -= config.talkInjuredActorPenalty;
    }
    return std::clamp(chance, config.minTalkChance, config.maxTalkChance);
}

InjuryEffect createInjury(InjuryType type, int severity) {
    InjuryTemplate tpl = injuryTemplate(type);
    InjuryEffect injury;
    injury.type = type;
    injury.severity = severity;
    injury.description = tpl.description;
    injury.accuracyPenalty = tpl.accuracyPenalty * static_cast<float>(severity);
    injury.movementPenalty = tpl.movementPenalty * static_cast<float>(severity);
    return injury;
}

InjuryEffect applyInjury(Combatant& target, const InjuryEffect& injury) {
    auto existing = std::find_if(target.injuries.begin(), target.injuries.end(),
                                 [&injury](const InjuryEffect& e) { return e.type == injury.type; });
    if (existing != target.injuries.end()) {
        *existing = createInjury(existing->type, std::min(2, existing->severity + 1));
        return *existing;
    }
    target.injuries.push_back(injury);
    return injury;
}

bool isDown(const Combatant& combatant, const CombatConfig& config) {
    const int threshold = combatant.isPlayer ? config.playerDownedThreshold : config.npcDownedThreshold;
    return static_cast<int>(combatant.injuries.size()) >= threshold;
}

InjuryType pickInjuryType(CombatActionType action, float roll) {
    if (action == CombatActionType::Strike) {
        if (roll < 0.5f) return InjuryType::ImpairedMovement;
        if (roll < 0.8f) return InjuryType::ReducedAccuracy;
        return InjuryType::Scarred;
    }
    if (roll < 0.4f) return InjuryType::GearDamage;
    if (roll < 0.8f) return InjuryType::ReducedAccuracy;
    return InjuryType::Scarred;
}

const Combatant* findCombatant(const CombatantList& combatants, const std::string& id) {
    auto it = std::find_if(combatants.begin(), combatants.end(),
                           [&id](const Combatant& c) { return c.id == id; });
    return it != combatants.end() ? &*it : nullptr;
}

const Combatant* findPlayer(const CombatantList& combatants) {
    auto it = std::find_if(combatants.begin(), combatants.end(),
                           [](const Combatant& c) { return c.isPlayer; });
    return it != combatants.end() ? &*it : nullptr;
}

size_t countActiveNpcs(const CombatantList& combatants) {
    return static_cast<size_t>(std::count_if(combatants.begin(), combatants.end(),
        [](const Combatant& c) { return !c.isPlayer && c.isActive(); }));
}

Resolution resolveAction(const TileMap& map, const CombatConfig& config, const CombatantList& combatants,
                         const CombatAction& action, int round, const RollSource& roll) {
    Resolution resolution{combatants, CombatActionResult{}};
    CombatActionResult& result = resolution.result;
    result.action = action;
    result.targetId = action.targetId;

    Combatant* actor = findMutable(resolution.combatants, action.actorId);
    if (!actor || !actor->isActive()) {
        resolution.combatants = combatants;
        return resolution;
    }

    switch (action.type) {
        case CombatActionType::Move:
        case CombatActionType::Interact:
            if (action.targetPosition) {
                resolveMovement(map, config, *actor, action, round, result);
            }
            break;

        case CombatActionType::Flee:
            actor->status = CombatantStatus::Fled;
            result.outcome = ActionOutcome::Fled;
            result.applied = true;
            break;

        case CombatActionType::Talk: {
            const Combatant* target = action.targetId ? findCombatant(resolution.combatants, *action.targetId) : nullptr;
            if (!target || !target->isActive()) {
                break;
            }
            const float chance = calculateTalkChance(config, *actor, *target);
            result.outcome = roll() < chance ? ActionOutcome::TalkSuccess : ActionOutcome::TalkFailed;
            result.applied = true;
            break;
        }

        case CombatActionType::Fire:
        case CombatActionType::Strike:
        case CombatActionType::Suppress: {
            Combatant* target = action.targetId ? findMutable(resolution.combatants, *action.targetId) : nullptr;
            if (!target || !target->isActive()) {
                break;
            }
            result.applied = true;

            // Ranged actions need a clear line; the action is spent either way
            if (action.type != CombatActionType::Strike &&
                !TileCollision::hasLineOfSight(map, actor->position, target->position)) {
                result.hit = false;
                break;
            }

            if (action.type == CombatActionType::Suppress) {
                target->temporaryEffects.suppressedUntilRound = round + 1;
                result.suppressed = true;
                result.hit = true;
                break;
            }

            const float chance = calculateHitChance(map, config, *actor, *target, action.type, round);
            const bool hit = roll() < chance;
            result.hit = hit;
            if (hit) {
                InjuryType type = pickInjuryType(action.type, roll());
                result.injuryApplied = applyInjury(*target, createInjury(type));
                if (isDown(*target, config)) {
                    target->status = CombatantStatus::Down;
                }
            }
            break;
        }
    }

    if (!result.applied) {
        resolution.combatants = combatants;
    }
    return resolution;
}

std::optional<Vector2D> findNearestCover(const TileMap& map, const CombatConfig& config,
                                         const Vector2D& from, const Vector2D& playerPos) {
    const float tileSize = map.getTileSize();
    std::optional<Vector2D> best;
    float bestScore = std::numeric_limits<float>::infinity();

    for (int row = 0; row < map.getHeight(); ++row) {
        for (int col = 0; col < map.getWidth(); ++col) {
            if (map.getCoverValue(col, row) == 0) {
                continue;
            }
            Vector2D point = map.gridToWorld(col, row);
            float toNpc = distanceTiles(from, point, tileSize);
            if (toNpc > config.coverSearchRadiusTiles) {
                continue;
            }
            float score = toNpc - distanceTiles(playerPos, point, tileSize) * config.coverPlayerDistanceWeight;
            if (score < bestScore) {
                bestScore = score;
                best = point;
            }
        }
    }
    return best;
}

CombatIntent planNpcIntent(const Combatant& npc, const CombatantList& combatants, const TileMap& map,
                           const CombatConfig& config) {
    CombatIntent intent;
    intent.npcId = npc.id;

    const Combatant* player = findPlayer(combatants);
    if (!player) {
        intent.action = CombatActionType::Move;
        return intent;
    }

    if (!npc.injuries.empty()) {
        intent.action = CombatActionType::Flee;
        intent.rationale = "injured";
        return intent;
    }

    const float tileSize = map.getTileSize();
    const bool canSee = TileCollision::hasLineOfSight(map, npc.position, player->position);
    const float distance = distanceTiles(npc.position, player->position, tileSize);

    if (canSee && distance <= config.fireRangeTiles) {
        intent.action = distance <= config.meleeAdjacencyTiles ? CombatActionType::Strike : CombatActionType::Fire;
        intent.targetId = player->id;
        intent.rationale = "line_of_sight";
        return intent;
    }

    if (auto cover = findNearestCover(map, config, npc.position, player->position)) {
        intent.action = CombatActionType::Move;
        intent.targetPosition = *cover;
        intent.rationale = "seek_cover";
        return intent;
    }

    // Step one tile toward the player along the Manhattan-normalised direction
    const float dx = player->position.getX() - npc.position.getX();
    const float dy = player->position.getY() - npc.position.getY();
    const float norm = std::max(1.0f, std::fabs(dx) + std::fabs(dy));
    intent.action = CombatActionType::Move;
    intent.targetPosition = Vector2D(npc.position.getX() + (dx / norm) * tileSize,
                                     npc.position.getY() + (dy / norm) * tileSize);
    intent.rationale = std::string("close_distance_") + facingName(facingFromDirection(dx, dy));
    return intent;
}

FactionImpact computeFactionImpact(const CombatantList& combatants, CombatOutcomeType outcome) {
    int delta = 0;
    switch (outcome) {
        case CombatOutcomeType::TalkSuccess: delta = 1; break;
        case CombatOutcomeType::NpcDown:
        case CombatOutcomeType::PlayerDown: delta = -2; break;
        case CombatOutcomeType::NpcFled:
        case CombatOutcomeType::PlayerFled: delta = -1; break;
    }

    FactionImpact impact;
    for (const auto& combatant : combatants) {
        if (!combatant.isPlayer && !combatant.faction.empty()) {
            // One entry per distinct faction
            impact[combatant.faction] = delta;
        }
    }
    return impact;
}

InjurySnapshot buildInjurySnapshot(const CombatantList& combatants) {
    InjurySnapshot snapshot;
    for (const auto& combatant : combatants) {
        if (!combatant.injuries.empty()) {
            snapshot[combatant.id] = combatant.injuries;
        }
    }
    return snapshot;
}

std::optional<CombatOutcome> evaluateOutcome(const CombatantList& combatants,
                                             const CombatActionResult& result, int round) {
    auto finish = [&](CombatOutcomeType type) {
        CombatOutcome outcome;
        outcome.outcome = type;
        outcome.factionImpact = computeFactionImpact(combatants, type);
        outcome.injuries = buildInjurySnapshot(combatants);
        outcome.rounds = round;
        return std::optional<CombatOutcome>(std::move(outcome));
    };

    if (result.outcome == ActionOutcome::TalkSuccess) {
        return finish(CombatOutcomeType::TalkSuccess);
    }

    const Combatant* player = findPlayer(combatants);
    if (player && player->status == CombatantStatus::Fled) {
        return finish(CombatOutcomeType::PlayerFled);
    }
    if (player && player->status == CombatantStatus::Down) {
        return finish(CombatOutcomeType::PlayerDown);
    }

    if (countActiveNpcs(combatants) == 0) {
        bool anyFled = std::any_of(combatants.begin(), combatants.end(), [](const Combatant& c) {
            return !c.isPlayer && c.status == CombatantStatus::Fled;
        });
        return finish(anyFled ? CombatOutcomeType::NpcFled : CombatOutcomeType::NpcDown);
    }

    return std::nullopt;
}

std::vector<CombatTargetInfo> getTargetOptions(const TileMap& map, const CombatConfig& config,
                                               const CombatantList& combatants, CombatActionType action) {
    std::vector<CombatTargetInfo> options;
    const Combatant* player = findPlayer(combatants);
    if (!player || !actionRequiresTarget(action)) {
        return options;
    }

    const float range = getActionRangeTiles(action, config);
    for (const auto& combatant : combatants) {
        if (combatant.isPlayer || !combatant.isActive()) {
            continue;
        }
        CombatTargetInfo info;
        info.id = combatant.id;
        info.name = combatant.name;
        info.faction = combatant.faction;
        info.distance = distanceTiles(player->position, combatant.position, map.getTileSize());
        info.coverValue = map.getCoverValueAt(combatant.position);
        info.inRange = info.distance <= range;
        options.push_back(std::move(info));
    }
    return options;
}

std::optional<std::string> nearestEnemyId(const CombatantList& combatants, const Vector2D& playerPos) {
    std::optional<std::string> best;
    float bestDist = std::numeric_limits<float>::infinity();
    for (const auto& combatant : combatants) {
        if (combatant.isPlayer) {
            continue;
        }
        float dist = Vector2D::distanceSquared(playerPos, combatant.position);
        if (dist < bestDist) {
            bestDist = dist;
            best = combatant.id;
        }
    }
    return best;
}

} // namespace CombatRules
} // namespace SentinelEngine
