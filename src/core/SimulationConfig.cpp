/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/SimulationConfig.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <format>

namespace SentinelEngine {

namespace {

void readAlert(const JsonValue& s, AlertConfig& c) {
    s.readNumber("detectionRange", c.detectionRange);
    s.readNumber("nightRangeMultiplier", c.nightRangeMultiplier);
    s.readNumber("detectionConeAngle", c.detectionConeAngle);
    s.readNumber("buildRate", c.buildRate);
    s.readNumber("decayRate", c.decayRate);
    s.readNumber("investigateThreshold", c.investigateThreshold);
    s.readNumber("combatThreshold", c.combatThreshold);
    s.readNumber("investigationDuration", c.investigationDuration);
}

void readPatrol(const JsonValue& s, PatrolBehaviorConfig& c) {
    s.readNumber("moveSpeed", c.moveSpeed);
    s.readNumber("investigateSpeedMultiplier", c.investigateSpeedMultiplier);
    s.readNumber("wanderSpeedMultiplier", c.wanderSpeedMultiplier);
    s.readNumber("entityRadius", c.entityRadius);
    s.readNumber("waypointReachedRadius", c.waypointReachedRadius);
    s.readNumber("simpleWait", c.simpleWait);
    s.readNumber("sweepWait", c.sweepWait);
    s.readNumber("wanderWaitMin", c.wanderWaitMin);
    s.readNumber("wanderWaitSpread", c.wanderWaitSpread);
    s.readNumber("staticWatchWait", c.staticWatchWait);
    s.readNumber("wanderOffsetTiles", c.wanderOffsetTiles);
}

void readAwareness(const JsonValue& s, AwarenessConfig& c) {
    s.readNumber("awareThreshold", c.awareThreshold);
    s.readNumber("proximityDecayMultiplier", c.proximityDecayMultiplier);
    s.readNumber("lingerThreshold", c.lingerThreshold);
    s.readNumber("idleLingerGate", c.idleLingerGate);
    s.readNumber("interactionRange", c.interactionRange);
    s.readNumber("glanceDuration", c.glanceDuration);
    s.readNumber("glanceIntervalMin", c.glanceIntervalMin);
    s.readNumber("glanceIntervalSpread", c.glanceIntervalSpread);
    s.readNumber("shiftCooldown", c.shiftCooldown);
    s.readNumber("shiftDuration", c.shiftDuration);
    s.readNumber("shiftMagnitude", c.shiftMagnitude);
    s.readNumber("fleeRangeFactor", c.fleeRangeFactor);
    s.readNumber("fleeCooldown", c.fleeCooldown);
    s.readNumber("fleeDuration", c.fleeDuration);
    s.readNumber("fleeMagnitude", c.fleeMagnitude);
}

void readCombat(const JsonValue& s, CombatConfig& c) {
    s.readNumber("maxCombatants", c.maxCombatants);
    s.readNumber("encounterCooldown", c.encounterCooldown);
    s.readNumber("maxRounds", c.maxRounds);
    s.readNumber("moveRangeTiles", c.moveRangeTiles);
    s.readNumber("fireRangeTiles", c.fireRangeTiles);
    s.readNumber("suppressRangeTiles", c.suppressRangeTiles);
    s.readNumber("strikeRangeTiles", c.strikeRangeTiles);
    s.readNumber("meleeAdjacencyTiles", c.meleeAdjacencyTiles);
    s.readNumber("coverSearchRadiusTiles", c.coverSearchRadiusTiles);
    s.readNumber("coverPlayerDistanceWeight", c.coverPlayerDistanceWeight);
    s.readNumber("fireBaseChance", c.fireBaseChance);
    s.readNumber("strikeBaseChance", c.strikeBaseChance);
    s.readNumber("suppressBaseChance", c.suppressBaseChance);
    s.readNumber("rangedFreeRangeTiles", c.rangedFreeRangeTiles);
    s.readNumber("meleeFreeRangeTiles", c.meleeFreeRangeTiles);
    s.readNumber("rangedFalloffPerTile", c.rangedFalloffPerTile);
    s.readNumber("meleeFalloffPerTile", c.meleeFalloffPerTile);
    s.readNumber("halfCoverPenalty", c.halfCoverPenalty);
    s.readNumber("fullCoverPenalty", c.fullCoverPenalty);
    s.readNumber("suppressedPenalty", c.suppressedPenalty);
    s.readNumber("minHitChance", c.minHitChance);
    s.readNumber("maxHitChance", c.maxHitChance);
    s.readNumber("talkBaseChance", c.talkBaseChance);
    s.readNumber("talkInjuredTargetBonus", c.talkInjuredTargetBonus);
    s.readNumber("talkInjuredActorPenalty", c.talkInjuredActorPenalty);
    s.readNumber("minTalkChance", c.minTalkChance);
    s.readNumber("maxTalkChance", c.maxTalkChance);
    s.readNumber("halfCoverDefenseBonus", c.halfCoverDefenseBonus);
    s.readNumber("fullCoverDefenseBonus", c.fullCoverDefenseBonus);
    s.readNumber("maxMovementPenalty", c.maxMovementPenalty);
    s.readNumber("minMovementRangeTiles", c.minMovementRangeTiles);
    s.readNumber("playerDownedThreshold", c.playerDownedThreshold);
    s.readNumber("npcDownedThreshold", c.npcDownedThreshold);
}

} // namespace

bool SimulationConfig::applyJson(const JsonValue& root, std::string* errorOut) {
    auto fail = [errorOut](const std::string& message) {
        if (errorOut) {
            *errorOut = message;
        }
        CONFIG_ERROR(message);
        return false;
    };

    if (!root.isObject()) {
        return fail("Config document must be a JSON object");
    }

    const char* sections[] = {"alert", "patrol", "awareness", "combat", "simulation"};
    for (const char* name : sections) {
        if (root.hasKey(name) && !root[name].isObject()) {
            return fail(std::format("Config section '{}' must be an object", name));
        }
    }

    readAlert(root["alert"], alert);
    readPatrol(root["patrol"], patrol);
    readAwareness(root["awareness"], awareness);
    readCombat(root["combat"], combat);

    const JsonValue& sim = root["simulation"];
    sim.readNumber("playerRadius", playerRadius);
    sim.readNumber("playerSpeed", playerSpeed);
    sim.readNumber("maxTickDelta", maxTickDelta);
    sim.readNumber("startHour", startHour);
    sim.readNumber("gameHoursPerSecond", gameHoursPerSecond);
    if (auto s = sim["seed"].tryAsNumber()) {
        seed = static_cast<uint32_t>(*s);
    }

    if (combat.maxCombatants < 2) {
        CONFIG_WARN(std::format("maxCombatants {} too small, using 2", combat.maxCombatants));
        combat.maxCombatants = 2;
    }
    if (combat.maxRounds < 1) {
        CONFIG_WARN(std::format("maxRounds {} too small, using 1", combat.maxRounds));
        combat.maxRounds = 1;
    }
    if (maxTickDelta <= 0.0f) {
        CONFIG_WARN("maxTickDelta must be positive, using 0.1");
        maxTickDelta = 0.1f;
    }

    return true;
}

std::optional<SimulationConfig> SimulationConfig::loadFromFile(const std::string& path,
                                                               std::string* errorOut) {
    JsonReader reader;
    if (!reader.loadFromFile(path)) {
        std::string message = std::format("Failed to read config '{}': {}", path, reader.getLastError());
        if (errorOut) {
            *errorOut = message;
        }
        CONFIG_ERROR(message);
        return std::nullopt;
    }

    SimulationConfig config;
    if (!config.applyJson(reader.getRoot(), errorOut)) {
        return std::nullopt;
    }
    CONFIG_INFO(std::format("Loaded simulation config from {}", path));
    return config;
}

std::optional<SimulationConfig> SimulationConfig::loadFromString(const std::string& json,
                                                                 std::string* errorOut) {
    JsonReader reader;
    if (!reader.parse(json)) {
        std::string message = "Failed to parse config JSON: " + reader.getLastError();
        if (errorOut) {
            *errorOut = message;
        }
        CONFIG_ERROR(message);
        return std::nullopt;
    }

    SimulationConfig config;
    if (!config.applyJson(reader.getRoot(), errorOut)) {
        return std::nullopt;
    }
    return config;
}

} // namespace SentinelEngine
