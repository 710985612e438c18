/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef COMBAT_CONFIG_HPP
#define COMBAT_CONFIG_HPP

namespace SentinelEngine
{

/**
 * Configuration for the turn-based combat rules and CombatController.
 *
 * Distances are in tiles unless noted; chances are probabilities in [0, 1].
 */
struct CombatConfig
{
    // Roster and pacing
    int maxCombatants = 6;                        // Player included
    float encounterCooldown = 2.0f;               // Seconds after an encounter before another can start
    int maxRounds = 30;                           // Remaining NPCs disengage when reached

    // Ranges (tiles)
    float moveRangeTiles = 3.0f;
    float fireRangeTiles = 8.0f;
    float suppressRangeTiles = 6.0f;
    float strikeRangeTiles = 1.6f;
    float meleeAdjacencyTiles = 1.2f;             // NPCs strike instead of fire inside this

    // Cover seeking
    float coverSearchRadiusTiles = 6.0f;
    float coverPlayerDistanceWeight = 0.2f;       // Score = dNpc - weight * dPlayer

    // Hit chance
    float fireBaseChance = 0.6f;
    float strikeBaseChance = 0.75f;
    float suppressBaseChance = 0.5f;
    float rangedFreeRangeTiles = 3.0f;
    float meleeFreeRangeTiles = 1.0f;
    float rangedFalloffPerTile = 0.05f;
    float meleeFalloffPerTile = 0.2f;
    float halfCoverPenalty = 0.15f;
    float fullCoverPenalty = 0.30f;
    float suppressedPenalty = 0.2f;
    float minHitChance = 0.10f;
    float maxHitChance = 0.90f;

    // Talk
    float talkBaseChance = 0.25f;
    float talkInjuredTargetBonus = 0.15f;
    float talkInjuredActorPenalty = 0.10f;
    float minTalkChance = 0.05f;
    float maxTalkChance = 0.60f;

    // Interact (take cover)
    float halfCoverDefenseBonus = 0.1f;
    float fullCoverDefenseBonus = 0.2f;

    // Movement
    float maxMovementPenalty = 0.6f;
    float minMovementRangeTiles = 1.5f;
    float movementRadiusFraction = 1.0f / 3.0f;   // Combat collision radius as a fraction of tile size

    // Injuries
    int playerDownedThreshold = 3;
    int npcDownedThreshold = 2;
};

} // namespace SentinelEngine

#endif // COMBAT_CONFIG_HPP
