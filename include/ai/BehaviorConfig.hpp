/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef BEHAVIOR_CONFIG_HPP
#define BEHAVIOR_CONFIG_HPP

namespace SentinelEngine
{

/**
 * Configuration for AlertSystem
 *
 * Controls how quickly NPCs notice the player and how far alert escalates.
 */
struct AlertConfig
{
    // Detection
    float detectionRange = 128.0f;                // Base sight distance in px (4 tiles)
    float nightRangeMultiplier = 0.7f;            // Applied to detectionRange in low light
    float detectionConeAngle = 1.5707963f;        // Full cone width in radians (90 degrees)

    // Alert level dynamics (level is 0-100)
    float buildRate = 60.0f;                      // Level gained per second while visible
    float decayRate = 20.0f;                      // Level lost per second while not visible

    // Thresholds
    float investigateThreshold = 50.0f;           // patrolling -> investigating
    float combatThreshold = 90.0f;                // investigating -> combat
    float investigationDuration = 5.0f;           // Seconds of not-visible time before giving up
};

/**
 * Configuration for PatrolBehavior
 *
 * Controls waypoint movement and the per-faction dwell timings.
 */
struct PatrolBehaviorConfig
{
    // Movement parameters
    float moveSpeed = 240.0f;                     // Px/s when walking a route
    float investigateSpeedMultiplier = 1.5f;      // Run when heading to an investigation target
    float wanderSpeedMultiplier = 0.7f;           // Wander strategy walks slower
    float entityRadius = 10.0f;                   // NPC collision radius in px

    // Waypoint parameters
    float waypointReachedRadius = 4.0f;           // Distance to consider waypoint reached

    // Dwell times (seconds)
    float simpleWait = 1.0f;
    float sweepWait = 2.0f;                       // Longer stops for inspection
    float wanderWaitMin = 0.5f;
    float wanderWaitSpread = 2.0f;                // Added uniformly in [0, spread)
    float staticWatchWait = 5.0f;                 // Time spent at each teleport node

    // Wander anchor offset, in tiles either side of the node
    float wanderOffsetTiles = 3.0f;
};

/**
 * Configuration for AwarenessTracker
 *
 * Ambient (non-hostile) awareness: glances, small shifts and flinches.
 */
struct AwarenessConfig
{
    float awareThreshold = 3.0f;                  // Seconds of proximity before an NPC is aware
    float proximityDecayMultiplier = 1.5f;        // Proximity drains faster than it builds
    float lingerThreshold = 10.0f;                // Default seconds of lingering before a shift
    float idleLingerGate = 5.0f;                  // Player idle seconds before lingering counts
    float interactionRange = 48.0f;               // Px; scales linger and flee ranges

    // Glance
    float glanceDuration = 0.65f;
    float glanceIntervalMin = 2.8f;
    float glanceIntervalSpread = 1.8f;

    // Shift (step away after lingering)
    float shiftCooldown = 6.0f;
    float shiftDuration = 1.4f;
    float shiftMagnitude = 3.0f;                  // Px

    // Flee on approach
    float fleeRangeFactor = 0.8f;                 // Of interactionRange
    float fleeCooldown = 4.5f;
    float fleeDuration = 1.1f;
    float fleeMagnitude = 18.0f;                  // Px
};

} // namespace SentinelEngine

#endif // BEHAVIOR_CONFIG_HPP
