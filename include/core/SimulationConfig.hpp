/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIMULATION_CONFIG_HPP
#define SIMULATION_CONFIG_HPP

#include "ai/BehaviorConfig.hpp"
#include "combat/CombatConfig.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace SentinelEngine {

class JsonValue;

/**
 * @brief All tuning for one simulation context.
 *
 * Defaults reproduce the shipped game balance. A JSON document may override
 * any subset:
 * @code
 * {
 *   "alert":      { "detectionRange": 160, "buildRate": 45 },
 *   "patrol":     { "moveSpeed": 200 },
 *   "awareness":  { "awareThreshold": 2.5 },
 *   "combat":     { "maxRounds": 20, "fireRangeTiles": 10 },
 *   "simulation": { "playerSpeed": 260, "maxTickDelta": 0.05, "seed": 7, "startHour": 22 }
 * }
 * @endcode
 */
struct SimulationConfig
{
    AlertConfig alert{};
    PatrolBehaviorConfig patrol{};
    AwarenessConfig awareness{};
    CombatConfig combat{};

    float playerRadius = 10.0f;                   // Px
    float playerSpeed = 240.0f;                   // Px/s outside combat
    float maxTickDelta = 0.1f;                    // Seconds; longer ticks are clamped
    uint32_t seed = 1337;                         // Seeds every RNG in the context
    float startHour = 12.0f;                      // In-game clock at map load
    float gameHoursPerSecond = 0.0f;              // 0 = frozen clock

    /**
     * @brief Overlay values from a parsed JSON document
     * @return false if a section has the wrong type (values read so far are kept)
     */
    bool applyJson(const JsonValue& root, std::string* errorOut = nullptr);

    static std::optional<SimulationConfig> loadFromFile(const std::string& path,
                                                        std::string* errorOut = nullptr);
    static std::optional<SimulationConfig> loadFromString(const std::string& json,
                                                          std::string* errorOut = nullptr);
};

} // namespace SentinelEngine

#endif // SIMULATION_CONFIG_HPP
