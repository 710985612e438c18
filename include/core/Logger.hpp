/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <string>

namespace SentinelEngine {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs
  ERROR_LEVEL = 1,  // Always logs (renamed to avoid macro conflicts)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Full console logging in debug builds
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;
  static std::mutex s_logMutex;

public:
  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
      return;
    }

    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("Sentinel Engine - [%s] %s: %s\n", system, getLevelString(level),
           message);
    fflush(stdout);
  }

private:
  static const char *getLevelString(LogLevel level) {
    switch (level) {
    case LogLevel::CRITICAL:
      return "CRITICAL";
    case LogLevel::ERROR_LEVEL:
      return "ERROR";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::DEBUG_LEVEL:
      return "DEBUG";
    default:
      return "UNKNOWN";
    }
  }
};

#define SENTINEL_CRITICAL(system, msg)                                         \
  SentinelEngine::Logger::Log(SentinelEngine::LogLevel::CRITICAL, system, msg)
#define SENTINEL_ERROR(system, msg)                                            \
  SentinelEngine::Logger::Log(SentinelEngine::LogLevel::ERROR_LEVEL, system,   \
                              msg)
#define SENTINEL_WARN(system, msg)                                             \
  SentinelEngine::Logger::Log(SentinelEngine::LogLevel::WARNING, system, msg)
#define SENTINEL_INFO(system, msg)                                             \
  SentinelEngine::Logger::Log(SentinelEngine::LogLevel::INFO, system, msg)
#define SENTINEL_DEBUG(system, msg)                                            \
  SentinelEngine::Logger::Log(SentinelEngine::LogLevel::DEBUG_LEVEL, system,   \
                              msg)

#else
// Release builds: CRITICAL/ERROR go to a log file (see Logger.cpp),
// everything else compiles away
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;

public:
  static std::mutex s_logMutex; // Public for macro access

  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define SENTINEL_CRITICAL(system, msg)                                         \
  SentinelEngine::Logger::Log("CRITICAL", system, msg)

#define SENTINEL_ERROR(system, msg)                                            \
  SentinelEngine::Logger::Log("ERROR", system, msg)

#define SENTINEL_WARN(system, msg) ((void)0)  // Zero overhead
#define SENTINEL_INFO(system, msg) ((void)0)  // Zero overhead
#define SENTINEL_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Static member definitions - shared by both DEBUG and RELEASE builds
inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Convenience macros for each simulation subsystem

#define SIM_CRITICAL(msg) SENTINEL_CRITICAL("Simulation", msg)
#define SIM_ERROR(msg) SENTINEL_ERROR("Simulation", msg)
#define SIM_WARN(msg) SENTINEL_WARN("Simulation", msg)
#define SIM_INFO(msg) SENTINEL_INFO("Simulation", msg)
#define SIM_DEBUG(msg) SENTINEL_DEBUG("Simulation", msg)

#define CONFIG_CRITICAL(msg) SENTINEL_CRITICAL("SimulationConfig", msg)
#define CONFIG_ERROR(msg) SENTINEL_ERROR("SimulationConfig", msg)
#define CONFIG_WARN(msg) SENTINEL_WARN("SimulationConfig", msg)
#define CONFIG_INFO(msg) SENTINEL_INFO("SimulationConfig", msg)
#define CONFIG_DEBUG(msg) SENTINEL_DEBUG("SimulationConfig", msg)

#define WORLD_CRITICAL(msg) SENTINEL_CRITICAL("MapLoader", msg)
#define WORLD_ERROR(msg) SENTINEL_ERROR("MapLoader", msg)
#define WORLD_WARN(msg) SENTINEL_WARN("MapLoader", msg)
#define WORLD_INFO(msg) SENTINEL_INFO("MapLoader", msg)
#define WORLD_DEBUG(msg) SENTINEL_DEBUG("MapLoader", msg)

#define COLLISION_CRITICAL(msg) SENTINEL_CRITICAL("TileCollision", msg)
#define COLLISION_ERROR(msg) SENTINEL_ERROR("TileCollision", msg)
#define COLLISION_WARN(msg) SENTINEL_WARN("TileCollision", msg)
#define COLLISION_INFO(msg) SENTINEL_INFO("TileCollision", msg)
#define COLLISION_DEBUG(msg) SENTINEL_DEBUG("TileCollision", msg)

// NPC perception and movement
#define ALERT_CRITICAL(msg) SENTINEL_CRITICAL("AlertSystem", msg)
#define ALERT_ERROR(msg) SENTINEL_ERROR("AlertSystem", msg)
#define ALERT_WARN(msg) SENTINEL_WARN("AlertSystem", msg)
#define ALERT_INFO(msg) SENTINEL_INFO("AlertSystem", msg)
#define ALERT_DEBUG(msg) SENTINEL_DEBUG("AlertSystem", msg)

#define PATROL_CRITICAL(msg) SENTINEL_CRITICAL("PatrolController", msg)
#define PATROL_ERROR(msg) SENTINEL_ERROR("PatrolController", msg)
#define PATROL_WARN(msg) SENTINEL_WARN("PatrolController", msg)
#define PATROL_INFO(msg) SENTINEL_INFO("PatrolController", msg)
#define PATROL_DEBUG(msg) SENTINEL_DEBUG("PatrolController", msg)

#define AWARENESS_CRITICAL(msg) SENTINEL_CRITICAL("AwarenessController", msg)
#define AWARENESS_ERROR(msg) SENTINEL_ERROR("AwarenessController", msg)
#define AWARENESS_WARN(msg) SENTINEL_WARN("AwarenessController", msg)
#define AWARENESS_INFO(msg) SENTINEL_INFO("AwarenessController", msg)
#define AWARENESS_DEBUG(msg) SENTINEL_DEBUG("AwarenessController", msg)

// Tactical combat
#define COMBAT_CRITICAL(msg) SENTINEL_CRITICAL("CombatController", msg)
#define COMBAT_ERROR(msg) SENTINEL_ERROR("CombatController", msg)
#define COMBAT_WARN(msg) SENTINEL_WARN("CombatController", msg)
#define COMBAT_INFO(msg) SENTINEL_INFO("CombatController", msg)
#define COMBAT_DEBUG(msg) SENTINEL_DEBUG("CombatController", msg)

// Benchmark mode convenience macros
#define SENTINEL_ENABLE_BENCHMARK_MODE()                                       \
  SentinelEngine::Logger::SetBenchmarkMode(true)
#define SENTINEL_DISABLE_BENCHMARK_MODE()                                      \
  SentinelEngine::Logger::SetBenchmarkMode(false)

} // namespace SentinelEngine

#endif // LOGGER_HPP
