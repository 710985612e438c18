/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "collisions/TileCollision.hpp"
#include "combat/CombatRules.hpp"
#include "controllers/combat/CombatController.hpp"
#include "core/Logger.hpp"
#include "core/PlayerState.hpp"
#include "core/SimulationConfig.hpp"
#include "core/SimulationContext.hpp"
#include "world/MapLoader.hpp"
#include <SDL3/SDL_timer.h>
#include <boost/container/flat_map.hpp>
#include <cstdio>
#include <cstdlib>
#include <format>
#include <limits>
#include <optional>
#include <string>

using namespace SentinelEngine;

namespace {

constexpr float TICK_RATE = 60.0f;
constexpr float DEFAULT_RUN_SECONDS = 120.0f;

// Fire at the closest enemy we can see in range, otherwise close the distance.
// Flee if there is nobody left to target.
void playPlayerTurn(const TileMap& map, CombatController& combat) {
  const Combatant* self = CombatRules::findPlayer(combat.getCombatants());
  if (!self) {
    combat.selectAction(CombatActionType::Flee);
    return;
  }
  const Vector2D selfPos = self->position;

  combat.clearSelection();
  combat.selectAction(CombatActionType::Fire);

  std::optional<std::string> shot;
  std::optional<Vector2D> approach;
  float shotDist = std::numeric_limits<float>::infinity();
  float approachDist = std::numeric_limits<float>::infinity();

  for (const auto& option : combat.getTargetOptions()) {
    const Combatant* target = CombatRules::findCombatant(combat.getCombatants(), option.id);
    if (!target) {
      continue;
    }
    if (option.distance < approachDist) {
      approachDist = option.distance;
      approach = target->position;
    }
    if (option.inRange && option.distance < shotDist &&
        TileCollision::hasLineOfSight(map, selfPos, target->position)) {
      shotDist = option.distance;
      shot = option.id;
    }
  }

  if (shot) {
    combat.selectTarget(*shot);
    return;
  }
  if (!approach) {
    combat.selectAction(CombatActionType::Flee);
    return;
  }

  combat.selectAction(CombatActionType::Move);
  if (!combat.mapClick(*approach)) {
    SIM_WARN("Move toward nearest enemy was rejected, fleeing");
    combat.selectAction(CombatActionType::Flee);
  }
}

} // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    std::fprintf(stderr, "Usage: %s <map.json> [config.json] [seconds]\n", argv[0]);
    return 1;
  }

  const std::string mapPath = argv[1];
  MapLoader loader;
  auto mapData = loader.loadFromFile(mapPath);
  if (!mapData) {
    SIM_CRITICAL(std::format("Failed to load map '{}': {}", mapPath, loader.getLastError()));
    return 1;
  }

  SimulationConfig config;
  if (argc >= 3) {
    std::string error;
    auto loaded = SimulationConfig::loadFromFile(argv[2], &error);
    if (!loaded) {
      SIM_CRITICAL(std::format("Failed to load config '{}': {}", argv[2], error));
      return 1;
    }
    config = *loaded;
  }

  float runSeconds = DEFAULT_RUN_SECONDS;
  if (argc >= 4) {
    char* end = nullptr;
    const float parsed = std::strtof(argv[3], &end);
    if (end == argv[3] || parsed <= 0.0f) {
      SIM_CRITICAL(std::format("Invalid run length '{}'", argv[3]));
      return 1;
    }
    runSeconds = parsed;
  }

  SimulationContext context(*mapData, config);
  CombatController& combat = context.getCombat();

  boost::container::flat_map<std::string, int> outcomeCounts;
  combat.setOutcomeCallback([&outcomeCounts](const CombatOutcome& outcome) {
    ++outcomeCounts[combatOutcomeName(outcome.outcome)];
    for (const auto& [faction, delta] : outcome.factionImpact) {
      SIM_INFO(std::format("  {} standing {:+}", faction, delta));
    }
  });

  const float dt = 1.0f / TICK_RATE;
  const uint64_t totalTicks = static_cast<uint64_t>(runSeconds * TICK_RATE);
  SIM_INFO(std::format("Running '{}' for {:.1f}s ({} ticks)", mapData->id, runSeconds, totalTicks));

  const uint64_t frequency = SDL_GetPerformanceFrequency();
  const uint64_t start = SDL_GetPerformanceCounter();

  for (uint64_t tick = 0; tick < totalTicks; ++tick) {
    switch (combat.getState()) {
      case CombatState::PlayerTurn:
        playPlayerTurn(context.getMap(), combat);
        break;
      case CombatState::Ended:
        combat.clearCombat();
        break;
      default:
        break;
    }
    context.tick(dt);
  }

  const uint64_t elapsed = SDL_GetPerformanceCounter() - start;
  const double wallMs = frequency > 0 ? static_cast<double>(elapsed) * 1000.0 / static_cast<double>(frequency) : 0.0;

  std::printf("%s: %.1f simulated seconds in %.2f ms (%.4f ms/tick)\n", mapData->id.c_str(),
              context.getElapsedSeconds(), wallMs,
              totalTicks > 0 ? wallMs / static_cast<double>(totalTicks) : 0.0);
  for (const auto& [name, count] : outcomeCounts) {
    std::printf("  %s: %d\n", name.c_str(), count);
  }
  const PlayerState& player = context.getPlayer();
  const auto& ledger = combat.getInjuryLedger();
  auto playerInjuries = ledger.find(PLAYER_COMBATANT_ID);
  std::printf("  player at (%.1f, %.1f), injuries on record: %zu\n", player.position.getX(),
              player.position.getY(), playerInjuries != ledger.end() ? playerInjuries->second.size() : size_t{0});

  return 0;
}
