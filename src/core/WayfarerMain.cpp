/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/Logger.hpp"
#include "core/NavigationConfig.hpp"
#include "core/NavigationLoop.hpp"
#include "managers/SettingsManager.hpp"
#include "sim/ExplorerPolicy.hpp"
#include "sim/GridWorldSim.hpp"
#include <SDL3/SDL.h>
#include <boost/lexical_cast/try_lexical_convert.hpp>
#include <cstdlib>
#include <format>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

const std::string APP_NAME{"wayfarer_sim"};
const std::string DEFAULT_SETTINGS{"res/settings.json"};

struct Options {
  size_t cycles{200};
  uint32_t seed{1};
  std::string settingsPath{DEFAULT_SETTINGS};
  std::string worldPath;
  std::string dataDir;
  std::vector<std::string> overrides;
  bool writeSettings{false};
  bool help{false};
};

void printUsage() {
  std::cout << "Usage: " << APP_NAME << " [options]\n"
            << "  --cycles N           navigation cycles to run (default 200)\n"
            << "  --seed N             seed for the fallback explorer choices\n"
            << "  --settings FILE      settings JSON (default " << DEFAULT_SETTINGS << ")\n"
            << "  --world FILE         world description, built-in demo if omitted\n"
            << "  --data-dir DIR       where area maps are saved\n"
            << "  --set CAT.KEY=VALUE  override one setting, repeatable\n"
            << "  --write-settings     save the effective settings back to the file\n"
            << "  --help               show this text\n";
}

bool parseArgs(int argc, char* argv[], Options& options) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    auto next = [&](std::string& out) {
      if (i + 1 >= argc) {
        std::cerr << arg << " needs a value\n";
        return false;
      }
      out = argv[++i];
      return true;
    };

    std::string value;
    if (arg == "--help" || arg == "-h") {
      options.help = true;
    } else if (arg == "--write-settings") {
      options.writeSettings = true;
    } else if (arg == "--cycles") {
      if (!next(value) || !boost::conversion::try_lexical_convert(value, options.cycles)) {
        std::cerr << "--cycles expects a number\n";
        return false;
      }
    } else if (arg == "--seed") {
      if (!next(value) || !boost::conversion::try_lexical_convert(value, options.seed)) {
        std::cerr << "--seed expects a number\n";
        return false;
      }
    } else if (arg == "--settings") {
      if (!next(options.settingsPath)) return false;
    } else if (arg == "--world") {
      if (!next(options.worldPath)) return false;
    } else if (arg == "--data-dir") {
      if (!next(options.dataDir)) return false;
    } else if (arg == "--set") {
      if (!next(value)) return false;
      options.overrides.push_back(value);
    } else {
      std::cerr << "Unknown option " << arg << "\n";
      return false;
    }
  }
  return true;
}

void printReport(Wayfarer::NavigationLoop& loop, const Wayfarer::GridWorldSim& world) {
  using namespace Wayfarer;

  std::cout << std::format("\n== {} cycles, {} areas mapped ==\n", loop.cycleCount(),
                           loop.maps().loadedCount());
  for (const auto& s : loop.maps().summaries()) {
    std::cout << std::format("{} '{}': {} known, {} walkable, {} blocked, {} transitions, "
                             "{} interactable, {} visits\n",
                             s.id.toKey(), s.displayName, s.knownTiles, s.walkableTiles,
                             s.blockedTiles, s.transitionTiles, s.interactableTiles,
                             s.visitCount);
  }

  std::cout << "\nConnections:\n";
  for (const auto& [id, area] : world.areas()) {
    for (const auto& c : loop.graph().connectionsFrom(id)) {
      std::ostringstream line;
      line << c;
      std::cout << "  " << line.str() << "\n";
    }
  }

  if (loop.activeArea().isSet()) {
    const AreaMap& map = *loop.activeArea();
    std::cout << std::format("\nAround the agent in {}:\n", map.id().toKey());
    std::cout << map.window(world.position(), 4, 7).render();

    for (const auto& [id, area] : world.areas()) {
      if (id == map.id()) continue;
      MovementPlan plan;
      std::vector<AreaId> route;
      PathfindingResult result = loop.planToArea(id, plan, &route);
      std::ostringstream status;
      status << result;
      std::cout << std::format("Plan to {}: {} ({} areas on route, {} steps)\n", id.toKey(),
                               status.str(), route.size(), plan.steps.size());
    }
  }

  const auto& stats = loop.pathfinder().getStats();
  std::cout << std::format("\nPathfinder: {} requests, {} searches, {} iterations\n",
                           stats.totalRequests, stats.searchesRun, stats.totalIterations);
}

} // namespace

int main(int argc, char* argv[]) {
  Options options;
  if (!parseArgs(argc, argv, options)) {
    printUsage();
    return EXIT_FAILURE;
  }
  if (options.help) {
    printUsage();
    return EXIT_SUCCESS;
  }

  if (!SDL_Init(0)) {
    SIM_ERROR(std::format("SDL init failed: {}", SDL_GetError()));
    return EXIT_FAILURE;
  }

  auto& settings = Wayfarer::SettingsManager::Instance();
  // The simulated game reacts instantly, so there is nothing to wait for
  settings.set("settle", "min_settle_ms", 0);
  settings.set("settle", "poll_interval_ms", 0);
  if (!settings.loadFromFile(options.settingsPath)) {
    SIM_WARN(std::format("No settings at {}, using defaults", options.settingsPath));
  }
  for (const auto& assignment : options.overrides) {
    if (!settings.applyOverride(assignment)) {
      std::cerr << "Bad --set value: " << assignment << "\n";
      SDL_Quit();
      return EXIT_FAILURE;
    }
  }
  if (!options.dataDir.empty()) {
    settings.set("persistence", "data_dir", options.dataDir);
  }

  const Wayfarer::NavigationConfig config = Wayfarer::NavigationConfig::fromSettings(settings);
  if (options.writeSettings) {
    config.storeTo(settings);
    if (!settings.saveToFile(options.settingsPath)) {
      SIM_WARN("Effective settings were not written");
    }
  }

  Wayfarer::GridWorldSim world(config.merge.shape);
  std::string error;
  bool loaded = false;
  if (options.worldPath.empty()) {
    std::istringstream demo(Wayfarer::GridWorldSim::demoWorldText());
    loaded = world.loadFromText(demo, error);
  } else {
    loaded = world.loadFromFile(options.worldPath, error);
  }
  if (!loaded) {
    SIM_ERROR("World not loaded: " + error);
    std::cerr << error << "\n";
    SDL_Quit();
    return EXIT_FAILURE;
  }

  Wayfarer::ExplorerPolicy policy(options.seed);
  int exitCode = EXIT_SUCCESS;
  try {
    Wayfarer::NavigationLoop loop(config, world, world, world, policy);
    if (!loop.start()) {
      SIM_ERROR("Navigation loop did not start");
      exitCode = EXIT_FAILURE;
    } else {
      const size_t completed = loop.run(options.cycles);
      SIM_INFO(std::format("{} of {} cycles completed", completed, options.cycles));
      printReport(loop, world);
      if (!loop.shutdown()) {
        SIM_WARN("Some maps were not saved");
      }
    }
  } catch (const std::exception& e) {
    SIM_ERROR(std::format("Simulation failed: {}", e.what()));
    exitCode = EXIT_FAILURE;
  }

  SDL_Quit();
  return exitCode;
}
