/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

// Required includes for logging system:
// - string: Used in macro expansions for std::string() conversions
// - cstdio: Required for printf() and fflush() functions
// - mutex: Required for serialized console output
// - atomic: Required for std::atomic<bool> benchmark mode flag
#include <atomic>  // IWYU pragma: keep
#include <cstdint> // IWYU pragma: keep
#include <cstdio>  // IWYU pragma: keep
#include <mutex>   // IWYU pragma: keep
#include <string>  // IWYU pragma: keep

namespace Wayfarer {
enum class LogLevel : uint8_t {
  CRITICAL = 0,    // Always logs
  ERROR_LEVEL = 1, // Always logs (file in release)
  WARNING = 2,     // Debug only
  INFO = 3,        // Debug only
  DEBUG_LEVEL = 4  // Debug only
};

#ifdef DEBUG
// Console logging in debug builds
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
    printf("Wayfarer - [%s] %s: %s\n", system, getLevelString(level), message);
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

#define WAYFARER_CRITICAL(system, msg)                                         \
  Wayfarer::Logger::Log(Wayfarer::LogLevel::CRITICAL, system, msg)
#define WAYFARER_ERROR(system, msg)                                            \
  Wayfarer::Logger::Log(Wayfarer::LogLevel::ERROR_LEVEL, system, msg)
#define WAYFARER_WARN(system, msg)                                             \
  Wayfarer::Logger::Log(Wayfarer::LogLevel::WARNING, system, msg)
#define WAYFARER_INFO(system, msg)                                             \
  Wayfarer::Logger::Log(Wayfarer::LogLevel::INFO, system, msg)
#define WAYFARER_DEBUG(system, msg)                                            \
  Wayfarer::Logger::Log(Wayfarer::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds write CRITICAL and ERROR to a rotating file (Logger.cpp)
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;

public:
  static std::mutex s_logMutex;

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

#define WAYFARER_CRITICAL(system, msg)                                         \
  Wayfarer::Logger::Log("CRITICAL", system, msg)

#define WAYFARER_ERROR(system, msg) Wayfarer::Logger::Log("ERROR", system, msg)

#define WAYFARER_WARN(system, msg) ((void)0)
#define WAYFARER_INFO(system, msg) ((void)0)
#define WAYFARER_DEBUG(system, msg) ((void)0)
#endif

inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Map building
#define AREAMAP_CRITICAL(msg) WAYFARER_CRITICAL("AreaMap", msg)
#define AREAMAP_ERROR(msg) WAYFARER_ERROR("AreaMap", msg)
#define AREAMAP_WARN(msg) WAYFARER_WARN("AreaMap", msg)
#define AREAMAP_INFO(msg) WAYFARER_INFO("AreaMap", msg)
#define AREAMAP_DEBUG(msg) WAYFARER_DEBUG("AreaMap", msg)

#define MERGE_ERROR(msg) WAYFARER_ERROR("ObservationMerger", msg)
#define MERGE_WARN(msg) WAYFARER_WARN("ObservationMerger", msg)
#define MERGE_INFO(msg) WAYFARER_INFO("ObservationMerger", msg)
#define MERGE_DEBUG(msg) WAYFARER_DEBUG("ObservationMerger", msg)

#define CONNECTIVITY_ERROR(msg) WAYFARER_ERROR("ConnectivityGraph", msg)
#define CONNECTIVITY_WARN(msg) WAYFARER_WARN("ConnectivityGraph", msg)
#define CONNECTIVITY_INFO(msg) WAYFARER_INFO("ConnectivityGraph", msg)
#define CONNECTIVITY_DEBUG(msg) WAYFARER_DEBUG("ConnectivityGraph", msg)

// Outcome handling
#define OUTCOME_WARN(msg) WAYFARER_WARN("OutcomeClassifier", msg)
#define OUTCOME_DEBUG(msg) WAYFARER_DEBUG("OutcomeClassifier", msg)

#define TRAVERSAL_ERROR(msg) WAYFARER_ERROR("TraversalUpdater", msg)
#define TRAVERSAL_WARN(msg) WAYFARER_WARN("TraversalUpdater", msg)
#define TRAVERSAL_INFO(msg) WAYFARER_INFO("TraversalUpdater", msg)
#define TRAVERSAL_DEBUG(msg) WAYFARER_DEBUG("TraversalUpdater", msg)

// Planning
#define PATHFIND_CRITICAL(msg) WAYFARER_CRITICAL("Pathfinding", msg)
#define PATHFIND_ERROR(msg) WAYFARER_ERROR("Pathfinding", msg)
#define PATHFIND_WARN(msg) WAYFARER_WARN("Pathfinding", msg)
#define PATHFIND_INFO(msg) WAYFARER_INFO("Pathfinding", msg)
#define PATHFIND_DEBUG(msg) WAYFARER_DEBUG("Pathfinding", msg)

#define EXPLORE_WARN(msg) WAYFARER_WARN("ExplorationAdvisor", msg)
#define EXPLORE_INFO(msg) WAYFARER_INFO("ExplorationAdvisor", msg)
#define EXPLORE_DEBUG(msg) WAYFARER_DEBUG("ExplorationAdvisor", msg)

// Core loop
#define SETTLE_WARN(msg) WAYFARER_WARN("SettleWaiter", msg)
#define SETTLE_DEBUG(msg) WAYFARER_DEBUG("SettleWaiter", msg)

#define NAVLOOP_CRITICAL(msg) WAYFARER_CRITICAL("NavigationLoop", msg)
#define NAVLOOP_ERROR(msg) WAYFARER_ERROR("NavigationLoop", msg)
#define NAVLOOP_WARN(msg) WAYFARER_WARN("NavigationLoop", msg)
#define NAVLOOP_INFO(msg) WAYFARER_INFO("NavigationLoop", msg)
#define NAVLOOP_DEBUG(msg) WAYFARER_DEBUG("NavigationLoop", msg)

// Managers
#define SAVE_CRITICAL(msg) WAYFARER_CRITICAL("AreaMapManager", msg)
#define SAVE_ERROR(msg) WAYFARER_ERROR("AreaMapManager", msg)
#define SAVE_WARN(msg) WAYFARER_WARN("AreaMapManager", msg)
#define SAVE_INFO(msg) WAYFARER_INFO("AreaMapManager", msg)
#define SAVE_DEBUG(msg) WAYFARER_DEBUG("AreaMapManager", msg)

#define SETTINGS_CRITICAL(msg) WAYFARER_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) WAYFARER_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) WAYFARER_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) WAYFARER_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) WAYFARER_DEBUG("SettingsManager", msg)

// Simulator
#define SIM_ERROR(msg) WAYFARER_ERROR("GridWorldSim", msg)
#define SIM_WARN(msg) WAYFARER_WARN("GridWorldSim", msg)
#define SIM_INFO(msg) WAYFARER_INFO("GridWorldSim", msg)
#define SIM_DEBUG(msg) WAYFARER_DEBUG("GridWorldSim", msg)

#define WAYFARER_ENABLE_BENCHMARK_MODE() Wayfarer::Logger::SetBenchmarkMode(true)
#define WAYFARER_DISABLE_BENCHMARK_MODE()                                      \
  Wayfarer::Logger::SetBenchmarkMode(false)

} // namespace Wayfarer

#endif // LOGGER_HPP
