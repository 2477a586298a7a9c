/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef NAVIGATION_CONFIG_HPP
#define NAVIGATION_CONFIG_HPP

#include "ai/ExplorationAdvisor.hpp"
#include "ai/pathfinding/AreaPathfinder.hpp"
#include "core/SettleWaiter.hpp"
#include "world/ObservationMerger.hpp"
#include <string>

namespace Wayfarer {

class SettingsManager;

struct PersistenceConfig {
    std::string dataDirectory;  // empty selects the SDL preference path
    int saveIntervalCycles{25};
};

struct LoopConfig {
    int windowHalfRows{4};
    int windowHalfCols{7};
    size_t decisionLogSize{50};
};

/**
 * @brief Every tunable of the engine, one struct per component.
 *
 * Defaults match a 9x15 vision window with the agent at row 4, column 7.
 */
struct NavigationConfig {
    MergeConfig merge;
    PathfinderConfig pathfinder;
    AdvisorConfig advisor;
    SettleConfig settle;
    PersistenceConfig persistence;
    LoopConfig loop;

    /**
     * @brief Reads overrides from the settings categories observation,
     *        merge, pathfinding, explore, settle, persistence and loop.
     *
     * Out-of-range values fall back to the defaults with a warning.
     */
    static NavigationConfig fromSettings(const SettingsManager& settings);

    // Writes every value back so a settings file can be generated
    void storeTo(SettingsManager& settings) const;
};

} // namespace Wayfarer

#endif // NAVIGATION_CONFIG_HPP
