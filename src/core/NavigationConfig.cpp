/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/NavigationConfig.hpp"
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"
#include <boost/algorithm/string/join.hpp>
#include <format>

namespace Wayfarer {

namespace {
int positiveOr(const SettingsManager& s, const char* category, const char* key, int fallback) {
    int value = s.get<int>(category, key, fallback);
    if (value <= 0) {
        SETTINGS_WARNING(std::format("{}.{} must be positive, using {}", category, key, fallback));
        return fallback;
    }
    return value;
}

int nonNegativeOr(const SettingsManager& s, const char* category, const char* key, int fallback) {
    int value = s.get<int>(category, key, fallback);
    if (value < 0) {
        SETTINGS_WARNING(std::format("{}.{} must not be negative, using {}", category, key, fallback));
        return fallback;
    }
    return value;
}
} // namespace

NavigationConfig NavigationConfig::fromSettings(const SettingsManager& s) {
    NavigationConfig c;

    ObservationShape shape;
    shape.rows = positiveOr(s, "observation", "rows", c.merge.shape.rows);
    shape.cols = positiveOr(s, "observation", "cols", c.merge.shape.cols);
    shape.agentRow = nonNegativeOr(s, "observation", "agent_row", c.merge.shape.agentRow);
    shape.agentCol = nonNegativeOr(s, "observation", "agent_col", c.merge.shape.agentCol);
    if (shape.isValid()) {
        c.merge.shape = shape;
    } else {
        SETTINGS_WARNING(std::format("Observation shape {}x{} with agent at {},{} is invalid, using defaults",
                                     shape.rows, shape.cols, shape.agentRow, shape.agentCol));
    }

    std::vector<std::string> defaultSolid(c.merge.solidLabels.begin(), c.merge.solidLabels.end());
    auto solid = s.getList("merge", "solid_labels", defaultSolid);
    c.merge.solidLabels = std::set<std::string>(solid.begin(), solid.end());
    c.merge.keepNegativeCoordinates =
        s.get<bool>("merge", "keep_negative_coordinates", c.merge.keepNegativeCoordinates);

    c.pathfinder.unknownPenalty =
        s.get<float>("pathfinding", "unknown_penalty", c.pathfinder.unknownPenalty);
    if (c.pathfinder.unknownPenalty < 0.0f) {
        SETTINGS_WARNING("pathfinding.unknown_penalty must not be negative, using 0.1");
        c.pathfinder.unknownPenalty = 0.1f;
    }
    c.pathfinder.searchMargin =
        nonNegativeOr(s, "pathfinding", "search_margin", c.pathfinder.searchMargin);
    c.pathfinder.maxIterations =
        positiveOr(s, "pathfinding", "max_iterations", c.pathfinder.maxIterations);

    c.advisor.historyCapacity = static_cast<size_t>(
        positiveOr(s, "explore", "history_capacity", static_cast<int>(c.advisor.historyCapacity)));
    c.advisor.stuckWindow = static_cast<size_t>(
        positiveOr(s, "explore", "stuck_window", static_cast<int>(c.advisor.stuckWindow)));
    c.advisor.stuckDistinctMax = static_cast<size_t>(
        positiveOr(s, "explore", "stuck_distinct_max", static_cast<int>(c.advisor.stuckDistinctMax)));
    c.advisor.stuckLimit = positiveOr(s, "explore", "stuck_limit", c.advisor.stuckLimit);
    c.advisor.stuckMinSamples = static_cast<size_t>(
        positiveOr(s, "explore", "stuck_min_samples", static_cast<int>(c.advisor.stuckMinSamples)));
    c.advisor.scanRadius = positiveOr(s, "explore", "scan_radius", c.advisor.scanRadius);

    c.settle.minSettleMs = static_cast<uint32_t>(
        nonNegativeOr(s, "settle", "min_settle_ms", static_cast<int>(c.settle.minSettleMs)));
    c.settle.timeoutMs = static_cast<uint32_t>(
        positiveOr(s, "settle", "timeout_ms", static_cast<int>(c.settle.timeoutMs)));
    c.settle.pollIntervalMs = static_cast<uint32_t>(
        nonNegativeOr(s, "settle", "poll_interval_ms", static_cast<int>(c.settle.pollIntervalMs)));
    c.settle.stablePolls = positiveOr(s, "settle", "stable_polls", c.settle.stablePolls);
    c.settle.dialogueWatchPolls =
        nonNegativeOr(s, "settle", "dialogue_watch_polls", c.settle.dialogueWatchPolls);

    c.persistence.dataDirectory =
        s.get<std::string>("persistence", "data_dir", c.persistence.dataDirectory);
    c.persistence.saveIntervalCycles =
        nonNegativeOr(s, "persistence", "save_interval_cycles", c.persistence.saveIntervalCycles);

    c.loop.windowHalfRows = nonNegativeOr(s, "loop", "window_half_rows", c.loop.windowHalfRows);
    c.loop.windowHalfCols = nonNegativeOr(s, "loop", "window_half_cols", c.loop.windowHalfCols);
    c.loop.decisionLogSize = static_cast<size_t>(
        positiveOr(s, "loop", "decision_log_size", static_cast<int>(c.loop.decisionLogSize)));

    return c;
}

void NavigationConfig::storeTo(SettingsManager& s) const {
    s.set("observation", "rows", merge.shape.rows);
    s.set("observation", "cols", merge.shape.cols);
    s.set("observation", "agent_row", merge.shape.agentRow);
    s.set("observation", "agent_col", merge.shape.agentCol);
    s.set("merge", "solid_labels", boost::algorithm::join(merge.solidLabels, ","));
    s.set("merge", "keep_negative_coordinates", merge.keepNegativeCoordinates);

    s.set("pathfinding", "unknown_penalty", pathfinder.unknownPenalty);
    s.set("pathfinding", "search_margin", pathfinder.searchMargin);
    s.set("pathfinding", "max_iterations", pathfinder.maxIterations);

    s.set("explore", "history_capacity", static_cast<int>(advisor.historyCapacity));
    s.set("explore", "stuck_window", static_cast<int>(advisor.stuckWindow));
    s.set("explore", "stuck_distinct_max", static_cast<int>(advisor.stuckDistinctMax));
    s.set("explore", "stuck_limit", advisor.stuckLimit);
    s.set("explore", "stuck_min_samples", static_cast<int>(advisor.stuckMinSamples));
    s.set("explore", "scan_radius", advisor.scanRadius);

    s.set("settle", "min_settle_ms", static_cast<int>(settle.minSettleMs));
    s.set("settle", "timeout_ms", static_cast<int>(settle.timeoutMs));
    s.set("settle", "poll_interval_ms", static_cast<int>(settle.pollIntervalMs));
    s.set("settle", "stable_polls", settle.stablePolls);
    s.set("settle", "dialogue_watch_polls", settle.dialogueWatchPolls);

    s.set("persistence", "data_dir", persistence.dataDirectory);
    s.set("persistence", "save_interval_cycles", persistence.saveIntervalCycles);

    s.set("loop", "window_half_rows", loop.windowHalfRows);
    s.set("loop", "window_half_cols", loop.windowHalfCols);
    s.set("loop", "decision_log_size", static_cast<int>(loop.decisionLogSize));
}

} // namespace Wayfarer
