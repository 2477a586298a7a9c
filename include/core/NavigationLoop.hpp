/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef NAVIGATION_LOOP_HPP
#define NAVIGATION_LOOP_HPP

#include "ai/ExplorationAdvisor.hpp"
#include "ai/OutcomeClassifier.hpp"
#include "ai/TraversalUpdater.hpp"
#include "ai/pathfinding/AreaPathfinder.hpp"
#include "core/Collaborators.hpp"
#include "core/NavigationConfig.hpp"
#include "core/SettleWaiter.hpp"
#include "managers/AreaMapManager.hpp"
#include "world/ActiveArea.hpp"
#include "world/ConnectivityGraph.hpp"
#include "world/ObservationMerger.hpp"
#include <cstdint>
#include <deque>
#include <optional>
#include <ostream>

namespace Wayfarer {

enum class CycleStatus { COMPLETED, ABORTED, POSITION_INVALID, EXECUTE_FAILED };

inline std::ostream& operator<<(std::ostream& os, const CycleStatus& status) {
    switch (status) {
        case CycleStatus::COMPLETED: return os << "COMPLETED";
        case CycleStatus::ABORTED: return os << "ABORTED";
        case CycleStatus::POSITION_INVALID: return os << "POSITION_INVALID";
        case CycleStatus::EXECUTE_FAILED: return os << "EXECUTE_FAILED";
        default: return os << "UNKNOWN";
    }
}

struct CycleReport {
    uint64_t cycle{0};
    CycleStatus status{CycleStatus::COMPLETED};
    Action action{Action::Wait};
    std::optional<MergeResult> merge;        // empty when no observation was available
    std::optional<SettleResult> settle;
    std::optional<ActionOutcome> outcome;
    UpdateReport update;
    bool scriptedAreaChange{false};
};

struct DecisionRecord {
    uint64_t cycle{0};
    Action action{Action::Wait};
    OutcomeKind outcome{OutcomeKind::UNKNOWN};
    AreaId area;
    Coordinate position;
};

/**
 * @brief Runs the observe, decide, act, settle, classify, update cycle.
 *
 * Owns all navigation state; nothing here is shared with other threads.
 * One cycle runs to completion before the next starts. Persistence
 * failures are logged and never stop the loop.
 */
class NavigationLoop {
public:
    NavigationLoop(const NavigationConfig& config, IPositionSource& position,
                   IVisionSource& vision, IActionExecutor& executor, IDecisionSource& decision);

    NavigationLoop(const NavigationLoop&) = delete;
    NavigationLoop& operator=(const NavigationLoop&) = delete;

    /**
     * @brief Loads the saved connection graph and binds the current area.
     * @return false if the agent position cannot be read
     */
    bool start();

    CycleReport runCycle();

    // Runs up to maxCycles; returns how many completed without abort
    size_t run(size_t maxCycles);

    // Saves every map and the connection graph
    bool shutdown();

    PathfindingResult planTo(const Coordinate& goal, MovementPlan& outPlan);
    PathfindingResult planToArea(const AreaId& target, MovementPlan& outPlan,
                                 std::vector<AreaId>* outRoute = nullptr);

    const ActiveArea& activeArea() const { return m_active; }
    const ConnectivityGraph& graph() const { return m_graph; }
    AreaMapManager& maps() { return m_maps; }
    const ExplorationAdvisor& advisor() const { return m_advisor; }
    AreaPathfinder& pathfinder() { return m_pathfinder; }
    const std::deque<DecisionRecord>& decisionLog() const { return m_decisionLog; }
    uint64_t cycleCount() const { return m_cycle; }
    bool isStarted() const { return m_started; }

private:
    // True when the previous cycle was a step that ended on the tile we still stand on
    bool steppedOntoLastTile() const;
    void handleScriptedAreaChange(const AgentSnapshot& now, CycleReport& report);
    void remember(const CycleReport& report, const AgentSnapshot& snapshot);
    void periodicSave();

    NavigationConfig m_config;
    IPositionSource& m_position;
    IVisionSource& m_vision;
    IActionExecutor& m_executor;
    IDecisionSource& m_decision;

    AreaMapManager m_maps;
    ConnectivityGraph m_graph;
    ObservationMerger m_merger;
    TraversalUpdater m_updater;
    ExplorationAdvisor m_advisor;
    AreaPathfinder m_pathfinder;
    SettleWaiter m_settle;
    ActiveArea m_active;

    AgentSnapshot m_lastSnapshot;
    std::optional<ActionOutcome> m_lastOutcome;
    std::deque<DecisionRecord> m_decisionLog;
    uint64_t m_cycle{0};
    bool m_started{false};
};

} // namespace Wayfarer

#endif // NAVIGATION_LOOP_HPP
