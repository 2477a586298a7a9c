/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/NavigationLoop.hpp"
#include "core/Logger.hpp"
#include <format>

namespace Wayfarer {

NavigationLoop::NavigationLoop(const NavigationConfig& config, IPositionSource& position,
                               IVisionSource& vision, IActionExecutor& executor,
                               IDecisionSource& decision)
    : m_config(config),
      m_position(position),
      m_vision(vision),
      m_executor(executor),
      m_decision(decision),
      m_maps(config.persistence.dataDirectory),
      m_merger(config.merge),
      m_updater(m_maps, m_graph),
      m_advisor(config.advisor),
      m_pathfinder(config.pathfinder),
      m_settle(config.settle) {}

bool NavigationLoop::start() {
    if (m_started) {
        return true;
    }
    AgentSnapshot snap = m_position.poll();
    if (!snap.valid) {
        NAVLOOP_ERROR("Cannot start, agent position unreadable");
        return false;
    }

    if (!m_maps.loadGraph(m_graph)) {
        NAVLOOP_INFO("Starting with an empty connection graph");
    }
    m_updater.enterArea(m_active, snap.area, snap.areaName, snap.position);
    m_lastSnapshot = snap;
    m_started = true;
    NAVLOOP_INFO(std::format("Started in {} '{}' at {},{}", snap.area.toKey(), snap.areaName,
                             snap.position.x, snap.position.y));
    return true;
}

bool NavigationLoop::steppedOntoLastTile() const {
    if (!m_lastOutcome || !(m_lastSnapshot.area == m_active.id())) {
        return false;
    }
    const auto* moved = std::get_if<Outcome::Moved>(&*m_lastOutcome);
    return moved != nullptr && moved->to == m_lastSnapshot.position;
}

void NavigationLoop::handleScriptedAreaChange(const AgentSnapshot& now, CycleReport& report) {
    // The game moved the agent without an input of ours (late warp, blackout, fly)
    if (steppedOntoLastTile()) {
        // A warp tile that fired after the step had settled: the tile is a real exit
        ActionOutcome outcome =
            OutcomeClassifier::classify({Action::Wait, m_lastSnapshot, now, false});
        report.update = m_updater.apply(m_active, outcome);
    } else {
        // Nothing in the old area leads here, so record the visit without an edge
        m_updater.enterArea(m_active, now.area, now.areaName, now.position);
    }
    report.scriptedAreaChange = true;
    NAVLOOP_INFO(std::format("Area changed outside an action: now {}", now.area.toKey()));
}

CycleReport NavigationLoop::runCycle() {
    CycleReport report;
    report.cycle = ++m_cycle;

    if (!m_started && !start()) {
        report.status = CycleStatus::POSITION_INVALID;
        return report;
    }

    const AgentSnapshot before = m_position.poll();
    if (!before.valid) {
        NAVLOOP_WARN(std::format("Cycle {}: agent position unreadable, skipping", m_cycle));
        report.status = CycleStatus::POSITION_INVALID;
        return report;
    }
    if (!isNavigable(before.mode)) {
        report.status = CycleStatus::ABORTED;
        m_lastOutcome.reset();
        m_lastSnapshot = before;
        return report;
    }
    if (!(before.area == m_active.id())) {
        handleScriptedAreaChange(before, report);
    }

    if (auto observation = m_vision.captureObservation()) {
        report.merge = m_merger.merge(*m_active, *observation, before.position);
    } else {
        NAVLOOP_DEBUG("No observation this cycle");
    }
    if (report.merge != MergeResult::MERGED) {
        // Nothing merged, so the marker has to be moved by hand
        m_active->setPlayer(before.position);
    }

    m_advisor.recordPosition(before.area, before.position);

    DecisionContext context;
    context.cycle = m_cycle;
    context.agent = before;
    context.area = m_active->summary();
    context.window =
        m_active->window(before.position, m_config.loop.windowHalfRows, m_config.loop.windowHalfCols);
    context.suggestion = m_advisor.suggest(*m_active, before.position);
    context.connections = m_graph.connectionsFrom(before.area);
    context.lastOutcome = m_lastOutcome;
    context.stuck = m_advisor.isStuck();

    report.action = m_decision.decide(context);
    if (!m_executor.execute(report.action)) {
        NAVLOOP_ERROR(std::format("Cycle {}: input {} was not delivered", m_cycle,
                                  toString(report.action)));
        report.status = CycleStatus::EXECUTE_FAILED;
        m_lastSnapshot = before;
        return report;
    }

    const bool watchDialogue = isDirectional(report.action) || report.action == Action::A;
    SettleReport settled = m_settle.wait(m_position, before, watchDialogue);
    report.settle = settled.result;
    if (settled.result == SettleResult::INTERRUPTED) {
        // Nothing was classified yet, so there is nothing to roll back
        NAVLOOP_INFO(std::format("Cycle {} aborted: {}", m_cycle,
                                 settled.snapshot.mode == AgentMode::Battle ? "battle" : "menu"));
        report.status = CycleStatus::ABORTED;
        m_lastOutcome.reset();
        m_lastSnapshot = settled.snapshot;
        return report;
    }

    ActionOutcome outcome = OutcomeClassifier::classify(
        {report.action, before, settled.snapshot, settled.dialogueBecameActive});
    report.update = m_updater.apply(m_active, outcome);
    report.outcome = outcome;
    NAVLOOP_DEBUG(std::format("Cycle {}: {} -> {}", m_cycle, toString(report.action),
                              describe(outcome)));

    m_lastOutcome = std::move(outcome);
    remember(report, settled.snapshot.valid ? settled.snapshot : before);
    periodicSave();
    return report;
}

void NavigationLoop::remember(const CycleReport& report, const AgentSnapshot& snapshot) {
    if (snapshot.valid) {
        m_lastSnapshot = snapshot;
    }
    DecisionRecord record;
    record.cycle = report.cycle;
    record.action = report.action;
    record.outcome = report.outcome ? kindOf(*report.outcome) : OutcomeKind::UNKNOWN;
    record.area = snapshot.area;
    record.position = snapshot.position;
    m_decisionLog.push_back(record);
    while (m_decisionLog.size() > m_config.loop.decisionLogSize) {
        m_decisionLog.pop_front();
    }
}

void NavigationLoop::periodicSave() {
    const int interval = m_config.persistence.saveIntervalCycles;
    if (interval <= 0 || m_cycle % static_cast<uint64_t>(interval) != 0) {
        return;
    }
    if (!m_maps.save(*m_active) || !m_maps.saveGraph(m_graph)) {
        NAVLOOP_WARN(std::format("Periodic save at cycle {} incomplete", m_cycle));
    }
}

size_t NavigationLoop::run(size_t maxCycles) {
    size_t completed = 0;
    for (size_t i = 0; i < maxCycles; ++i) {
        if (runCycle().status == CycleStatus::COMPLETED) {
            ++completed;
        }
    }
    return completed;
}

bool NavigationLoop::shutdown() {
    if (!m_started) {
        return true;
    }
    bool ok = m_maps.saveAll();
    ok = m_maps.saveGraph(m_graph) && ok;
    NAVLOOP_INFO(std::format("Shutdown after {} cycles, {} areas known", m_cycle,
                             m_maps.loadedCount()));
    return ok;
}

PathfindingResult NavigationLoop::planTo(const Coordinate& goal, MovementPlan& outPlan) {
    if (!m_started && !start()) {
        return PathfindingResult::INVALID_START;
    }
    const AgentSnapshot& agent = m_lastSnapshot;
    return m_pathfinder.findPlan(*m_active, agent.position, agent.facing, goal, outPlan);
}

PathfindingResult NavigationLoop::planToArea(const AreaId& target, MovementPlan& outPlan,
                                             std::vector<AreaId>* outRoute) {
    if (!m_started && !start()) {
        return PathfindingResult::INVALID_START;
    }
    const AgentSnapshot& agent = m_lastSnapshot;
    return m_pathfinder.planToArea(m_graph, *m_active, agent.position, agent.facing, target,
                                   outPlan, outRoute);
}

} // namespace Wayfarer
