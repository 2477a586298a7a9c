/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/ExplorationAdvisor.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <array>
#include <format>

namespace Wayfarer {

namespace {
constexpr std::array<Direction, 4> SCAN_ORDER{Direction::Up, Direction::Down, Direction::Left,
                                              Direction::Right};
}

PositionHistory::PositionHistory(const AdvisorConfig& config) : m_config(config) {
    m_config.historyCapacity = std::max<size_t>(1, m_config.historyCapacity);
    m_config.stuckWindow = std::clamp<size_t>(m_config.stuckWindow, 1, m_config.historyCapacity);
}

size_t PositionHistory::distinctInWindow() const {
    const size_t window = std::min(m_config.stuckWindow, m_samples.size());
    std::vector<PositionSample> distinct;
    distinct.reserve(window);
    for (auto it = m_samples.end() - static_cast<std::ptrdiff_t>(window); it != m_samples.end();
         ++it) {
        if (std::find(distinct.begin(), distinct.end(), *it) == distinct.end()) {
            distinct.push_back(*it);
        }
    }
    return distinct.size();
}

void PositionHistory::record(const AreaId& area, const Coordinate& position) {
    m_samples.push_back({area, position});
    while (m_samples.size() > m_config.historyCapacity) {
        m_samples.pop_front();
    }
    m_visited[area].insert(position);

    if (m_samples.size() < m_config.stuckMinSamples) {
        return;
    }

    const bool wasStuck = isStuck();
    if (distinctInWindow() <= m_config.stuckDistinctMax) {
        // Capped so a long stall does not take equally long to recover from
        m_stuckCounter = std::min(m_stuckCounter + 1, m_config.stuckLimit * 2);
    } else if (m_stuckCounter > 0) {
        --m_stuckCounter;
    }

    if (isStuck() != wasStuck) {
        EXPLORE_INFO(std::format("Agent {} stuck at {},{} in {}", isStuck() ? "is" : "no longer",
                                 position.x, position.y, area.toKey()));
    }
}

bool PositionHistory::hasVisited(const AreaId& area, const Coordinate& position) const {
    auto it = m_visited.find(area);
    return it != m_visited.end() && it->second.count(position) > 0;
}

size_t PositionHistory::visitedCount(const AreaId& area) const {
    auto it = m_visited.find(area);
    return it != m_visited.end() ? it->second.size() : 0;
}

void PositionHistory::clear() {
    m_samples.clear();
    m_visited.clear();
    m_stuckCounter = 0;
}

ExplorationAdvisor::ExplorationAdvisor(const AdvisorConfig& config)
    : m_config(config), m_history(config) {
    m_config.scanRadius = std::max(1, m_config.scanRadius);
}

void ExplorationAdvisor::recordPosition(const AreaId& area, const Coordinate& position) {
    m_history.record(area, position);
}

Direction ExplorationAdvisor::pickFresh(const std::vector<DirectionProbe>& probes,
                                        const AreaId& area, const Coordinate& agent) const {
    // Nearest first; among equals prefer a neighbor the agent has not stood on
    const DirectionProbe* best = nullptr;
    bool bestFresh = false;
    for (const auto& probe : probes) {
        const bool fresh = !m_history.hasVisited(area, step(agent, probe.direction));
        if (best == nullptr || probe.distance < best->distance ||
            (probe.distance == best->distance && fresh && !bestFresh)) {
            best = &probe;
            bestFresh = fresh;
        }
    }
    return best != nullptr ? best->direction : Direction::None;
}

ExplorationSuggestion ExplorationAdvisor::suggest(const AreaMap& map,
                                                  const Coordinate& agent) const {
    ExplorationSuggestion s;
    s.stuck = m_history.isStuck();

    for (Direction d : SCAN_ORDER) {
        bool unexploredFound = false;
        bool transitionFound = false;
        Coordinate c = agent;
        for (int r = 1; r <= m_config.scanRadius; ++r) {
            c = step(c, d);
            const TraversalStatus status = map.statusAt(c);
            if (isImpassable(status)) {
                break;
            }
            if (status == TraversalStatus::Unknown && !unexploredFound) {
                s.unexplored.push_back({d, r});
                unexploredFound = true;
            } else if (status == TraversalStatus::TransitionEdge && !transitionFound) {
                s.transitions.push_back({d, r});
                transitionFound = true;
            }
            if (r == 1 && (status == TraversalStatus::Walkable || status == TraversalStatus::Ledge ||
                           status == TraversalStatus::TransitionEdge)) {
                s.walkable.push_back({d, 1});
            }
        }
    }

    if (!s.stuck && !s.unexplored.empty()) {
        s.direction = pickFresh(s.unexplored, map.id(), agent);
        s.reason = SuggestionReason::UNEXPLORED;
    } else if (!s.transitions.empty()) {
        s.direction = pickFresh(s.transitions, map.id(), agent);
        s.reason = SuggestionReason::TRANSITION;
    } else if (!s.walkable.empty()) {
        s.direction = pickFresh(s.walkable, map.id(), agent);
        s.reason = SuggestionReason::WALKABLE;
    }

    EXPLORE_DEBUG(std::format("Suggest {} ({} unexplored, {} transitions, {} walkable{})",
                              toString(s.direction), s.unexplored.size(), s.transitions.size(),
                              s.walkable.size(), s.stuck ? ", stuck" : ""));
    return s;
}

} // namespace Wayfarer
