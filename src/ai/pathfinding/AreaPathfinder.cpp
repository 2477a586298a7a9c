/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/pathfinding/AreaPathfinder.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <format>

namespace Wayfarer {

namespace {
constexpr std::array<Direction, 4> CARDINALS{Direction::Up, Direction::Down, Direction::Left,
                                             Direction::Right};

bool isEnterable(TraversalStatus status) {
    return !isImpassable(status);
}
} // namespace

std::ostream& operator<<(std::ostream& os, const PlanStep& step) {
    return os << (step.type == PlanStep::Type::Turn ? "TURN " : "MOVE ") << step.direction;
}

size_t MovementPlan::moveCount() const {
    return static_cast<size_t>(std::count_if(steps.begin(), steps.end(), [](const PlanStep& s) {
        return s.type == PlanStep::Type::Move;
    }));
}

std::vector<Action> MovementPlan::toActions() const {
    std::vector<Action> actions;
    actions.reserve(steps.size());
    for (const auto& s : steps) {
        actions.push_back(toAction(s.direction));
    }
    return actions;
}

AreaPathfinder::AreaPathfinder(const PathfinderConfig& config) : m_config(config) {
    if (m_config.unknownPenalty < 0.0f) {
        PATHFIND_WARN("Negative unknown-tile penalty clamped to 0");
        m_config.unknownPenalty = 0.0f;
    }
    m_config.searchMargin = std::max(0, m_config.searchMargin);
    m_config.maxIterations = std::max(1, m_config.maxIterations);
}

float AreaPathfinder::stepCost(TraversalStatus status) const {
    switch (status) {
        case TraversalStatus::Unknown:
            return 1.0f + m_config.unknownPenalty;
        case TraversalStatus::Blocked:
        case TraversalStatus::Interactable:
            return std::numeric_limits<float>::infinity();
        default:
            return 1.0f;
    }
}

bool AreaPathfinder::hasEnterableNeighbor(const AreaMap& map, const Coordinate& goal) {
    for (Direction d : CARDINALS) {
        if (isEnterable(map.statusAt(step(goal, d)))) {
            return true;
        }
    }
    return false;
}

PathfindingResult AreaPathfinder::record(PathfindingResult result) {
    m_stats.totalRequests++;
    switch (result) {
        case PathfindingResult::SUCCESS: m_stats.successfulPaths++; break;
        case PathfindingResult::NO_PATH_FOUND: m_stats.noPathFound++; break;
        case PathfindingResult::GOAL_UNREACHABLE: m_stats.goalUnreachable++; break;
        case PathfindingResult::INVALID_START: m_stats.invalidStarts++; break;
        case PathfindingResult::TIMEOUT: m_stats.timeouts++; break;
    }
    return result;
}

PathfindingResult AreaPathfinder::findPlan(const AreaMap& map, const Coordinate& start,
                                           Direction facing, const Coordinate& goal,
                                           MovementPlan& outPlan) {
    outPlan.clear();
    outPlan.finalFacing = facing;

    if (isImpassable(map.statusAt(start))) {
        PATHFIND_ERROR(std::format("findPlan: INVALID_START - ({},{}) is {} in {}", start.x,
                                   start.y, toChar(map.statusAt(start)), map.id().toKey()));
        return record(PathfindingResult::INVALID_START);
    }

    if (start == goal) {
        outPlan.tiles.push_back(start);
        return record(PathfindingResult::SUCCESS);
    }

    // Nothing around the goal could ever be stood on, so no search can help
    if (!hasEnterableNeighbor(map, goal)) {
        PATHFIND_DEBUG(std::format("findPlan: goal ({},{}) has no enterable neighbor", goal.x,
                                   goal.y));
        return record(PathfindingResult::GOAL_UNREACHABLE);
    }

    std::vector<Coordinate> goals;
    const bool approach = isImpassable(map.statusAt(goal));
    if (approach) {
        for (Direction d : CARDINALS) {
            Coordinate n = step(goal, d);
            if (isEnterable(map.statusAt(n)) || n == start) {
                goals.push_back(n);
            }
        }
    } else {
        goals.push_back(goal);
    }

    std::vector<Coordinate> tiles;
    PathfindingResult result = search(map, start, goals, tiles);
    if (result != PathfindingResult::SUCCESS) {
        return record(result);
    }

    outPlan.tiles = std::move(tiles);
    outPlan.approach = approach;
    buildSteps(outPlan.tiles, facing, outPlan);
    if (approach) {
        Direction face = directionBetween(outPlan.tiles.back(), goal);
        if (face != outPlan.finalFacing) {
            outPlan.steps.push_back({PlanStep::Type::Turn, face});
            outPlan.finalFacing = face;
        }
    }
    return record(PathfindingResult::SUCCESS);
}

void AreaPathfinder::buildSteps(const std::vector<Coordinate>& tiles, Direction facing,
                                MovementPlan& plan) {
    Direction current = facing;
    for (size_t i = 1; i < tiles.size(); ++i) {
        Direction d = directionBetween(tiles[i - 1], tiles[i]);
        if (d != current) {
            plan.steps.push_back({PlanStep::Type::Turn, d});
            current = d;
        }
        plan.steps.push_back({PlanStep::Type::Move, d});
    }
    plan.finalFacing = current;
}

PathfindingResult AreaPathfinder::search(const AreaMap& map, const Coordinate& start,
                                         const std::vector<Coordinate>& goals,
                                         std::vector<Coordinate>& outTiles) {
    outTiles.clear();
    if (goals.empty()) {
        return PathfindingResult::NO_PATH_FOUND;
    }
    for (const auto& g : goals) {
        if (g == start) {
            outTiles.push_back(start);
            return PathfindingResult::SUCCESS;
        }
    }
    m_stats.searchesRun++;

    // Search region: what we know plus a margin of optimistic unknown
    GridBounds region = map.traversal().bounds().expanded(m_config.searchMargin);
    region.include(start);
    for (const auto& g : goals) {
        region.include(g);
    }
    const int W = region.width();
    const int H = region.height();
    const size_t cells = static_cast<size_t>(W) * static_cast<size_t>(H);

    auto idx = [&](int x, int y) { return (y - region.minY) * W + (x - region.minX); };
    auto h = [&](int x, int y) {
        int best = std::numeric_limits<int>::max();
        for (const auto& g : goals) {
            best = std::min(best, std::abs(x - g.x) + std::abs(y - g.y));
        }
        return static_cast<float>(best);
    };
    std::vector<int> goalIndices;
    goalIndices.reserve(goals.size());
    for (const auto& g : goals) {
        goalIndices.push_back(idx(g.x, g.y));
    }

    thread_local NodePool pool;
    pool.prepare(cells);
    auto& open = pool.openQueue;
    auto& gScore = pool.gScore;
    auto& parent = pool.parent;
    auto& closed = pool.closed;

    const int startIndex = idx(start.x, start.y);
    gScore[static_cast<size_t>(startIndex)] = 0.0f;
    open.push(NodePool::Node{startIndex, h(start.x, start.y)});

    int iterations = 0;
    while (!open.empty()) {
        if (iterations++ >= m_config.maxIterations) {
            m_stats.totalIterations += static_cast<uint64_t>(iterations);
            PATHFIND_WARN(std::format("Search in {} hit the {} iteration budget",
                                      map.id().toKey(), m_config.maxIterations));
            return PathfindingResult::TIMEOUT;
        }

        NodePool::Node cur = open.top();
        open.pop();
        const size_t cIndex = static_cast<size_t>(cur.index);
        if (closed[cIndex]) continue;
        closed[cIndex] = 1;

        const int cx = region.minX + cur.index % W;
        const int cy = region.minY + cur.index / W;

        if (std::find(goalIndices.begin(), goalIndices.end(), cur.index) != goalIndices.end()) {
            std::vector<Coordinate> rev;
            int p = cur.index;
            while (p >= 0) {
                rev.push_back({region.minX + p % W, region.minY + p / W});
                if (p == startIndex) break;
                p = parent[static_cast<size_t>(p)];
            }
            outTiles.assign(rev.rbegin(), rev.rend());
            m_stats.totalIterations += static_cast<uint64_t>(iterations);
            return PathfindingResult::SUCCESS;
        }

        const float gCur = gScore[cIndex];
        for (Direction d : CARDINALS) {
            const Coordinate n = step({cx, cy}, d);
            if (!region.contains(n)) continue;
            const size_t nIndex = static_cast<size_t>(idx(n.x, n.y));
            if (closed[nIndex]) continue;

            const float cost = stepCost(map.statusAt(n));
            if (std::isinf(cost)) continue;

            const float tentative = gCur + cost;
            if (tentative < gScore[nIndex]) {
                gScore[nIndex] = tentative;
                parent[nIndex] = cur.index;
                open.push(NodePool::Node{static_cast<int>(nIndex), tentative + h(n.x, n.y)});
            }
        }
    }

    m_stats.totalIterations += static_cast<uint64_t>(iterations);
    return PathfindingResult::NO_PATH_FOUND;
}

PathfindingResult AreaPathfinder::planToArea(const ConnectivityGraph& graph, const AreaMap& map,
                                             const Coordinate& start, Direction facing,
                                             const AreaId& target, MovementPlan& outPlan,
                                             std::vector<AreaId>* outRoute) {
    outPlan.clear();
    outPlan.finalFacing = facing;

    auto route = graph.shortestAreaPath(map.id(), target);
    if (!route) {
        PATHFIND_DEBUG(std::format("No known route {} -> {}", map.id().toKey(), target.toKey()));
        return record(PathfindingResult::NO_PATH_FOUND);
    }
    if (outRoute != nullptr) {
        *outRoute = *route;
    }
    if (route->size() < 2) {
        outPlan.tiles.push_back(start);
        return record(PathfindingResult::SUCCESS);
    }

    const std::vector<AreaConnection> exits = graph.exitsTo(map.id(), (*route)[1]);
    bool found = false;
    PathfindingResult lastFailure = PathfindingResult::NO_PATH_FOUND;
    MovementPlan best;

    for (const auto& exit : exits) {
        MovementPlan candidate;
        candidate.finalFacing = facing;
        if (exit.fromCoord == start) {
            // Standing on the exit: one more step in the warp direction
            candidate.tiles.push_back(start);
            if (exit.direction != facing) {
                candidate.steps.push_back({PlanStep::Type::Turn, exit.direction});
            }
            candidate.steps.push_back({PlanStep::Type::Move, exit.direction});
            candidate.finalFacing = exit.direction;
        } else {
            std::vector<Coordinate> tiles;
            PathfindingResult r = search(map, start, {exit.fromCoord}, tiles);
            if (r != PathfindingResult::SUCCESS) {
                lastFailure = r;
                continue;
            }
            candidate.tiles = std::move(tiles);
            buildSteps(candidate.tiles, facing, candidate);
        }
        if (!found || candidate.steps.size() < best.steps.size()) {
            best = std::move(candidate);
            found = true;
        }
    }

    if (!found) {
        return record(lastFailure);
    }
    outPlan = std::move(best);
    return record(PathfindingResult::SUCCESS);
}

} // namespace Wayfarer
