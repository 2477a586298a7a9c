/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AREA_PATHFINDER_HPP
#define AREA_PATHFINDER_HPP

#include "world/AreaMap.hpp"
#include "world/ConnectivityGraph.hpp"
#include "world/NavTypes.hpp"
#include <cstdint>
#include <limits>
#include <ostream>
#include <queue>
#include <vector>

namespace Wayfarer {

enum class PathfindingResult { SUCCESS, NO_PATH_FOUND, GOAL_UNREACHABLE, INVALID_START, TIMEOUT };

inline std::ostream& operator<<(std::ostream& os, const PathfindingResult& result) {
    switch (result) {
        case PathfindingResult::SUCCESS: return os << "SUCCESS";
        case PathfindingResult::NO_PATH_FOUND: return os << "NO_PATH_FOUND";
        case PathfindingResult::GOAL_UNREACHABLE: return os << "GOAL_UNREACHABLE";
        case PathfindingResult::INVALID_START: return os << "INVALID_START";
        case PathfindingResult::TIMEOUT: return os << "TIMEOUT";
        default: return os << "UNKNOWN";
    }
}

struct PlanStep {
    enum class Type : uint8_t { Turn, Move };

    Type type{Type::Move};
    Direction direction{Direction::None};

    bool operator==(const PlanStep& other) const = default;
};

std::ostream& operator<<(std::ostream& os, const PlanStep& step);

/**
 * @brief A facing-aware action sequence plus the tiles it visits.
 *
 * A Turn is emitted before every Move whose direction differs from the
 * facing the agent will have at that point. Both step types are issued as
 * the matching directional button.
 */
struct MovementPlan {
    std::vector<PlanStep> steps;
    std::vector<Coordinate> tiles;  // start first, last tile stood on last
    bool approach{false};           // ends facing an impassable goal instead of on it
    Direction finalFacing{Direction::None};

    size_t moveCount() const;
    std::vector<Action> toActions() const;
    void clear() {
        steps.clear();
        tiles.clear();
        approach = false;
        finalFacing = Direction::None;
    }
};

struct PathfinderConfig {
    float unknownPenalty{0.1f};  // extra cost of entering an Unknown tile
    int searchMargin{2};         // tiles of unexplored border around the known bounds
    int maxIterations{20000};
};

/**
 * @brief A* over one AreaMap's traversal layer.
 *
 * Walkable, TransitionEdge, Player and Ledge tiles cost 1, Unknown tiles cost
 * 1 + unknownPenalty, Blocked and Interactable tiles are never entered.
 * Uncertainty is treated optimistically so the agent discovers by moving.
 */
class AreaPathfinder {
public:
    explicit AreaPathfinder(const PathfinderConfig& config = PathfinderConfig{});

    /**
     * @brief Plans from start to goal within one area.
     *
     * Fails fast with GOAL_UNREACHABLE, without searching, when no orthogonal
     * neighbor of the goal could ever be entered. An impassable goal with an
     * enterable neighbor produces an approach plan that ends facing it.
     */
    PathfindingResult findPlan(const AreaMap& map, const Coordinate& start, Direction facing,
                               const Coordinate& goal, MovementPlan& outPlan);

    /**
     * @brief Plans the first leg toward another area.
     *
     * Routes over the connection graph, then plans to the nearest exit into
     * the next area on that route. Standing on the exit already yields a
     * single step through it.
     * @param outRoute receives the area route when not null
     */
    PathfindingResult planToArea(const ConnectivityGraph& graph, const AreaMap& map,
                                 const Coordinate& start, Direction facing, const AreaId& target,
                                 MovementPlan& outPlan, std::vector<AreaId>* outRoute = nullptr);

    static bool hasEnterableNeighbor(const AreaMap& map, const Coordinate& goal);

    float stepCost(TraversalStatus status) const;

    struct PathfindingStats {
        uint64_t totalRequests{0};
        uint64_t searchesRun{0};
        uint64_t successfulPaths{0};
        uint64_t noPathFound{0};
        uint64_t goalUnreachable{0};
        uint64_t invalidStarts{0};
        uint64_t timeouts{0};
        uint64_t totalIterations{0};
    };

    void resetStats() { m_stats = PathfindingStats{}; }
    const PathfindingStats& getStats() const { return m_stats; }
    const PathfinderConfig& config() const { return m_config; }

private:
    PathfindingResult search(const AreaMap& map, const Coordinate& start,
                             const std::vector<Coordinate>& goals,
                             std::vector<Coordinate>& outTiles);
    static void buildSteps(const std::vector<Coordinate>& tiles, Direction facing,
                           MovementPlan& plan);
    PathfindingResult record(PathfindingResult result);

    PathfinderConfig m_config;
    PathfindingStats m_stats{};

    // Reused between searches on the same thread
    struct NodePool {
        struct Node { int index; float f; };
        struct Cmp { bool operator()(const Node& a, const Node& b) const { return a.f > b.f; } };

        std::priority_queue<Node, std::vector<Node>, Cmp> openQueue;
        std::vector<float> gScore;
        std::vector<int> parent;
        std::vector<uint8_t> closed;

        void prepare(size_t cells) {
            while (!openQueue.empty()) openQueue.pop();
            gScore.assign(cells, std::numeric_limits<float>::infinity());
            parent.assign(cells, -1);
            closed.assign(cells, 0);
        }
    };
};

} // namespace Wayfarer

#endif // AREA_PATHFINDER_HPP
