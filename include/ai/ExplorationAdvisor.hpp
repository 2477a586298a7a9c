/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef EXPLORATION_ADVISOR_HPP
#define EXPLORATION_ADVISOR_HPP

#include "world/AreaMap.hpp"
#include "world/NavTypes.hpp"
#include <cstddef>
#include <deque>
#include <ostream>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace Wayfarer {

struct AdvisorConfig {
    size_t historyCapacity{20};
    size_t stuckWindow{10};       // recent samples examined per check
    size_t stuckDistinctMax{3};   // at most this many distinct positions counts as circling
    int stuckLimit{3};            // counter value at which the agent is stuck
    size_t stuckMinSamples{8};    // checks start once this many samples exist
    int scanRadius{4};
};

struct PositionSample {
    AreaId area;
    Coordinate position;

    bool operator==(const PositionSample& other) const = default;
};

/**
 * @brief Recent positions of the agent, used only to notice circling.
 *
 * Each recorded sample re-checks the most recent window: few distinct
 * positions bump the stuck counter, otherwise it decays by one toward zero.
 * Discardable across restarts.
 */
class PositionHistory {
public:
    explicit PositionHistory(const AdvisorConfig& config);

    void record(const AreaId& area, const Coordinate& position);

    bool isStuck() const { return m_stuckCounter >= m_config.stuckLimit; }
    int stuckCounter() const { return m_stuckCounter; }

    size_t size() const { return m_samples.size(); }
    const std::deque<PositionSample>& samples() const { return m_samples; }

    bool hasVisited(const AreaId& area, const Coordinate& position) const;
    size_t visitedCount(const AreaId& area) const;

    void clear();

private:
    size_t distinctInWindow() const;

    AdvisorConfig m_config;
    std::deque<PositionSample> m_samples;
    int m_stuckCounter{0};
    std::unordered_map<AreaId, std::unordered_set<Coordinate>> m_visited;
};

enum class SuggestionReason { UNEXPLORED, TRANSITION, WALKABLE, NONE };

inline std::ostream& operator<<(std::ostream& os, const SuggestionReason& reason) {
    switch (reason) {
        case SuggestionReason::UNEXPLORED: return os << "UNEXPLORED";
        case SuggestionReason::TRANSITION: return os << "TRANSITION";
        case SuggestionReason::WALKABLE: return os << "WALKABLE";
        case SuggestionReason::NONE: return os << "NONE";
        default: return os << "UNKNOWN";
    }
}

struct DirectionProbe {
    Direction direction{Direction::None};
    int distance{0};
};

struct ExplorationSuggestion {
    Direction direction{Direction::None};
    SuggestionReason reason{SuggestionReason::NONE};
    bool stuck{false};
    std::vector<DirectionProbe> unexplored;
    std::vector<DirectionProbe> transitions;
    std::vector<DirectionProbe> walkable;
};

/**
 * @brief Suggests which way to go next while exploring.
 *
 * Looks along each cardinal ray out to scanRadius (rays stop at Blocked
 * or Interactable tiles). Preference: nearest Unknown tile unless the agent
 * is stuck, then nearest known transition, then any walkable neighbor.
 */
class ExplorationAdvisor {
public:
    explicit ExplorationAdvisor(const AdvisorConfig& config = AdvisorConfig{});

    void recordPosition(const AreaId& area, const Coordinate& position);
    bool isStuck() const { return m_history.isStuck(); }

    ExplorationSuggestion suggest(const AreaMap& map, const Coordinate& agent) const;

    const PositionHistory& history() const { return m_history; }
    void reset() { m_history.clear(); }

private:
    Direction pickFresh(const std::vector<DirectionProbe>& probes, const AreaId& area,
                        const Coordinate& agent) const;

    AdvisorConfig m_config;
    PositionHistory m_history;
};

} // namespace Wayfarer

#endif // EXPLORATION_ADVISOR_HPP
