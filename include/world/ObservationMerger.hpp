/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef OBSERVATION_MERGER_HPP
#define OBSERVATION_MERGER_HPP

#include "world/AreaMap.hpp"
#include "world/NavTypes.hpp"
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace Wayfarer {

// One classified cell of the vision window, relative to the window's top-left
struct ObservedTile {
    int row{0};
    int col{0};
    std::string label;
};

struct Observation {
    std::vector<ObservedTile> tiles;
};

/**
 * @brief Size of the vision window and where the agent sits inside it.
 */
struct ObservationShape {
    int rows{9};
    int cols{15};
    int agentRow{4};
    int agentCol{7};

    bool isValid() const {
        return rows > 0 && cols > 0 && agentRow >= 0 && agentRow < rows &&
               agentCol >= 0 && agentCol < cols;
    }
};

struct MergeConfig {
    ObservationShape shape;
    // Labels that are solid no matter what, stored lower case
    std::set<std::string> solidLabels{"tree", "black"};
    bool keepNegativeCoordinates{true};
};

enum class MergeResult {
    MERGED,
    MALFORMED
};

inline std::ostream& operator<<(std::ostream& os, const MergeResult& result) {
    switch (result) {
        case MergeResult::MERGED: return os << "MERGED";
        case MergeResult::MALFORMED: return os << "MALFORMED";
        default: return os << "UNKNOWN";
    }
}

/**
 * @brief Folds one windowed observation into an AreaMap.
 *
 * Terrain is last-writer-wins. Traversal inference is limited to turning
 * Unknown tiles with a definitely-solid label into Blocked; everything else
 * waits for a movement attempt. The Player marker is cleared first and
 * re-applied at the agent coordinate last, so merging the same window twice
 * leaves the map unchanged.
 */
class ObservationMerger {
public:
    /**
     * @throws std::invalid_argument if the configured shape is unusable
     */
    explicit ObservationMerger(MergeConfig config);

    MergeResult merge(AreaMap& map, const Observation& observation,
                      const Coordinate& agent) const;

    /**
     * @brief Checks an observation against the configured window shape.
     * @param reason receives a description of the first problem found
     */
    bool validate(const Observation& observation, std::string& reason) const;

    bool isSolidLabel(const std::string& label) const;

    const MergeConfig& config() const { return m_config; }

private:
    MergeConfig m_config;
};

} // namespace Wayfarer

#endif // OBSERVATION_MERGER_HPP
