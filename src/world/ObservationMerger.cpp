/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/ObservationMerger.hpp"
#include "core/Logger.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <format>
#include <stdexcept>

namespace Wayfarer {

ObservationMerger::ObservationMerger(MergeConfig config) : m_config(std::move(config)) {
    if (!m_config.shape.isValid()) {
        throw std::invalid_argument(std::format(
            "Invalid observation shape {}x{} with agent at row {} col {}",
            m_config.shape.rows, m_config.shape.cols, m_config.shape.agentRow,
            m_config.shape.agentCol));
    }

    std::set<std::string> lowered;
    for (const auto& label : m_config.solidLabels) {
        lowered.insert(boost::algorithm::to_lower_copy(label));
    }
    m_config.solidLabels = std::move(lowered);
}

bool ObservationMerger::isSolidLabel(const std::string& label) const {
    return m_config.solidLabels.count(boost::algorithm::to_lower_copy(label)) > 0;
}

bool ObservationMerger::validate(const Observation& observation, std::string& reason) const {
    const auto& shape = m_config.shape;
    const size_t expected = static_cast<size_t>(shape.rows) * static_cast<size_t>(shape.cols);
    if (observation.tiles.size() != expected) {
        reason = std::format("expected {} tiles for a {}x{} window, got {}", expected,
                             shape.rows, shape.cols, observation.tiles.size());
        return false;
    }

    std::vector<bool> seen(expected, false);
    for (const auto& tile : observation.tiles) {
        if (tile.row < 0 || tile.row >= shape.rows || tile.col < 0 || tile.col >= shape.cols) {
            reason = std::format("tile ({},{}) outside {}x{} window", tile.row, tile.col,
                                 shape.rows, shape.cols);
            return false;
        }
        size_t idx = static_cast<size_t>(tile.row) * static_cast<size_t>(shape.cols) +
                     static_cast<size_t>(tile.col);
        if (seen[idx]) {
            reason = std::format("tile ({},{}) reported twice", tile.row, tile.col);
            return false;
        }
        seen[idx] = true;
    }
    return true;
}

MergeResult ObservationMerger::merge(AreaMap& map, const Observation& observation,
                                     const Coordinate& agent) const {
    std::string reason;
    if (!validate(observation, reason)) {
        MERGE_WARN(std::format("Rejected observation for {}: {}", map.id().toKey(), reason));
        return MergeResult::MALFORMED;
    }

    const Coordinate topLeft{agent.x - m_config.shape.agentCol, agent.y - m_config.shape.agentRow};

    map.clearPlayer();

    size_t skipped = 0;
    size_t newlyBlocked = 0;
    for (const auto& tile : observation.tiles) {
        const Coordinate c{topLeft.x + tile.col, topLeft.y + tile.row};
        if (!m_config.keepNegativeCoordinates && (c.x < 0 || c.y < 0)) {
            ++skipped;
            continue;
        }

        map.setLabel(c, tile.label);
        if (map.statusAt(c) == TraversalStatus::Unknown && isSolidLabel(tile.label)) {
            map.markTraversal(c, TraversalStatus::Blocked);
            ++newlyBlocked;
        }
    }

    map.setPlayer(agent);
    map.touch();

    MERGE_DEBUG(std::format("{} merged window at {},{} ({} newly blocked, {} skipped)",
                            map.id().toKey(), agent.x, agent.y, newlyBlocked, skipped));
    return MergeResult::MERGED;
}

} // namespace Wayfarer
