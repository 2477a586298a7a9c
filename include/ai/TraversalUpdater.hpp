/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TRAVERSAL_UPDATER_HPP
#define TRAVERSAL_UPDATER_HPP

#include "ai/ActionOutcome.hpp"
#include "world/ActiveArea.hpp"
#include "world/ConnectivityGraph.hpp"
#include <optional>
#include <string>

namespace Wayfarer {

class AreaMapManager;

struct UpdateReport {
    bool mapChanged{false};
    bool areaSwitched{false};
    bool connectionChanged{false};
    bool repeatedBlock{false};
};

/**
 * @brief Applies one classified outcome to the maps.
 *
 * Moved marks the vacated tile Walkable (Ledge for a multi-tile hop) and
 * moves the Player marker. Blocked marks the target. AreaChanged marks both
 * ends of the warp as TransitionEdge, persists the map being left, switches
 * the ActiveArea and records the reciprocal connection. Interaction that
 * opened dialogue marks the faced tile Interactable; a walk-on trigger is
 * marked the same way and takes effect once the agent steps off it.
 * Everything else is a no-op.
 */
class TraversalUpdater {
public:
    TraversalUpdater(AreaMapManager& maps, ConnectivityGraph& graph);

    /**
     * @brief Points the handle at an area without a warp edge, used at
     *        startup and when the game moved the agent on its own.
     */
    AreaMap& enterArea(ActiveArea& active, const AreaId& id, const std::string& name,
                       const Coordinate& position);

    UpdateReport apply(ActiveArea& active, const ActionOutcome& outcome);

private:
    UpdateReport applyMoved(AreaMap& map, const Coordinate& from, const Coordinate& to);
    UpdateReport applyBlocked(AreaMap& map, const Coordinate& target);
    UpdateReport applyAreaChanged(ActiveArea& active, const Outcome::AreaChanged& change);
    UpdateReport applyInteractable(AreaMap& map, const Coordinate& c);

    AreaMapManager& m_maps;
    ConnectivityGraph& m_graph;

    struct BlockedMemo {
        AreaId area;
        Coordinate target;
    };
    std::optional<BlockedMemo> m_lastBlocked;
};

} // namespace Wayfarer

#endif // TRAVERSAL_UPDATER_HPP
