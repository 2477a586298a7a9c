/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/TraversalUpdater.hpp"
#include "core/Logger.hpp"
#include "managers/AreaMapManager.hpp"
#include <format>

namespace Wayfarer {

TraversalUpdater::TraversalUpdater(AreaMapManager& maps, ConnectivityGraph& graph)
    : m_maps(maps), m_graph(graph) {}

AreaMap& TraversalUpdater::enterArea(ActiveArea& active, const AreaId& id,
                                     const std::string& name, const Coordinate& position) {
    if (active.isSet() && !(active->id() == id)) {
        active->clearPlayer();
        if (!m_maps.save(*active)) {
            TRAVERSAL_WARN("Left " + active->id().toKey() + " without saving it");
        }
    }
    AreaMap& map = m_maps.loadOrCreate(id, name);
    if (!active.isSet() || !(active->id() == id)) {
        map.recordVisit();
    }
    active.switchTo(map);
    map.setPlayer(position);
    m_lastBlocked.reset();
    TRAVERSAL_INFO(std::format("Now in {} '{}' at {},{}", id.toKey(), map.displayName(),
                               position.x, position.y));
    return map;
}

UpdateReport TraversalUpdater::apply(ActiveArea& active, const ActionOutcome& outcome) {
    if (!active.isSet()) {
        TRAVERSAL_WARN("Outcome ignored, no active area");
        return {};
    }
    AreaMap& map = *active;

    if (const auto* moved = std::get_if<Outcome::Moved>(&outcome)) {
        return applyMoved(map, moved->from, moved->to);
    }
    if (std::holds_alternative<Outcome::Turned>(outcome)) {
        if (auto at = map.playerCoord()) {
            map.setPlayer(*at);
        }
        return {};
    }
    if (const auto* blocked = std::get_if<Outcome::Blocked>(&outcome)) {
        return applyBlocked(map, blocked->target);
    }
    if (const auto* change = std::get_if<Outcome::AreaChanged>(&outcome)) {
        return applyAreaChanged(active, *change);
    }
    if (const auto* interacted = std::get_if<Outcome::Interacted>(&outcome)) {
        if (!interacted->dialogueOpened) {
            return {};
        }
        return applyInteractable(map, interacted->faced);
    }
    if (const auto* triggered = std::get_if<Outcome::AutoDialogue>(&outcome)) {
        UpdateReport report = applyMoved(map, triggered->from, triggered->to);
        UpdateReport marked = applyInteractable(map, triggered->trigger);
        report.mapChanged = report.mapChanged || marked.mapChanged;
        return report;
    }
    if (const auto* unknown = std::get_if<Outcome::Unknown>(&outcome)) {
        TRAVERSAL_DEBUG("Skipping unclassified outcome: " + unknown->reason);
    }
    return {};
}

UpdateReport TraversalUpdater::applyMoved(AreaMap& map, const Coordinate& from,
                                          const Coordinate& to) {
    UpdateReport report;
    // More than one tile in a single step means a one-way ledge hop
    const TraversalStatus vacated =
        manhattan(from, to) > 1 ? TraversalStatus::Ledge : TraversalStatus::Walkable;
    // A walk-on trigger stays impassable once found
    const bool onTrigger = map.playerCoord() && *map.playerCoord() == from &&
                           map.coveredStatus() == TraversalStatus::Interactable;
    if (!onTrigger) {
        report.mapChanged = map.markTraversal(from, vacated);
    }
    map.setPlayer(to);
    map.touch();
    m_lastBlocked.reset();
    return report;
}

UpdateReport TraversalUpdater::applyBlocked(AreaMap& map, const Coordinate& target) {
    UpdateReport report;
    report.repeatedBlock = m_lastBlocked && m_lastBlocked->area == map.id() &&
                           m_lastBlocked->target == target;
    if (!report.repeatedBlock) {
        TRAVERSAL_DEBUG(std::format("{} blocked at {},{}", map.id().toKey(), target.x, target.y));
    }
    m_lastBlocked = BlockedMemo{map.id(), target};

    // Interactable tiles are already impassable and carry more information
    if (map.statusAt(target) == TraversalStatus::Interactable) {
        return report;
    }
    report.mapChanged = map.markTraversal(target, TraversalStatus::Blocked);
    if (report.mapChanged) {
        map.touch();
    }
    return report;
}

UpdateReport TraversalUpdater::applyInteractable(AreaMap& map, const Coordinate& c) {
    UpdateReport report;
    report.mapChanged = map.markTraversal(c, TraversalStatus::Interactable);
    if (report.mapChanged) {
        TRAVERSAL_DEBUG(std::format("{} interactable at {},{}", map.id().toKey(), c.x, c.y));
        map.touch();
    }
    return report;
}

UpdateReport TraversalUpdater::applyAreaChanged(ActiveArea& active,
                                                const Outcome::AreaChanged& change) {
    UpdateReport report;
    report.mapChanged = true;
    report.areaSwitched = true;

    AreaMap* oldMap = active.get();
    if (!(oldMap->id() == change.fromArea)) {
        TRAVERSAL_WARN(std::format("Active area {} does not match departure area {}",
                                   oldMap->id().toKey(), change.fromArea.toKey()));
        oldMap = &m_maps.loadOrCreate(change.fromArea, "");
    }

    const std::optional<Coordinate> vacated = oldMap->playerCoord();
    oldMap->markTransition(change.exit);
    oldMap->clearPlayer();
    if (vacated && !(*vacated == change.exit) &&
        oldMap->statusAt(*vacated) != TraversalStatus::Interactable) {
        oldMap->markTraversal(*vacated, TraversalStatus::Walkable);
    }
    oldMap->touch();
    if (!m_maps.save(*oldMap)) {
        TRAVERSAL_WARN("Left " + oldMap->id().toKey() + " without saving it");
    }

    AreaMap& newMap = m_maps.loadOrCreate(change.toArea, change.toAreaName);
    newMap.recordVisit();
    newMap.markTransition(change.entry);
    newMap.setPlayer(change.entry);
    active.switchTo(newMap);
    m_lastBlocked.reset();

    AreaConnection connection{change.fromArea, change.exit, change.toArea, change.entry,
                              change.direction};
    report.connectionChanged = m_graph.addConnection(connection);
    if (report.connectionChanged && !m_maps.saveGraph(m_graph)) {
        TRAVERSAL_WARN("Connection graph not saved, will retry on next save");
    }

    TRAVERSAL_INFO(std::format("Area change {} -> {} '{}'", change.fromArea.toKey(),
                               change.toArea.toKey(), newMap.displayName()));
    return report;
}

} // namespace Wayfarer
