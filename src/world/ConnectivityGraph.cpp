/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/ConnectivityGraph.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <deque>
#include <format>
#include <unordered_map>

namespace Wayfarer {

std::ostream& operator<<(std::ostream& os, const AreaConnection& connection) {
    return os << connection.fromArea << connection.fromCoord << " -" << connection.direction
              << "-> " << connection.toArea << connection.toCoord;
}

bool ConnectivityGraph::upsert(const AreaConnection& connection) {
    auto& edges = m_adjacency[connection.fromArea];
    auto it = std::find_if(edges.begin(), edges.end(), [&](const AreaConnection& existing) {
        return existing.fromCoord == connection.fromCoord && existing.toArea == connection.toArea;
    });
    if (it == edges.end()) {
        edges.push_back(connection);
        return true;
    }
    if (*it == connection) {
        return false;
    }
    *it = connection;
    return true;
}

void ConnectivityGraph::dropStaleMirror(const AreaConnection& connection) {
    auto areaIt = m_adjacency.find(connection.fromArea);
    if (areaIt == m_adjacency.end()) {
        return;
    }
    const auto& edges = areaIt->second;
    auto it = std::find_if(edges.begin(), edges.end(), [&](const AreaConnection& existing) {
        return existing.fromCoord == connection.fromCoord && existing.toArea == connection.toArea;
    });
    if (it == edges.end() || it->toCoord == connection.toCoord) {
        return;
    }

    // The old landing tile still points back here
    const Coordinate oldLanding = it->toCoord;
    auto mirrorIt = m_adjacency.find(connection.toArea);
    if (mirrorIt == m_adjacency.end()) {
        return;
    }
    auto& mirrors = mirrorIt->second;
    std::erase_if(mirrors, [&](const AreaConnection& mirror) {
        return mirror.fromCoord == oldLanding && mirror.toArea == connection.fromArea &&
               mirror.toCoord == connection.fromCoord;
    });
    CONNECTIVITY_DEBUG(std::format("Dropped stale return edge {} ({},{}) -> {}",
                                   connection.toArea.toKey(), oldLanding.x, oldLanding.y,
                                   connection.fromArea.toKey()));
}

bool ConnectivityGraph::addConnection(const AreaConnection& connection) {
    AreaConnection reverse{connection.toArea, connection.toCoord, connection.fromArea,
                           connection.fromCoord, opposite(connection.direction)};

    dropStaleMirror(connection);
    dropStaleMirror(reverse);

    bool changed = upsert(connection);
    changed = upsert(reverse) || changed;
    if (changed) {
        CONNECTIVITY_INFO(std::format("Connected {} ({},{}) <-> {} ({},{}) going {}",
                                      connection.fromArea.toKey(), connection.fromCoord.x,
                                      connection.fromCoord.y, connection.toArea.toKey(),
                                      connection.toCoord.x, connection.toCoord.y,
                                      toString(connection.direction)));
    }
    return changed;
}

const std::vector<AreaConnection>& ConnectivityGraph::connectionsFrom(const AreaId& area) const {
    static const std::vector<AreaConnection> none;
    auto it = m_adjacency.find(area);
    return it != m_adjacency.end() ? it->second : none;
}

std::vector<AreaConnection> ConnectivityGraph::exitsTo(const AreaId& from, const AreaId& to) const {
    std::vector<AreaConnection> result;
    for (const auto& connection : connectionsFrom(from)) {
        if (connection.toArea == to) {
            result.push_back(connection);
        }
    }
    return result;
}

std::vector<AreaId> ConnectivityGraph::neighbors(const AreaId& area) const {
    std::vector<AreaId> result;
    for (const auto& connection : connectionsFrom(area)) {
        if (std::find(result.begin(), result.end(), connection.toArea) == result.end()) {
            result.push_back(connection.toArea);
        }
    }
    return result;
}

size_t ConnectivityGraph::connectionCount() const {
    size_t total = 0;
    for (const auto& [area, edges] : m_adjacency) {
        total += edges.size();
    }
    return total;
}

std::optional<std::vector<AreaId>> ConnectivityGraph::shortestAreaPath(const AreaId& from,
                                                                       const AreaId& to) const {
    if (from == to) {
        return std::vector<AreaId>{from};
    }

    std::unordered_map<AreaId, AreaId> cameFrom;
    std::deque<AreaId> frontier{from};
    cameFrom.emplace(from, from);

    while (!frontier.empty()) {
        AreaId current = frontier.front();
        frontier.pop_front();

        for (const auto& next : neighbors(current)) {
            if (cameFrom.count(next) > 0) {
                continue;
            }
            cameFrom.emplace(next, current);
            if (next == to) {
                std::vector<AreaId> route{to};
                AreaId step = current;
                while (!(step == from)) {
                    route.push_back(step);
                    step = cameFrom.at(step);
                }
                route.push_back(from);
                std::reverse(route.begin(), route.end());
                return route;
            }
            frontier.push_back(next);
        }
    }
    return std::nullopt;
}

JsonValue ConnectivityGraph::toJson() const {
    JsonValue areas = JsonValue::object();
    for (const auto& [area, edges] : m_adjacency) {
        JsonValue list = JsonValue::array();
        for (const auto& c : edges) {
            JsonValue entry = JsonValue::object();
            entry.set("from_group", JsonValue(c.fromArea.group))
                .set("from_number", JsonValue(c.fromArea.number))
                .set("from_x", JsonValue(c.fromCoord.x))
                .set("from_y", JsonValue(c.fromCoord.y))
                .set("to_group", JsonValue(c.toArea.group))
                .set("to_number", JsonValue(c.toArea.number))
                .set("to_x", JsonValue(c.toCoord.x))
                .set("to_y", JsonValue(c.toCoord.y))
                .set("direction", JsonValue(toString(c.direction)));
            list.push(std::move(entry));
        }
        areas.set(area.toKey(), std::move(list));
    }

    JsonValue root = JsonValue::object();
    root.set("version", JsonValue(1));
    root.set("connections", std::move(areas));
    return root;
}

bool ConnectivityGraph::fromJson(const JsonValue& json) {
    const JsonObject* areas = json["connections"].tryAsObject();
    if (areas == nullptr) {
        CONNECTIVITY_WARN("Connection data has no 'connections' object");
        return false;
    }

    m_adjacency.clear();
    size_t skipped = 0;
    for (const auto& [key, list] : *areas) {
        const JsonArray* edges = list.tryAsArray();
        if (edges == nullptr) {
            ++skipped;
            continue;
        }
        for (const auto& entry : *edges) {
            auto direction = directionFromString(entry.getString("direction", ""));
            if (!entry.isObject() || !direction) {
                ++skipped;
                continue;
            }
            AreaConnection c;
            c.fromArea = {entry.getInt("from_group", 0), entry.getInt("from_number", 0)};
            c.fromCoord = {entry.getInt("from_x", 0), entry.getInt("from_y", 0)};
            c.toArea = {entry.getInt("to_group", 0), entry.getInt("to_number", 0)};
            c.toCoord = {entry.getInt("to_x", 0), entry.getInt("to_y", 0)};
            c.direction = *direction;
            // Older files may hold only one side of a pair
            addConnection(c);
        }
    }
    if (skipped > 0) {
        CONNECTIVITY_WARN(std::format("Skipped {} malformed connection entries", skipped));
    }
    return true;
}

} // namespace Wayfarer
