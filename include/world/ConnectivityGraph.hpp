/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CONNECTIVITY_GRAPH_HPP
#define CONNECTIVITY_GRAPH_HPP

#include "world/NavTypes.hpp"
#include "utils/JsonReader.hpp"
#include <boost/container/flat_map.hpp>
#include <optional>
#include <vector>

namespace Wayfarer {

/**
 * @brief One directed warp between two areas.
 *
 * Stepping onto fromCoord in fromArea while moving in direction lands the
 * agent on toCoord in toArea.
 */
struct AreaConnection {
    AreaId fromArea;
    Coordinate fromCoord;
    AreaId toArea;
    Coordinate toCoord;
    Direction direction{Direction::None};

    bool operator==(const AreaConnection& other) const = default;
};

std::ostream& operator<<(std::ostream& os, const AreaConnection& connection);

/**
 * @brief Areas linked by discovered transition edges.
 *
 * Connections are always stored in reciprocal pairs and deduplicated by
 * (fromArea, fromCoord, toArea). Re-recording a pair with a new landing
 * tile replaces both directions.
 */
class ConnectivityGraph {
public:
    /**
     * @brief Records a transition and its reverse.
     * @return true if either direction was new or changed
     */
    bool addConnection(const AreaConnection& connection);

    const std::vector<AreaConnection>& connectionsFrom(const AreaId& area) const;

    // Connections leaving from that lead directly to to
    std::vector<AreaConnection> exitsTo(const AreaId& from, const AreaId& to) const;

    std::vector<AreaId> neighbors(const AreaId& area) const;

    /**
     * @brief Fewest-hop area route by breadth-first search.
     * @return the route including both ends, or std::nullopt when unreachable
     */
    std::optional<std::vector<AreaId>> shortestAreaPath(const AreaId& from,
                                                        const AreaId& to) const;

    bool hasArea(const AreaId& area) const { return m_adjacency.count(area) > 0; }
    size_t areaCount() const { return m_adjacency.size(); }
    size_t connectionCount() const;
    void clear() { m_adjacency.clear(); }

    JsonValue toJson() const;
    // Replaces the current contents; malformed entries are skipped
    bool fromJson(const JsonValue& json);

private:
    bool upsert(const AreaConnection& connection);
    // Removes the return edge of a pair whose landing tile is about to change
    void dropStaleMirror(const AreaConnection& connection);

    boost::container::flat_map<AreaId, std::vector<AreaConnection>> m_adjacency;
};

} // namespace Wayfarer

#endif // CONNECTIVITY_GRAPH_HPP
