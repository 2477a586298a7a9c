/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AREA_MAP_HPP
#define AREA_MAP_HPP

#include "world/CoordinateGrid.hpp"
#include "world/NavTypes.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Wayfarer {

struct AreaSummary {
    AreaId id;
    std::string displayName;
    GridBounds bounds;
    size_t knownTiles{0};
    size_t walkableTiles{0};
    size_t blockedTiles{0};
    size_t transitionTiles{0};
    size_t interactableTiles{0};
    int visitCount{0};
};

/**
 * @brief Dense copy of both layers around a center tile.
 *
 * Handed to the decision source so it never touches the live grids.
 */
struct AreaWindow {
    Coordinate topLeft;
    int rows{0};
    int cols{0};
    std::vector<std::string> traversalRows;        // one char per tile
    std::vector<std::vector<std::string>> labels;  // [row][col]

    TraversalStatus statusAt(int row, int col) const {
        return traversalFromChar(traversalRows[row][col]);
    }
    std::string render() const;
};

/**
 * @brief Everything the agent knows about one area.
 *
 * Two layers share the same coordinate space: terrain holds the last label
 * the vision classifier reported for each tile, traversal holds what
 * movement attempts proved. Exactly one tile may carry the Player marker;
 * the status it covers is remembered and restored when the marker moves.
 * A TransitionEdge is never downgraded once set.
 */
class AreaMap {
public:
    AreaMap(AreaId id, std::string displayName);

    const AreaId& id() const { return m_id; }
    const std::string& displayName() const { return m_displayName; }
    void setDisplayName(const std::string& name);

    const CoordinateGrid<std::string>& terrain() const { return m_terrain; }
    const CoordinateGrid<TraversalStatus>& traversal() const { return m_traversal; }

    const std::string& labelAt(const Coordinate& c) const { return m_terrain.get(c); }
    TraversalStatus statusAt(const Coordinate& c) const { return m_traversal.get(c); }

    void setLabel(const Coordinate& c, std::string label);

    /**
     * @brief Records a traversal fact for one tile.
     *
     * Player requests move the marker, TransitionEdge requests go through
     * markTransition(). A tile that is already a TransitionEdge is left alone.
     * Writing the tile currently under the Player marker updates the covered
     * status instead of removing the marker.
     * @return true if the stored state changed
     */
    bool markTraversal(const Coordinate& c, TraversalStatus status);

    // The only way a tile becomes a TransitionEdge
    void markTransition(const Coordinate& c);

    void setPlayer(const Coordinate& c);
    void clearPlayer();
    std::optional<Coordinate> playerCoord() const { return m_player; }
    // Status restored when the marker leaves its tile
    TraversalStatus coveredStatus() const { return m_underPlayer; }

    // Union of the written extents of both layers
    GridBounds bounds() const;

    int visitCount() const { return m_visitCount; }
    void recordVisit();

    int64_t createdAt() const { return m_createdAt; }
    int64_t updatedAt() const { return m_updatedAt; }
    void touch();
    void restoreMetadata(int64_t createdAt, int64_t updatedAt, int visitCount);

    AreaSummary summary() const;
    AreaWindow window(const Coordinate& center, int halfRows, int halfCols) const;

    static int64_t nowSeconds();

private:
    AreaId m_id;
    std::string m_displayName;
    CoordinateGrid<std::string> m_terrain{UNKNOWN_LABEL};
    CoordinateGrid<TraversalStatus> m_traversal{TraversalStatus::Unknown};

    std::optional<Coordinate> m_player;
    TraversalStatus m_underPlayer{TraversalStatus::Unknown};

    int m_visitCount{0};
    int64_t m_createdAt{0};
    int64_t m_updatedAt{0};
};

} // namespace Wayfarer

#endif // AREA_MAP_HPP
