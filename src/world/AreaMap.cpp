/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/AreaMap.hpp"
#include "core/Logger.hpp"
#include <chrono>
#include <format>

namespace Wayfarer {

std::string AreaWindow::render() const {
    std::string out;
    out.reserve(static_cast<size_t>(rows) * static_cast<size_t>(cols + 1));
    for (const auto& row : traversalRows) {
        out += row;
        out += '\n';
    }
    return out;
}

AreaMap::AreaMap(AreaId id, std::string displayName)
    : m_id(id), m_displayName(std::move(displayName)) {
    m_createdAt = nowSeconds();
    m_updatedAt = m_createdAt;
}

int64_t AreaMap::nowSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

void AreaMap::setDisplayName(const std::string& name) {
    if (!name.empty() && name != m_displayName) {
        AREAMAP_DEBUG(std::format("{} renamed '{}' -> '{}'", m_id.toKey(), m_displayName, name));
        m_displayName = name;
    }
}

void AreaMap::setLabel(const Coordinate& c, std::string label) {
    m_terrain.set(c, std::move(label));
}

bool AreaMap::markTraversal(const Coordinate& c, TraversalStatus status) {
    if (status == TraversalStatus::Player) {
        setPlayer(c);
        return true;
    }
    if (status == TraversalStatus::TransitionEdge) {
        bool changed = m_traversal.get(c) != TraversalStatus::TransitionEdge;
        markTransition(c);
        return changed;
    }

    if (m_player && *m_player == c && m_traversal.get(c) == TraversalStatus::Player) {
        if (m_underPlayer == TraversalStatus::TransitionEdge || m_underPlayer == status) {
            return false;
        }
        m_underPlayer = status;
        return true;
    }

    TraversalStatus current = m_traversal.get(c);
    if (current == TraversalStatus::TransitionEdge || current == status) {
        return false;
    }
    m_traversal.set(c, status);
    return true;
}

void AreaMap::markTransition(const Coordinate& c) {
    if (m_player && *m_player == c) {
        // The marker stays logically on this tile but the edge is what gets stored
        m_underPlayer = TraversalStatus::TransitionEdge;
    }
    if (m_traversal.get(c) != TraversalStatus::TransitionEdge) {
        AREAMAP_DEBUG(std::format("{} transition edge at {},{}", m_id.toKey(), c.x, c.y));
    }
    m_traversal.set(c, TraversalStatus::TransitionEdge);
}

void AreaMap::setPlayer(const Coordinate& c) {
    if (m_player && *m_player == c) {
        if (m_traversal.get(c) != TraversalStatus::TransitionEdge) {
            m_traversal.set(c, TraversalStatus::Player);
        }
        return;
    }
    clearPlayer();

    TraversalStatus covered = m_traversal.get(c);
    m_player = c;
    m_underPlayer = covered;
    if (covered != TraversalStatus::TransitionEdge) {
        m_traversal.set(c, TraversalStatus::Player);
    }
}

void AreaMap::clearPlayer() {
    if (!m_player) {
        return;
    }
    const Coordinate c = *m_player;
    m_player.reset();

    if (m_traversal.get(c) != TraversalStatus::Player) {
        return;
    }
    // The agent stood here, so the tile is at least walkable
    TraversalStatus restored = m_underPlayer;
    if (restored == TraversalStatus::Unknown || restored == TraversalStatus::Blocked ||
        restored == TraversalStatus::Player) {
        restored = TraversalStatus::Walkable;
    }
    m_traversal.set(c, restored);
    m_underPlayer = TraversalStatus::Unknown;
}

GridBounds AreaMap::bounds() const {
    GridBounds result = m_terrain.bounds();
    const GridBounds& t = m_traversal.bounds();
    if (!t.empty) {
        result.include({t.minX, t.minY});
        result.include({t.maxX, t.maxY});
    }
    return result;
}

void AreaMap::recordVisit() {
    ++m_visitCount;
    touch();
}

void AreaMap::touch() {
    m_updatedAt = nowSeconds();
}

void AreaMap::restoreMetadata(int64_t createdAt, int64_t updatedAt, int visitCount) {
    m_createdAt = createdAt;
    m_updatedAt = updatedAt;
    m_visitCount = visitCount;
}

AreaSummary AreaMap::summary() const {
    AreaSummary s;
    s.id = m_id;
    s.displayName = m_displayName;
    s.bounds = bounds();
    s.visitCount = m_visitCount;
    m_traversal.forEachWritten([&s](const Coordinate&, TraversalStatus status) {
        switch (status) {
            case TraversalStatus::Unknown:
                return;
            case TraversalStatus::Walkable:
            case TraversalStatus::Player:
            case TraversalStatus::Ledge:
                ++s.walkableTiles;
                break;
            case TraversalStatus::Blocked:
                ++s.blockedTiles;
                break;
            case TraversalStatus::TransitionEdge:
                ++s.transitionTiles;
                break;
            case TraversalStatus::Interactable:
                ++s.interactableTiles;
                break;
        }
        ++s.knownTiles;
    });
    return s;
}

AreaWindow AreaMap::window(const Coordinate& center, int halfRows, int halfCols) const {
    AreaWindow w;
    w.topLeft = {center.x - halfCols, center.y - halfRows};
    w.rows = halfRows * 2 + 1;
    w.cols = halfCols * 2 + 1;
    w.traversalRows.reserve(static_cast<size_t>(w.rows));
    w.labels.reserve(static_cast<size_t>(w.rows));

    for (int r = 0; r < w.rows; ++r) {
        std::string line;
        std::vector<std::string> labels;
        line.reserve(static_cast<size_t>(w.cols));
        labels.reserve(static_cast<size_t>(w.cols));
        for (int col = 0; col < w.cols; ++col) {
            Coordinate c{w.topLeft.x + col, w.topLeft.y + r};
            line += toChar(m_traversal.get(c));
            labels.push_back(m_terrain.get(c));
        }
        w.traversalRows.push_back(std::move(line));
        w.labels.push_back(std::move(labels));
    }
    return w;
}

} // namespace Wayfarer
