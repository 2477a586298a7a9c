/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "sim/GridWorldSim.hpp"
#include "core/Logger.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <algorithm>
#include <format>
#include <fstream>
#include <sstream>

namespace Wayfarer {

GridWorldSim::GridWorldSim(const ObservationShape& shape) : m_shape(shape) {}

void GridWorldSim::addArea(const AreaId& id, const std::string& name,
                           std::vector<std::string> rows) {
    m_areas[id] = SimArea{id, name, std::move(rows)};
}

void GridWorldSim::addWarp(const AreaId& area, const Coordinate& at, const AreaId& toArea,
                           const Coordinate& landing) {
    m_warps[area][at] = SimWarp{toArea, landing};
}

bool GridWorldSim::place(const AreaId& area, const Coordinate& position, Direction facing) {
    if (m_areas.count(area) == 0 || !isEnterable(area, position)) {
        SIM_ERROR(std::format("Cannot place agent at {},{} in {}", position.x, position.y,
                              area.toKey()));
        return false;
    }
    m_area = area;
    m_position = position;
    m_facing = facing;
    m_mode = AgentMode::Overworld;
    m_placed = true;
    return true;
}

char GridWorldSim::tileAt(const AreaId& area, const Coordinate& c) const {
    auto it = m_areas.find(area);
    if (it == m_areas.end() || c.y < 0 || c.x < 0) {
        return SimTiles::OUTSIDE;
    }
    const auto& rows = it->second.rows;
    if (static_cast<size_t>(c.y) >= rows.size() ||
        static_cast<size_t>(c.x) >= rows[static_cast<size_t>(c.y)].size()) {
        return SimTiles::OUTSIDE;
    }
    return rows[static_cast<size_t>(c.y)][static_cast<size_t>(c.x)];
}

std::string GridWorldSim::labelFor(char tile) {
    switch (tile) {
        case SimTiles::PATH: return "path";
        case SimTiles::GRASS: return "grass";
        case SimTiles::TREE: return "tree";
        case SimTiles::WALL: return "wall";
        case SimTiles::WATER: return "water";
        case SimTiles::PERSON: return "npc";
        case SimTiles::SIGN: return "path";
        case SimTiles::DOOR: return "door";
        case SimTiles::LEDGE: return "ledge";
        default: return "black";
    }
}

bool GridWorldSim::isEnterable(const AreaId& area, const Coordinate& c) const {
    if (warpAt(area, c) != nullptr) {
        return true;
    }
    switch (tileAt(area, c)) {
        case SimTiles::PATH:
        case SimTiles::GRASS:
        case SimTiles::SIGN:
        case SimTiles::DOOR:
            return true;
        default:
            return false;
    }
}

const SimWarp* GridWorldSim::warpAt(const AreaId& area, const Coordinate& c) const {
    auto areaIt = m_warps.find(area);
    if (areaIt == m_warps.end()) {
        return nullptr;
    }
    auto it = areaIt->second.find(c);
    return it != areaIt->second.end() ? &it->second : nullptr;
}

void GridWorldSim::tick() {
    if (m_modeTicksLeft > 0 && --m_modeTicksLeft == 0 &&
        (m_mode == AgentMode::Battle || m_mode == AgentMode::Menu)) {
        SIM_DEBUG(std::format("{} over", m_mode == AgentMode::Battle ? "Battle" : "Menu"));
        m_mode = AgentMode::Overworld;
    }
}

AgentSnapshot GridWorldSim::poll() {
    tick();
    AgentSnapshot snap;
    if (!m_placed || !m_positionReadable) {
        return snap;
    }
    snap.area = m_area;
    snap.areaName = m_areas.at(m_area).name;
    snap.position = m_position;
    snap.facing = m_facing;
    snap.mode = m_mode;
    snap.valid = true;
    return snap;
}

std::optional<Observation> GridWorldSim::captureObservation() {
    if (!m_placed || !m_visionAvailable) {
        return std::nullopt;
    }
    Observation obs;
    obs.tiles.reserve(static_cast<size_t>(m_shape.rows) * static_cast<size_t>(m_shape.cols));
    for (int row = 0; row < m_shape.rows; ++row) {
        for (int col = 0; col < m_shape.cols; ++col) {
            const Coordinate c{m_position.x + col - m_shape.agentCol,
                               m_position.y + row - m_shape.agentRow};
            char tile = tileAt(m_area, c);
            // Map-edge warps look like open ground
            if (tile == SimTiles::OUTSIDE && warpAt(m_area, c) != nullptr) {
                tile = SimTiles::PATH;
            }
            obs.tiles.push_back({row, col, labelFor(tile)});
        }
    }
    return obs;
}

void GridWorldSim::walk(Direction d) {
    if (m_facing != d) {
        m_facing = d;
        return;
    }

    const Coordinate target = step(m_position, d);
    if (const SimWarp* warp = warpAt(m_area, target)) {
        SIM_DEBUG(std::format("Warp {} -> {}", m_area.toKey(), warp->toArea.toKey()));
        m_area = warp->toArea;
        m_position = warp->landing;
        return;
    }

    const char tile = tileAt(m_area, target);
    if (tile == SimTiles::LEDGE) {
        const Coordinate landing = step(target, d);
        if (d == Direction::Down && isEnterable(m_area, landing)) {
            m_position = landing;
        }
        return;
    }
    if (!isEnterable(m_area, target)) {
        return;
    }

    m_position = target;
    if (tile == SimTiles::SIGN) {
        m_mode = AgentMode::Dialogue;
    } else if (tile == SimTiles::GRASS && m_encounterSteps > 0 &&
               ++m_grassSteps % m_encounterSteps == 0) {
        startBattle(BATTLE_TICKS);
    }
}

bool GridWorldSim::execute(Action action) {
    if (!m_inputConnected) {
        return false;
    }
    ++m_inputs;
    if (!m_placed) {
        return true;
    }

    switch (m_mode) {
        case AgentMode::Dialogue:
            if (action == Action::A || action == Action::B) {
                m_mode = AgentMode::Overworld;
            }
            return true;
        case AgentMode::Battle:
        case AgentMode::Menu:
            // The game owns the controls until the mode ends
            return true;
        case AgentMode::Overworld:
            break;
    }

    if (isDirectional(action)) {
        walk(toDirection(action));
    } else if (action == Action::A) {
        if (tileAt(m_area, step(m_position, m_facing)) == SimTiles::PERSON) {
            m_mode = AgentMode::Dialogue;
        }
    } else if (action == Action::Start) {
        m_mode = AgentMode::Menu;
        m_modeTicksLeft = MENU_TICKS;
    }
    return true;
}

void GridWorldSim::teleport(const AreaId& area, const Coordinate& position) {
    m_area = area;
    m_position = position;
}

void GridWorldSim::startBattle(int ticks) {
    m_mode = AgentMode::Battle;
    m_modeTicksLeft = std::max(1, ticks);
}

bool GridWorldSim::loadFromFile(const std::string& path, std::string& error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error = "Could not open world file: " + path;
        return false;
    }
    return loadFromText(file, error);
}

bool GridWorldSim::loadFromText(std::istream& input, std::string& error) {
    std::string line;
    int lineNumber = 0;
    bool haveStart = false;

    auto fail = [&](const std::string& message) {
        error = std::format("line {}: {}", lineNumber, message);
        return false;
    };

    while (std::getline(input, line)) {
        ++lineNumber;
        const std::string trimmed = boost::algorithm::trim_copy(line);
        if (trimmed.empty() || trimmed[0] == ';') {
            continue;
        }

        std::istringstream words(trimmed);
        std::string keyword;
        words >> keyword;

        if (keyword == "area") {
            AreaId id;
            std::string name;
            if (!(words >> id.group >> id.number)) {
                return fail("area needs a group and a number");
            }
            std::getline(words, name);
            boost::algorithm::trim(name);

            std::vector<std::string> rows;
            bool closed = false;
            while (std::getline(input, line)) {
                ++lineNumber;
                if (boost::algorithm::trim_copy(line) == "end") {
                    closed = true;
                    break;
                }
                boost::algorithm::trim_right(line);
                rows.push_back(line);
            }
            if (!closed) {
                return fail(std::format("area {} is missing 'end'", id.toKey()));
            }
            addArea(id, name, std::move(rows));
        } else if (keyword == "warp") {
            AreaId from;
            AreaId to;
            Coordinate at;
            Coordinate landing;
            std::string arrow;
            if (!(words >> from.group >> from.number >> at.x >> at.y >> arrow >> to.group >>
                  to.number >> landing.x >> landing.y) ||
                arrow != "->") {
                return fail("expected warp <g> <n> <x> <y> -> <g> <n> <x> <y>");
            }
            addWarp(from, at, to, landing);
        } else if (keyword == "start") {
            AreaId id;
            Coordinate at;
            std::string facingText;
            if (!(words >> id.group >> id.number >> at.x >> at.y >> facingText)) {
                return fail("expected start <g> <n> <x> <y> <facing>");
            }
            auto facing = directionFromString(facingText);
            if (!facing || *facing == Direction::None) {
                return fail("unknown facing '" + facingText + "'");
            }
            if (!place(id, at, *facing)) {
                return fail("start position is not an open tile of a known area");
            }
            haveStart = true;
        } else if (keyword == "encounter") {
            int steps = 0;
            if (!(words >> steps) || steps < 0) {
                return fail("encounter needs a non-negative step count");
            }
            m_encounterSteps = steps;
        } else if (boost::algorithm::starts_with(keyword, "#")) {
            return fail("layout rows must sit between 'area' and 'end'");
        } else {
            return fail("unknown keyword '" + keyword + "'");
        }
    }

    for (const auto& [area, warps] : m_warps) {
        for (const auto& [at, warp] : warps) {
            if (m_areas.count(area) == 0 || m_areas.count(warp.toArea) == 0) {
                error = std::format("warp at {},{} in {} references an unknown area", at.x, at.y,
                                    area.toKey());
                return false;
            }
        }
    }
    if (!haveStart) {
        error = "world has no start line";
        return false;
    }
    SIM_INFO(std::format("World loaded: {} areas", m_areas.size()));
    return true;
}

const char* GridWorldSim::demoWorldText() {
    return R"(; Three areas: a town with a house and a route to the south
area 1 1 Home Town
############
#....N.....#
#..........#
#...XXXX...#
#...XDXX...#
#..........#
#,,,,......#
#,,,,...S..#
#.......vvv#
#..........#
#####.######
end

area 1 2 Route 1
#.######
#......#
#..,,..#
#..,,..#
#..N...#
#......#
########
end

area 2 1 Player House
#######
#..N..#
#.....#
###D###
end

warp 1 1 5 11 -> 1 2 1 0
warp 1 2 1 -1 -> 1 1 5 10
warp 1 1 5 4 -> 2 1 3 2
warp 2 1 3 4 -> 1 1 5 5
start 1 1 2 2 DOWN
encounter 0
)";
}

} // namespace Wayfarer
