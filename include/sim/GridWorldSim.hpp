/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GRID_WORLD_SIM_HPP
#define GRID_WORLD_SIM_HPP

#include "core/Collaborators.hpp"
#include "world/AgentState.hpp"
#include "world/NavTypes.hpp"
#include "world/ObservationMerger.hpp"
#include <boost/container/flat_map.hpp>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Wayfarer {

/**
 * @brief Character legend of simulated area layouts.
 *
 *   .  path          ,  tall grass (may start an encounter)
 *   #  tree          X  wall
 *   ~  water         N  person, talk to them with A
 *   S  sign trigger  D  door
 *   v  ledge, jumped over going down
 *
 * Anything outside the rows reads as "black" and cannot be entered
 * unless a warp sits there.
 */
namespace SimTiles {
constexpr char PATH = '.';
constexpr char GRASS = ',';
constexpr char TREE = '#';
constexpr char WALL = 'X';
constexpr char WATER = '~';
constexpr char PERSON = 'N';
constexpr char SIGN = 'S';
constexpr char DOOR = 'D';
constexpr char LEDGE = 'v';
constexpr char OUTSIDE = ' ';
} // namespace SimTiles

struct SimArea {
    AreaId id;
    std::string name;
    std::vector<std::string> rows;
};

struct SimWarp {
    AreaId toArea;
    Coordinate landing;
};

/**
 * @brief Small tile world that stands in for the real game.
 *
 * Implements the position, vision and input collaborators so the whole
 * navigation loop can run headless. The simulated game advances one tick
 * per poll: battles and menus close on their own after a few ticks.
 * Pressing a direction the agent is not facing only turns it.
 */
class GridWorldSim : public IPositionSource, public IVisionSource, public IActionExecutor {
public:
    explicit GridWorldSim(const ObservationShape& shape = ObservationShape{});

    void addArea(const AreaId& id, const std::string& name, std::vector<std::string> rows);
    // Stepping onto at inside area moves the agent to landing in toArea
    void addWarp(const AreaId& area, const Coordinate& at, const AreaId& toArea,
                 const Coordinate& landing);
    bool place(const AreaId& area, const Coordinate& position, Direction facing);

    /**
     * @brief Reads a world description.
     *
     * Lines: "area <group> <number> <name>" followed by layout rows and
     * "end", "warp <g> <n> <x> <y> -> <g> <n> <x> <y>",
     * "start <g> <n> <x> <y> <facing>", "encounter <steps>". Lines starting
     * with ';' are comments.
     * @param error receives the first problem with its line number
     */
    bool loadFromText(std::istream& input, std::string& error);
    bool loadFromFile(const std::string& path, std::string& error);

    // The three-area world used by the command line tool
    static const char* demoWorldText();

    AgentSnapshot poll() override;
    std::optional<Observation> captureObservation() override;
    bool execute(Action action) override;

    // Game-side events, used to script situations
    void teleport(const AreaId& area, const Coordinate& position);
    void startBattle(int ticks);
    void setEncounterSteps(int steps) { m_encounterSteps = steps; }
    void setVisionAvailable(bool available) { m_visionAvailable = available; }
    void setPositionReadable(bool readable) { m_positionReadable = readable; }
    void setInputConnected(bool connected) { m_inputConnected = connected; }

    char tileAt(const AreaId& area, const Coordinate& c) const;
    static std::string labelFor(char tile);
    bool isEnterable(const AreaId& area, const Coordinate& c) const;

    const ObservationShape& shape() const { return m_shape; }
    const std::map<AreaId, SimArea>& areas() const { return m_areas; }
    const AreaId& currentArea() const { return m_area; }
    const Coordinate& position() const { return m_position; }
    Direction facing() const { return m_facing; }
    AgentMode mode() const { return m_mode; }
    size_t inputsReceived() const { return m_inputs; }

private:
    const SimWarp* warpAt(const AreaId& area, const Coordinate& c) const;
    void walk(Direction d);
    void tick();

    ObservationShape m_shape;
    std::map<AreaId, SimArea> m_areas;
    boost::container::flat_map<AreaId, std::map<Coordinate, SimWarp>> m_warps;

    AreaId m_area;
    Coordinate m_position;
    Direction m_facing{Direction::Down};
    AgentMode m_mode{AgentMode::Overworld};
    bool m_placed{false};

    int m_modeTicksLeft{0};
    int m_encounterSteps{0};
    int m_grassSteps{0};
    size_t m_inputs{0};

    bool m_visionAvailable{true};
    bool m_positionReadable{true};
    bool m_inputConnected{true};

    static constexpr int MENU_TICKS = 4;
    static constexpr int BATTLE_TICKS = 12;
};

} // namespace Wayfarer

#endif // GRID_WORLD_SIM_HPP
