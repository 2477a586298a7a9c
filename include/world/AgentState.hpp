/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AGENT_STATE_HPP
#define AGENT_STATE_HPP

#include "world/NavTypes.hpp"
#include <ostream>
#include <string>

namespace Wayfarer {

enum class AgentMode : uint8_t {
    Overworld,
    Dialogue,
    Battle,
    Menu
};

inline std::ostream& operator<<(std::ostream& os, const AgentMode& mode) {
    switch (mode) {
        case AgentMode::Overworld: return os << "OVERWORLD";
        case AgentMode::Dialogue: return os << "DIALOGUE";
        case AgentMode::Battle: return os << "BATTLE";
        case AgentMode::Menu: return os << "MENU";
        default: return os << "UNKNOWN";
    }
}

// Battle and menus take over the controls; navigation has to stop
inline bool isNavigable(AgentMode mode) {
    return mode == AgentMode::Overworld || mode == AgentMode::Dialogue;
}

/**
 * @brief One read of the agent's position, facing and game mode.
 *
 * valid is false when the underlying read failed or returned garbage.
 */
struct AgentSnapshot {
    AreaId area;
    std::string areaName;
    Coordinate position;
    Direction facing{Direction::None};
    AgentMode mode{AgentMode::Overworld};
    bool valid{false};

    // Compares what matters for settling; the display name is ignored
    bool samePlace(const AgentSnapshot& other) const {
        return area == other.area && position == other.position &&
               facing == other.facing && mode == other.mode && valid == other.valid;
    }
};

} // namespace Wayfarer

#endif // AGENT_STATE_HPP
