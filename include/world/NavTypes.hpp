/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef NAV_TYPES_HPP
#define NAV_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <format>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

namespace Wayfarer {

/**
 * @brief Identifies one discrete region of the world (a town, a route, a house).
 *
 * Derived from the game's (group, number) pair. Stable across sessions and
 * used as the persistence key.
 */
struct AreaId {
    int group{0};
    int number{0};

    std::string toKey() const { return std::format("area_{}_{}", group, number); }

    bool operator==(const AreaId& other) const = default;
    bool operator<(const AreaId& other) const {
        return group != other.group ? group < other.group : number < other.number;
    }
};

inline std::ostream& operator<<(std::ostream& os, const AreaId& id) {
    return os << id.toKey();
}

// Area-local tile coordinate. +x is Right, +y is Down.
struct Coordinate {
    int x{0};
    int y{0};

    bool operator==(const Coordinate& other) const = default;
    bool operator<(const Coordinate& other) const {
        return y != other.y ? y < other.y : x < other.x;
    }
};

inline int manhattan(const Coordinate& a, const Coordinate& b) {
    return std::abs(a.x - b.x) + std::abs(a.y - b.y);
}

inline std::ostream& operator<<(std::ostream& os, const Coordinate& c) {
    return os << "(" << c.x << "," << c.y << ")";
}

enum class Direction : uint8_t {
    Up,
    Down,
    Left,
    Right,
    None
};

inline Direction opposite(Direction d) {
    switch (d) {
        case Direction::Up: return Direction::Down;
        case Direction::Down: return Direction::Up;
        case Direction::Left: return Direction::Right;
        case Direction::Right: return Direction::Left;
        default: return Direction::None;
    }
}

inline Coordinate step(const Coordinate& from, Direction d) {
    switch (d) {
        case Direction::Up: return {from.x, from.y - 1};
        case Direction::Down: return {from.x, from.y + 1};
        case Direction::Left: return {from.x - 1, from.y};
        case Direction::Right: return {from.x + 1, from.y};
        default: return from;
    }
}

// Direction of a single orthogonal hop, None when the tiles are not adjacent
inline Direction directionBetween(const Coordinate& from, const Coordinate& to) {
    int dx = to.x - from.x;
    int dy = to.y - from.y;
    if (dx == 0 && dy == -1) return Direction::Up;
    if (dx == 0 && dy == 1) return Direction::Down;
    if (dx == -1 && dy == 0) return Direction::Left;
    if (dx == 1 && dy == 0) return Direction::Right;
    return Direction::None;
}

inline const char* toString(Direction d) {
    switch (d) {
        case Direction::Up: return "UP";
        case Direction::Down: return "DOWN";
        case Direction::Left: return "LEFT";
        case Direction::Right: return "RIGHT";
        default: return "NONE";
    }
}

std::optional<Direction> directionFromString(const std::string& text);

inline std::ostream& operator<<(std::ostream& os, const Direction& d) {
    return os << toString(d);
}

/**
 * @brief Controller inputs the agent can issue. Interact is A.
 */
enum class Action : uint8_t {
    Up,
    Down,
    Left,
    Right,
    A,
    B,
    Start,
    Select,
    Wait
};

inline bool isDirectional(Action a) {
    return a == Action::Up || a == Action::Down || a == Action::Left ||
           a == Action::Right;
}

inline Direction toDirection(Action a) {
    switch (a) {
        case Action::Up: return Direction::Up;
        case Action::Down: return Direction::Down;
        case Action::Left: return Direction::Left;
        case Action::Right: return Direction::Right;
        default: return Direction::None;
    }
}

inline Action toAction(Direction d) {
    switch (d) {
        case Direction::Up: return Action::Up;
        case Direction::Down: return Action::Down;
        case Direction::Left: return Action::Left;
        case Direction::Right: return Action::Right;
        default: return Action::Wait;
    }
}

inline const char* toString(Action a) {
    switch (a) {
        case Action::Up: return "UP";
        case Action::Down: return "DOWN";
        case Action::Left: return "LEFT";
        case Action::Right: return "RIGHT";
        case Action::A: return "A";
        case Action::B: return "B";
        case Action::Start: return "START";
        case Action::Select: return "SELECT";
        case Action::Wait: return "WAIT";
        default: return "UNKNOWN";
    }
}

std::optional<Action> actionFromString(const std::string& text);

inline std::ostream& operator<<(std::ostream& os, const Action& a) {
    return os << toString(a);
}

/**
 * @brief What the agent has learned about entering a tile.
 *
 * Persisted as a single character per tile.
 */
enum class TraversalStatus : uint8_t {
    Unknown,
    Walkable,
    Blocked,
    Player,
    TransitionEdge,
    Interactable,
    Ledge
};

inline char toChar(TraversalStatus s) {
    switch (s) {
        case TraversalStatus::Walkable: return 'W';
        case TraversalStatus::Blocked: return 'N';
        case TraversalStatus::Player: return 'P';
        case TraversalStatus::TransitionEdge: return 'T';
        case TraversalStatus::Interactable: return 'I';
        case TraversalStatus::Ledge: return 'L';
        default: return '?';
    }
}

inline TraversalStatus traversalFromChar(char c) {
    switch (c) {
        case 'W':
        case 'Y': // older saves used Y for walkable
            return TraversalStatus::Walkable;
        case 'N': return TraversalStatus::Blocked;
        case 'P': return TraversalStatus::Player;
        case 'T': return TraversalStatus::TransitionEdge;
        case 'I': return TraversalStatus::Interactable;
        case 'L': return TraversalStatus::Ledge;
        default: return TraversalStatus::Unknown;
    }
}

// Blocked and Interactable tiles can never be stepped onto
inline bool isImpassable(TraversalStatus s) {
    return s == TraversalStatus::Blocked || s == TraversalStatus::Interactable;
}

inline std::ostream& operator<<(std::ostream& os, const TraversalStatus& s) {
    switch (s) {
        case TraversalStatus::Unknown: return os << "UNKNOWN";
        case TraversalStatus::Walkable: return os << "WALKABLE";
        case TraversalStatus::Blocked: return os << "BLOCKED";
        case TraversalStatus::Player: return os << "PLAYER";
        case TraversalStatus::TransitionEdge: return os << "TRANSITION_EDGE";
        case TraversalStatus::Interactable: return os << "INTERACTABLE";
        case TraversalStatus::Ledge: return os << "LEDGE";
        default: return os << "INVALID";
    }
}

inline const std::string UNKNOWN_LABEL = "?";

} // namespace Wayfarer

template <>
struct std::hash<Wayfarer::AreaId> {
    size_t operator()(const Wayfarer::AreaId& id) const noexcept {
        return std::hash<int64_t>{}((static_cast<int64_t>(id.group) << 32) ^
                                    static_cast<uint32_t>(id.number));
    }
};

template <>
struct std::hash<Wayfarer::Coordinate> {
    size_t operator()(const Wayfarer::Coordinate& c) const noexcept {
        return std::hash<int64_t>{}((static_cast<int64_t>(c.x) << 32) ^
                                    static_cast<uint32_t>(c.y));
    }
};

#endif // NAV_TYPES_HPP
