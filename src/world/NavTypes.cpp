/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/NavTypes.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

namespace Wayfarer {

namespace {
std::string normalized(const std::string& text) {
    return boost::algorithm::to_upper_copy(boost::algorithm::trim_copy(text));
}
} // namespace

std::optional<Direction> directionFromString(const std::string& text) {
    const std::string key = normalized(text);
    if (key == "UP") return Direction::Up;
    if (key == "DOWN") return Direction::Down;
    if (key == "LEFT") return Direction::Left;
    if (key == "RIGHT") return Direction::Right;
    if (key == "NONE") return Direction::None;
    return std::nullopt;
}

std::optional<Action> actionFromString(const std::string& text) {
    const std::string key = normalized(text);
    if (key == "UP") return Action::Up;
    if (key == "DOWN") return Action::Down;
    if (key == "LEFT") return Action::Left;
    if (key == "RIGHT") return Action::Right;
    if (key == "A" || key == "INTERACT") return Action::A;
    if (key == "B") return Action::B;
    if (key == "START") return Action::Start;
    if (key == "SELECT") return Action::Select;
    if (key == "WAIT") return Action::Wait;
    return std::nullopt;
}

} // namespace Wayfarer
