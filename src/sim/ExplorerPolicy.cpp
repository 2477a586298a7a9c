/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "sim/ExplorerPolicy.hpp"
#include "core/Logger.hpp"
#include <array>

namespace Wayfarer {

ExplorerPolicy::ExplorerPolicy(uint32_t seed) : m_rng(seed) {}

bool ExplorerPolicy::facingUnmarkedPerson(const DecisionContext& context) const {
    const AreaWindow& w = context.window;
    const Coordinate faced = step(context.agent.position, context.agent.facing);
    const int row = faced.y - w.topLeft.y;
    const int col = faced.x - w.topLeft.x;
    if (row < 0 || row >= w.rows || col < 0 || col >= w.cols) {
        return false;
    }
    return w.labels[static_cast<size_t>(row)][static_cast<size_t>(col)] == "npc" &&
           w.statusAt(row, col) != TraversalStatus::Interactable;
}

Action ExplorerPolicy::decide(const DecisionContext& context) {
    if (context.agent.mode == AgentMode::Dialogue) {
        return Action::B;
    }
    if (facingUnmarkedPerson(context)) {
        return Action::A;
    }
    if (context.suggestion.direction != Direction::None) {
        return toAction(context.suggestion.direction);
    }

    static constexpr std::array<Action, 4> DIRECTIONS{Action::Up, Action::Down, Action::Left,
                                                      Action::Right};
    std::uniform_int_distribution<size_t> pick(0, DIRECTIONS.size() - 1);
    ++m_randomChoices;
    const Action chosen = DIRECTIONS[pick(m_rng)];
    SIM_DEBUG(std::string("No suggestion, trying ") + toString(chosen));
    return chosen;
}

} // namespace Wayfarer
