/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/OutcomeClassifier.hpp"
#include "core/Logger.hpp"
#include <format>

namespace Wayfarer {

namespace {
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;
} // namespace

std::string describe(const ActionOutcome& outcome) {
    return std::visit(
        Overloaded{
            [](const Outcome::Moved& o) {
                return std::format("moved ({},{}) -> ({},{})", o.from.x, o.from.y, o.to.x, o.to.y);
            },
            [](const Outcome::Turned& o) {
                return std::format("turned {} -> {}", toString(o.fromFacing), toString(o.toFacing));
            },
            [](const Outcome::Blocked& o) {
                return std::format("blocked at ({},{})", o.target.x, o.target.y);
            },
            [](const Outcome::AreaChanged& o) {
                return std::format("area {} ({},{}) -> {} ({},{}) going {}", o.fromArea.toKey(),
                                   o.exit.x, o.exit.y, o.toArea.toKey(), o.entry.x, o.entry.y,
                                   toString(o.direction));
            },
            [](const Outcome::Interacted& o) {
                return std::format("interacted with ({},{}){}", o.faced.x, o.faced.y,
                                   o.dialogueOpened ? " dialogue opened" : "");
            },
            [](const Outcome::AutoDialogue& o) {
                return std::format("dialogue triggered stepping onto ({},{})", o.trigger.x,
                                   o.trigger.y);
            },
            [](const Outcome::Waited&) { return std::string("waited"); },
            [](const Outcome::Unknown& o) { return std::format("unknown: {}", o.reason); },
        },
        outcome);
}

ActionOutcome OutcomeClassifier::classify(const ClassifierInput& input) {
    const AgentSnapshot& before = input.before;
    const AgentSnapshot& after = input.after;

    if (!before.valid || !after.valid) {
        OUTCOME_WARN(std::format("Snapshot invalid for {}", toString(input.action)));
        return Outcome::Unknown{"invalid snapshot"};
    }

    const bool directional = isDirectional(input.action);
    const Direction attempted = directional ? toDirection(input.action) : before.facing;

    if (!(before.area == after.area)) {
        Outcome::AreaChanged changed;
        changed.fromArea = before.area;
        changed.exit = directional ? step(before.position, attempted) : before.position;
        changed.toArea = after.area;
        changed.entry = after.position;
        changed.direction = attempted;
        changed.toAreaName = after.areaName;
        return changed;
    }

    if (directional) {
        if (!(before.position == after.position)) {
            if (input.dialogueBecameActive) {
                return Outcome::AutoDialogue{before.position, after.position, after.position};
            }
            return Outcome::Moved{before.position, after.position};
        }
        if (before.facing != after.facing) {
            return Outcome::Turned{before.facing, after.facing};
        }
        return Outcome::Blocked{step(before.position, attempted)};
    }

    if (input.action == Action::A) {
        if (before.facing == Direction::None) {
            return Outcome::Unknown{"interact without a facing direction"};
        }
        return Outcome::Interacted{step(before.position, before.facing),
                                   input.dialogueBecameActive};
    }

    return Outcome::Waited{};
}

} // namespace Wayfarer
