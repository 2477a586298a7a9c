/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ACTION_OUTCOME_HPP
#define ACTION_OUTCOME_HPP

#include "world/NavTypes.hpp"
#include <ostream>
#include <string>
#include <variant>

namespace Wayfarer {

namespace Outcome {

struct Moved {
    Coordinate from;
    Coordinate to;
};

struct Turned {
    Direction fromFacing{Direction::None};
    Direction toFacing{Direction::None};
};

struct Blocked {
    Coordinate target;
};

struct AreaChanged {
    AreaId fromArea;
    Coordinate exit;
    AreaId toArea;
    Coordinate entry;
    Direction direction{Direction::None};
    std::string toAreaName;
};

struct Interacted {
    Coordinate faced;
    bool dialogueOpened{false};
};

// A step that triggered dialogue on its own (walk-on script, NPC spotting)
struct AutoDialogue {
    Coordinate from;
    Coordinate to;
    Coordinate trigger;
};

struct Waited {};

struct Unknown {
    std::string reason;
};

} // namespace Outcome

using ActionOutcome = std::variant<Outcome::Moved, Outcome::Turned, Outcome::Blocked,
                                   Outcome::AreaChanged, Outcome::Interacted,
                                   Outcome::AutoDialogue, Outcome::Waited, Outcome::Unknown>;

enum class OutcomeKind : uint8_t {
    MOVED,
    TURNED,
    BLOCKED,
    AREA_CHANGED,
    INTERACTED,
    AUTO_DIALOGUE,
    WAITED,
    UNKNOWN
};

inline OutcomeKind kindOf(const ActionOutcome& outcome) {
    return static_cast<OutcomeKind>(outcome.index());
}

inline std::ostream& operator<<(std::ostream& os, const OutcomeKind& kind) {
    switch (kind) {
        case OutcomeKind::MOVED: return os << "MOVED";
        case OutcomeKind::TURNED: return os << "TURNED";
        case OutcomeKind::BLOCKED: return os << "BLOCKED";
        case OutcomeKind::AREA_CHANGED: return os << "AREA_CHANGED";
        case OutcomeKind::INTERACTED: return os << "INTERACTED";
        case OutcomeKind::AUTO_DIALOGUE: return os << "AUTO_DIALOGUE";
        case OutcomeKind::WAITED: return os << "WAITED";
        case OutcomeKind::UNKNOWN: return os << "UNKNOWN";
        default: return os << "INVALID";
    }
}

std::string describe(const ActionOutcome& outcome);

} // namespace Wayfarer

#endif // ACTION_OUTCOME_HPP
