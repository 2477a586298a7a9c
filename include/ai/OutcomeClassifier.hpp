/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef OUTCOME_CLASSIFIER_HPP
#define OUTCOME_CLASSIFIER_HPP

#include "ai/ActionOutcome.hpp"
#include "world/AgentState.hpp"

namespace Wayfarer {

/**
 * @brief Everything known about one attempted action after it settled.
 */
struct ClassifierInput {
    Action action{Action::Wait};
    AgentSnapshot before;
    AgentSnapshot after;
    // Dialogue appeared during the post-action polling window
    bool dialogueBecameActive{false};
};

/**
 * @brief Turns before/after agent snapshots into a tagged outcome.
 *
 * Rules, in priority order:
 *  1. An area change dominates every other delta.
 *  2. Directional actions yield exactly one of Moved, Turned or Blocked.
 *     A move that opened dialogue is reported as AutoDialogue.
 *  3. Interact (A) yields Interacted carrying the faced tile.
 *  4. Wait and the remaining buttons yield Waited.
 *
 * Pure and total: an invalid snapshot degrades to Unknown.
 */
class OutcomeClassifier {
public:
    static ActionOutcome classify(const ClassifierInput& input);
};

} // namespace Wayfarer

#endif // OUTCOME_CLASSIFIER_HPP
