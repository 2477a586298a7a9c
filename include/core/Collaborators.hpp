/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLABORATORS_HPP
#define COLLABORATORS_HPP

#include "ai/ActionOutcome.hpp"
#include "ai/ExplorationAdvisor.hpp"
#include "world/AgentState.hpp"
#include "world/AreaMap.hpp"
#include "world/ConnectivityGraph.hpp"
#include "world/ObservationMerger.hpp"
#include <optional>
#include <vector>

namespace Wayfarer {

/**
 * @brief Reads the agent's area, tile, facing and mode from the game.
 *
 * Must be side-effect free; it is polled repeatedly while an action settles.
 */
class IPositionSource {
public:
    virtual ~IPositionSource() = default;
    virtual AgentSnapshot poll() = 0;
};

/**
 * @brief Produces the labelled vision window around the agent.
 */
class IVisionSource {
public:
    virtual ~IVisionSource() = default;
    virtual std::optional<Observation> captureObservation() = 0;
};

/**
 * @brief Presses one button. Fire-and-forget.
 * @return false if the input could not be delivered
 */
class IActionExecutor {
public:
    virtual ~IActionExecutor() = default;
    virtual bool execute(Action action) = 0;
};

// Read-only view handed to the decision source each cycle
struct DecisionContext {
    uint64_t cycle{0};
    AgentSnapshot agent;
    AreaSummary area;
    AreaWindow window;
    ExplorationSuggestion suggestion;
    std::vector<AreaConnection> connections;
    std::optional<ActionOutcome> lastOutcome;
    bool stuck{false};
};

/**
 * @brief Chooses the next action (a policy model, a script, a test double).
 */
class IDecisionSource {
public:
    virtual ~IDecisionSource() = default;
    virtual Action decide(const DecisionContext& context) = 0;
};

} // namespace Wayfarer

#endif // COLLABORATORS_HPP
