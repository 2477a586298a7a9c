/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef EXPLORER_POLICY_HPP
#define EXPLORER_POLICY_HPP

#include "core/Collaborators.hpp"
#include <cstdint>
#include <random>

namespace Wayfarer {

/**
 * @brief Rule-based decision source that follows the exploration advisor.
 *
 * Closes dialogue, talks to an unmarked person it is facing, otherwise
 * walks the suggested direction. With no suggestion it picks a random
 * direction from a seeded generator so runs are reproducible.
 */
class ExplorerPolicy : public IDecisionSource {
public:
    explicit ExplorerPolicy(uint32_t seed = 1);

    Action decide(const DecisionContext& context) override;

    uint64_t randomChoices() const { return m_randomChoices; }

private:
    bool facingUnmarkedPerson(const DecisionContext& context) const;

    std::mt19937 m_rng;
    uint64_t m_randomChoices{0};
};

} // namespace Wayfarer

#endif // EXPLORER_POLICY_HPP
