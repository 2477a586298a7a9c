/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SETTLE_WAITER_HPP
#define SETTLE_WAITER_HPP

#include "core/Collaborators.hpp"
#include "world/AgentState.hpp"
#include <cstdint>
#include <ostream>

namespace Wayfarer {

struct SettleConfig {
    uint32_t minSettleMs{120};
    uint32_t timeoutMs{1500};
    uint32_t pollIntervalMs{16};
    int stablePolls{3};          // identical consecutive reads that count as settled
    int dialogueWatchPolls{6};   // how long a new dialogue is attributed to the action
};

enum class SettleResult { STABILIZED, TIMED_OUT, AREA_CHANGED_MID_WAIT, INTERRUPTED };

inline std::ostream& operator<<(std::ostream& os, const SettleResult& result) {
    switch (result) {
        case SettleResult::STABILIZED: return os << "STABILIZED";
        case SettleResult::TIMED_OUT: return os << "TIMED_OUT";
        case SettleResult::AREA_CHANGED_MID_WAIT: return os << "AREA_CHANGED_MID_WAIT";
        case SettleResult::INTERRUPTED: return os << "INTERRUPTED";
        default: return os << "UNKNOWN";
    }
}

struct SettleReport {
    SettleResult result{SettleResult::TIMED_OUT};
    AgentSnapshot snapshot;  // last read taken
    int polls{0};
    uint64_t elapsedMs{0};
    bool dialogueBecameActive{false};
};

/**
 * @brief Bounded wait for the game to finish reacting to an input.
 *
 * Polls the position source every pollIntervalMs until the snapshot has
 * been identical for stablePolls reads and at least minSettleMs passed, or
 * until timeoutMs. A change of area is reported as AREA_CHANGED_MID_WAIT
 * once the new area settles (or the wait times out). Battle or menu mode
 * ends the wait immediately as INTERRUPTED.
 */
class SettleWaiter {
public:
    explicit SettleWaiter(const SettleConfig& config = SettleConfig{});

    SettleReport wait(IPositionSource& source, const AgentSnapshot& before, bool watchDialogue);

    const SettleConfig& config() const { return m_config; }

private:
    SettleConfig m_config;
};

} // namespace Wayfarer

#endif // SETTLE_WAITER_HPP
