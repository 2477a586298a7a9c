/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/SettleWaiter.hpp"
#include "core/Logger.hpp"
#include <SDL3/SDL.h>
#include <algorithm>
#include <format>

namespace Wayfarer {

SettleWaiter::SettleWaiter(const SettleConfig& config) : m_config(config) {
    m_config.stablePolls = std::max(1, m_config.stablePolls);
    m_config.timeoutMs = std::max(m_config.timeoutMs, m_config.minSettleMs);
}

SettleReport SettleWaiter::wait(IPositionSource& source, const AgentSnapshot& before,
                                bool watchDialogue) {
    SettleReport report;
    report.snapshot = before;

    const uint64_t start = SDL_GetTicks();
    AgentSnapshot previous = before;
    int stable = 0;
    bool areaChanged = false;

    while (true) {
        if (m_config.pollIntervalMs > 0) {
            SDL_Delay(m_config.pollIntervalMs);
        }
        AgentSnapshot snap = source.poll();
        report.polls++;
        report.elapsedMs = SDL_GetTicks() - start;
        report.snapshot = snap;

        if (snap.valid) {
            if (!isNavigable(snap.mode)) {
                report.result = SettleResult::INTERRUPTED;
                SETTLE_DEBUG(std::format("Interrupted by {} mode after {} polls",
                                         snap.mode == AgentMode::Battle ? "battle" : "menu",
                                         report.polls));
                return report;
            }
            if (watchDialogue && report.polls <= m_config.dialogueWatchPolls &&
                snap.mode == AgentMode::Dialogue && before.mode != AgentMode::Dialogue) {
                report.dialogueBecameActive = true;
            }
            if (before.valid && !(snap.area == before.area)) {
                areaChanged = true;
            }
        }

        stable = (snap.valid && snap.samePlace(previous)) ? stable + 1 : 0;
        previous = snap;

        if (report.elapsedMs >= m_config.minSettleMs && stable >= m_config.stablePolls) {
            report.result =
                areaChanged ? SettleResult::AREA_CHANGED_MID_WAIT : SettleResult::STABILIZED;
            return report;
        }
        if (report.elapsedMs >= m_config.timeoutMs) {
            report.result = areaChanged ? SettleResult::AREA_CHANGED_MID_WAIT
                                        : SettleResult::TIMED_OUT;
            SETTLE_WARN(std::format("No stable state after {} ms ({} polls)", report.elapsedMs,
                                    report.polls));
            return report;
        }
    }
}

} // namespace Wayfarer
