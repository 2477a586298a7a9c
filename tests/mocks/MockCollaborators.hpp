/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MOCK_COLLABORATORS_HPP
#define MOCK_COLLABORATORS_HPP

#include "core/Collaborators.hpp"
#include <deque>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace Wayfarer {
namespace Testing {

inline AgentSnapshot makeSnapshot(AreaId area, Coordinate position,
                                  Direction facing = Direction::Down,
                                  AgentMode mode = AgentMode::Overworld,
                                  const std::string& name = "Test Area") {
    AgentSnapshot s;
    s.area = area;
    s.areaName = name;
    s.position = position;
    s.facing = facing;
    s.mode = mode;
    s.valid = true;
    return s;
}

// Returns queued snapshots in order, then repeats the last one forever
class ScriptedPositionSource : public IPositionSource {
public:
    void push(const AgentSnapshot& s) { m_queue.push_back(s); }
    void pushRepeated(const AgentSnapshot& s, int count) {
        for (int i = 0; i < count; ++i) m_queue.push_back(s);
    }
    void setSteady(const AgentSnapshot& s) {
        m_queue.clear();
        m_last = s;
    }

    AgentSnapshot poll() override {
        ++m_polls;
        if (!m_queue.empty()) {
            m_last = m_queue.front();
            m_queue.pop_front();
        }
        return m_last;
    }

    int polls() const { return m_polls; }

private:
    std::deque<AgentSnapshot> m_queue;
    AgentSnapshot m_last;
    int m_polls{0};
};

class MockVisionSource : public IVisionSource {
public:
    std::optional<Observation> next;

    std::optional<Observation> captureObservation() override {
        ++captures;
        return next;
    }

    int captures{0};
};

class RecordingExecutor : public IActionExecutor {
public:
    bool connected{true};
    std::vector<Action> actions;

    bool execute(Action action) override {
        if (!connected) return false;
        actions.push_back(action);
        return true;
    }
};

// Plays a fixed action list, then waits
class ScriptedDecisionSource : public IDecisionSource {
public:
    explicit ScriptedDecisionSource(std::vector<Action> script = {})
        : m_script(std::move(script)) {}

    Action decide(const DecisionContext& context) override {
        contexts.push_back(context);
        if (m_next < m_script.size()) {
            return m_script[m_next++];
        }
        return Action::Wait;
    }

    std::vector<DecisionContext> contexts;

private:
    std::vector<Action> m_script;
    size_t m_next{0};
};

// Fresh directory under the system temp path, removed on destruction
struct TempDataDir {
    std::filesystem::path path;

    explicit TempDataDir(const std::string& name) {
        path = std::filesystem::temp_directory_path() / ("wayfarer_test_" + name);
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
        std::filesystem::create_directories(path, ec);
    }
    ~TempDataDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::string str() const { return path.string(); }
};

} // namespace Testing
} // namespace Wayfarer

#endif // MOCK_COLLABORATORS_HPP
