/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE NavigationConfigTests
#include <boost/test/unit_test.hpp>

#include "core/NavigationConfig.hpp"
#include "managers/SettingsManager.hpp"

using namespace Wayfarer;

struct SettingsFixture {
    SettingsManager& settings = SettingsManager::Instance();

    SettingsFixture() { settings.clearAll(); }
    ~SettingsFixture() { settings.clearAll(); }
};

BOOST_FIXTURE_TEST_SUITE(NavigationConfigTestSuite, SettingsFixture)

BOOST_AUTO_TEST_CASE(TestEmptySettingsGiveDefaults) {
    NavigationConfig config = NavigationConfig::fromSettings(settings);
    NavigationConfig defaults;

    BOOST_CHECK_EQUAL(config.merge.shape.rows, defaults.merge.shape.rows);
    BOOST_CHECK_EQUAL(config.merge.shape.cols, defaults.merge.shape.cols);
    BOOST_CHECK(config.merge.solidLabels == defaults.merge.solidLabels);
    BOOST_CHECK_CLOSE(config.pathfinder.unknownPenalty, 0.1f, 0.001f);
    BOOST_CHECK_EQUAL(config.advisor.stuckLimit, defaults.advisor.stuckLimit);
    BOOST_CHECK_EQUAL(config.settle.timeoutMs, defaults.settle.timeoutMs);
    BOOST_CHECK_EQUAL(config.persistence.dataDirectory, "");
}

BOOST_AUTO_TEST_CASE(TestOverridesApplied) {
    settings.applyOverride("observation.rows=11");
    settings.applyOverride("observation.agent_row=5");
    settings.applyOverride("merge.solid_labels=tree, water ,black");
    settings.applyOverride("pathfinding.unknown_penalty=0.5");
    settings.applyOverride("settle.timeout_ms=800");
    settings.applyOverride("persistence.data_dir=/tmp/wayfarer_maps");
    settings.applyOverride("loop.decision_log_size=10");

    NavigationConfig config = NavigationConfig::fromSettings(settings);
    BOOST_CHECK_EQUAL(config.merge.shape.rows, 11);
    BOOST_CHECK_EQUAL(config.merge.shape.agentRow, 5);
    BOOST_CHECK_EQUAL(config.merge.solidLabels.size(), 3u);
    BOOST_CHECK(config.merge.solidLabels.count("water") == 1);
    BOOST_CHECK_CLOSE(config.pathfinder.unknownPenalty, 0.5f, 0.001f);
    BOOST_CHECK_EQUAL(config.settle.timeoutMs, 800u);
    BOOST_CHECK_EQUAL(config.persistence.dataDirectory, "/tmp/wayfarer_maps");
    BOOST_CHECK_EQUAL(config.loop.decisionLogSize, 10u);
}

BOOST_AUTO_TEST_CASE(TestOutOfRangeValuesFallBack) {
    settings.set("pathfinding", "max_iterations", -5);
    settings.set("pathfinding", "unknown_penalty", -1.0f);
    settings.set("settle", "stable_polls", 0);

    NavigationConfig config = NavigationConfig::fromSettings(settings);
    NavigationConfig defaults;
    BOOST_CHECK_EQUAL(config.pathfinder.maxIterations, defaults.pathfinder.maxIterations);
    BOOST_CHECK_CLOSE(config.pathfinder.unknownPenalty, 0.1f, 0.001f);
    BOOST_CHECK_EQUAL(config.settle.stablePolls, defaults.settle.stablePolls);
}

BOOST_AUTO_TEST_CASE(TestAgentOutsideWindowRejected) {
    settings.set("observation", "rows", 5);
    settings.set("observation", "agent_row", 7);

    NavigationConfig config = NavigationConfig::fromSettings(settings);
    NavigationConfig defaults;
    BOOST_CHECK_EQUAL(config.merge.shape.rows, defaults.merge.shape.rows);
    BOOST_CHECK_EQUAL(config.merge.shape.agentRow, defaults.merge.shape.agentRow);
}

BOOST_AUTO_TEST_CASE(TestStoreThenReadBack) {
    NavigationConfig original;
    original.merge.solidLabels = {"tree", "black", "wall"};
    original.pathfinder.searchMargin = 4;
    original.settle.pollIntervalMs = 0;
    original.persistence.saveIntervalCycles = 7;
    original.storeTo(settings);

    NavigationConfig restored = NavigationConfig::fromSettings(settings);
    BOOST_CHECK(restored.merge.solidLabels == original.merge.solidLabels);
    BOOST_CHECK_EQUAL(restored.pathfinder.searchMargin, 4);
    BOOST_CHECK_EQUAL(restored.settle.pollIntervalMs, 0u);
    BOOST_CHECK_EQUAL(restored.persistence.saveIntervalCycles, 7);
}

BOOST_AUTO_TEST_SUITE_END()
