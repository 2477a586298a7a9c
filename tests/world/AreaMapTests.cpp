/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE AreaMapTests
#include <boost/test/unit_test.hpp>

#include "world/AreaMap.hpp"
#include "world/ObservationMerger.hpp"
#include <stdexcept>

using namespace Wayfarer;

namespace {

// Full 9x15 window of one label, with optional per-cell overrides
Observation uniformObservation(const std::string& label) {
    Observation obs;
    for (int r = 0; r < 9; ++r) {
        for (int c = 0; c < 15; ++c) {
            obs.tiles.push_back({r, c, label});
        }
    }
    return obs;
}

void setCell(Observation& obs, int row, int col, const std::string& label) {
    for (auto& t : obs.tiles) {
        if (t.row == row && t.col == col) {
            t.label = label;
        }
    }
}

struct AreaMapFixture {
    AreaMap map{AreaId{1, 3}, "Pallet Town"};
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(AreaMapTestSuite, AreaMapFixture)

BOOST_AUTO_TEST_CASE(TestFreshMapIsUnknown) {
    BOOST_CHECK_EQUAL(map.statusAt({0, 0}), TraversalStatus::Unknown);
    BOOST_CHECK_EQUAL(map.labelAt({4, 4}), UNKNOWN_LABEL);
    BOOST_CHECK(map.bounds().empty);
    BOOST_CHECK(!map.playerCoord().has_value());
    BOOST_CHECK_EQUAL(map.id().toKey(), "area_1_3");
}

BOOST_AUTO_TEST_CASE(TestPlayerMarkerIsUnique) {
    map.setPlayer({2, 2});
    map.setPlayer({3, 2});

    BOOST_CHECK_EQUAL(map.statusAt({3, 2}), TraversalStatus::Player);
    // The tile left behind was stood on, so it is walkable now
    BOOST_CHECK_EQUAL(map.statusAt({2, 2}), TraversalStatus::Walkable);
    size_t players = map.traversal().countIf(
        [](TraversalStatus s) { return s == TraversalStatus::Player; });
    BOOST_CHECK_EQUAL(players, 1u);
}

BOOST_AUTO_TEST_CASE(TestTransitionEdgeNeverDowngraded) {
    map.markTransition({5, 0});
    BOOST_CHECK(!map.markTraversal({5, 0}, TraversalStatus::Blocked));
    BOOST_CHECK(!map.markTraversal({5, 0}, TraversalStatus::Walkable));
    BOOST_CHECK_EQUAL(map.statusAt({5, 0}), TraversalStatus::TransitionEdge);

    // Standing on it keeps it a transition edge
    map.setPlayer({5, 0});
    BOOST_CHECK_EQUAL(map.statusAt({5, 0}), TraversalStatus::TransitionEdge);
    map.setPlayer({5, 1});
    BOOST_CHECK_EQUAL(map.statusAt({5, 0}), TraversalStatus::TransitionEdge);
}

BOOST_AUTO_TEST_CASE(TestMarkTraversalUnderPlayerUpdatesCoveredStatus) {
    map.setPlayer({1, 1});
    BOOST_CHECK(map.markTraversal({1, 1}, TraversalStatus::Interactable));
    BOOST_CHECK_EQUAL(map.statusAt({1, 1}), TraversalStatus::Player);
    BOOST_CHECK_EQUAL(map.coveredStatus(), TraversalStatus::Interactable);

    map.setPlayer({1, 2});
    BOOST_CHECK_EQUAL(map.statusAt({1, 1}), TraversalStatus::Interactable);
}

BOOST_AUTO_TEST_CASE(TestSummaryCounts) {
    map.markTraversal({0, 0}, TraversalStatus::Walkable);
    map.markTraversal({1, 0}, TraversalStatus::Blocked);
    map.markTraversal({2, 0}, TraversalStatus::Interactable);
    map.markTransition({3, 0});
    map.setPlayer({0, 1});
    map.recordVisit();

    AreaSummary s = map.summary();
    BOOST_CHECK_EQUAL(s.knownTiles, 5u);
    BOOST_CHECK_EQUAL(s.walkableTiles, 2u);
    BOOST_CHECK_EQUAL(s.blockedTiles, 1u);
    BOOST_CHECK_EQUAL(s.interactableTiles, 1u);
    BOOST_CHECK_EQUAL(s.transitionTiles, 1u);
    BOOST_CHECK_EQUAL(s.visitCount, 1);
    BOOST_CHECK_EQUAL(s.displayName, "Pallet Town");
}

BOOST_AUTO_TEST_CASE(TestWindowRendersAroundCenter) {
    map.markTraversal({0, 0}, TraversalStatus::Blocked);
    map.setPlayer({1, 0});

    AreaWindow w = map.window({1, 0}, 1, 1);
    BOOST_CHECK_EQUAL(w.rows, 3);
    BOOST_CHECK_EQUAL(w.cols, 3);
    BOOST_CHECK_EQUAL(w.traversalRows[1], "NP?");
    BOOST_CHECK_EQUAL(w.statusAt(1, 0), TraversalStatus::Blocked);
    BOOST_CHECK_EQUAL(w.render(), "???\nNP?\n???\n");
}

BOOST_AUTO_TEST_CASE(TestDisplayNameKeepsLastNonEmpty) {
    map.setDisplayName("");
    BOOST_CHECK_EQUAL(map.displayName(), "Pallet Town");
    map.setDisplayName("Pallet Town East");
    BOOST_CHECK_EQUAL(map.displayName(), "Pallet Town East");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ObservationMergerTestSuite)

BOOST_AUTO_TEST_CASE(TestMergePlacesWindowAroundAgent) {
    AreaMap map(AreaId{0, 0}, "Route");
    ObservationMerger merger(MergeConfig{});

    Observation obs = uniformObservation("grass");
    setCell(obs, 0, 0, "tree");
    BOOST_CHECK_EQUAL(merger.merge(map, obs, {10, 10}), MergeResult::MERGED);

    // Agent sits at row 4 col 7, so the window starts 7 left and 4 up
    BOOST_CHECK_EQUAL(map.labelAt({3, 6}), "tree");
    BOOST_CHECK_EQUAL(map.statusAt({3, 6}), TraversalStatus::Blocked);
    BOOST_CHECK_EQUAL(map.labelAt({17, 14}), "grass");
    BOOST_CHECK_EQUAL(map.statusAt({17, 14}), TraversalStatus::Unknown);
    BOOST_CHECK_EQUAL(map.statusAt({10, 10}), TraversalStatus::Player);
    BOOST_CHECK_EQUAL(map.bounds().width(), 15);
    BOOST_CHECK_EQUAL(map.bounds().height(), 9);
}

BOOST_AUTO_TEST_CASE(TestMergeTwiceIsIdempotent) {
    AreaMap map(AreaId{0, 0}, "Route");
    ObservationMerger merger(MergeConfig{});
    Observation obs = uniformObservation("path");
    setCell(obs, 2, 3, "black");
    setCell(obs, 8, 14, "Tree");

    merger.merge(map, obs, {0, 0});
    AreaWindow first = map.window({0, 0}, 6, 9);
    merger.merge(map, obs, {0, 0});
    AreaWindow second = map.window({0, 0}, 6, 9);

    BOOST_CHECK(first.traversalRows == second.traversalRows);
    BOOST_CHECK(first.labels == second.labels);
    // Solid labels match regardless of case
    BOOST_CHECK_EQUAL(map.statusAt({7, 4}), TraversalStatus::Blocked);
}

BOOST_AUTO_TEST_CASE(TestMergeNeverTouchesKnownTraversal) {
    AreaMap map(AreaId{0, 0}, "Route");
    map.markTraversal({1, 0}, TraversalStatus::Walkable);
    map.markTransition({2, 0});

    ObservationMerger merger(MergeConfig{});
    Observation obs = uniformObservation("tree");
    merger.merge(map, obs, {0, 0});

    BOOST_CHECK_EQUAL(map.statusAt({1, 0}), TraversalStatus::Walkable);
    BOOST_CHECK_EQUAL(map.statusAt({2, 0}), TraversalStatus::TransitionEdge);
    BOOST_CHECK_EQUAL(map.statusAt({0, 0}), TraversalStatus::Player);
}

BOOST_AUTO_TEST_CASE(TestMalformedObservationLeavesMapAlone) {
    AreaMap map(AreaId{0, 0}, "Route");
    ObservationMerger merger(MergeConfig{});

    Observation shortObs = uniformObservation("grass");
    shortObs.tiles.pop_back();
    BOOST_CHECK_EQUAL(merger.merge(map, shortObs, {0, 0}), MergeResult::MALFORMED);

    Observation outOfRange = uniformObservation("grass");
    outOfRange.tiles.back().row = 9;
    BOOST_CHECK_EQUAL(merger.merge(map, outOfRange, {0, 0}), MergeResult::MALFORMED);

    Observation duplicate = uniformObservation("grass");
    duplicate.tiles.back() = duplicate.tiles.front();
    std::string reason;
    BOOST_CHECK(!merger.validate(duplicate, reason));
    BOOST_CHECK(!reason.empty());

    BOOST_CHECK(map.bounds().empty);
}

BOOST_AUTO_TEST_CASE(TestNegativeCoordinatesCanBeDropped) {
    AreaMap map(AreaId{0, 0}, "Route");
    MergeConfig config;
    config.keepNegativeCoordinates = false;
    ObservationMerger merger(config);

    merger.merge(map, uniformObservation("path"), {0, 0});
    BOOST_CHECK_EQUAL(map.labelAt({-1, 0}), UNKNOWN_LABEL);
    BOOST_CHECK_EQUAL(map.labelAt({7, 4}), "path");
    BOOST_CHECK_EQUAL(map.terrain().bounds().minX, 0);
}

BOOST_AUTO_TEST_CASE(TestInvalidShapeThrows) {
    MergeConfig config;
    config.shape.agentRow = 9;
    BOOST_CHECK_THROW(ObservationMerger{config}, std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
