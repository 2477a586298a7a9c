/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE TraversalUpdaterTests
#include <boost/test/unit_test.hpp>

#include "ai/TraversalUpdater.hpp"
#include "managers/AreaMapManager.hpp"
#include "mocks/MockCollaborators.hpp"
#include <filesystem>

using namespace Wayfarer;

namespace {
const AreaId TOWN{1, 1};
const AreaId HOUSE{2, 1};
} // namespace

struct UpdaterFixture {
    Testing::TempDataDir dir{"updater"};
    AreaMapManager maps{dir.str()};
    ConnectivityGraph graph;
    TraversalUpdater updater{maps, graph};
    ActiveArea active;

    UpdaterFixture() { updater.enterArea(active, TOWN, "Town", {5, 5}); }
};

BOOST_FIXTURE_TEST_SUITE(TraversalUpdaterTestSuite, UpdaterFixture)

BOOST_AUTO_TEST_CASE(TestEnterAreaBindsActiveMap) {
    BOOST_REQUIRE(active.isSet());
    BOOST_CHECK_EQUAL(active.id(), TOWN);
    BOOST_CHECK_EQUAL(active->statusAt({5, 5}), TraversalStatus::Player);
    BOOST_CHECK_EQUAL(active->visitCount(), 1);

    // Re-entering the same area is not a new visit
    updater.enterArea(active, TOWN, "Town", {5, 6});
    BOOST_CHECK_EQUAL(active->visitCount(), 1);
    BOOST_CHECK_EQUAL(active->statusAt({5, 5}), TraversalStatus::Walkable);
}

BOOST_AUTO_TEST_CASE(TestMovedMarksVacatedWalkable) {
    UpdateReport report = updater.apply(active, Outcome::Moved{{5, 5}, {5, 6}});
    BOOST_CHECK(report.mapChanged);
    BOOST_CHECK_EQUAL(active->statusAt({5, 5}), TraversalStatus::Walkable);
    BOOST_CHECK_EQUAL(active->statusAt({5, 6}), TraversalStatus::Player);
}

BOOST_AUTO_TEST_CASE(TestLedgeHopMarksLedge) {
    updater.apply(active, Outcome::Moved{{5, 5}, {5, 7}});
    BOOST_CHECK_EQUAL(active->statusAt({5, 5}), TraversalStatus::Ledge);
    BOOST_CHECK_EQUAL(active->statusAt({5, 7}), TraversalStatus::Player);
}

BOOST_AUTO_TEST_CASE(TestBlockedMarksTarget) {
    UpdateReport first = updater.apply(active, Outcome::Blocked{{5, 4}});
    BOOST_CHECK(first.mapChanged);
    BOOST_CHECK(!first.repeatedBlock);
    BOOST_CHECK_EQUAL(active->statusAt({5, 4}), TraversalStatus::Blocked);

    UpdateReport again = updater.apply(active, Outcome::Blocked{{5, 4}});
    BOOST_CHECK(!again.mapChanged);
    BOOST_CHECK(again.repeatedBlock);
}

BOOST_AUTO_TEST_CASE(TestBlockedNeverDowngradesTransitionOrInteractable) {
    active->markTransition({6, 5});
    active->markTraversal({4, 5}, TraversalStatus::Interactable);

    updater.apply(active, Outcome::Blocked{{6, 5}});
    updater.apply(active, Outcome::Blocked{{4, 5}});
    BOOST_CHECK_EQUAL(active->statusAt({6, 5}), TraversalStatus::TransitionEdge);
    BOOST_CHECK_EQUAL(active->statusAt({4, 5}), TraversalStatus::Interactable);
}

BOOST_AUTO_TEST_CASE(TestTurnedChangesNothing) {
    UpdateReport report = updater.apply(active, Outcome::Turned{Direction::Down, Direction::Left});
    BOOST_CHECK(!report.mapChanged);
    BOOST_CHECK_EQUAL(active->statusAt({5, 5}), TraversalStatus::Player);
}

BOOST_AUTO_TEST_CASE(TestInteractionWithDialogueMarksInteractable) {
    updater.apply(active, Outcome::Interacted{{5, 4}, false});
    BOOST_CHECK_EQUAL(active->statusAt({5, 4}), TraversalStatus::Unknown);

    UpdateReport report = updater.apply(active, Outcome::Interacted{{5, 4}, true});
    BOOST_CHECK(report.mapChanged);
    BOOST_CHECK_EQUAL(active->statusAt({5, 4}), TraversalStatus::Interactable);
}

BOOST_AUTO_TEST_CASE(TestWalkOnTriggerBecomesInteractableAfterLeaving) {
    updater.apply(active, Outcome::AutoDialogue{{5, 5}, {5, 6}, {5, 6}});
    BOOST_CHECK_EQUAL(active->statusAt({5, 6}), TraversalStatus::Player);

    updater.apply(active, Outcome::Moved{{5, 6}, {6, 6}});
    BOOST_CHECK_EQUAL(active->statusAt({5, 6}), TraversalStatus::Interactable);
    BOOST_CHECK_EQUAL(active->statusAt({5, 5}), TraversalStatus::Walkable);
}

BOOST_AUTO_TEST_CASE(TestAreaChangeSwitchesMapsAndRecordsConnection) {
    AreaMap* town = active.get();

    Outcome::AreaChanged change{TOWN, {5, 4}, HOUSE, {3, 2}, Direction::Up, "House"};
    UpdateReport report = updater.apply(active, change);

    BOOST_CHECK(report.areaSwitched);
    BOOST_CHECK(report.connectionChanged);
    BOOST_CHECK_EQUAL(active.id(), HOUSE);
    BOOST_CHECK_EQUAL(active->displayName(), "House");
    BOOST_CHECK_EQUAL(active->statusAt({3, 2}), TraversalStatus::TransitionEdge);
    BOOST_CHECK_EQUAL(active->playerCoord().value(), (Coordinate{3, 2}));

    BOOST_CHECK_EQUAL(town->statusAt({5, 4}), TraversalStatus::TransitionEdge);
    BOOST_CHECK_EQUAL(town->statusAt({5, 5}), TraversalStatus::Walkable);
    BOOST_CHECK(!town->playerCoord().has_value());

    BOOST_CHECK_EQUAL(graph.exitsTo(TOWN, HOUSE).size(), 1u);
    BOOST_CHECK_EQUAL(graph.exitsTo(HOUSE, TOWN).size(), 1u);

    // The map left behind and the graph were both written out
    BOOST_CHECK(maps.hasRecord(TOWN));
    BOOST_CHECK(std::filesystem::exists(dir.path / AreaMapManager::CONNECTIONS_FILE));

    // Walking the same door again adds nothing new
    Outcome::AreaChanged back{HOUSE, {3, 3}, TOWN, {5, 5}, Direction::Down, "Town"};
    updater.apply(active, back);
    updater.apply(active, Outcome::Moved{{5, 5}, {5, 6}});
    updater.apply(active, Outcome::Moved{{5, 6}, {5, 5}});
    UpdateReport repeat = updater.apply(active, change);
    BOOST_CHECK(!repeat.connectionChanged);
}

BOOST_AUTO_TEST_CASE(TestUnknownOutcomeIsNoOp) {
    UpdateReport report = updater.apply(active, Outcome::Unknown{"garbled read"});
    BOOST_CHECK(!report.mapChanged);
    BOOST_CHECK(!report.areaSwitched);
}

BOOST_AUTO_TEST_SUITE_END()
