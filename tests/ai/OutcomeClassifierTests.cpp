/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE OutcomeClassifierTests
#include <boost/test/unit_test.hpp>

#include "ai/OutcomeClassifier.hpp"
#include "mocks/MockCollaborators.hpp"

using namespace Wayfarer;
using Wayfarer::Testing::makeSnapshot;

namespace {
const AreaId TOWN{1, 1};
const AreaId HOUSE{2, 1};

ActionOutcome classify(Action action, const AgentSnapshot& before, const AgentSnapshot& after,
                       bool dialogue = false) {
    return OutcomeClassifier::classify({action, before, after, dialogue});
}
} // namespace

BOOST_AUTO_TEST_SUITE(OutcomeClassifierTestSuite)

BOOST_AUTO_TEST_CASE(TestMoveWhileFacing) {
    auto before = makeSnapshot(TOWN, {3, 3}, Direction::Right);
    auto after = makeSnapshot(TOWN, {4, 3}, Direction::Right);

    ActionOutcome outcome = classify(Action::Right, before, after);
    BOOST_REQUIRE_EQUAL(kindOf(outcome), OutcomeKind::MOVED);
    const auto& moved = std::get<Outcome::Moved>(outcome);
    BOOST_CHECK_EQUAL(moved.from, (Coordinate{3, 3}));
    BOOST_CHECK_EQUAL(moved.to, (Coordinate{4, 3}));
}

BOOST_AUTO_TEST_CASE(TestTurnInPlace) {
    auto before = makeSnapshot(TOWN, {3, 3}, Direction::Down);
    auto after = makeSnapshot(TOWN, {3, 3}, Direction::Left);

    ActionOutcome outcome = classify(Action::Left, before, after);
    BOOST_REQUIRE_EQUAL(kindOf(outcome), OutcomeKind::TURNED);
    BOOST_CHECK_EQUAL(std::get<Outcome::Turned>(outcome).toFacing, Direction::Left);
}

BOOST_AUTO_TEST_CASE(TestBlockedTargetsAdjacentTile) {
    auto before = makeSnapshot(TOWN, {3, 3}, Direction::Up);

    ActionOutcome outcome = classify(Action::Up, before, before);
    BOOST_REQUIRE_EQUAL(kindOf(outcome), OutcomeKind::BLOCKED);
    BOOST_CHECK_EQUAL(std::get<Outcome::Blocked>(outcome).target, (Coordinate{3, 2}));
}

BOOST_AUTO_TEST_CASE(TestAreaChangeDominates) {
    auto before = makeSnapshot(TOWN, {5, 5}, Direction::Down);
    auto after = makeSnapshot(HOUSE, {3, 2}, Direction::Up, AgentMode::Overworld, "House");

    ActionOutcome outcome = classify(Action::Up, before, after, true);
    BOOST_REQUIRE_EQUAL(kindOf(outcome), OutcomeKind::AREA_CHANGED);
    const auto& change = std::get<Outcome::AreaChanged>(outcome);
    BOOST_CHECK_EQUAL(change.fromArea, TOWN);
    BOOST_CHECK_EQUAL(change.exit, (Coordinate{5, 4}));
    BOOST_CHECK_EQUAL(change.toArea, HOUSE);
    BOOST_CHECK_EQUAL(change.entry, (Coordinate{3, 2}));
    BOOST_CHECK_EQUAL(change.direction, Direction::Up);
    BOOST_CHECK_EQUAL(change.toAreaName, "House");
}

BOOST_AUTO_TEST_CASE(TestAreaChangeWithoutDirectionUsesPosition) {
    auto before = makeSnapshot(TOWN, {5, 5}, Direction::Left);
    auto after = makeSnapshot(HOUSE, {1, 1}, Direction::Down);

    ActionOutcome outcome = classify(Action::Wait, before, after);
    BOOST_REQUIRE_EQUAL(kindOf(outcome), OutcomeKind::AREA_CHANGED);
    BOOST_CHECK_EQUAL(std::get<Outcome::AreaChanged>(outcome).exit, (Coordinate{5, 5}));
    BOOST_CHECK_EQUAL(std::get<Outcome::AreaChanged>(outcome).direction, Direction::Left);
}

BOOST_AUTO_TEST_CASE(TestMoveThatOpensDialogue) {
    auto before = makeSnapshot(TOWN, {7, 6}, Direction::Down);
    auto after = makeSnapshot(TOWN, {7, 7}, Direction::Down, AgentMode::Dialogue);

    ActionOutcome outcome = classify(Action::Down, before, after, true);
    BOOST_REQUIRE_EQUAL(kindOf(outcome), OutcomeKind::AUTO_DIALOGUE);
    BOOST_CHECK_EQUAL(std::get<Outcome::AutoDialogue>(outcome).trigger, (Coordinate{7, 7}));
}

BOOST_AUTO_TEST_CASE(TestInteractReportsFacedTile) {
    auto before = makeSnapshot(TOWN, {5, 2}, Direction::Up);
    auto after = makeSnapshot(TOWN, {5, 2}, Direction::Up, AgentMode::Dialogue);

    ActionOutcome outcome = classify(Action::A, before, after, true);
    BOOST_REQUIRE_EQUAL(kindOf(outcome), OutcomeKind::INTERACTED);
    const auto& interacted = std::get<Outcome::Interacted>(outcome);
    BOOST_CHECK_EQUAL(interacted.faced, (Coordinate{5, 1}));
    BOOST_CHECK(interacted.dialogueOpened);

    ActionOutcome quiet = classify(Action::A, before, before, false);
    BOOST_CHECK(!std::get<Outcome::Interacted>(quiet).dialogueOpened);
}

BOOST_AUTO_TEST_CASE(TestOtherButtonsWait) {
    auto snap = makeSnapshot(TOWN, {1, 1});
    BOOST_CHECK_EQUAL(kindOf(classify(Action::B, snap, snap)), OutcomeKind::WAITED);
    BOOST_CHECK_EQUAL(kindOf(classify(Action::Start, snap, snap)), OutcomeKind::WAITED);
    BOOST_CHECK_EQUAL(kindOf(classify(Action::Wait, snap, snap)), OutcomeKind::WAITED);
}

BOOST_AUTO_TEST_CASE(TestInvalidSnapshotIsUnknown) {
    auto snap = makeSnapshot(TOWN, {1, 1});
    AgentSnapshot broken;

    ActionOutcome outcome = classify(Action::Up, snap, broken);
    BOOST_CHECK_EQUAL(kindOf(outcome), OutcomeKind::UNKNOWN);
    BOOST_CHECK(!describe(outcome).empty());
}

BOOST_AUTO_TEST_SUITE_END()
