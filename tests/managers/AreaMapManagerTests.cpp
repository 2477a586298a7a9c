/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE AreaMapManagerTests
#include <boost/test/unit_test.hpp>

#include "managers/AreaMapManager.hpp"
#include "mocks/MockCollaborators.hpp"
#include <filesystem>
#include <fstream>

using namespace Wayfarer;

namespace {
const AreaId TOWN{1, 1};
const AreaId ROUTE{1, 2};

void writeFile(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
}
} // namespace

struct AreaMapManagerFixture {
    Testing::TempDataDir dir{"map_manager"};
};

BOOST_FIXTURE_TEST_SUITE(AreaMapManagerTestSuite, AreaMapManagerFixture)

BOOST_AUTO_TEST_CASE(TestLoadOrCreateReturnsStableMap) {
    AreaMapManager maps(dir.str());
    AreaMap& first = maps.loadOrCreate(TOWN, "Town");
    first.markTraversal({1, 1}, TraversalStatus::Blocked);

    AreaMap& again = maps.loadOrCreate(TOWN, "Pallet");
    BOOST_CHECK_EQUAL(&first, &again);
    BOOST_CHECK_EQUAL(again.displayName(), "Pallet");
    BOOST_CHECK_EQUAL(maps.loadedCount(), 1u);
    BOOST_CHECK(maps.find(ROUTE) == nullptr);
    BOOST_CHECK(!maps.hasRecord(TOWN));
}

BOOST_AUTO_TEST_CASE(TestSaveAndReloadRoundTrip) {
    {
        AreaMapManager maps(dir.str());
        AreaMap& town = maps.loadOrCreate(TOWN, "Town");
        town.setLabel({0, 0}, "path");
        town.setLabel({1, 0}, "tree");
        town.setLabel({-1, 2}, "grass");
        town.markTraversal({0, 0}, TraversalStatus::Walkable);
        town.markTraversal({1, 0}, TraversalStatus::Blocked);
        town.markTransition({0, 3});
        town.markTraversal({2, 2}, TraversalStatus::Interactable);
        town.recordVisit();
        town.recordVisit();
        BOOST_REQUIRE(maps.saveAll());
        BOOST_CHECK(maps.hasRecord(TOWN));
    }

    AreaMapManager reloaded(dir.str());
    AreaMap& town = reloaded.loadOrCreate(TOWN, "Town");
    BOOST_CHECK_EQUAL(town.labelAt({1, 0}), "tree");
    BOOST_CHECK_EQUAL(town.labelAt({-1, 2}), "grass");
    BOOST_CHECK_EQUAL(town.statusAt({0, 0}), TraversalStatus::Walkable);
    BOOST_CHECK_EQUAL(town.statusAt({1, 0}), TraversalStatus::Blocked);
    BOOST_CHECK_EQUAL(town.statusAt({0, 3}), TraversalStatus::TransitionEdge);
    BOOST_CHECK_EQUAL(town.statusAt({2, 2}), TraversalStatus::Interactable);
    BOOST_CHECK_EQUAL(town.visitCount(), 2);
    BOOST_CHECK(town.bounds() == (GridBounds{-1, 0, 2, 3, false}));
}

BOOST_AUTO_TEST_CASE(TestSavedPlayerMarkerLoadsAsWalkable) {
    {
        AreaMapManager maps(dir.str());
        AreaMap& town = maps.loadOrCreate(TOWN, "Town");
        town.setPlayer({4, 4});
        BOOST_REQUIRE(maps.save(town));
    }

    AreaMapManager reloaded(dir.str());
    AreaMap& town = reloaded.loadOrCreate(TOWN, "Town");
    BOOST_CHECK_EQUAL(town.statusAt({4, 4}), TraversalStatus::Walkable);
    BOOST_CHECK(!town.playerCoord().has_value());
}

BOOST_AUTO_TEST_CASE(TestCorruptRecordStartsFresh) {
    writeFile(dir.path / (TOWN.toKey() + ".json"), "{ \"group\": 1, \"number\": ");

    AreaMapManager maps(dir.str());
    AreaMap& town = maps.loadOrCreate(TOWN, "Town");
    BOOST_CHECK(town.bounds().empty);
    BOOST_CHECK_EQUAL(town.visitCount(), 0);
}

BOOST_AUTO_TEST_CASE(TestHugeBoundsStartFresh) {
    // The span overflows an int and the rows cannot match it
    writeFile(dir.path / (TOWN.toKey() + ".json"),
              R"({"version": 1, "group": 1, "number": 1, "visit_count": 4,
                  "bounds": {"empty": false, "min_x": -2000000000, "min_y": 0,
                             "max_x": 2000000000, "max_y": 0},
                  "terrain": [["path"]], "traversal": ["W"]})");

    AreaMapManager maps(dir.str());
    AreaMap& town = maps.loadOrCreate(TOWN, "Town");
    BOOST_CHECK(town.bounds().empty);
    BOOST_CHECK_EQUAL(town.visitCount(), 0);
}

BOOST_AUTO_TEST_CASE(TestBoundsOutsideIntRangeRejected) {
    AreaMap map(TOWN, "Town");
    map.markTraversal({0, 0}, TraversalStatus::Walkable);
    JsonValue json = AreaMapManager::toJson(map);

    JsonValue bounds = JsonValue::object();
    bounds.set("empty", JsonValue(false))
        .set("min_x", JsonValue(0))
        .set("min_y", JsonValue(0))
        .set("max_x", JsonValue(1e12))
        .set("max_y", JsonValue(0));
    json.set("bounds", std::move(bounds));

    std::string error;
    BOOST_CHECK(AreaMapManager::fromJson(json, error) == nullptr);
    BOOST_CHECK(!error.empty());
}

BOOST_AUTO_TEST_CASE(TestRecordForAnotherAreaIsIgnored) {
    {
        AreaMapManager maps(dir.str());
        AreaMap& route = maps.loadOrCreate(ROUTE, "Route");
        route.markTraversal({0, 0}, TraversalStatus::Blocked);
        BOOST_REQUIRE(maps.save(route));
    }
    std::filesystem::rename(dir.path / (ROUTE.toKey() + ".json"),
                            dir.path / (TOWN.toKey() + ".json"));

    AreaMapManager maps(dir.str());
    BOOST_CHECK(maps.loadOrCreate(TOWN, "Town").bounds().empty);
}

BOOST_AUTO_TEST_CASE(TestFromJsonRejectsMismatchedRows) {
    AreaMap map(TOWN, "Town");
    map.markTraversal({0, 0}, TraversalStatus::Walkable);
    map.markTraversal({1, 1}, TraversalStatus::Walkable);

    JsonValue json = AreaMapManager::toJson(map);
    json.set("traversal", JsonValue::array());

    std::string error;
    BOOST_CHECK(!AreaMapManager::fromJson(json, error));
    BOOST_CHECK(!error.empty());

    error.clear();
    BOOST_CHECK(!AreaMapManager::fromJson(JsonValue(std::string("nope")), error));
    BOOST_CHECK(!error.empty());
}

BOOST_AUTO_TEST_CASE(TestGraphPersistence) {
    {
        AreaMapManager maps(dir.str());
        ConnectivityGraph graph;
        graph.addConnection({TOWN, {5, 11}, ROUTE, {1, 0}, Direction::Down});
        BOOST_REQUIRE(maps.saveGraph(graph));
    }
    BOOST_CHECK(std::filesystem::exists(dir.path / AreaMapManager::CONNECTIONS_FILE));

    AreaMapManager maps(dir.str());
    ConnectivityGraph graph;
    BOOST_REQUIRE(maps.loadGraph(graph));
    BOOST_CHECK_EQUAL(graph.connectionCount(), 2u);
    BOOST_CHECK_EQUAL(graph.exitsTo(ROUTE, TOWN).front().toCoord, (Coordinate{5, 11}));
}

BOOST_AUTO_TEST_CASE(TestMissingOrCorruptGraphLeavesGraphUsable) {
    AreaMapManager maps(dir.str());
    ConnectivityGraph graph;
    BOOST_CHECK(!maps.loadGraph(graph));

    writeFile(dir.path / AreaMapManager::CONNECTIONS_FILE, "[1, 2,");
    BOOST_CHECK(!maps.loadGraph(graph));
    BOOST_CHECK_EQUAL(graph.connectionCount(), 0u);
    BOOST_CHECK(graph.addConnection({TOWN, {0, 0}, ROUTE, {0, 9}, Direction::Up}));
}

BOOST_AUTO_TEST_CASE(TestSummariesCoverLoadedMaps) {
    AreaMapManager maps(dir.str());
    AreaMap& town = maps.loadOrCreate(TOWN, "Town");
    town.markTraversal({0, 0}, TraversalStatus::Walkable);
    town.markTraversal({1, 0}, TraversalStatus::Blocked);
    maps.loadOrCreate(ROUTE, "Route");

    auto summaries = maps.summaries();
    BOOST_REQUIRE_EQUAL(summaries.size(), 2u);
    BOOST_CHECK_EQUAL(summaries[0].id, TOWN);
    BOOST_CHECK_EQUAL(summaries[0].walkableTiles, 1u);
    BOOST_CHECK_EQUAL(summaries[0].blockedTiles, 1u);
}

BOOST_AUTO_TEST_SUITE_END()
