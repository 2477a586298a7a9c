/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE ConnectivityGraphTests
#include <boost/test/unit_test.hpp>

#include "utils/JsonReader.hpp"
#include "world/ConnectivityGraph.hpp"
#include <algorithm>

using namespace Wayfarer;

namespace {
const AreaId TOWN{1, 1};
const AreaId ROUTE{1, 2};
const AreaId HOUSE{2, 1};
const AreaId CAVE{3, 7};

AreaConnection link(AreaId from, Coordinate exit, AreaId to, Coordinate entry, Direction d) {
    return AreaConnection{from, exit, to, entry, d};
}

bool everyEdgeHasMirror(const ConnectivityGraph& graph, const std::vector<AreaId>& areas) {
    for (const auto& area : areas) {
        for (const auto& edge : graph.connectionsFrom(area)) {
            const AreaConnection mirror{edge.toArea, edge.toCoord, edge.fromArea, edge.fromCoord,
                                        opposite(edge.direction)};
            const auto& back = graph.connectionsFrom(edge.toArea);
            if (std::find(back.begin(), back.end(), mirror) == back.end()) {
                BOOST_TEST_MESSAGE("Edge without a return: " << edge);
                return false;
            }
        }
    }
    return true;
}
} // namespace

BOOST_AUTO_TEST_SUITE(ConnectivityGraphTestSuite)

BOOST_AUTO_TEST_CASE(TestAddConnectionStoresReciprocalPair) {
    ConnectivityGraph graph;
    BOOST_CHECK(graph.addConnection(link(TOWN, {5, 11}, ROUTE, {1, 0}, Direction::Down)));

    BOOST_REQUIRE_EQUAL(graph.connectionsFrom(TOWN).size(), 1u);
    BOOST_REQUIRE_EQUAL(graph.connectionsFrom(ROUTE).size(), 1u);

    const AreaConnection& back = graph.connectionsFrom(ROUTE).front();
    BOOST_CHECK_EQUAL(back.fromCoord, (Coordinate{1, 0}));
    BOOST_CHECK_EQUAL(back.toArea, TOWN);
    BOOST_CHECK_EQUAL(back.toCoord, (Coordinate{5, 11}));
    BOOST_CHECK_EQUAL(back.direction, Direction::Up);
    BOOST_CHECK_EQUAL(graph.connectionCount(), 2u);
}

BOOST_AUTO_TEST_CASE(TestDuplicateConnectionIsNotAddedTwice) {
    ConnectivityGraph graph;
    graph.addConnection(link(TOWN, {5, 4}, HOUSE, {3, 2}, Direction::Up));
    BOOST_CHECK(!graph.addConnection(link(TOWN, {5, 4}, HOUSE, {3, 2}, Direction::Up)));
    BOOST_CHECK_EQUAL(graph.connectionCount(), 2u);

    // Same exit tile, different landing: both directions are replaced
    BOOST_CHECK(graph.addConnection(link(TOWN, {5, 4}, HOUSE, {3, 1}, Direction::Up)));
    BOOST_CHECK_EQUAL(graph.connectionsFrom(TOWN).size(), 1u);
    BOOST_CHECK_EQUAL(graph.connectionsFrom(TOWN).front().toCoord, (Coordinate{3, 1}));
    BOOST_REQUIRE_EQUAL(graph.connectionsFrom(HOUSE).size(), 1u);
    BOOST_CHECK_EQUAL(graph.connectionsFrom(HOUSE).front().fromCoord, (Coordinate{3, 1}));
    BOOST_CHECK_EQUAL(graph.connectionCount(), 2u);
    BOOST_CHECK(everyEdgeHasMirror(graph, {TOWN, HOUSE}));
}

BOOST_AUTO_TEST_CASE(TestMovedExitReplacesReturnEdge) {
    ConnectivityGraph graph;
    graph.addConnection(link(TOWN, {5, 4}, HOUSE, {3, 2}, Direction::Up));
    graph.addConnection(link(TOWN, {9, 1}, ROUTE, {1, 5}, Direction::Right));

    // Recorded from the house side: the town exit it lands on has moved
    BOOST_CHECK(graph.addConnection(link(HOUSE, {3, 2}, TOWN, {6, 4}, Direction::Down)));
    BOOST_REQUIRE_EQUAL(graph.exitsTo(TOWN, HOUSE).size(), 1u);
    BOOST_CHECK_EQUAL(graph.exitsTo(TOWN, HOUSE).front().fromCoord, (Coordinate{6, 4}));
    BOOST_CHECK_EQUAL(graph.connectionsFrom(HOUSE).size(), 1u);
    BOOST_CHECK_EQUAL(graph.connectionCount(), 4u);
    BOOST_CHECK(everyEdgeHasMirror(graph, {TOWN, HOUSE, ROUTE}));
}

BOOST_AUTO_TEST_CASE(TestShortestAreaPath) {
    ConnectivityGraph graph;
    graph.addConnection(link(TOWN, {5, 11}, ROUTE, {1, 0}, Direction::Down));
    graph.addConnection(link(TOWN, {5, 4}, HOUSE, {3, 2}, Direction::Up));
    graph.addConnection(link(ROUTE, {6, 5}, CAVE, {0, 0}, Direction::Right));

    auto route = graph.shortestAreaPath(HOUSE, CAVE);
    BOOST_REQUIRE(route.has_value());
    std::vector<AreaId> expected{HOUSE, TOWN, ROUTE, CAVE};
    BOOST_CHECK_EQUAL_COLLECTIONS(route->begin(), route->end(), expected.begin(),
                                  expected.end());

    auto self = graph.shortestAreaPath(TOWN, TOWN);
    BOOST_REQUIRE(self.has_value());
    BOOST_CHECK_EQUAL(self->size(), 1u);

    BOOST_CHECK(!graph.shortestAreaPath(TOWN, AreaId{9, 9}).has_value());
}

BOOST_AUTO_TEST_CASE(TestExitsAndNeighbors) {
    ConnectivityGraph graph;
    graph.addConnection(link(TOWN, {5, 11}, ROUTE, {1, 0}, Direction::Down));
    graph.addConnection(link(TOWN, {6, 11}, ROUTE, {2, 0}, Direction::Down));
    graph.addConnection(link(TOWN, {5, 4}, HOUSE, {3, 2}, Direction::Up));

    BOOST_CHECK_EQUAL(graph.exitsTo(TOWN, ROUTE).size(), 2u);
    BOOST_CHECK_EQUAL(graph.neighbors(TOWN).size(), 2u);
    BOOST_CHECK(graph.exitsTo(HOUSE, ROUTE).empty());
    BOOST_CHECK(graph.hasArea(HOUSE));
    BOOST_CHECK(!graph.hasArea(CAVE));
}

BOOST_AUTO_TEST_CASE(TestJsonRoundTripKeepsConnections) {
    ConnectivityGraph graph;
    graph.addConnection(link(TOWN, {5, 11}, ROUTE, {1, 0}, Direction::Down));
    graph.addConnection(link(TOWN, {-2, 4}, HOUSE, {3, 2}, Direction::Left));

    JsonReader reader;
    BOOST_REQUIRE(reader.parse(JsonWriter::write(graph.toJson())));

    ConnectivityGraph restored;
    BOOST_REQUIRE(restored.fromJson(reader.getRoot()));
    BOOST_CHECK_EQUAL(restored.connectionCount(), graph.connectionCount());
    BOOST_CHECK_EQUAL(restored.exitsTo(TOWN, HOUSE).front(), graph.exitsTo(TOWN, HOUSE).front());
}

BOOST_AUTO_TEST_CASE(TestFromJsonSkipsMalformedEntries) {
    JsonReader reader;
    BOOST_REQUIRE(reader.parse(R"({
        "connections": {
            "area_1_1": [
                {"from_group": 1, "from_number": 1, "from_x": 0, "from_y": 0,
                 "to_group": 1, "to_number": 2, "to_x": 4, "to_y": 4, "direction": "DOWN"},
                {"from_group": 1, "direction": "SIDEWAYS"}
            ],
            "area_9_9": "not a list"
        }
    })"));

    ConnectivityGraph graph;
    BOOST_CHECK(graph.fromJson(reader.getRoot()));
    BOOST_CHECK_EQUAL(graph.connectionCount(), 2u);

    JsonReader bad;
    BOOST_REQUIRE(bad.parse(R"({"version": 1})"));
    BOOST_CHECK(!graph.fromJson(bad.getRoot()));
}

BOOST_AUTO_TEST_SUITE_END()
