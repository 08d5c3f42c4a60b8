#include "core/LocationGraph.hpp"
#include "core/RouteCalculator.hpp"
#include "core/RouteStitcher.hpp"

#include <gtest/gtest.h>

#include <memory>

using namespace wayfinder::core;
using namespace wayfinder::model;
using namespace std::chrono_literals;

namespace {
  Location node(const std::string& id, double x, double y, std::vector<std::string> links) {
    return Location(id, "Checkpoint " + id, "", Coordinates{ x, y }, std::move(links),
                    LocationType::Hallway);
  }

  std::shared_ptr<const LocationGraph> graphOf(std::vector<Location> nodes) {
    return std::make_shared<const InMemoryLocationGraph>(nodes);
  }
} // namespace

//---LocationGraph-------------------------------------------------------------

TEST(location_graph, demo_facility_is_complete) {
  auto g = InMemoryLocationGraph::demoFacility();
  EXPECT_EQ(g.size(), 22u);
  ASSERT_TRUE(g.findById("CP5"));
  EXPECT_EQ(g.findById("CP5")->name(), "Checkpoint 5");

  const auto office = g.findByTagSerial("04:A1:3B:01:2C:44:03");
  ASSERT_TRUE(office);
  EXPECT_EQ(office->id(), "Main Office");
}

TEST(location_graph, search_matches_name_description_and_id_ignoring_case) {
  auto g = InMemoryLocationGraph::demoFacility();
  const auto offices = g.searchLocations("office");
  ASSERT_EQ(offices.size(), 2u);
  EXPECT_EQ(offices[0].id(), "Main Office");
  EXPECT_EQ(offices[1].id(), "Nurse's Office");

  const auto nurse = g.searchLocations("NURSE");
  ASSERT_EQ(nurse.size(), 1u);
  EXPECT_EQ(nurse[0].id(), "Nurse's Office");

  EXPECT_EQ(g.searchLocations("bus loading").size(), 1u);
  EXPECT_EQ(g.searchLocations("").size(), 22u);
  EXPECT_TRUE(g.searchLocations("zzz").empty());
}

TEST(location_graph, catalog_groups_by_type) {
  auto g = InMemoryLocationGraph::demoFacility();
  const auto entrances = g.locationsOfType(LocationType::Entrance);
  ASSERT_EQ(entrances.size(), 3u);
  EXPECT_EQ(entrances[0].id(), "Main Entrance");
  EXPECT_EQ(entrances[2].id(), "Bus Entrance");

  const auto groups = g.locationsByType();
  EXPECT_EQ(groups.size(), 4u);
  EXPECT_EQ(groups.at(LocationType::Hallway).size(), 12u);
  EXPECT_EQ(groups.at(LocationType::Room).size(), 5u);
  EXPECT_EQ(groups.at(LocationType::Office).size(), 2u);
  EXPECT_EQ(groups.count(LocationType::Restroom), 0u);
}

TEST(location_graph, neighbours_in_declared_order_skipping_dangling_ids) {
  InMemoryLocationGraph g({ node("A", 0, 0, { "C", "ghost", "B" }), node("B", 1, 0, {}),
                            node("C", 2, 0, {}) });
  const auto n = g.adjacentTo("A");
  ASSERT_EQ(n.size(), 2u);
  EXPECT_EQ(n[0].id(), "C");
  EXPECT_EQ(n[1].id(), "B");
  EXPECT_TRUE(g.adjacentTo("nope").empty());
  EXPECT_FALSE(g.findById("nope").has_value());
}

TEST(location_graph, add_replaces_and_remove_forgets) {
  InMemoryLocationGraph g({ node("A", 0, 0, {}), node("B", 1, 0, {}) });
  g.add(node("A", 5, 5, { "B" }));
  EXPECT_EQ(g.size(), 2u);
  EXPECT_EQ(g.all().front().id(), "A");
  EXPECT_TRUE(g.findById("A")->isAdjacentTo("B"));

  g.remove("A");
  EXPECT_FALSE(g.contains("A"));
  EXPECT_EQ(g.all().size(), 1u);
}

TEST(location_graph, loads_catalog_json) {
  const auto catalog = nlohmann::json::parse(R"({
    "locations": [
      {"id": "L1", "name": "Lobby", "coordinates": {"x": 0, "y": 0},
       "connectedLocationIds": ["L2"], "type": "entrance", "nfcTagSerial": "AA:BB"},
      {"id": "L2", "name": "Lift", "coordinates": {"x": 0, "y": 10},
       "connectedLocationIds": ["L1"], "type": "elevator"}
    ]})");

  auto g = InMemoryLocationGraph::fromJson(catalog);
  EXPECT_EQ(g.size(), 2u);
  EXPECT_EQ(g.findById("L2")->type(), LocationType::Elevator);
  EXPECT_EQ(g.findByTagSerial("AA:BB")->id(), "L1");

  auto bare = InMemoryLocationGraph::fromJson(catalog["locations"]);
  EXPECT_EQ(bare.size(), 2u);
}

TEST(location_graph, bad_catalog_shape_throws) {
  EXPECT_THROW(InMemoryLocationGraph::fromJson(nlohmann::json::object()), std::runtime_error);
  EXPECT_THROW(InMemoryLocationGraph::fromJson(nlohmann::json::parse(R"({"locations": 3})")),
               std::runtime_error);
  EXPECT_THROW(InMemoryLocationGraph::fromJson(nlohmann::json::parse(R"([{"id": "X"}])")),
               std::runtime_error);
}

//---RouteCalculator-----------------------------------------------------------

class DemoRoutingTest : public ::testing::Test {
protected:
  void SetUp() override {
    graph = std::make_shared<const InMemoryLocationGraph>(InMemoryLocationGraph::demoFacility());
    calc = std::make_unique<DijkstraRouteCalculator>(graph);
  }

  std::shared_ptr<const LocationGraph> graph;
  std::unique_ptr<DijkstraRouteCalculator> calc;
};

TEST_F(DemoRoutingTest, every_hop_is_a_declared_adjacency) {
  for (const auto& from : graph->all()) {
    for (const auto& to : graph->all()) {
      const auto route = calc->calculateRoute(from.id(), to.id());
      if (!route)
        continue;
      EXPECT_TRUE(route->isValid()) << from.id() << " -> " << to.id();
      for (std::size_t i = 0; i + 1 < route->path.size(); ++i) {
        EXPECT_TRUE(graph->findById(route->path[i])->isAdjacentTo(route->path[i + 1]))
            << route->path[i] << " -> " << route->path[i + 1];
      }
    }
  }
}

TEST_F(DemoRoutingTest, direct_neighbours_give_two_node_routes) {
  for (const auto& from : graph->all()) {
    for (const auto& to : graph->adjacentTo(from.id())) {
      const auto route = calc->calculateRoute(from.id(), to.id());
      ASSERT_TRUE(route) << from.id() << " -> " << to.id();
      EXPECT_EQ(route->path.size(), 2u);
      ASSERT_EQ(route->instructions.size(), 1u);
      EXPECT_EQ(route->instructions.front().type, InstructionType::Destination);
    }
  }
}

TEST_F(DemoRoutingTest, same_location_is_a_zero_route) {
  const auto route = calc->calculateRoute("Gym", "Gym");
  ASSERT_TRUE(route);
  EXPECT_EQ(route->path, std::vector<std::string>{ "Gym" });
  EXPECT_DOUBLE_EQ(route->estimatedDistance, 0.0);
  EXPECT_EQ(route->estimatedTime, 0ms);
  ASSERT_EQ(route->instructions.size(), 1u);
  EXPECT_EQ(route->instructions.front().type, InstructionType::Destination);
}

TEST_F(DemoRoutingTest, unknown_ids_yield_none) {
  EXPECT_FALSE(calc->calculateRoute("Gym", "Moon"));
  EXPECT_FALSE(calc->calculateRoute("Moon", "Gym"));
  EXPECT_FALSE(calc->areLocationsConnected("Moon", "Moon"));
}

TEST_F(DemoRoutingTest, entrance_to_office_goes_through_cp5) {
  const auto route = calc->calculateRoute("Main Entrance", "Main Office");
  ASSERT_TRUE(route);
  EXPECT_EQ(route->path, (std::vector<std::string>{ "Main Entrance", "CP5", "Main Office" }));
  ASSERT_EQ(route->instructions.size(), 2u);
  EXPECT_EQ(route->instructions[0].type, InstructionType::Start);
  EXPECT_EQ(route->instructions[1].type, InstructionType::Destination);
}

TEST_F(DemoRoutingTest, alternatives_start_with_the_shortest_path) {
  const auto best = calc->calculateRoute("Gym", "Main Office");
  const auto alts = calc->findAlternativeRoutes("Gym", "Main Office", 3);
  ASSERT_TRUE(best);
  ASSERT_FALSE(alts.empty());
  EXPECT_EQ(alts.front().path, best->path);
  for (const auto& r : alts) {
    EXPECT_EQ(r.startLocationId, "Gym");
    EXPECT_EQ(r.endLocationId, "Main Office");
  }
}

TEST(route_calculator, disconnected_pair_yields_none) {
  DijkstraRouteCalculator calc(
      graphOf({ node("A", 0, 0, { "B" }), node("B", 10, 0, { "A" }), node("island", 50, 50, {}) }));
  EXPECT_FALSE(calc.calculateRoute("A", "island"));
  EXPECT_FALSE(calc.areLocationsConnected("island", "A"));
  EXPECT_TRUE(calc.areLocationsConnected("A", "B"));
}

TEST(route_calculator, one_way_links_are_respected) {
  DijkstraRouteCalculator calc(graphOf({ node("A", 0, 0, { "B" }), node("B", 10, 0, {}) }));
  EXPECT_TRUE(calc.calculateRoute("A", "B"));
  EXPECT_FALSE(calc.calculateRoute("B", "A"));
}

TEST(route_calculator, prefers_shorter_distance_over_fewer_hops) {
  DijkstraRouteCalculator calc(graphOf({
      node("S", 0, 0, { "K", "M1" }),
      node("K", 200, 300, { "T" }),
      node("M1", 100, 0, { "M2" }),
      node("M2", 300, 0, { "T" }),
      node("T", 400, 0, {}),
  }));
  const auto route = calc.calculateRoute("S", "T");
  ASSERT_TRUE(route);
  EXPECT_EQ(route->path, (std::vector<std::string>{ "S", "M1", "M2", "T" }));
  EXPECT_DOUBLE_EQ(route->estimatedDistance, 200.0); // 400 units * 0.5 m
}

TEST(route_calculator, equal_length_paths_keep_discovery_order) {
  const auto square = [](std::vector<std::string> firstLinks) {
    return graphOf({ node("A", 0, 0, std::move(firstLinks)), node("B", 10, 0, { "D" }),
                     node("C", 0, 10, { "D" }), node("D", 10, 10, {}) });
  };
  const auto viaB = DijkstraRouteCalculator(square({ "B", "C" })).calculateRoute("A", "D");
  ASSERT_TRUE(viaB);
  EXPECT_EQ(viaB->path, (std::vector<std::string>{ "A", "B", "D" }));

  const auto viaC = DijkstraRouteCalculator(square({ "C", "B" })).calculateRoute("A", "D");
  ASSERT_TRUE(viaC);
  EXPECT_EQ(viaC->path, (std::vector<std::string>{ "A", "C", "D" }));
}

TEST(route_calculator, each_hop_adds_checkpoint_delay) {
  DijkstraRouteCalculator calc(graphOf({
      node("P", 0, 0, { "Q" }),
      node("Q", 100, 0, { "R" }),
      node("R", 200, 0, {}),
      node("S", 0, 100, { "T" }),
      node("T", 200, 100, {}),
  }));
  const auto twoHops = calc.calculateRoute("P", "R");
  const auto direct = calc.calculateRoute("S", "T");
  ASSERT_TRUE(twoHops && direct);
  EXPECT_DOUBLE_EQ(twoHops->estimatedDistance, direct->estimatedDistance);
  // 100 m at 80 m/min = 75 s of walking
  EXPECT_EQ(direct->estimatedTime, 105s);
  EXPECT_EQ(twoHops->estimatedTime, 135s);
  EXPECT_GT(twoHops->estimatedTime, direct->estimatedTime);
}

TEST(route_calculator, configured_scale_and_speed_apply) {
  NavigationConfig cfg;
  cfg.metersPerUnit = 1.0;
  cfg.walkingSpeedMetersPerMinute = 60.0;
  cfg.checkpointDelay = 0s;
  DijkstraRouteCalculator calc(graphOf({ node("A", 0, 0, { "B" }), node("B", 120, 0, {}) }), cfg);
  const auto route = calc.calculateRoute("A", "B");
  ASSERT_TRUE(route);
  EXPECT_DOUBLE_EQ(route->estimatedDistance, 120.0);
  EXPECT_EQ(route->estimatedTime, 2min);
}

TEST(route_calculator, instruction_kinds_follow_the_path_shape) {
  DijkstraRouteCalculator calc(graphOf({
      node("A", 0, 0, { "B" }),
      node("B", 100, 0, { "C" }),
      node("C", 200, 0, { "D" }),
      node("D", 200, 100, {}),
  }));
  const auto route = calc.calculateRoute("A", "D");
  ASSERT_TRUE(route);
  ASSERT_EQ(route->instructions.size(), 3u);
  EXPECT_EQ(route->instructions[0].type, InstructionType::Start);
  EXPECT_EQ(route->instructions[1].type, InstructionType::Straight);
  EXPECT_EQ(route->instructions[2].type, InstructionType::Destination);
  EXPECT_EQ(route->instructions[2].direction, Direction::Right);
  EXPECT_DOUBLE_EQ(route->totalInstructionDistance(), route->estimatedDistance);

  const auto next = calc.nextInstruction(*route, "B");
  ASSERT_TRUE(next);
  EXPECT_EQ(next->toLocationId, "C");
  EXPECT_FALSE(calc.nextInstruction(*route, "D"));
}

TEST(route_calculator, recalculation_marks_the_first_step) {
  DijkstraRouteCalculator calc(graphOf({
      node("A", 0, 0, { "B" }),
      node("B", 100, 0, { "C" }),
      node("C", 200, 0, {}),
  }));
  const auto multi = calc.recalculateFromCurrent("A", "C");
  ASSERT_TRUE(multi);
  EXPECT_EQ(multi->instructions.front().type, InstructionType::Reroute);
  EXPECT_EQ(multi->instructions.front().description.rfind("Route recalculated. ", 0), 0u);

  const auto direct = calc.recalculateFromCurrent("B", "C");
  ASSERT_TRUE(direct);
  EXPECT_EQ(direct->instructions.front().type, InstructionType::Destination);
}

TEST(route_calculator, turn_classification) {
  const Coordinates o{ 0, 0 }, east{ 100, 0 };
  EXPECT_EQ(DijkstraRouteCalculator::classifyTurn(o, east, { 200, 10 }), Direction::Forward);
  EXPECT_EQ(DijkstraRouteCalculator::classifyTurn(o, east, { 100, 100 }), Direction::Right);
  EXPECT_EQ(DijkstraRouteCalculator::classifyTurn(o, east, { 100, -100 }), Direction::Left);
  EXPECT_EQ(DijkstraRouteCalculator::classifyTurn(o, east, { 0, 1 }), Direction::Back);
}

//---RouteStitcher-------------------------------------------------------------

namespace {
  NavigationInstruction hop(const std::string& from, const std::string& to) {
    return { "i_" + from, InstructionType::Straight, "to " + to, from, to, Direction::Forward, 10.0 };
  }

  Route original() {
    Route r;
    r.id = "route_1";
    r.startLocationId = "A";
    r.endLocationId = "D";
    r.path = { "A", "B", "C", "D" };
    r.estimatedDistance = 300.0;
    r.estimatedTime = 400s;
    r.instructions = { hop("A", "B"), hop("B", "C"), hop("C", "D") };
    return r;
  }

  Route back(const std::string& from, const std::string& to) {
    Route r;
    r.id = "route_2";
    r.startLocationId = from;
    r.endLocationId = to;
    r.path = { from, to };
    r.estimatedDistance = 18.0;
    r.estimatedTime = 30s;
    r.instructions = { hop(from, to) };
    return r;
  }
} // namespace

TEST(route_stitcher, splices_without_repeating_the_rejoin_node) {
  RouteStitcher stitcher;
  const auto combined = stitcher.combine(back("Y", "B"), original(), "B");
  ASSERT_TRUE(combined);
  EXPECT_EQ(combined->path, (std::vector<std::string>{ "Y", "B", "C", "D" }));
  EXPECT_EQ(combined->startLocationId, "Y");
  EXPECT_EQ(combined->endLocationId, "D");
  // 18 + 300 * (4 - 1 - 1) / 4
  EXPECT_DOUBLE_EQ(combined->estimatedDistance, 168.0);
  EXPECT_EQ(combined->estimatedTime, 230s);
  ASSERT_EQ(combined->instructions.size(), 2u);
  EXPECT_EQ(combined->instructions[0].fromLocationId, "Y");
  EXPECT_EQ(combined->instructions[1].fromLocationId, "C");
  EXPECT_EQ(combined->id.rfind("combined_", 0), 0u);
}

TEST(route_stitcher, rejoin_near_the_end_keeps_only_the_tail) {
  RouteStitcher stitcher;
  const auto combined = stitcher.combine(back("Y", "C"), original(), "C");
  ASSERT_TRUE(combined);
  EXPECT_EQ(combined->path, (std::vector<std::string>{ "Y", "C", "D" }));
  EXPECT_DOUBLE_EQ(combined->estimatedDistance, 93.0);
  EXPECT_EQ(combined->instructions.size(), 1u);
}

TEST(route_stitcher, off_route_rejoin_fails) {
  RouteStitcher stitcher;
  EXPECT_FALSE(stitcher.combine(back("Y", "Q"), original(), "Q"));
}
