/* @file RouteCalculator.cpp
 * @brief Dijkstra routing, time estimate and per-hop instruction synthesis
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <numbers>
#include <queue>
#include <stdexcept>
#include <tuple>
#include <unordered_map>
#include <unordered_set>

// Wayfinder headers
#include "core/RouteCalculator.hpp"

using namespace wayfinder::core;
using wayfinder::model::Coordinates;
using wayfinder::model::Direction;
using wayfinder::model::InstructionType;
using wayfinder::model::Location;
using wayfinder::model::NavigationInstruction;
using wayfinder::model::Route;

namespace {
  constexpr double kStraightToleranceDeg = 30.0;
  constexpr double kTurnAroundDeg = 150.0;
  constexpr double kReusedEdgePenalty = 3.0;
  constexpr double kMaxAlternativeOverlap = 0.7;

  std::string describe(Direction d, const std::string& target) {
    switch (d) {
    case Direction::Left:
      return "Turn left to " + target;
    case Direction::Right:
      return "Turn right to " + target;
    case Direction::Back:
      return "Turn around to " + target;
    case Direction::Up:
      return "Go up to " + target;
    case Direction::Down:
      return "Go down to " + target;
    case Direction::Forward:
    default:
      return "Continue straight to " + target;
    }
  }

  bool usesEdge(const std::vector<std::string>& path, const std::string& a, const std::string& b) {
    for (std::size_t i = 0; i + 1 < path.size(); ++i) {
      if (path[i] == a && path[i + 1] == b)
        return true;
    }
    return false;
  }
} // namespace

DijkstraRouteCalculator::DijkstraRouteCalculator(std::shared_ptr<const LocationGraph> graph,
                                                 NavigationConfig config)
    : graph_(std::move(graph)), config_(config) {
  assert(graph_ && "[RouteCalculator] location graph is nullptr");
}

std::optional<Route> DijkstraRouteCalculator::calculateRoute(const std::string& fromId,
                                                             const std::string& toId) const {
  auto from = graph_->findById(fromId);
  auto to = graph_->findById(toId);
  if (!from || !to)
    return std::nullopt;

  if (fromId == toId)
    return sameLocationRoute(*from);

  auto result = shortestPath(fromId, toId, nullptr);
  if (!result)
    return std::nullopt;

  try {
    return buildRoute(*result, "route");
  } catch (const std::exception& e) {
    std::cerr << "[RouteCalculator] route assembly failed: " << e.what() << '\n';
    return std::nullopt;
  }
}

std::optional<Route> DijkstraRouteCalculator::recalculateFromCurrent(
    const std::string& currentId, const std::string& destinationId) const {
  auto route = calculateRoute(currentId, destinationId);
  if (!route)
    return std::nullopt;

  route->id = nextId("reroute") + "_" + currentId + "_to_" + destinationId;

  // a direct hop keeps its single destination instruction
  if (route->path.size() > 2 && !route->instructions.empty()) {
    auto& first = route->instructions.front();
    if (first.fromLocationId == currentId) {
      first.type = InstructionType::Reroute;
      first.description = "Route recalculated. " + first.description;
    }
  }
  return route;
}

std::vector<Route> DijkstraRouteCalculator::findAlternativeRoutes(const std::string& fromId,
                                                                  const std::string& toId,
                                                                  std::size_t maxAlternatives) const {
  std::vector<Route> found;
  if (!graph_->contains(fromId) || !graph_->contains(toId) || fromId == toId)
    return found;

  while (found.size() < maxAlternatives) {
    auto penalty = [&found](const std::string& a, const std::string& b) {
      for (const auto& r : found) {
        if (usesEdge(r.path, a, b))
          return kReusedEdgePenalty;
      }
      return 1.0;
    };

    auto result = shortestPath(fromId, toId, penalty);
    if (!result)
      break;

    bool distinct = true;
    for (const auto& r : found) {
      const auto common = std::count_if(result->path.begin(), result->path.end(),
                                        [&r](const std::string& id) {
                                          return r.containsLocation(id);
                                        });
      const double overlap = static_cast<double>(common) /
                             static_cast<double>(std::max(result->path.size(), r.path.size()));
      if (overlap > kMaxAlternativeOverlap) {
        distinct = false;
        break;
      }
    }
    if (!distinct)
      break;

    // report true leg lengths, not the penalized search weight
    double total = 0.0;
    for (std::size_t i = 0; i + 1 < result->path.size(); ++i)
      total += legDistance(result->path[i], result->path[i + 1]).value_or(0.0);
    result->totalDistance = total;

    found.push_back(buildRoute(*result, "route"));
  }
  return found;
}

std::optional<double> DijkstraRouteCalculator::legDistance(const std::string& fromId,
                                                           const std::string& toId) const {
  auto a = graph_->findById(fromId);
  auto b = graph_->findById(toId);
  if (!a || !b)
    return std::nullopt;
  return model::distanceBetween(a->coordinates(), b->coordinates()) * config_.metersPerUnit;
}

Direction DijkstraRouteCalculator::classifyTurn(const Coordinates& before, const Coordinates& at,
                                                const Coordinates& after) {
  const double ax = at.x - before.x;
  const double ay = at.y - before.y;
  const double bx = after.x - at.x;
  const double by = after.y - at.y;
  if ((ax == 0.0 && ay == 0.0) || (bx == 0.0 && by == 0.0))
    return Direction::Forward;

  const double cross = ax * by - ay * bx;
  const double dot = ax * bx + ay * by;
  const double angleDeg = std::abs(std::atan2(cross, dot)) * 180.0 / std::numbers::pi;

  if (angleDeg <= kStraightToleranceDeg)
    return Direction::Forward;
  if (angleDeg >= kTurnAroundDeg)
    return Direction::Back;
  // y grows downward on the plan: positive cross product is a clockwise (right) turn
  return cross > 0.0 ? Direction::Right : Direction::Left;
}

std::optional<DijkstraRouteCalculator::PathResult> DijkstraRouteCalculator::shortestPath(
    const std::string& fromId, const std::string& toId, const EdgePenalty& penalty) const {
  // (distance, discovery sequence, id); equal distances pop in discovery order
  using Entry = std::tuple<double, std::uint64_t, std::string>;
  std::priority_queue<Entry, std::vector<Entry>, std::greater<>> frontier;

  std::unordered_map<std::string, double> dist;
  std::unordered_map<std::string, std::string> prev;
  std::unordered_set<std::string> settled;
  std::uint64_t seq = 0;

  try {
    dist[fromId] = 0.0;
    frontier.emplace(0.0, seq++, fromId);

    while (!frontier.empty()) {
      const double d = std::get<0>(frontier.top());
      const std::string id = std::get<2>(frontier.top());
      frontier.pop();

      if (!settled.insert(id).second)
        continue;
      if (id == toId)
        break;

      auto current = graph_->findById(id);
      if (!current)
        continue;

      for (const auto& neighbour : graph_->adjacentTo(id)) {
        if (settled.count(neighbour.id()) != 0)
          continue;

        double weight = model::distanceBetween(current->coordinates(), neighbour.coordinates()) *
                        config_.metersPerUnit;
        if (penalty)
          weight *= penalty(id, neighbour.id());

        const double candidate = d + weight;
        auto known = dist.find(neighbour.id());
        if (known == dist.end() || candidate < known->second) {
          dist[neighbour.id()] = candidate;
          prev[neighbour.id()] = id;
          frontier.emplace(candidate, seq++, neighbour.id());
        }
      }
    }
  } catch (const std::exception& e) {
    std::cerr << "[RouteCalculator] traversal " << fromId << " -> " << toId
              << " aborted: " << e.what() << '\n';
    return std::nullopt;
  }

  if (settled.count(toId) == 0)
    return std::nullopt;

  PathResult result;
  result.totalDistance = dist.at(toId);
  for (std::string at = toId;;) {
    result.path.push_back(at);
    auto p = prev.find(at);
    if (p == prev.end())
      break;
    at = p->second;
  }
  std::reverse(result.path.begin(), result.path.end());
  return result;
}

Route DijkstraRouteCalculator::buildRoute(const PathResult& result,
                                          const std::string& idPrefix) const {
  std::vector<Location> nodes;
  nodes.reserve(result.path.size());
  for (const auto& id : result.path) {
    auto loc = graph_->findById(id);
    if (!loc)
      throw std::runtime_error("location vanished from graph: " + id);
    nodes.push_back(std::move(*loc));
  }

  const double minutes = result.totalDistance / config_.walkingSpeedMetersPerMinute;
  const auto walking = std::chrono::milliseconds{ std::llround(minutes * 60.0 * 1000.0) };
  const auto hops = static_cast<long long>(result.path.size() - 1);
  const auto checkpoints =
      std::chrono::duration_cast<std::chrono::milliseconds>(config_.checkpointDelay) * hops;

  Route route;
  route.id = nextId(idPrefix);
  route.startLocationId = result.path.front();
  route.endLocationId = result.path.back();
  route.path = result.path;
  route.estimatedDistance = result.totalDistance;
  route.estimatedTime = walking + checkpoints;
  route.instructions = buildInstructions(nodes);
  return route;
}

Route DijkstraRouteCalculator::sameLocationRoute(const Location& location) const {
  Route route;
  route.id = nextId("route_same");
  route.startLocationId = location.id();
  route.endLocationId = location.id();
  route.path = { location.id() };
  route.estimatedDistance = 0.0;
  route.estimatedTime = std::chrono::milliseconds{ 0 };
  route.instructions = { NavigationInstruction{ "instruction_same", InstructionType::Destination,
                                                "You are already at " + location.name(),
                                                location.id(), location.id(), Direction::Forward,
                                                0.0 } };
  return route;
}

std::vector<NavigationInstruction> DijkstraRouteCalculator::buildInstructions(
    const std::vector<Location>& nodes) const {
  std::vector<NavigationInstruction> out;
  if (nodes.size() < 2)
    return out;

  const std::size_t lastHop = nodes.size() - 2;
  for (std::size_t i = 0; i <= lastHop; ++i) {
    const auto& from = nodes[i];
    const auto& to = nodes[i + 1];

    NavigationInstruction ins;
    ins.id = "instruction_" + std::to_string(i);
    ins.fromLocationId = from.id();
    ins.toLocationId = to.id();
    ins.distance = model::distanceBetween(from.coordinates(), to.coordinates()) *
                   config_.metersPerUnit;
    ins.direction = i == 0 ? Direction::Forward
                           : classifyTurn(nodes[i - 1].coordinates(), from.coordinates(),
                                          to.coordinates());

    if (i == 0 && i == lastHop) {
      ins.type = InstructionType::Destination;
      ins.description = "Go directly to " + to.name();
    } else if (i == 0) {
      ins.type = InstructionType::Start;
      ins.description = "Start at " + from.name() + " towards " + to.name();
    } else if (i == lastHop) {
      ins.type = InstructionType::Destination;
      ins.description = "Arrive at " + to.name();
    } else {
      ins.type = ins.direction == Direction::Forward ? InstructionType::Straight
                                                     : InstructionType::Turn;
      ins.description = describe(ins.direction, to.name());
    }
    out.push_back(std::move(ins));
  }
  return out;
}

std::string DijkstraRouteCalculator::nextId(const std::string& prefix) const {
  return prefix + "_" + std::to_string(++idCounter_);
}
