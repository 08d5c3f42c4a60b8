#pragma once
/** @file  RouteCalculator.hpp
 *  @brief Shortest-path routing over the location graph + instruction synthesis.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Wayfinder headers
#include "core/LocationGraph.hpp"
#include "core/NavigationConfig.hpp"
#include "model/Route.hpp"

namespace wayfinder {
  namespace core {

    /**
 * @class RouteCalculator
 * @brief Seam between the state machine and the routing algorithm.
 *
 *  * Absence (unknown id, no path) is a `std::nullopt`, never an exception.
 *  * Read-only with respect to the graph; safe to call from several threads.
 */
    class RouteCalculator {
    public:
      virtual ~RouteCalculator() = default;

      virtual std::optional<model::Route> calculateRoute(const std::string& fromId,
                                                         const std::string& toId) const = 0;

      /// Same contract as `calculateRoute`; \p currentId is a live position.
      virtual std::optional<model::Route> recalculateFromCurrent(
          const std::string& currentId, const std::string& destinationId) const = 0;

      /// Instruction leaving \p locationId; none for the terminal node or an off-route id.
      virtual std::optional<model::NavigationInstruction> nextInstruction(
          const model::Route& route, const std::string& locationId) const {
        return route.nextInstruction(locationId);
      }

      virtual bool areLocationsConnected(const std::string& fromId, const std::string& toId) const {
        return calculateRoute(fromId, toId).has_value();
      }
    };

    /**
 * @class DijkstraRouteCalculator
 * @brief Euclidean-weighted Dijkstra; ties go to the first-discovered path.
 *
 *  * Edge weight = coordinate distance × metersPerUnit.
 *  * Time = distance / walking speed + checkpointDelay per hop.
 *  * Turn classification: heading change > 30° → turn, > 150° → back.
 */
    class DijkstraRouteCalculator : public RouteCalculator {
    public:
      explicit DijkstraRouteCalculator(std::shared_ptr<const LocationGraph> graph,
                                       NavigationConfig config = {});

      std::optional<model::Route> calculateRoute(const std::string& fromId,
                                                 const std::string& toId) const override;
      std::optional<model::Route> recalculateFromCurrent(
          const std::string& currentId, const std::string& destinationId) const override;

      /// Up to \p maxAlternatives routes; reused edges cost 3×, >70% node overlap rejected.
      std::vector<model::Route> findAlternativeRoutes(const std::string& fromId,
                                                      const std::string& toId,
                                                      std::size_t maxAlternatives = 3) const;

      /// Leg length between two known locations in meters.
      std::optional<double> legDistance(const std::string& fromId, const std::string& toId) const;

      static model::Direction classifyTurn(const model::Coordinates& before,
                                           const model::Coordinates& at,
                                           const model::Coordinates& after);

    private:
      struct PathResult {
        std::vector<std::string> path;
        double totalDistance{ 0.0 };
      };

      using EdgePenalty = std::function<double(const std::string&, const std::string&)>;

      std::optional<PathResult> shortestPath(const std::string& fromId, const std::string& toId,
                                             const EdgePenalty& penalty) const;
      model::Route buildRoute(const PathResult& result, const std::string& idPrefix) const;
      model::Route sameLocationRoute(const model::Location& location) const;
      std::vector<model::NavigationInstruction> buildInstructions(
          const std::vector<model::Location>& nodes) const;
      std::string nextId(const std::string& prefix) const;

      std::shared_ptr<const LocationGraph> graph_;
      NavigationConfig config_;
      mutable std::atomic<std::uint64_t> idCounter_{ 0 };
    };

  } // namespace core
} // namespace wayfinder
