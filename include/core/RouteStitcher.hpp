#pragma once
/** @file  RouteStitcher.hpp
 *  @brief Splices a short return-to-route leg onto the rest of an active route.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

// Wayfinder headers
#include "model/Route.hpp"

namespace wayfinder {
  namespace core {

    /**
 * @class RouteStitcher
 * @brief returnRoute.path ++ original.path[rejoin+1 ..], rejoin node not duplicated.
 *
 *  * Distance / time: return totals + original totals × (n - rejoin - 1) / n.
 *    This is a pro-rated estimate, not a sum of the stitched legs.
 *  * Instructions: return route's, then the original's leaving a node after the rejoin index.
 */
    class RouteStitcher {
    public:
      /// none if \p rejoinLocationId is not on \p originalRoute.
      std::optional<model::Route> combine(const model::Route& returnRoute,
                                          const model::Route& originalRoute,
                                          const std::string& rejoinLocationId) const;

    private:
      mutable std::atomic<std::uint64_t> idCounter_{ 0 };
    };

  } // namespace core
} // namespace wayfinder
