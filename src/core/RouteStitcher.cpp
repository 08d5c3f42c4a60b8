/* @file RouteStitcher.cpp
 * @brief return-route + remaining-route splicing for minor deviations
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cmath>

// Wayfinder headers
#include "core/RouteStitcher.hpp"

using namespace wayfinder::core;
using wayfinder::model::Route;

std::optional<Route> RouteStitcher::combine(const Route& returnRoute, const Route& originalRoute,
                                            const std::string& rejoinLocationId) const {
  const auto rejoin = originalRoute.indexOf(rejoinLocationId);
  if (!rejoin || returnRoute.path.empty())
    return std::nullopt;

  const auto& original = originalRoute.path;
  const std::size_t n = original.size();
  const double remaining = static_cast<double>(n - *rejoin - 1) / static_cast<double>(n);

  Route combined;
  combined.id = "combined_" + std::to_string(++idCounter_);
  combined.startLocationId = returnRoute.startLocationId;
  combined.endLocationId = originalRoute.endLocationId;

  combined.path = returnRoute.path;
  combined.path.insert(combined.path.end(), original.begin() + static_cast<std::ptrdiff_t>(*rejoin) + 1,
                       original.end());

  combined.estimatedDistance = returnRoute.estimatedDistance +
                               originalRoute.estimatedDistance * remaining;
  combined.estimatedTime =
      returnRoute.estimatedTime +
      std::chrono::milliseconds{ std::llround(
          static_cast<double>(originalRoute.estimatedTime.count()) * remaining) };

  combined.instructions = returnRoute.instructions;
  for (const auto& ins : originalRoute.instructions) {
    const auto at = originalRoute.indexOf(ins.fromLocationId);
    if (at && *at > *rejoin)
      combined.instructions.push_back(ins);
  }
  return combined;
}
