/* @file Route.cpp
 * @brief route invariants, lookups and JSON output
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <numeric>

// Wayfinder headers
#include "model/Route.hpp"

namespace wayfinder {
  namespace model {

    const char* toString(InstructionType type) {
      switch (type) {
      case InstructionType::Start:
        return "start";
      case InstructionType::Turn:
        return "turn";
      case InstructionType::Straight:
        return "straight";
      case InstructionType::Destination:
        return "destination";
      case InstructionType::Reroute:
        return "reroute";
      default:
        return "unknown";
      }
    }

    const char* toString(Direction direction) {
      switch (direction) {
      case Direction::Forward:
        return "forward";
      case Direction::Left:
        return "left";
      case Direction::Right:
        return "right";
      case Direction::Back:
        return "back";
      case Direction::Up:
        return "up";
      case Direction::Down:
        return "down";
      default:
        return "unknown";
      }
    }

    bool Route::isValid() const {
      if (path.empty())
        return false;
      if (path.front() != startLocationId || path.back() != endLocationId)
        return false;
      if (estimatedDistance < 0.0 || estimatedTime.count() < 0)
        return false;
      if (instructions.empty() && path.size() > 1)
        return false;
      return true;
    }

    bool Route::containsLocation(const std::string& locationId) const {
      return indexOf(locationId).has_value();
    }

    std::optional<std::size_t> Route::indexOf(const std::string& locationId) const {
      auto it = std::find(path.begin(), path.end(), locationId);
      if (it == path.end())
        return std::nullopt;
      return static_cast<std::size_t>(std::distance(path.begin(), it));
    }

    std::optional<NavigationInstruction> Route::nextInstruction(const std::string& locationId) const {
      for (const auto& ins : instructions) {
        if (ins.fromLocationId == locationId)
          return ins;
      }
      return std::nullopt;
    }

    double Route::totalInstructionDistance() const {
      return std::accumulate(instructions.begin(), instructions.end(), 0.0,
                             [](double sum, const NavigationInstruction& ins) {
                               return sum + ins.distance;
                             });
    }

    void to_json(nlohmann::json& j, const NavigationInstruction& ins) {
      j = { { "id", ins.id },
            { "type", toString(ins.type) },
            { "description", ins.description },
            { "fromLocationId", ins.fromLocationId },
            { "toLocationId", ins.toLocationId },
            { "direction", toString(ins.direction) },
            { "distance", ins.distance } };
    }

    void to_json(nlohmann::json& j, const Route& route) {
      j = { { "id", route.id },
            { "startLocationId", route.startLocationId },
            { "endLocationId", route.endLocationId },
            { "pathLocationIds", route.path },
            { "estimatedDistance", route.estimatedDistance },
            { "estimatedTimeMs", route.estimatedTime.count() },
            { "instructions", route.instructions } };
    }

  } // namespace model
} // namespace wayfinder
