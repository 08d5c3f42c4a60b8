#pragma once
/** @file  Route.hpp
 *  @brief Route value object + per-hop navigation instructions.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

// 3rd-party headers
#include <nlohmann/json.hpp>

namespace wayfinder {
  namespace model {

    enum class InstructionType { Start, Turn, Straight, Destination, Reroute };
    enum class Direction { Forward, Left, Right, Back, Up, Down };

    const char* toString(InstructionType type);
    const char* toString(Direction direction);

    /** One hop of a route, produced only by the calculator / stitcher. */
    struct NavigationInstruction {
      std::string id;
      InstructionType type{ InstructionType::Straight };
      std::string description;
      std::string fromLocationId;
      std::string toLocationId;
      Direction direction{ Direction::Forward };
      double distance{ 0.0 }; ///< leg length in meters

      bool operator==(const NavigationInstruction&) const = default;
    };

    /**
 * @struct Route
 * @brief Ordered path + derived distance/time/instructions.
 *
 *  * Never mutated after the calculator hands it out; a recalculation
 *    replaces the whole value.
 *  * A single-element path is a zero-length self route.
 */
    struct Route {
      std::string id;
      std::string startLocationId;
      std::string endLocationId;
      std::vector<std::string> path;
      double estimatedDistance{ 0.0 }; ///< meters
      std::chrono::milliseconds estimatedTime{ 0 };
      std::vector<NavigationInstruction> instructions;

      /// Structural invariant check (endpoints, non-negative totals, instructions).
      bool isValid() const;

      bool containsLocation(const std::string& locationId) const;

      /// Position of \p locationId in the path, first occurrence.
      std::optional<std::size_t> indexOf(const std::string& locationId) const;

      /// First instruction leaving \p locationId, none for the terminal node.
      std::optional<NavigationInstruction> nextInstruction(const std::string& locationId) const;

      double totalInstructionDistance() const;

      bool operator==(const Route&) const = default;
    };

    //---nlohmann ADL hooks------------------------------------------------
    void to_json(nlohmann::json& j, const NavigationInstruction& ins);
    void to_json(nlohmann::json& j, const Route& route);

  } // namespace model
} // namespace wayfinder
