#pragma once
/** @file  Location.hpp
 *  @brief Checkpoint / room node of the indoor location graph.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <optional>
#include <string>
#include <vector>

// 3rd-party headers
#include <nlohmann/json.hpp>

namespace wayfinder {
  namespace model {

    enum class LocationType { Room, Hallway, Entrance, Office, Elevator, Stairs, Restroom };

    const char* toString(LocationType type);

    /// Unknown names map to `Room`.
    LocationType locationTypeFromString(const std::string& name);

    /** Map-unit position on the facility plan (y grows downward). */
    struct Coordinates {
      double x{ 0.0 };
      double y{ 0.0 };

      bool operator==(const Coordinates&) const = default;
    };

    /// Straight-line distance in map units.
    double distanceBetween(const Coordinates& a, const Coordinates& b);

    /**
 * @class Location
 * @brief Immutable node description handed out by the catalog.
 *
 *  * Adjacency is declared per node and is not mirrored automatically.
 *  * `tagSerial` links a physical tag UID to the node (optional).
 */
    class Location {
    public:
      Location() = default;
      Location(std::string id, std::string name, std::string description, Coordinates coordinates,
               std::vector<std::string> connectedIds, LocationType type,
               nlohmann::json metadata = nlohmann::json::object(),
               std::optional<std::string> tagSerial = std::nullopt);

      const std::string& id() const { return id_; }
      const std::string& name() const { return name_; }
      const std::string& description() const { return description_; }
      const Coordinates& coordinates() const { return coordinates_; }
      const std::vector<std::string>& connectedIds() const { return connectedIds_; }
      LocationType type() const { return type_; }
      const nlohmann::json& metadata() const { return metadata_; }
      const std::optional<std::string>& tagSerial() const { return tagSerial_; }

      /// True iff \p otherId is declared in this node's adjacency list.
      bool isAdjacentTo(const std::string& otherId) const;

      bool operator==(const Location& other) const;

    private:
      std::string id_;
      std::string name_;
      std::string description_;
      Coordinates coordinates_{};
      std::vector<std::string> connectedIds_;
      LocationType type_{ LocationType::Room };
      nlohmann::json metadata_ = nlohmann::json::object();
      std::optional<std::string> tagSerial_;
    };

    //---nlohmann ADL hooks------------------------------------------------
    void to_json(nlohmann::json& j, const Coordinates& c);
    void from_json(const nlohmann::json& j, Coordinates& c);
    void to_json(nlohmann::json& j, const Location& loc);
    void from_json(const nlohmann::json& j, Location& loc);

  } // namespace model
} // namespace wayfinder
