/* @file Location.cpp
 * @brief location model + JSON mapping for the catalog file
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <array>
#include <cmath>
#include <utility>

// Wayfinder headers
#include "model/Location.hpp"

namespace wayfinder {
  namespace model {

    namespace {
      constexpr std::array<std::pair<LocationType, const char*>, 7> kTypeNames{
        { { LocationType::Room, "room" },
          { LocationType::Hallway, "hallway" },
          { LocationType::Entrance, "entrance" },
          { LocationType::Office, "office" },
          { LocationType::Elevator, "elevator" },
          { LocationType::Stairs, "stairs" },
          { LocationType::Restroom, "restroom" } }
      };
    } // namespace

    const char* toString(LocationType type) {
      for (const auto& [t, name] : kTypeNames) {
        if (t == type)
          return name;
      }
      return "room";
    }

    LocationType locationTypeFromString(const std::string& name) {
      for (const auto& [t, n] : kTypeNames) {
        if (name == n)
          return t;
      }
      return LocationType::Room;
    }

    double distanceBetween(const Coordinates& a, const Coordinates& b) {
      return std::hypot(b.x - a.x, b.y - a.y);
    }

    Location::Location(std::string id, std::string name, std::string description,
                       Coordinates coordinates, std::vector<std::string> connectedIds,
                       LocationType type, nlohmann::json metadata,
                       std::optional<std::string> tagSerial)
        : id_(std::move(id)), name_(std::move(name)), description_(std::move(description)),
          coordinates_(coordinates), connectedIds_(std::move(connectedIds)), type_(type),
          metadata_(std::move(metadata)), tagSerial_(std::move(tagSerial)) {
      if (metadata_.is_null())
        metadata_ = nlohmann::json::object();
    }

    bool Location::isAdjacentTo(const std::string& otherId) const {
      return std::find(connectedIds_.begin(), connectedIds_.end(), otherId) != connectedIds_.end();
    }

    bool Location::operator==(const Location& other) const {
      return id_ == other.id_ && name_ == other.name_ && description_ == other.description_ &&
             coordinates_ == other.coordinates_ && connectedIds_ == other.connectedIds_ &&
             type_ == other.type_ && metadata_ == other.metadata_ && tagSerial_ == other.tagSerial_;
    }

    void to_json(nlohmann::json& j, const Coordinates& c) { j = { { "x", c.x }, { "y", c.y } }; }

    void from_json(const nlohmann::json& j, Coordinates& c) {
      c.x = j.at("x").get<double>();
      c.y = j.at("y").get<double>();
    }

    void to_json(nlohmann::json& j, const Location& loc) {
      j = { { "id", loc.id() },
            { "name", loc.name() },
            { "description", loc.description() },
            { "coordinates", loc.coordinates() },
            { "connectedLocationIds", loc.connectedIds() },
            { "type", toString(loc.type()) },
            { "metadata", loc.metadata() } };
      if (loc.tagSerial())
        j["nfcTagSerial"] = *loc.tagSerial();
    }

    void from_json(const nlohmann::json& j, Location& loc) {
      std::optional<std::string> serial;
      if (auto it = j.find("nfcTagSerial"); it != j.end() && it->is_string())
        serial = it->get<std::string>();

      loc = Location(j.at("id").get<std::string>(), j.at("name").get<std::string>(),
                     j.value("description", std::string{}), j.at("coordinates").get<Coordinates>(),
                     j.at("connectedLocationIds").get<std::vector<std::string>>(),
                     locationTypeFromString(j.value("type", std::string{ "room" })),
                     j.value("metadata", nlohmann::json::object()), std::move(serial));
    }

  } // namespace model
} // namespace wayfinder
