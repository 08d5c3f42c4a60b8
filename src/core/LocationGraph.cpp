/* @file LocationGraph.cpp
 * @brief in-memory catalog + demo facility plan
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

// Wayfinder headers
#include "core/LocationGraph.hpp"

using namespace wayfinder::core;
using wayfinder::model::Coordinates;
using wayfinder::model::Location;
using wayfinder::model::LocationType;

namespace {
  std::string lowered(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
  }
} // namespace

std::vector<Location> LocationGraph::searchLocations(const std::string& query) const {
  std::vector<Location> found = all();
  if (query.empty())
    return found;

  const std::string needle = lowered(query);
  auto misses = [&needle](const Location& loc) {
    return lowered(loc.name()).find(needle) == std::string::npos &&
           lowered(loc.description()).find(needle) == std::string::npos &&
           lowered(loc.id()).find(needle) == std::string::npos;
  };
  found.erase(std::remove_if(found.begin(), found.end(), misses), found.end());
  return found;
}

std::vector<Location> LocationGraph::locationsOfType(LocationType type) const {
  std::vector<Location> found = all();
  found.erase(std::remove_if(found.begin(), found.end(),
                             [type](const Location& loc) { return loc.type() != type; }),
              found.end());
  return found;
}

std::map<LocationType, std::vector<Location>> LocationGraph::locationsByType() const {
  std::map<LocationType, std::vector<Location>> grouped;
  for (auto& loc : all())
    grouped[loc.type()].push_back(std::move(loc));
  return grouped;
}

InMemoryLocationGraph::InMemoryLocationGraph(const std::vector<Location>& locations) {
  for (const auto& loc : locations)
    add(loc);
}

InMemoryLocationGraph InMemoryLocationGraph::fromJson(const nlohmann::json& catalog) {
  const nlohmann::json* list = &catalog;
  if (catalog.is_object()) {
    auto it = catalog.find("locations");
    if (it == catalog.end())
      throw std::runtime_error("[LocationGraph] catalog has no 'locations' array");
    list = &*it;
  }
  if (!list->is_array())
    throw std::runtime_error("[LocationGraph] catalog 'locations' is not an array");

  InMemoryLocationGraph graph;
  for (const auto& entry : *list) {
    try {
      graph.add(entry.get<Location>());
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("[LocationGraph] malformed location entry: ") + e.what());
    }
  }
  return graph;
}

std::optional<Location> InMemoryLocationGraph::findById(const std::string& id) const {
  auto it = locations_.find(id);
  if (it == locations_.end())
    return std::nullopt;
  return it->second;
}

std::vector<Location> InMemoryLocationGraph::all() const {
  std::vector<Location> out;
  out.reserve(order_.size());
  for (const auto& id : order_)
    out.push_back(locations_.at(id));
  return out;
}

std::vector<Location> InMemoryLocationGraph::adjacentTo(const std::string& id) const {
  std::vector<Location> out;
  auto it = locations_.find(id);
  if (it == locations_.end())
    return out;

  for (const auto& neighbourId : it->second.connectedIds()) {
    if (auto n = locations_.find(neighbourId); n != locations_.end())
      out.push_back(n->second);
  }
  return out;
}

bool InMemoryLocationGraph::contains(const std::string& id) const {
  return locations_.count(id) != 0;
}

std::optional<Location> InMemoryLocationGraph::findByTagSerial(const std::string& serial) const {
  for (const auto& id : order_) {
    const auto& loc = locations_.at(id);
    if (loc.tagSerial() && *loc.tagSerial() == serial)
      return loc;
  }
  return std::nullopt;
}

void InMemoryLocationGraph::add(Location location) {
  const std::string id = location.id();
  if (locations_.count(id) == 0)
    order_.push_back(id);
  locations_.insert_or_assign(id, std::move(location));
}

void InMemoryLocationGraph::remove(const std::string& id) {
  if (locations_.erase(id) != 0)
    order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
}

void InMemoryLocationGraph::clear() {
  locations_.clear();
  order_.clear();
}

InMemoryLocationGraph InMemoryLocationGraph::demoFacility() {
  // pixel positions on the 1615x1255 floor-plan image
  auto node = [](std::string id, std::string name, std::string desc, double x, double y,
                 std::vector<std::string> links, LocationType type, std::string serial) {
    return Location(id, std::move(name), std::move(desc), Coordinates{ x, y }, std::move(links),
                    type, nlohmann::json::object(), std::move(serial));
  };

  InMemoryLocationGraph g;
  // rooms
  g.add(node("Gym", "Gym", "School gymnasium and sports facility", 378, 296, { "CP1" },
             LocationType::Room, "04:A1:0A:01:92:44:03"));
  g.add(node("Cafeteria", "Cafeteria", "Student dining area", 562, 576, { "CP9" },
             LocationType::Room, "04:A1:B7:01:D0:44:03"));
  g.add(node("Auditorium", "Auditorium", "Main auditorium for assemblies and events", 532, 1041,
             { "CP7" }, LocationType::Room, "04:A1:23:01:03:44:03"));
  g.add(node("Main Office", "Main Office", "School administrative office", 1014, 1107, { "CP5" },
             LocationType::Office, "04:A1:3B:01:2C:44:03"));
  g.add(node("Nurse's Office", "Nurse's Office", "School health office", 1031, 901, { "CP6" },
             LocationType::Office, "04:A1:66:01:AC:44:03"));
  g.add(node("Media Center", "Media Center", "Library and media resources", 1031, 638, { "CP10" },
             LocationType::Room, "04:A1:28:01:FD:44:03"));
  g.add(node("7 Red/7 Gold", "7 Red/7 Gold", "Seventh grade classrooms", 1264, 462, { "CP3" },
             LocationType::Room, "04:A1:70:01:E9:44:03"));
  // entrances
  g.add(node("Main Entrance", "Main Entrance", "Primary school entrance", 968, 1162, { "CP5" },
             LocationType::Entrance, "04:A1:7E:01:E6:44:03"));
  g.add(node("Auditorium Entrance", "Auditorium Entrance", "Entrance to auditorium area", 659,
             1164, { "CP7" }, LocationType::Entrance, "04:A1:A2:A2:01:C4:44:03"));
  g.add(node("Bus Entrance", "Bus Entrance", "Entrance near bus loading area", 364, 510, { "CP1" },
             LocationType::Entrance, "04:A1:64:01:F2:44:03"));
  // corridor checkpoints
  g.add(node("CP1", "Checkpoint 1", "Navigation checkpoint near gym area", 372, 458,
             { "Gym", "CP2", "Bus Entrance" }, LocationType::Hallway, "04:A1:1C:01:00:44:03"));
  g.add(node("CP2", "Checkpoint 2", "Central corridor junction", 658, 461,
             { "CP1", "CP9", "CP3", "CP4" }, LocationType::Hallway, "04:A1:06:01:3A:44:03"));
  g.add(node("CP3", "Checkpoint 3", "East corridor checkpoint", 969, 464,
             { "CP2", "CPA", "CP11", "7 Red/7 Gold" }, LocationType::Hallway,
             "04:A1:BA:01:E8:44:03"));
  g.add(node("CPA", "Checkpoint A", "Auxiliary checkpoint", 816, 465, { "CP3", "CP2", "CP11" },
             LocationType::Hallway, "04:A1:67:01:3B:44:03"));
  g.add(node("CP9", "Checkpoint 9", "Cafeteria area checkpoint", 658, 576,
             { "CP2", "Cafeteria", "CP4" }, LocationType::Hallway, "04:A1:A6:01:DD:44:03"));
  g.add(node("CP10", "Checkpoint 10", "Media center area checkpoint", 970, 651,
             { "CP3", "CP11", "Media Center" }, LocationType::Hallway, "04:A1:5A:01:DA:44:03"));
  g.add(node("CPB", "Checkpoint B", "Secondary auxiliary checkpoint", 813, 849, { "CP4", "CP11" },
             LocationType::Hallway, "04:A1:34:01:5E:44:03"));
  g.add(node("CP4", "Checkpoint 4", "South corridor checkpoint", 658, 850,
             { "CP2", "CP9", "CPB", "CP7" }, LocationType::Hallway, "04:A1:6E:01:CB:44:03"));
  g.add(node("CP6", "Checkpoint 6", "Administrative area checkpoint", 967, 909,
             { "CP11", "Nurse's Office", "CP5" }, LocationType::Hallway, "04:A1:98:01:DF:44:03"));
  g.add(node("CP7", "Checkpoint 7", "Auditorium area checkpoint", 658, 1012,
             { "CP4", "Auditorium", "Auditorium Entrance" }, LocationType::Hallway,
             "04:A1:50:01:D0:44:03"));
  g.add(node("CP5", "Checkpoint 5", "Main entrance area checkpoint", 968, 1115,
             { "CP6", "Main Office", "Main Entrance" }, LocationType::Hallway,
             "04:A1:36:01:B4:44:03"));
  g.add(node("CP11", "Checkpoint 11", "East administrative checkpoint", 967, 847,
             { "CP3", "CP10", "CP6", "CPB" }, LocationType::Hallway, "04:A1:15:01:D8:44:03"));
  return g;
}
