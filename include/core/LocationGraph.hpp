#pragma once
/** @file  LocationGraph.hpp
 *  @brief Read-only query surface over the facility catalog + in-memory catalog.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Wayfinder headers
#include "model/Location.hpp"

namespace wayfinder {
  namespace core {

    /**
 * @class LocationGraph
 * @brief What the engine may ask the catalog; unknown ids yield none / empty.
 *
 *  * No mutation here; populating the graph is the catalog's business.
 *  * Implementations must tolerate concurrent readers.
 */
    class LocationGraph {
    public:
      virtual ~LocationGraph() = default;

      virtual std::optional<model::Location> findById(const std::string& id) const = 0;
      virtual std::vector<model::Location> all() const = 0;

      /// Declared neighbours of \p id in declaration order; dangling ids skipped.
      virtual std::vector<model::Location> adjacentTo(const std::string& id) const = 0;

      virtual bool contains(const std::string& id) const = 0;

      /// Tag UID → location (fallback when a tag carries no payload).
      virtual std::optional<model::Location> findByTagSerial(const std::string& serial) const = 0;

      //---manual selection (built on all())--------------------------------
      /// Case-insensitive substring match on name, description or id; empty query → all().
      std::vector<model::Location> searchLocations(const std::string& query) const;
      std::vector<model::Location> locationsOfType(model::LocationType type) const;
      std::map<model::LocationType, std::vector<model::Location>> locationsByType() const;
    };

    /**
 * @class InMemoryLocationGraph
 * @brief Catalog held in a hash map; insertion order is kept for `all()`.
 */
    class InMemoryLocationGraph : public LocationGraph {
    public:
      InMemoryLocationGraph() = default;
      explicit InMemoryLocationGraph(const std::vector<model::Location>& locations);

      /// Parse `{"locations": [...]}` (or a bare array); throws `std::runtime_error` on bad shape.
      static InMemoryLocationGraph fromJson(const nlohmann::json& catalog);

      /// School floor plan used by the host when no catalog file is configured.
      static InMemoryLocationGraph demoFacility();

      std::optional<model::Location> findById(const std::string& id) const override;
      std::vector<model::Location> all() const override;
      std::vector<model::Location> adjacentTo(const std::string& id) const override;
      bool contains(const std::string& id) const override;
      std::optional<model::Location> findByTagSerial(const std::string& serial) const override;

      //---catalog-side mutation (not part of the engine contract)------------
      void add(model::Location location); ///< replaces an existing id
      void remove(const std::string& id);
      void clear();
      std::size_t size() const { return locations_.size(); }

    private:
      std::unordered_map<std::string, model::Location> locations_;
      std::vector<std::string> order_; ///< insertion order for all()
    };

  } // namespace core
} // namespace wayfinder
