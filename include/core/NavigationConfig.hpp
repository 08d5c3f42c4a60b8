#pragma once
/** @file  NavigationConfig.hpp
 *  @brief Tunable constants of the routing / deviation logic + host wiring.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstddef>
#include <string>

// 3rd-party headers
#include <nlohmann/json.hpp>

namespace wayfinder {
  namespace core {

    /**
 * @struct NavigationConfig
 * @brief Distances in map units unless the name says meters.
 */
    struct NavigationConfig {
      double metersPerUnit{ 0.5 };                ///< map unit → meters
      double walkingSpeedMetersPerMinute{ 80.0 }; ///< ~4.8 km/h
      std::chrono::seconds checkpointDelay{ 30 }; ///< added per hop
      double transitionProximity{ 100.0 };        ///< max plausible jump without adjacency
      double minorDeviationDistance{ 50.0 };      ///< nearest-node distance < this → minor
      double moderateDeviationDistance{ 200.0 };  ///< < this → moderate, else major
      double shortReturnMaxDistance{ 100.0 };     ///< meters, splice only below this
      std::size_t eventQueueCapacity{ 32 };

      /// Throws `std::invalid_argument` on non-positive scale/speed or inverted thresholds.
      void validate() const;
    };

    /** Everything the host needs beyond the engine constants. */
    struct HostConfig {
      NavigationConfig navigation{};
      std::string catalogPath{};  ///< empty → built-in demo facility
      std::string readerDevice{}; ///< empty → manual check-in only
      unsigned int readerBaud{ 115200 };
      std::string journalPath{ "wayfinder_journal.csv" };
    };

    /// Missing keys keep their defaults; result is validated.
    NavigationConfig navigationConfigFromJson(const nlohmann::json& j);
    HostConfig hostConfigFromJson(const nlohmann::json& j);

  } // namespace core
} // namespace wayfinder
