/* @file ConfigLoader.cpp
 * @brief JSON file loading + mapping onto NavigationConfig / HostConfig
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <fstream>
#include <stdexcept>
#include <utility>

// 3rd-party headers
#include <nlohmann/json.hpp>

// Wayfinder headers
#include "core/ConfigLoader.hpp"
#include "core/NavigationConfig.hpp"

namespace wayfinder {
  namespace core {

    ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

    nlohmann::json ConfigLoader::load() const {
      std::ifstream in(path_);
      if (!in)
        throw std::runtime_error("[ConfigLoader] cannot open " + path_);

      try {
        return nlohmann::json::parse(in);
      } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("[ConfigLoader] " + path_ + ": " + e.what());
      }
    }

    void NavigationConfig::validate() const {
      if (metersPerUnit <= 0.0)
        throw std::invalid_argument("[NavigationConfig] metersPerUnit must be > 0");
      if (walkingSpeedMetersPerMinute <= 0.0)
        throw std::invalid_argument("[NavigationConfig] walkingSpeedMetersPerMinute must be > 0");
      if (checkpointDelay.count() < 0)
        throw std::invalid_argument("[NavigationConfig] checkpointDelaySeconds must be >= 0");
      if (transitionProximity < 0.0 || shortReturnMaxDistance < 0.0)
        throw std::invalid_argument("[NavigationConfig] distances must be >= 0");
      if (minorDeviationDistance < 0.0 || moderateDeviationDistance < minorDeviationDistance)
        throw std::invalid_argument(
            "[NavigationConfig] deviation thresholds must satisfy 0 <= minor <= moderate");
      if (eventQueueCapacity == 0)
        throw std::invalid_argument("[NavigationConfig] eventQueueCapacity must be > 0");
    }

    NavigationConfig navigationConfigFromJson(const nlohmann::json& j) {
      NavigationConfig cfg;
      if (!j.is_object())
        throw std::invalid_argument("[NavigationConfig] navigation section is not an object");

      try {
        cfg.metersPerUnit = j.value("metersPerUnit", cfg.metersPerUnit);
        cfg.walkingSpeedMetersPerMinute =
            j.value("walkingSpeedMetersPerMinute", cfg.walkingSpeedMetersPerMinute);
        cfg.checkpointDelay = std::chrono::seconds{ j.value(
            "checkpointDelaySeconds", static_cast<long long>(cfg.checkpointDelay.count())) };
        cfg.transitionProximity = j.value("transitionProximity", cfg.transitionProximity);
        cfg.minorDeviationDistance = j.value("minorDeviationDistance", cfg.minorDeviationDistance);
        cfg.moderateDeviationDistance =
            j.value("moderateDeviationDistance", cfg.moderateDeviationDistance);
        cfg.shortReturnMaxDistance = j.value("shortReturnMaxDistance", cfg.shortReturnMaxDistance);
        cfg.eventQueueCapacity = j.value("eventQueueCapacity", cfg.eventQueueCapacity);
      } catch (const nlohmann::json::type_error& e) {
        throw std::invalid_argument(std::string("[NavigationConfig] ") + e.what());
      }

      cfg.validate();
      return cfg;
    }

    HostConfig hostConfigFromJson(const nlohmann::json& j) {
      if (!j.is_object())
        throw std::invalid_argument("[HostConfig] root is not an object");

      HostConfig host;
      if (auto it = j.find("navigation"); it != j.end())
        host.navigation = navigationConfigFromJson(*it);

      try {
        host.catalogPath = j.value("catalogPath", host.catalogPath);
        host.readerDevice = j.value("readerDevice", host.readerDevice);
        host.readerBaud = j.value("readerBaud", host.readerBaud);
        host.journalPath = j.value("journalPath", host.journalPath);
      } catch (const nlohmann::json::type_error& e) {
        throw std::invalid_argument(std::string("[HostConfig] ") + e.what());
      }
      return host;
    }

  } // namespace core
} // namespace wayfinder
