#pragma once
/** @file  NavigationController.hpp
 *  @brief Navigation state machine: tag events in, immutable session snapshots out.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

// Wayfinder headers
#include "core/ErrorMonitor.hpp"
#include "core/LocationGraph.hpp"
#include "core/Logger.hpp"
#include "core/NavigationConfig.hpp"
#include "core/NavigationSession.hpp"
#include "core/RouteCalculator.hpp"
#include "core/RouteStitcher.hpp"
#include "io/TagReader.hpp"
#include "model/TagPayload.hpp"

namespace wayfinder {
  namespace core {

    enum class DeviationSeverity { None, Minor, Moderate, Major, Unknown };

    const char* toString(DeviationSeverity severity);

    /**
 * @class NavigationController
 * @brief Single writer of the navigation session.
 *
 *  * One operation at a time (`opMtx_`); tag events and API calls share the lock.
 *  * Every transition publishes a new `shared_ptr<const NavigationSession>`.
 *  * The scan lease is taken by `startNavigation()` and held while navigating or rerouting;
 *    route planning never touches the reader.
 *  * Reader faults are classified; hardware / permission faults switch to manual check-in.
 *  * Failures become `NavigationState::Error` values; nothing here throws to the caller.
 *  * Observers run on the mutating thread and must not call back into mutating operations.
 */
    class NavigationController {
    public:
      using SessionPtr = std::shared_ptr<const NavigationSession>;
      using Observer = std::function<void(const SessionPtr&)>;
      using SubscriptionId = std::uint64_t;

      /// \p reader may be null (manual check-in only); \p errorMonitor and \p journal are optional.
      NavigationController(std::shared_ptr<const LocationGraph> graph,
                           std::shared_ptr<const RouteCalculator> calculator,
                           std::shared_ptr<io::TagReader> reader, NavigationConfig config = {},
                           std::shared_ptr<ErrorMonitor> errorMonitor = nullptr,
                           std::shared_ptr<Logger> journal = nullptr);
      ~NavigationController() = default;

      NavigationController(const NavigationController&) = delete;
      NavigationController& operator=(const NavigationController&) = delete;

      //---session access---------------------------------------------------
      SessionPtr session() const;
      SubscriptionId subscribe(Observer observer);
      void unsubscribe(SubscriptionId id);

      //---operations-------------------------------------------------------
      void setCurrentLocation(const std::string& locationId);
      void setDestination(const std::string& destinationId);
      void startNavigation();
      void stopNavigation();

      /// Core reactive path. \p eventSeq comes from `noteIncomingEvent()` (0 = direct call).
      void handleTagPayload(const model::TagPayload& payload, std::uint64_t eventSeq = 0);
      void handleReaderError(const std::string& message);

      /// Manual fallback: synthesizes a payload for \p locationId and runs the tag path.
      void checkIn(const std::string& locationId);

      /// Manual check-in only: scanning stops and stays off until `exitFallbackMode()`.
      void enableFallbackMode();
      /// Back to the reader if it reports Available; false (still in fallback) otherwise.
      bool exitFallbackMode();

      /// Full reroute from the current location; no-op unless navigating.
      void triggerRerouting();
      void clearRoute();
      void clearSession();
      void clearError();

      //---queries----------------------------------------------------------
      /// Producer side: stamps an arriving event; later reroutes for older events are discarded.
      std::uint64_t noteIncomingEvent() { return ++arrivals_; }

      /// 0 on route, none without an active route or for an unknown id.
      std::optional<double> deviationDistance(const std::string& locationId) const;

      /// `< minor` → Minor, `< moderate` → Moderate, else Major; none → Unknown.
      static DeviationSeverity classifyDeviation(std::optional<double> nearestDistance,
                                                 const NavigationConfig& config = {});

      const NavigationConfig& config() const { return config_; }

    private:
      struct NearestNode {
        std::string locationId;
        double distance{ 0.0 };
      };

      void processTag(const model::TagPayload& payload, std::uint64_t eventSeq);
      void onRouteUpdate(NavigationSession next, const model::Route& route,
                         const std::string& locationId);
      void handleDeviation(const std::string& locationId, const model::Route& route,
                           std::uint64_t eventSeq);
      bool tryShortReturn(const std::string& locationId, const model::Route& route,
                          const NearestNode& nearest);
      void fullReroute(const std::string& locationId, std::uint64_t eventSeq);
      void applyRoute(const model::Route& route, const std::string& deviationId, bool minor);
      void unreachable(const std::string& locationId);
      void calculateRoute();

      bool isPlausibleTransition(const std::string& fromId, const std::string& toId) const;
      std::optional<NearestNode> nearestOnRoute(const std::string& locationId,
                                                const model::Route& route) const;
      std::string displayName(const std::string& locationId) const;

      void fail(NavigationFault fault, const std::string& message);
      void fail(NavigationSession next, NavigationFault fault, const std::string& message);
      void readerFailed(NavigationSession& next, const std::string& message);
      void publish(NavigationSession next);
      void syncScanning(NavigationSession& next);
      void note(LogCategory category, std::string message) const;
      NavigationSession current() const { return *session(); }

      std::shared_ptr<const LocationGraph> graph_;
      std::shared_ptr<const RouteCalculator> calculator_;
      std::shared_ptr<io::TagReader> reader_;
      NavigationConfig config_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::shared_ptr<Logger> journal_;
      RouteStitcher stitcher_;

      std::mutex opMtx_; ///< one in-flight mutation
      mutable std::mutex sessionMtx_;
      SessionPtr session_;

      std::mutex observerMtx_;
      std::map<SubscriptionId, Observer> observers_;
      SubscriptionId nextSubscription_{ 1 };

      std::optional<io::ScanLease> lease_; ///< declared after reader_, released first
      std::atomic<std::uint64_t> arrivals_{ 0 };
    };

  } // namespace core
} // namespace wayfinder
