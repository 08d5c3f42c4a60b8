/* @file NavigationController.cpp
 * @brief navigation FSM: validation, on-route progress, deviation response, rerouting
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <exception>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

// Wayfinder headers
#include "core/NavigationController.hpp"

namespace wayfinder {
  namespace core {

    using model::Route;
    using model::TagPayload;

    const char* toString(DeviationSeverity severity) {
      switch (severity) {
      case DeviationSeverity::None:
        return "none";
      case DeviationSeverity::Minor:
        return "minor";
      case DeviationSeverity::Moderate:
        return "moderate";
      case DeviationSeverity::Major:
        return "major";
      default:
        return "unknown";
      }
    }

    NavigationController::NavigationController(std::shared_ptr<const LocationGraph> graph,
                                               std::shared_ptr<const RouteCalculator> calculator,
                                               std::shared_ptr<io::TagReader> reader,
                                               NavigationConfig config,
                                               std::shared_ptr<ErrorMonitor> errorMonitor,
                                               std::shared_ptr<Logger> journal)
        : graph_(std::move(graph)), calculator_(std::move(calculator)), reader_(std::move(reader)),
          config_(config), errorMonitor_(std::move(errorMonitor)), journal_(std::move(journal)) {
      if (!graph_ || !calculator_)
        throw std::invalid_argument("[NavigationController] graph and calculator are required");
      config_.validate();

      NavigationSession initial;
      if (!reader_) {
        initial.fallbackMode = true;
      } else if (const auto availability = reader_->availability();
                 availability != io::ReaderAvailability::Available) {
        initial.fallbackMode = true;
        initial.readerFault = io::faultFor(availability);
      }
      session_ = std::make_shared<const NavigationSession>(std::move(initial));
    }

    //---session access-----------------------------------------------------

    NavigationController::SessionPtr NavigationController::session() const {
      std::lock_guard<std::mutex> lock(sessionMtx_);
      return session_;
    }

    NavigationController::SubscriptionId NavigationController::subscribe(Observer observer) {
      std::lock_guard<std::mutex> lock(observerMtx_);
      const SubscriptionId id = nextSubscription_++;
      observers_.emplace(id, std::move(observer));
      return id;
    }

    void NavigationController::unsubscribe(SubscriptionId id) {
      std::lock_guard<std::mutex> lock(observerMtx_);
      observers_.erase(id);
    }

    //---operations---------------------------------------------------------

    void NavigationController::setCurrentLocation(const std::string& locationId) {
      std::lock_guard<std::mutex> op(opMtx_);
      if (!graph_->contains(locationId)) {
        fail(NavigationFault::Validation, "Invalid location: " + locationId);
        return;
      }

      NavigationSession next = current();
      next.currentLocationId = locationId;
      if (next.state == NavigationState::Error)
        next.state = NavigationState::Idle;
      publish(std::move(next));
    }

    void NavigationController::setDestination(const std::string& destinationId) {
      std::lock_guard<std::mutex> op(opMtx_);
      if (!graph_->contains(destinationId)) {
        fail(NavigationFault::Validation, "Invalid destination: " + destinationId);
        return;
      }

      NavigationSession next = current();
      next.destinationLocationId = destinationId;
      next.state = NavigationState::SelectingDestination;
      next.activeRoute.reset(); // a route to the old destination is stale
      next.currentInstruction.reset();
      next.currentStepIndex = 0;
      publish(std::move(next));

      if (current().currentLocationId)
        calculateRoute();
    }

    void NavigationController::startNavigation() {
      std::lock_guard<std::mutex> op(opMtx_);
      NavigationSession next = current();
      if (!next.activeRoute) {
        fail(NavigationFault::Precondition, "No route available to start navigation");
        return;
      }
      if (!next.currentLocationId) {
        fail(NavigationFault::Precondition, "Current location not set");
        return;
      }

      const Route& route = *next.activeRoute;
      next.currentInstruction = calculator_->nextInstruction(route, *next.currentLocationId);
      next.currentStepIndex = route.indexOf(*next.currentLocationId).value_or(0);
      next.state = NavigationState::Navigating;
      publish(std::move(next));
    }

    void NavigationController::stopNavigation() {
      std::lock_guard<std::mutex> op(opMtx_);
      NavigationSession next = current();
      next.state = NavigationState::Idle;
      next.currentInstruction.reset();
      next.currentStepIndex = 0;
      publish(std::move(next));
    }

    void NavigationController::handleTagPayload(const TagPayload& payload, std::uint64_t eventSeq) {
      std::lock_guard<std::mutex> op(opMtx_);
      processTag(payload, eventSeq);
    }

    void NavigationController::handleReaderError(const std::string& message) {
      std::lock_guard<std::mutex> op(opMtx_);
      note(LogCategory::Reader, message);
      NavigationSession next = current();
      readerFailed(next, message);
      fail(std::move(next), NavigationFault::Reader, "Tag reader error: " + message);
    }

    void NavigationController::checkIn(const std::string& locationId) {
      std::lock_guard<std::mutex> op(opMtx_);
      TagPayload::AuxData aux = TagPayload::AuxData::object();
      aux["source"] = "manual";
      processTag(TagPayload::create(locationId, std::chrono::system_clock::now(), std::move(aux)),
                 0);
    }

    void NavigationController::triggerRerouting() {
      std::lock_guard<std::mutex> op(opMtx_);
      const NavigationSession s = current();
      if (!s.isNavigating() || !s.activeRoute || !s.currentLocationId || !s.destinationLocationId)
        return;
      fullReroute(*s.currentLocationId, 0);
    }

    void NavigationController::clearRoute() {
      std::lock_guard<std::mutex> op(opMtx_);
      NavigationSession next = current();
      next.activeRoute.reset();
      next.currentInstruction.reset();
      next.currentStepIndex = 0;
      next.state = NavigationState::Idle;
      publish(std::move(next));
    }

    void NavigationController::clearSession() {
      std::lock_guard<std::mutex> op(opMtx_);
      const NavigationSession before = current();
      NavigationSession fresh;
      fresh.fallbackMode = before.fallbackMode; // reader mode outlives the journey
      fresh.readerFault = before.readerFault;
      publish(std::move(fresh));
    }

    void NavigationController::clearError() {
      std::lock_guard<std::mutex> op(opMtx_);
      NavigationSession next = current();
      if (next.state != NavigationState::Error)
        return;
      next.state = NavigationState::Idle;
      publish(std::move(next));
    }

    void NavigationController::enableFallbackMode() {
      std::lock_guard<std::mutex> op(opMtx_);
      NavigationSession next = current();
      if (next.fallbackMode)
        return;
      next.fallbackMode = true;
      note(LogCategory::Reader, "manual check-in enabled");
      publish(std::move(next));
    }

    bool NavigationController::exitFallbackMode() {
      std::lock_guard<std::mutex> op(opMtx_);
      NavigationSession next = current();
      if (!next.fallbackMode)
        return true;
      if (!reader_)
        return false;

      const auto availability = reader_->availability();
      if (availability != io::ReaderAvailability::Available) {
        note(LogCategory::Reader,
             std::string("reader still ") + io::toString(availability) + ", staying manual");
        next.readerFault = io::faultFor(availability);
        publish(std::move(next));
        return false;
      }

      next.fallbackMode = false;
      next.readerFault.reset();
      note(LogCategory::Reader, "tag reader re-enabled");
      publish(std::move(next));
      return !current().fallbackMode;
    }

    //---queries------------------------------------------------------------

    std::optional<double> NavigationController::deviationDistance(
        const std::string& locationId) const {
      const SessionPtr s = session();
      if (!s->activeRoute)
        return std::nullopt;
      if (s->activeRoute->containsLocation(locationId))
        return 0.0;
      if (auto nearest = nearestOnRoute(locationId, *s->activeRoute))
        return nearest->distance;
      return std::nullopt;
    }

    DeviationSeverity NavigationController::classifyDeviation(std::optional<double> nearestDistance,
                                                              const NavigationConfig& config) {
      if (!nearestDistance)
        return DeviationSeverity::Unknown;
      if (*nearestDistance < config.minorDeviationDistance)
        return DeviationSeverity::Minor;
      if (*nearestDistance < config.moderateDeviationDistance)
        return DeviationSeverity::Moderate;
      return DeviationSeverity::Major;
    }

    //---tag path-----------------------------------------------------------

    void NavigationController::processTag(const TagPayload& payload, std::uint64_t eventSeq) {
      if (!payload.isValid()) {
        note(LogCategory::Tag, "checksum mismatch, ignored: " + payload.locationId());
        return;
      }

      const std::string& id = payload.locationId();
      if (!graph_->contains(id)) {
        fail(NavigationFault::Validation, "Invalid location detected: " + id);
        return;
      }
      note(LogCategory::Tag, "scanned " + id);

      NavigationSession next = current();
      if (!next.isNavigating() || !next.activeRoute) {
        next.currentLocationId = id;
        publish(std::move(next));
        return;
      }

      const Route route = *next.activeRoute;
      if (route.containsLocation(id)) {
        next.currentLocationId = id;
        onRouteUpdate(std::move(next), route, id);
        return;
      }

      if (next.currentLocationId && !isPlausibleTransition(*next.currentLocationId, id)) {
        note(LogCategory::Deviation, "rejected jump " + *next.currentLocationId + " -> " + id);
        fail(NavigationFault::TransitionRejected,
             "Invalid location transition detected. Please scan a valid tag.");
        return;
      }

      next.currentLocationId = id;
      publish(std::move(next));
      handleDeviation(id, route, eventSeq);
    }

    void NavigationController::onRouteUpdate(NavigationSession next, const Route& route,
                                             const std::string& locationId) {
      const std::size_t index = route.indexOf(locationId).value_or(0);
      if (index < next.currentStepIndex)
        note(LogCategory::Transition, "moved back on route to " + locationId + " (step " +
                                          std::to_string(index) + ")");

      next.currentStepIndex = index;
      next.currentInstruction = calculator_->nextInstruction(route, locationId);

      if (locationId == route.endLocationId) {
        next.state = NavigationState::Arrived;
        next.currentInstruction.reset();
      }
      publish(std::move(next));
    }

    void NavigationController::handleDeviation(const std::string& locationId, const Route& route,
                                               std::uint64_t eventSeq) {
      const auto nearest = nearestOnRoute(locationId, route);
      const DeviationSeverity severity =
          classifyDeviation(nearest ? std::optional<double>(nearest->distance) : std::nullopt,
                            config_);

      std::ostringstream msg;
      msg << toString(severity) << " deviation at " << locationId;
      if (nearest)
        msg << ", nearest " << nearest->locationId << " at " << std::fixed << std::setprecision(1)
            << nearest->distance;
      note(LogCategory::Deviation, msg.str());

      if (severity == DeviationSeverity::Minor && tryShortReturn(locationId, route, *nearest))
        return;
      fullReroute(locationId, eventSeq);
    }

    bool NavigationController::tryShortReturn(const std::string& locationId, const Route& route,
                                              const NearestNode& nearest) {
      std::optional<Route> back;
      try {
        back = calculator_->calculateRoute(locationId, nearest.locationId);
      } catch (const std::exception& e) {
        note(LogCategory::Reroute, std::string("short return failed: ") + e.what());
        return false;
      }
      if (!back || back->estimatedDistance >= config_.shortReturnMaxDistance)
        return false;

      const auto combined = stitcher_.combine(*back, route, nearest.locationId);
      if (!combined)
        return false;

      applyRoute(*combined, locationId, true);
      return true;
    }

    void NavigationController::fullReroute(const std::string& locationId, std::uint64_t eventSeq) {
      NavigationSession calculating = current();
      if (!calculating.destinationLocationId)
        return;
      const std::string destination = *calculating.destinationLocationId;
      const std::uint64_t ticket = eventSeq != 0 ? eventSeq : arrivals_.load();

      calculating.state = NavigationState::Calculating;
      publish(std::move(calculating));

      std::optional<Route> route;
      try {
        route = calculator_->recalculateFromCurrent(locationId, destination);
      } catch (const std::exception& e) {
        fail(NavigationFault::Internal, std::string("Route recalculation failed: ") + e.what());
        return;
      }

      if (arrivals_.load() > ticket) {
        note(LogCategory::Reroute, "reroute from " + locationId + " superseded by a newer scan");
        NavigationSession keep = current();
        if (keep.state == NavigationState::Calculating) {
          keep.state = NavigationState::Navigating;
          publish(std::move(keep));
        }
        return;
      }

      if (route && route->isValid())
        applyRoute(*route, locationId, false);
      else
        unreachable(locationId);
    }

    void NavigationController::applyRoute(const Route& route, const std::string& deviationId,
                                          bool minor) {
      NavigationSession next = current();
      next.activeRoute = route;
      next.state = NavigationState::Navigating;
      next.currentInstruction =
          route.instructions.empty() ? std::nullopt
                                     : std::optional<model::NavigationInstruction>(
                                           route.instructions.front());
      next.currentStepIndex = 0;
      publish(std::move(next));

      std::ostringstream msg;
      msg << (minor ? "Minor reroute" : "Full reroute") << ": deviation at " << deviationId
          << ", new route distance: " << std::fixed << std::setprecision(1)
          << route.estimatedDistance << "m, estimated time: "
          << std::chrono::duration_cast<std::chrono::minutes>(route.estimatedTime).count()
          << "min";
      note(LogCategory::Reroute, msg.str());
    }

    void NavigationController::unreachable(const std::string& locationId) {
      NavigationSession next = current();
      std::string message = "Unable to calculate route from current location to destination.";
      if (next.destinationLocationId && graph_->contains(locationId) &&
          graph_->contains(*next.destinationLocationId)) {
        message = "No route found from " + displayName(locationId) + " to " +
                  displayName(*next.destinationLocationId) +
                  ". Please navigate to a connected location and try again.";
      }

      next.activeRoute.reset();
      next.currentInstruction.reset();
      next.currentStepIndex = 0;
      next.state = NavigationState::Error;
      next.errorMessage = message;
      next.fault = NavigationFault::NoRouteFound;
      note(LogCategory::Fault, message);
      publish(std::move(next));
    }

    void NavigationController::calculateRoute() {
      NavigationSession calculating = current();
      if (!calculating.currentLocationId || !calculating.destinationLocationId)
        return;
      const std::string from = *calculating.currentLocationId;
      const std::string to = *calculating.destinationLocationId;

      calculating.state = NavigationState::Calculating;
      publish(std::move(calculating));

      std::optional<Route> route;
      try {
        route = calculator_->calculateRoute(from, to);
      } catch (const std::exception& e) {
        fail(NavigationFault::Internal, std::string("Route calculation failed: ") + e.what());
        return;
      }

      if (!route || !route->isValid()) {
        fail(NavigationFault::NoRouteFound, "No route found to destination");
        return;
      }

      NavigationSession next = current();
      next.activeRoute = std::move(route);
      next.state = NavigationState::Idle;
      publish(std::move(next));
    }

    //---helpers------------------------------------------------------------

    bool NavigationController::isPlausibleTransition(const std::string& fromId,
                                                     const std::string& toId) const {
      const auto from = graph_->findById(fromId);
      if (!from)
        return false;
      if (from->isAdjacentTo(toId))
        return true;
      const auto to = graph_->findById(toId);
      if (!to)
        return false;
      return model::distanceBetween(from->coordinates(), to->coordinates()) <=
             config_.transitionProximity;
    }

    std::optional<NavigationController::NearestNode> NavigationController::nearestOnRoute(
        const std::string& locationId, const Route& route) const {
      const auto here = graph_->findById(locationId);
      if (!here)
        return std::nullopt;

      std::optional<NearestNode> best;
      for (const auto& id : route.path) {
        const auto node = graph_->findById(id);
        if (!node)
          continue;
        const double d = model::distanceBetween(here->coordinates(), node->coordinates());
        if (!best || d < best->distance)
          best = NearestNode{ id, d };
      }
      return best;
    }

    std::string NavigationController::displayName(const std::string& locationId) const {
      const auto loc = graph_->findById(locationId);
      return loc ? loc->name() : locationId;
    }

    void NavigationController::fail(NavigationFault fault, const std::string& message) {
      fail(current(), fault, message);
    }

    void NavigationController::fail(NavigationSession next, NavigationFault fault,
                                    const std::string& message) {
      next.state = NavigationState::Error;
      next.errorMessage = message;
      next.fault = fault;
      note(LogCategory::Fault, message);
      if (errorMonitor_ && (fault == NavigationFault::Reader || fault == NavigationFault::Internal))
        errorMonitor_->notifyFailure("[NavigationController] " + message);
      publish(std::move(next));
    }

    void NavigationController::readerFailed(NavigationSession& next, const std::string& message) {
      next.readerFault = io::classifyReaderError(message);
      if (io::shouldOfferManualSelection(*next.readerFault) && !next.fallbackMode) {
        next.fallbackMode = true;
        note(LogCategory::Reader, std::string("switching to manual check-in (") +
                                      io::toString(next.readerFault->kind) + ")");
      }
    }

    void NavigationController::syncScanning(NavigationSession& next) {
      if (!reader_)
        return;

      // only an active navigation takes the lease; a reroute keeps the one it has
      if (next.isNavigating() && !next.fallbackMode && !lease_) {
        try {
          lease_.emplace(*reader_);
        } catch (const std::exception& e) {
          next.state = NavigationState::Error;
          next.errorMessage = std::string("Failed to start navigation: ") + e.what();
          next.fault = NavigationFault::Reader;
          next.currentInstruction.reset();
          readerFailed(next, e.what());
          note(LogCategory::Fault, *next.errorMessage);
          if (errorMonitor_)
            errorMonitor_->notifyFailure("[NavigationController] " + *next.errorMessage);
        }
      } else if (!next.wantsScanning() && lease_) {
        try {
          lease_->release();
        } catch (const std::exception& e) {
          next.state = NavigationState::Error;
          next.errorMessage = std::string("Failed to stop navigation: ") + e.what();
          next.fault = NavigationFault::Reader;
          next.readerFault = io::classifyReaderError(e.what());
          note(LogCategory::Fault, *next.errorMessage);
          if (errorMonitor_)
            errorMonitor_->notifyFailure("[NavigationController] " + *next.errorMessage);
        }
        lease_.reset();
      }
    }

    void NavigationController::publish(NavigationSession next) {
      syncScanning(next);

      if (next.state != NavigationState::Error) {
        next.errorMessage.reset();
        next.fault = NavigationFault::None;
        if (!next.fallbackMode)
          next.readerFault.reset();
      }

      auto published = std::make_shared<const NavigationSession>(std::move(next));
      NavigationState previous;
      {
        std::lock_guard<std::mutex> lock(sessionMtx_);
        previous = session_->state;
        session_ = published;
      }
      if (previous != published->state)
        note(LogCategory::Transition,
             std::string(toString(previous)) + " -> " + toString(published->state));

      std::vector<Observer> targets;
      {
        std::lock_guard<std::mutex> lock(observerMtx_);
        targets.reserve(observers_.size());
        for (const auto& [id, observer] : observers_)
          targets.push_back(observer);
      }
      for (const auto& observer : targets)
        observer(published);
    }

    void NavigationController::note(LogCategory category, std::string message) const {
      if (journal_)
        journal_->log(category, std::move(message));
    }

  } // namespace core
} // namespace wayfinder
