#pragma once
/** @file  NavigationSession.hpp
 *  @brief Immutable snapshot of one user journey (published after every transition).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <optional>
#include <string>

// Wayfinder headers
#include "io/ReaderFault.hpp"
#include "model/Route.hpp"

namespace wayfinder {
  namespace core {

    enum class NavigationState { Idle, SelectingDestination, Calculating, Navigating, Arrived, Error };

    /// Why the session is in `Error` (None otherwise).
    enum class NavigationFault {
      None,
      Validation,         ///< unknown location id
      TransitionRejected, ///< physically implausible checkpoint jump
      NoRouteFound,
      Precondition, ///< e.g. start without a route
      Reader,
      Internal
    };

    const char* toString(NavigationState state);
    const char* toString(NavigationFault fault);

    struct NavigationSession {
      std::optional<std::string> currentLocationId;
      std::optional<std::string> destinationLocationId;
      std::optional<model::Route> activeRoute;
      NavigationState state{ NavigationState::Idle };
      std::optional<model::NavigationInstruction> currentInstruction;
      std::size_t currentStepIndex{ 0 };
      std::optional<std::string> errorMessage; ///< set iff state == Error
      NavigationFault fault{ NavigationFault::None };
      std::optional<io::ReaderFault> readerFault; ///< classified cause of a Reader fault
      bool fallbackMode{ false }; ///< manual check-in, the reader stays off

      bool isNavigating() const { return state == NavigationState::Navigating; }
      bool hasActiveRoute() const { return activeRoute.has_value(); }
      bool hasError() const { return state == NavigationState::Error; }

      /// Scanning runs while navigating, including a reroute in progress, unless in fallback.
      bool wantsScanning() const {
        if (fallbackMode)
          return false;
        return state == NavigationState::Navigating ||
               (state == NavigationState::Calculating && activeRoute.has_value());
      }

      bool operator==(const NavigationSession&) const = default;
    };

  } // namespace core
} // namespace wayfinder
