/* @file NavigationSession.cpp
 * @brief enum names for journal rows and the host console
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "core/NavigationSession.hpp"

namespace wayfinder {
  namespace core {

    const char* toString(NavigationState state) {
      switch (state) {
      case NavigationState::Idle:
        return "idle";
      case NavigationState::SelectingDestination:
        return "selectingDestination";
      case NavigationState::Calculating:
        return "calculating";
      case NavigationState::Navigating:
        return "navigating";
      case NavigationState::Arrived:
        return "arrived";
      case NavigationState::Error:
        return "error";
      default:
        return "unknown";
      }
    }

    const char* toString(NavigationFault fault) {
      switch (fault) {
      case NavigationFault::None:
        return "none";
      case NavigationFault::Validation:
        return "validation";
      case NavigationFault::TransitionRejected:
        return "transitionRejected";
      case NavigationFault::NoRouteFound:
        return "noRouteFound";
      case NavigationFault::Precondition:
        return "precondition";
      case NavigationFault::Reader:
        return "reader";
      case NavigationFault::Internal:
        return "internal";
      default:
        return "unknown";
      }
    }

  } // namespace core
} // namespace wayfinder
