#pragma once

/** @file  EngineHost.hpp
 *  @brief Wires catalog, reader, controller, pump and journal; runs the console loop.
 *
 *  © 2025 Milo Medical — licensed under MIT.
 */

#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>

#include "core/ErrorMonitor.hpp"
#include "core/LocationGraph.hpp"
#include "core/Logger.hpp"
#include "core/NavigationConfig.hpp"
#include "core/NavigationController.hpp"
#include "core/RouteCalculator.hpp"
#include "core/TagEventPump.hpp"
#include "io/TagReader.hpp"

namespace wayfinder {
  namespace core {

    class EngineHost {

    public:
      explicit EngineHost(HostConfig config);
      ~EngineHost(); ///< shutdown()

      EngineHost(const EngineHost&) = delete;
      EngineHost& operator=(const EngineHost&) = delete;

      // ---- Public API ----
      bool initialize(); ///< Load catalog, open journal, attach reader (or fall back to manual)
      int run(std::istream& in, std::ostream& out); ///< Console loop until `quit` / EOF
      bool handleCommand(const std::string& line, std::ostream& out); ///< false on `quit`
      void handleError(const std::string& reason);
      void shutdown();

      bool manualMode() const { return !controller_ || controller_->session()->fallbackMode; }
      NavigationController& controller() { return *controller_; }
      const LocationGraph& graph() const { return *graph_; }

    private:
      enum class State { BOOT, INIT, READY, RUNNING, FINISHED, ERROR };

      void transitionTo(State next);
      void say(std::ostream& out, const std::string& text);
      std::string describe(const NavigationSession& s) const;

      HostConfig config_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::shared_ptr<Logger> journal_;
      std::shared_ptr<const LocationGraph> graph_;
      std::shared_ptr<const RouteCalculator> calculator_;
      std::shared_ptr<io::TagReader> reader_;
      std::unique_ptr<NavigationController> controller_;
      std::unique_ptr<TagEventPump> pump_;

      std::mutex outMtx_;
      State currentState_{ State::BOOT };
    };

  } // namespace core
} // namespace wayfinder
