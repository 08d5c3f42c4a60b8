/* @file EngineHost.cpp
 * @brief host lifecycle (BOOT → INIT → READY → RUNNING → FINISHED) + line commands
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

// 3rd-party headers
#include <nlohmann/json.hpp>

// Wayfinder headers
#include "core/ConfigLoader.hpp"
#include "core/EngineHost.hpp"
#include "io/ReaderFault.hpp"
#include "io/SerialTagReader.hpp"

using namespace wayfinder::core;

namespace {
  const char* kHelp =
      "commands: locations [type] | find <text> | from <id> | to <id> | start | stop |\n"
      "          checkin <id> | reroute | route | status | clearroute | clear | ack |\n"
      "          manual | reader | quit\n";

  std::string listing(const std::vector<wayfinder::model::Location>& locations) {
    std::ostringstream os;
    for (const auto& loc : locations)
      os << "  " << std::left << std::setw(16) << loc.id() << loc.name() << " ("
         << wayfinder::model::toString(loc.type()) << ")\n";
    return os.str();
  }

  const char* stateName(int s) {
    static const char* names[] = { "BOOT", "INIT", "READY", "RUNNING", "FINISHED", "ERROR" };
    return names[s];
  }
} // namespace

EngineHost::EngineHost(HostConfig config)
    : config_(std::move(config)), errorMonitor_(std::make_shared<ErrorMonitor>()),
      journal_(std::make_shared<Logger>()) {
  errorMonitor_->registerEscalation(
      [](const std::string& msg) { std::cerr << "[wayfinder] fault: " << msg << "\n"; });
}

EngineHost::~EngineHost() { shutdown(); }

bool EngineHost::initialize() {
  transitionTo(State::INIT);
  try {
    config_.navigation.validate();

    if (config_.catalogPath.empty()) {
      graph_ = std::make_shared<const InMemoryLocationGraph>(InMemoryLocationGraph::demoFacility());
    } else {
      graph_ = std::make_shared<const InMemoryLocationGraph>(
          InMemoryLocationGraph::fromJson(ConfigLoader(config_.catalogPath).load()));
    }
    calculator_ = std::make_shared<const DijkstraRouteCalculator>(graph_, config_.navigation);

    if (!config_.journalPath.empty() && !journal_->startNewRun(config_.journalPath))
      std::cerr << "[EngineHost] journal disabled, cannot write " << config_.journalPath << "\n";

    if (!config_.readerDevice.empty()) {
      reader_ = std::make_shared<io::SerialTagReader>(config_.readerDevice, config_.readerBaud,
                                                      graph_);
      const auto availability = reader_->availability();
      if (availability != io::ReaderAvailability::Available)
        std::cerr << "[EngineHost] reader " << config_.readerDevice << " is "
                  << io::toString(availability) << ", using manual check-in\n";
    }

    controller_ = std::make_unique<NavigationController>(graph_, calculator_, reader_,
                                                         config_.navigation, errorMonitor_,
                                                         journal_);
    pump_ = std::make_unique<TagEventPump>(*controller_, reader_,
                                           config_.navigation.eventQueueCapacity, errorMonitor_);
    pump_->start();
  } catch (const std::exception& e) {
    handleError(e.what());
    return false;
  }

  transitionTo(State::READY);
  return true;
}

int EngineHost::run(std::istream& in, std::ostream& out) {
  if (currentState_ != State::READY) {
    say(out, "engine not initialized\n");
    return 1;
  }
  transitionTo(State::RUNNING);

  const auto sub = controller_->subscribe(
      [this, &out](const NavigationController::SessionPtr& s) { say(out, describe(*s) + "\n"); });

  say(out, manualMode() ? "manual check-in mode\n" : "tag reader attached\n");
  say(out, kHelp);

  std::string line;
  while (std::getline(in, line)) {
    if (!handleCommand(line, out))
      break;
  }

  controller_->unsubscribe(sub);
  transitionTo(State::FINISHED);
  shutdown();
  return 0;
}

bool EngineHost::handleCommand(const std::string& line, std::ostream& out) {
  std::istringstream iss(line);
  std::string cmd;
  iss >> cmd;
  std::string arg;
  std::getline(iss >> std::ws, arg);

  if (cmd.empty())
    return true;

  if (cmd == "quit" || cmd == "exit") {
    return false;
  } else if (cmd == "help") {
    say(out, kHelp);
  } else if (cmd == "locations") {
    if (arg.empty()) {
      std::string text;
      for (const auto& [type, group] : graph_->locationsByType())
        text += std::string(model::toString(type)) + ":\n" + listing(group);
      say(out, text);
    } else {
      say(out, listing(graph_->locationsOfType(model::locationTypeFromString(arg))));
    }
  } else if (cmd == "find") {
    const auto found = graph_->searchLocations(arg);
    say(out, found.empty() ? "no matching location\n" : listing(found));
  } else if (cmd == "manual") {
    controller_->enableFallbackMode();
  } else if (cmd == "reader") {
    if (!controller_->exitFallbackMode())
      say(out, "tag reader unavailable, staying in manual check-in\n");
  } else if (cmd == "from") {
    controller_->setCurrentLocation(arg);
  } else if (cmd == "to") {
    controller_->setDestination(arg);
  } else if (cmd == "start") {
    controller_->startNavigation();
  } else if (cmd == "stop") {
    controller_->stopNavigation();
  } else if (cmd == "checkin") {
    controller_->checkIn(arg);
  } else if (cmd == "reroute") {
    controller_->triggerRerouting();
  } else if (cmd == "clearroute") {
    controller_->clearRoute();
  } else if (cmd == "clear") {
    controller_->clearSession();
  } else if (cmd == "ack") {
    controller_->clearError();
    errorMonitor_->reset();
  } else if (cmd == "route") {
    const auto s = controller_->session();
    if (!s->activeRoute) {
      say(out, "no active route\n");
    } else {
      nlohmann::json j = *s->activeRoute;
      say(out, j.dump(2) + "\n");
    }
  } else if (cmd == "status") {
    say(out, describe(*controller_->session()) + "\n");
  } else {
    say(out, "unknown command: " + cmd + "\n");
  }
  return true;
}

void EngineHost::handleError(const std::string& reason) {
  std::cerr << "[EngineHost] " << reason << "\n";
  errorMonitor_->notifyFailure("[EngineHost] " + reason);
  transitionTo(State::ERROR);
}

void EngineHost::shutdown() {
  if (pump_)
    pump_->stop();
  if (controller_) {
    const auto s = controller_->session();
    if (s->wantsScanning())
      controller_->stopNavigation();
  }
  journal_->finishRun();
}

void EngineHost::transitionTo(State next) {
  if (next == currentState_)
    return;
  journal_->log(LogCategory::Transition,
                std::string("host ") + stateName(static_cast<int>(currentState_)) + " -> " +
                    stateName(static_cast<int>(next)));
  currentState_ = next;
}

void EngineHost::say(std::ostream& out, const std::string& text) {
  std::lock_guard<std::mutex> lock(outMtx_);
  out << text << std::flush;
}

std::string EngineHost::describe(const NavigationSession& s) const {
  std::ostringstream os;
  os << "[" << toString(s.state) << "]";
  if (s.currentLocationId)
    os << " at " << *s.currentLocationId;
  if (s.destinationLocationId)
    os << " -> " << *s.destinationLocationId;
  if (s.activeRoute)
    os << " (" << std::fixed << std::setprecision(1) << s.activeRoute->estimatedDistance << " m, "
       << s.activeRoute->path.size() << " stops)";
  if (s.currentInstruction)
    os << " | " << s.currentInstruction->description;
  if (s.errorMessage)
    os << " | error: " << *s.errorMessage;
  if (s.fallbackMode)
    os << " | manual check-in";
  if (s.readerFault && s.hasError())
    os << "\n" << io::formatGuidance(*s.readerFault);
  return os.str();
}
