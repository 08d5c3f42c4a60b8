/* @file main.cpp
 * @brief wayfinder [config.json]
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>
#include <iostream>

// 3rd-party headers
#include <nlohmann/json.hpp>

// Wayfinder headers
#include "core/ConfigLoader.hpp"
#include "core/EngineHost.hpp"
#include "core/NavigationConfig.hpp"

int main(int argc, char** argv) {
  using namespace wayfinder::core;

  HostConfig config;
  if (argc > 1) {
    try {
      config = hostConfigFromJson(ConfigLoader(argv[1]).load());
    } catch (const std::exception& e) {
      std::cerr << "wayfinder: " << e.what() << "\n";
      return 1;
    }
  }

  EngineHost host(std::move(config));
  if (!host.initialize())
    return 1;
  return host.run(std::cin, std::cout);
}
