/* @file main.cpp
 * @brief rollstart console: one command per stdin line, one JSON reply per stdout line
 *
 * © 2025 RollStart contributors — MIT-licensed.
 */

// STL headers
#include <exception>
#include <iostream>
#include <utility>

// POSIX headers
#include <unistd.h>

#include <nlohmann/json.hpp>

// RollStart headers
#include "core/AppConfig.hpp"
#include "core/ConfigLoader.hpp"
#include "core/SystemCoordinator.hpp"
#include "io/LineChannel.hpp"

int main(int argc, char** argv) {
  if (argc > 2) {
    std::cerr << "usage: " << argv[0] << " [config.json]\n";
    return 2;
  }

  try {
    rollstart::core::AppConfig config;
    if (argc == 2)
      config = rollstart::core::AppConfig::fromJson(rollstart::core::ConfigLoader(argv[1]).load());

    rollstart::core::SystemCoordinator coordinator(std::move(config));
    coordinator.initialize();

    rollstart::io::LineChannel console(STDIN_FILENO, STDOUT_FILENO);
    return coordinator.run(console) ? 0 : 1;
  } catch (const std::exception& e) {
    std::cerr << "[main] fatal: " << e.what() << '\n';
    return 1;
  }
}
