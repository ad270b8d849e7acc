/* @file ConfigLoader.cpp
 * @brief reads the JSON config file
 *
 * © 2025 RollStart contributors — MIT-licensed.
 */

// STL headers
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

// RollStart headers
#include "core/ConfigLoader.hpp"

using namespace rollstart::core;

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {
  if (path_.empty())
    throw std::invalid_argument("[ConfigLoader] config path is empty");
}

nlohmann::json ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw std::runtime_error("[ConfigLoader] cannot open " + path_);

  try {
    nlohmann::json j = nlohmann::json::parse(in);
    if (!j.is_object())
      throw std::runtime_error("[ConfigLoader] " + path_ + ": top level must be an object");
    return j;
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("[ConfigLoader] " + path_ + ": " + e.what());
  }
}
