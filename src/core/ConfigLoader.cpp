/* @file ConfigLoader.cpp
 * @brief JSON file -> nlohmann::json
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <fstream>
#include <stdexcept>
#include <utility>

// third-party headers
#include <nlohmann/json.hpp>

// rfsweep headers
#include "core/ConfigLoader.hpp"

using namespace rfsweep::core;

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

nlohmann::json ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw std::runtime_error("[ConfigLoader] cannot open config file: " + path_);

  try {
    return nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("[ConfigLoader] " + path_ + ": " + e.what());
  }
}
