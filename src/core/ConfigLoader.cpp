/* @file ConfigLoader.cpp
 * @brief reads and parses JSON documents from disk
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <fstream>
#include <stdexcept>
#include <utility>

// third-party headers
#include <nlohmann/json.hpp>

// Elero headers
#include "core/ConfigLoader.hpp"

using namespace elero::core;

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

nlohmann::json ConfigLoader::load() const {
  std::ifstream file(path_);
  if (!file.is_open())
    throw std::runtime_error("[ConfigLoader] cannot open " + path_);

  try {
    return nlohmann::json::parse(file);
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("[ConfigLoader] " + path_ + ": " + e.what());
  }
}
