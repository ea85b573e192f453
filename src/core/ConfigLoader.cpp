/* @file ConfigLoader.cpp
 * @brief JSON file → nlohmann::json
 *
 * © 2025 Spectackler contributors — MIT-licensed.
 */

#include "core/ConfigLoader.hpp"

#include <fstream>
#include <stdexcept>

using namespace spectackler::core;

nlohmann::json ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw std::runtime_error("[ConfigLoader] cannot open " + path_);
  try {
    return nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("[ConfigLoader] " + path_ + ": " + e.what());
  }
}
