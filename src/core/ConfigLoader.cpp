/* @file ConfigLoader.cpp
 * @brief JSON file loading for run configs and experiment definitions
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <filesystem>
#include <fstream>

// 3rd-party headers
#include <nlohmann/json.hpp>

// TrialFlow headers
#include "core/ConfigLoader.hpp"
#include "core/Errors.hpp"

using namespace trialflow::core;

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

nlohmann::json ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw ConfigurationError("[ConfigLoader] cannot open '" + path_ + "'");

  try {
    return nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigurationError("[ConfigLoader] '" + path_ + "' is not valid JSON: " + e.what());
  }
}

std::string ConfigLoader::resolve(const std::string& relative) const {
  std::filesystem::path rel(relative);
  if (rel.is_absolute())
    return rel.string();
  return (std::filesystem::path(path_).parent_path() / rel).string();
}
