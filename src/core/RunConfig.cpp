/* @file RunConfig.cpp
 * @brief schema validation for run configuration files
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <filesystem>

// 3rd-party headers
#include <nlohmann/json.hpp>

// TrialFlow headers
#include "core/Errors.hpp"
#include "core/ExpressionEvaluator.hpp"
#include "core/RunConfig.hpp"

using nlohmann::json;

namespace trialflow::core {

  namespace {
    std::string resolved(const std::string& path, const std::string& baseDir) {
      std::filesystem::path p(path);
      if (p.is_relative() && !baseDir.empty())
        p = std::filesystem::path(baseDir) / p;
      return p.string();
    }

    std::uint64_t unsignedField(const json& j, const char* key) {
      const json& v = j.at(key);
      if (!v.is_number_integer() || v.get<long long>() < 0)
        throw ConfigurationError(std::string("'") + key + "' must be a non-negative integer");
      return v.get<std::uint64_t>();
    }
  } // namespace

  RunConfig RunConfig::fromJson(const json& doc, const std::string& baseDir) {
    if (!doc.is_object())
      throw ConfigurationError("run config must hold a JSON object");

    RunConfig cfg;
    try {
      if (!doc.contains("experiment") || !doc.at("experiment").is_string())
        throw ConfigurationError("run config needs an 'experiment' path");
      cfg.experimentPath = resolved(doc.at("experiment").get<std::string>(), baseDir);

      cfg.frameRate = doc.value("frameRate", 60.0);
      if (!(cfg.frameRate > 0.0))
        throw ConfigurationError("'frameRate' must be positive");

      if (doc.contains("logPath") && !doc.at("logPath").is_null())
        cfg.logPath = resolved(doc.at("logPath").get<std::string>(), baseDir);
      if (doc.contains("seed") && !doc.at("seed").is_null())
        cfg.seed = unsignedField(doc, "seed");
      if (doc.contains("maxFrames") && !doc.at("maxFrames").is_null())
        cfg.maxFrames = unsignedField(doc, "maxFrames");

      if (doc.contains("responses")) {
        for (const auto& r : doc.at("responses")) {
          io::Response resp;
          resp.t = r.at("t").get<double>();
          resp.x = r.value("x", 0.0);
          resp.y = r.value("y", 0.0);
          resp.value = static_cast<double>(r.value("button", 0));
          cfg.responses.push_back(resp);
        }
        std::stable_sort(cfg.responses.begin(), cfg.responses.end(),
                         [](const io::Response& a, const io::Response& b) { return a.t < b.t; });
      }

      if (doc.contains("variables")) {
        for (const auto& [key, value] : doc.at("variables").items()) {
          if (!ExpressionEvaluator::isValidName(key))
            throw ConfigurationError("invalid variable name '" + key + "'");
          if (value.is_boolean())
            cfg.variables.insert_or_assign(key, value.get<bool>());
          else if (value.is_number())
            cfg.variables.insert_or_assign(key, value.get<double>());
          else if (value.is_string())
            cfg.variables.insert_or_assign(key, value.get<std::string>());
          else
            throw ConfigurationError("variable '" + key + "' must be a number, boolean or string");
        }
      }
    } catch (const json::exception& e) {
      throw ConfigurationError(std::string("malformed run config: ") + e.what());
    }
    return cfg;
  }

} // namespace trialflow::core
