#pragma once
/** @file  RunConfig.hpp
 *  @brief Validated run configuration (frame rate, seed, log path, scripted input).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "core/Value.hpp"
#include "io/ResponseDevice.hpp"

namespace trialflow::core {

  struct RunConfig {
    std::string experimentPath;
    double frameRate{ 60.0 };
    std::string logPath; ///< empty = no run log
    std::optional<std::uint64_t> seed;
    std::optional<std::uint64_t> maxFrames;
    std::vector<io::Response> responses; ///< scripted pointer input, time-ordered
    std::map<std::string, Value> variables; ///< overrides applied after the experiment's own

    /// Validate \p doc; relative paths resolve against \p baseDir. Throws `ConfigurationError`.
    static RunConfig fromJson(const nlohmann::json& doc, const std::string& baseDir = {});
  };

} // namespace trialflow::core
