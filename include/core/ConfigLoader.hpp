#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads run-time configuration and experiment files (JSON) from the host FS.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include <nlohmann/json_fwd.hpp>

namespace trialflow::core {

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file and hands the parsed object to
 *        the caller.
 *
 *  * No caching: every call to `load()` re-reads the file.
 *  * All schema validation lives in the calling layer (RunConfig, ExperimentLoader).
 */
  class ConfigLoader {
  public:
    /// @param configPath  Absolute or relative path on the host FS.
    explicit ConfigLoader(std::string configPath);

    /// Parse the file into a nlohmann::json object or throw `ConfigurationError`.
    nlohmann::json load() const;

    const std::string& path() const noexcept { return path_; }

    /// Resolve \p relative against the directory holding this file.
    std::string resolve(const std::string& relative) const;

  private:
    std::string path_;
  };

} // namespace trialflow::core
