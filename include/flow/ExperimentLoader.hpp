#pragma once
/** @file  ExperimentLoader.hpp
 *  @brief Parses experiment files (JSON) into `flow::Experiment`.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include <nlohmann/json_fwd.hpp>

#include "components/ComponentFactory.hpp"
#include "flow/Experiment.hpp"

namespace trialflow::flow {

  /**
 * @class ExperimentLoader
 * @brief Schema validation for experiment files; parsed once at startup.
 *
 *  * Every fault is a `ConfigurationError` (or an `EvaluationError` naming the
 *    component whose expression does not parse).
 *  * Bracket structure is checked later by `FlowSequencer::linearize`.
 *  * `conditionsFile` paths (.json or .csv) resolve against \p baseDir.
 */
  class ExperimentLoader {
  public:
    explicit ExperimentLoader(components::ComponentFactory factory);

    Experiment load(const std::string& path) const;
    Experiment fromJson(const nlohmann::json& doc, const std::string& baseDir = {}) const;

    /// Parse a CSV condition table: header row of names, one row per condition.
    static ConditionTable parseConditionsCsv(const std::string& text);

  private:
    RoutineDefinition parseRoutine(const std::string& name, const nlohmann::json& j) const;
    LoopNode parseLoop(const nlohmann::json& j, const std::string& baseDir) const;

    components::ComponentFactory factory_;
  };

} // namespace trialflow::flow
