#pragma once
/** @file  Experiment.hpp
 *  @brief In-memory experiment: routines, loops, flow order and initial variables.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <map>
#include <string>
#include <vector>

#include "core/Value.hpp"
#include "flow/FlowEntry.hpp"
#include "flow/LoopNode.hpp"
#include "flow/Routine.hpp"

namespace trialflow::flow {

  struct Experiment {
    std::string source; ///< file the definition came from, if any
    std::map<std::string, core::Value> variables;
    std::map<std::string, RoutineDefinition> routines;
    std::map<std::string, LoopNode> loops;
    std::vector<FlowEntry> flow;
  };

} // namespace trialflow::flow
