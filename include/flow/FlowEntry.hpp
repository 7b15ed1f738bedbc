#pragma once
/** @file  FlowEntry.hpp
 *  @brief Records of the serialized flow: routine references and loop brackets.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>
#include <variant>

namespace trialflow::flow {

  struct RoutineRef {
    std::string name;
  };

  struct LoopStart {
    std::string name;
  };

  struct LoopEnd {
    std::string name;
  };

  /// Insertion order is execution order; LoopStart/LoopEnd pairs must nest.
  using FlowEntry = std::variant<RoutineRef, LoopStart, LoopEnd>;

  inline const std::string& entryName(const FlowEntry& e) {
    return std::visit([](const auto& v) -> const std::string& { return v.name; }, e);
  }

} // namespace trialflow::flow
