#pragma once
/** @file  CodeComponent.hpp
 *  @brief Inline statement scripts hooked into experiment and routine phases.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include "core/ScriptExecutor.hpp"

namespace trialflow {
  namespace core {
    class VariableEnvironment;
  }

  namespace components {

    class Component;
    struct FrameContext;

    /**
 * @class CodeComponent
 * @brief Computational component. Untimed: its each-frame script runs on
 *        every tick of the activation and it never keeps a routine alive.
 */
    class CodeComponent {
    public:
      static constexpr const char* kKindName = "code";

      struct Scripts {
        core::CompiledScript beginExperiment;
        core::CompiledScript beginRoutine;
        core::CompiledScript eachFrame;
        core::CompiledScript endRoutine;
        core::CompiledScript endExperiment;
      };

      explicit CodeComponent(Scripts scripts) : scripts_(std::move(scripts)) {}

      void onBegin(Component& self, FrameContext& ctx);
      void onFrame(Component& self, FrameContext& ctx);
      void onEnd(Component& self, FrameContext& ctx);

      void beginExperiment(const Component& self, core::VariableEnvironment& env) const;
      void endExperiment(const Component& self, core::VariableEnvironment& env) const;

      const Scripts& scripts() const noexcept { return scripts_; }

    private:
      Scripts scripts_;
    };

  } // namespace components
} // namespace trialflow
