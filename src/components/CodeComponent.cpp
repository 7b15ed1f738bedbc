/* @file CodeComponent.cpp
 * @brief phase scripts for computational components
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// TrialFlow headers
#include "components/Component.hpp"
#include "core/Errors.hpp"
#include "core/VariableEnvironment.hpp"

namespace trialflow::components {

  namespace {
    void run(const core::CompiledScript& script, const Component& self,
             core::VariableEnvironment& env) {
      if (script.empty())
        return;
      try {
        core::ScriptExecutor::execute(script, env);
      } catch (const core::EvaluationError& e) {
        throw e.withComponent(self.name());
      }
    }
  } // namespace

  void CodeComponent::onBegin(Component& self, FrameContext& ctx) {
    run(scripts_.beginRoutine, self, ctx.env);
  }

  void CodeComponent::onFrame(Component& self, FrameContext& ctx) {
    run(scripts_.eachFrame, self, ctx.env);
  }

  void CodeComponent::onEnd(Component& self, FrameContext& ctx) {
    run(scripts_.endRoutine, self, ctx.env);
  }

  void CodeComponent::beginExperiment(const Component& self, core::VariableEnvironment& env) const {
    run(scripts_.beginExperiment, self, env);
  }

  void CodeComponent::endExperiment(const Component& self, core::VariableEnvironment& env) const {
    run(scripts_.endExperiment, self, env);
  }

} // namespace trialflow::components
