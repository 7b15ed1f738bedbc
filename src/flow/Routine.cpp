/* @file Routine.cpp
 * @brief routine activation: component ticking and end-condition evaluation
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <stdexcept>

// TrialFlow headers
#include "core/Errors.hpp"
#include "flow/Routine.hpp"
#include "io/FrameSink.hpp"

namespace trialflow::flow {

  namespace {
    const char* const kContinueRoutine = "continueRoutine";
  }

  const char* toString(RoutineActivation::EndReason r) {
    switch (r) {
    case RoutineActivation::EndReason::Running:
      return "running";
    case RoutineActivation::EndReason::Forced:
      return "forced";
    case RoutineActivation::EndReason::ScriptRequested:
      return "script";
    case RoutineActivation::EndReason::MaxDuration:
      return "max_duration";
    case RoutineActivation::EndReason::ComponentsFinished:
      return "components_finished";
    default:
      return "unknown";
    }
  }

  RoutineActivation::RoutineActivation(const RoutineDefinition& def, core::VariableEnvironment& env,
                                       io::FrameSink* sink, io::ResponseDevice* pointer)
      : def_(def), env_(env), sink_(sink), pointer_(pointer) {}

  components::FrameContext RoutineActivation::context(const io::FrameTick& tick) {
    components::FrameContext ctx{ env_, *this };
    ctx.sink = sink_;
    ctx.pointer = pointer_;
    ctx.t = tick.t - start_.t;
    ctx.runT = tick.t;
    ctx.frameN = tick.frameN - start_.frameN;
    return ctx;
  }

  void RoutineActivation::begin(const io::FrameTick& first) {
    if (begun_)
      throw std::logic_error("[RoutineActivation] '" + def_.name + "' begun twice");
    begun_ = true;
    start_ = first;
    last_ = first;

    components_ = def_.components;
    continueRoutine_ = env_.bind(kContinueRoutine, true);

    if (!def_.maxDuration.empty()) {
      core::Value v;
      try {
        v = core::ExpressionEvaluator::evaluate(def_.maxDuration, env_);
      } catch (const core::EvaluationError& e) {
        throw e.withComponent(def_.name);
      }
      double d = 0.0;
      if (!core::asNumber(v, d) || d < 0.0)
        throw core::ConfigurationError("maxDuration of routine '" + def_.name +
                                       "' must be a non-negative number");
      maxDuration_ = d;
    }

    auto ctx = context(first);
    for (auto& c : components_)
      c.begin(ctx);
  }

  bool RoutineActivation::tick(const io::FrameTick& tick) {
    if (!begun_)
      throw std::logic_error("[RoutineActivation] tick before begin on '" + def_.name + "'");
    if (reason_ != EndReason::Running)
      return false;

    last_ = tick;
    auto ctx = context(tick);
    lastT_ = ctx.t;
    ++frames_;

    for (auto& c : components_)
      c.tick(ctx);

    if (sink_)
      sink_->flip(tick);

    const core::Value* cont = env_.find(kContinueRoutine);
    if (forced_)
      reason_ = EndReason::Forced;
    else if (cont && !core::isTruthy(*cont))
      reason_ = EndReason::ScriptRequested;
    else if (maxDuration_ && ctx.t >= *maxDuration_ - components::kFrameTolerance)
      reason_ = EndReason::MaxDuration;
    else if (std::none_of(components_.begin(), components_.end(),
                          [](const components::Component& c) { return c.keepsRoutineAlive(); }))
      reason_ = EndReason::ComponentsFinished;

    return reason_ == EndReason::Running;
  }

  void RoutineActivation::end() {
    if (!begun_ || ended_)
      return;
    ended_ = true;
    auto ctx = context(last_);
    for (auto& c : components_)
      c.end(ctx);
    continueRoutine_.release();
  }

  const components::Component* RoutineActivation::findComponent(const std::string& name) const {
    auto it = std::find_if(components_.begin(), components_.end(),
                           [&](const components::Component& c) { return c.name() == name; });
    return it == components_.end() ? nullptr : &*it;
  }

  std::unique_ptr<RoutineActivation> activate(const RoutineDefinition& def,
                                              core::VariableEnvironment& env,
                                              const io::FrameTick& first, io::FrameSink* sink,
                                              io::ResponseDevice* pointer) {
    auto act = std::make_unique<RoutineActivation>(def, env, sink, pointer);
    act->begin(first);
    return act;
  }

} // namespace trialflow::flow
