/* @file Component.cpp
 * @brief component timing state-machine, parameter resolution and hook dispatch
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <type_traits>
#include <utility>

// TrialFlow headers
#include "components/Component.hpp"
#include "core/Errors.hpp"
#include "core/VariableEnvironment.hpp"
#include "io/FrameSink.hpp"

namespace trialflow::components {

  namespace {

    // Hook dispatch: call the variant's hook when it declares one.
    template <typename Visitor> void visitHook(Behavior& b, Visitor&& v) {
      std::visit(std::forward<Visitor>(v), b);
    }

  } // namespace

  Component::Component(std::shared_ptr<const ComponentSpec> spec, Behavior behavior)
      : spec_(std::move(spec)), behavior_(std::move(behavior)) {
    if (!spec_)
      throw std::invalid_argument("[Component] spec is nullptr");
  }

  unsigned Component::capabilities() const noexcept {
    switch (kind()) {
    case Kind::Shape:
    case Kind::Text:
    case Kind::Progress:
      return Drawable;
    case Kind::Listener:
      return Listenable;
    case Kind::Code:
      return Computational;
    default:
      return 0;
    }
  }

  const char* Component::kindName() const noexcept {
    return std::visit([](const auto& b) { return std::decay_t<decltype(b)>::kKindName; }, behavior_);
  }

  void Component::begin(FrameContext& ctx) {
    status_ = Status::NotStarted;
    resolved_.clear();
    resolutions_.clear();
    tStart_ = tStop_ = -1.0;
    frameNStart_ = 0;

    for (const auto& p : spec_->parameters) {
      switch (p.updates) {
      case UpdatePolicy::Never:
        resolved_.insert_or_assign(p.name, p.literal);
        break;
      case UpdatePolicy::Constant:
      case UpdatePolicy::EveryRepeat:
        resolve(p, ctx.env);
        break;
      case UpdatePolicy::EveryFrame:
        break;
      }
    }

    const auto& timing = spec_->timing;
    auto numeric = [&](const core::CompiledExpression& expr, const char* what) {
      if (expr.empty())
        return 0.0;
      double d = 0.0;
      if (!core::asNumber(evaluate(expr, ctx.env), d))
        throw core::ConfigurationError("[Component] " + std::string(what) + " of '" + name() +
                                       "' must be numeric: " + expr.source());
      return d;
    };
    if (timing.startType == StartType::TimeSec || timing.startType == StartType::FrameN)
      startValue_ = numeric(timing.startVal, "start value");
    if (timing.stopType != StopType::None && timing.stopType != StopType::Condition)
      stopValue_ = numeric(timing.stopVal, "stop value");

    visitHook(behavior_, [&](auto& b) {
      if constexpr (requires { b.onBegin(*this, ctx); })
        b.onBegin(*this, ctx);
    });
  }

  void Component::tick(FrameContext& ctx) {
    if (!timed()) {
      visitHook(behavior_, [&](auto& b) {
        if constexpr (requires { b.onFrame(*this, ctx); })
          b.onFrame(*this, ctx);
      });
      return;
    }

    if (status_ == Status::NotStarted && startDue(ctx)) {
      status_ = Status::Started;
      tStart_ = ctx.t;
      frameNStart_ = ctx.frameN;
      visitHook(behavior_, [&](auto& b) {
        if constexpr (requires { b.onStart(*this, ctx); })
          b.onStart(*this, ctx);
      });
    }

    if (status_ == Status::Started && stopDue(ctx)) {
      status_ = Status::Finished;
      tStop_ = ctx.t;
      visitHook(behavior_, [&](auto& b) {
        if constexpr (requires { b.onStop(*this, ctx); })
          b.onStop(*this, ctx);
      });
      return;
    }

    if (status_ != Status::Started)
      return;

    for (const auto& p : spec_->parameters) {
      if (p.updates == UpdatePolicy::EveryFrame)
        resolve(p, ctx.env);
    }
    visitHook(behavior_, [&](auto& b) {
      if constexpr (requires { b.onFrame(*this, ctx); })
        b.onFrame(*this, ctx);
    });
    draw(ctx);
  }

  void Component::end(FrameContext& ctx) {
    if (status_ == Status::Started) {
      status_ = Status::Finished;
      tStop_ = ctx.t;
      visitHook(behavior_, [&](auto& b) {
        if constexpr (requires { b.onStop(*this, ctx); })
          b.onStop(*this, ctx);
      });
    }
    visitHook(behavior_, [&](auto& b) {
      if constexpr (requires { b.onEnd(*this, ctx); })
        b.onEnd(*this, ctx);
    });
  }

  bool Component::startsOnTick(const FrameContext& ctx) const {
    return timed() && status_ == Status::NotStarted && startDue(ctx);
  }

  bool Component::keepsRoutineAlive() const noexcept {
    if (!timed())
      return false;
    if (status_ == Status::Started)
      return true;
    return status_ == Status::NotStarted && spec_->timing.startType != StartType::None;
  }

  const core::Value* Component::param(const std::string& name) const {
    auto it = resolved_.find(name);
    return it == resolved_.end() ? nullptr : &it->second;
  }

  double Component::numberParam(const std::string& name, double fallback) const {
    double d = fallback;
    if (const auto* v = param(name); v && core::asNumber(*v, d))
      return d;
    return fallback;
  }

  std::size_t Component::resolutionCount(const std::string& param) const {
    auto it = resolutions_.find(param);
    return it == resolutions_.end() ? 0 : it->second;
  }

  void Component::resolve(const ParameterSpec& p, const core::VariableEnvironment& env) {
    resolved_.insert_or_assign(p.name, evaluate(p.expr, env));
    ++resolutions_[p.name];
  }

  core::Value Component::evaluate(const core::CompiledExpression& expr,
                                  const core::VariableEnvironment& env) const {
    try {
      return core::ExpressionEvaluator::evaluate(expr, env);
    } catch (const core::EvaluationError& e) {
      throw e.withComponent(name());
    }
  }

  bool Component::startDue(const FrameContext& ctx) const {
    switch (spec_->timing.startType) {
    case StartType::TimeSec:
      return ctx.t >= startValue_ - kFrameTolerance;
    case StartType::FrameN:
      return static_cast<double>(ctx.frameN) >= startValue_;
    case StartType::Condition:
      return core::isTruthy(evaluate(spec_->timing.startVal, ctx.env));
    case StartType::None:
    default:
      return false;
    }
  }

  bool Component::stopDue(const FrameContext& ctx) const {
    switch (spec_->timing.stopType) {
    case StopType::DurationSec:
      return ctx.t >= tStart_ + stopValue_ - kFrameTolerance;
    case StopType::TimeSec:
      return ctx.t >= stopValue_ - kFrameTolerance;
    case StopType::DurationFrames:
      return static_cast<double>(ctx.frameN - frameNStart_) >= stopValue_;
    case StopType::FrameN:
      return static_cast<double>(ctx.frameN) >= stopValue_;
    case StopType::Condition:
      return core::isTruthy(evaluate(spec_->timing.stopVal, ctx.env));
    case StopType::None:
    default:
      return false;
    }
  }

  void Component::draw(FrameContext& ctx) {
    if (!has(Drawable) || !ctx.sink)
      return;

    bool custom = false;
    visitHook(behavior_, [&](auto& b) {
      if constexpr (requires { b.draw(*this, ctx); }) {
        b.draw(*this, ctx);
        custom = true;
      }
    });
    if (!custom)
      ctx.sink->draw(io::DrawCommand{ name(), kindName(), resolved_ });
  }

} // namespace trialflow::components
