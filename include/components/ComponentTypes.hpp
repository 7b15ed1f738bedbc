#pragma once
/** @file  ComponentTypes.hpp
 *  @brief Policies, timing and per-tick context shared by every component variant.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <string>
#include <vector>

#include "core/ExpressionEvaluator.hpp"
#include "core/Value.hpp"

namespace trialflow {
  namespace core {
    class VariableEnvironment;
  }
  namespace io {
    class FrameSink;
    class ResponseDevice;
  } // namespace io

  namespace components {

    class Component;

    /// When a parameter is (re-)resolved.
    enum class UpdatePolicy { Never, Constant, EveryRepeat, EveryFrame };

    enum class StartType { None, TimeSec, FrameN, Condition };

    enum class StopType { None, DurationSec, TimeSec, DurationFrames, FrameN, Condition };

    enum class Status { NotStarted, Started, Finished };

    /// Capability bits; a variant may carry several.
    enum Capability : unsigned { Drawable = 1u << 0, Listenable = 1u << 1, Computational = 1u << 2 };

    /// Parse the authoring names ("set every frame", "time (s)", ...). Throw `ConfigurationError`.
    UpdatePolicy parseUpdatePolicy(const std::string& text);
    StartType parseStartType(const std::string& text);
    StopType parseStopType(const std::string& text);

    const char* toString(UpdatePolicy p);
    const char* toString(Status s);

    /// Frame tolerance applied to every time-based start/stop comparison (s).
    inline constexpr double kFrameTolerance = 0.001;

    /// One named parameter: a literal (`Never`) or an expression.
    struct ParameterSpec {
      std::string name;
      UpdatePolicy updates{ UpdatePolicy::Never };
      core::Value literal{ 0.0 };
      core::CompiledExpression expr; ///< empty for literals
    };

    struct ComponentTiming {
      StartType startType{ StartType::TimeSec };
      core::CompiledExpression startVal; ///< empty ⇒ 0
      StopType stopType{ StopType::None };
      core::CompiledExpression stopVal;
    };

    /// Immutable definition shared by every activation of a component.
    struct ComponentSpec {
      std::string kind; ///< registry key the component was created from
      std::string name;
      ComponentTiming timing;
      UpdatePolicy updates{ UpdatePolicy::Constant }; ///< default for expression parameters
      std::vector<ParameterSpec> parameters;

      const ParameterSpec* findParameter(const std::string& param) const;
    };

    /**
 * @class RoutineControl
 * @brief What a component may ask of the routine activation that owns it.
 */
    class RoutineControl {
    public:
      virtual ~RoutineControl() = default;

      /// End the activation after the current tick.
      virtual void forceEnd() = 0;

      /// Sibling lookup by name; nullptr if absent.
      virtual const Component* findComponent(const std::string& name) const = 0;
    };

    /// Everything a component hook sees during one call.
    struct FrameContext {
      core::VariableEnvironment& env;
      RoutineControl& routine;
      io::FrameSink* sink{ nullptr };       ///< null when nothing renders
      io::ResponseDevice* pointer{ nullptr }; ///< null when no pointer is attached
      double t{ 0.0 };                        ///< seconds since activation start
      double runT{ 0.0 };                     ///< seconds since run start
      std::uint64_t frameN{ 0 };              ///< ticks since activation start
    };

  } // namespace components
} // namespace trialflow
