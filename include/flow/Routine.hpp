#pragma once
/** @file  Routine.hpp
 *  @brief Routine definitions and their per-visit activations.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "components/Component.hpp"
#include "core/VariableEnvironment.hpp"
#include "io/FrameDriver.hpp"

namespace trialflow {
  namespace io {
    class FrameSink;
    class ResponseDevice;
  } // namespace io

  namespace flow {

    /// Static routine: ordered component prototypes plus an optional time cap.
    struct RoutineDefinition {
      std::string name;
      std::vector<components::Component> components;
      core::CompiledExpression maxDuration; ///< seconds, evaluated per activation; empty = none
    };

    /**
 * @class RoutineActivation
 * @brief One visit of the sequencer to a routine.
 *
 *  * Owns fresh copies of the routine's components for this visit only.
 *  * Components are queried in declaration order on every tick.
 *  * Publishes `continueRoutine = true`; a script clearing it ends the visit.
 *  * Discarding an activation without `end()` (abort, error) skips the
 *    end-of-routine hooks but still withdraws `continueRoutine`.
 */
    class RoutineActivation : public components::RoutineControl {
    public:
      enum class EndReason { Running, Forced, ScriptRequested, MaxDuration, ComponentsFinished };

      RoutineActivation(const RoutineDefinition& def, core::VariableEnvironment& env,
                        io::FrameSink* sink = nullptr, io::ResponseDevice* pointer = nullptr);
      ~RoutineActivation() override = default;

      /// Start the visit on \p first (the tick the first frame will be drawn on).
      void begin(const io::FrameTick& first);

      /// Run one tick. Returns true while more frames are needed.
      bool tick(const io::FrameTick& tick);

      /// Run end-of-routine hooks and withdraw `continueRoutine`.
      void end();

      //---RoutineControl---------------------------------------------------
      void forceEnd() override { forced_ = true; }
      const components::Component* findComponent(const std::string& name) const override;

      const RoutineDefinition& definition() const noexcept { return def_; }
      const std::vector<components::Component>& components() const noexcept { return components_; }
      EndReason endReason() const noexcept { return reason_; }
      std::uint64_t frames() const noexcept { return frames_; }
      double elapsed() const noexcept { return lastT_; }

      RoutineActivation(const RoutineActivation&) = delete;
      RoutineActivation& operator=(const RoutineActivation&) = delete;

    private:
      components::FrameContext context(const io::FrameTick& tick);

      const RoutineDefinition& def_;
      core::VariableEnvironment& env_;
      io::FrameSink* sink_;
      io::ResponseDevice* pointer_;

      std::vector<components::Component> components_;
      core::ScopedBinding continueRoutine_;
      std::optional<double> maxDuration_;
      io::FrameTick start_{};
      io::FrameTick last_{};
      double lastT_{ 0.0 };
      std::uint64_t frames_{ 0 };
      bool begun_{ false };
      bool ended_{ false };
      bool forced_{ false };
      EndReason reason_{ EndReason::Running };
    };

    const char* toString(RoutineActivation::EndReason r);

    /// Create and begin an activation of \p def on \p first.
    std::unique_ptr<RoutineActivation> activate(const RoutineDefinition& def,
                                                core::VariableEnvironment& env,
                                                const io::FrameTick& first,
                                                io::FrameSink* sink = nullptr,
                                                io::ResponseDevice* pointer = nullptr);

  } // namespace flow
} // namespace trialflow
