#pragma once

/** @file  RunCoordinator.hpp
 *  @brief Public API for trialflow::core::RunCoordinator.
 *
 *  © 2025 Milo Medical — licensed under MIT.
 */

#include <memory>
#include <string>

#include "core/RunConfig.hpp"
#include "flow/FlowSequencer.hpp"

namespace trialflow {
  namespace io {
    class FixedRateFrameDriver;
    class FrameSink;
    class HeadlessFrameSink;
    class ScriptedPointer;
  } // namespace io

  namespace core {

    class ErrorMonitor;
    class Logger;

    /**
 * @class RunCoordinator
 * @brief Owns one experiment run end to end: config → load → validate → run → report.
 *
 *  * BOOT → INIT → IDLE → RUNNING → FINISHED | ABORTED; any state → ERROR.
 *  * Every structural fault surfaces in `initialize()`, before execution.
 *  * The variable environment lives only inside `run()`.
 */
    class RunCoordinator {

    public:
      enum class State { BOOT, INIT, IDLE, RUNNING, FINISHED, ABORTED, ERROR };

      explicit RunCoordinator(std::shared_ptr<ErrorMonitor> errMonitor = nullptr);
      ~RunCoordinator();

      // ---- Public API ----
      void initialize(const std::string& configPath); ///< Load config + experiment, validate flow
      void initialize(RunConfig config, flow::Experiment experiment);
      flow::RunSummary run();                         ///< Execute the flow once
      void handleAbort();                             ///< User escape; honoured at the next tick
      void handleError(const std::string& reason);

      /// Route draw commands to \p sink instead of the built-in headless sink.
      void attachFrameSink(io::FrameSink* sink) { externalSink_ = sink; }

      State state() const noexcept { return currentState_; }
      const RunConfig& config() const noexcept { return config_; }
      const flow::Experiment& experiment() const;
      const io::HeadlessFrameSink& headlessSink() const { return *headless_; }
      std::shared_ptr<ErrorMonitor> errorMonitor() const { return errorMonitor_; }

      RunCoordinator(const RunCoordinator&) = delete;
      RunCoordinator& operator=(const RunCoordinator&) = delete;

    private:
      void transitionTo(State next);
      void logSummary(const flow::RunSummary& summary);

      State currentState_{ State::BOOT };
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      RunConfig config_;
      std::unique_ptr<flow::Experiment> experiment_;
      std::unique_ptr<flow::FlowSequencer> sequencer_;
      std::unique_ptr<io::FixedRateFrameDriver> driver_;
      std::unique_ptr<io::HeadlessFrameSink> headless_;
      std::unique_ptr<io::ScriptedPointer> pointer_;
      std::unique_ptr<Logger> logger_;
      io::FrameSink* externalSink_{ nullptr };
    };

    const char* toString(RunCoordinator::State s);

  } // namespace core
} // namespace trialflow
