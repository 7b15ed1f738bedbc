#pragma once
/** @file  FlowSequencer.hpp
 *  @brief Top-level driver: linearizes the flow and runs it tick by tick.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "core/Value.hpp"
#include "flow/Experiment.hpp"

namespace trialflow {
  namespace core {
    class ErrorMonitor;
    class Logger;
    class VariableEnvironment;
  } // namespace core
  namespace io {
    class FrameDriver;
    class FrameSink;
    class ResponseDevice;
  } // namespace io

  namespace flow {

    /// Executable tree produced from the bracketed flow list.
    struct ExecNode {
      enum class Type { Routine, Loop };

      Type type{ Type::Routine };
      const RoutineDefinition* routine{ nullptr };
      const LoopNode* loop{ nullptr };
      std::vector<ExecNode> body; ///< loops only
    };

    /// End-of-run report handed to logging/persistence collaborators.
    struct RunSummary {
      enum class Outcome { Completed, Aborted };

      Outcome outcome{ Outcome::Completed };
      std::uint64_t frames{ 0 };
      std::map<std::string, std::size_t> routineActivations;
      std::map<std::string, std::size_t> loopIterations;
      std::map<std::string, core::Value> variables;
    };

    const char* toString(RunSummary::Outcome o);

    /// External collaborators for one run; everything but the driver is optional.
    struct RunIO {
      io::FrameDriver& driver;
      io::FrameSink* sink{ nullptr };
      io::ResponseDevice* pointer{ nullptr };
      core::Logger* logger{ nullptr };
    };

    /**
 * @class FlowSequencer
 * @brief Strictly sequential interpreter over the linearized flow.
 *
 *  * Construction linearizes and validates bracket structure, so malformed
 *    flows fail with `ConfigurationError` before anything executes.
 *  * `run()` is single-threaded and cooperative: one tick per frame, escape
 *    checked at every tick boundary.
 *  * Fatal errors are reported to the ErrorMonitor and rethrown.
 */
    class FlowSequencer {
    public:
      FlowSequencer(const Experiment& experiment, std::shared_ptr<core::ErrorMonitor> errMonitor);
      ~FlowSequencer() = default;

      /// Build the executable tree; throws `ConfigurationError` on bad bracketing.
      static std::vector<ExecNode> linearize(const Experiment& experiment);

      /// Execute the flow once against \p env.
      /// @param seed  seeds the process-level random source for unseeded random loops.
      RunSummary run(core::VariableEnvironment& env, RunIO io,
                     std::optional<std::uint64_t> seed = std::nullopt);

      const std::vector<ExecNode>& program() const noexcept { return program_; }

    private:
      struct RunState;

      void execute(const std::vector<ExecNode>& nodes, RunState& st);
      void runLoop(const ExecNode& node, RunState& st);
      void runRoutine(const RoutineDefinition& routine, RunState& st);
      void experimentHooks(RunState& st, bool begin);

      const Experiment& experiment_;
      std::shared_ptr<core::ErrorMonitor> errorMonitor_;
      std::vector<ExecNode> program_;
    };

  } // namespace flow
} // namespace trialflow
