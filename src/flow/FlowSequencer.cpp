/* @file FlowSequencer.cpp
 * @brief flow linearization, loop/routine driving and run-level reporting
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <functional>
#include <iostream>
#include <set>

// TrialFlow headers
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "core/VariableEnvironment.hpp"
#include "flow/FlowSequencer.hpp"
#include "io/FrameDriver.hpp"
#include "io/FrameSink.hpp"
#include "io/ResponseDevice.hpp"

namespace trialflow::flow {

  namespace {
    /// Thrown at a tick boundary once escape was requested; never leaves `run()`.
    struct RunAborted {};
  } // namespace

  const char* toString(RunSummary::Outcome o) {
    switch (o) {
    case RunSummary::Outcome::Completed:
      return "completed";
    case RunSummary::Outcome::Aborted:
      return "aborted";
    default:
      return "unknown";
    }
  }

  struct FlowSequencer::RunState {
    core::VariableEnvironment& env;
    RunIO io;
    std::mt19937_64 rng;
    RunSummary summary;

    void checkEscape() const {
      if (io.driver.escapeRequested())
        throw RunAborted{};
    }

    void log(core::LogEvent::Kind kind, const std::string& subject, std::string detail = {}) {
      if (io.logger)
        io.logger->log(core::LogEvent{ kind, io.driver.current().t, subject, std::move(detail) });
    }
  };

  FlowSequencer::FlowSequencer(const Experiment& experiment,
                               std::shared_ptr<core::ErrorMonitor> errMonitor)
      : experiment_(experiment), errorMonitor_(std::move(errMonitor)) {
    if (!errorMonitor_)
      throw std::invalid_argument("[FlowSequencer] error monitor is nullptr");
    try {
      program_ = linearize(experiment_);
    } catch (const core::ConfigurationError& e) {
      errorMonitor_->notifyFailure(std::string("[FlowSequencer] ") + e.what());
      throw;
    }
  }

  std::vector<ExecNode> FlowSequencer::linearize(const Experiment& experiment) {
    struct Open {
      const LoopNode* loop;
      std::vector<ExecNode> body;
    };
    std::vector<Open> stack;
    stack.push_back({ nullptr, {} });
    std::set<std::string> opened;

    for (std::size_t i = 0; i < experiment.flow.size(); ++i) {
      const FlowEntry& entry = experiment.flow[i];
      const std::string& name = entryName(entry);
      const std::string at = " (flow entry " + std::to_string(i) + ")";

      if (std::holds_alternative<RoutineRef>(entry)) {
        auto it = experiment.routines.find(name);
        if (it == experiment.routines.end())
          throw core::ConfigurationError("unknown routine '" + name + "'" + at);
        ExecNode node;
        node.type = ExecNode::Type::Routine;
        node.routine = &it->second;
        stack.back().body.push_back(std::move(node));
      } else if (std::holds_alternative<LoopStart>(entry)) {
        auto it = experiment.loops.find(name);
        if (it == experiment.loops.end())
          throw core::ConfigurationError("LoopStart '" + name + "' has no loop definition" + at);
        if (!opened.insert(name).second)
          throw core::ConfigurationError("loop '" + name + "' is started more than once" + at);
        stack.push_back({ &it->second, {} });
      } else {
        if (stack.size() == 1)
          throw core::ConfigurationError("LoopEnd '" + name + "' has no matching LoopStart" + at);
        if (stack.back().loop->name != name)
          throw core::ConfigurationError("LoopEnd '" + name + "' overlaps open loop '" +
                                         stack.back().loop->name + "'" + at);
        ExecNode node;
        node.type = ExecNode::Type::Loop;
        node.loop = stack.back().loop;
        node.body = std::move(stack.back().body);
        stack.pop_back();
        stack.back().body.push_back(std::move(node));
      }
    }

    if (stack.size() > 1)
      throw core::ConfigurationError("LoopStart '" + stack.back().loop->name +
                                     "' has no matching LoopEnd");
    return std::move(stack.front().body);
  }

  RunSummary FlowSequencer::run(core::VariableEnvironment& env, RunIO io,
                                std::optional<std::uint64_t> seed) {
    RunState st{ env, io, std::mt19937_64(seed ? *seed : std::random_device{}()), {} };
    for (const auto& [name, routine] : experiment_.routines)
      st.summary.routineActivations.emplace(name, 0);
    for (const auto& [name, loop] : experiment_.loops)
      st.summary.loopIterations.emplace(name, 0);

    st.log(core::LogEvent::Kind::RunStarted, experiment_.source);
    try {
      experimentHooks(st, true);
      execute(program_, st);
      experimentHooks(st, false);
      st.summary.outcome = RunSummary::Outcome::Completed;
    } catch (const RunAborted&) {
      std::cerr << "[FlowSequencer] run aborted at t=" << io.driver.current().t << "s\n";
      st.summary.outcome = RunSummary::Outcome::Aborted;
    } catch (const core::FlowError& e) {
      st.log(core::LogEvent::Kind::Error, experiment_.source, e.what());
      errorMonitor_->notifyFailure(std::string("[FlowSequencer] ") + e.what());
      throw;
    }

    st.summary.variables = env.snapshot();
    st.log(core::LogEvent::Kind::RunFinished, experiment_.source,
           toString(st.summary.outcome));
    return st.summary;
  }

  void FlowSequencer::execute(const std::vector<ExecNode>& nodes, RunState& st) {
    for (const auto& node : nodes) {
      if (node.type == ExecNode::Type::Loop)
        runLoop(node, st);
      else
        runRoutine(*node.routine, st);
    }
  }

  void FlowSequencer::runLoop(const ExecNode& node, RunState& st) {
    const LoopNode& loop = *node.loop;
    st.checkEscape();

    LoopActivation activation(loop, st.env, st.rng);
    const std::size_t count = activation.enter();
    std::string detail = "nReps=" + std::to_string(count);
    if (loop.kind == LoopKind::BranchGuard)
      detail = count ? "branch taken" : "branch skipped";
    st.log(core::LogEvent::Kind::LoopEntered, loop.name, detail);

    while (activation.next()) {
      ++st.summary.loopIterations[loop.name];
      st.log(core::LogEvent::Kind::LoopIteration, loop.name,
             "thisN=" + std::to_string(activation.thisN()));
      execute(node.body, st);
      st.checkEscape();
    }
    st.log(core::LogEvent::Kind::LoopExited, loop.name,
           "iterations=" + std::to_string(activation.position()));
  }

  void FlowSequencer::runRoutine(const RoutineDefinition& routine, RunState& st) {
    st.checkEscape();

    io::FrameDriver& driver = st.io.driver;
    RoutineActivation activation(routine, st.env, st.io.sink, st.io.pointer);

    io::FrameTick tick = driver.nextFrame();
    ++st.summary.frames;
    st.log(core::LogEvent::Kind::RoutineStarted, routine.name);
    activation.begin(tick);

    while (activation.tick(tick)) {
      st.checkEscape();
      tick = driver.nextFrame();
      ++st.summary.frames;
    }
    activation.end();

    ++st.summary.routineActivations[routine.name];
    st.log(core::LogEvent::Kind::RoutineEnded, routine.name,
           std::string(toString(activation.endReason())) + " after " +
               std::to_string(activation.frames()) + " frames");
  }

  void FlowSequencer::experimentHooks(RunState& st, bool begin) {
    // flow order, each routine once
    std::vector<const RoutineDefinition*> order;
    std::function<void(const std::vector<ExecNode>&)> collect =
        [&](const std::vector<ExecNode>& nodes) {
      for (const auto& n : nodes) {
        if (n.type == ExecNode::Type::Loop)
          collect(n.body);
        else if (std::find(order.begin(), order.end(), n.routine) == order.end())
          order.push_back(n.routine);
      }
    };
    collect(program_);

    for (const auto* routine : order) {
      for (const auto& c : routine->components) {
        const auto* code = c.as<components::CodeComponent>();
        if (!code)
          continue;
        if (begin)
          code->beginExperiment(c, st.env);
        else
          code->endExperiment(c, st.env);
      }
    }
  }

} // namespace trialflow::flow
