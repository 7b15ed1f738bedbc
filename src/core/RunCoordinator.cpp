/* @file RunCoordinator.cpp
 * @brief top-level run state-machine wiring config, loader, sequencer and logger
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <filesystem>
#include <stdexcept>

// 3rd-party headers
#include <nlohmann/json.hpp>

// TrialFlow headers
#include "components/ComponentFactory.hpp"
#include "core/ConfigLoader.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "core/RunCoordinator.hpp"
#include "core/VariableEnvironment.hpp"
#include "flow/ExperimentLoader.hpp"
#include "io/FrameDriver.hpp"
#include "io/FrameSink.hpp"
#include "io/ResponseDevice.hpp"

namespace trialflow {
  namespace core {

    const char* toString(RunCoordinator::State s) {
      switch (s) {
      case RunCoordinator::State::BOOT:
        return "BOOT";
      case RunCoordinator::State::INIT:
        return "INIT";
      case RunCoordinator::State::IDLE:
        return "IDLE";
      case RunCoordinator::State::RUNNING:
        return "RUNNING";
      case RunCoordinator::State::FINISHED:
        return "FINISHED";
      case RunCoordinator::State::ABORTED:
        return "ABORTED";
      case RunCoordinator::State::ERROR:
        return "ERROR";
      default:
        return "UNKNOWN";
      }
    }

    RunCoordinator::RunCoordinator(std::shared_ptr<ErrorMonitor> errMonitor)
        : errorMonitor_(errMonitor ? std::move(errMonitor) : std::make_shared<ErrorMonitor>()),
          headless_(std::make_unique<io::HeadlessFrameSink>()) {}

    RunCoordinator::~RunCoordinator() = default;

    void RunCoordinator::initialize(const std::string& configPath) {
      transitionTo(State::INIT);
      RunConfig cfg;
      flow::Experiment exp;
      try {
        ConfigLoader loader(configPath);
        cfg = RunConfig::fromJson(loader.load(),
                                  std::filesystem::path(configPath).parent_path().string());

        flow::ExperimentLoader experimentLoader(components::ComponentFactory::withBuiltins());
        exp = experimentLoader.load(cfg.experimentPath);
      } catch (const FlowError& e) {
        handleError(e.what());
        throw;
      }
      initialize(std::move(cfg), std::move(exp));
    }

    void RunCoordinator::initialize(RunConfig config, flow::Experiment experiment) {
      if (currentState_ != State::BOOT && currentState_ != State::INIT)
        throw std::logic_error(std::string("[RunCoordinator] initialize() in state ") +
                               toString(currentState_));
      transitionTo(State::INIT);

      try {
        config_ = std::move(config);
        experiment_ = std::make_unique<flow::Experiment>(std::move(experiment));
        sequencer_ = std::make_unique<flow::FlowSequencer>(*experiment_, errorMonitor_);

        driver_ = std::make_unique<io::FixedRateFrameDriver>(config_.frameRate, config_.maxFrames);
        pointer_ = std::make_unique<io::ScriptedPointer>();
        for (const auto& r : config_.responses)
          pointer_->schedule(r);
        logger_ = std::make_unique<Logger>(config_.logPath);
        pointer_->addListener("log", [this](const io::Response& r) {
          logger_->log(LogEvent{ LogEvent::Kind::Response, r.t, pointer_->name(), r.toJson() });
        });
      } catch (const FlowError&) {
        // the sequencer has already reported its own validation failure
        transitionTo(State::ERROR);
        throw;
      } catch (const std::invalid_argument& e) {
        handleError(e.what());
        throw ConfigurationError(e.what());
      }

      transitionTo(State::IDLE);
    }

    flow::RunSummary RunCoordinator::run() {
      if (currentState_ != State::IDLE)
        throw std::logic_error(std::string("[RunCoordinator] run() in state ") +
                               toString(currentState_));
      transitionTo(State::RUNNING);

      VariableEnvironment env;
      for (const auto& [name, value] : experiment_->variables)
        env.set(name, value);
      for (const auto& [name, value] : config_.variables)
        env.set(name, value);

      flow::RunSummary summary;
      try {
        logger_->startNewRun();
        io::FrameSink* sink = externalSink_ ? externalSink_ : headless_.get();
        summary = sequencer_->run(env, flow::RunIO{ *driver_, sink, pointer_.get(), logger_.get() },
                                  config_.seed);
      } catch (const FlowError&) {
        logger_->finishRun();
        transitionTo(State::ERROR); // reported by the sequencer
        throw;
      } catch (const std::exception& e) {
        logger_->finishRun();
        handleError(e.what());
        throw;
      }

      logSummary(summary);
      logger_->finishRun();
      transitionTo(summary.outcome == flow::RunSummary::Outcome::Completed ? State::FINISHED
                                                                           : State::ABORTED);
      return summary;
    }

    void RunCoordinator::handleAbort() {
      if (driver_)
        driver_->requestEscape();
    }

    void RunCoordinator::handleError(const std::string& reason) {
      errorMonitor_->notifyFailure("[RunCoordinator] " + reason);
      transitionTo(State::ERROR);
    }

    const flow::Experiment& RunCoordinator::experiment() const {
      if (!experiment_)
        throw std::logic_error("[RunCoordinator] no experiment loaded");
      return *experiment_;
    }

    void RunCoordinator::transitionTo(State next) { currentState_ = next; }

    void RunCoordinator::logSummary(const flow::RunSummary& summary) {
      const double t = driver_->current().t;
      for (const auto& [name, value] : summary.variables)
        logger_->log(LogEvent{ LogEvent::Kind::Variable, t, name, toDisplayString(value) });
    }

  } // namespace core
} // namespace trialflow
