#pragma once
/** @file  ExperimentBuilder.hpp
 *  @brief Helpers to build experiments from inline JSON and run them headless.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <memory>
#include <optional>

#include <nlohmann/json.hpp>

#include "components/ComponentFactory.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/VariableEnvironment.hpp"
#include "flow/ExperimentLoader.hpp"
#include "flow/FlowSequencer.hpp"
#include "io/FrameDriver.hpp"
#include "io/FrameSink.hpp"
#include "io/ResponseDevice.hpp"

namespace trialflow {
  namespace test {

    inline flow::Experiment experimentFrom(const nlohmann::json& doc) {
      flow::ExperimentLoader loader(components::ComponentFactory::withBuiltins());
      return loader.fromJson(doc);
    }

    /// One-frame text routine; handy as a flow placeholder.
    inline nlohmann::json blipRoutine(const std::string& componentName) {
      return nlohmann::json::array({ { { "kind", "text" },
                                       { "name", componentName },
                                       { "stopType", "duration (frames)" },
                                       { "stopVal", 1 } } });
    }

    /// Sequencer plus the collaborators of one headless run.
    struct HeadlessRun {
      explicit HeadlessRun(const nlohmann::json& doc,
                           std::optional<std::uint64_t> maxFrames = std::nullopt)
          : experiment(experimentFrom(doc)), monitor(std::make_shared<core::ErrorMonitor>()),
            driver(60.0, maxFrames), sequencer(experiment, monitor) {}

      flow::RunSummary run(std::optional<std::uint64_t> seed = 1) {
        for (const auto& [name, value] : experiment.variables)
          env.set(name, value);
        return sequencer.run(env, flow::RunIO{ driver, &sink, &pointer, logger }, seed);
      }

      flow::Experiment experiment;
      std::shared_ptr<core::ErrorMonitor> monitor;
      io::FixedRateFrameDriver driver;
      io::HeadlessFrameSink sink;
      io::ScriptedPointer pointer;
      core::VariableEnvironment env;
      core::Logger* logger{ nullptr };
      flow::FlowSequencer sequencer;
    };

  } // namespace test
} // namespace trialflow
