// TrialFlow-Prod headers
#include "core/Errors.hpp"
#include "flow/ExperimentLoader.hpp"
#include "flow/FlowSequencer.hpp"

// TrialFlow-Fake headers
#include "ExperimentBuilder.hpp"
#include "MockErrorMonitor.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

// STL headers
#include <algorithm>
#include <filesystem>
#include <fstream>

namespace trialflow::test {

  using core::ConfigurationError;
  using core::Value;
  using flow::RunSummary;
  using nlohmann::json;
  using ::testing::HasSubstr;

  namespace {

    json routineRecord(const std::string& name) { return json{ { "type", "Routine" }, { "name", name } }; }

    json loopStart(const std::string& name, json nReps) {
      return json{ { "type", "LoopStart" }, { "name", name }, { "nReps", std::move(nReps) } };
    }

    json loopEnd(const std::string& name) { return json{ { "type", "LoopEnd" }, { "name", name } }; }

    json recorder(const std::string& beginRoutine) {
      return json::array({ { { "kind", "code" },
                             { "name", "recorder" },
                             { "parameters", { { "beginRoutine", beginRoutine } } } } });
    }

    /// instructions → outer(branch == 1) → inner(3) → body
    json branchingExperiment(double branch) {
      return json{ { "variables", { { "branch", branch }, { "trace", "" }, { "totals", 0 } } },
                   { "routines",
                     { { "instructions", blipRoutine("welcome") },
                       { "body", recorder("trace += str(inner.thisN); totals += inner.nTotal") } } },
                   { "flow",
                     json::array({ routineRecord("instructions"), loopStart("outer", "branch == 1"),
                                   loopStart("inner", 3), routineRecord("body"), loopEnd("inner"),
                                   loopEnd("outer") }) } };
    }

  } // namespace

  //---end-to-end scenarios -----------------------------------------------

  TEST(FlowSequencerTest, BranchZeroSkipsTheWholeBody) {
    HeadlessRun h(branchingExperiment(0));
    auto summary = h.run();

    EXPECT_EQ(summary.outcome, RunSummary::Outcome::Completed);
    EXPECT_EQ(summary.routineActivations.at("instructions"), 1u);
    EXPECT_EQ(summary.routineActivations.at("body"), 0u);
    EXPECT_EQ(summary.loopIterations.at("outer"), 0u);
    EXPECT_EQ(summary.loopIterations.at("inner"), 0u);
    EXPECT_EQ(summary.variables.at("trace"), Value(std::string()));
  }

  TEST(FlowSequencerTest, BranchOneRunsInnerLoopThreeTimes) {
    HeadlessRun h(branchingExperiment(1));
    auto summary = h.run();

    EXPECT_EQ(summary.routineActivations.at("instructions"), 1u);
    EXPECT_EQ(summary.routineActivations.at("body"), 3u);
    EXPECT_EQ(summary.loopIterations.at("outer"), 1u);
    EXPECT_EQ(summary.variables.at("trace"), Value(std::string("012")));
    EXPECT_EQ(summary.variables.at("totals"), Value(9.0));
  }

  TEST(FlowSequencerTest, LoopCountersDoNotOutliveTheLoop) {
    HeadlessRun h(branchingExperiment(1));
    auto summary = h.run();

    for (const char* name : { "inner.thisN", "inner.nTotal", "outer.thisN", "outer.finished" })
      EXPECT_EQ(summary.variables.count(name), 0u) << name;
    EXPECT_FALSE(h.env.contains("continueRoutine"));
  }

  TEST(FlowSequencerTest, NestedLoopReResolvesInnerCount) {
    json doc{ { "variables", { { "innerRuns", 0 } } },
              { "routines", { { "body", recorder("innerRuns += 1") } } },
              { "flow",
                json::array({ loopStart("outer", 2), loopStart("inner", "outer.thisN + 1"),
                              routineRecord("body"), loopEnd("inner"), loopEnd("outer") }) } };
    HeadlessRun h(doc);
    auto summary = h.run();

    EXPECT_EQ(summary.loopIterations.at("inner"), 3u);
    EXPECT_EQ(summary.variables.at("innerRuns"), Value(3.0));
  }

  TEST(FlowSequencerTest, ZeroLoopCountersInvisibleToSiblings) {
    json doc{ { "routines",
                { { "body", blipRoutine("b") }, { "after", recorder("peek = skip.thisN") } } },
              { "flow", json::array({ loopStart("skip", 0), routineRecord("body"), loopEnd("skip"),
                                      routineRecord("after") }) } };
    auto experiment = experimentFrom(doc);
    auto monitor = std::make_shared<::testing::NiceMock<MockErrorMonitor>>();
    EXPECT_CALL(*monitor, notifyFailure(HasSubstr("skip.thisN"))).Times(1);

    flow::FlowSequencer sequencer(experiment, monitor);
    core::VariableEnvironment env;
    io::FixedRateFrameDriver driver;
    EXPECT_THROW(sequencer.run(env, flow::RunIO{ driver }), core::UnresolvedNameError);
  }

  TEST(FlowSequencerTest, OversizedCountIsReportedAsFlowError) {
    json doc{ { "routines", { { "body", blipRoutine("b") } } },
              { "flow", json::array({ loopStart("trials", "1e13"), routineRecord("body"), loopEnd("trials") }) } };
    auto experiment = experimentFrom(doc);
    auto monitor = std::make_shared<::testing::NiceMock<MockErrorMonitor>>();
    EXPECT_CALL(*monitor, notifyFailure(HasSubstr("repetition count of loop 'trials'"))).Times(1);

    flow::FlowSequencer sequencer(experiment, monitor);
    core::VariableEnvironment env;
    io::FixedRateFrameDriver driver;
    EXPECT_THROW(sequencer.run(env, flow::RunIO{ driver }), core::ConfigurationError);
  }

  TEST(FlowSequencerTest, ConditionRowsFollowTheLoop) {
    json start = loopStart("trials", 3);
    start["conditions"] = json::array({ { { "word", "a" } }, { { "word", "b" } } });
    json doc{ { "variables", { { "trace", "" } } },
              { "routines", { { "body", recorder("trace += word + str(trials.thisIndex)") } } },
              { "flow", json::array({ start, routineRecord("body"), loopEnd("trials") }) } };
    HeadlessRun h(doc);
    auto summary = h.run();

    EXPECT_EQ(summary.variables.at("trace"), Value(std::string("a0b1a0")));
    EXPECT_EQ(summary.variables.count("word"), 0u);
  }

  TEST(FlowSequencerTest, FinishedFlagEndsLoopEarly) {
    json doc{ { "routines", { { "body", recorder("trials.finished = trials.thisN == 1") } } },
              { "flow", json::array({ loopStart("trials", 5), routineRecord("body"), loopEnd("trials") }) } };
    HeadlessRun h(doc);
    EXPECT_EQ(h.run().loopIterations.at("trials"), 2u);
  }

  TEST(FlowSequencerTest, RandomOrderReproducibleWithRunSeed) {
    auto doc = [] {
      json start = loopStart("trials", 8);
      start["loopType"] = "random";
      return json{ { "variables", { { "trace", "" } } },
                   { "routines", { { "body", recorder("trace += str(trials.thisN)") } } },
                   { "flow", json::array({ start, routineRecord("body"), loopEnd("trials") }) } };
    }();

    HeadlessRun a(doc);
    HeadlessRun b(doc);
    auto first = std::get<std::string>(a.run(99).variables.at("trace"));
    auto second = std::get<std::string>(b.run(99).variables.at("trace"));

    EXPECT_EQ(first, second);
    std::string sorted = first;
    std::sort(sorted.begin(), sorted.end());
    EXPECT_EQ(sorted, "01234567");
  }

  TEST(FlowSequencerTest, ExperimentHooksRunOnceAroundTheFlow) {
    json doc{ { "variables", { { "visits", 0 } } },
              { "routines",
                { { "body",
                    json::array({ { { "kind", "code" },
                                    { "name", "hooks" },
                                    { "parameters",
                                      { { "beginExperiment", "setup = 1" },
                                        { "beginRoutine", "visits += setup" },
                                        { "endExperiment", "teardown = visits * 10" } } } } }) } } },
              { "flow", json::array({ loopStart("trials", 2), routineRecord("body"), loopEnd("trials") }) } };
    HeadlessRun h(doc);
    auto summary = h.run();

    EXPECT_EQ(summary.variables.at("visits"), Value(2.0));
    EXPECT_EQ(summary.variables.at("teardown"), Value(20.0));
  }

  TEST(FlowSequencerTest, EscapeAbortsAtTickBoundary) {
    json doc{ { "routines", { { "forever", json::array({ { { "kind", "text" }, { "name", "t" } } }) } } },
              { "flow", json::array({ routineRecord("forever") }) } };
    HeadlessRun h(doc, 10);
    auto summary = h.run();

    EXPECT_EQ(summary.outcome, RunSummary::Outcome::Aborted);
    EXPECT_EQ(summary.frames, 10u);
    EXPECT_EQ(summary.routineActivations.at("forever"), 0u);
    EXPECT_FALSE(h.env.contains("continueRoutine"));
  }

  TEST(FlowSequencerTest, PendingEscapeStopsBeforeFirstRoutine) {
    HeadlessRun h(branchingExperiment(1));
    h.driver.requestEscape();
    auto summary = h.run();

    EXPECT_EQ(summary.outcome, RunSummary::Outcome::Aborted);
    EXPECT_EQ(summary.frames, 0u);
  }

  //---linearization --------------------------------------------------------

  class LinearizeTest : public ::testing::Test {
  protected:
    void SetUp() override {
      experiment.routines.emplace("r", flow::RoutineDefinition{ "r", {}, {} });
      for (const char* name : { "a", "b" }) {
        flow::LoopNode loop;
        loop.name = name;
        loop.nReps = core::ExpressionEvaluator::compile("1");
        experiment.loops.emplace(name, loop);
      }
    }

    flow::Experiment experiment;
  };

  TEST_F(LinearizeTest, BuildsNestedTree) {
    experiment.flow = { flow::RoutineRef{ "r" }, flow::LoopStart{ "a" }, flow::LoopStart{ "b" },
                        flow::RoutineRef{ "r" }, flow::LoopEnd{ "b" }, flow::LoopEnd{ "a" } };
    auto program = flow::FlowSequencer::linearize(experiment);

    ASSERT_EQ(program.size(), 2u);
    EXPECT_EQ(program[1].type, flow::ExecNode::Type::Loop);
    EXPECT_EQ(program[1].loop->name, "a");
    ASSERT_EQ(program[1].body.size(), 1u);
    EXPECT_EQ(program[1].body[0].loop->name, "b");
    EXPECT_EQ(program[1].body[0].body[0].routine->name, "r");
  }

  TEST_F(LinearizeTest, UnmatchedEndIsRejected) {
    experiment.flow = { flow::RoutineRef{ "r" }, flow::LoopEnd{ "a" } };
    EXPECT_THROW(flow::FlowSequencer::linearize(experiment), ConfigurationError);
  }

  TEST_F(LinearizeTest, UnclosedStartIsRejected) {
    experiment.flow = { flow::LoopStart{ "a" }, flow::RoutineRef{ "r" } };
    EXPECT_THROW(flow::FlowSequencer::linearize(experiment), ConfigurationError);
  }

  TEST_F(LinearizeTest, OverlappingLoopsAreRejected) {
    experiment.flow = { flow::LoopStart{ "a" }, flow::LoopStart{ "b" }, flow::LoopEnd{ "a" },
                        flow::LoopEnd{ "b" } };
    try {
      flow::FlowSequencer::linearize(experiment);
      FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
      EXPECT_THAT(e.what(), HasSubstr("overlaps open loop 'b'"));
    }
  }

  TEST_F(LinearizeTest, ConstructorReportsBadFlowBeforeRunning) {
    experiment.flow = { flow::LoopStart{ "a" } };
    auto monitor = std::make_shared<::testing::NiceMock<MockErrorMonitor>>();
    EXPECT_CALL(*monitor, notifyFailure(HasSubstr("has no matching LoopEnd"))).Times(1);

    EXPECT_THROW(flow::FlowSequencer sequencer(experiment, monitor), ConfigurationError);
  }

  //---ExperimentLoader -----------------------------------------------------

  TEST(ExperimentLoaderTest, RejectsStructuralFaults) {
    auto bad = [](json flowRecords, json routines = json::object()) {
      return json{ { "routines", std::move(routines) }, { "flow", std::move(flowRecords) } };
    };
    json routines{ { "r", blipRoutine("x") } };

    EXPECT_THROW(experimentFrom(bad(json::array({ routineRecord("ghost") }))), ConfigurationError);
    EXPECT_THROW(experimentFrom(bad(json::array({ loopStart("a", 1), loopEnd("a"), loopStart("a", 1),
                                                  loopEnd("a") }))),
                 ConfigurationError);
    EXPECT_THROW(experimentFrom(bad(json::array({ json{ { "type", "LoopStart" }, { "name", "a" } } }))),
                 ConfigurationError);
    EXPECT_THROW(experimentFrom(bad(json::array({ json{ { "type", "Fork" }, { "name", "a" } } }))),
                 ConfigurationError);

    json twice{ { "r", json::array({ { { "kind", "text" }, { "name", "dup" } },
                                     { { "kind", "shape" }, { "name", "dup" } } }) } };
    EXPECT_THROW(experimentFrom(bad(json::array({ routineRecord("r") }), twice)), ConfigurationError);

    json random = loopStart("a", 1);
    random["loopType"] = "staircase";
    EXPECT_THROW(experimentFrom(bad(json::array({ random, loopEnd("a") }), routines)),
                 ConfigurationError);
  }

  TEST(ExperimentLoaderTest, RoutineObjectCarriesMaxDuration) {
    json doc{ { "routines", { { "r", { { "components", blipRoutine("x") }, { "maxDuration", "0.5" } } } } },
              { "flow", json::array({ routineRecord("r") }) } };
    auto exp = experimentFrom(doc);
    EXPECT_EQ(exp.routines.at("r").maxDuration.source(), "0.5");
  }

  TEST(ExperimentLoaderTest, LoopRecordFields) {
    json start = loopStart("trials", "n * 2");
    start["loopType"] = "fullRandom";
    start["seed"] = 11;
    start["isTrials"] = false;
    start["guard"] = true;
    start["endPoints"] = json::array({ 0, 2 });
    json doc{ { "routines", { { "r", blipRoutine("x") } } },
              { "flow", json::array({ start, routineRecord("r"), loopEnd("trials") }) } };

    const auto& loop = experimentFrom(doc).loops.at("trials");
    EXPECT_EQ(loop.order, flow::LoopOrder::Random);
    EXPECT_EQ(loop.kind, flow::LoopKind::BranchGuard);
    EXPECT_FALSE(loop.isTrials);
    EXPECT_EQ(loop.seed.value_or(0), 11u);
    EXPECT_EQ(loop.nReps.source(), "n * 2");
    EXPECT_EQ(loop.endPoints, (std::vector<int>{ 0, 2 }));
  }

  TEST(ExperimentLoaderTest, ParsesCsvConditions) {
    auto table = flow::ExperimentLoader::parseConditionsCsv(
        "word,delay,correct\n\"a,b\",0.5,True\nplain, 2 ,false\n");
    ASSERT_EQ(table.size(), 2u);
    EXPECT_EQ(table[0].at("word"), Value(std::string("a,b")));
    EXPECT_EQ(table[0].at("delay"), Value(0.5));
    EXPECT_EQ(table[0].at("correct"), Value(true));
    EXPECT_EQ(table[1].at("delay"), Value(2.0));
    EXPECT_THROW(flow::ExperimentLoader::parseConditionsCsv("a,b\n1\n"), ConfigurationError);
    EXPECT_THROW(flow::ExperimentLoader::parseConditionsCsv("bad name\n1\n"), ConfigurationError);
  }

  TEST(ExperimentLoaderTest, LoadsConditionsFileBesideExperiment) {
    auto dir = std::filesystem::temp_directory_path() / "trialflow_loader_test";
    std::filesystem::create_directories(dir);
    std::ofstream(dir / "conds.csv") << "target\nleft\nright\n";
    json start = loopStart("trials", 2);
    start["conditionsFile"] = "conds.csv";
    json doc{ { "routines", { { "r", blipRoutine("x") } } },
              { "flow", json::array({ start, routineRecord("r"), loopEnd("trials") }) } };
    std::ofstream(dir / "exp.json") << doc.dump(2);

    flow::ExperimentLoader loader(components::ComponentFactory::withBuiltins());
    auto exp = loader.load((dir / "exp.json").string());
    std::filesystem::remove_all(dir);

    ASSERT_TRUE(exp.loops.at("trials").conditions.has_value());
    EXPECT_EQ(exp.loops.at("trials").conditions->size(), 2u);
    EXPECT_EQ(exp.source, (dir / "exp.json").string());
  }

} // namespace trialflow::test
