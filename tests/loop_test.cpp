// TrialFlow-Prod headers
#include "core/Errors.hpp"
#include "core/ExpressionEvaluator.hpp"
#include "core/VariableEnvironment.hpp"
#include "flow/LoopNode.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

// STL headers
#include <algorithm>
#include <numeric>

namespace trialflow::test {

  using core::ConfigurationError;
  using core::ExpressionEvaluator;
  using core::Value;
  using core::VariableEnvironment;
  using flow::BranchGuard;
  using flow::LoopActivation;
  using flow::LoopKind;
  using flow::LoopNode;
  using flow::LoopOrder;

  class LoopActivationTest : public ::testing::Test {
  protected:
    LoopNode makeLoop(const std::string& name, const std::string& reps,
                      LoopOrder order = LoopOrder::Sequential) {
      LoopNode loop;
      loop.name = name;
      loop.nReps = ExpressionEvaluator::compile(reps);
      loop.order = order;
      return loop;
    }

    /// Drive one full entry of \p loop and return the published thisN values.
    std::vector<std::size_t> iterate(const LoopNode& loop) {
      LoopActivation act(loop, env, rng);
      act.enter();
      std::vector<std::size_t> seen;
      while (act.next())
        seen.push_back(static_cast<std::size_t>(std::get<double>(env.get(loop.name + ".thisN"))));
      return seen;
    }

    VariableEnvironment env;
    std::mt19937_64 rng{ 42 };
  };

  TEST_F(LoopActivationTest, ZeroCountExitsWithoutPublishing) {
    auto loop = makeLoop("skip", "0");
    LoopActivation act(loop, env, rng);

    EXPECT_EQ(act.enter(), 0u);
    EXPECT_EQ(act.state(), LoopActivation::State::Exited);
    EXPECT_FALSE(act.next());
    EXPECT_FALSE(env.contains("skip.thisN"));
    EXPECT_FALSE(env.contains("skip.nTotal"));
  }

  TEST_F(LoopActivationTest, SequentialRunsExactlyNTimesInOrder) {
    auto loop = makeLoop("trials", "4");
    EXPECT_THAT(iterate(loop), ::testing::ElementsAre(0u, 1u, 2u, 3u));
    EXPECT_FALSE(env.contains("trials.thisN"));
  }

  TEST_F(LoopActivationTest, PublishesCountersWhileIterating) {
    auto loop = makeLoop("trials", "3");
    LoopActivation act(loop, env, rng);
    act.enter();

    ASSERT_TRUE(act.next());
    EXPECT_EQ(act.state(), LoopActivation::State::Iterating);
    EXPECT_EQ(env.get("trials.nTotal"), Value(3.0));
    EXPECT_EQ(env.get("trials.nRemaining"), Value(2.0));
    EXPECT_EQ(env.get("trials.thisRepN"), Value(0.0));
    EXPECT_EQ(env.get("trials.finished"), Value(false));

    ASSERT_TRUE(act.next());
    EXPECT_EQ(env.get("trials.nRemaining"), Value(1.0));
    EXPECT_EQ(act.thisN(), 1u);

    act.exit();
    EXPECT_EQ(act.state(), LoopActivation::State::Exited);
    EXPECT_FALSE(env.contains("trials.nTotal"));
  }

  TEST_F(LoopActivationTest, CountersRemovedWhenActivationIsDiscarded) {
    auto loop = makeLoop("trials", "3");
    {
      LoopActivation act(loop, env, rng);
      act.enter();
      ASSERT_TRUE(act.next());
      EXPECT_TRUE(env.contains("trials.thisN"));
    }
    EXPECT_FALSE(env.contains("trials.thisN"));
  }

  TEST_F(LoopActivationTest, FinishedFlagStopsAfterCurrentIteration) {
    auto loop = makeLoop("trials", "5");
    LoopActivation act(loop, env, rng);
    act.enter();

    ASSERT_TRUE(act.next());
    ASSERT_TRUE(act.next());
    env.set("trials.finished", true);
    EXPECT_FALSE(act.next());
    EXPECT_EQ(act.position(), 2u);
    EXPECT_FALSE(env.contains("trials.finished"));
  }

  TEST_F(LoopActivationTest, BooleanCountActsAsZeroOrOne) {
    env.set("branch", 1.0);
    EXPECT_EQ(iterate(makeLoop("g", "branch == 1")).size(), 1u);
    env.set("branch", 0.0);
    EXPECT_EQ(iterate(makeLoop("g", "branch == 1")).size(), 0u);
  }

  TEST_F(LoopActivationTest, NegativeOrFractionalCountIsConfigurationError) {
    auto negative = makeLoop("bad", "-1");
    auto fractional = makeLoop("bad", "2.5");
    auto text = makeLoop("bad", "'three'");
    EXPECT_THROW(LoopActivation(negative, env, rng).enter(), ConfigurationError);
    EXPECT_THROW(LoopActivation(fractional, env, rng).enter(), ConfigurationError);
    EXPECT_THROW(LoopActivation(text, env, rng).enter(), ConfigurationError);
  }

  TEST_F(LoopActivationTest, HugeCountIsConfigurationErrorNotZero) {
    auto astronomical = makeLoop("huge", "1e30");
    auto oversized = makeLoop("huge", "1e13");
    LoopActivation act(astronomical, env, rng);
    EXPECT_THROW(act.enter(), ConfigurationError);
    EXPECT_FALSE(env.contains("huge.thisN"));
    EXPECT_THROW(LoopActivation(oversized, env, rng).enter(), ConfigurationError);
    EXPECT_THROW(flow::repetitionsFrom(Value(static_cast<double>(flow::kMaxRepetitions) + 1), oversized),
                 ConfigurationError);
    EXPECT_EQ(flow::repetitionsFrom(Value(static_cast<double>(flow::kMaxRepetitions)), oversized),
              flow::kMaxRepetitions);
  }

  TEST_F(LoopActivationTest, SequentialLoopDrawsNoOrderTable) {
    auto loop = makeLoop("long", std::to_string(flow::kMaxRepetitions));
    LoopActivation act(loop, env, rng);

    EXPECT_EQ(act.enter(), flow::kMaxRepetitions);
    EXPECT_TRUE(act.order().empty());
    ASSERT_TRUE(act.next());
    ASSERT_TRUE(act.next());
    EXPECT_EQ(act.thisN(), 1u);
    EXPECT_EQ(env.get("long.nRemaining"), Value(static_cast<double>(flow::kMaxRepetitions - 2)));
  }

  TEST_F(LoopActivationTest, CountReferencingUnpublishedLoopFails) {
    auto inner = makeLoop("inner", "outer.thisN + 1");
    LoopActivation act(inner, env, rng);
    EXPECT_THROW(act.enter(), core::UnresolvedNameError);
  }

  TEST_F(LoopActivationTest, SeededRandomOrderIsReproducible) {
    auto loop = makeLoop("trials", "10", LoopOrder::Random);
    loop.seed = 1234;

    auto first = iterate(loop);
    std::mt19937_64 otherRng{ 7 };
    LoopActivation again(loop, env, otherRng);
    again.enter();

    EXPECT_EQ(first, again.order());
  }

  TEST_F(LoopActivationTest, UnseededRandomOrderIsAPermutation) {
    auto loop = makeLoop("trials", "12", LoopOrder::Random);
    auto seen = iterate(loop);

    std::vector<std::size_t> expected(12);
    std::iota(expected.begin(), expected.end(), std::size_t{ 0 });
    std::sort(seen.begin(), seen.end());
    EXPECT_EQ(seen, expected);
  }

  TEST_F(LoopActivationTest, ConditionRowsBoundPerIteration) {
    auto loop = makeLoop("trials", "3");
    loop.isTrials = true;
    loop.conditions = flow::ConditionTable{ { { "target", Value(std::string("left")) } },
                                            { { "target", Value(std::string("right")) } } };
    LoopActivation act(loop, env, rng);
    act.enter();

    std::vector<std::string> targets;
    while (act.next())
      targets.push_back(std::get<std::string>(env.get("target")));

    EXPECT_THAT(targets, ::testing::ElementsAre("left", "right", "left"));
    EXPECT_FALSE(env.contains("target"));
    EXPECT_FALSE(env.contains("trials.thisIndex"));
  }

  TEST_F(LoopActivationTest, EnterTwiceIsALogicError) {
    auto loop = makeLoop("trials", "1");
    LoopActivation act(loop, env, rng);
    act.enter();
    EXPECT_THROW(act.enter(), std::logic_error);
  }

  //---BranchGuard---------------------------------------------------------

  TEST_F(LoopActivationTest, BranchGuardReportsTakenAndRejectsOtherCounts) {
    auto loop = makeLoop("maybe", "choice");
    loop.kind = LoopKind::BranchGuard;
    BranchGuard guard(loop);

    env.set("choice", 1.0);
    EXPECT_TRUE(guard.taken(env));
    env.set("choice", false);
    EXPECT_FALSE(guard.taken(env));
    env.set("choice", 2.0);
    EXPECT_THROW(guard.taken(env), ConfigurationError);
  }

  TEST_F(LoopActivationTest, BranchGuardNeedsGuardLoop) {
    auto loop = makeLoop("plain", "1");
    EXPECT_THROW(BranchGuard{ loop }, std::invalid_argument);
  }

} // namespace trialflow::test
