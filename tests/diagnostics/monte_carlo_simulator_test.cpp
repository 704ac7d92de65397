// Tests for diagnostics/monte_carlo_simulator.h -- trigger-rate estimation.

#include "diagnostics/monte_carlo_simulator.h"

#include <gtest/gtest.h>

#include <vector>

#include "scoring/prototype_emotion_calculator.h"
#include "test_helpers.h"

namespace affect {
namespace {

using test_helpers::logicFromText;
using test_helpers::makeExpression;
using test_helpers::makePrototype;

class CountingScheduler : public IScheduler {
 public:
  YieldStatus yieldControl(const CancellationToken* token) override {
    ++yields;
    return token && token->isCancelled() ? YieldStatus::Cancelled : YieldStatus::Continue;
  }
  int yields = 0;
};

class MonteCarloSimulatorTest : public ::testing::Test {
 protected:
  MonteCarloSimulatorTest() : calculator_({makePrototype("joy", {{"valence", 1.0}})}) {
    config_.seed = 77;
    config_.sample_count = 2500;
    config_.chunk_size = 1000;
  }

  PrototypeEmotionCalculator calculator_;
  MonteCarloConfig config_;
  CountingScheduler scheduler_;
};

// ---------------------------------------------------------------------------
// Wilson interval
// ---------------------------------------------------------------------------

TEST(WilsonIntervalTest, EmptyTrials) {
  ConfidenceInterval interval = wilsonInterval(0, 0, 1.96);
  EXPECT_DOUBLE_EQ(interval.low, 0.0);
  EXPECT_DOUBLE_EQ(interval.high, 0.0);
}

TEST(WilsonIntervalTest, SymmetricAroundHalf) {
  ConfidenceInterval interval = wilsonInterval(50, 100, 1.96);
  EXPECT_LT(interval.low, 0.5);
  EXPECT_GT(interval.high, 0.5);
  EXPECT_NEAR(interval.low + interval.high, 1.0, 1e-12);
  EXPECT_NEAR(interval.high - interval.low, 0.19, 0.01);
}

TEST(WilsonIntervalTest, ExtremesStayInUnitRange) {
  ConfidenceInterval none = wilsonInterval(0, 20, 1.96);
  EXPECT_NEAR(none.low, 0.0, 1e-12);
  EXPECT_GT(none.high, 0.0);
  ConfidenceInterval all = wilsonInterval(20, 20, 1.96);
  EXPECT_LT(all.low, 1.0);
  EXPECT_LE(all.high, 1.0);
}

TEST(WilsonIntervalTest, ZScores) {
  EXPECT_DOUBLE_EQ(zScoreForConfidence(0.90), 1.645);
  EXPECT_DOUBLE_EQ(zScoreForConfidence(0.95), 1.96);
  EXPECT_DOUBLE_EQ(zScoreForConfidence(0.99), 2.576);
  EXPECT_DOUBLE_EQ(zScoreForConfidence(0.5), 1.96);
}

// ---------------------------------------------------------------------------
// Simulation
// ---------------------------------------------------------------------------

TEST_F(MonteCarloSimulatorTest, EstimatesTriggerRate) {
  MonteCarloSimulator simulator(calculator_, &scheduler_);
  Expression expr =
      makeExpression("upbeat", {logicFromText(R"({">=": [{"var": "moodAxes.valence"}, 0]})")});

  SimulationResult result = simulator.simulate(expr, config_);
  EXPECT_EQ(result.status, SimulationStatus::Completed);
  EXPECT_EQ(result.sample_count, 2500u);
  EXPECT_NEAR(result.trigger_rate, 0.5, 0.05);
  EXPECT_LE(result.confidence_interval.low, result.trigger_rate);
  EXPECT_GE(result.confidence_interval.high, result.trigger_rate);
  ASSERT_EQ(result.clause_failures.size(), 1u);
  EXPECT_EQ(result.clause_failures[0].failure_count, result.sample_count - result.trigger_count);
  EXPECT_EQ(result.witnesses.size(), config_.max_witnesses);
}

TEST_F(MonteCarloSimulatorTest, ProgressIncludesPartialLastChunk) {
  MonteCarloSimulator simulator(calculator_, &scheduler_);
  std::vector<size_t> completed;
  simulator.simulate(makeExpression("always", {}), config_,
                     [&completed](size_t done, size_t total) {
                       EXPECT_EQ(total, 2500u);
                       completed.push_back(done);
                     });
  ASSERT_EQ(completed.size(), 3u);
  EXPECT_EQ(completed[0], 1000u);
  EXPECT_EQ(completed[1], 2000u);
  EXPECT_EQ(completed[2], 2500u);
  EXPECT_EQ(scheduler_.yields, 2);
}

TEST_F(MonteCarloSimulatorTest, AlwaysTrueCapsWitnesses) {
  config_.max_witnesses = 3;
  MonteCarloSimulator simulator(calculator_, &scheduler_);
  SimulationResult result = simulator.simulate(makeExpression("always", {}), config_);
  EXPECT_EQ(result.trigger_count, result.sample_count);
  EXPECT_DOUBLE_EQ(result.trigger_rate, 1.0);
  EXPECT_EQ(result.witnesses.size(), 3u);
  EXPECT_FALSE(result.nearest_miss.has_value());
}

TEST_F(MonteCarloSimulatorTest, NearestMissHasFewestFailures) {
  MonteCarloSimulator simulator(calculator_, &scheduler_);
  Expression expr = makeExpression(
      "never", {logicFromText(R"({">": [{"var": "moodAxes.valence"}, 100]})"),
                logicFromText(R"({">=": [{"var": "moodAxes.threat"}, 0]})")});
  SimulationResult result = simulator.simulate(expr, config_);
  EXPECT_EQ(result.trigger_count, 0u);
  EXPECT_NEAR(result.confidence_interval.low, 0.0, 1e-12);
  ASSERT_TRUE(result.nearest_miss.has_value());
  EXPECT_EQ(result.nearest_miss->failed_clause_count, 1u);
  ASSERT_EQ(result.nearest_miss->failed_clause_indices.size(), 1u);
  EXPECT_EQ(result.nearest_miss->failed_clause_indices[0], 0u);

  ASSERT_EQ(result.clause_failures.size(), 2u);
  EXPECT_DOUBLE_EQ(result.clause_failures[0].failure_rate, 1.0);
  EXPECT_LT(result.clause_failures[1].failure_rate, 1.0);
}

TEST_F(MonteCarloSimulatorTest, CancellationStopsBetweenChunks) {
  MonteCarloSimulator simulator(calculator_, &scheduler_);
  CancellationToken token;
  token.cancel();
  int progress_calls = 0;
  SimulationResult result = simulator.simulate(
      makeExpression("always", {}), config_,
      [&progress_calls](size_t, size_t) { ++progress_calls; }, &token);
  EXPECT_EQ(result.status, SimulationStatus::Cancelled);
  EXPECT_EQ(result.sample_count, 1000u);
  EXPECT_EQ(progress_calls, 1);
}

TEST_F(MonteCarloSimulatorTest, StoresSamplesUpToLimit) {
  config_.store_samples_for_sensitivity = true;
  config_.sensitivity_sample_limit = 50;
  config_.sample_count = 200;
  MonteCarloSimulator simulator(calculator_, &scheduler_);
  SimulationResult result = simulator.simulate(makeExpression("always", {}), config_);
  EXPECT_EQ(result.stored_samples.size(), 50u);
}

TEST_F(MonteCarloSimulatorTest, SameSeedSameCounts) {
  MonteCarloSimulator simulator(calculator_, &scheduler_);
  Expression expr =
      makeExpression("upbeat", {logicFromText(R"({">=": [{"var": "emotions.joy"}, 0.4]})")});
  EXPECT_EQ(simulator.simulate(expr, config_).trigger_count,
            simulator.simulate(expr, config_).trigger_count);
}

}  // namespace
}  // namespace affect
