// Tests for overlap/prototype_vector_evaluator.h -- batch prototype evaluation.

#include "overlap/prototype_vector_evaluator.h"

#include <gtest/gtest.h>

#include <utility>
#include <vector>

#include "test_helpers.h"

namespace affect {
namespace {

using test_helpers::makeMoodContext;
using test_helpers::makePrototype;

class CountingScheduler : public IScheduler {
 public:
  YieldStatus yieldControl(const CancellationToken* token) override {
    ++yields;
    return token && token->isCancelled() ? YieldStatus::Cancelled : YieldStatus::Continue;
  }
  int yields = 0;
};

/// Valence -100, -50, 0, 50, 100.
std::vector<AffectContext> valenceSweep() {
  std::vector<AffectContext> pool;
  for (int val = -100; val <= 100; val += 50) {
    pool.push_back(makeMoodContext({{"valence", static_cast<double>(val)}}));
  }
  return pool;
}

// ---------------------------------------------------------------------------
// buildVector
// ---------------------------------------------------------------------------

TEST(PrototypeVectorEvaluatorTest, BuildVectorZeroesFailedPositions) {
  PrototypeVector vec =
      PrototypeVectorEvaluator::buildVector("p", {1, 0, 1, 0}, {0.2, 0.9, 0.6, 0.4});
  ASSERT_EQ(vec.intensities.size(), 4u);
  EXPECT_DOUBLE_EQ(vec.intensities[0], 0.2);
  EXPECT_DOUBLE_EQ(vec.intensities[1], 0.0);
  EXPECT_DOUBLE_EQ(vec.intensities[2], 0.6);
  EXPECT_DOUBLE_EQ(vec.intensities[3], 0.0);
  EXPECT_EQ(vec.pass_count, 2u);
  EXPECT_DOUBLE_EQ(vec.activation_rate, 0.5);
  EXPECT_NEAR(vec.mean_intensity, 0.4, 1e-12);
  EXPECT_NEAR(vec.std_intensity, 0.2, 1e-12);
}

TEST(PrototypeVectorEvaluatorTest, BuildVectorWithNoPasses) {
  PrototypeVector vec = PrototypeVectorEvaluator::buildVector("p", {0, 0}, {0.5, 0.5});
  EXPECT_EQ(vec.pass_count, 0u);
  EXPECT_DOUBLE_EQ(vec.activation_rate, 0.0);
  EXPECT_DOUBLE_EQ(vec.mean_intensity, 0.0);
  EXPECT_DOUBLE_EQ(vec.std_intensity, 0.0);
}

// ---------------------------------------------------------------------------
// evaluateAll
// ---------------------------------------------------------------------------

TEST(PrototypeVectorEvaluatorTest, EvaluatesGatesAndIntensities) {
  CountingScheduler scheduler;
  PrototypeVectorEvaluator evaluator(&scheduler);
  std::vector<std::pair<size_t, size_t>> progress;

  VectorEvaluationResult result = evaluator.evaluateAll(
      {makePrototype("joy", {{"valence", 1.0}}, {"valence >= 0.5"}),
       makePrototype("calm", {{"valence", 0.5}, {"arousal", -0.5}})},
      valenceSweep(),
      [&progress](size_t done, size_t total) { progress.emplace_back(done, total); });

  ASSERT_TRUE(result.success());
  ASSERT_EQ(result.vectors.size(), 2u);
  const PrototypeVector& joy = result.vectors.at("joy");
  EXPECT_EQ(joy.gate_results, (std::vector<uint8_t>{0, 0, 0, 1, 1}));
  EXPECT_DOUBLE_EQ(joy.intensities[3], 0.5);
  EXPECT_DOUBLE_EQ(joy.intensities[4], 1.0);
  EXPECT_DOUBLE_EQ(joy.activation_rate, 0.4);
  EXPECT_DOUBLE_EQ(joy.mean_intensity, 0.75);

  // Ungated prototypes pass everywhere, including negative intensities.
  const PrototypeVector& calm = result.vectors.at("calm");
  EXPECT_DOUBLE_EQ(calm.activation_rate, 1.0);
  EXPECT_DOUBLE_EQ(calm.intensities[0], -0.5);

  ASSERT_EQ(progress.size(), 2u);
  EXPECT_EQ(progress[0], (std::pair<size_t, size_t>(1, 2)));
  EXPECT_EQ(progress[1], (std::pair<size_t, size_t>(2, 2)));
  EXPECT_EQ(scheduler.yields, 0);
}

TEST(PrototypeVectorEvaluatorTest, RecordsGateParseInfo) {
  PrototypeVectorEvaluator evaluator;
  VectorEvaluationResult result = evaluator.evaluateAll(
      {makePrototype("joy", {{"valence", 1.0}}, {"valence >= 0.5", "nonsense gate"})},
      valenceSweep());
  ASSERT_TRUE(result.success());
  const GateParseInfo& info = result.vectors.at("joy").gate_parse_info;
  EXPECT_EQ(info.parse_status, GateParseStatus::Partial);
  EXPECT_EQ(info.parsed_gate_count, 1u);
  EXPECT_EQ(info.total_gate_count, 2u);
  ASSERT_EQ(info.unparsed_gates.size(), 1u);
  EXPECT_EQ(info.unparsed_gates[0], "nonsense gate");
}

TEST(PrototypeVectorEvaluatorTest, EmptyPoolStillReportsProgress) {
  PrototypeVectorEvaluator evaluator;
  int progress_calls = 0;
  VectorEvaluationResult result =
      evaluator.evaluateAll({makePrototype("joy", {{"valence", 1.0}})}, {},
                            [&progress_calls](size_t, size_t) { ++progress_calls; });
  ASSERT_TRUE(result.success());
  EXPECT_DOUBLE_EQ(result.vectors.at("joy").activation_rate, 0.0);
  EXPECT_TRUE(result.vectors.at("joy").gate_results.empty());
  EXPECT_EQ(progress_calls, 1);
}

TEST(PrototypeVectorEvaluatorTest, MissingIdFailsBeforeWork) {
  PrototypeVectorEvaluator evaluator;
  int progress_calls = 0;
  VectorEvaluationResult result = evaluator.evaluateAll(
      {makePrototype("joy", {{"valence", 1.0}}), makePrototype("", {{"valence", 1.0}})},
      valenceSweep(), [&progress_calls](size_t, size_t) { ++progress_calls; });
  EXPECT_EQ(result.status, VectorEvalStatus::InvalidPrototype);
  EXPECT_FALSE(result.success());
  EXPECT_TRUE(result.vectors.empty());
  EXPECT_NE(result.error_message.find("index 1"), std::string::npos);
  EXPECT_EQ(progress_calls, 0);
}

TEST(PrototypeVectorEvaluatorTest, LargePoolYieldsAndHonorsCancellation) {
  std::vector<AffectContext> pool(2500, makeMoodContext({{"valence", 40.0}}));

  CountingScheduler scheduler;
  PrototypeVectorEvaluator evaluator(&scheduler);
  VectorEvaluationResult result =
      evaluator.evaluateAll({makePrototype("joy", {{"valence", 1.0}})}, pool);
  ASSERT_TRUE(result.success());
  EXPECT_EQ(scheduler.yields, 2);

  CancellationToken token;
  token.cancel();
  VectorEvaluationResult cancelled = evaluator.evaluateAll(
      {makePrototype("joy", {{"valence", 1.0}})}, pool, ProgressFn(), &token);
  EXPECT_EQ(cancelled.status, VectorEvalStatus::Cancelled);
  EXPECT_TRUE(cancelled.vectors.empty());
}

TEST(PrototypeVectorEvaluatorTest, StatusStrings) {
  EXPECT_STREQ(vectorEvalStatusToString(VectorEvalStatus::Ok), "ok");
  EXPECT_STREQ(vectorEvalStatusToString(VectorEvalStatus::InvalidPrototype), "invalid_prototype");
  EXPECT_STREQ(vectorEvalStatusToString(VectorEvalStatus::Cancelled), "cancelled");
}

}  // namespace
}  // namespace affect
