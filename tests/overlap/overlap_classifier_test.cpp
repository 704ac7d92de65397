// Tests for overlap/overlap_classifier.h -- pair classification rules.

#include "overlap/overlap_classifier.h"

#include <gtest/gtest.h>

#include <string>

namespace affect {
namespace {

/// Behavior with the given gate rates; everything else neutral.
BehavioralMetrics makeBehavior(double on_either, double on_both) {
  BehavioralMetrics behavior;
  behavior.sample_count = 8000;
  behavior.gate_overlap.on_either_rate = on_either;
  behavior.gate_overlap.on_both_rate = on_both;
  behavior.gate_overlap.p_only_rate = (on_either - on_both) / 2.0;
  behavior.gate_overlap.q_only_rate = (on_either - on_both) / 2.0;
  behavior.intensity.pearson_correlation = 0.5;
  behavior.intensity.mean_abs_diff = 0.2;
  behavior.pass_rates.p_a_given_b = 0.5;
  behavior.pass_rates.p_b_given_a = 0.5;
  return behavior;
}

GateImplicationResult aImpliesB(bool vacuous) {
  GateImplicationResult implication;
  implication.a_implies_b = true;
  implication.relation = ImplicationRelation::Narrower;
  implication.is_vacuous = vacuous;
  return implication;
}

class OverlapClassifierTest : public ::testing::Test {
 protected:
  OverlapConfig config_;
  CandidateMetrics candidate_;
};

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

TEST(OverlapClassifierHelpersTest, GateOverlapRatio) {
  GateOverlapStats stats;
  EXPECT_DOUBLE_EQ(gateOverlapRatio(stats), 0.0);
  stats.on_either_rate = 0.5;
  stats.on_both_rate = 0.25;
  EXPECT_DOUBLE_EQ(gateOverlapRatio(stats), 0.5);
}

TEST(OverlapClassifierHelpersTest, ClampConfidence) {
  EXPECT_DOUBLE_EQ(clampConfidence(kNaN), 0.0);
  EXPECT_DOUBLE_EQ(clampConfidence(1.5), 1.0);
  EXPECT_DOUBLE_EQ(clampConfidence(-0.2), 0.0);
  EXPECT_DOUBLE_EQ(clampConfidence(0.42), 0.42);
}

TEST(OverlapClassifierHelpersTest, Strings) {
  EXPECT_STREQ(overlapTypeToString(OverlapType::MergeRecommended), "merge_recommended");
  EXPECT_STREQ(overlapTypeToString(OverlapType::ConvertToExpression), "convert_to_expression");
  EXPECT_STREQ(overlapTypeToString(OverlapType::KeepDistinct), "keep_distinct");
  EXPECT_STREQ(pairSideToString(PairSide::B), "b");
}

// ---------------------------------------------------------------------------
// Classification
// ---------------------------------------------------------------------------

TEST_F(OverlapClassifierTest, Merge) {
  BehavioralMetrics behavior = makeBehavior(0.5, 0.48);
  behavior.intensity.pearson_correlation = 0.99;
  behavior.intensity.mean_abs_diff = 0.01;
  behavior.intensity.dominance_p = 0.1;
  behavior.intensity.dominance_q = 0.1;
  behavior.pass_rates.p_a_given_b = 0.96;
  behavior.pass_rates.p_b_given_a = 0.96;

  ClassificationResult result = OverlapClassifier(config_).classify(candidate_, behavior);
  ASSERT_EQ(result.entries.size(), 1u);
  EXPECT_EQ(result.primary().type, OverlapType::MergeRecommended);
  EXPECT_TRUE(result.primary().is_primary);
  EXPECT_NEAR(result.primary().confidence, 0.96, 1e-12);
}

TEST_F(OverlapClassifierTest, DeadPairNeverMerges) {
  BehavioralMetrics behavior = makeBehavior(0.01, 0.01);
  behavior.intensity.pearson_correlation = 0.999;
  behavior.intensity.mean_abs_diff = 0.001;
  ClassificationResult result = OverlapClassifier(config_).classify(candidate_, behavior);
  EXPECT_FALSE(result.has(OverlapType::MergeRecommended));
}

TEST_F(OverlapClassifierTest, NaNCorrelationNeverMerges) {
  BehavioralMetrics behavior = makeBehavior(0.5, 0.5);
  behavior.intensity.pearson_correlation = kNaN;
  behavior.intensity.mean_abs_diff = 0.0;
  ClassificationResult result = OverlapClassifier(config_).classify(candidate_, behavior);
  EXPECT_EQ(result.primary().type, OverlapType::KeepDistinct);
  EXPECT_NE(result.primary().evidence.find("pearson=NaN"), std::string::npos);
}

TEST_F(OverlapClassifierTest, SubsumedNamesTheSubsumedSide) {
  BehavioralMetrics behavior = makeBehavior(0.5, 0.3);
  behavior.gate_overlap.p_only_rate = 0.005;
  behavior.gate_overlap.q_only_rate = 0.195;
  behavior.intensity.pearson_correlation = 0.97;
  behavior.intensity.dominance_q = 0.97;
  behavior.pass_rates.p_a_given_b = kNaN;
  behavior.pass_rates.p_b_given_a = kNaN;

  ClassificationResult result = OverlapClassifier(config_).classify(candidate_, behavior);
  ASSERT_EQ(result.entries.size(), 1u);
  EXPECT_EQ(result.primary().type, OverlapType::SubsumedRecommended);
  EXPECT_EQ(result.primary().side, PairSide::A);
  EXPECT_NEAR(result.primary().confidence, 0.97, 1e-12);
}

TEST_F(OverlapClassifierTest, ConvertToExpressionNeedsProofAndRate) {
  BehavioralMetrics behavior = makeBehavior(0.4, 0.2);
  behavior.gate_implication = aImpliesB(false);
  behavior.pass_rates.p_b_given_a = 0.99;
  behavior.pass_rates.p_a_given_b = 0.5;

  ClassificationResult result = OverlapClassifier(config_).classify(candidate_, behavior);
  ASSERT_EQ(result.entries.size(), 2u);
  EXPECT_EQ(result.primary().type, OverlapType::ConvertToExpression);
  EXPECT_EQ(result.primary().side, PairSide::A);
  EXPECT_NEAR(result.primary().confidence, 0.99, 1e-12);
  EXPECT_EQ(result.entries[1].type, OverlapType::NestedSiblings);
  EXPECT_TRUE(result.entries[1].deterministic);
  EXPECT_DOUBLE_EQ(result.entries[1].confidence, 1.0);
  EXPECT_FALSE(result.entries[1].is_primary);

  // Proof without corroborating rate.
  behavior.pass_rates.p_b_given_a = 0.9;
  result = OverlapClassifier(config_).classify(candidate_, behavior);
  EXPECT_FALSE(result.has(OverlapType::ConvertToExpression));
  EXPECT_EQ(result.primary().type, OverlapType::NestedSiblings);
  EXPECT_TRUE(result.primary().deterministic);
}

TEST_F(OverlapClassifierTest, ConvertCanBeDisabled) {
  config_.enable_convert_to_expression = false;
  BehavioralMetrics behavior = makeBehavior(0.4, 0.2);
  behavior.gate_implication = aImpliesB(false);
  behavior.pass_rates.p_b_given_a = 0.99;
  ClassificationResult result = OverlapClassifier(config_).classify(candidate_, behavior);
  EXPECT_EQ(result.primary().type, OverlapType::NestedSiblings);
}

TEST_F(OverlapClassifierTest, ConfigIsCopiedAtConstruction) {
  config_.enable_convert_to_expression = false;
  OverlapClassifier classifier(config_);
  config_.enable_convert_to_expression = true;
  BehavioralMetrics behavior = makeBehavior(0.4, 0.2);
  behavior.gate_implication = aImpliesB(false);
  behavior.pass_rates.p_b_given_a = 0.99;
  EXPECT_EQ(classifier.classify(candidate_, behavior).primary().type,
            OverlapType::NestedSiblings);
}

TEST_F(OverlapClassifierTest, VacuousImplicationIsNotDeterministic) {
  BehavioralMetrics behavior = makeBehavior(0.4, 0.2);
  behavior.gate_implication = aImpliesB(true);
  behavior.pass_rates.p_b_given_a = 0.99;
  behavior.pass_rates.p_a_given_b = 0.5;

  ClassificationResult result = OverlapClassifier(config_).classify(candidate_, behavior);
  EXPECT_FALSE(result.has(OverlapType::ConvertToExpression));
  ASSERT_EQ(result.primary().type, OverlapType::NestedSiblings);
  EXPECT_FALSE(result.primary().deterministic);
  EXPECT_EQ(result.primary().side, PairSide::A);
  EXPECT_NEAR(result.primary().confidence, 0.99, 1e-12);
}

TEST_F(OverlapClassifierTest, PartialParseDisablesDeterministicNesting) {
  BehavioralMetrics behavior = makeBehavior(0.4, 0.2);
  behavior.gate_implication = aImpliesB(false);
  behavior.gate_parse_info_b.parse_status = GateParseStatus::Partial;
  ClassificationResult result = OverlapClassifier(config_).classify(candidate_, behavior);
  EXPECT_FALSE(result.has(OverlapType::ConvertToExpression));
  EXPECT_FALSE(result.has(OverlapType::NestedSiblings));
}

TEST_F(OverlapClassifierTest, NeedsSeparation) {
  BehavioralMetrics behavior = makeBehavior(0.5, 0.4);
  behavior.intensity.pearson_correlation = 0.9;
  behavior.intensity.mean_abs_diff = 0.1;
  behavior.pass_rates.p_a_given_b = 0.8;
  behavior.pass_rates.p_b_given_a = 0.8;

  ClassificationResult result = OverlapClassifier(config_).classify(candidate_, behavior);
  ASSERT_EQ(result.entries.size(), 1u);
  EXPECT_EQ(result.primary().type, OverlapType::NeedsSeparation);
  EXPECT_NEAR(result.primary().confidence, 0.8 * 0.9, 1e-12);
}

TEST_F(OverlapClassifierTest, KeepDistinctOnlyWhenNothingMatches) {
  candidate_.weight_cosine_similarity = 0.9;
  BehavioralMetrics behavior = makeBehavior(0.5, 0.1);
  ClassificationResult result = OverlapClassifier(config_).classify(candidate_, behavior);
  ASSERT_EQ(result.entries.size(), 1u);
  EXPECT_EQ(result.primary().type, OverlapType::KeepDistinct);
  EXPECT_NEAR(result.primary().confidence, 0.8, 1e-12);
  EXPECT_NE(result.primary().evidence.find("weightCosine=0.9000"), std::string::npos);
}

// ---------------------------------------------------------------------------
// Near misses
// ---------------------------------------------------------------------------

TEST_F(OverlapClassifierTest, NearMissOnCorrelation) {
  BehavioralMetrics behavior = makeBehavior(0.5, 0.48);
  behavior.intensity.pearson_correlation = 0.95;
  NearMissResult near = OverlapClassifier(config_).checkNearMiss(candidate_, behavior);
  EXPECT_TRUE(near.is_near_miss);
  EXPECT_EQ(near.reason, "correlation 0.950 (threshold: 0.98)");
}

TEST_F(OverlapClassifierTest, NearMissOnGateOverlap) {
  BehavioralMetrics behavior = makeBehavior(0.5, 0.4);
  behavior.intensity.pearson_correlation = 0.99;
  NearMissResult near = OverlapClassifier(config_).checkNearMiss(candidate_, behavior);
  EXPECT_TRUE(near.is_near_miss);
  EXPECT_EQ(near.reason, "gate overlap 0.800 (threshold: 0.9)");
}

TEST_F(OverlapClassifierTest, NearMissOnIntensityDifference) {
  BehavioralMetrics behavior = makeBehavior(0.5, 0.48);
  behavior.intensity.pearson_correlation = 0.99;
  behavior.intensity.mean_abs_diff = 0.1;
  NearMissResult near = OverlapClassifier(config_).checkNearMiss(candidate_, behavior);
  EXPECT_TRUE(near.is_near_miss);
  EXPECT_EQ(near.reason, "mean abs diff 0.100 (threshold: 0.03)");
}

TEST_F(OverlapClassifierTest, DeadOrDistantPairsAreNotNearMisses) {
  BehavioralMetrics dead = makeBehavior(0.01, 0.01);
  dead.intensity.pearson_correlation = 0.95;
  EXPECT_FALSE(OverlapClassifier(config_).checkNearMiss(candidate_, dead).is_near_miss);

  BehavioralMetrics distant = makeBehavior(0.5, 0.1);
  EXPECT_FALSE(OverlapClassifier(config_).checkNearMiss(candidate_, distant).is_near_miss);
}

}  // namespace
}  // namespace affect
