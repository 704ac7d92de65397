// Tests for overlap/candidate_pair_filter.h -- static weight-vector prefilter.

#include "overlap/candidate_pair_filter.h"

#include <gtest/gtest.h>

#include <cmath>
#include <set>
#include <string>
#include <vector>

#include "test_helpers.h"

namespace affect {
namespace {

using test_helpers::makePrototype;

// ---------------------------------------------------------------------------
// Metrics
// ---------------------------------------------------------------------------

TEST(CandidateMetricsTest, ActiveAxesUseEpsilon) {
  std::set<std::string> axes = activeAxes({{"valence", 0.5}, {"arousal", -0.08}, {"threat", 0.01}},
                                          0.08);
  EXPECT_EQ(axes, (std::set<std::string>{"arousal", "valence"}));
}

TEST(CandidateMetricsTest, JaccardOverlap) {
  EXPECT_NEAR(activeAxisOverlap({"a", "b"}, {"b", "c"}, 1.0), 1.0 / 3.0, 1e-12);
  EXPECT_DOUBLE_EQ(activeAxisOverlap({"a"}, {"a"}, 1.0), 1.0);
  EXPECT_DOUBLE_EQ(activeAxisOverlap({"a"}, {}, 1.0), 0.0);
  EXPECT_DOUBLE_EQ(activeAxisOverlap({}, {}, 1.0), 1.0);
  EXPECT_DOUBLE_EQ(activeAxisOverlap({}, {}, 0.0), 0.0);
}

TEST(CandidateMetricsTest, SoftSign) {
  EXPECT_EQ(softSign(0.5, 0.15), 1);
  EXPECT_EQ(softSign(-0.5, 0.15), -1);
  EXPECT_EQ(softSign(0.1, 0.15), 0);
  EXPECT_EQ(softSign(-0.1, 0.15), 0);
}

TEST(CandidateMetricsTest, MixedSignAgreement) {
  AxisMap a = {{"valence", 0.5}, {"arousal", 0.5}};
  AxisMap b = {{"valence", 0.5}, {"arousal", -0.5}};
  std::set<std::string> active = {"arousal", "valence"};
  EXPECT_DOUBLE_EQ(signAgreement(a, b, active, active, 0.15), 0.5);
  EXPECT_DOUBLE_EQ(signAgreement(a, b, {"valence"}, {"arousal"}, 0.15), 0.0);
}

TEST(CandidateMetricsTest, NeutralSignsAgree) {
  AxisMap a = {{"valence", 0.10}};
  AxisMap b = {{"valence", -0.12}};
  std::set<std::string> active = {"valence"};
  EXPECT_DOUBLE_EQ(signAgreement(a, b, active, active, 0.15), 1.0);
}

TEST(CandidateMetricsTest, CosineTreatsMissingAxesAsZero) {
  EXPECT_NEAR(weightCosineSimilarity({{"x", 1.0}}, {{"x", 1.0}, {"y", 1.0}}), 1.0 / std::sqrt(2.0),
              1e-12);
  EXPECT_NEAR(weightCosineSimilarity({{"x", 2.0}}, {{"x", 0.5}}), 1.0, 1e-12);
  EXPECT_NEAR(weightCosineSimilarity({{"x", 1.0}}, {{"y", 1.0}}), 0.0, 1e-12);
  EXPECT_NEAR(weightCosineSimilarity({{"x", 1.0}}, {{"x", -1.0}}), -1.0, 1e-12);
  EXPECT_DOUBLE_EQ(weightCosineSimilarity({{"x", 0.0}}, {{"x", 1.0}}), 0.0);
}

// ---------------------------------------------------------------------------
// Filter
// ---------------------------------------------------------------------------

TEST(CandidatePairFilterTest, CountsRejectionsByFirstFailedReason) {
  OverlapConfig config;
  CandidatePairFilter filter(config);
  CandidateFilterResult result = filter.filter({
      makePrototype("joy", {{"valence", 1.0}, {"arousal", 0.5}}),
      makePrototype("elation", {{"valence", 0.9}, {"arousal", 0.6}}),
      makePrototype("dread", {{"threat", 1.0}}),
      makePrototype("blank", {}),
      makePrototype("sadness", {{"valence", -1.0}, {"arousal", -0.5}}),
  });

  const CandidateFilterStats& stats = result.stats;
  EXPECT_EQ(stats.total_prototypes, 5u);
  EXPECT_EQ(stats.skipped_no_weights, 1u);
  EXPECT_EQ(stats.pairs_evaluated, 6u);
  EXPECT_EQ(stats.passed, 1u);
  EXPECT_EQ(stats.rejected_active_axis_overlap, 3u);
  EXPECT_EQ(stats.rejected_sign_agreement, 2u);
  EXPECT_EQ(stats.rejected_cosine_similarity, 0u);

  ASSERT_EQ(result.candidates.size(), 1u);
  const CandidatePair& pair = result.candidates[0];
  EXPECT_EQ(pair.index_a, 0u);
  EXPECT_EQ(pair.index_b, 1u);
  EXPECT_EQ(pair.prototype_a_id, "joy");
  EXPECT_EQ(pair.prototype_b_id, "elation");
  EXPECT_DOUBLE_EQ(pair.metrics.active_axis_overlap, 1.0);
  EXPECT_DOUBLE_EQ(pair.metrics.sign_agreement, 1.0);
  EXPECT_GT(pair.metrics.weight_cosine_similarity, 0.99);
}

TEST(CandidatePairFilterTest, CosineRejection) {
  OverlapConfig config;
  CandidatePairFilter filter(config);
  CandidateFilterResult result = filter.filter({
      makePrototype("a", {{"valence", 1.0}, {"arousal", 0.2}}),
      makePrototype("b", {{"valence", 0.2}, {"arousal", 1.0}}),
  });
  EXPECT_TRUE(result.candidates.empty());
  EXPECT_EQ(result.stats.rejected_cosine_similarity, 1u);
}

TEST(CandidatePairFilterTest, CapKeepsEnumerationOrder) {
  OverlapConfig config;
  config.max_candidate_pairs = 2;
  CandidatePairFilter filter(config);
  CandidateFilterResult result = filter.filter({
      makePrototype("a", {{"valence", 1.0}}),
      makePrototype("b", {{"valence", 1.0}}),
      makePrototype("c", {{"valence", 1.0}}),
  });
  EXPECT_EQ(result.stats.passed, 3u);
  EXPECT_EQ(result.stats.dropped_by_cap, 1u);
  ASSERT_EQ(result.candidates.size(), 2u);
  EXPECT_EQ(result.candidates[0].prototype_b_id, "b");
  EXPECT_EQ(result.candidates[1].prototype_b_id, "c");
  EXPECT_EQ(result.candidates[1].prototype_a_id, "a");
}

TEST(CandidatePairFilterTest, FamilyRestriction) {
  OverlapConfig config;
  config.prototype_family = "sexual";
  CandidatePairFilter filter(config);
  CandidateFilterResult result = filter.filter({
      makePrototype("joy", {{"valence", 1.0}}),
      makePrototype("lust", {{"sexual_arousal", 1.0}}, {}, PrototypeType::Sexual),
      makePrototype("desire", {{"sexual_arousal", 0.9}}, {}, PrototypeType::Sexual),
  });
  EXPECT_EQ(result.stats.skipped_family, 1u);
  EXPECT_EQ(result.stats.pairs_evaluated, 1u);
  ASSERT_EQ(result.candidates.size(), 1u);
  EXPECT_EQ(result.candidates[0].index_a, 1u);
  EXPECT_EQ(result.candidates[0].index_b, 2u);
}

TEST(CandidatePairFilterTest, FewerThanTwoPrototypes) {
  OverlapConfig config;
  CandidatePairFilter filter(config);
  CandidateFilterResult result = filter.filter({makePrototype("joy", {{"valence", 1.0}})});
  EXPECT_TRUE(result.candidates.empty());
  EXPECT_EQ(result.stats.pairs_evaluated, 0u);
}

}  // namespace
}  // namespace affect
