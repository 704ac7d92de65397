// Tests for core/axis_normalizer.h -- raw to normalized axis conversion.

#include "core/axis_normalizer.h"

#include <gtest/gtest.h>

namespace affect {
namespace {

// ---------------------------------------------------------------------------
// Scalar normalization
// ---------------------------------------------------------------------------

TEST(AxisNormalizerTest, MoodDividesAndClamps) {
  EXPECT_DOUBLE_EQ(normalizeMoodValue(50.0), 0.5);
  EXPECT_DOUBLE_EQ(normalizeMoodValue(-100.0), -1.0);
  EXPECT_DOUBLE_EQ(normalizeMoodValue(250.0), 1.0);
  EXPECT_DOUBLE_EQ(normalizeMoodValue(-250.0), -1.0);
}

TEST(AxisNormalizerTest, UnitValueClampsToZeroOne) {
  EXPECT_DOUBLE_EQ(normalizeUnitValue(35.0), 0.35);
  EXPECT_DOUBLE_EQ(normalizeUnitValue(-10.0), 0.0);
  EXPECT_DOUBLE_EQ(normalizeUnitValue(140.0), 1.0);
}

TEST(AxisNormalizerTest, SexualArousalFormula) {
  EXPECT_DOUBLE_EQ(computeSexualArousal(60.0, 20.0, 10.0), 0.5);
  EXPECT_DOUBLE_EQ(computeSexualArousal(10.0, 80.0, 0.0), 0.0);
  EXPECT_DOUBLE_EQ(computeSexualArousal(100.0, 0.0, 50.0), 1.0);
}

// ---------------------------------------------------------------------------
// State normalization
// ---------------------------------------------------------------------------

TEST(AxisNormalizerTest, MissingAxesTakeDefaults) {
  AffectState state;
  NormalizedAxes axes = normalizeState(state);
  EXPECT_EQ(axes.mood.size(), moodAxisNames().size());
  EXPECT_DOUBLE_EQ(axes.mood.at("valence"), 0.0);
  EXPECT_DOUBLE_EQ(axes.traits.at("harm_aversion"), 0.5);
  EXPECT_DOUBLE_EQ(axes.sexual.at("sexual_arousal"), 0.0);
}

TEST(AxisNormalizerTest, NormalizesEveryFamily) {
  AffectState state;
  state.mood["valence"] = 40.0;
  state.mood["threat"] = -80.0;
  state.sexual["sex_excitation"] = 70.0;
  state.sexual["sex_inhibition"] = 30.0;
  state.sexual["baseline_libido"] = -10.0;
  state.traits["affective_empathy"] = 90.0;

  NormalizedAxes axes = normalizeState(state);
  EXPECT_DOUBLE_EQ(axes.mood.at("valence"), 0.4);
  EXPECT_DOUBLE_EQ(axes.mood.at("threat"), -0.8);
  EXPECT_DOUBLE_EQ(axes.sexual.at("sex_excitation"), 0.7);
  EXPECT_DOUBLE_EQ(axes.sexual.at("sex_inhibition"), 0.3);
  EXPECT_NEAR(axes.sexual.at("sexual_arousal"), 0.3, 1e-12);
  EXPECT_DOUBLE_EQ(axes.traits.at("affective_empathy"), 0.9);
}

TEST(AxisNormalizerTest, ExtraMoodAxesAreKept) {
  AffectState state;
  state.mood["custom_axis"] = 20.0;
  EXPECT_DOUBLE_EQ(normalizeState(state).mood.at("custom_axis"), 0.2);
}

// ---------------------------------------------------------------------------
// Resolution
// ---------------------------------------------------------------------------

TEST(AxisNormalizerTest, ResolveAxisOrderAndAlias) {
  NormalizedAxes axes;
  axes.mood["valence"] = -0.3;
  axes.sexual["sexual_arousal"] = 0.6;
  axes.traits["harm_aversion"] = 0.8;
  axes.mood["harm_aversion"] = -1.0;

  EXPECT_DOUBLE_EQ(resolveAxis(axes, "valence"), -0.3);
  EXPECT_DOUBLE_EQ(resolveAxis(axes, "SA"), 0.6);
  EXPECT_DOUBLE_EQ(resolveAxis(axes, "sexual_arousal"), 0.6);
  EXPECT_DOUBLE_EQ(resolveAxis(axes, "harm_aversion"), 0.8);
  EXPECT_DOUBLE_EQ(resolveAxis(axes, "nonexistent"), 0.0);
}

TEST(AxisNormalizerTest, KnownAxes) {
  EXPECT_TRUE(isKnownAxis("valence"));
  EXPECT_TRUE(isKnownAxis("baseline_libido"));
  EXPECT_TRUE(isKnownAxis("SA"));
  EXPECT_TRUE(isKnownAxis("cognitive_empathy"));
  EXPECT_FALSE(isKnownAxis("joy"));
}

}  // namespace
}  // namespace affect
