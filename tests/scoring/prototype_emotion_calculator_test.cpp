// Tests for scoring/prototype_emotion_calculator.h -- reference calculator.

#include "scoring/prototype_emotion_calculator.h"

#include <gtest/gtest.h>

#include <vector>

#include "test_helpers.h"

namespace affect {
namespace {

using test_helpers::makePrototype;

std::vector<Prototype> samplePrototypes() {
  return {makePrototype("joy", {{"valence", 1.0}}, {"valence >= 0.2"}),
          makePrototype("dread", {{"threat", 1.0}, {"valence", -1.0}}),
          makePrototype("desire", {{"sexual_arousal", 1.0}}, {"SA >= 0.1"},
                        PrototypeType::Sexual)};
}

TEST(PrototypeEmotionCalculatorTest, SplitsFamilies) {
  PrototypeEmotionCalculator calculator(samplePrototypes());
  AffectState state;
  AxisMap emotions = calculator.calculateEmotions(state);
  EXPECT_EQ(emotions.size(), 2u);
  EXPECT_EQ(emotions.count("desire"), 0u);

  AxisMap sexual = calculator.calculateSexualStates(state, 0.0);
  EXPECT_EQ(sexual.size(), 1u);
  EXPECT_EQ(sexual.count("desire"), 1u);
}

TEST(PrototypeEmotionCalculatorTest, GatedAndClampedIntensity) {
  PrototypeEmotionCalculator calculator(samplePrototypes());
  AffectState state;
  state.mood["valence"] = 10.0;
  state.mood["threat"] = 30.0;
  AxisMap emotions = calculator.calculateEmotions(state);
  EXPECT_DOUBLE_EQ(emotions.at("joy"), 0.0);  // gate fails
  EXPECT_NEAR(emotions.at("dread"), 0.1, 1e-12);

  state.mood["valence"] = 60.0;
  emotions = calculator.calculateEmotions(state);
  EXPECT_DOUBLE_EQ(emotions.at("joy"), 0.6);
  EXPECT_DOUBLE_EQ(emotions.at("dread"), 0.0);  // negative intensity clamps to 0
}

TEST(PrototypeEmotionCalculatorTest, SexualStatesUseSuppliedArousal) {
  PrototypeEmotionCalculator calculator(samplePrototypes());
  AffectState state;
  state.sexual["sex_excitation"] = 70.0;
  state.sexual["sex_inhibition"] = 20.0;
  double arousal = calculator.calculateSexualArousal(state);
  EXPECT_NEAR(arousal, 0.5, 1e-12);
  EXPECT_NEAR(calculator.calculateSexualStates(state, arousal).at("desire"), 0.5, 1e-12);
  EXPECT_DOUBLE_EQ(calculator.calculateSexualStates(state, 0.05).at("desire"), 0.0);
}

}  // namespace
}  // namespace affect
