// Pure abstract interface for the emotion-calculation collaborator.
// Concrete implementation: PrototypeEmotionCalculator (reference).

#ifndef AFFECT_SCORING_I_EMOTION_CALCULATOR_H
#define AFFECT_SCORING_I_EMOTION_CALCULATOR_H

#include "core/basic_types.h"

namespace affect {

/// @brief Turns a raw affect state into emotion and sexual-state outputs.
///
/// The diagnostics core only consumes these outputs; the formula behind
/// them belongs to the implementation.
class IEmotionCalculator {
 public:
  virtual ~IEmotionCalculator() = default;

  /// @brief Emotion intensities for a state.
  /// @param state Raw affect state.
  /// @return Emotion id -> intensity in [0, 1].
  virtual AxisMap calculateEmotions(const AffectState& state) const = 0;

  /// @brief Derived sexual arousal in [0, 1].
  virtual double calculateSexualArousal(const AffectState& state) const = 0;

  /// @brief Sexual-state intensities for a state.
  /// @param state Raw affect state.
  /// @param sexual_arousal Value from calculateSexualArousal.
  /// @return Sexual-state id -> intensity in [0, 1].
  virtual AxisMap calculateSexualStates(const AffectState& state,
                                        double sexual_arousal) const = 0;
};

}  // namespace affect

#endif  // AFFECT_SCORING_I_EMOTION_CALCULATOR_H
