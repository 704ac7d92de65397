// Reference emotion calculator scoring registry prototypes directly.

#ifndef AFFECT_SCORING_PROTOTYPE_EMOTION_CALCULATOR_H
#define AFFECT_SCORING_PROTOTYPE_EMOTION_CALCULATOR_H

#include <vector>

#include "gate/gate_checker.h"
#include "scoring/i_emotion_calculator.h"

namespace affect {

/// @brief IEmotionCalculator that reports each prototype's gated intensity.
///
/// An output is clamp01(intensity) when all gates pass, else 0. Emotion
/// prototypes feed calculateEmotions, sexual prototypes feed
/// calculateSexualStates.
class PrototypeEmotionCalculator : public IEmotionCalculator {
 public:
  /// @param prototypes Prototypes of both families; copied and pre-parsed.
  explicit PrototypeEmotionCalculator(const std::vector<Prototype>& prototypes);

  AxisMap calculateEmotions(const AffectState& state) const override;
  double calculateSexualArousal(const AffectState& state) const override;
  AxisMap calculateSexualStates(const AffectState& state,
                                double sexual_arousal) const override;

 private:
  struct Entry {
    Prototype prototype;
    ParsedGateSet gates;
  };

  AxisMap score(const std::vector<Entry>& entries, const NormalizedAxes& axes) const;

  std::vector<Entry> emotions_;
  std::vector<Entry> sexual_states_;
};

}  // namespace affect

#endif  // AFFECT_SCORING_PROTOTYPE_EMOTION_CALCULATOR_H
