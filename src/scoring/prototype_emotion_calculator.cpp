// Reference emotion calculator implementation.

#include "scoring/prototype_emotion_calculator.h"

#include <algorithm>
#include <utility>

#include "scoring/intensity_calculator.h"

namespace affect {

PrototypeEmotionCalculator::PrototypeEmotionCalculator(
    const std::vector<Prototype>& prototypes) {
  for (const auto& proto : prototypes) {
    Entry entry{proto, parseGates(proto.gates, proto.id)};
    if (proto.type == PrototypeType::Sexual) {
      sexual_states_.push_back(std::move(entry));
    } else {
      emotions_.push_back(std::move(entry));
    }
  }
}

AxisMap PrototypeEmotionCalculator::score(const std::vector<Entry>& entries,
                                          const NormalizedAxes& axes) const {
  AxisMap out;
  for (const auto& entry : entries) {
    double intensity = 0.0;
    if (checkAllGatesPassNormalized(entry.gates.gates, axes)) {
      intensity = std::clamp(computeIntensityNormalized(entry.prototype.weights, axes),
                             0.0, 1.0);
    }
    out[entry.prototype.id] = intensity;
  }
  return out;
}

AxisMap PrototypeEmotionCalculator::calculateEmotions(const AffectState& state) const {
  return score(emotions_, normalizeState(state));
}

double PrototypeEmotionCalculator::calculateSexualArousal(const AffectState& state) const {
  return normalizeState(state).sexual.at(axis::kSexualArousal);
}

AxisMap PrototypeEmotionCalculator::calculateSexualStates(const AffectState& state,
                                                          double sexual_arousal) const {
  NormalizedAxes axes = normalizeState(state);
  axes.sexual[axis::kSexualArousal] = std::clamp(sexual_arousal, 0.0, 1.0);
  return score(sexual_states_, axes);
}

}  // namespace affect
