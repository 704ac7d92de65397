// Evaluation context construction and path resolution.

#include "sampling/evaluation_context.h"

namespace affect {

namespace {

bool lookup(const AxisMap& values, const std::string& key, double& out) {
  auto iter = values.find(key);
  if (iter == values.end()) return false;
  out = iter->second;
  return true;
}

}  // namespace

EvaluationContext::EvaluationContext(const AffectContext& affect,
                                     const IEmotionCalculator& calculator)
    : affect_(affect) {
  emotions_ = calculator.calculateEmotions(affect.current);
  sexual_arousal_ = calculator.calculateSexualArousal(affect.current);
  sexual_states_ = calculator.calculateSexualStates(affect.current, sexual_arousal_);

  if (affect.previous) {
    has_previous_outputs_ = true;
    previous_emotions_ = calculator.calculateEmotions(*affect.previous);
    previous_sexual_arousal_ = calculator.calculateSexualArousal(*affect.previous);
    previous_sexual_states_ =
        calculator.calculateSexualStates(*affect.previous, previous_sexual_arousal_);
  }
}

void EvaluationContext::setPreviousEmotion(const std::string& id, double value) {
  has_previous_outputs_ = true;
  previous_emotions_[id] = value;
}

bool EvaluationContext::resolve(const std::string& path, double& out) const {
  if (path == "sexualArousal") {
    out = sexual_arousal_;
    return true;
  }
  if (path == "previousSexualArousal") {
    if (!has_previous_outputs_) return false;
    out = previous_sexual_arousal_;
    return true;
  }

  size_t dot = path.find('.');
  if (dot == std::string::npos) return false;
  std::string scope = path.substr(0, dot);
  std::string key = path.substr(dot + 1);

  const AffectState& current = affect_.current;
  if (scope == "moodAxes" || scope == "mood") return lookup(current.mood, key, out);
  if (scope == "sexualAxes") return lookup(current.sexual, key, out);
  if (scope == "affectTraits") {
    if (lookup(current.traits, key, out)) return true;
    for (const auto& trait : affectTraitNames()) {
      if (trait == key) {
        out = kTraitDefault;
        return true;
      }
    }
    return false;
  }
  if (scope == "emotions") return lookup(emotions_, key, out);
  if (scope == "sexualStates") return lookup(sexual_states_, key, out);

  if (scope == "previousMoodAxes") {
    return affect_.previous && lookup(affect_.previous->mood, key, out);
  }
  if (scope == "previousEmotions") return lookup(previous_emotions_, key, out);
  if (scope == "previousSexualStates") return lookup(previous_sexual_states_, key, out);
  return false;
}

}  // namespace affect
