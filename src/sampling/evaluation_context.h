// Evaluation context: raw state plus derived emotion outputs, resolvable by path.

#ifndef AFFECT_SAMPLING_EVALUATION_CONTEXT_H
#define AFFECT_SAMPLING_EVALUATION_CONTEXT_H

#include <string>

#include "core/basic_types.h"
#include "core/logic_expr.h"
#include "scoring/i_emotion_calculator.h"

namespace affect {

/// @brief Everything an expression can reference for one sampled context.
///
/// Variable paths:
///   moodAxes.<axis> (alias mood.<axis>), sexualAxes.<axis>,
///   affectTraits.<trait>, emotions.<id>, sexualStates.<id>, sexualArousal,
///   and previousMoodAxes.*, previousEmotions.*, previousSexualStates.*,
///   previousSexualArousal.
/// Mood, sexual and trait values are raw; emotion outputs are in [0, 1].
class EvaluationContext : public IVariableResolver {
 public:
  EvaluationContext() = default;

  /// @brief Build from a raw context using the emotion collaborator.
  EvaluationContext(const AffectContext& affect, const IEmotionCalculator& calculator);

  bool resolve(const std::string& path, double& out) const override;

  const AffectContext& affect() const { return affect_; }
  const AxisMap& emotions() const { return emotions_; }
  const AxisMap& sexualStates() const { return sexual_states_; }
  double sexualArousal() const { return sexual_arousal_; }

  /// @brief Direct setters for hand-built fixtures.
  void setEmotion(const std::string& id, double value) { emotions_[id] = value; }
  void setSexualState(const std::string& id, double value) { sexual_states_[id] = value; }
  void setSexualArousal(double value) { sexual_arousal_ = value; }
  void setPreviousEmotion(const std::string& id, double value);
  void setMood(const std::string& axis_name, double value) {
    affect_.current.mood[axis_name] = value;
  }

 private:
  AffectContext affect_;
  AxisMap emotions_;
  AxisMap sexual_states_;
  double sexual_arousal_ = 0.0;
  bool has_previous_outputs_ = false;
  AxisMap previous_emotions_;
  AxisMap previous_sexual_states_;
  double previous_sexual_arousal_ = 0.0;
};

}  // namespace affect

#endif  // AFFECT_SAMPLING_EVALUATION_CONTEXT_H
