// Axis tables and type conversions.

#include "core/basic_types.h"

namespace affect {

const std::vector<std::string>& moodAxisNames() {
  static const std::vector<std::string> kNames = {
      "valence",    "arousal",           "agency_control",  "threat",
      "engagement", "future_expectancy", "self_evaluation", "affiliation"};
  return kNames;
}

const std::vector<std::string>& sexualAxisNames() {
  static const std::vector<std::string> kNames = {
      axis::kSexExcitation, axis::kSexInhibition, axis::kBaselineLibido};
  return kNames;
}

const std::vector<std::string>& affectTraitNames() {
  static const std::vector<std::string> kNames = {
      "affective_empathy", "cognitive_empathy", "harm_aversion"};
  return kNames;
}

bool rawAxisRange(const std::string& name, AxisRange& out) {
  for (const auto& trait : affectTraitNames()) {
    if (name == trait) {
      out = {kTraitMin, kTraitMax};
      return true;
    }
  }
  if (name == axis::kBaselineLibido) {
    out = {kLibidoMin, kLibidoMax};
    return true;
  }
  if (name == axis::kSexExcitation || name == axis::kSexInhibition) {
    out = {kSexualAxisMin, kSexualAxisMax};
    return true;
  }
  for (const auto& mood : moodAxisNames()) {
    if (name == mood) {
      out = {kMoodAxisMin, kMoodAxisMax};
      return true;
    }
  }
  return false;
}

const char* prototypeTypeToString(PrototypeType type) {
  switch (type) {
    case PrototypeType::Emotion: return "emotion";
    case PrototypeType::Sexual:  return "sexual";
  }
  return "unknown";
}

bool prototypeTypeFromString(const std::string& str, PrototypeType& out) {
  if (str == "emotion") {
    out = PrototypeType::Emotion;
    return true;
  }
  if (str == "sexual") {
    out = PrototypeType::Sexual;
    return true;
  }
  return false;
}

}  // namespace affect
