// Axis normalization implementation.

#include "core/axis_normalizer.h"

#include <algorithm>

namespace affect {

namespace {

double valueOr(const AxisMap& values, const std::string& name, double fallback) {
  auto iter = values.find(name);
  return iter != values.end() ? iter->second : fallback;
}

}  // namespace

double normalizeMoodValue(double raw) {
  return std::clamp(raw / 100.0, -1.0, 1.0);
}

double normalizeUnitValue(double raw) {
  return std::clamp(raw / 100.0, 0.0, 1.0);
}

double computeSexualArousal(double excitation, double inhibition, double baseline) {
  return std::clamp((excitation - inhibition + baseline) / 100.0, 0.0, 1.0);
}

NormalizedAxes normalizeState(const AffectState& state) {
  NormalizedAxes out;
  for (const auto& name : moodAxisNames()) {
    out.mood[name] = normalizeMoodValue(valueOr(state.mood, name, 0.0));
  }
  // Extra mood axes carried by the context are kept as well.
  for (const auto& entry : state.mood) {
    if (out.mood.find(entry.first) == out.mood.end()) {
      out.mood[entry.first] = normalizeMoodValue(entry.second);
    }
  }

  double excitation = valueOr(state.sexual, axis::kSexExcitation, 0.0);
  double inhibition = valueOr(state.sexual, axis::kSexInhibition, 0.0);
  double baseline = valueOr(state.sexual, axis::kBaselineLibido, 0.0);
  out.sexual[axis::kSexExcitation] = normalizeUnitValue(excitation);
  out.sexual[axis::kSexInhibition] = normalizeUnitValue(inhibition);
  out.sexual[axis::kSexualArousal] = computeSexualArousal(excitation, inhibition, baseline);

  for (const auto& name : affectTraitNames()) {
    out.traits[name] = normalizeUnitValue(valueOr(state.traits, name, kTraitDefault));
  }
  return out;
}

double resolveAxis(const NormalizedAxes& axes, const std::string& name) {
  const std::string& resolved =
      name == axis::kSexualArousalAlias ? std::string(axis::kSexualArousal) : name;

  auto trait = axes.traits.find(resolved);
  if (trait != axes.traits.end()) return trait->second;

  auto sexual = axes.sexual.find(resolved);
  if (sexual != axes.sexual.end()) return sexual->second;

  auto mood = axes.mood.find(resolved);
  if (mood != axes.mood.end()) return mood->second;
  return 0.0;
}

bool isKnownAxis(const std::string& name) {
  if (name == axis::kSexualArousal || name == axis::kSexualArousalAlias) return true;
  AxisRange range;
  return rawAxisRange(name, range);
}

}  // namespace affect
