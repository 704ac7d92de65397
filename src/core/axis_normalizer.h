// Axis normalization from raw authoring units into scoring units.

#ifndef AFFECT_CORE_AXIS_NORMALIZER_H
#define AFFECT_CORE_AXIS_NORMALIZER_H

#include <string>

#include "core/basic_types.h"

namespace affect {

/// @brief One affect state in normalized units.
///
/// mood in [-1, 1]; traits, sex_excitation, sex_inhibition and
/// sexual_arousal in [0, 1]. Every known axis is present.
struct NormalizedAxes {
  AxisMap mood;
  AxisMap sexual;
  AxisMap traits;
};

/// @brief Normalize a raw mood value: divide by 100, clamp to [-1, 1].
double normalizeMoodValue(double raw);

/// @brief Normalize a raw [0, 100] value: divide by 100, clamp to [0, 1].
double normalizeUnitValue(double raw);

/// @brief Derived sexual arousal from raw sexual axes.
/// @param excitation Raw sex_excitation [0, 100].
/// @param inhibition Raw sex_inhibition [0, 100].
/// @param baseline Raw baseline_libido [-50, 50].
/// @return clamp01((excitation - inhibition + baseline) / 100).
double computeSexualArousal(double excitation, double inhibition, double baseline);

/// @brief Normalize a full raw state.
///
/// Missing mood and sexual axes become 0; missing traits take the default
/// of 50 (0.5 normalized).
NormalizedAxes normalizeState(const AffectState& state);

/// @brief Resolve an axis name against normalized values.
///
/// Resolution order: traits, then sexual (including "sexual_arousal" and its
/// alias "SA"), then mood. Unknown axes resolve to 0.
///
/// @param axes Normalized axes.
/// @param name Axis name.
/// @return Normalized value.
double resolveAxis(const NormalizedAxes& axes, const std::string& name);

/// @brief True if the name refers to a known axis of any family.
bool isKnownAxis(const std::string& name);

}  // namespace affect

#endif  // AFFECT_CORE_AXIS_NORMALIZER_H
