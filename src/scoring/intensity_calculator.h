// L1-normalized prototype intensity, distributions and composite scoring.

#ifndef AFFECT_SCORING_INTENSITY_CALCULATOR_H
#define AFFECT_SCORING_INTENSITY_CALCULATOR_H

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "core/axis_normalizer.h"
#include "core/basic_types.h"

namespace affect {

/// @brief Weighted score of normalized axes divided by the L1 norm of the weights.
///
/// intensity = sum(w[a] * x[a]) / sum(|w[a]|), 0 when all weights are zero.
/// Scaling every weight by k > 0 leaves the result unchanged.
///
/// @param weights Axis -> weight.
/// @param axes Normalized axis values.
/// @return Intensity in [-1, 1].
double computeIntensityNormalized(const std::map<std::string, double>& weights,
                                  const NormalizedAxes& axes);

/// @brief Intensity for a raw state (normalizes first).
double computeIntensity(const std::map<std::string, double>& weights,
                        const AffectState& state);

/// @brief Percentile summary of intensities over the gate-passing contexts.
struct IntensityDistribution {
  double min = 0.0;
  double max = 0.0;
  double p50 = 0.0;
  double p90 = 0.0;
  double p95 = 0.0;
  double p_above_threshold = 0.0;  ///< Fraction at or above the threshold.
  size_t sample_count = 0;         ///< Gate-passing contexts scored.
};

/// @brief Nearest-rank percentile of an ascending-sorted list.
/// @param sorted Values in ascending order (may be empty).
/// @param fraction Percentile in [0, 1].
/// @return The value at rank ceil(fraction * n), or 0 for an empty list.
double percentileSorted(const std::vector<double>& sorted, double fraction);

/// @brief Distribution of a prototype's intensity over contexts.
///
/// Only contexts whose gates all pass are scored; the rest are skipped.
///
/// @param prototype Prototype with weights and gates.
/// @param contexts Context list (current state is scored).
/// @param threshold Cutoff for p_above_threshold (inclusive).
/// @return Distribution; all zeros when no context passes the gates.
IntensityDistribution computeDistribution(const Prototype& prototype,
                                          const std::vector<AffectContext>& contexts,
                                          double threshold);

/// @brief Sub-scores of a prototype's fit, each already in [0, 1].
struct CompositeScoreInputs {
  double gate_pass_rate = 0.0;
  double p_intensity_above = 0.0;
  double conflict_score = 0.0;           ///< Higher is worse; enters as (1 - x).
  double exclusion_compatibility = 0.0;
};

/// Weights of the composite fit score.
constexpr double kCompositeGatePassWeight = 0.30;
constexpr double kCompositeIntensityWeight = 0.35;
constexpr double kCompositeConflictWeight = 0.20;
constexpr double kCompositeExclusionWeight = 0.15;

/// @brief Weighted fit score 0.30/0.35/0.20/0.15.
///
/// Inputs are clamped to [0, 1]; non-finite inputs count as 0 (conflict as 1).
double computeCompositeScore(const CompositeScoreInputs& inputs);

}  // namespace affect

#endif  // AFFECT_SCORING_INTENSITY_CALCULATOR_H
