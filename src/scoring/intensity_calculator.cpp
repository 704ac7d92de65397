// Intensity calculator implementation.

#include "scoring/intensity_calculator.h"

#include <algorithm>
#include <cmath>

#include "gate/gate_checker.h"

namespace affect {

double computeIntensityNormalized(const std::map<std::string, double>& weights,
                                  const NormalizedAxes& axes) {
  double raw_sum = 0.0;
  double sum_abs_weights = 0.0;
  for (const auto& entry : weights) {
    raw_sum += entry.second * resolveAxis(axes, entry.first);
    sum_abs_weights += std::fabs(entry.second);
  }
  return sum_abs_weights > 0.0 ? raw_sum / sum_abs_weights : 0.0;
}

double computeIntensity(const std::map<std::string, double>& weights,
                        const AffectState& state) {
  return computeIntensityNormalized(weights, normalizeState(state));
}

double percentileSorted(const std::vector<double>& sorted, double fraction) {
  if (sorted.empty()) return 0.0;
  double clamped = std::clamp(fraction, 0.0, 1.0);
  auto rank = static_cast<size_t>(std::ceil(clamped * static_cast<double>(sorted.size())));
  if (rank == 0) rank = 1;
  return sorted[std::min(rank, sorted.size()) - 1];
}

IntensityDistribution computeDistribution(const Prototype& prototype,
                                          const std::vector<AffectContext>& contexts,
                                          double threshold) {
  IntensityDistribution dist;
  if (contexts.empty()) return dist;

  ParsedGateSet gates = parseGates(prototype.gates);
  std::vector<double> values;
  values.reserve(contexts.size());
  size_t above = 0;
  for (const auto& ctx : contexts) {
    NormalizedAxes axes = normalizeState(ctx.current);
    if (!checkAllGatesPassNormalized(gates.gates, axes)) continue;
    double intensity = computeIntensityNormalized(prototype.weights, axes);
    if (intensity >= threshold) ++above;
    values.push_back(intensity);
  }
  if (values.empty()) return dist;

  std::sort(values.begin(), values.end());
  dist.sample_count = values.size();
  dist.min = values.front();
  dist.max = values.back();
  dist.p50 = percentileSorted(values, 0.50);
  dist.p90 = percentileSorted(values, 0.90);
  dist.p95 = percentileSorted(values, 0.95);
  dist.p_above_threshold = static_cast<double>(above) / static_cast<double>(values.size());
  return dist;
}

namespace {

double clampUnit(double value, double fallback) {
  if (!std::isfinite(value)) return fallback;
  return std::clamp(value, 0.0, 1.0);
}

}  // namespace

double computeCompositeScore(const CompositeScoreInputs& inputs) {
  return kCompositeGatePassWeight * clampUnit(inputs.gate_pass_rate, 0.0) +
         kCompositeIntensityWeight * clampUnit(inputs.p_intensity_above, 0.0) +
         kCompositeConflictWeight * (1.0 - clampUnit(inputs.conflict_score, 1.0)) +
         kCompositeExclusionWeight * clampUnit(inputs.exclusion_compatibility, 0.0);
}

}  // namespace affect
