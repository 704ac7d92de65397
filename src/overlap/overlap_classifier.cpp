// Overlap classifier implementation.

#include "overlap/overlap_classifier.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

#include "core/diag_log.h"

namespace affect {

const char* overlapTypeToString(OverlapType type) {
  switch (type) {
    case OverlapType::MergeRecommended:    return "merge_recommended";
    case OverlapType::SubsumedRecommended: return "subsumed_recommended";
    case OverlapType::ConvertToExpression: return "convert_to_expression";
    case OverlapType::NestedSiblings:      return "nested_siblings";
    case OverlapType::NeedsSeparation:     return "needs_separation";
    case OverlapType::KeepDistinct:        return "keep_distinct";
  }
  return "unknown";
}

const char* pairSideToString(PairSide side) {
  switch (side) {
    case PairSide::None: return "none";
    case PairSide::A:    return "a";
    case PairSide::B:    return "b";
  }
  return "unknown";
}

bool ClassificationResult::has(OverlapType type) const {
  for (const auto& entry : entries) {
    if (entry.type == type) return true;
  }
  return false;
}

double gateOverlapRatio(const GateOverlapStats& stats) {
  if (!(stats.on_either_rate > 0.0)) return 0.0;
  return stats.on_both_rate / stats.on_either_rate;
}

double clampConfidence(double value) {
  if (std::isnan(value)) return 0.0;
  return std::max(0.0, std::min(1.0, value));
}

namespace {

/// @brief "name=0.1234", or "name=NaN" for missing metrics.
std::string metric(const char* name, double value) {
  char buf[64];
  if (std::isnan(value)) {
    std::snprintf(buf, sizeof(buf), "%s=NaN", name);
  } else {
    std::snprintf(buf, sizeof(buf), "%s=%.4f", name, value);
  }
  return buf;
}

bool atLeast(double value, double threshold) {
  return !std::isnan(value) && value >= threshold;
}

}  // namespace

OverlapClassifier::Nesting OverlapClassifier::detectNesting(
    const BehavioralMetrics& behavior) const {
  Nesting nesting;
  const bool parse_complete =
      behavior.gate_parse_info_a.parse_status == GateParseStatus::Complete &&
      behavior.gate_parse_info_b.parse_status == GateParseStatus::Complete;
  if (parse_complete && behavior.gate_implication && !behavior.gate_implication->is_vacuous &&
      behavior.gate_implication->a_implies_b != behavior.gate_implication->b_implies_a) {
    nesting.deterministic = true;
    nesting.deterministic_side = behavior.gate_implication->a_implies_b ? PairSide::A : PairSide::B;
  }

  const double threshold = config_.nested_conditional_threshold;
  const double p_a_given_b = behavior.pass_rates.p_a_given_b;
  const double p_b_given_a = behavior.pass_rates.p_b_given_a;
  if (std::isnan(p_a_given_b) || std::isnan(p_b_given_a)) return nesting;

  // B almost always fires when A does: A is the narrower prototype.
  if (p_b_given_a >= threshold && p_a_given_b < threshold) {
    nesting.behavioral = true;
    nesting.behavioral_side = PairSide::A;
  } else if (p_a_given_b >= threshold && p_b_given_a < threshold) {
    nesting.behavioral = true;
    nesting.behavioral_side = PairSide::B;
  }
  return nesting;
}

bool OverlapClassifier::checkMerge(const BehavioralMetrics& behavior,
                                   OverlapClassification& out) const {
  const IntensityStats& intensity = behavior.intensity;
  const double ratio = gateOverlapRatio(behavior.gate_overlap);
  if (behavior.gate_overlap.on_either_rate < config_.min_on_either_rate_for_merge) return false;
  if (ratio < config_.min_gate_overlap_ratio) return false;
  if (!atLeast(intensity.pearson_correlation, config_.min_correlation_for_merge)) return false;
  if (std::isnan(intensity.mean_abs_diff) ||
      intensity.mean_abs_diff > config_.max_mean_abs_diff_for_merge) {
    return false;
  }
  if (intensity.dominance_p >= config_.min_dominance_for_subsumption ||
      intensity.dominance_q >= config_.min_dominance_for_subsumption) {
    return false;
  }

  out.type = OverlapType::MergeRecommended;
  out.confidence = std::min(ratio, intensity.pearson_correlation);
  out.evidence = metric("gateOverlapRatio", ratio) + ", " +
                 metric("pearson", intensity.pearson_correlation) + ", " +
                 metric("meanAbsDiff", intensity.mean_abs_diff);
  return true;
}

bool OverlapClassifier::checkSubsumed(const BehavioralMetrics& behavior,
                                      OverlapClassification& out) const {
  const IntensityStats& intensity = behavior.intensity;
  const GateOverlapStats& gates = behavior.gate_overlap;
  if (!atLeast(intensity.pearson_correlation, config_.min_correlation_for_subsumption)) {
    return false;
  }

  double dominance = 0.0;
  double exclusive = 0.0;
  if (gates.p_only_rate <= config_.max_exclusive_rate_for_subsumption &&
      intensity.dominance_q >= config_.min_dominance_for_subsumption) {
    out.side = PairSide::A;
    dominance = intensity.dominance_q;
    exclusive = gates.p_only_rate;
  } else if (gates.q_only_rate <= config_.max_exclusive_rate_for_subsumption &&
             intensity.dominance_p >= config_.min_dominance_for_subsumption) {
    out.side = PairSide::B;
    dominance = intensity.dominance_p;
    exclusive = gates.q_only_rate;
  } else {
    return false;
  }

  out.type = OverlapType::SubsumedRecommended;
  out.confidence = std::min(intensity.pearson_correlation, dominance);
  out.evidence = std::string("subsumed=") + pairSideToString(out.side) + ", " +
                 metric("exclusiveRate", exclusive) + ", " + metric("dominance", dominance) +
                 ", " + metric("pearson", intensity.pearson_correlation);
  return true;
}

bool OverlapClassifier::checkConvertToExpression(const BehavioralMetrics& behavior,
                                                 const Nesting& nesting,
                                                 OverlapClassification& out) const {
  if (!config_.enable_convert_to_expression || !nesting.deterministic) return false;

  // The narrower side's conditional rate must corroborate the proof.
  const PassRates& rates = behavior.pass_rates;
  double conditional =
      nesting.deterministic_side == PairSide::A ? rates.p_b_given_a : rates.p_a_given_b;
  if (!atLeast(conditional, config_.nested_conditional_threshold)) return false;

  out.type = OverlapType::ConvertToExpression;
  out.side = nesting.deterministic_side;
  out.confidence = conditional;
  out.evidence = std::string("narrower=") + pairSideToString(out.side) + ", relation=" +
                 implicationRelationToString(behavior.gate_implication->relation) + ", " +
                 metric("conditional", conditional);
  return true;
}

bool OverlapClassifier::checkNestedSiblings(const BehavioralMetrics& behavior,
                                            const Nesting& nesting,
                                            OverlapClassification& out) const {
  if (!nesting.deterministic && !nesting.behavioral) return false;

  const PassRates& rates = behavior.pass_rates;
  out.type = OverlapType::NestedSiblings;
  out.deterministic = nesting.deterministic;
  out.side = nesting.deterministic ? nesting.deterministic_side : nesting.behavioral_side;
  if (nesting.deterministic) {
    out.confidence = 1.0;
  } else {
    out.confidence = out.side == PairSide::A ? rates.p_b_given_a : rates.p_a_given_b;
  }
  out.evidence = std::string("narrower=") + pairSideToString(out.side) +
                 (nesting.deterministic ? ", gate implication" : ", behavioral") + ", " +
                 metric("pA_given_B", rates.p_a_given_b) + ", " +
                 metric("pB_given_A", rates.p_b_given_a);
  return true;
}

bool OverlapClassifier::checkNeedsSeparation(const BehavioralMetrics& behavior,
                                             OverlapClassification& out) const {
  const IntensityStats& intensity = behavior.intensity;
  const double ratio = gateOverlapRatio(behavior.gate_overlap);
  if (ratio < config_.separation_min_gate_overlap_ratio) return false;

  const double threshold = config_.nested_conditional_threshold;
  const double p_a_given_b = behavior.pass_rates.p_a_given_b;
  const double p_b_given_a = behavior.pass_rates.p_b_given_a;
  if (!std::isnan(p_a_given_b) && !std::isnan(p_b_given_a) &&
      (p_a_given_b >= threshold || p_b_given_a >= threshold)) {
    return false;
  }
  if (!atLeast(intensity.pearson_correlation, config_.separation_min_correlation)) return false;
  if (std::isnan(intensity.mean_abs_diff) ||
      intensity.mean_abs_diff <= config_.max_mean_abs_diff_for_merge) {
    return false;
  }

  out.type = OverlapType::NeedsSeparation;
  out.confidence = ratio * intensity.pearson_correlation;
  out.evidence = metric("gateOverlapRatio", ratio) + ", " +
                 metric("pearson", intensity.pearson_correlation) + ", " +
                 metric("meanAbsDiff", intensity.mean_abs_diff);
  return true;
}

ClassificationResult OverlapClassifier::classify(const CandidateMetrics& candidate,
                                                 const BehavioralMetrics& behavior) const {
  ClassificationResult result;
  const Nesting nesting = detectNesting(behavior);

  OverlapClassification entry;
  if (checkMerge(behavior, entry)) result.entries.push_back(entry);
  entry = OverlapClassification();
  if (checkSubsumed(behavior, entry)) result.entries.push_back(entry);
  entry = OverlapClassification();
  if (checkConvertToExpression(behavior, nesting, entry)) result.entries.push_back(entry);
  entry = OverlapClassification();
  if (checkNestedSiblings(behavior, nesting, entry)) result.entries.push_back(entry);
  entry = OverlapClassification();
  if (checkNeedsSeparation(behavior, entry)) result.entries.push_back(entry);

  if (result.entries.empty()) {
    const double ratio = gateOverlapRatio(behavior.gate_overlap);
    entry = OverlapClassification();
    entry.type = OverlapType::KeepDistinct;
    entry.confidence = 1.0 - ratio;
    entry.evidence = metric("gateOverlapRatio", ratio) + ", " +
                     metric("pearson", behavior.intensity.pearson_correlation) + ", " +
                     metric("weightCosine", candidate.weight_cosine_similarity);
    result.entries.push_back(entry);
  }

  for (auto& item : result.entries) {
    item.confidence = clampConfidence(item.confidence);
  }
  result.entries.front().is_primary = true;

  logDebug(config_.verbose, "OverlapClassifier", "primary %s (%zu matching) %s",
           overlapTypeToString(result.primary().type), result.entries.size(),
           result.primary().evidence.c_str());
  return result;
}

NearMissResult OverlapClassifier::checkNearMiss(const CandidateMetrics& candidate,
                                                const BehavioralMetrics& behavior) const {
  NearMissResult result;
  if (behavior.gate_overlap.on_either_rate < config_.min_on_either_rate_for_merge) return result;

  const double ratio = gateOverlapRatio(behavior.gate_overlap);
  const double pearson = behavior.intensity.pearson_correlation;
  const double mad = behavior.intensity.mean_abs_diff;
  char buf[128];

  std::string reason;
  auto append = [&reason](const char* text) {
    if (!reason.empty()) reason += "; ";
    reason += text;
  };

  if (atLeast(pearson, config_.near_miss_correlation_threshold) &&
      pearson < config_.min_correlation_for_merge) {
    std::snprintf(buf, sizeof(buf), "correlation %.3f (threshold: %g)", pearson,
                  config_.min_correlation_for_merge);
    append(buf);
  }
  if (ratio >= config_.near_miss_gate_overlap_ratio && ratio < config_.min_gate_overlap_ratio) {
    std::snprintf(buf, sizeof(buf), "gate overlap %.3f (threshold: %g)", ratio,
                  config_.min_gate_overlap_ratio);
    append(buf);
  }
  // Correlation and overlap are fine but intensities still differ.
  if (reason.empty() && atLeast(pearson, config_.near_miss_correlation_threshold) &&
      ratio >= config_.near_miss_gate_overlap_ratio &&
      (std::isnan(mad) || mad > config_.max_mean_abs_diff_for_merge)) {
    if (std::isnan(mad)) {
      std::snprintf(buf, sizeof(buf), "mean abs diff NaN (threshold: %g)",
                    config_.max_mean_abs_diff_for_merge);
    } else {
      std::snprintf(buf, sizeof(buf), "mean abs diff %.3f (threshold: %g)", mad,
                    config_.max_mean_abs_diff_for_merge);
    }
    append(buf);
  }

  if (reason.empty()) return result;
  result.is_near_miss = true;
  result.reason = reason;
  logDebug(config_.verbose, "OverlapClassifier", "near miss (cosine %.3f): %s",
           candidate.weight_cosine_similarity, reason.c_str());
  return result;
}

}  // namespace affect
