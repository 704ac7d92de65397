// Overlap config loading and validation.

#include "overlap/overlap_config.h"

#include <cmath>
#include <cstdio>

namespace affect {

namespace {

struct DoubleField {
  const char* key;
  double OverlapConfig::*member;
};

struct CountField {
  const char* key;
  size_t OverlapConfig::*member;
};

struct BoolField {
  const char* key;
  bool OverlapConfig::*member;
};

constexpr DoubleField kDoubleFields[] = {
    {"activeAxisEpsilon", &OverlapConfig::active_axis_epsilon},
    {"softSignThreshold", &OverlapConfig::soft_sign_threshold},
    {"jaccardEmptySetValue", &OverlapConfig::jaccard_empty_set_value},
    {"candidateMinActiveAxisOverlap", &OverlapConfig::candidate_min_active_axis_overlap},
    {"candidateMinSignAgreement", &OverlapConfig::candidate_min_sign_agreement},
    {"candidateMinCosineSimilarity", &OverlapConfig::candidate_min_cosine_similarity},
    {"dominanceDelta", &OverlapConfig::dominance_delta},
    {"intensityEps", &OverlapConfig::intensity_eps},
    {"minOnEitherRateForMerge", &OverlapConfig::min_on_either_rate_for_merge},
    {"minGateOverlapRatio", &OverlapConfig::min_gate_overlap_ratio},
    {"minCorrelationForMerge", &OverlapConfig::min_correlation_for_merge},
    {"maxMeanAbsDiffForMerge", &OverlapConfig::max_mean_abs_diff_for_merge},
    {"minCorrelationForSubsumption", &OverlapConfig::min_correlation_for_subsumption},
    {"maxExclusiveRateForSubsumption", &OverlapConfig::max_exclusive_rate_for_subsumption},
    {"minDominanceForSubsumption", &OverlapConfig::min_dominance_for_subsumption},
    {"nestedConditionalThreshold", &OverlapConfig::nested_conditional_threshold},
    {"separationMinGateOverlapRatio", &OverlapConfig::separation_min_gate_overlap_ratio},
    {"separationMinCorrelation", &OverlapConfig::separation_min_correlation},
    {"nearMissCorrelationThreshold", &OverlapConfig::near_miss_correlation_threshold},
    {"nearMissGateOverlapRatio", &OverlapConfig::near_miss_gate_overlap_ratio},
    {"compositeScoreGateOverlapWeight", &OverlapConfig::composite_gate_overlap_weight},
    {"compositeScoreGlobalDiffWeight", &OverlapConfig::composite_global_diff_weight},
    {"compositeScoreCorrelationWeight", &OverlapConfig::composite_correlation_weight},
};

constexpr CountField kCountFields[] = {
    {"maxCandidatePairs", &OverlapConfig::max_candidate_pairs},
    {"sampleCountPerPair", &OverlapConfig::sample_count_per_pair},
    {"divergenceExamplesK", &OverlapConfig::divergence_examples_k},
    {"minCoPassSamples", &OverlapConfig::min_co_pass_samples},
    {"minPassSamplesForConditional", &OverlapConfig::min_pass_samples_for_conditional},
    {"maxNearMissPairsToReport", &OverlapConfig::max_near_miss_pairs_to_report},
};

constexpr BoolField kBoolFields[] = {
    {"enableConvertToExpression", &OverlapConfig::enable_convert_to_expression},
    {"verbose", &OverlapConfig::verbose},
};

std::string formatNumber(double val) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%g", val);
  return buf;
}

bool isWholeNonNegative(double val) {
  return std::isfinite(val) && val >= 0.0 && std::floor(val) == val;
}

void checkRange(const char* name, double val, double lo, double hi,
                std::vector<std::string>& errors) {
  if (!std::isfinite(val) || val < lo || val > hi) {
    errors.push_back(std::string(name) + " must be in range [" + formatNumber(lo) + ", " +
                     formatNumber(hi) + "], got " + formatNumber(val));
  }
}

void checkPositive(const char* name, double val, std::vector<std::string>& errors) {
  if (!std::isfinite(val) || val <= 0.0) {
    errors.push_back(std::string(name) + " must be > 0, got " + formatNumber(val));
  }
}

void checkCount(const char* name, size_t val, std::vector<std::string>& errors) {
  if (val < 1) {
    errors.push_back(std::string(name) + " must be >= 1, got 0");
  }
}

void checkLess(const char* lesser, double lesser_val, const char* greater, double greater_val,
               std::vector<std::string>& errors) {
  if (!(lesser_val < greater_val)) {
    errors.push_back(std::string(lesser) + " must be less than " + greater + " (" +
                     formatNumber(lesser_val) + " >= " + formatNumber(greater_val) + ")");
  }
}

}  // namespace

OverlapConfigLoadResult applyOverlapConfigJson(const JsonValue& object, OverlapConfig& config) {
  OverlapConfigLoadResult result;
  if (!object.isObject()) {
    result.success = false;
    result.errors.push_back("configuration must be a JSON object");
    return result;
  }

  auto reject = [&result](const std::string& key, const char* expected) {
    result.success = false;
    result.errors.push_back(key + " must be " + expected);
  };

  for (const auto& member : object.object_val) {
    const std::string& key = member.first;
    const JsonValue& val = member.second;
    bool handled = false;

    for (const auto& field : kDoubleFields) {
      if (key != field.key) continue;
      handled = true;
      if (val.isNumber()) {
        config.*field.member = val.number_val;
      } else {
        reject(key, "a number");
      }
    }
    for (const auto& field : kCountFields) {
      if (key != field.key) continue;
      handled = true;
      if (val.isNumber() && isWholeNonNegative(val.number_val)) {
        config.*field.member = static_cast<size_t>(val.number_val);
      } else {
        reject(key, "a non-negative integer");
      }
    }
    for (const auto& field : kBoolFields) {
      if (key != field.key) continue;
      handled = true;
      if (val.isBool()) {
        config.*field.member = val.bool_val;
      } else {
        reject(key, "a boolean");
      }
    }
    if (handled) continue;

    if (key == "seed") {
      if (val.isNumber() && isWholeNonNegative(val.number_val) && val.number_val <= 4294967295.0) {
        config.seed = static_cast<uint32_t>(val.number_val);
      } else {
        reject(key, "a 32-bit unsigned integer");
      }
    } else if (key == "prototypeFamily") {
      if (val.isString() || val.isNull()) {
        config.prototype_family = val.asString();
      } else {
        reject(key, "a string");
      }
    } else if (key == "highThresholds") {
      bool all_numbers = val.isArray();
      if (all_numbers) {
        for (const auto& item : val.array_val) {
          if (!item.isNumber()) all_numbers = false;
        }
      }
      if (all_numbers) {
        config.high_thresholds.clear();
        for (const auto& item : val.array_val) {
          config.high_thresholds.push_back(item.number_val);
        }
      } else {
        reject(key, "an array of numbers");
      }
    }
  }
  return result;
}

OverlapConfigValidation validateOverlapConfig(const OverlapConfig& config) {
  OverlapConfigValidation result;
  std::vector<std::string>& errors = result.errors;

  // Probabilities and ratios.
  checkRange("jaccardEmptySetValue", config.jaccard_empty_set_value, 0.0, 1.0, errors);
  checkRange("candidateMinActiveAxisOverlap", config.candidate_min_active_axis_overlap, 0.0, 1.0,
             errors);
  checkRange("candidateMinSignAgreement", config.candidate_min_sign_agreement, 0.0, 1.0, errors);
  checkRange("minOnEitherRateForMerge", config.min_on_either_rate_for_merge, 0.0, 1.0, errors);
  checkRange("minGateOverlapRatio", config.min_gate_overlap_ratio, 0.0, 1.0, errors);
  checkRange("maxExclusiveRateForSubsumption", config.max_exclusive_rate_for_subsumption, 0.0,
             1.0, errors);
  checkRange("minDominanceForSubsumption", config.min_dominance_for_subsumption, 0.0, 1.0,
             errors);
  checkRange("nestedConditionalThreshold", config.nested_conditional_threshold, 0.0, 1.0, errors);
  checkRange("separationMinGateOverlapRatio", config.separation_min_gate_overlap_ratio, 0.0, 1.0,
             errors);
  checkRange("nearMissGateOverlapRatio", config.near_miss_gate_overlap_ratio, 0.0, 1.0, errors);
  checkRange("maxMeanAbsDiffForMerge", config.max_mean_abs_diff_for_merge, 0.0, 1.0, errors);
  checkRange("compositeScoreGateOverlapWeight", config.composite_gate_overlap_weight, 0.0, 1.0,
             errors);
  checkRange("compositeScoreGlobalDiffWeight", config.composite_global_diff_weight, 0.0, 1.0,
             errors);
  checkRange("compositeScoreCorrelationWeight", config.composite_correlation_weight, 0.0, 1.0,
             errors);

  // Correlations.
  checkRange("candidateMinCosineSimilarity", config.candidate_min_cosine_similarity, -1.0, 1.0,
             errors);
  checkRange("minCorrelationForMerge", config.min_correlation_for_merge, -1.0, 1.0, errors);
  checkRange("minCorrelationForSubsumption", config.min_correlation_for_subsumption, -1.0, 1.0,
             errors);
  checkRange("separationMinCorrelation", config.separation_min_correlation, -1.0, 1.0, errors);
  checkRange("nearMissCorrelationThreshold", config.near_miss_correlation_threshold, -1.0, 1.0,
             errors);

  // Epsilons.
  checkPositive("activeAxisEpsilon", config.active_axis_epsilon, errors);
  checkPositive("softSignThreshold", config.soft_sign_threshold, errors);
  checkPositive("intensityEps", config.intensity_eps, errors);
  checkPositive("dominanceDelta", config.dominance_delta, errors);

  // Counts.
  checkCount("maxCandidatePairs", config.max_candidate_pairs, errors);
  checkCount("sampleCountPerPair", config.sample_count_per_pair, errors);
  checkCount("divergenceExamplesK", config.divergence_examples_k, errors);
  checkCount("minCoPassSamples", config.min_co_pass_samples, errors);
  checkCount("minPassSamplesForConditional", config.min_pass_samples_for_conditional, errors);

  for (size_t idx = 0; idx < config.high_thresholds.size(); ++idx) {
    double val = config.high_thresholds[idx];
    if (!std::isfinite(val) || val <= 0.0 || val >= 1.0) {
      errors.push_back("highThresholds[" + std::to_string(idx) +
                       "] must be a number in range (0, 1), got " + formatNumber(val));
    }
  }

  // Ordering.
  checkLess("nearMissCorrelationThreshold", config.near_miss_correlation_threshold,
            "minCorrelationForMerge", config.min_correlation_for_merge, errors);
  checkLess("nearMissGateOverlapRatio", config.near_miss_gate_overlap_ratio,
            "minGateOverlapRatio", config.min_gate_overlap_ratio, errors);
  if (config.min_correlation_for_subsumption > config.min_correlation_for_merge) {
    errors.push_back("minCorrelationForSubsumption must be <= minCorrelationForMerge");
  }

  double weight_sum = config.composite_gate_overlap_weight + config.composite_global_diff_weight +
                      config.composite_correlation_weight;
  if (std::fabs(weight_sum - 1.0) > 1e-3) {
    errors.push_back("Composite score weights must sum to 1.0, got " + formatNumber(weight_sum));
  }

  // Legal but suspicious settings.
  if (config.min_co_pass_samples > config.sample_count_per_pair) {
    result.warnings.push_back("minCoPassSamples exceeds sampleCountPerPair; co-pass metrics "
                              "will always be NaN");
  }
  if (config.min_pass_samples_for_conditional > config.sample_count_per_pair) {
    result.warnings.push_back("minPassSamplesForConditional exceeds sampleCountPerPair; "
                              "conditional rates will always be NaN");
  }
  if (config.active_axis_epsilon > config.soft_sign_threshold) {
    result.warnings.push_back("activeAxisEpsilon is above softSignThreshold; no active axis "
                              "can have a neutral sign");
  }
  if (config.high_thresholds.empty()) {
    result.warnings.push_back("highThresholds is empty; no high-coactivation metrics");
  }
  if (!config.prototype_family.empty() && config.prototype_family != "emotion" &&
      config.prototype_family != "sexual") {
    result.warnings.push_back("prototypeFamily '" + config.prototype_family +
                              "' matches no prototype type");
  }

  result.is_valid = errors.empty();
  return result;
}

}  // namespace affect
