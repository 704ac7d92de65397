// Thresholds and weights for the prototype overlap pipeline.

#ifndef AFFECT_OVERLAP_OVERLAP_CONFIG_H
#define AFFECT_OVERLAP_OVERLAP_CONFIG_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "core/json_parser.h"

namespace affect {

/// @brief Configuration for candidate filtering, behavioral sampling,
///        classification and ranking of prototype pairs.
///
/// JSON keys are the camelCase forms of the member names
/// (active_axis_epsilon -> activeAxisEpsilon).
struct OverlapConfig {
  // Candidate filter (static weight vectors).
  double active_axis_epsilon = 0.08;        ///< |w| at or above this marks an active axis.
  double soft_sign_threshold = 0.15;        ///< |w| below this has neutral sign.
  double jaccard_empty_set_value = 1.0;     ///< Overlap of two empty active sets.
  double candidate_min_active_axis_overlap = 0.6;
  double candidate_min_sign_agreement = 0.8;
  double candidate_min_cosine_similarity = 0.85;
  size_t max_candidate_pairs = 5000;
  std::string prototype_family;             ///< "emotion", "sexual" or empty for all.

  // Behavioral sampling.
  size_t sample_count_per_pair = 8000;      ///< Size of the shared context pool.
  uint32_t seed = 0;                        ///< 0 = random seed.
  size_t divergence_examples_k = 5;
  double dominance_delta = 0.05;
  double intensity_eps = 0.05;
  size_t min_co_pass_samples = 200;
  size_t min_pass_samples_for_conditional = 200;
  std::vector<double> high_thresholds = {0.4, 0.6, 0.75};

  // Classification.
  double min_on_either_rate_for_merge = 0.05;
  double min_gate_overlap_ratio = 0.9;
  double min_correlation_for_merge = 0.98;
  double max_mean_abs_diff_for_merge = 0.03;
  double min_correlation_for_subsumption = 0.95;
  double max_exclusive_rate_for_subsumption = 0.01;
  double min_dominance_for_subsumption = 0.95;
  double nested_conditional_threshold = 0.97;
  bool enable_convert_to_expression = true;
  double separation_min_gate_overlap_ratio = 0.70;
  double separation_min_correlation = 0.80;
  double near_miss_correlation_threshold = 0.9;
  double near_miss_gate_overlap_ratio = 0.75;
  size_t max_near_miss_pairs_to_report = 10;

  // Composite ranking.
  double composite_gate_overlap_weight = 0.5;
  double composite_global_diff_weight = 0.3;
  double composite_correlation_weight = 0.2;

  bool verbose = false;
};

/// @brief Outcome of applying a JSON object to an OverlapConfig.
struct OverlapConfigLoadResult {
  bool success = true;
  std::vector<std::string> errors;  ///< One message per rejected key.
};

/// @brief Overwrite config fields from a flat JSON object.
///
/// Unknown keys are ignored. A key whose value has the wrong type is
/// reported and leaves the field unchanged; the remaining keys still apply.
///
/// @param object Parsed JSON object.
/// @param config Config to update in place.
/// @return success=false if the input is not an object or any key was rejected.
OverlapConfigLoadResult applyOverlapConfigJson(const JsonValue& object, OverlapConfig& config);

/// @brief Result of validateOverlapConfig.
struct OverlapConfigValidation {
  bool is_valid = true;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

/// @brief Check ranges, ordering constraints and weight sums.
///
/// Errors: probabilities outside [0,1], correlations outside [-1,1],
/// zero counts, non-positive epsilons, high thresholds outside (0,1),
/// near-miss thresholds not below their merge counterparts, subsumption
/// correlation above merge correlation, composite weights not summing to 1
/// within 1e-3. Warnings flag settings that are legal but unlikely to work.
OverlapConfigValidation validateOverlapConfig(const OverlapConfig& config);

}  // namespace affect

#endif  // AFFECT_OVERLAP_OVERLAP_CONFIG_H
