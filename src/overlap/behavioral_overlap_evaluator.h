// Behavioral comparison of two prototypes over a shared context pool.

#ifndef AFFECT_OVERLAP_BEHAVIORAL_OVERLAP_EVALUATOR_H
#define AFFECT_OVERLAP_BEHAVIORAL_OVERLAP_EVALUATOR_H

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "gate/gate_checker.h"
#include "gate/gate_implication.h"
#include "overlap/overlap_config.h"
#include "overlap/prototype_vector_evaluator.h"

namespace affect {

/// @brief Gate co-occurrence over the pool. Rates are fractions of all samples.
struct GateOverlapStats {
  double on_either_rate = 0.0;
  double on_both_rate = 0.0;
  double p_only_rate = 0.0;   ///< A passes, B does not.
  double q_only_rate = 0.0;   ///< B passes, A does not.
};

/// @brief Intensity agreement.
///
/// Co-pass metrics use only samples where both gates pass and are NaN with
/// fewer than min_co_pass_samples such samples. Global metrics compare the
/// gated outputs (0 on gate failure) over the whole pool.
struct IntensityStats {
  double pearson_correlation = kNaN;
  double mean_abs_diff = kNaN;
  double rmse = kNaN;
  double pct_within_eps = kNaN;
  double dominance_p = 0.0;   ///< P(a > b + delta | co-pass).
  double dominance_q = 0.0;   ///< P(b > a + delta | co-pass).
  double global_mean_abs_diff = kNaN;
  double global_l2_distance = kNaN;
  double global_output_correlation = kNaN;
};

/// @brief Unconditional and conditional pass rates.
struct PassRates {
  double pass_a_rate = 0.0;
  double pass_b_rate = 0.0;
  double p_a_given_b = kNaN;  ///< NaN when B passes fewer than min_pass_samples_for_conditional times.
  double p_b_given_a = kNaN;
  size_t co_pass_count = 0;
  size_t pass_a_count = 0;
  size_t pass_b_count = 0;
};

/// @brief High-intensity co-activation at one threshold, over samples where
///        either gate passes.
struct HighCoactivationEntry {
  double threshold = 0.0;
  double p_high_a = 0.0;
  double p_high_b = 0.0;
  double p_high_both = 0.0;
  double high_jaccard = 0.0;    ///< both-high / either-high, 0 if neither ever high.
  double high_agreement = 0.0;  ///< Fraction where both or neither are high.
};

/// @brief A co-pass sample where the two intensities differ most.
struct DivergenceExample {
  size_t context_index = 0;
  double intensity_a = 0.0;
  double intensity_b = 0.0;
  double abs_diff = 0.0;
  std::string context_summary;  ///< Up to three relevant normalized axes, largest first.
};

/// @brief Everything the classifier needs to know about a pair's behavior.
struct BehavioralMetrics {
  size_t sample_count = 0;
  GateOverlapStats gate_overlap;
  IntensityStats intensity;
  PassRates pass_rates;
  std::vector<HighCoactivationEntry> high_coactivation;
  std::vector<DivergenceExample> divergence_examples;
  /// Set only when both gate lists parsed completely.
  std::optional<GateImplicationResult> gate_implication;
  GateParseInfo gate_parse_info_a;
  GateParseInfo gate_parse_info_b;
};

/// @brief Pearson correlation clamped to [-1, 1].
/// @return NaN for fewer than two points, mismatched lengths or zero variance.
double pearsonCorrelation(const std::vector<double>& xs, const std::vector<double>& ys);

/// @brief Computes BehavioralMetrics from two precomputed prototype vectors.
class BehavioralOverlapEvaluator {
 public:
  explicit BehavioralOverlapEvaluator(const OverlapConfig& config) : config_(config) {}

  /// @brief Compare prototypes a and b.
  ///
  /// @param proto_a Prototype A (gates and weights for implication and summaries).
  /// @param proto_b Prototype B.
  /// @param vec_a Vector of A over the pool.
  /// @param vec_b Vector of B over the same pool.
  /// @param pool The pool both vectors were computed on; used for divergence
  ///        summaries. Summaries are left empty if its size differs.
  BehavioralMetrics evaluate(const Prototype& proto_a, const Prototype& proto_b,
                             const PrototypeVector& vec_a, const PrototypeVector& vec_b,
                             const std::vector<AffectContext>& pool) const;

 private:
  std::string summarizeContext(const AffectContext& context, const Prototype& proto_a,
                               const Prototype& proto_b) const;

  OverlapConfig config_;
};

}  // namespace affect

#endif  // AFFECT_OVERLAP_BEHAVIORAL_OVERLAP_EVALUATOR_H
