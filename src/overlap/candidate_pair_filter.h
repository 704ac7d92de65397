// Static weight-vector prefilter for prototype overlap analysis.

#ifndef AFFECT_OVERLAP_CANDIDATE_PAIR_FILTER_H
#define AFFECT_OVERLAP_CANDIDATE_PAIR_FILTER_H

#include <cstddef>
#include <set>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "overlap/overlap_config.h"

namespace affect {

/// @brief Similarity of two weight maps, computed without sampling.
struct CandidateMetrics {
  double active_axis_overlap = 0.0;       ///< Jaccard of active-axis sets.
  double sign_agreement = 0.0;            ///< Fraction of shared active axes with equal soft sign.
  double weight_cosine_similarity = 0.0;  ///< Missing axes count as 0.
};

/// @brief A prototype pair that survived the prefilter.
///
/// index_a < index_b, both indexing the prototype list given to filter().
struct CandidatePair {
  size_t index_a = 0;
  size_t index_b = 0;
  std::string prototype_a_id;
  std::string prototype_b_id;
  CandidateMetrics metrics;
};

/// @brief Counters describing one filter run.
///
/// Each rejected pair is counted under the first threshold it missed, in
/// the order overlap, sign, cosine.
struct CandidateFilterStats {
  size_t total_prototypes = 0;
  size_t skipped_no_weights = 0;
  size_t skipped_family = 0;
  size_t pairs_evaluated = 0;
  size_t passed = 0;
  size_t rejected_active_axis_overlap = 0;
  size_t rejected_sign_agreement = 0;
  size_t rejected_cosine_similarity = 0;
  size_t dropped_by_cap = 0;              ///< Passing pairs beyond max_candidate_pairs.
};

/// @brief Filter output.
struct CandidateFilterResult {
  std::vector<CandidatePair> candidates;
  CandidateFilterStats stats;
};

/// @brief Axes whose |weight| is at least epsilon.
std::set<std::string> activeAxes(const AxisMap& weights, double epsilon);

/// @brief Jaccard index of two sets; empty_value when both are empty.
double activeAxisOverlap(const std::set<std::string>& a, const std::set<std::string>& b,
                         double empty_value);

/// @brief -1, 0 or +1, with |weight| below soft_threshold counting as 0.
int softSign(double weight, double soft_threshold);

/// @brief Fraction of shared active axes on which both soft signs match.
/// @return 0 when the active sets share no axis.
double signAgreement(const AxisMap& weights_a, const AxisMap& weights_b,
                     const std::set<std::string>& active_a,
                     const std::set<std::string>& active_b, double soft_threshold);

/// @brief Cosine similarity over the union of axes; 0 if either vector is zero.
double weightCosineSimilarity(const AxisMap& weights_a, const AxisMap& weights_b);

/// @brief Compute all three candidate metrics for one pair.
CandidateMetrics computeCandidateMetrics(const AxisMap& weights_a, const AxisMap& weights_b,
                                         const OverlapConfig& config);

/// @brief Prunes the quadratic pair space to pairs worth sampling.
class CandidatePairFilter {
 public:
  explicit CandidatePairFilter(const OverlapConfig& config) : config_(config) {}

  /// @brief Enumerate unordered pairs (no self-pairs) and keep those meeting
  ///        every configured minimum.
  ///
  /// Prototypes without weights, or outside config.prototype_family when it
  /// is set, are skipped. At most max_candidate_pairs pairs are returned,
  /// in enumeration order.
  CandidateFilterResult filter(const std::vector<Prototype>& prototypes) const;

 private:
  OverlapConfig config_;
};

}  // namespace affect

#endif  // AFFECT_OVERLAP_CANDIDATE_PAIR_FILTER_H
