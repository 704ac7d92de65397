// Candidate pair filter implementation.

#include "overlap/candidate_pair_filter.h"

#include <cmath>

#include "core/diag_log.h"

namespace affect {

std::set<std::string> activeAxes(const AxisMap& weights, double epsilon) {
  std::set<std::string> axes;
  for (const auto& entry : weights) {
    if (std::fabs(entry.second) >= epsilon) axes.insert(entry.first);
  }
  return axes;
}

double activeAxisOverlap(const std::set<std::string>& a, const std::set<std::string>& b,
                         double empty_value) {
  if (a.empty() && b.empty()) return empty_value;
  size_t shared = 0;
  for (const auto& axis : a) {
    if (b.count(axis)) ++shared;
  }
  size_t union_size = a.size() + b.size() - shared;
  return static_cast<double>(shared) / static_cast<double>(union_size);
}

int softSign(double weight, double soft_threshold) {
  if (std::fabs(weight) < soft_threshold) return 0;
  if (weight > 0.0) return 1;
  if (weight < 0.0) return -1;
  return 0;
}

double signAgreement(const AxisMap& weights_a, const AxisMap& weights_b,
                     const std::set<std::string>& active_a,
                     const std::set<std::string>& active_b, double soft_threshold) {
  size_t shared = 0;
  size_t agree = 0;
  for (const auto& axis : active_a) {
    if (!active_b.count(axis)) continue;
    ++shared;
    if (softSign(weights_a.at(axis), soft_threshold) ==
        softSign(weights_b.at(axis), soft_threshold)) {
      ++agree;
    }
  }
  if (shared == 0) return 0.0;
  return static_cast<double>(agree) / static_cast<double>(shared);
}

double weightCosineSimilarity(const AxisMap& weights_a, const AxisMap& weights_b) {
  double dot = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;
  for (const auto& entry : weights_a) {
    norm_a += entry.second * entry.second;
    auto iter = weights_b.find(entry.first);
    if (iter != weights_b.end()) dot += entry.second * iter->second;
  }
  for (const auto& entry : weights_b) {
    norm_b += entry.second * entry.second;
  }
  if (norm_a <= 0.0 || norm_b <= 0.0) return 0.0;
  return dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
}

CandidateMetrics computeCandidateMetrics(const AxisMap& weights_a, const AxisMap& weights_b,
                                         const OverlapConfig& config) {
  std::set<std::string> active_a = activeAxes(weights_a, config.active_axis_epsilon);
  std::set<std::string> active_b = activeAxes(weights_b, config.active_axis_epsilon);

  CandidateMetrics metrics;
  metrics.active_axis_overlap =
      activeAxisOverlap(active_a, active_b, config.jaccard_empty_set_value);
  metrics.sign_agreement =
      signAgreement(weights_a, weights_b, active_a, active_b, config.soft_sign_threshold);
  metrics.weight_cosine_similarity = weightCosineSimilarity(weights_a, weights_b);
  return metrics;
}

CandidateFilterResult CandidatePairFilter::filter(
    const std::vector<Prototype>& prototypes) const {
  CandidateFilterResult result;
  CandidateFilterStats& stats = result.stats;
  stats.total_prototypes = prototypes.size();

  std::vector<size_t> eligible;
  for (size_t idx = 0; idx < prototypes.size(); ++idx) {
    const Prototype& proto = prototypes[idx];
    if (proto.weights.empty()) {
      ++stats.skipped_no_weights;
      continue;
    }
    if (!config_.prototype_family.empty() &&
        config_.prototype_family != prototypeTypeToString(proto.type)) {
      ++stats.skipped_family;
      continue;
    }
    eligible.push_back(idx);
  }

  for (size_t pos_a = 0; pos_a < eligible.size(); ++pos_a) {
    for (size_t pos_b = pos_a + 1; pos_b < eligible.size(); ++pos_b) {
      const Prototype& proto_a = prototypes[eligible[pos_a]];
      const Prototype& proto_b = prototypes[eligible[pos_b]];
      ++stats.pairs_evaluated;

      CandidateMetrics metrics = computeCandidateMetrics(proto_a.weights, proto_b.weights, config_);
      if (metrics.active_axis_overlap < config_.candidate_min_active_axis_overlap) {
        ++stats.rejected_active_axis_overlap;
        continue;
      }
      if (metrics.sign_agreement < config_.candidate_min_sign_agreement) {
        ++stats.rejected_sign_agreement;
        continue;
      }
      if (metrics.weight_cosine_similarity < config_.candidate_min_cosine_similarity) {
        ++stats.rejected_cosine_similarity;
        continue;
      }

      ++stats.passed;
      if (result.candidates.size() >= config_.max_candidate_pairs) {
        ++stats.dropped_by_cap;
        continue;
      }
      CandidatePair pair;
      pair.index_a = eligible[pos_a];
      pair.index_b = eligible[pos_b];
      pair.prototype_a_id = proto_a.id;
      pair.prototype_b_id = proto_b.id;
      pair.metrics = metrics;
      result.candidates.push_back(pair);
    }
  }

  if (stats.dropped_by_cap > 0) {
    logWarn("CandidatePairFilter", "%zu passing pairs dropped by maxCandidatePairs=%zu",
            stats.dropped_by_cap, config_.max_candidate_pairs);
  }
  logDebug(config_.verbose, "CandidatePairFilter",
           "%zu prototypes, %zu pairs evaluated, %zu passed (overlap %zu, sign %zu, cosine %zu "
           "rejected)",
           stats.total_prototypes, stats.pairs_evaluated, stats.passed,
           stats.rejected_active_axis_overlap, stats.rejected_sign_agreement,
           stats.rejected_cosine_similarity);
  return result;
}

}  // namespace affect
