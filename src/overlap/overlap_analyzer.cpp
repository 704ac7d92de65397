// Overlap analyzer implementation.

#include "overlap/overlap_analyzer.h"

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <set>
#include <string>
#include <utility>

#include "core/diag_log.h"
#include "core/rng_util.h"
#include "overlap/prototype_vector_evaluator.h"
#include "sampling/random_context_generator.h"

namespace affect {

void ClassificationBreakdown::add(OverlapType type) {
  switch (type) {
    case OverlapType::MergeRecommended:    ++merge_recommended; break;
    case OverlapType::SubsumedRecommended: ++subsumed_recommended; break;
    case OverlapType::ConvertToExpression: ++convert_to_expression; break;
    case OverlapType::NestedSiblings:      ++nested_siblings; break;
    case OverlapType::NeedsSeparation:     ++needs_separation; break;
    case OverlapType::KeepDistinct:        ++keep_distinct; break;
  }
}

size_t ClassificationBreakdown::actionable() const {
  return merge_recommended + subsumed_recommended + convert_to_expression + nested_siblings +
         needs_separation;
}

const char* insightStatusToString(InsightStatus status) {
  switch (status) {
    case InsightStatus::NoCandidates:       return "no_candidates";
    case InsightStatus::RedundantFound:     return "redundant_found";
    case InsightStatus::NearMisses:         return "near_misses";
    case InsightStatus::WellDifferentiated: return "well_differentiated";
  }
  return "unknown";
}

const char* overlapAnalysisStatusToString(OverlapAnalysisStatus status) {
  switch (status) {
    case OverlapAnalysisStatus::Ok:               return "ok";
    case OverlapAnalysisStatus::InvalidConfig:    return "invalid_config";
    case OverlapAnalysisStatus::InvalidPrototype: return "invalid_prototype";
    case OverlapAnalysisStatus::Cancelled:        return "cancelled";
  }
  return "unknown";
}

double computePairCompositeScore(double gate_overlap_ratio, double pearson_correlation,
                                 double global_mean_abs_diff, const OverlapConfig& config) {
  double gate = std::isfinite(gate_overlap_ratio)
                    ? std::max(0.0, std::min(1.0, gate_overlap_ratio))
                    : 0.0;
  double score = gate * config.composite_gate_overlap_weight;
  double weight = config.composite_gate_overlap_weight;

  if (std::isfinite(global_mean_abs_diff)) {
    double diff = std::max(0.0, std::min(1.0, global_mean_abs_diff));
    score += (1.0 - diff) * config.composite_global_diff_weight;
    weight += config.composite_global_diff_weight;
  }
  if (std::isfinite(pearson_correlation)) {
    score += ((pearson_correlation + 1.0) / 2.0) * config.composite_correlation_weight;
    weight += config.composite_correlation_weight;
  }

  if (!(weight > 0.0) || !std::isfinite(score / weight)) return gate;
  return score / weight;
}

namespace {

SummaryInsight buildInsight(const OverlapReport& report) {
  SummaryInsight insight;
  const size_t total = report.pairs.size();
  if (total == 0) {
    insight.status = InsightStatus::NoCandidates;
    insight.message = "No structurally similar pairs found. Prototypes are already "
                      "well-differentiated at the structural level.";
    return insight;
  }

  const ClassificationBreakdown& counts = report.breakdown;
  if (counts.actionable() > 0) {
    insight.status = InsightStatus::RedundantFound;
    insight.message = "Found " + std::to_string(counts.actionable()) + " pair(s) needing action";
    if (counts.merge_recommended > 0 || counts.subsumed_recommended > 0) {
      insight.message += " (" + std::to_string(counts.merge_recommended) + " merge, " +
                         std::to_string(counts.subsumed_recommended) + " subsumed)";
    }
    insight.message += ".";
    return insight;
  }

  if (!report.near_misses.empty()) {
    insight.status = InsightStatus::NearMisses;
    insight.message = "All " + std::to_string(total) +
                      " structurally similar pairs were behaviorally distinct, but " +
                      std::to_string(report.near_misses.size()) +
                      " pair(s) came close to redundancy thresholds.";
    return insight;
  }

  insight.status = InsightStatus::WellDifferentiated;
  insight.message = "All " + std::to_string(total) +
                    " structurally similar pairs were behaviorally distinct.";
  return insight;
}

}  // namespace

OverlapAnalyzer::OverlapAnalyzer(const OverlapConfig& config, IScheduler* scheduler)
    : config_(config), scheduler_(scheduler ? scheduler : &default_scheduler_) {}

OverlapReport OverlapAnalyzer::analyze(const std::vector<Prototype>& prototypes,
                                       const ProgressFn& on_progress,
                                       const CancellationToken* cancel) {
  uint32_t seed = config_.seed != 0 ? config_.seed : rng::generateRandomSeed();
  RandomContextGenerator generator(seed);
  std::vector<AffectContext> pool = generator.generatePool(config_.sample_count_per_pair);
  logDebug(config_.verbose, "OverlapAnalyzer", "shared pool of %zu contexts (seed %u)",
           pool.size(), seed);
  return analyzeWithPool(prototypes, pool, on_progress, cancel);
}

OverlapReport OverlapAnalyzer::analyzeWithPool(const std::vector<Prototype>& prototypes,
                                               const std::vector<AffectContext>& pool,
                                               const ProgressFn& on_progress,
                                               const CancellationToken* cancel) {
  OverlapReport report;
  report.prototype_family = config_.prototype_family;
  report.total_prototypes = prototypes.size();
  report.sample_count = pool.size();

  OverlapConfigValidation validation = validateOverlapConfig(config_);
  for (const auto& warning : validation.warnings) {
    logWarn("OverlapAnalyzer", "config: %s", warning.c_str());
  }
  if (!validation.is_valid) {
    report.status = OverlapAnalysisStatus::InvalidConfig;
    for (const auto& error : validation.errors) {
      if (!report.error_message.empty()) report.error_message += "; ";
      report.error_message += error;
    }
    return report;
  }

  std::set<std::string> ids;
  for (size_t idx = 0; idx < prototypes.size(); ++idx) {
    if (prototypes[idx].id.empty()) {
      report.status = OverlapAnalysisStatus::InvalidPrototype;
      report.error_message = "invalid prototype at index " + std::to_string(idx) + ": missing id";
      return report;
    }
    if (!ids.insert(prototypes[idx].id).second) {
      report.status = OverlapAnalysisStatus::InvalidPrototype;
      report.error_message = "duplicate prototype '" + prototypes[idx].id + "' at index " +
                             std::to_string(idx);
      return report;
    }
  }

  // Stage A: static prefilter.
  CandidatePairFilter filter(config_);
  CandidateFilterResult filtered = filter.filter(prototypes);
  report.filter_stats = filtered.stats;
  if (filtered.candidates.empty()) {
    finalizeReport(report);
    return report;
  }

  // Only prototypes that appear in some candidate pair need vectors.
  std::vector<Prototype> involved;
  std::vector<uint8_t> seen(prototypes.size(), 0);
  for (const auto& pair : filtered.candidates) {
    for (size_t idx : {pair.index_a, pair.index_b}) {
      if (seen[idx]) continue;
      seen[idx] = 1;
      involved.push_back(prototypes[idx]);
    }
  }

  PrototypeVectorEvaluator vector_eval(scheduler_, config_.verbose);
  VectorEvaluationResult vectors = vector_eval.evaluateAll(involved, pool, ProgressFn(), cancel);
  if (vectors.status == VectorEvalStatus::Cancelled) {
    report.status = OverlapAnalysisStatus::Cancelled;
    report.error_message = vectors.error_message;
    return report;
  }
  if (!vectors.success()) {
    report.status = OverlapAnalysisStatus::InvalidPrototype;
    report.error_message = vectors.error_message;
    return report;
  }

  // Stage B and C: behavior and classification per pair.
  BehavioralOverlapEvaluator behavior_eval(config_);
  OverlapClassifier classifier(config_);
  const size_t total = filtered.candidates.size();
  for (size_t pair_idx = 0; pair_idx < total; ++pair_idx) {
    if (pair_idx > 0 && pair_idx % kPairYieldInterval == 0 &&
        scheduler_->yieldControl(cancel) == YieldStatus::Cancelled) {
      report.status = OverlapAnalysisStatus::Cancelled;
      report.error_message = "analysis cancelled";
      report.pairs.clear();
      return report;
    }

    const CandidatePair& candidate = filtered.candidates[pair_idx];
    const Prototype& proto_a = prototypes[candidate.index_a];
    const Prototype& proto_b = prototypes[candidate.index_b];

    PairOverlapResult pair;
    pair.prototype_a_id = candidate.prototype_a_id;
    pair.prototype_b_id = candidate.prototype_b_id;
    pair.candidate = candidate.metrics;
    pair.behavior = behavior_eval.evaluate(proto_a, proto_b, vectors.vectors.at(proto_a.id),
                                           vectors.vectors.at(proto_b.id), pool);
    pair.classification = classifier.classify(pair.candidate, pair.behavior);
    pair.gate_overlap_ratio = gateOverlapRatio(pair.behavior.gate_overlap);
    pair.composite_score = computePairCompositeScore(
        pair.gate_overlap_ratio, pair.behavior.intensity.pearson_correlation,
        pair.behavior.intensity.global_mean_abs_diff, config_);
    if (pair.classification.primary().type == OverlapType::KeepDistinct) {
      pair.near_miss = classifier.checkNearMiss(pair.candidate, pair.behavior);
    }
    report.pairs.push_back(std::move(pair));

    if (on_progress) on_progress(pair_idx + 1, total);
  }

  finalizeReport(report);
  logDebug(config_.verbose, "OverlapAnalyzer", "%zu pairs analyzed, %zu actionable: %s",
           report.pairs.size(), report.breakdown.actionable(), report.insight.message.c_str());
  return report;
}

void OverlapAnalyzer::finalizeReport(OverlapReport& report) const {
  std::stable_sort(report.pairs.begin(), report.pairs.end(),
                   [](const PairOverlapResult& lhs, const PairOverlapResult& rhs) {
                     return lhs.composite_score > rhs.composite_score;
                   });

  for (const auto& pair : report.pairs) {
    report.breakdown.add(pair.classification.primary().type);
    if (!pair.near_miss.is_near_miss) continue;
    NearMissEntry entry;
    entry.prototype_a_id = pair.prototype_a_id;
    entry.prototype_b_id = pair.prototype_b_id;
    entry.reason = pair.near_miss.reason;
    entry.pearson_correlation = pair.behavior.intensity.pearson_correlation;
    entry.gate_overlap_ratio = pair.gate_overlap_ratio;
    report.near_misses.push_back(entry);
  }

  // NaN correlations sort last.
  std::stable_sort(report.near_misses.begin(), report.near_misses.end(),
                   [](const NearMissEntry& lhs, const NearMissEntry& rhs) {
                     double left = std::isnan(lhs.pearson_correlation) ? -2.0
                                                                       : lhs.pearson_correlation;
                     double right = std::isnan(rhs.pearson_correlation)
                                        ? -2.0
                                        : rhs.pearson_correlation;
                     return left > right;
                   });
  if (report.near_misses.size() > config_.max_near_miss_pairs_to_report) {
    report.near_misses.resize(config_.max_near_miss_pairs_to_report);
  }

  if (!report.pairs.empty()) {
    const PairOverlapResult& top = report.pairs.front();
    ClosestPairSummary closest;
    closest.prototype_a_id = top.prototype_a_id;
    closest.prototype_b_id = top.prototype_b_id;
    closest.composite_score = top.composite_score;
    closest.gate_overlap_ratio = top.gate_overlap_ratio;
    closest.pearson_correlation = top.behavior.intensity.pearson_correlation;
    closest.global_mean_abs_diff = top.behavior.intensity.global_mean_abs_diff;
    report.closest_pair = closest;
  }

  report.insight = buildInsight(report);
}

}  // namespace affect
