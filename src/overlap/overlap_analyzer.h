// Prototype overlap pipeline: filter, sample, compare, classify, rank.

#ifndef AFFECT_OVERLAP_OVERLAP_ANALYZER_H
#define AFFECT_OVERLAP_OVERLAP_ANALYZER_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "core/cooperative_scheduler.h"
#include "overlap/behavioral_overlap_evaluator.h"
#include "overlap/candidate_pair_filter.h"
#include "overlap/overlap_classifier.h"
#include "overlap/overlap_config.h"

namespace affect {

/// @brief Full analysis of one candidate pair.
struct PairOverlapResult {
  std::string prototype_a_id;
  std::string prototype_b_id;
  CandidateMetrics candidate;
  BehavioralMetrics behavior;
  ClassificationResult classification;
  double gate_overlap_ratio = 0.0;
  double composite_score = 0.0;  ///< Always finite.
  NearMissResult near_miss;      ///< Checked only for KeepDistinct pairs.
};

/// @brief Highest composite-score pair.
struct ClosestPairSummary {
  std::string prototype_a_id;
  std::string prototype_b_id;
  double composite_score = 0.0;
  double gate_overlap_ratio = 0.0;
  double pearson_correlation = kNaN;
  double global_mean_abs_diff = kNaN;
};

/// @brief Count of pairs per primary classification.
struct ClassificationBreakdown {
  size_t merge_recommended = 0;
  size_t subsumed_recommended = 0;
  size_t convert_to_expression = 0;
  size_t nested_siblings = 0;
  size_t needs_separation = 0;
  size_t keep_distinct = 0;

  void add(OverlapType type);

  /// Pairs whose primary classification is anything but KeepDistinct.
  size_t actionable() const;
};

/// @brief Near-miss pair as listed in the report.
struct NearMissEntry {
  std::string prototype_a_id;
  std::string prototype_b_id;
  std::string reason;
  double pearson_correlation = kNaN;
  double gate_overlap_ratio = 0.0;
};

/// @brief Overall verdict of a run.
enum class InsightStatus : uint8_t {
  NoCandidates,
  RedundantFound,
  NearMisses,
  WellDifferentiated
};

/// @brief Convert InsightStatus to snake_case string.
const char* insightStatusToString(InsightStatus status);

/// @brief One-line verdict.
struct SummaryInsight {
  InsightStatus status = InsightStatus::NoCandidates;
  std::string message;
};

/// @brief Outcome code of an analysis run.
enum class OverlapAnalysisStatus : uint8_t {
  Ok,
  InvalidConfig,
  InvalidPrototype,
  Cancelled
};

/// @brief Convert OverlapAnalysisStatus to lowercase string.
const char* overlapAnalysisStatusToString(OverlapAnalysisStatus status);

/// @brief Report of one analysis run.
struct OverlapReport {
  OverlapAnalysisStatus status = OverlapAnalysisStatus::Ok;
  std::string error_message;
  std::string prototype_family;
  size_t total_prototypes = 0;
  size_t sample_count = 0;                   ///< Size of the shared pool.
  std::vector<PairOverlapResult> pairs;      ///< Descending composite score.
  std::optional<ClosestPairSummary> closest_pair;
  ClassificationBreakdown breakdown;
  std::vector<NearMissEntry> near_misses;    ///< Descending correlation, capped.
  CandidateFilterStats filter_stats;
  SummaryInsight insight;

  bool success() const { return status == OverlapAnalysisStatus::Ok; }
};

/// @brief Composite closeness of a pair.
///
/// gate*w_gate + (1 - clamp01(globalMeanAbsDiff))*w_diff + ((pearson+1)/2)*w_corr.
/// Terms whose metric is not finite are dropped and the remaining weights
/// renormalized; with neither output metric available the score is the
/// gate overlap ratio alone.
double computePairCompositeScore(double gate_overlap_ratio, double pearson_correlation,
                                 double global_mean_abs_diff, const OverlapConfig& config);

/// @brief Runs the overlap pipeline over a prototype set.
class OverlapAnalyzer {
 public:
  /// Pairs between yield points.
  static constexpr size_t kPairYieldInterval = 100;

  /// @param config Pipeline configuration (validated on each run).
  /// @param scheduler Yield hook; nullptr uses a ThreadYieldScheduler.
  explicit OverlapAnalyzer(const OverlapConfig& config, IScheduler* scheduler = nullptr);
  OverlapAnalyzer(const OverlapAnalyzer&) = delete;
  OverlapAnalyzer& operator=(const OverlapAnalyzer&) = delete;

  /// @brief Sample a shared pool of sample_count_per_pair contexts and
  ///        analyze every candidate pair against it.
  /// @param prototypes Prototypes to compare.
  /// @param on_progress Optional (pairs done, pair total) callback.
  /// @param cancel Optional cancellation token.
  OverlapReport analyze(const std::vector<Prototype>& prototypes,
                        const ProgressFn& on_progress = ProgressFn(),
                        const CancellationToken* cancel = nullptr);

  /// @brief Same as analyze() but on a caller-supplied pool.
  OverlapReport analyzeWithPool(const std::vector<Prototype>& prototypes,
                                const std::vector<AffectContext>& pool,
                                const ProgressFn& on_progress = ProgressFn(),
                                const CancellationToken* cancel = nullptr);

 private:
  void finalizeReport(OverlapReport& report) const;

  OverlapConfig config_;
  ThreadYieldScheduler default_scheduler_;
  IScheduler* scheduler_;
};

}  // namespace affect

#endif  // AFFECT_OVERLAP_OVERLAP_ANALYZER_H
