// Rule-based classification of prototype pair overlap.

#ifndef AFFECT_OVERLAP_OVERLAP_CLASSIFIER_H
#define AFFECT_OVERLAP_OVERLAP_CLASSIFIER_H

#include <cstdint>
#include <string>
#include <vector>

#include "overlap/behavioral_overlap_evaluator.h"
#include "overlap/candidate_pair_filter.h"
#include "overlap/overlap_config.h"

namespace affect {

/// @brief Overlap category, declared in priority order (highest first).
enum class OverlapType : uint8_t {
  MergeRecommended,
  SubsumedRecommended,
  ConvertToExpression,
  NestedSiblings,
  NeedsSeparation,
  KeepDistinct
};

/// @brief Convert OverlapType to snake_case string ("merge_recommended").
const char* overlapTypeToString(OverlapType type);

/// @brief Which prototype of the pair a classification singles out.
enum class PairSide : uint8_t {
  None,
  A,
  B
};

/// @brief Convert PairSide to "none", "a" or "b".
const char* pairSideToString(PairSide side);

/// @brief One matching category with its own confidence.
struct OverlapClassification {
  OverlapType type = OverlapType::KeepDistinct;
  double confidence = 0.0;      ///< In [0, 1]; 0 when evidence is NaN.
  std::string evidence;
  bool is_primary = false;
  /// Subsumed prototype for SubsumedRecommended, narrower prototype for
  /// ConvertToExpression and NestedSiblings.
  PairSide side = PairSide::None;
  bool deterministic = false;   ///< NestedSiblings backed by gate implication.
};

/// @brief All matching categories, highest priority first.
///
/// entries is never empty; entries[0] is the primary classification.
/// KeepDistinct appears only when nothing else matched.
struct ClassificationResult {
  std::vector<OverlapClassification> entries;

  const OverlapClassification& primary() const { return entries.front(); }
  bool has(OverlapType type) const;
};

/// @brief Pair that narrowly misses merge.
struct NearMissResult {
  bool is_near_miss = false;
  std::string reason;
};

/// @brief onBoth / onEither, 0 when neither prototype ever passes.
double gateOverlapRatio(const GateOverlapStats& stats);

/// @brief Clamp a confidence into [0, 1]; NaN becomes 0.
double clampConfidence(double value);

/// @brief Applies the merge, subsumption, conversion, nesting and separation
///        rules to one candidate pair.
class OverlapClassifier {
 public:
  explicit OverlapClassifier(const OverlapConfig& config) : config_(config) {}

  /// @brief Classify a pair.
  ///
  /// A vacuous gate implication never supports ConvertToExpression or
  /// deterministic NestedSiblings. A partial gate parse on either side
  /// disables deterministic nesting; behavioral nesting still applies.
  ///
  /// @param candidate Static weight metrics.
  /// @param behavior Sampled behavioral metrics.
  ClassificationResult classify(const CandidateMetrics& candidate,
                                const BehavioralMetrics& behavior) const;

  /// @brief Flag pairs close to merge thresholds without meeting them.
  ///
  /// Dead pairs (onEither below the merge minimum) are never near misses.
  NearMissResult checkNearMiss(const CandidateMetrics& candidate,
                               const BehavioralMetrics& behavior) const;

 private:
  struct Nesting {
    bool deterministic = false;
    bool behavioral = false;
    PairSide deterministic_side = PairSide::None;
    PairSide behavioral_side = PairSide::None;
  };

  Nesting detectNesting(const BehavioralMetrics& behavior) const;

  bool checkMerge(const BehavioralMetrics& behavior, OverlapClassification& out) const;
  bool checkSubsumed(const BehavioralMetrics& behavior, OverlapClassification& out) const;
  bool checkConvertToExpression(const BehavioralMetrics& behavior, const Nesting& nesting,
                                OverlapClassification& out) const;
  bool checkNestedSiblings(const BehavioralMetrics& behavior, const Nesting& nesting,
                           OverlapClassification& out) const;
  bool checkNeedsSeparation(const BehavioralMetrics& behavior, OverlapClassification& out) const;

  OverlapConfig config_;
};

}  // namespace affect

#endif  // AFFECT_OVERLAP_OVERLAP_CLASSIFIER_H
