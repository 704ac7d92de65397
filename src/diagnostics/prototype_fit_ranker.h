// Ranking of prototypes by how well they fit an expression's mood regime.

#ifndef AFFECT_DIAGNOSTICS_PROTOTYPE_FIT_RANKER_H
#define AFFECT_DIAGNOSTICS_PROTOTYPE_FIT_RANKER_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "registry/i_prototype_registry.h"
#include "scoring/intensity_calculator.h"

namespace affect {

/// @brief Normalized range an expression allows on one mood axis.
struct AxisConstraint {
  double min = -1.0;
  double max = 1.0;
};

/// Mood axis -> allowed normalized range.
using AxisConstraintMap = std::map<std::string, AxisConstraint>;

/// @brief Mood-axis ranges implied by an expression's prerequisites.
///
/// Collects comparisons of moodAxes.<axis> (or mood.<axis>) against a
/// literal that hold unconditionally: at a prerequisite root or under
/// nested "and". Branches of "or" and "!" do not constrain. Literals are
/// normalized like mood values (divide by 100, clamp to [-1, 1]); strictness
/// is not tracked.
AxisConstraintMap extractMoodConstraints(const std::vector<Prerequisite>& prerequisites);

/// @brief True if every constrained mood axis of the context lies in range.
///
/// Missing axes count as 0.
bool isInMoodRegime(const AffectContext& ctx, const AxisConstraintMap& constraints);

/// @brief A prototype named by an expression clause.
struct PrototypeRef {
  std::string id;
  PrototypeType type = PrototypeType::Emotion;
};

/// @brief First emotions.<id> or sexualStates.<id> compared in a clause.
///
/// Prerequisites are searched in order, descending into "and"/"or".
std::optional<PrototypeRef> findReferencedPrototype(const Expression& expression);

/// @brief Weight on an axis whose sign opposes the regime.
struct ConflictingAxis {
  std::string axis;
  double weight = 0.0;
};

/// @brief Sign conflicts between prototype weights and the regime.
struct ConflictAnalysis {
  double score = 0.0;      ///< Conflicting axes / constrained axes, in [0, 1].
  double magnitude = 0.0;  ///< Sum of |weight| over conflicting axes.
  std::vector<ConflictingAxis> axes;
};

/// @brief Compare weight signs with the direction of each constrained axis.
///
/// An axis points up when the midpoint of its range is >= 0. Axes the
/// prototype does not weight never conflict but still count as constrained.
ConflictAnalysis analyzeConflicts(const std::map<std::string, double>& weights,
                                  const AxisConstraintMap& constraints);

/// @brief Fit metrics of one prototype.
struct PrototypeFitEntry {
  std::string prototype_id;
  PrototypeType type = PrototypeType::Emotion;
  double gate_pass_rate = 0.0;          ///< Over regime samples.
  IntensityDistribution intensity;      ///< Over gate-passing regime samples.
  ConflictAnalysis conflict;
  double exclusion_compatibility = 1.0;
  double composite_score = 0.0;
  size_t rank = 0;                      ///< 1 = best.
};

/// @brief Ranking options.
struct FitRankingOptions {
  double threshold = 0.3;       ///< Intensity cutoff for P(intensity >= threshold).
  size_t leaderboard_size = 10;
  bool verbose = false;
};

/// @brief Why a ranking has no entries.
enum class FitRankingStatus : uint8_t {
  Ok,
  NoSamples,    ///< No stored samples were supplied.
  NoPrototypes  ///< The registry has no prototype of the referenced families.
};

/// @brief Convert FitRankingStatus to lowercase string.
const char* fitRankingStatusToString(FitRankingStatus status);

/// @brief Leaderboard and comparison with the expression's own prototype.
struct PrototypeFitRanking {
  FitRankingStatus status = FitRankingStatus::Ok;
  std::string expression_id;
  size_t sample_count = 0;
  size_t regime_sample_count = 0;
  AxisConstraintMap constraints;
  std::vector<PrototypeFitEntry> leaderboard;   ///< Best first, at most leaderboard_size.
  std::optional<PrototypeFitEntry> current;     ///< Entry of the referenced prototype.
  std::string best_alternative;                 ///< Empty unless a better prototype exists.
  double improvement_factor = kNaN;             ///< Top score / current score.
};

/// @brief Scores every prototype against the stored samples of an
///        expression's Monte Carlo run.
///
/// Samples are first restricted to the expression's mood regime. Each
/// prototype then gets a gate-pass rate, an intensity distribution over its
/// gate-passing samples, and a sign-conflict score; computeCompositeScore
/// combines them. Exclusion compatibility is fixed at 1.
class PrototypeFitRanker {
 public:
  explicit PrototypeFitRanker(const IPrototypeRegistry& registry,
                              const FitRankingOptions& options = FitRankingOptions());

  /// @brief Rank the prototype families the expression references.
  ///
  /// Emotion prototypes are ranked when the expression references
  /// emotions.* or nothing at all; sexual prototypes when it references
  /// sexualStates.*. Ties keep registry order.
  ///
  /// @param expression Expression whose regime and prototype are used.
  /// @param samples Stored Monte Carlo contexts.
  PrototypeFitRanking rank(const Expression& expression,
                           const std::vector<AffectContext>& samples) const;

 private:
  PrototypeFitEntry scorePrototype(const Prototype& prototype,
                                   const std::vector<AffectContext>& regime,
                                   const AxisConstraintMap& constraints) const;

  const IPrototypeRegistry& registry_;
  FitRankingOptions options_;
};

}  // namespace affect

#endif  // AFFECT_DIAGNOSTICS_PROTOTYPE_FIT_RANKER_H
