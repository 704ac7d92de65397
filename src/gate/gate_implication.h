// Deterministic gate implication via per-axis interval containment.

#ifndef AFFECT_GATE_GATE_IMPLICATION_H
#define AFFECT_GATE_GATE_IMPLICATION_H

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "gate/gate_checker.h"

namespace affect {

/// @brief Interval on one normalized axis. Missing bounds are infinite.
///
/// Strict gates (">", "<") give open bounds, so "> 0.5" and "< 0.5" together
/// leave no point.
struct AxisInterval {
  bool has_lower = false;
  double lower = 0.0;
  bool lower_strict = false;
  bool has_upper = false;
  double upper = 0.0;
  bool upper_strict = false;
  bool unsatisfiable = false;

  /// @brief True if every point of this interval lies in other.
  ///
  /// An unsatisfiable interval is a subset of anything.
  bool isSubsetOf(const AxisInterval& other) const;

  /// @brief True if the two intervals share no point.
  bool isDisjointFrom(const AxisInterval& other) const;

  /// @brief Render as "[lo, hi]", "(lo, hi)" etc., with "-inf"/"+inf" for
  ///        missing bounds.
  std::string toString() const;
};

/// Axis name -> interval. A missing axis is unconstrained.
using IntervalMap = std::map<std::string, AxisInterval>;

/// @brief Fold parsed gates into per-axis intervals.
///
/// Lower bounds tighten by max, upper bounds by min, "==" pins both; at equal
/// values the strict bound wins. An axis becomes unsatisfiable when its
/// bounds cross, meet at an open end, or exclude the normalized domain of a
/// known axis.
IntervalMap buildGateIntervals(const std::vector<ParsedGate>& gates);

/// @brief Relationship between two gate regions.
enum class ImplicationRelation : uint8_t {
  Equal,       ///< Mutual implication.
  Narrower,    ///< A implies B only.
  Wider,       ///< B implies A only.
  Disjoint,    ///< Some shared axis has no common point.
  Overlapping  ///< Anything else.
};

/// @brief Convert ImplicationRelation to lowercase string.
const char* implicationRelationToString(ImplicationRelation relation);

/// @brief Per-axis interval comparison.
struct ImplicationEvidence {
  std::string axis;
  AxisInterval interval_a;
  AxisInterval interval_b;
  bool a_within_b = false;
  bool b_within_a = false;
};

/// @brief Outcome of comparing two gate regions.
struct GateImplicationResult {
  bool a_implies_b = false;
  bool b_implies_a = false;
  /// True when either side is unsatisfiable, making its implication trivial.
  bool is_vacuous = false;
  bool a_unsatisfiable = false;
  bool b_unsatisfiable = false;
  ImplicationRelation relation = ImplicationRelation::Overlapping;
  std::vector<std::string> counter_example_axes;  ///< Axes where A is not within B.
  std::vector<ImplicationEvidence> evidence;      ///< One entry per axis in either map.
};

/// @brief Compare gate regions A and B axis by axis.
/// @param intervals_a Intervals of prototype A.
/// @param intervals_b Intervals of prototype B.
/// @return Implication flags, relation and evidence.
GateImplicationResult evaluateGateImplication(const IntervalMap& intervals_a,
                                              const IntervalMap& intervals_b);

}  // namespace affect

#endif  // AFFECT_GATE_GATE_IMPLICATION_H
