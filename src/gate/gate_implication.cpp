// Gate implication implementation.

#include "gate/gate_implication.h"

#include <algorithm>
#include <cstdio>
#include <set>

namespace affect {

bool AxisInterval::isSubsetOf(const AxisInterval& other) const {
  if (unsatisfiable) return true;
  if (other.unsatisfiable) return false;
  if (other.has_lower) {
    if (!has_lower || lower < other.lower) return false;
    if (lower == other.lower && other.lower_strict && !lower_strict) return false;
  }
  if (other.has_upper) {
    if (!has_upper || upper > other.upper) return false;
    if (upper == other.upper && other.upper_strict && !upper_strict) return false;
  }
  return true;
}

namespace {

/// True if an upper bound lies below a lower bound, or touches it at an
/// open end.
bool boundsSeparate(double upper, bool upper_strict, double lower, bool lower_strict) {
  return upper < lower || (upper == lower && (upper_strict || lower_strict));
}

}  // namespace

bool AxisInterval::isDisjointFrom(const AxisInterval& other) const {
  if (unsatisfiable || other.unsatisfiable) return true;
  if (has_upper && other.has_lower &&
      boundsSeparate(upper, upper_strict, other.lower, other.lower_strict)) {
    return true;
  }
  if (other.has_upper && has_lower &&
      boundsSeparate(other.upper, other.upper_strict, lower, lower_strict)) {
    return true;
  }
  return false;
}

std::string AxisInterval::toString() const {
  if (unsatisfiable) return "empty";
  char buf[64];
  std::string lo = has_lower ? "" : "-inf";
  std::string hi = has_upper ? "" : "+inf";
  if (has_lower) {
    std::snprintf(buf, sizeof(buf), "%g", lower);
    lo = buf;
  }
  if (has_upper) {
    std::snprintf(buf, sizeof(buf), "%g", upper);
    hi = buf;
  }
  return std::string(has_lower && lower_strict ? "(" : "[") + lo + ", " + hi +
         (has_upper && upper_strict ? ")" : "]");
}

namespace {

/// @brief Normalized domain of a known axis.
bool normalizedDomain(const std::string& axis_name, double& lo, double& hi) {
  if (axis_name == axis::kSexualArousal || axis_name == axis::kSexualArousalAlias) {
    lo = 0.0;
    hi = 1.0;
    return true;
  }
  AxisRange range;
  if (!rawAxisRange(axis_name, range)) return false;
  if (axis_name == axis::kBaselineLibido) return false;
  lo = range.min < 0.0 ? -1.0 : 0.0;
  hi = 1.0;
  return true;
}

void tightenLower(AxisInterval& interval, double value, bool strict) {
  if (!interval.has_lower || value > interval.lower) {
    interval.lower = value;
    interval.lower_strict = strict;
  } else if (value == interval.lower) {
    interval.lower_strict = interval.lower_strict || strict;
  }
  interval.has_lower = true;
}

void tightenUpper(AxisInterval& interval, double value, bool strict) {
  if (!interval.has_upper || value < interval.upper) {
    interval.upper = value;
    interval.upper_strict = strict;
  } else if (value == interval.upper) {
    interval.upper_strict = interval.upper_strict || strict;
  }
  interval.has_upper = true;
}

bool isMapUnsatisfiable(const IntervalMap& intervals) {
  for (const auto& entry : intervals) {
    if (entry.second.unsatisfiable) return true;
  }
  return false;
}

}  // namespace

IntervalMap buildGateIntervals(const std::vector<ParsedGate>& gates) {
  IntervalMap intervals;
  for (const auto& gate : gates) {
    AxisInterval& interval = intervals[gate.axis];
    switch (gate.op) {
      case GateOp::Greater:
        tightenLower(interval, gate.value, true);
        break;
      case GateOp::GreaterEq:
        tightenLower(interval, gate.value, false);
        break;
      case GateOp::Less:
        tightenUpper(interval, gate.value, true);
        break;
      case GateOp::LessEq:
        tightenUpper(interval, gate.value, false);
        break;
      case GateOp::Equal:
        tightenLower(interval, gate.value, false);
        tightenUpper(interval, gate.value, false);
        break;
    }
  }

  for (auto& entry : intervals) {
    AxisInterval& interval = entry.second;
    if (interval.has_lower && interval.has_upper &&
        boundsSeparate(interval.upper, interval.upper_strict, interval.lower,
                       interval.lower_strict)) {
      interval.unsatisfiable = true;
      continue;
    }
    double lo = 0.0;
    double hi = 0.0;
    if (normalizedDomain(entry.first, lo, hi)) {
      if ((interval.has_lower && boundsSeparate(hi, false, interval.lower, interval.lower_strict)) ||
          (interval.has_upper && boundsSeparate(interval.upper, interval.upper_strict, lo, false))) {
        interval.unsatisfiable = true;
      }
    }
  }
  return intervals;
}

const char* implicationRelationToString(ImplicationRelation relation) {
  switch (relation) {
    case ImplicationRelation::Equal:       return "equal";
    case ImplicationRelation::Narrower:    return "narrower";
    case ImplicationRelation::Wider:       return "wider";
    case ImplicationRelation::Disjoint:    return "disjoint";
    case ImplicationRelation::Overlapping: return "overlapping";
  }
  return "unknown";
}

GateImplicationResult evaluateGateImplication(const IntervalMap& intervals_a,
                                              const IntervalMap& intervals_b) {
  GateImplicationResult result;
  result.a_unsatisfiable = isMapUnsatisfiable(intervals_a);
  result.b_unsatisfiable = isMapUnsatisfiable(intervals_b);
  result.is_vacuous = result.a_unsatisfiable || result.b_unsatisfiable;

  std::set<std::string> axes;
  for (const auto& entry : intervals_a) axes.insert(entry.first);
  for (const auto& entry : intervals_b) axes.insert(entry.first);

  const AxisInterval unconstrained;
  bool a_within_b_all = true;
  bool b_within_a_all = true;
  bool any_disjoint = false;

  for (const auto& axis_name : axes) {
    auto iter_a = intervals_a.find(axis_name);
    auto iter_b = intervals_b.find(axis_name);
    const AxisInterval& interval_a = iter_a != intervals_a.end() ? iter_a->second : unconstrained;
    const AxisInterval& interval_b = iter_b != intervals_b.end() ? iter_b->second : unconstrained;

    ImplicationEvidence evidence;
    evidence.axis = axis_name;
    evidence.interval_a = interval_a;
    evidence.interval_b = interval_b;
    evidence.a_within_b = interval_a.isSubsetOf(interval_b);
    evidence.b_within_a = interval_b.isSubsetOf(interval_a);

    if (!evidence.a_within_b) {
      a_within_b_all = false;
      result.counter_example_axes.push_back(axis_name);
    }
    if (!evidence.b_within_a) b_within_a_all = false;
    if (iter_a != intervals_a.end() && iter_b != intervals_b.end() &&
        interval_a.isDisjointFrom(interval_b)) {
      any_disjoint = true;
    }
    result.evidence.push_back(evidence);
  }

  // An unsatisfiable region implies anything.
  result.a_implies_b = result.a_unsatisfiable || a_within_b_all;
  result.b_implies_a = result.b_unsatisfiable || b_within_a_all;

  if (result.a_implies_b && result.b_implies_a) {
    result.relation = ImplicationRelation::Equal;
  } else if (result.a_implies_b) {
    result.relation = ImplicationRelation::Narrower;
  } else if (result.b_implies_a) {
    result.relation = ImplicationRelation::Wider;
  } else if (any_disjoint) {
    result.relation = ImplicationRelation::Disjoint;
  } else {
    result.relation = ImplicationRelation::Overlapping;
  }
  return result;
}

}  // namespace affect
