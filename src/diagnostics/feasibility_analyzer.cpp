// Feasibility analyzer implementation.

#include "diagnostics/feasibility_analyzer.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

#include "core/diag_log.h"

namespace affect {

const char* feasibilityClassToString(FeasibilityClass cls) {
  switch (cls) {
    case FeasibilityClass::Ok:                      return "OK";
    case FeasibilityClass::TheoreticallyImpossible: return "THEORETICALLY_IMPOSSIBLE";
    case FeasibilityClass::EmpiricallyUnreachable:  return "EMPIRICALLY_UNREACHABLE";
  }
  return "UNKNOWN";
}

void clauseSignalDomain(ClauseSignal signal, double& lo, double& hi) {
  switch (signal) {
    case ClauseSignal::Raw:
      lo = 0.0;
      hi = 1.0;
      return;
    case ClauseSignal::Delta:
      lo = -1.0;
      hi = 1.0;
      return;
  }
}

bool isStructurallyImpossible(const ClauseSpec& clause) {
  double lo = 0.0;
  double hi = 0.0;
  clauseSignalDomain(clause.signal, lo, hi);
  switch (clause.op) {
    case LogicOp::GreaterEq: return clause.threshold > hi;
    case LogicOp::Greater:   return clause.threshold >= hi;
    case LogicOp::LessEq:    return clause.threshold < lo;
    case LogicOp::Less:      return clause.threshold <= lo;
    case LogicOp::Equal:     return clause.threshold < lo || clause.threshold > hi;
    case LogicOp::Number:
    case LogicOp::Bool:
    case LogicOp::Var:
    case LogicOp::And:
    case LogicOp::Or:
    case LogicOp::Not:
    case LogicOp::Subtract:
      return false;
  }
  return false;
}

namespace {

bool passes(LogicOp op, double value, double threshold) {
  switch (op) {
    case LogicOp::GreaterEq: return value >= threshold;
    case LogicOp::Greater:   return value > threshold;
    case LogicOp::LessEq:    return value <= threshold;
    case LogicOp::Less:      return value < threshold;
    case LogicOp::Equal:     return value == threshold;
    case LogicOp::Number:
    case LogicOp::Bool:
    case LogicOp::Var:
    case LogicOp::And:
    case LogicOp::Or:
    case LogicOp::Not:
    case LogicOp::Subtract:
      return false;
  }
  return false;
}

bool isUpperBoundOp(LogicOp op) {
  return op == LogicOp::GreaterEq || op == LogicOp::Greater;
}

bool signalValue(const ClauseSpec& clause, const EvaluationContext& ctx, double& out) {
  double current = 0.0;
  if (!ctx.resolve(clause.variable_path, current)) return false;
  if (clause.signal == ClauseSignal::Raw) {
    out = current;
    return true;
  }
  double previous = 0.0;
  if (!ctx.resolve(clause.previous_path, previous)) return false;
  out = current - previous;
  return true;
}

}  // namespace

FeasibilityResult FeasibilityAnalyzer::analyzeClause(
    const ClauseSpec& clause, const std::vector<EvaluationContext>& pool) const {
  FeasibilityResult result;
  result.clause_id = clause.clause_id;
  result.signal = clause.signal;
  result.variable_path = clause.variable_path;
  result.op = clause.op;
  result.threshold = clause.threshold;
  result.max_value = kNaN;
  result.min_value = kNaN;

  size_t pass_count = 0;
  for (const auto& ctx : pool) {
    double value = 0.0;
    if (!signalValue(clause, ctx, value) || std::isnan(value)) continue;
    if (result.sample_count == 0) {
      result.max_value = value;
      result.min_value = value;
    } else {
      result.max_value = std::max(result.max_value, value);
      result.min_value = std::min(result.min_value, value);
    }
    ++result.sample_count;
    if (passes(clause.op, value, clause.threshold)) ++pass_count;
  }
  if (result.sample_count > 0) {
    result.pass_rate = static_cast<double>(pass_count) / static_cast<double>(result.sample_count);
  }

  char buf[160];
  if (pass_count > 0) {
    result.classification = FeasibilityClass::Ok;
    std::snprintf(buf, sizeof(buf), "%zu of %zu samples pass", pass_count, result.sample_count);
  } else if (isStructurallyImpossible(clause)) {
    result.classification = FeasibilityClass::TheoreticallyImpossible;
    double lo = 0.0;
    double hi = 0.0;
    clauseSignalDomain(clause.signal, lo, hi);
    std::snprintf(buf, sizeof(buf), "threshold %g unreachable in domain [%g, %g]",
                  clause.threshold, lo, hi);
  } else {
    result.classification = FeasibilityClass::EmpiricallyUnreachable;
    if (result.sample_count == 0) {
      std::snprintf(buf, sizeof(buf), "signal never resolved in %zu samples", pool.size());
    } else if (isUpperBoundOp(clause.op)) {
      std::snprintf(buf, sizeof(buf), "ceiling: max observed %g vs threshold %g over %zu samples",
                    result.max_value, clause.threshold, result.sample_count);
    } else {
      std::snprintf(buf, sizeof(buf), "floor: min observed %g vs threshold %g over %zu samples",
                    result.min_value, clause.threshold, result.sample_count);
    }
  }
  result.evidence = buf;
  return result;
}

std::vector<FeasibilityResult> FeasibilityAnalyzer::analyze(
    const std::vector<Prerequisite>& prerequisites,
    const std::vector<EvaluationContext>& pool,
    const std::string& expression_id) const {
  NonAxisClauseExtractor extractor;
  std::vector<ClauseSpec> clauses = extractor.extract(prerequisites);

  std::vector<FeasibilityResult> results;
  results.reserve(clauses.size());
  for (const auto& clause : clauses) {
    FeasibilityResult result = analyzeClause(clause, pool);
    result.expression_id = expression_id;
    logDebug(verbose_, "FeasibilityAnalyzer", "%s %s %s %s %g: %s (pass rate %.4f)",
             expression_id.c_str(), clause.clause_id.c_str(), clause.variable_path.c_str(),
             logicOpToString(clause.op), clause.threshold,
             feasibilityClassToString(result.classification), result.pass_rate);
    results.push_back(result);
  }
  return results;
}

}  // namespace affect
