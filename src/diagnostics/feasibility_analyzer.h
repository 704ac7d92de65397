// Statistical three-tier feasibility classification of threshold clauses.

#ifndef AFFECT_DIAGNOSTICS_FEASIBILITY_ANALYZER_H
#define AFFECT_DIAGNOSTICS_FEASIBILITY_ANALYZER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "diagnostics/clause_extractor.h"
#include "sampling/evaluation_context.h"

namespace affect {

/// @brief Feasibility verdict of one clause.
enum class FeasibilityClass : uint8_t {
  Ok,                       ///< At least one sample passes.
  TheoreticallyImpossible,  ///< No pass, and the signal's domain cannot reach the threshold.
  EmpiricallyUnreachable    ///< No pass, but only the sampled extreme shows it.
};

/// @brief Convert FeasibilityClass to its report string (e.g. "THEORETICALLY_IMPOSSIBLE").
const char* feasibilityClassToString(FeasibilityClass cls);

/// @brief Per-clause feasibility report.
struct FeasibilityResult {
  std::string expression_id;
  std::string clause_id;
  ClauseSignal signal = ClauseSignal::Raw;
  std::string variable_path;
  LogicOp op = LogicOp::GreaterEq;
  double threshold = 0.0;
  double pass_rate = 0.0;
  double max_value = 0.0;  ///< NaN when no sample resolved the signal.
  double min_value = 0.0;  ///< NaN when no sample resolved the signal.
  size_t sample_count = 0; ///< Samples where the signal resolved.
  FeasibilityClass classification = FeasibilityClass::EmpiricallyUnreachable;
  std::string evidence;
};

/// @brief Domain [lo, hi] of a clause's signal: [0, 1] raw, [-1, 1] delta.
void clauseSignalDomain(ClauseSignal signal, double& lo, double& hi);

/// @brief True if no value in the signal's domain can satisfy the clause.
bool isStructurallyImpossible(const ClauseSpec& clause);

/// @brief Scans a context pool once per clause and classifies it.
///
/// Classification is derived from pass_rate first: any pass is Ok, so a
/// clause can never be reported both reachable and impossible.
class FeasibilityAnalyzer {
 public:
  explicit FeasibilityAnalyzer(bool verbose = false) : verbose_(verbose) {}

  /// @brief Classify every non-axis clause of the prerequisites.
  /// @param prerequisites Expression prerequisites.
  /// @param pool Evaluation contexts.
  /// @param expression_id Id copied into each result.
  /// @return One result per extracted clause, in extraction order.
  std::vector<FeasibilityResult> analyze(const std::vector<Prerequisite>& prerequisites,
                                         const std::vector<EvaluationContext>& pool,
                                         const std::string& expression_id) const;

  /// @brief Classify a single clause.
  FeasibilityResult analyzeClause(const ClauseSpec& clause,
                                  const std::vector<EvaluationContext>& pool) const;

 private:
  bool verbose_;
};

}  // namespace affect

#endif  // AFFECT_DIAGNOSTICS_FEASIBILITY_ANALYZER_H
