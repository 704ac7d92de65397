// Extraction of threshold clauses on emotion-level (non-axis) signals.

#ifndef AFFECT_DIAGNOSTICS_CLAUSE_EXTRACTOR_H
#define AFFECT_DIAGNOSTICS_CLAUSE_EXTRACTOR_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "core/logic_expr.h"

namespace affect {

/// @brief What a clause compares against its threshold.
enum class ClauseSignal : uint8_t {
  Raw,   ///< The variable's current value.
  Delta  ///< current - previous of the same signal.
};

/// @brief Convert ClauseSignal to "raw"/"delta".
const char* clauseSignalToString(ClauseSignal signal);

/// @brief One normalized threshold clause.
struct ClauseSpec {
  std::string clause_id;        ///< "<prereq index>.<ordinal>", stable per expression.
  size_t prerequisite_index = 0;
  ClauseSignal signal = ClauseSignal::Raw;
  std::string variable_path;    ///< e.g. "emotions.joy".
  std::string previous_path;    ///< Delta only, e.g. "previousEmotions.joy".
  LogicOp op = LogicOp::GreaterEq;
  double threshold = 0.0;
};

/// @brief True for paths of emotion-level signals (emotions, sexual states,
///        sexual arousal and their previous-state counterparts).
bool isNonAxisPath(const std::string& path);

/// @brief Walks prerequisites and collects comparisons on non-axis signals.
///
/// Recognized shapes, inside any nesting of "and"/"or":
///   {op: [{"var": P}, number]}
///   {op: [number, {"var": P}]}                (operator is mirrored)
///   {op: [{"-": [{"var": P}, {"var": Q}]}, number]}   (delta, Q previous of P)
/// Comparisons under "!" and between two variables are skipped.
class NonAxisClauseExtractor {
 public:
  /// @brief Extract clauses in document order.
  std::vector<ClauseSpec> extract(const std::vector<Prerequisite>& prerequisites) const;

 private:
  void visit(const LogicNode& node, size_t prereq_index, size_t& ordinal,
             std::vector<ClauseSpec>& out) const;
};

}  // namespace affect

#endif  // AFFECT_DIAGNOSTICS_CLAUSE_EXTRACTOR_H
