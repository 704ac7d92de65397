// Non-axis clause extraction.

#include "diagnostics/clause_extractor.h"

#include <utility>

namespace affect {

const char* clauseSignalToString(ClauseSignal signal) {
  switch (signal) {
    case ClauseSignal::Raw:   return "raw";
    case ClauseSignal::Delta: return "delta";
  }
  return "unknown";
}

namespace {

bool startsWith(const std::string& str, const char* prefix) {
  return str.rfind(prefix, 0) == 0;
}

/// @brief Mirror an operator for swapped operands (a < b <=> b > a).
LogicOp mirror(LogicOp op) {
  switch (op) {
    case LogicOp::Greater:   return LogicOp::Less;
    case LogicOp::GreaterEq: return LogicOp::LessEq;
    case LogicOp::Less:      return LogicOp::Greater;
    case LogicOp::LessEq:    return LogicOp::GreaterEq;
    case LogicOp::Equal:
    case LogicOp::Number:
    case LogicOp::Bool:
    case LogicOp::Var:
    case LogicOp::And:
    case LogicOp::Or:
    case LogicOp::Not:
    case LogicOp::Subtract:
      return op;
  }
  return op;
}

/// @brief Match {"-": [{"var": P}, {"var": Q}]} with both non-axis.
bool matchDelta(const LogicNode& node, std::string& current, std::string& previous) {
  if (node.op != LogicOp::Subtract || node.children.size() != 2) return false;
  const LogicNode& lhs = node.children[0];
  const LogicNode& rhs = node.children[1];
  if (lhs.op != LogicOp::Var || rhs.op != LogicOp::Var) return false;
  if (!isNonAxisPath(lhs.var_path) || !isNonAxisPath(rhs.var_path)) return false;
  current = lhs.var_path;
  previous = rhs.var_path;
  return true;
}

}  // namespace

bool isNonAxisPath(const std::string& path) {
  return startsWith(path, "emotions.") || startsWith(path, "sexualStates.") ||
         path == "sexualArousal" || startsWith(path, "previousEmotions.") ||
         startsWith(path, "previousSexualStates.") || path == "previousSexualArousal";
}

std::vector<ClauseSpec> NonAxisClauseExtractor::extract(
    const std::vector<Prerequisite>& prerequisites) const {
  std::vector<ClauseSpec> clauses;
  for (size_t idx = 0; idx < prerequisites.size(); ++idx) {
    size_t ordinal = 0;
    visit(prerequisites[idx].logic, idx, ordinal, clauses);
  }
  return clauses;
}

void NonAxisClauseExtractor::visit(const LogicNode& node, size_t prereq_index,
                                   size_t& ordinal, std::vector<ClauseSpec>& out) const {
  if (node.op == LogicOp::And || node.op == LogicOp::Or) {
    for (const auto& child : node.children) {
      visit(child, prereq_index, ordinal, out);
    }
    return;
  }
  if (!isComparisonOp(node.op) || node.children.size() != 2) return;

  const LogicNode* operand = &node.children[0];
  const LogicNode* literal = &node.children[1];
  LogicOp op = node.op;
  if (operand->op == LogicOp::Number && literal->op != LogicOp::Number) {
    std::swap(operand, literal);
    op = mirror(op);
  }
  if (literal->op != LogicOp::Number) return;

  ClauseSpec clause;
  clause.prerequisite_index = prereq_index;
  clause.op = op;
  clause.threshold = literal->number;
  if (operand->op == LogicOp::Var && isNonAxisPath(operand->var_path)) {
    clause.signal = ClauseSignal::Raw;
    clause.variable_path = operand->var_path;
  } else if (matchDelta(*operand, clause.variable_path, clause.previous_path)) {
    clause.signal = ClauseSignal::Delta;
  } else {
    return;
  }
  clause.clause_id = std::to_string(prereq_index) + "." + std::to_string(ordinal++);
  out.push_back(clause);
}

}  // namespace affect
