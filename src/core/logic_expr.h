// Logic expression AST for expression prerequisites.
//
// A prerequisite is a small JSON-logic tree of comparisons and boolean
// combinators. It is parsed once into LogicNode and evaluated against a
// variable resolver for each sampled context.

#ifndef AFFECT_CORE_LOGIC_EXPR_H
#define AFFECT_CORE_LOGIC_EXPR_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/json_parser.h"

namespace affect {

/// @brief Node kinds of the logic AST.
enum class LogicOp : uint8_t {
  Number,     ///< Numeric literal.
  Bool,       ///< Boolean literal.
  Var,        ///< Variable reference {"var": "path"}.
  Greater,    ///< {">": [a, b]}
  GreaterEq,  ///< {">=": [a, b]}
  Less,       ///< {"<": [a, b]}
  LessEq,     ///< {"<=": [a, b]}
  Equal,      ///< {"==": [a, b]}
  And,        ///< {"and": [...]}
  Or,         ///< {"or": [...]}
  Not,        ///< {"!": x}
  Subtract    ///< {"-": [a, b]} or unary {"-": [a]}
};

/// @brief JSON-logic operator token for a node kind ("var", ">=", ...).
const char* logicOpToString(LogicOp op);

/// @brief True for the five binary comparison kinds.
bool isComparisonOp(LogicOp op);

/// @brief One node of a parsed logic expression.
struct LogicNode {
  LogicOp op = LogicOp::Bool;
  double number = 0.0;            ///< Value for Number.
  bool boolean = true;            ///< Value for Bool.
  std::string var_path;           ///< Path for Var.
  std::vector<LogicNode> children;
};

/// @brief Result of evaluating a node: a number, a boolean, or missing.
struct LogicValue {
  enum Kind { Missing, Number, Bool };
  Kind kind = Missing;
  double number = 0.0;
  bool boolean = false;

  static LogicValue missing() { return LogicValue(); }
  static LogicValue ofNumber(double val) {
    LogicValue out;
    out.kind = Number;
    out.number = val;
    return out;
  }
  static LogicValue ofBool(bool val) {
    LogicValue out;
    out.kind = Bool;
    out.boolean = val;
    return out;
  }

  /// @brief JSON-logic truthiness: nonzero numbers and true are truthy.
  bool truthy() const;
};

/// @brief Resolves variable paths during evaluation.
class IVariableResolver {
 public:
  virtual ~IVariableResolver() = default;

  /// @brief Look up a variable.
  /// @param path Dotted path, e.g. "emotions.joy".
  /// @param out Receives the value when found.
  /// @return False if the path does not resolve.
  virtual bool resolve(const std::string& path, double& out) const = 0;
};

/// @brief Outcome of converting JSON into a LogicNode.
struct LogicParseResult {
  bool success = false;
  std::string error_message;
  LogicNode node;
};

/// @brief Parse a JSON-logic value into an AST.
///
/// Unknown operators, string literals outside "var", and comparisons with
/// other than two operands fail with a message.
///
/// @param json Parsed JSON value.
/// @return Parsed AST or error.
LogicParseResult parseLogic(const JsonValue& json);

/// @brief Evaluate a node to a value.
LogicValue evaluateLogicValue(const LogicNode& node, const IVariableResolver& vars);

/// @brief Evaluate a node for truthiness. Missing values are false.
bool evaluateLogic(const LogicNode& node, const IVariableResolver& vars);

/// @brief Render a node as compact JSON-logic text, for reports.
std::string logicToString(const LogicNode& node);

/// @brief Convenience builders for tests and programmatic expressions.
namespace logic {

LogicNode number(double val);
LogicNode boolean(bool val);
LogicNode var(const std::string& path);
LogicNode compare(LogicOp op, LogicNode lhs, LogicNode rhs);
LogicNode allOf(std::vector<LogicNode> children);
LogicNode anyOf(std::vector<LogicNode> children);
LogicNode negate(LogicNode child);
LogicNode subtract(LogicNode lhs, LogicNode rhs);

}  // namespace logic

}  // namespace affect

#endif  // AFFECT_CORE_LOGIC_EXPR_H
