// Logic expression parsing and evaluation.

#include "core/logic_expr.h"

#include <cmath>
#include <cstdio>
#include <utility>

#include "core/json_helpers.h"

namespace affect {

const char* logicOpToString(LogicOp op) {
  switch (op) {
    case LogicOp::Number:    return "number";
    case LogicOp::Bool:      return "bool";
    case LogicOp::Var:       return "var";
    case LogicOp::Greater:   return ">";
    case LogicOp::GreaterEq: return ">=";
    case LogicOp::Less:      return "<";
    case LogicOp::LessEq:    return "<=";
    case LogicOp::Equal:     return "==";
    case LogicOp::And:       return "and";
    case LogicOp::Or:        return "or";
    case LogicOp::Not:       return "!";
    case LogicOp::Subtract:  return "-";
  }
  return "unknown";
}

bool isComparisonOp(LogicOp op) {
  switch (op) {
    case LogicOp::Greater:
    case LogicOp::GreaterEq:
    case LogicOp::Less:
    case LogicOp::LessEq:
    case LogicOp::Equal:
      return true;
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

bool LogicValue::truthy() const {
  switch (kind) {
    case Missing: return false;
    case Number:  return number != 0.0 && !std::isnan(number);
    case Bool:    return boolean;
  }
  return false;
}

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

namespace {

/// @brief Map an operator token to a node kind.
bool lookupOperator(const std::string& token, LogicOp& op) {
  static const std::pair<const char*, LogicOp> kOperators[] = {
      {">", LogicOp::Greater},   {">=", LogicOp::GreaterEq}, {"<", LogicOp::Less},
      {"<=", LogicOp::LessEq},   {"==", LogicOp::Equal},     {"===", LogicOp::Equal},
      {"and", LogicOp::And},     {"or", LogicOp::Or},        {"!", LogicOp::Not},
      {"-", LogicOp::Subtract},  {"var", LogicOp::Var}};
  for (const auto& entry : kOperators) {
    if (token == entry.first) {
      op = entry.second;
      return true;
    }
  }
  return false;
}

bool parseNode(const JsonValue& json, LogicNode& node, std::string& error);

/// @brief Parse an operator's argument list (array, or a single bare value).
bool parseArgs(const JsonValue& args, LogicNode& node, std::string& error) {
  if (args.isArray()) {
    for (const auto& arg : args.array_val) {
      LogicNode child;
      if (!parseNode(arg, child, error)) return false;
      node.children.push_back(std::move(child));
    }
    return true;
  }
  LogicNode child;
  if (!parseNode(args, child, error)) return false;
  node.children.push_back(std::move(child));
  return true;
}

bool parseVar(const JsonValue& args, LogicNode& node, std::string& error) {
  node.op = LogicOp::Var;
  const JsonValue* path = &args;
  if (args.isArray()) {
    if (args.array_val.empty()) {
      error = "var requires a path";
      return false;
    }
    path = &args.array_val.front();
  }
  if (!path->isString() || path->string_val.empty()) {
    error = "var path must be a non-empty string";
    return false;
  }
  node.var_path = path->string_val;
  return true;
}

bool parseNode(const JsonValue& json, LogicNode& node, std::string& error) {
  switch (json.type) {
    case JsonValue::Number:
      node.op = LogicOp::Number;
      node.number = json.number_val;
      return true;
    case JsonValue::Bool:
      node.op = LogicOp::Bool;
      node.boolean = json.bool_val;
      return true;
    case JsonValue::Null:
      error = "null is not a valid logic operand";
      return false;
    case JsonValue::String:
      error = "string literal \"" + json.string_val + "\" is not a valid operand";
      return false;
    case JsonValue::Array:
      error = "array is not a valid logic operand";
      return false;
    case JsonValue::Object:
      break;
  }

  if (json.object_val.size() != 1) {
    error = "logic object must have exactly one operator";
    return false;
  }
  const std::string& token = json.object_val.front().first;
  const JsonValue& args = json.object_val.front().second;

  LogicOp op = LogicOp::Bool;
  if (!lookupOperator(token, op)) {
    error = "unknown operator \"" + token + "\"";
    return false;
  }
  if (op == LogicOp::Var) return parseVar(args, node, error);

  node.op = op;
  if (!parseArgs(args, node, error)) return false;

  if (isComparisonOp(op) && node.children.size() != 2) {
    error = std::string("operator ") + token + " expects 2 operands";
    return false;
  }
  if (op == LogicOp::Not && node.children.size() != 1) {
    error = "operator ! expects 1 operand";
    return false;
  }
  if (op == LogicOp::Subtract &&
      (node.children.empty() || node.children.size() > 2)) {
    error = "operator - expects 1 or 2 operands";
    return false;
  }
  return true;
}

}  // namespace

LogicParseResult parseLogic(const JsonValue& json) {
  LogicParseResult result;
  if (!parseNode(json, result.node, result.error_message)) {
    result.node = LogicNode();
    return result;
  }
  result.success = true;
  return result;
}

// ---------------------------------------------------------------------------
// Evaluation
// ---------------------------------------------------------------------------

namespace {

bool compareNumbers(LogicOp op, double lhs, double rhs) {
  switch (op) {
    case LogicOp::Greater:   return lhs > rhs;
    case LogicOp::GreaterEq: return lhs >= rhs;
    case LogicOp::Less:      return lhs < rhs;
    case LogicOp::LessEq:    return lhs <= rhs;
    case LogicOp::Equal:     return lhs == rhs;
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

/// @brief Numeric view of a value. Booleans coerce to 0/1.
bool numericValue(const LogicValue& val, double& out) {
  switch (val.kind) {
    case LogicValue::Missing:
      return false;
    case LogicValue::Number:
      out = val.number;
      return !std::isnan(out);
    case LogicValue::Bool:
      out = val.boolean ? 1.0 : 0.0;
      return true;
  }
  return false;
}

}  // namespace

LogicValue evaluateLogicValue(const LogicNode& node, const IVariableResolver& vars) {
  switch (node.op) {
    case LogicOp::Number:
      return LogicValue::ofNumber(node.number);
    case LogicOp::Bool:
      return LogicValue::ofBool(node.boolean);
    case LogicOp::Var: {
      double resolved = 0.0;
      if (!vars.resolve(node.var_path, resolved)) return LogicValue::missing();
      return LogicValue::ofNumber(resolved);
    }
    case LogicOp::Greater:
    case LogicOp::GreaterEq:
    case LogicOp::Less:
    case LogicOp::LessEq:
    case LogicOp::Equal: {
      double lhs = 0.0;
      double rhs = 0.0;
      if (!numericValue(evaluateLogicValue(node.children[0], vars), lhs) ||
          !numericValue(evaluateLogicValue(node.children[1], vars), rhs)) {
        return LogicValue::ofBool(false);
      }
      return LogicValue::ofBool(compareNumbers(node.op, lhs, rhs));
    }
    case LogicOp::And:
      for (const auto& child : node.children) {
        if (!evaluateLogic(child, vars)) return LogicValue::ofBool(false);
      }
      return LogicValue::ofBool(true);
    case LogicOp::Or:
      for (const auto& child : node.children) {
        if (evaluateLogic(child, vars)) return LogicValue::ofBool(true);
      }
      return LogicValue::ofBool(false);
    case LogicOp::Not:
      return LogicValue::ofBool(!evaluateLogic(node.children[0], vars));
    case LogicOp::Subtract: {
      double lhs = 0.0;
      if (!numericValue(evaluateLogicValue(node.children[0], vars), lhs)) {
        return LogicValue::missing();
      }
      if (node.children.size() == 1) return LogicValue::ofNumber(-lhs);
      double rhs = 0.0;
      if (!numericValue(evaluateLogicValue(node.children[1], vars), rhs)) {
        return LogicValue::missing();
      }
      return LogicValue::ofNumber(lhs - rhs);
    }
  }
  return LogicValue::missing();
}

bool evaluateLogic(const LogicNode& node, const IVariableResolver& vars) {
  return evaluateLogicValue(node, vars).truthy();
}

// ---------------------------------------------------------------------------
// Rendering
// ---------------------------------------------------------------------------

namespace {

void writeNode(const LogicNode& node, JsonWriter& writer) {
  switch (node.op) {
    case LogicOp::Number:
      writer.value(node.number);
      return;
    case LogicOp::Bool:
      writer.value(node.boolean);
      return;
    case LogicOp::Var:
      writer.beginObject();
      writer.field("var", node.var_path);
      writer.endObject();
      return;
    case LogicOp::Greater:
    case LogicOp::GreaterEq:
    case LogicOp::Less:
    case LogicOp::LessEq:
    case LogicOp::Equal:
    case LogicOp::And:
    case LogicOp::Or:
    case LogicOp::Not:
    case LogicOp::Subtract:
      writer.beginObject();
      writer.key(logicOpToString(node.op));
      writer.beginArray();
      for (const auto& child : node.children) {
        writeNode(child, writer);
      }
      writer.endArray();
      writer.endObject();
      return;
  }
}

}  // namespace

std::string logicToString(const LogicNode& node) {
  JsonWriter writer;
  writeNode(node, writer);
  return writer.toString();
}

// ---------------------------------------------------------------------------
// Builders
// ---------------------------------------------------------------------------

namespace logic {

LogicNode number(double val) {
  LogicNode node;
  node.op = LogicOp::Number;
  node.number = val;
  return node;
}

LogicNode boolean(bool val) {
  LogicNode node;
  node.op = LogicOp::Bool;
  node.boolean = val;
  return node;
}

LogicNode var(const std::string& path) {
  LogicNode node;
  node.op = LogicOp::Var;
  node.var_path = path;
  return node;
}

LogicNode compare(LogicOp op, LogicNode lhs, LogicNode rhs) {
  LogicNode node;
  node.op = op;
  node.children.push_back(std::move(lhs));
  node.children.push_back(std::move(rhs));
  return node;
}

LogicNode allOf(std::vector<LogicNode> children) {
  LogicNode node;
  node.op = LogicOp::And;
  node.children = std::move(children);
  return node;
}

LogicNode anyOf(std::vector<LogicNode> children) {
  LogicNode node;
  node.op = LogicOp::Or;
  node.children = std::move(children);
  return node;
}

LogicNode negate(LogicNode child) {
  LogicNode node;
  node.op = LogicOp::Not;
  node.children.push_back(std::move(child));
  return node;
}

LogicNode subtract(LogicNode lhs, LogicNode rhs) {
  LogicNode node;
  node.op = LogicOp::Subtract;
  node.children.push_back(std::move(lhs));
  node.children.push_back(std::move(rhs));
  return node;
}

}  // namespace logic

}  // namespace affect
