// Gate parsing and evaluation.

#include "gate/gate_checker.h"

#include <cctype>
#include <cmath>
#include <cstdlib>

#include "core/diag_log.h"

namespace affect {

const char* gateOpToString(GateOp op) {
  switch (op) {
    case GateOp::Greater:   return ">";
    case GateOp::GreaterEq: return ">=";
    case GateOp::Less:      return "<";
    case GateOp::LessEq:    return "<=";
    case GateOp::Equal:     return "==";
  }
  return "?";
}

const char* gateParseStatusToString(GateParseStatus status) {
  switch (status) {
    case GateParseStatus::Complete: return "complete";
    case GateParseStatus::Partial:  return "partial";
  }
  return "unknown";
}

namespace {

bool isWordChar(char chr) {
  return std::isalnum(static_cast<unsigned char>(chr)) || chr == '_';
}

bool isSpace(char chr) {
  return std::isspace(static_cast<unsigned char>(chr)) != 0;
}

/// @brief Match "-?\d*\.?\d+" over the whole remaining text.
bool parseGateNumber(const std::string& text, size_t pos, double& out) {
  size_t start = pos;
  if (pos < text.size() && text[pos] == '-') ++pos;
  size_t int_digits = 0;
  while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
    ++pos;
    ++int_digits;
  }
  size_t frac_digits = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
      ++pos;
      ++frac_digits;
    }
    if (frac_digits == 0) return false;
  } else if (int_digits == 0) {
    return false;
  }
  if (pos != text.size()) return false;

  out = std::strtod(text.c_str() + start, nullptr);
  return true;
}

}  // namespace

bool parseGate(const std::string& text, ParsedGate& out) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && isSpace(text[begin])) ++begin;
  while (end > begin && isSpace(text[end - 1])) --end;
  std::string trimmed = text.substr(begin, end - begin);

  size_t pos = 0;
  while (pos < trimmed.size() && isWordChar(trimmed[pos])) ++pos;
  if (pos == 0) return false;
  std::string axis_name = trimmed.substr(0, pos);

  while (pos < trimmed.size() && isSpace(trimmed[pos])) ++pos;

  GateOp op = GateOp::GreaterEq;
  auto startsWith = [&](const char* token) {
    return trimmed.compare(pos, std::char_traits<char>::length(token), token) == 0;
  };
  if (startsWith(">=")) {
    op = GateOp::GreaterEq;
    pos += 2;
  } else if (startsWith("<=")) {
    op = GateOp::LessEq;
    pos += 2;
  } else if (startsWith("==")) {
    op = GateOp::Equal;
    pos += 2;
  } else if (startsWith(">")) {
    op = GateOp::Greater;
    pos += 1;
  } else if (startsWith("<")) {
    op = GateOp::Less;
    pos += 1;
  } else {
    return false;
  }

  while (pos < trimmed.size() && isSpace(trimmed[pos])) ++pos;

  double threshold = 0.0;
  if (!parseGateNumber(trimmed, pos, threshold)) return false;

  out.axis = axis_name;
  out.op = op;
  out.value = threshold;
  out.source = text;
  return true;
}

ParsedGateSet parseGates(const std::vector<std::string>& gates,
                         const std::string& owner_id) {
  ParsedGateSet result;
  result.info.total_gate_count = gates.size();
  for (const auto& text : gates) {
    ParsedGate parsed;
    if (parseGate(text, parsed)) {
      result.gates.push_back(parsed);
      continue;
    }
    result.info.unparsed_gates.push_back(text);
    if (!owner_id.empty()) {
      logWarn("GateChecker", "%s: invalid gate format \"%s\", skipped",
              owner_id.c_str(), text.c_str());
    }
  }
  result.info.parsed_gate_count = result.gates.size();
  result.info.parse_status = result.info.unparsed_gates.empty()
                                 ? GateParseStatus::Complete
                                 : GateParseStatus::Partial;
  return result;
}

bool evaluateGate(const ParsedGate& gate, double axis_value) {
  switch (gate.op) {
    case GateOp::Greater:   return axis_value > gate.value;
    case GateOp::GreaterEq: return axis_value >= gate.value;
    case GateOp::Less:      return axis_value < gate.value;
    case GateOp::LessEq:    return axis_value <= gate.value;
    case GateOp::Equal:     return std::fabs(axis_value - gate.value) < kGateEqualityTolerance;
  }
  return false;
}

bool checkAllGatesPassNormalized(const std::vector<ParsedGate>& gates,
                                 const NormalizedAxes& axes) {
  for (const auto& gate : gates) {
    if (!evaluateGate(gate, resolveAxis(axes, gate.axis))) return false;
  }
  return true;
}

bool checkAllGatesPass(const Prototype& prototype, const AffectState& state) {
  ParsedGateSet parsed = parseGates(prototype.gates);
  return checkAllGatesPassNormalized(parsed.gates, normalizeState(state));
}

}  // namespace affect
