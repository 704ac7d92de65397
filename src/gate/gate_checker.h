// Gate parsing and evaluation for prototype activation conditions.

#ifndef AFFECT_GATE_GATE_CHECKER_H
#define AFFECT_GATE_GATE_CHECKER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "core/axis_normalizer.h"
#include "core/basic_types.h"

namespace affect {

/// Tolerance used by "==" gates.
constexpr double kGateEqualityTolerance = 0.0001;

/// @brief Comparison operator of a gate.
enum class GateOp : uint8_t {
  Greater,
  GreaterEq,
  Less,
  LessEq,
  Equal
};

/// @brief Gate operator token (">=", "<", ...).
const char* gateOpToString(GateOp op);

/// @brief A gate string parsed into axis, operator and threshold.
struct ParsedGate {
  std::string axis;
  GateOp op = GateOp::GreaterEq;
  double value = 0.0;
  std::string source;  ///< Original gate text.
};

/// @brief Whether every gate of a prototype was understood.
enum class GateParseStatus : uint8_t {
  Complete,
  Partial
};

/// @brief Convert GateParseStatus to "complete"/"partial".
const char* gateParseStatusToString(GateParseStatus status);

/// @brief Per-prototype gate parse record.
struct GateParseInfo {
  GateParseStatus parse_status = GateParseStatus::Complete;
  size_t parsed_gate_count = 0;
  size_t total_gate_count = 0;
  std::vector<std::string> unparsed_gates;
};

/// @brief Pre-parsed gates of one prototype.
struct ParsedGateSet {
  std::vector<ParsedGate> gates;
  GateParseInfo info;
};

/// @brief Parse a gate of the form "<axis> <op> <number>".
///
/// The axis is a word ([A-Za-z0-9_]+), op one of >=, <=, >, <, ==, and the
/// number an optionally negative decimal. Whitespace around the operator is
/// optional.
///
/// @param text Gate text.
/// @param out Receives the parsed gate.
/// @return False if the text does not match the gate grammar.
bool parseGate(const std::string& text, ParsedGate& out);

/// @brief Parse all gates of a prototype.
///
/// Unparseable gates are skipped and mark the set Partial.
///
/// @param gates Gate strings.
/// @param owner_id Prototype id used in the warning line; empty disables logging.
/// @return Parsed gates and parse info.
ParsedGateSet parseGates(const std::vector<std::string>& gates,
                         const std::string& owner_id = "");

/// @brief Evaluate one gate against a normalized axis value.
bool evaluateGate(const ParsedGate& gate, double axis_value);

/// @brief Check pre-parsed gates against pre-normalized axes.
///
/// Batch form: parse once with parseGates, normalize each context once with
/// normalizeState, then call this per prototype.
///
/// @return True if every gate passes (an empty gate list passes).
bool checkAllGatesPassNormalized(const std::vector<ParsedGate>& gates,
                                 const NormalizedAxes& axes);

/// @brief Check a prototype's gates against a raw state.
/// @return True if every parseable gate passes.
bool checkAllGatesPass(const Prototype& prototype, const AffectState& state);

}  // namespace affect

#endif  // AFFECT_GATE_GATE_CHECKER_H
