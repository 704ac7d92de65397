// Tests for gate/gate_checker.h -- gate grammar and evaluation.

#include "gate/gate_checker.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "test_helpers.h"

namespace affect {
namespace {

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

TEST(GateCheckerTest, ParsesEveryOperator) {
  struct Case {
    const char* text;
    GateOp op;
  };
  const Case cases[] = {{"valence >= 0.2", GateOp::GreaterEq},
                        {"valence <= 0.2", GateOp::LessEq},
                        {"valence > 0.2", GateOp::Greater},
                        {"valence < 0.2", GateOp::Less},
                        {"valence == 0.2", GateOp::Equal}};
  for (const auto& test_case : cases) {
    ParsedGate gate;
    ASSERT_TRUE(parseGate(test_case.text, gate)) << test_case.text;
    EXPECT_EQ(gate.axis, "valence");
    EXPECT_EQ(gate.op, test_case.op) << test_case.text;
    EXPECT_DOUBLE_EQ(gate.value, 0.2);
    EXPECT_EQ(gate.source, test_case.text);
  }
}

TEST(GateCheckerTest, ParsesCompactAndNegativeForms) {
  ParsedGate gate;
  ASSERT_TRUE(parseGate("threat<-.35", gate));
  EXPECT_EQ(gate.axis, "threat");
  EXPECT_EQ(gate.op, GateOp::Less);
  EXPECT_DOUBLE_EQ(gate.value, -0.35);

  ASSERT_TRUE(parseGate("  sex_excitation   >=   1  ", gate));
  EXPECT_EQ(gate.axis, "sex_excitation");
  EXPECT_DOUBLE_EQ(gate.value, 1.0);
}

TEST(GateCheckerTest, RejectsMalformedGates) {
  ParsedGate gate;
  EXPECT_FALSE(parseGate("", gate));
  EXPECT_FALSE(parseGate("valence", gate));
  EXPECT_FALSE(parseGate("valence => 0.2", gate));
  EXPECT_FALSE(parseGate("valence >= high", gate));
  EXPECT_FALSE(parseGate("valence >= 0.2 and arousal", gate));
  EXPECT_FALSE(parseGate("valence >= 1.", gate));
  EXPECT_FALSE(parseGate(">= 0.2", gate));
  EXPECT_FALSE(parseGate("valence != 0.2", gate));
}

TEST(GateCheckerTest, ParseGatesMarksPartial) {
  ParsedGateSet set = parseGates({"valence >= 0.2", "bogus", "arousal < 0.5"});
  EXPECT_EQ(set.gates.size(), 2u);
  EXPECT_EQ(set.info.parse_status, GateParseStatus::Partial);
  EXPECT_EQ(set.info.parsed_gate_count, 2u);
  EXPECT_EQ(set.info.total_gate_count, 3u);
  ASSERT_EQ(set.info.unparsed_gates.size(), 1u);
  EXPECT_EQ(set.info.unparsed_gates[0], "bogus");
  EXPECT_STREQ(gateParseStatusToString(set.info.parse_status), "partial");
}

TEST(GateCheckerTest, EmptyGateListIsComplete) {
  ParsedGateSet set = parseGates({});
  EXPECT_EQ(set.info.parse_status, GateParseStatus::Complete);
  EXPECT_EQ(set.info.total_gate_count, 0u);
}

// ---------------------------------------------------------------------------
// Evaluation
// ---------------------------------------------------------------------------

TEST(GateCheckerTest, EvaluateBoundaries) {
  ParsedGate gate;
  ASSERT_TRUE(parseGate("valence > 0.5", gate));
  EXPECT_FALSE(evaluateGate(gate, 0.5));
  EXPECT_TRUE(evaluateGate(gate, 0.5001));

  ASSERT_TRUE(parseGate("valence == 0.5", gate));
  EXPECT_TRUE(evaluateGate(gate, 0.50005));
  EXPECT_FALSE(evaluateGate(gate, 0.5002));
}

TEST(GateCheckerTest, ChecksAgainstRawState) {
  Prototype proto = test_helpers::makePrototype(
      "content", {{"valence", 1.0}}, {"valence >= 0.2", "threat < 0.1", "harm_aversion >= 0.5"});

  AffectState state;
  state.mood["valence"] = 30.0;
  state.mood["threat"] = 0.0;
  EXPECT_TRUE(checkAllGatesPass(proto, state));  // harm_aversion defaults to 0.5

  state.mood["threat"] = 20.0;
  EXPECT_FALSE(checkAllGatesPass(proto, state));
}

TEST(GateCheckerTest, UnparseableGatesAreIgnoredDuringChecks) {
  Prototype proto = test_helpers::makePrototype("odd", {{"valence", 1.0}},
                                                {"valence >= 0.2", "not a gate"});
  AffectState state;
  state.mood["valence"] = 25.0;
  EXPECT_TRUE(checkAllGatesPass(proto, state));
}

TEST(GateCheckerTest, SexualArousalAliasResolves) {
  ParsedGateSet set = parseGates({"SA >= 0.3"});
  AffectState state;
  state.sexual["sex_excitation"] = 50.0;
  state.sexual["sex_inhibition"] = 10.0;
  EXPECT_TRUE(checkAllGatesPassNormalized(set.gates, normalizeState(state)));
  state.sexual["sex_inhibition"] = 30.0;
  EXPECT_FALSE(checkAllGatesPassNormalized(set.gates, normalizeState(state)));
}

}  // namespace
}  // namespace affect
