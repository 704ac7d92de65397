// Tests for core/logic_expr.h -- JSON-logic parsing and evaluation.

#include "core/logic_expr.h"

#include <gtest/gtest.h>

#include <string>

#include "test_helpers.h"

namespace affect {
namespace {

using test_helpers::logicFromText;
using test_helpers::MapResolver;

LogicParseResult parseText(const std::string& text) {
  JsonParseResult json = parseJson(text.data(), text.size());
  EXPECT_TRUE(json.success) << text;
  return parseLogic(json.value);
}

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

TEST(LogicExprTest, ParsesComparisonTree) {
  auto result = parseText(
      R"({"and": [{">=": [{"var": "emotions.joy"}, 0.5]}, {"<": [{"var": "moodAxes.threat"}, 10]}]})");
  ASSERT_TRUE(result.success) << result.error_message;
  EXPECT_EQ(result.node.op, LogicOp::And);
  ASSERT_EQ(result.node.children.size(), 2u);
  EXPECT_EQ(result.node.children[0].op, LogicOp::GreaterEq);
  EXPECT_EQ(result.node.children[0].children[0].var_path, "emotions.joy");
  EXPECT_DOUBLE_EQ(result.node.children[1].children[1].number, 10.0);
}

TEST(LogicExprTest, VarAcceptsArrayForm) {
  auto result = parseText(R"({"var": ["emotions.joy", 0]})");
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.node.op, LogicOp::Var);
  EXPECT_EQ(result.node.var_path, "emotions.joy");
}

TEST(LogicExprTest, TripleEqualsIsEquality) {
  auto result = parseText(R"({"===": [{"var": "a"}, 1]})");
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.node.op, LogicOp::Equal);
}

TEST(LogicExprTest, RejectsUnknownOperator) {
  auto result = parseText(R"({"in": ["a", ["a"]]})");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error_message.find("unknown operator"), std::string::npos);
}

TEST(LogicExprTest, RejectsWrongArity) {
  EXPECT_FALSE(parseText(R"({">": [1]})").success);
  EXPECT_FALSE(parseText(R"({"!": [true, false]})").success);
  EXPECT_FALSE(parseText(R"({"-": []})").success);
}

TEST(LogicExprTest, RejectsStringLiteralOperand) {
  EXPECT_FALSE(parseText(R"({">": [{"var": "a"}, "x"]})").success);
}

TEST(LogicExprTest, RejectsMultiKeyObject) {
  EXPECT_FALSE(parseText(R"({">": [1, 0], "<": [0, 1]})").success);
}

// ---------------------------------------------------------------------------
// Evaluation
// ---------------------------------------------------------------------------

TEST(LogicExprTest, EvaluatesComparisons) {
  MapResolver vars({{"emotions.joy", 0.6}});
  EXPECT_TRUE(evaluateLogic(logicFromText(R"({">=": [{"var": "emotions.joy"}, 0.6]})"), vars));
  EXPECT_FALSE(evaluateLogic(logicFromText(R"({">": [{"var": "emotions.joy"}, 0.6]})"), vars));
  EXPECT_TRUE(evaluateLogic(logicFromText(R"({"<": [0.5, {"var": "emotions.joy"}]})"), vars));
}

TEST(LogicExprTest, MissingVariableFailsComparison) {
  MapResolver vars;
  EXPECT_FALSE(evaluateLogic(logicFromText(R"({"<": [{"var": "emotions.joy"}, 1]})"), vars));
  EXPECT_TRUE(evaluateLogic(logicFromText(R"({"!": {"<": [{"var": "emotions.joy"}, 1]}})"), vars));
}

TEST(LogicExprTest, AndOrNot) {
  MapResolver vars({{"a", 1.0}, {"b", 0.0}});
  EXPECT_FALSE(evaluateLogic(logic::allOf({logic::var("a"), logic::var("b")}), vars));
  EXPECT_TRUE(evaluateLogic(logic::anyOf({logic::var("a"), logic::var("b")}), vars));
  EXPECT_TRUE(evaluateLogic(logic::negate(logic::var("b")), vars));
  EXPECT_TRUE(evaluateLogic(logic::allOf({}), vars));
  EXPECT_FALSE(evaluateLogic(logic::anyOf({}), vars));
}

TEST(LogicExprTest, SubtractComputesDelta) {
  MapResolver vars({{"emotions.joy", 0.7}, {"previousEmotions.joy", 0.2}});
  LogicValue delta = evaluateLogicValue(
      logic::subtract(logic::var("emotions.joy"), logic::var("previousEmotions.joy")), vars);
  ASSERT_EQ(delta.kind, LogicValue::Number);
  EXPECT_NEAR(delta.number, 0.5, 1e-12);

  LogicValue missing = evaluateLogicValue(
      logic::subtract(logic::var("emotions.joy"), logic::var("previousEmotions.fear")), vars);
  EXPECT_EQ(missing.kind, LogicValue::Missing);
}

TEST(LogicExprTest, UnaryMinusNegates) {
  MapResolver vars({{"a", 3.0}});
  auto result = parseText(R"({"<": [{"-": [{"var": "a"}]}, -2]})");
  ASSERT_TRUE(result.success);
  EXPECT_TRUE(evaluateLogic(result.node, vars));
}

TEST(LogicExprTest, BooleansCoerceInComparisons) {
  MapResolver vars;
  EXPECT_TRUE(evaluateLogic(logic::compare(LogicOp::Equal, logic::boolean(true), logic::number(1)),
                            vars));
}

// ---------------------------------------------------------------------------
// Rendering
// ---------------------------------------------------------------------------

TEST(LogicExprTest, RendersCompactJson) {
  LogicNode node = logic::compare(LogicOp::GreaterEq, logic::var("emotions.joy"),
                                  logic::number(0.5));
  EXPECT_EQ(logicToString(node), R"({">=":[{"var":"emotions.joy"},0.5]})");
}

TEST(LogicExprTest, RenderedTextParsesBack) {
  LogicNode node = logic::allOf(
      {logic::negate(logic::var("a")),
       logic::compare(LogicOp::Less, logic::subtract(logic::var("b"), logic::var("c")),
                      logic::number(-0.25))});
  std::string text = logicToString(node);
  EXPECT_EQ(logicToString(logicFromText(text)), text);
}

}  // namespace
}  // namespace affect
