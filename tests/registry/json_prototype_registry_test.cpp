// Tests for registry/json_prototype_registry.h -- JSON-backed registry.

#include "registry/json_prototype_registry.h"

#include <gtest/gtest.h>

#include <fstream>
#include <string>
#include <vector>

namespace affect {
namespace {

const char* kRegistryJson = R"({
  "prototypes": {
    "joy": {"weights": {"valence": 1.0, "arousal": 0.3}, "gates": ["valence >= 0.2"]},
    "desire": {"type": "sexual", "weights": {"sexual_arousal": 1.0}},
    "dread": {"type": "emotion", "weights": {"threat": 1.0, "valence": -0.5}}
  },
  "expressions": {
    "beaming": {
      "description": "Openly happy",
      "prerequisites": [
        {"logic": {">=": [{"var": "emotions.joy"}, 0.6]}},
        {"logic": {"<": [{"var": "moodAxes.threat"}, 20]}}
      ]
    },
    "idle": {}
  }
})";

TEST(JsonPrototypeRegistryTest, LoadsPrototypesAndExpressions) {
  JsonPrototypeRegistry registry;
  RegistryLoadResult result = registry.loadFromString(kRegistryJson);
  ASSERT_TRUE(result.success) << result.error_message;
  EXPECT_EQ(result.prototype_count, 3u);
  EXPECT_EQ(result.expression_count, 2u);

  const Prototype* joy = registry.getPrototype("joy");
  ASSERT_NE(joy, nullptr);
  EXPECT_EQ(joy->type, PrototypeType::Emotion);
  EXPECT_DOUBLE_EQ(joy->weights.at("arousal"), 0.3);
  ASSERT_EQ(joy->gates.size(), 1u);
  EXPECT_EQ(joy->gates[0], "valence >= 0.2");
  EXPECT_EQ(registry.getPrototype("missing"), nullptr);

  const Expression* beaming = registry.getExpression("beaming");
  ASSERT_NE(beaming, nullptr);
  EXPECT_EQ(beaming->description, "Openly happy");
  ASSERT_EQ(beaming->prerequisites.size(), 2u);
  EXPECT_EQ(beaming->prerequisites[0].logic.op, LogicOp::GreaterEq);
  EXPECT_TRUE(registry.getExpression("idle")->prerequisites.empty());
}

TEST(JsonPrototypeRegistryTest, KeepsDocumentOrderAndFiltersByType) {
  JsonPrototypeRegistry registry;
  ASSERT_TRUE(registry.loadFromString(kRegistryJson).success);
  const std::vector<Prototype>& all = registry.allPrototypes();
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].id, "joy");
  EXPECT_EQ(all[1].id, "desire");
  EXPECT_EQ(all[2].id, "dread");

  std::vector<Prototype> emotions = registry.prototypesByType(PrototypeType::Emotion);
  ASSERT_EQ(emotions.size(), 2u);
  EXPECT_EQ(emotions[1].id, "dread");
  std::vector<Prototype> sexual = registry.prototypesByType(PrototypeType::Sexual);
  ASSERT_EQ(sexual.size(), 1u);
  EXPECT_EQ(sexual[0].id, "desire");
}

TEST(JsonPrototypeRegistryTest, RejectsBadEntriesAndStaysEmpty) {
  JsonPrototypeRegistry registry;
  ASSERT_TRUE(registry.loadFromString(kRegistryJson).success);

  RegistryLoadResult bad_type =
      registry.loadFromString(R"({"prototypes": {"joy": {"type": "mood"}}})");
  EXPECT_FALSE(bad_type.success);
  EXPECT_NE(bad_type.error_message.find("prototype 'joy'"), std::string::npos);
  EXPECT_TRUE(registry.allPrototypes().empty());
  EXPECT_TRUE(registry.allExpressions().empty());

  RegistryLoadResult bad_weight =
      registry.loadFromString(R"({"prototypes": {"joy": {"weights": {"valence": "high"}}}})");
  EXPECT_FALSE(bad_weight.success);
  EXPECT_NE(bad_weight.error_message.find("weight 'valence'"), std::string::npos);

  RegistryLoadResult bad_logic = registry.loadFromString(
      R"({"expressions": {"x": {"prerequisites": [{"logic": {"max": [1, 2]}}]}}})");
  EXPECT_FALSE(bad_logic.success);
  EXPECT_NE(bad_logic.error_message.find("expression 'x': prerequisite 0"), std::string::npos);

  RegistryLoadResult no_logic =
      registry.loadFromString(R"({"expressions": {"x": {"prerequisites": [{}]}}})");
  EXPECT_FALSE(no_logic.success);
  EXPECT_NE(no_logic.error_message.find("has no logic"), std::string::npos);
}

TEST(JsonPrototypeRegistryTest, RejectsMalformedDocuments) {
  JsonPrototypeRegistry registry;
  RegistryLoadResult not_json = registry.loadFromString("{\"prototypes\": ");
  EXPECT_FALSE(not_json.success);
  EXPECT_NE(not_json.error_message.find("JSON parse error"), std::string::npos);

  EXPECT_FALSE(registry.loadFromString("[]").success);
  EXPECT_FALSE(registry.loadFromString(R"({"prototypes": []})").success);
}

TEST(JsonPrototypeRegistryTest, LoadsFromFile) {
  std::string path = ::testing::TempDir() + "affect_registry_test.json";
  {
    std::ofstream out(path);
    out << kRegistryJson;
  }
  JsonPrototypeRegistry registry;
  RegistryLoadResult result = registry.loadFromFile(path);
  ASSERT_TRUE(result.success) << result.error_message;
  EXPECT_EQ(result.prototype_count, 3u);

  RegistryLoadResult missing = registry.loadFromFile(path + ".absent");
  EXPECT_FALSE(missing.success);
  EXPECT_NE(missing.error_message.find("cannot read"), std::string::npos);
}

}  // namespace
}  // namespace affect
