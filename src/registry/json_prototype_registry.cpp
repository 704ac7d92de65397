// JSON prototype registry implementation.

#include "registry/json_prototype_registry.h"

#include <utility>

namespace affect {

namespace {

bool loadPrototype(const std::string& id, const JsonValue& json, Prototype& out,
                   std::string& error) {
  if (!json.isObject()) {
    error = "prototype '" + id + "' must be an object";
    return false;
  }
  out.id = id;

  if (const JsonValue* type = json.find("type")) {
    if (!type->isString() || !prototypeTypeFromString(type->string_val, out.type)) {
      error = "prototype '" + id + "': type must be \"emotion\" or \"sexual\"";
      return false;
    }
  }

  if (const JsonValue* weights = json.find("weights")) {
    if (!weights->isObject()) {
      error = "prototype '" + id + "': weights must be an object";
      return false;
    }
    for (const auto& member : weights->object_val) {
      if (!member.second.isNumber()) {
        error = "prototype '" + id + "': weight '" + member.first + "' is not a number";
        return false;
      }
      out.weights[member.first] = member.second.number_val;
    }
  }

  if (const JsonValue* gates = json.find("gates")) {
    if (!gates->isArray()) {
      error = "prototype '" + id + "': gates must be an array";
      return false;
    }
    for (const auto& gate : gates->array_val) {
      if (!gate.isString()) {
        error = "prototype '" + id + "': gates must be strings";
        return false;
      }
      out.gates.push_back(gate.string_val);
    }
  }
  return true;
}

bool loadExpression(const std::string& id, const JsonValue& json, Expression& out,
                    std::string& error) {
  if (!json.isObject()) {
    error = "expression '" + id + "' must be an object";
    return false;
  }
  out.id = id;
  if (const JsonValue* desc = json.find("description")) {
    out.description = desc->asString();
  }

  const JsonValue* prereqs = json.find("prerequisites");
  if (prereqs == nullptr) return true;
  if (!prereqs->isArray()) {
    error = "expression '" + id + "': prerequisites must be an array";
    return false;
  }
  for (size_t idx = 0; idx < prereqs->array_val.size(); ++idx) {
    const JsonValue& item = prereqs->array_val[idx];
    const JsonValue* logic = item.find("logic");
    if (logic == nullptr) {
      error = "expression '" + id + "': prerequisite " + std::to_string(idx) +
              " has no logic";
      return false;
    }
    LogicParseResult parsed = parseLogic(*logic);
    if (!parsed.success) {
      error = "expression '" + id + "': prerequisite " + std::to_string(idx) + ": " +
              parsed.error_message;
      return false;
    }
    Prerequisite prereq;
    prereq.logic = std::move(parsed.node);
    out.prerequisites.push_back(std::move(prereq));
  }
  return true;
}

}  // namespace

void JsonPrototypeRegistry::clear() {
  prototypes_.clear();
  expressions_.clear();
  prototype_index_.clear();
  expression_index_.clear();
}

RegistryLoadResult JsonPrototypeRegistry::loadFromValue(const JsonValue& root) {
  RegistryLoadResult result;
  clear();
  if (!root.isObject()) {
    result.error_message = "registry document must be a JSON object";
    return result;
  }

  if (const JsonValue* protos = root.find("prototypes")) {
    if (!protos->isObject()) {
      result.error_message = "prototypes must be an object";
      return result;
    }
    for (const auto& member : protos->object_val) {
      Prototype proto;
      if (!loadPrototype(member.first, member.second, proto, result.error_message)) {
        clear();
        return result;
      }
      if (prototype_index_.count(proto.id)) {
        result.error_message = "duplicate prototype '" + proto.id + "'";
        clear();
        return result;
      }
      prototype_index_[proto.id] = prototypes_.size();
      prototypes_.push_back(std::move(proto));
    }
  }

  if (const JsonValue* exprs = root.find("expressions")) {
    if (!exprs->isObject()) {
      result.error_message = "expressions must be an object";
      clear();
      return result;
    }
    for (const auto& member : exprs->object_val) {
      Expression expr;
      if (!loadExpression(member.first, member.second, expr, result.error_message)) {
        clear();
        return result;
      }
      if (expression_index_.count(expr.id)) {
        result.error_message = "duplicate expression '" + expr.id + "'";
        clear();
        return result;
      }
      expression_index_[expr.id] = expressions_.size();
      expressions_.push_back(std::move(expr));
    }
  }

  result.success = true;
  result.prototype_count = prototypes_.size();
  result.expression_count = expressions_.size();
  return result;
}

RegistryLoadResult JsonPrototypeRegistry::loadFromString(const std::string& text) {
  JsonParseResult parsed = parseJson(text.data(), text.size());
  if (!parsed.success) {
    clear();
    RegistryLoadResult result;
    result.error_message = "JSON parse error at offset " + std::to_string(parsed.error_offset) +
                           ": " + parsed.error_message;
    return result;
  }
  return loadFromValue(parsed.value);
}

RegistryLoadResult JsonPrototypeRegistry::loadFromFile(const std::string& path) {
  std::string text;
  if (!readTextFile(path, text)) {
    clear();
    RegistryLoadResult result;
    result.error_message = "cannot read " + path;
    return result;
  }
  return loadFromString(text);
}

const Prototype* JsonPrototypeRegistry::getPrototype(const std::string& id) const {
  auto iter = prototype_index_.find(id);
  return iter == prototype_index_.end() ? nullptr : &prototypes_[iter->second];
}

const Expression* JsonPrototypeRegistry::getExpression(const std::string& id) const {
  auto iter = expression_index_.find(id);
  return iter == expression_index_.end() ? nullptr : &expressions_[iter->second];
}

std::vector<Prototype> JsonPrototypeRegistry::prototypesByType(PrototypeType type) const {
  std::vector<Prototype> result;
  for (const auto& proto : prototypes_) {
    if (proto.type == type) result.push_back(proto);
  }
  return result;
}

}  // namespace affect
