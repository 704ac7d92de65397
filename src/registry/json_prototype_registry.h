// Prototype/expression registry loaded from a JSON document.

#ifndef AFFECT_REGISTRY_JSON_PROTOTYPE_REGISTRY_H
#define AFFECT_REGISTRY_JSON_PROTOTYPE_REGISTRY_H

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "core/json_parser.h"
#include "registry/i_prototype_registry.h"

namespace affect {

/// @brief Outcome of loading a registry document.
struct RegistryLoadResult {
  bool success = false;
  std::string error_message;
  size_t prototype_count = 0;
  size_t expression_count = 0;
};

/// @brief IPrototypeRegistry backed by a JSON document:
///
/// @code
///   {"prototypes":  {"joy": {"type": "emotion", "weights": {"valence": 1.0},
///                            "gates": ["valence >= 0.2"]}},
///    "expressions": {"elated": {"description": "...",
///                               "prerequisites": [{"logic": {...}}]}}}
/// @endcode
///
/// "type" defaults to "emotion"; "gates", "description" and either top-level
/// section may be omitted. Members keep document order.
class JsonPrototypeRegistry : public IPrototypeRegistry {
 public:
  JsonPrototypeRegistry() = default;

  /// @brief Replace the contents with a parsed document.
  ///
  /// On failure the registry is left empty and error_message names the
  /// offending entry.
  RegistryLoadResult loadFromValue(const JsonValue& root);

  /// @brief Parse JSON text and load it.
  RegistryLoadResult loadFromString(const std::string& text);

  /// @brief Read a file and load it.
  RegistryLoadResult loadFromFile(const std::string& path);

  const Prototype* getPrototype(const std::string& id) const override;
  const Expression* getExpression(const std::string& id) const override;
  std::vector<Prototype> prototypesByType(PrototypeType type) const override;
  const std::vector<Prototype>& allPrototypes() const override { return prototypes_; }
  const std::vector<Expression>& allExpressions() const override { return expressions_; }

 private:
  void clear();

  std::vector<Prototype> prototypes_;
  std::vector<Expression> expressions_;
  std::map<std::string, size_t> prototype_index_;
  std::map<std::string, size_t> expression_index_;
};

}  // namespace affect

#endif  // AFFECT_REGISTRY_JSON_PROTOTYPE_REGISTRY_H
