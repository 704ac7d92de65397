// Read-only lookup of prototypes and expressions.

#ifndef AFFECT_REGISTRY_I_PROTOTYPE_REGISTRY_H
#define AFFECT_REGISTRY_I_PROTOTYPE_REGISTRY_H

#include <string>
#include <vector>

#include "core/basic_types.h"

namespace affect {

/// @brief Source of prototypes and expressions for one analysis call.
class IPrototypeRegistry {
 public:
  virtual ~IPrototypeRegistry() = default;

  /// @return Prototype with the id, or nullptr.
  virtual const Prototype* getPrototype(const std::string& id) const = 0;

  /// @return Expression with the id, or nullptr.
  virtual const Expression* getExpression(const std::string& id) const = 0;

  /// @brief Prototypes of one semantic type, in registry order.
  virtual std::vector<Prototype> prototypesByType(PrototypeType type) const = 0;

  virtual const std::vector<Prototype>& allPrototypes() const = 0;
  virtual const std::vector<Expression>& allExpressions() const = 0;
};

}  // namespace affect

#endif  // AFFECT_REGISTRY_I_PROTOTYPE_REGISTRY_H
