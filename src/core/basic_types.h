// Basic types for affect-state diagnostics.

#ifndef AFFECT_CORE_BASIC_TYPES_H
#define AFFECT_CORE_BASIC_TYPES_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/logic_expr.h"

namespace affect {

/// Named axis values (raw, authoring scale).
using AxisMap = std::map<std::string, double>;

/// Marker for metrics that could not be computed.
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

// ---------------------------------------------------------------------------
// Axis domains (raw scale)
// ---------------------------------------------------------------------------

constexpr double kMoodAxisMin = -100.0;
constexpr double kMoodAxisMax = 100.0;
constexpr double kSexualAxisMin = 0.0;
constexpr double kSexualAxisMax = 100.0;
constexpr double kLibidoMin = -50.0;
constexpr double kLibidoMax = 50.0;
constexpr double kTraitMin = 0.0;
constexpr double kTraitMax = 100.0;
constexpr double kTraitDefault = 50.0;

/// Axis names as they appear in contexts and prototype weights.
namespace axis {
constexpr const char* kSexExcitation = "sex_excitation";
constexpr const char* kSexInhibition = "sex_inhibition";
constexpr const char* kBaselineLibido = "baseline_libido";
constexpr const char* kSexualArousal = "sexual_arousal";
constexpr const char* kSexualArousalAlias = "SA";
}  // namespace axis

/// @brief Inclusive raw value range of an axis.
struct AxisRange {
  double min = 0.0;
  double max = 0.0;

  double span() const { return max - min; }
};

/// @brief The eight mood axes, in canonical order.
const std::vector<std::string>& moodAxisNames();

/// @brief Raw sexual axes (excitation, inhibition, baseline libido).
const std::vector<std::string>& sexualAxisNames();

/// @brief Affect trait axes.
const std::vector<std::string>& affectTraitNames();

/// @brief Raw sampling range for any known mood, sexual or trait axis.
/// @param name Axis name.
/// @param out Receives the range.
/// @return False for unknown axes.
bool rawAxisRange(const std::string& name, AxisRange& out);

// ---------------------------------------------------------------------------
// Contexts
// ---------------------------------------------------------------------------

/// @brief One affect state in raw authoring units.
struct AffectState {
  AxisMap mood;    ///< Mood axes, [-100, 100].
  AxisMap sexual;  ///< sex_excitation/sex_inhibition [0, 100], baseline_libido [-50, 50].
  AxisMap traits;  ///< Affect traits, [0, 100].
};

/// @brief A sampled or candidate world state, optionally with its predecessor.
///
/// Produced once and read by every pipeline stage; never mutated after
/// construction.
struct AffectContext {
  AffectState current;
  std::optional<AffectState> previous;
};

// ---------------------------------------------------------------------------
// Prototypes and expressions
// ---------------------------------------------------------------------------

/// @brief Semantic family of a prototype.
enum class PrototypeType : uint8_t {
  Emotion,
  Sexual
};

/// @brief Convert PrototypeType to its registry string ("emotion"/"sexual").
const char* prototypeTypeToString(PrototypeType type);

/// @brief Parse a registry type string.
/// @return False if the string is not a known type.
bool prototypeTypeFromString(const std::string& str, PrototypeType& out);

/// @brief Named linear scoring rule restricted by gate conditions.
struct Prototype {
  std::string id;
  PrototypeType type = PrototypeType::Emotion;
  std::map<std::string, double> weights;  ///< Axis -> weight.
  std::vector<std::string> gates;         ///< e.g. "valence >= 0.35".
};

/// @brief One prerequisite clause of an expression.
struct Prerequisite {
  LogicNode logic;
};

/// @brief Named set of prerequisites combined with implicit AND.
struct Expression {
  std::string id;
  std::string description;
  std::vector<Prerequisite> prerequisites;
};

/// Progress callback: (completed, total).
using ProgressFn = std::function<void(size_t completed, size_t total)>;

}  // namespace affect

#endif  // AFFECT_CORE_BASIC_TYPES_H
