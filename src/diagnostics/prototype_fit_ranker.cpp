// Prototype fit ranking implementation.

#include "diagnostics/prototype_fit_ranker.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include "core/axis_normalizer.h"
#include "core/diag_log.h"
#include "gate/gate_checker.h"

namespace affect {

const char* fitRankingStatusToString(FitRankingStatus status) {
  switch (status) {
    case FitRankingStatus::Ok:           return "ok";
    case FitRankingStatus::NoSamples:    return "no_samples";
    case FitRankingStatus::NoPrototypes: return "no_prototypes";
  }
  return "unknown";
}

namespace {

bool startsWith(const std::string& str, const char* prefix) {
  return str.rfind(prefix, 0) == 0;
}

/// @brief Axis name of a mood variable path, or empty.
std::string moodAxisOf(const std::string& path) {
  if (startsWith(path, "moodAxes.")) return path.substr(9);
  if (startsWith(path, "mood.")) return path.substr(5);
  return std::string();
}

/// @brief Split a comparison into (variable, op, literal), literal on the right.
bool splitComparison(const LogicNode& node, const LogicNode*& var, LogicOp& op, double& value) {
  if (!isComparisonOp(node.op) || node.children.size() != 2) return false;
  const LogicNode& lhs = node.children[0];
  const LogicNode& rhs = node.children[1];
  op = node.op;
  if (lhs.op == LogicOp::Var && rhs.op == LogicOp::Number) {
    var = &lhs;
    value = rhs.number;
    return true;
  }
  if (lhs.op == LogicOp::Number && rhs.op == LogicOp::Var) {
    var = &rhs;
    value = lhs.number;
    switch (op) {
      case LogicOp::Greater:   op = LogicOp::Less; break;
      case LogicOp::GreaterEq: op = LogicOp::LessEq; break;
      case LogicOp::Less:      op = LogicOp::Greater; break;
      case LogicOp::LessEq:    op = LogicOp::GreaterEq; break;
      default: break;
    }
    return true;
  }
  return false;
}

void collectConstraints(const LogicNode& node, AxisConstraintMap& out) {
  if (node.op == LogicOp::And) {
    for (const auto& child : node.children) collectConstraints(child, out);
    return;
  }
  const LogicNode* var = nullptr;
  LogicOp op = LogicOp::GreaterEq;
  double value = 0.0;
  if (!splitComparison(node, var, op, value)) return;
  std::string axis_name = moodAxisOf(var->var_path);
  if (axis_name.empty()) return;

  double bound = normalizeMoodValue(value);
  AxisConstraint& constraint = out[axis_name];
  switch (op) {
    case LogicOp::Greater:
    case LogicOp::GreaterEq:
      constraint.min = std::max(constraint.min, bound);
      break;
    case LogicOp::Less:
    case LogicOp::LessEq:
      constraint.max = std::min(constraint.max, bound);
      break;
    case LogicOp::Equal:
      constraint.min = std::max(constraint.min, bound);
      constraint.max = std::min(constraint.max, bound);
      break;
    default:
      break;
  }
}

bool findRef(const LogicNode& node, PrototypeRef& out) {
  if (node.op == LogicOp::And || node.op == LogicOp::Or) {
    for (const auto& child : node.children) {
      if (findRef(child, out)) return true;
    }
    return false;
  }
  if (!isComparisonOp(node.op) || node.children.empty()) return false;
  const LogicNode& lhs = node.children[0];
  if (lhs.op != LogicOp::Var) return false;
  if (startsWith(lhs.var_path, "emotions.")) {
    out.id = lhs.var_path.substr(9);
    out.type = PrototypeType::Emotion;
    return true;
  }
  if (startsWith(lhs.var_path, "sexualStates.")) {
    out.id = lhs.var_path.substr(13);
    out.type = PrototypeType::Sexual;
    return true;
  }
  return false;
}

/// @brief Which prototype families the expression's variables mention.
void referencedFamilies(const LogicNode& node, bool& emotions, bool& sexual) {
  if (node.op == LogicOp::Var) {
    if (startsWith(node.var_path, "emotions.") || startsWith(node.var_path, "previousEmotions.")) {
      emotions = true;
    } else if (startsWith(node.var_path, "sexualStates.") ||
               startsWith(node.var_path, "previousSexualStates.")) {
      sexual = true;
    }
    return;
  }
  for (const auto& child : node.children) referencedFamilies(child, emotions, sexual);
}

}  // namespace

AxisConstraintMap extractMoodConstraints(const std::vector<Prerequisite>& prerequisites) {
  AxisConstraintMap constraints;
  for (const auto& prereq : prerequisites) collectConstraints(prereq.logic, constraints);
  return constraints;
}

bool isInMoodRegime(const AffectContext& ctx, const AxisConstraintMap& constraints) {
  for (const auto& entry : constraints) {
    auto found = ctx.current.mood.find(entry.first);
    double value = found != ctx.current.mood.end() ? normalizeMoodValue(found->second) : 0.0;
    if (value < entry.second.min || value > entry.second.max) return false;
  }
  return true;
}

std::optional<PrototypeRef> findReferencedPrototype(const Expression& expression) {
  PrototypeRef ref;
  for (const auto& prereq : expression.prerequisites) {
    if (findRef(prereq.logic, ref)) return ref;
  }
  return std::nullopt;
}

ConflictAnalysis analyzeConflicts(const std::map<std::string, double>& weights,
                                  const AxisConstraintMap& constraints) {
  ConflictAnalysis analysis;
  if (constraints.empty()) return analysis;

  for (const auto& entry : constraints) {
    auto weight = weights.find(entry.first);
    if (weight == weights.end() || weight->second == 0.0) continue;
    bool regime_up = (entry.second.min + entry.second.max) / 2.0 >= 0.0;
    if ((weight->second > 0.0) == regime_up) continue;
    ConflictingAxis conflict;
    conflict.axis = entry.first;
    conflict.weight = weight->second;
    analysis.axes.push_back(conflict);
    analysis.magnitude += std::fabs(weight->second);
  }
  analysis.score =
      static_cast<double>(analysis.axes.size()) / static_cast<double>(constraints.size());
  return analysis;
}

PrototypeFitRanker::PrototypeFitRanker(const IPrototypeRegistry& registry,
                                       const FitRankingOptions& options)
    : registry_(registry), options_(options) {}

PrototypeFitEntry PrototypeFitRanker::scorePrototype(const Prototype& prototype,
                                                     const std::vector<AffectContext>& regime,
                                                     const AxisConstraintMap& constraints) const {
  PrototypeFitEntry entry;
  entry.prototype_id = prototype.id;
  entry.type = prototype.type;

  if (!regime.empty()) {
    ParsedGateSet gates = parseGates(prototype.gates);
    size_t passed = 0;
    for (const auto& ctx : regime) {
      if (checkAllGatesPassNormalized(gates.gates, normalizeState(ctx.current))) ++passed;
    }
    entry.gate_pass_rate = static_cast<double>(passed) / static_cast<double>(regime.size());
  }
  entry.intensity = computeDistribution(prototype, regime, options_.threshold);
  entry.conflict = analyzeConflicts(prototype.weights, constraints);

  CompositeScoreInputs inputs;
  inputs.gate_pass_rate = entry.gate_pass_rate;
  inputs.p_intensity_above = entry.intensity.p_above_threshold;
  inputs.conflict_score = entry.conflict.score;
  inputs.exclusion_compatibility = entry.exclusion_compatibility;
  entry.composite_score = computeCompositeScore(inputs);
  return entry;
}

PrototypeFitRanking PrototypeFitRanker::rank(const Expression& expression,
                                             const std::vector<AffectContext>& samples) const {
  PrototypeFitRanking ranking;
  ranking.expression_id = expression.id;
  ranking.sample_count = samples.size();
  if (samples.empty()) {
    ranking.status = FitRankingStatus::NoSamples;
    logDebug(options_.verbose, "PrototypeFitRanker", "%s: no stored samples",
             expression.id.c_str());
    return ranking;
  }

  bool emotions = false;
  bool sexual = false;
  for (const auto& prereq : expression.prerequisites) {
    referencedFamilies(prereq.logic, emotions, sexual);
  }
  if (!emotions && !sexual) emotions = true;

  std::vector<Prototype> prototypes;
  if (emotions) prototypes = registry_.prototypesByType(PrototypeType::Emotion);
  if (sexual) {
    std::vector<Prototype> sexual_protos = registry_.prototypesByType(PrototypeType::Sexual);
    prototypes.insert(prototypes.end(), sexual_protos.begin(), sexual_protos.end());
  }
  if (prototypes.empty()) {
    ranking.status = FitRankingStatus::NoPrototypes;
    logWarn("PrototypeFitRanker", "%s: no prototypes to rank", expression.id.c_str());
    return ranking;
  }

  ranking.constraints = extractMoodConstraints(expression.prerequisites);
  std::vector<AffectContext> regime;
  for (const auto& ctx : samples) {
    if (isInMoodRegime(ctx, ranking.constraints)) regime.push_back(ctx);
  }
  ranking.regime_sample_count = regime.size();
  logDebug(options_.verbose, "PrototypeFitRanker", "%s: %zu/%zu samples in regime",
           expression.id.c_str(), regime.size(), samples.size());

  std::vector<PrototypeFitEntry> entries;
  entries.reserve(prototypes.size());
  for (const auto& proto : prototypes) {
    entries.push_back(scorePrototype(proto, regime, ranking.constraints));
  }
  std::stable_sort(entries.begin(), entries.end(),
                   [](const PrototypeFitEntry& lhs, const PrototypeFitEntry& rhs) {
                     return lhs.composite_score > rhs.composite_score;
                   });
  for (size_t idx = 0; idx < entries.size(); ++idx) entries[idx].rank = idx + 1;

  std::optional<PrototypeRef> ref = findReferencedPrototype(expression);
  if (ref) {
    for (const auto& entry : entries) {
      if (entry.prototype_id == ref->id && entry.type == ref->type) {
        ranking.current = entry;
        break;
      }
    }
  }

  size_t keep = std::min(entries.size(), options_.leaderboard_size);
  ranking.leaderboard.assign(entries.begin(), entries.begin() + static_cast<std::ptrdiff_t>(keep));

  if (ranking.current && !ranking.leaderboard.empty() &&
      ranking.leaderboard.front().prototype_id != ranking.current->prototype_id) {
    ranking.best_alternative = ranking.leaderboard.front().prototype_id;
    if (ranking.current->composite_score > 0.0) {
      ranking.improvement_factor =
          ranking.leaderboard.front().composite_score / ranking.current->composite_score;
    }
  }
  return ranking;
}

}  // namespace affect
