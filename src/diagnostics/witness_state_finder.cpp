// Witness state finder implementation.

#include "diagnostics/witness_state_finder.h"

#include <algorithm>
#include <cmath>

#include "core/diag_log.h"
#include "core/rng_util.h"
#include "sampling/evaluation_context.h"

namespace affect {

const char* searchStatusToString(SearchStatus status) {
  switch (status) {
    case SearchStatus::Found:     return "found";
    case SearchStatus::Exhausted: return "exhausted";
    case SearchStatus::Cancelled: return "cancelled";
  }
  return "unknown";
}

namespace {

/// Cap for unsatisfied clauses so only satisfied ones reach 1.
constexpr double kUnsatisfiedCeiling = 0.99;

bool startsWith(const std::string& str, const char* prefix) {
  return str.rfind(prefix, 0) == 0;
}

/// @brief Domain span of the value an operand produces.
double operandScale(const LogicNode& node) {
  switch (node.op) {
    case LogicOp::Var:
      if (startsWith(node.var_path, "moodAxes.") || startsWith(node.var_path, "mood.") ||
          startsWith(node.var_path, "previousMoodAxes.")) {
        return kMoodAxisMax - kMoodAxisMin;
      }
      if (startsWith(node.var_path, "sexualAxes.")) return kSexualAxisMax - kSexualAxisMin;
      if (startsWith(node.var_path, "affectTraits.")) return kTraitMax - kTraitMin;
      return 1.0;
    case LogicOp::Subtract: {
      double scale = 0.0;
      for (const auto& child : node.children) scale = std::max(scale, operandScale(child));
      return 2.0 * scale;
    }
    case LogicOp::Number:
    case LogicOp::Bool:
    case LogicOp::Greater:
    case LogicOp::GreaterEq:
    case LogicOp::Less:
    case LogicOp::LessEq:
    case LogicOp::Equal:
    case LogicOp::And:
    case LogicOp::Or:
    case LogicOp::Not:
      return 0.0;
  }
  return 0.0;
}

bool numericOperand(const LogicNode& node, const IVariableResolver& vars, double& out) {
  LogicValue val = evaluateLogicValue(node, vars);
  if (val.kind == LogicValue::Number) {
    out = val.number;
    return !std::isnan(out);
  }
  if (val.kind == LogicValue::Bool) {
    out = val.boolean ? 1.0 : 0.0;
    return true;
  }
  return false;
}

}  // namespace

double scoreClause(const LogicNode& clause, const IVariableResolver& vars) {
  switch (clause.op) {
    case LogicOp::Greater:
    case LogicOp::GreaterEq:
    case LogicOp::Less:
    case LogicOp::LessEq:
    case LogicOp::Equal: {
      if (evaluateLogic(clause, vars)) return 1.0;
      double lhs = 0.0;
      double rhs = 0.0;
      if (!numericOperand(clause.children[0], vars, lhs) ||
          !numericOperand(clause.children[1], vars, rhs)) {
        return 0.0;
      }
      double scale = std::max(operandScale(clause.children[0]),
                              operandScale(clause.children[1]));
      if (scale <= 0.0) scale = 1.0;
      double distance = std::fabs(lhs - rhs);
      return kUnsatisfiedCeiling * (1.0 - std::min(1.0, distance / scale));
    }
    case LogicOp::And: {
      if (clause.children.empty()) return 1.0;
      double sum = 0.0;
      for (const auto& child : clause.children) sum += scoreClause(child, vars);
      double mean = sum / static_cast<double>(clause.children.size());
      // Rounding must not lift a failing conjunction to 1.
      return evaluateLogic(clause, vars) ? 1.0 : std::min(mean, kUnsatisfiedCeiling);
    }
    case LogicOp::Or: {
      double best = 0.0;
      for (const auto& child : clause.children) best = std::max(best, scoreClause(child, vars));
      return best;
    }
    case LogicOp::Number:
    case LogicOp::Bool:
    case LogicOp::Var:
    case LogicOp::Not:
    case LogicOp::Subtract:
      return evaluateLogic(clause, vars) ? 1.0 : 0.0;
  }
  return 0.0;
}

WitnessStateFinder::WitnessStateFinder(const IEmotionCalculator& calculator,
                                       const WitnessSearchConfig& config,
                                       IScheduler* scheduler)
    : calculator_(calculator),
      config_(config),
      scheduler_(scheduler ? scheduler : &default_scheduler_) {
  if (config_.chunk_size == 0) config_.chunk_size = 1;
}

double WitnessStateFinder::fitness(const Expression& expression, const AffectContext& ctx,
                                   std::vector<double>* clause_scores) const {
  if (expression.prerequisites.empty()) return 1.0;

  EvaluationContext eval(ctx, calculator_);
  double sum = 0.0;
  bool all_satisfied = true;
  for (const auto& prereq : expression.prerequisites) {
    double score = scoreClause(prereq.logic, eval);
    if (score < 1.0) all_satisfied = false;
    sum += score;
    if (clause_scores) clause_scores->push_back(score);
  }
  if (all_satisfied) return 1.0;
  double mean = sum / static_cast<double>(expression.prerequisites.size());
  return std::min(mean, kUnsatisfiedCeiling);
}

SearchResult WitnessStateFinder::findWitness(const Expression& expression,
                                             const WitnessSearchOptions& options) {
  SearchResult result;
  uint32_t seed = config_.seed != 0 ? config_.seed : rng::generateRandomSeed();
  RandomContextGenerator generator(seed, config_.sampling);

  AffectContext best = generator.generate();
  result.best_fitness = fitness(expression, best, nullptr);
  if (result.best_fitness >= 1.0) {
    result.status = SearchStatus::Found;
    result.found = true;
    result.witness = best;
    logDebug(config_.verbose, "WitnessStateFinder", "%s: witness on initial candidate",
             expression.id.c_str());
    return result;
  }

  AffectContext current = best;
  double current_fitness = result.best_fitness;
  size_t stale = 0;
  bool restart_pending = false;

  for (size_t iter = 1; iter <= options.max_iterations; ++iter) {
    AffectContext candidate;
    if (!restart_pending && rng::rollProbability(generator.rng(), config_.perturb_probability)) {
      candidate.current = generator.perturb(current.current, config_.perturb_scale);
      if (current.previous) {
        candidate.previous = generator.perturb(*current.previous, config_.perturb_scale);
      }
    } else {
      candidate = generator.generate();
    }

    double score = fitness(expression, candidate, nullptr);
    result.iterations_used = iter;
    if (score > result.best_fitness) {
      result.best_fitness = score;
      best = candidate;
    }
    if (score >= 1.0) {
      result.status = SearchStatus::Found;
      result.found = true;
      result.witness = candidate;
      logDebug(config_.verbose, "WitnessStateFinder", "%s: witness after %zu iterations",
               expression.id.c_str(), iter);
      return result;
    }

    if (restart_pending || score > current_fitness) {
      current = candidate;
      current_fitness = score;
      stale = 0;
      restart_pending = false;
    } else if (options.restart_threshold > 0 && ++stale >= options.restart_threshold) {
      restart_pending = true;
      stale = 0;
      ++result.restarts;
    }

    if (iter % config_.chunk_size == 0) {
      result.fitness_trace.push_back(result.best_fitness);
      if (iter == options.max_iterations) break;
      if (options.on_progress) options.on_progress(iter, options.max_iterations);
      if (scheduler_->yieldControl(options.cancel) == YieldStatus::Cancelled) {
        result.status = SearchStatus::Cancelled;
        result.nearest_miss = best;
        logDebug(config_.verbose, "WitnessStateFinder", "%s: cancelled after %zu iterations",
                 expression.id.c_str(), iter);
        return result;
      }
    }
  }

  result.status = SearchStatus::Exhausted;
  result.nearest_miss = best;

  std::vector<double> clause_scores;
  fitness(expression, best, &clause_scores);
  for (size_t idx = 0; idx < clause_scores.size(); ++idx) {
    if (clause_scores[idx] >= 1.0) continue;
    ClauseViolation violation;
    violation.clause_index = idx;
    violation.clause = logicToString(expression.prerequisites[idx].logic);
    violation.score = clause_scores[idx];
    result.violated_clauses.push_back(violation);
  }
  logDebug(config_.verbose, "WitnessStateFinder",
           "%s: no witness in %zu iterations (%zu restarts), best fitness %.4f, "
           "%zu violated clauses",
           expression.id.c_str(), result.iterations_used, result.restarts, result.best_fitness,
           result.violated_clauses.size());
  return result;
}

}  // namespace affect
