// Chunked randomized search for a context satisfying an expression.

#ifndef AFFECT_DIAGNOSTICS_WITNESS_STATE_FINDER_H
#define AFFECT_DIAGNOSTICS_WITNESS_STATE_FINDER_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "core/cooperative_scheduler.h"
#include "sampling/random_context_generator.h"
#include "scoring/i_emotion_calculator.h"

namespace affect {

/// @brief Terminal state of a witness search.
enum class SearchStatus : uint8_t {
  Found,      ///< Every prerequisite satisfied.
  Exhausted,  ///< Iteration budget spent without a witness.
  Cancelled   ///< Cancellation token fired at a yield point.
};

/// @brief Convert SearchStatus to lowercase string.
const char* searchStatusToString(SearchStatus status);

/// @brief Search tuning that does not vary per call.
struct WitnessSearchConfig {
  size_t chunk_size = 100;             ///< Iterations between progress/yield points.
  double perturb_probability = 0.5;    ///< Chance of refining the nearest miss instead of resampling.
  double perturb_scale = 1.0;          ///< Multiplier on the sampler's delta sigmas.
  uint32_t seed = 0;                   ///< 0 = random seed.
  SamplingConfig sampling;
  bool verbose = false;
};

/// @brief Per-call options.
struct WitnessSearchOptions {
  size_t max_iterations = 10000;
  /// Non-improving iterations before the search point is replaced by a
  /// fresh sample. 0 disables restarts.
  size_t restart_threshold = 0;
  ProgressFn on_progress;                        ///< (completed, total) after each full chunk.
  const CancellationToken* cancel = nullptr;
};

/// @brief A prerequisite the nearest miss failed.
struct ClauseViolation {
  size_t clause_index = 0;
  std::string clause;   ///< JSON-logic text.
  double score = 0.0;   ///< Graded satisfaction in [0, 1).
};

/// @brief Outcome of findWitness.
struct SearchResult {
  SearchStatus status = SearchStatus::Exhausted;
  bool found = false;
  std::optional<AffectContext> witness;
  std::optional<AffectContext> nearest_miss;
  double best_fitness = 0.0;
  size_t iterations_used = 0;
  size_t restarts = 0;
  std::vector<ClauseViolation> violated_clauses;
  std::vector<double> fitness_trace;  ///< best_fitness after each completed chunk.
};

/// @brief Graded satisfaction of one clause.
///
/// 1 when satisfied. An unsatisfied comparison scores
/// 0.99 * (1 - min(1, distance / scale)) where scale is the domain span of
/// the variable it compares, so near misses outrank wide misses. "and"
/// averages its children, "or" takes the best child, anything else is 0/1.
///
/// @param clause Clause AST.
/// @param vars Variable resolver.
/// @return Score in [0, 1].
double scoreClause(const LogicNode& clause, const IVariableResolver& vars);

/// @brief Randomized witness search.
///
/// Candidate 0 is a fresh sample and the first search point. Each later
/// iteration either perturbs the search point or draws a fresh sample; a
/// candidate that beats the search point replaces it. After
/// restart_threshold non-improving iterations the next candidate is a fresh
/// sample adopted unconditionally. best_fitness and nearest_miss track the
/// best candidate over all restarts. The search stops on the first candidate
/// whose fitness (mean clause score) is 1.
class WitnessStateFinder {
 public:
  /// @param calculator Emotion collaborator used to build evaluation contexts.
  /// @param config Search tuning.
  /// @param scheduler Yield hook; nullptr uses a ThreadYieldScheduler.
  WitnessStateFinder(const IEmotionCalculator& calculator,
                     const WitnessSearchConfig& config = WitnessSearchConfig(),
                     IScheduler* scheduler = nullptr);
  WitnessStateFinder(const WitnessStateFinder&) = delete;
  WitnessStateFinder& operator=(const WitnessStateFinder&) = delete;

  /// @brief Search for a witness of all prerequisites.
  ///
  /// Empty prerequisites are satisfied by candidate 0 with zero progress
  /// calls. iterations_used counts iterations after candidate 0 and never
  /// exceeds max_iterations. Progress and the yield point follow each full
  /// chunk except the last iteration of the budget.
  ///
  /// @param expression Expression to satisfy.
  /// @param options Budget, progress callback and cancellation.
  /// @return Search result.
  SearchResult findWitness(const Expression& expression,
                           const WitnessSearchOptions& options);

 private:
  double fitness(const Expression& expression, const AffectContext& ctx,
                 std::vector<double>* clause_scores) const;

  const IEmotionCalculator& calculator_;
  WitnessSearchConfig config_;
  ThreadYieldScheduler default_scheduler_;
  IScheduler* scheduler_;
};

}  // namespace affect

#endif  // AFFECT_DIAGNOSTICS_WITNESS_STATE_FINDER_H
