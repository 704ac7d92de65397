// Monte Carlo trigger-rate estimation for expressions.

#ifndef AFFECT_DIAGNOSTICS_MONTE_CARLO_SIMULATOR_H
#define AFFECT_DIAGNOSTICS_MONTE_CARLO_SIMULATOR_H

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

/// @brief Simulation options.
struct MonteCarloConfig {
  size_t sample_count = 10000;
  size_t chunk_size = 1000;             ///< Samples between progress/yield points.
  uint32_t seed = 0;                    ///< 0 = random seed.
  SamplingConfig sampling;
  double confidence_level = 0.95;       ///< 0.90, 0.95 or 0.99.
  size_t max_witnesses = 5;
  bool store_samples_for_sensitivity = false;
  size_t sensitivity_sample_limit = 10000;
  bool verbose = false;
};

/// @brief Terminal state of a simulation.
enum class SimulationStatus : uint8_t {
  Completed,
  Cancelled
};

/// @brief Convert SimulationStatus to lowercase string.
const char* simulationStatusToString(SimulationStatus status);

/// @brief Two-sided interval on a proportion.
struct ConfidenceInterval {
  double low = 0.0;
  double high = 0.0;
};

/// @brief How often one top-level prerequisite failed.
struct ClauseFailureStat {
  size_t clause_index = 0;
  std::string clause;
  size_t failure_count = 0;
  double failure_rate = 0.0;
};

/// @brief Non-triggering sample with the fewest failed prerequisites.
struct NearestMissRecord {
  AffectContext context;
  size_t failed_clause_count = 0;
  std::vector<size_t> failed_clause_indices;
};

/// @brief Outcome of a simulation.
struct SimulationResult {
  SimulationStatus status = SimulationStatus::Completed;
  size_t sample_count = 0;   ///< Samples actually evaluated.
  size_t trigger_count = 0;
  double trigger_rate = 0.0;
  double confidence_level = 0.95;
  ConfidenceInterval confidence_interval;
  std::vector<ClauseFailureStat> clause_failures;
  std::vector<AffectContext> witnesses;
  std::optional<NearestMissRecord> nearest_miss;
  std::vector<AffectContext> stored_samples;  ///< Kept for sensitivity analysis when enabled.
};

/// @brief z value for a two-sided confidence level (1.645, 1.96, 2.576).
///
/// Unlisted levels use 1.96.
double zScoreForConfidence(double confidence_level);

/// @brief Wilson score interval for successes out of trials.
/// @return [0, 0] when trials is 0.
ConfidenceInterval wilsonInterval(size_t successes, size_t trials, double z);

/// @brief Samples contexts, derives emotions via the collaborator, evaluates
///        an expression and aggregates the trigger statistics.
class MonteCarloSimulator {
 public:
  /// @param calculator Emotion collaborator.
  /// @param scheduler Yield hook; nullptr uses a ThreadYieldScheduler.
  explicit MonteCarloSimulator(const IEmotionCalculator& calculator,
                               IScheduler* scheduler = nullptr);
  MonteCarloSimulator(const MonteCarloSimulator&) = delete;
  MonteCarloSimulator& operator=(const MonteCarloSimulator&) = delete;

  /// @brief Run the simulation.
  ///
  /// Progress fires after every chunk (the last one may be partial), so the
  /// final call reports completion.
  ///
  /// @param expression Expression to evaluate.
  /// @param config Simulation options.
  /// @param on_progress Optional (completed, total) callback.
  /// @param cancel Optional cancellation token checked between chunks.
  SimulationResult simulate(const Expression& expression, const MonteCarloConfig& config,
                            const ProgressFn& on_progress = ProgressFn(),
                            const CancellationToken* cancel = nullptr);

 private:
  const IEmotionCalculator& calculator_;
  ThreadYieldScheduler default_scheduler_;
  IScheduler* scheduler_;
};

}  // namespace affect

#endif  // AFFECT_DIAGNOSTICS_MONTE_CARLO_SIMULATOR_H
