// Monte Carlo simulator implementation.

#include "diagnostics/monte_carlo_simulator.h"

#include <algorithm>
#include <cmath>

#include "core/diag_log.h"
#include "core/rng_util.h"
#include "sampling/evaluation_context.h"

namespace affect {

const char* simulationStatusToString(SimulationStatus status) {
  switch (status) {
    case SimulationStatus::Completed: return "completed";
    case SimulationStatus::Cancelled: return "cancelled";
  }
  return "unknown";
}

double zScoreForConfidence(double confidence_level) {
  if (std::fabs(confidence_level - 0.99) < 1e-9) return 2.576;
  if (std::fabs(confidence_level - 0.90) < 1e-9) return 1.645;
  return 1.96;
}

ConfidenceInterval wilsonInterval(size_t successes, size_t trials, double z) {
  ConfidenceInterval interval;
  if (trials == 0) return interval;

  double n = static_cast<double>(trials);
  double p = static_cast<double>(successes) / n;
  double z2 = z * z;
  double denom = 1.0 + z2 / n;
  double center = (p + z2 / (2.0 * n)) / denom;
  double margin = z * std::sqrt(p * (1.0 - p) / n + z2 / (4.0 * n * n)) / denom;
  interval.low = std::max(0.0, center - margin);
  interval.high = std::min(1.0, center + margin);
  return interval;
}

MonteCarloSimulator::MonteCarloSimulator(const IEmotionCalculator& calculator,
                                         IScheduler* scheduler)
    : calculator_(calculator), scheduler_(scheduler ? scheduler : &default_scheduler_) {}

SimulationResult MonteCarloSimulator::simulate(const Expression& expression,
                                               const MonteCarloConfig& config,
                                               const ProgressFn& on_progress,
                                               const CancellationToken* cancel) {
  SimulationResult result;
  result.confidence_level = config.confidence_level;

  uint32_t seed = config.seed != 0 ? config.seed : rng::generateRandomSeed();
  RandomContextGenerator generator(seed, config.sampling);
  size_t chunk_size = std::max<size_t>(1, config.chunk_size);

  const size_t clause_count = expression.prerequisites.size();
  std::vector<size_t> failures(clause_count, 0);

  size_t processed = 0;
  while (processed < config.sample_count) {
    size_t chunk_end = std::min(config.sample_count, processed + chunk_size);
    for (; processed < chunk_end; ++processed) {
      AffectContext ctx = generator.generate();
      EvaluationContext eval(ctx, calculator_);

      std::vector<size_t> failed;
      for (size_t idx = 0; idx < clause_count; ++idx) {
        if (!evaluateLogic(expression.prerequisites[idx].logic, eval)) {
          ++failures[idx];
          failed.push_back(idx);
        }
      }

      if (failed.empty()) {
        ++result.trigger_count;
        if (result.witnesses.size() < config.max_witnesses) {
          result.witnesses.push_back(ctx);
        }
      } else if (!result.nearest_miss ||
                 failed.size() < result.nearest_miss->failed_clause_count) {
        NearestMissRecord miss;
        miss.context = ctx;
        miss.failed_clause_count = failed.size();
        miss.failed_clause_indices = failed;
        result.nearest_miss = miss;
      }

      if (config.store_samples_for_sensitivity &&
          result.stored_samples.size() < config.sensitivity_sample_limit) {
        result.stored_samples.push_back(ctx);
      }
    }

    if (on_progress) on_progress(processed, config.sample_count);
    if (processed < config.sample_count &&
        scheduler_->yieldControl(cancel) == YieldStatus::Cancelled) {
      result.status = SimulationStatus::Cancelled;
      logDebug(config.verbose, "MonteCarloSimulator", "%s: cancelled after %zu samples",
               expression.id.c_str(), processed);
      break;
    }
  }

  result.sample_count = processed;
  if (processed > 0) {
    result.trigger_rate =
        static_cast<double>(result.trigger_count) / static_cast<double>(processed);
  }
  result.confidence_interval = wilsonInterval(result.trigger_count, processed,
                                              zScoreForConfidence(config.confidence_level));

  for (size_t idx = 0; idx < clause_count; ++idx) {
    ClauseFailureStat stat;
    stat.clause_index = idx;
    stat.clause = logicToString(expression.prerequisites[idx].logic);
    stat.failure_count = failures[idx];
    stat.failure_rate =
        processed > 0 ? static_cast<double>(failures[idx]) / static_cast<double>(processed) : 0.0;
    result.clause_failures.push_back(stat);
  }

  logDebug(config.verbose, "MonteCarloSimulator", "%s: %zu/%zu triggered (%.4f)",
           expression.id.c_str(), result.trigger_count, processed, result.trigger_rate);
  return result;
}

}  // namespace affect
