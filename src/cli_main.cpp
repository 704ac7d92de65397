/// @file
/// @brief CLI entry point for the affect-state diagnostics.

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "core/json_parser.h"
#include "core/rng_util.h"
#include "diagnostics/feasibility_analyzer.h"
#include "diagnostics/monte_carlo_simulator.h"
#include "diagnostics/prototype_fit_ranker.h"
#include "diagnostics/witness_state_finder.h"
#include "overlap/overlap_analyzer.h"
#include "overlap/overlap_config.h"
#include "registry/json_prototype_registry.h"
#include "report/report_writer.h"
#include "sampling/evaluation_context.h"
#include "sampling/random_context_generator.h"
#include "scoring/prototype_emotion_calculator.h"

namespace {

/// @brief Diagnostic to run.
enum class CliMode : uint8_t {
  Witness,
  Feasibility,
  MonteCarlo,
  Fit,
  Overlap
};

/// @brief Command-line options parsed from argv.
struct CliOptions {
  std::string data_path;
  std::string config_path;
  std::string expression_id;
  CliMode mode = CliMode::Witness;
  uint32_t seed = 0;
  size_t samples = 0;     ///< 0 = mode default.
  size_t iterations = 10000;
  size_t restart_threshold = 0;
  double threshold = 0.3;
  bool json_output = false;
  bool verbose = false;
};

/// @brief Print usage information to stdout.
void printUsage() {
  std::printf("affect_diag - Affect expression and prototype diagnostics\n\n");
  std::printf("Usage: affect_diag --data FILE [options]\n\n");
  std::printf("Options:\n");
  std::printf("  --data FILE        Registry JSON (prototypes and expressions)\n");
  std::printf("  --mode MODE        witness, feasibility, montecarlo, fit, overlap\n");
  std::printf("                     (default: witness)\n");
  std::printf("  --expression ID    Expression to diagnose (all modes but overlap)\n");
  std::printf("  --seed N           Random seed (0 = auto)\n");
  std::printf("  --samples N        Sample count (feasibility, montecarlo, fit, overlap)\n");
  std::printf("  --threshold X      Fit intensity threshold (default: 0.3)\n");
  std::printf("  --iterations N     Witness search budget (default: 10000)\n");
  std::printf("  --restart N        Witness restart after N stale iterations (0 = off)\n");
  std::printf("  --config FILE      Overlap configuration JSON\n");
  std::printf("  --json             JSON output\n");
  std::printf("  --verbose          Debug logging to stderr\n");
  std::printf("  --help             Show this help\n");
}

bool parseMode(const char* val, CliMode& out) {
  if (std::strcmp(val, "witness") == 0) {
    out = CliMode::Witness;
  } else if (std::strcmp(val, "feasibility") == 0) {
    out = CliMode::Feasibility;
  } else if (std::strcmp(val, "montecarlo") == 0) {
    out = CliMode::MonteCarlo;
  } else if (std::strcmp(val, "fit") == 0) {
    out = CliMode::Fit;
  } else if (std::strcmp(val, "overlap") == 0) {
    out = CliMode::Overlap;
  } else {
    return false;
  }
  return true;
}

enum class ParseOutcome : uint8_t { Run, Help, Error };

/// @brief Parse command-line arguments into CliOptions.
/// @param argc Argument count from main().
/// @param argv Argument vector from main().
/// @param opts Output structure populated with parsed values.
/// @return Help if --help was requested, Error on a bad argument.
ParseOutcome parseArgs(int argc, char* argv[], CliOptions& opts) {
  for (int idx = 1; idx < argc; ++idx) {
    if (std::strcmp(argv[idx], "--help") == 0 || std::strcmp(argv[idx], "-h") == 0) {
      printUsage();
      return ParseOutcome::Help;
    }
    if (std::strcmp(argv[idx], "--data") == 0 && idx + 1 < argc) {
      opts.data_path = argv[++idx];
    } else if (std::strcmp(argv[idx], "--config") == 0 && idx + 1 < argc) {
      opts.config_path = argv[++idx];
    } else if (std::strcmp(argv[idx], "--expression") == 0 && idx + 1 < argc) {
      opts.expression_id = argv[++idx];
    } else if (std::strcmp(argv[idx], "--mode") == 0 && idx + 1 < argc) {
      ++idx;
      if (!parseMode(argv[idx], opts.mode)) {
        std::fprintf(stderr, "Error: unknown mode '%s'\n", argv[idx]);
        return ParseOutcome::Error;
      }
    } else if (std::strcmp(argv[idx], "--seed") == 0 && idx + 1 < argc) {
      opts.seed = static_cast<uint32_t>(std::strtoul(argv[++idx], nullptr, 10));
    } else if (std::strcmp(argv[idx], "--samples") == 0 && idx + 1 < argc) {
      opts.samples = static_cast<size_t>(std::strtoul(argv[++idx], nullptr, 10));
    } else if (std::strcmp(argv[idx], "--iterations") == 0 && idx + 1 < argc) {
      opts.iterations = static_cast<size_t>(std::strtoul(argv[++idx], nullptr, 10));
    } else if (std::strcmp(argv[idx], "--restart") == 0 && idx + 1 < argc) {
      opts.restart_threshold = static_cast<size_t>(std::strtoul(argv[++idx], nullptr, 10));
    } else if (std::strcmp(argv[idx], "--threshold") == 0 && idx + 1 < argc) {
      opts.threshold = std::strtod(argv[++idx], nullptr);
    } else if (std::strcmp(argv[idx], "--json") == 0) {
      opts.json_output = true;
    } else if (std::strcmp(argv[idx], "--verbose") == 0) {
      opts.verbose = true;
    } else {
      std::fprintf(stderr, "Error: unrecognized argument '%s'\n", argv[idx]);
      return ParseOutcome::Error;
    }
  }
  if (opts.data_path.empty()) {
    std::fprintf(stderr, "Error: --data is required\n");
    return ParseOutcome::Error;
  }
  if (opts.mode != CliMode::Overlap && opts.expression_id.empty()) {
    std::fprintf(stderr, "Error: --expression is required for this mode\n");
    return ParseOutcome::Error;
  }
  return ParseOutcome::Run;
}

int runWitness(const CliOptions& opts, const affect::Expression& expr,
               const affect::IEmotionCalculator& calculator) {
  affect::WitnessSearchConfig config;
  config.seed = opts.seed;
  config.verbose = opts.verbose;
  affect::WitnessStateFinder finder(calculator, config);

  affect::WitnessSearchOptions options;
  options.max_iterations = opts.iterations;
  options.restart_threshold = opts.restart_threshold;
  affect::SearchResult result = finder.findWitness(expr, options);

  if (opts.json_output) {
    std::printf("%s\n", affect::searchResultToJson(result).c_str());
    return 0;
  }
  std::printf("Expression: %s\n", expr.id.c_str());
  std::printf("Status:     %s\n", affect::searchStatusToString(result.status));
  std::printf("Found:      %s\n", result.found ? "yes" : "no");
  std::printf("Fitness:    %.4f\n", result.best_fitness);
  std::printf("Iterations: %zu (%zu restarts)\n", result.iterations_used, result.restarts);
  for (const auto& violation : result.violated_clauses) {
    std::printf("  [%zu] score %.3f  %s\n", violation.clause_index, violation.score,
                violation.clause.c_str());
  }
  return 0;
}

int runFeasibility(const CliOptions& opts, const affect::Expression& expr,
                   const affect::IEmotionCalculator& calculator) {
  affect::RandomContextGenerator generator(opts.seed != 0 ? opts.seed
                                                          : affect::rng::generateRandomSeed());
  std::vector<affect::AffectContext> contexts =
      generator.generatePool(opts.samples > 0 ? opts.samples : 10000);
  std::vector<affect::EvaluationContext> pool;
  pool.reserve(contexts.size());
  for (const auto& ctx : contexts) pool.emplace_back(ctx, calculator);

  affect::FeasibilityAnalyzer analyzer(opts.verbose);
  std::vector<affect::FeasibilityResult> results =
      analyzer.analyze(expr.prerequisites, pool, expr.id);

  if (opts.json_output) {
    std::printf("%s\n", affect::feasibilityResultsToJson(results).c_str());
    return 0;
  }
  std::printf("Expression: %s (%zu clauses, %zu samples)\n", expr.id.c_str(), results.size(),
              pool.size());
  for (const auto& result : results) {
    std::printf("  %-6s %-26s %s\n", result.clause_id.c_str(),
                affect::feasibilityClassToString(result.classification),
                result.evidence.c_str());
  }
  return 0;
}

int runMonteCarlo(const CliOptions& opts, const affect::Expression& expr,
                  const affect::IEmotionCalculator& calculator) {
  affect::MonteCarloConfig config;
  config.seed = opts.seed;
  config.verbose = opts.verbose;
  if (opts.samples > 0) config.sample_count = opts.samples;
  affect::MonteCarloSimulator simulator(calculator);
  affect::SimulationResult result = simulator.simulate(expr, config);

  if (opts.json_output) {
    std::printf("%s\n", affect::simulationResultToJson(result).c_str());
    return 0;
  }
  std::printf("Expression:   %s\n", expr.id.c_str());
  std::printf("Samples:      %zu\n", result.sample_count);
  std::printf("Triggers:     %zu\n", result.trigger_count);
  std::printf("Trigger rate: %.4f  (%.0f%% CI %.4f - %.4f)\n", result.trigger_rate,
              result.confidence_level * 100.0, result.confidence_interval.low,
              result.confidence_interval.high);
  for (const auto& failure : result.clause_failures) {
    std::printf("  [%zu] fails %.1f%%  %s\n", failure.clause_index,
                failure.failure_rate * 100.0, failure.clause.c_str());
  }
  return 0;
}

int runFit(const CliOptions& opts, const affect::Expression& expr,
           const affect::IEmotionCalculator& calculator,
           const affect::JsonPrototypeRegistry& registry) {
  affect::MonteCarloConfig config;
  config.seed = opts.seed;
  config.verbose = opts.verbose;
  config.store_samples_for_sensitivity = true;
  if (opts.samples > 0) {
    config.sample_count = opts.samples;
    config.sensitivity_sample_limit = opts.samples;
  }
  affect::MonteCarloSimulator simulator(calculator);
  affect::SimulationResult simulation = simulator.simulate(expr, config);

  affect::FitRankingOptions options;
  options.threshold = opts.threshold;
  options.verbose = opts.verbose;
  affect::PrototypeFitRanker ranker(registry, options);
  affect::PrototypeFitRanking ranking = ranker.rank(expr, simulation.stored_samples);

  if (opts.json_output) {
    std::printf("%s\n", affect::fitRankingToJson(ranking).c_str());
    return 0;
  }
  std::printf("Expression: %s\n", expr.id.c_str());
  std::printf("Status:     %s\n", affect::fitRankingStatusToString(ranking.status));
  std::printf("Regime:     %zu of %zu samples\n", ranking.regime_sample_count,
              ranking.sample_count);
  for (const auto& entry : ranking.leaderboard) {
    std::printf("  %2zu. %-20s score %.3f  gate %.3f  p>=%.2f %.3f  conflict %.2f\n",
                entry.rank, entry.prototype_id.c_str(), entry.composite_score,
                entry.gate_pass_rate, opts.threshold, entry.intensity.p_above_threshold,
                entry.conflict.score);
  }
  if (ranking.current) {
    std::printf("Current:    %s (rank %zu)\n", ranking.current->prototype_id.c_str(),
                ranking.current->rank);
  }
  if (!ranking.best_alternative.empty()) {
    std::printf("Better fit: %s (x%.2f)\n", ranking.best_alternative.c_str(),
                ranking.improvement_factor);
  }
  return 0;
}

int runOverlap(const CliOptions& opts, const affect::JsonPrototypeRegistry& registry) {
  affect::OverlapConfig config;
  if (!opts.config_path.empty()) {
    std::string text;
    if (!affect::readTextFile(opts.config_path, text)) {
      std::fprintf(stderr, "Error: cannot read %s\n", opts.config_path.c_str());
      return 1;
    }
    affect::JsonParseResult parsed = affect::parseJson(text.data(), text.size());
    if (!parsed.success) {
      std::fprintf(stderr, "Error: %s: %s\n", opts.config_path.c_str(),
                   parsed.error_message.c_str());
      return 1;
    }
    affect::OverlapConfigLoadResult loaded = affect::applyOverlapConfigJson(parsed.value, config);
    for (const auto& error : loaded.errors) {
      std::fprintf(stderr, "Warning: %s: %s\n", opts.config_path.c_str(), error.c_str());
    }
  }
  if (opts.seed != 0) config.seed = opts.seed;
  if (opts.samples > 0) config.sample_count_per_pair = opts.samples;
  config.verbose = config.verbose || opts.verbose;

  affect::OverlapAnalyzer analyzer(config);
  affect::OverlapReport report = analyzer.analyze(registry.allPrototypes());

  if (opts.json_output) {
    std::printf("%s\n", affect::overlapReportToJson(report).c_str());
    return report.success() ? 0 : 1;
  }
  if (!report.success()) {
    std::fprintf(stderr, "Error: %s\n", report.error_message.c_str());
    return 1;
  }
  std::printf("Prototypes: %zu\n", report.total_prototypes);
  std::printf("Candidates: %zu\n", report.pairs.size());
  std::printf("Insight:    %s\n", report.insight.message.c_str());
  for (const auto& pair : report.pairs) {
    const affect::OverlapClassification& primary = pair.classification.primary();
    std::printf("  %-20s %-20s %-22s score %.3f\n", pair.prototype_a_id.c_str(),
                pair.prototype_b_id.c_str(), affect::overlapTypeToString(primary.type),
                pair.composite_score);
  }
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliOptions opts;
  ParseOutcome outcome = parseArgs(argc, argv, opts);
  if (outcome == ParseOutcome::Help) return 0;
  if (outcome == ParseOutcome::Error) {
    printUsage();
    return 1;
  }

  affect::JsonPrototypeRegistry registry;
  affect::RegistryLoadResult loaded = registry.loadFromFile(opts.data_path);
  if (!loaded.success) {
    std::fprintf(stderr, "Error: %s\n", loaded.error_message.c_str());
    return 1;
  }
  if (opts.verbose) {
    std::fprintf(stderr, "[affect_diag] loaded %zu prototypes, %zu expressions\n",
                 loaded.prototype_count, loaded.expression_count);
  }

  if (opts.mode == CliMode::Overlap) return runOverlap(opts, registry);

  const affect::Expression* expr = registry.getExpression(opts.expression_id);
  if (expr == nullptr) {
    std::fprintf(stderr, "Error: unknown expression '%s'\n", opts.expression_id.c_str());
    return 1;
  }

  affect::PrototypeEmotionCalculator calculator(registry.allPrototypes());
  switch (opts.mode) {
    case CliMode::Witness:     return runWitness(opts, *expr, calculator);
    case CliMode::Feasibility: return runFeasibility(opts, *expr, calculator);
    case CliMode::MonteCarlo:  return runMonteCarlo(opts, *expr, calculator);
    case CliMode::Fit:         return runFit(opts, *expr, calculator, registry);
    case CliMode::Overlap:     break;
  }
  return 0;
}
