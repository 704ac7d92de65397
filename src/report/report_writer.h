// JSON rendering of diagnostic results for tools and the CLI.

#ifndef AFFECT_REPORT_REPORT_WRITER_H
#define AFFECT_REPORT_REPORT_WRITER_H

#include <map>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "core/json_helpers.h"
#include "diagnostics/feasibility_analyzer.h"
#include "diagnostics/monte_carlo_simulator.h"
#include "diagnostics/prototype_fit_ranker.h"
#include "diagnostics/witness_state_finder.h"
#include "overlap/overlap_analyzer.h"
#include "overlap/prototype_vector_evaluator.h"

namespace affect {

/// @brief Append a context as {"mood":{..},"sexual":{..},"traits":{..},"previous":..}.
void writeAffectContext(JsonWriter& writer, const AffectContext& ctx);

/// @brief Witness search result.
std::string searchResultToJson(const SearchResult& result, bool pretty = true);

/// @brief Feasibility results of one expression, as an array.
std::string feasibilityResultsToJson(const std::vector<FeasibilityResult>& results,
                                     bool pretty = true);

/// @brief Prototype vectors keyed by id.
///
/// Per-context arrays are omitted unless include_arrays is set, since they
/// scale with the pool size.
std::string prototypeVectorsToJson(const std::map<std::string, PrototypeVector>& vectors,
                                   bool include_arrays = false, bool pretty = true);

/// @brief Monte Carlo simulation result. Stored samples are reported by count only.
std::string simulationResultToJson(const SimulationResult& result, bool pretty = true);

/// @brief Prototype fit leaderboard; a missing current prototype is null.
std::string fitRankingToJson(const PrototypeFitRanking& ranking, bool pretty = true);

/// @brief Overlap analysis report. NaN metrics are written as null.
std::string overlapReportToJson(const OverlapReport& report, bool pretty = true);

}  // namespace affect

#endif  // AFFECT_REPORT_REPORT_WRITER_H
