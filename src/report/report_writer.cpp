// Report writer implementation.

#include "report/report_writer.h"

#include <cstdint>

namespace affect {

namespace {

void writeAxisMap(JsonWriter& writer, std::string_view name, const AxisMap& axes) {
  writer.key(name);
  writer.beginObject();
  for (const auto& entry : axes) {
    writer.field(entry.first, entry.second);
  }
  writer.endObject();
}

void writeAffectState(JsonWriter& writer, const AffectState& state) {
  writeAxisMap(writer, "mood", state.mood);
  writeAxisMap(writer, "sexual", state.sexual);
  writeAxisMap(writer, "traits", state.traits);
}

void writeCount(JsonWriter& writer, std::string_view name, size_t count) {
  writer.field(name, static_cast<uint64_t>(count));
}

std::string finish(const JsonWriter& writer, bool pretty) {
  return pretty ? writer.toPrettyString() : writer.toString();
}

void writeGateParseInfo(JsonWriter& writer, std::string_view name, const GateParseInfo& info) {
  writer.key(name);
  writer.beginObject();
  writer.field("parseStatus", gateParseStatusToString(info.parse_status));
  writeCount(writer, "parsedGateCount", info.parsed_gate_count);
  writeCount(writer, "totalGateCount", info.total_gate_count);
  writer.key("unparsedGates");
  writer.beginArray();
  for (const auto& gate : info.unparsed_gates) writer.value(gate);
  writer.endArray();
  writer.endObject();
}

void writeImplication(JsonWriter& writer, const GateImplicationResult& impl) {
  writer.key("gateImplication");
  writer.beginObject();
  writer.field("aImpliesB", impl.a_implies_b);
  writer.field("bImpliesA", impl.b_implies_a);
  writer.field("isVacuous", impl.is_vacuous);
  writer.field("relation", implicationRelationToString(impl.relation));
  writer.key("counterExampleAxes");
  writer.beginArray();
  for (const auto& axis : impl.counter_example_axes) writer.value(axis);
  writer.endArray();
  writer.key("evidence");
  writer.beginArray();
  for (const auto& item : impl.evidence) {
    writer.beginObject();
    writer.field("axis", item.axis);
    writer.field("intervalA", item.interval_a.toString());
    writer.field("intervalB", item.interval_b.toString());
    writer.field("aWithinB", item.a_within_b);
    writer.field("bWithinA", item.b_within_a);
    writer.endObject();
  }
  writer.endArray();
  writer.endObject();
}

void writeBehavior(JsonWriter& writer, const BehavioralMetrics& behavior) {
  writer.key("behavior");
  writer.beginObject();
  writeCount(writer, "sampleCount", behavior.sample_count);

  writer.key("gateOverlap");
  writer.beginObject();
  writer.field("onEitherRate", behavior.gate_overlap.on_either_rate);
  writer.field("onBothRate", behavior.gate_overlap.on_both_rate);
  writer.field("pOnlyRate", behavior.gate_overlap.p_only_rate);
  writer.field("qOnlyRate", behavior.gate_overlap.q_only_rate);
  writer.endObject();

  const IntensityStats& intensity = behavior.intensity;
  writer.key("intensity");
  writer.beginObject();
  writer.field("pearsonCorrelation", intensity.pearson_correlation);
  writer.field("meanAbsDiff", intensity.mean_abs_diff);
  writer.field("rmse", intensity.rmse);
  writer.field("pctWithinEps", intensity.pct_within_eps);
  writer.field("dominanceP", intensity.dominance_p);
  writer.field("dominanceQ", intensity.dominance_q);
  writer.field("globalMeanAbsDiff", intensity.global_mean_abs_diff);
  writer.field("globalL2Distance", intensity.global_l2_distance);
  writer.field("globalOutputCorrelation", intensity.global_output_correlation);
  writer.endObject();

  const PassRates& rates = behavior.pass_rates;
  writer.key("passRates");
  writer.beginObject();
  writer.field("passARate", rates.pass_a_rate);
  writer.field("passBRate", rates.pass_b_rate);
  writer.field("pAGivenB", rates.p_a_given_b);
  writer.field("pBGivenA", rates.p_b_given_a);
  writeCount(writer, "coPassCount", rates.co_pass_count);
  writeCount(writer, "passACount", rates.pass_a_count);
  writeCount(writer, "passBCount", rates.pass_b_count);
  writer.endObject();

  writer.key("highCoactivation");
  writer.beginArray();
  for (const auto& entry : behavior.high_coactivation) {
    writer.beginObject();
    writer.field("threshold", entry.threshold);
    writer.field("pHighA", entry.p_high_a);
    writer.field("pHighB", entry.p_high_b);
    writer.field("pHighBoth", entry.p_high_both);
    writer.field("highJaccard", entry.high_jaccard);
    writer.field("highAgreement", entry.high_agreement);
    writer.endObject();
  }
  writer.endArray();

  writer.key("divergenceExamples");
  writer.beginArray();
  for (const auto& example : behavior.divergence_examples) {
    writer.beginObject();
    writeCount(writer, "contextIndex", example.context_index);
    writer.field("intensityA", example.intensity_a);
    writer.field("intensityB", example.intensity_b);
    writer.field("absDiff", example.abs_diff);
    if (!example.context_summary.empty()) {
      writer.field("contextSummary", example.context_summary);
    }
    writer.endObject();
  }
  writer.endArray();

  if (behavior.gate_implication) {
    writeImplication(writer, *behavior.gate_implication);
  } else {
    writer.key("gateImplication");
    writer.valueNull();
  }
  writeGateParseInfo(writer, "gateParseInfoA", behavior.gate_parse_info_a);
  writeGateParseInfo(writer, "gateParseInfoB", behavior.gate_parse_info_b);
  writer.endObject();
}

void writeClassification(JsonWriter& writer, const ClassificationResult& result) {
  writer.key("classifications");
  writer.beginArray();
  for (const auto& entry : result.entries) {
    writer.beginObject();
    writer.field("type", overlapTypeToString(entry.type));
    writer.field("confidence", entry.confidence);
    writer.field("isPrimary", entry.is_primary);
    if (entry.side != PairSide::None) {
      writer.field("side", pairSideToString(entry.side));
    }
    if (entry.type == OverlapType::NestedSiblings) {
      writer.field("deterministic", entry.deterministic);
    }
    writer.field("evidence", entry.evidence);
    writer.endObject();
  }
  writer.endArray();
}

void writeFitEntry(JsonWriter& writer, const PrototypeFitEntry& entry) {
  writer.beginObject();
  writer.field("prototypeId", entry.prototype_id);
  writer.field("type", prototypeTypeToString(entry.type));
  writeCount(writer, "rank", entry.rank);
  writer.field("compositeScore", entry.composite_score);
  writer.field("gatePassRate", entry.gate_pass_rate);
  writer.key("intensityDistribution");
  writer.beginObject();
  writeCount(writer, "sampleCount", entry.intensity.sample_count);
  writer.field("p50", entry.intensity.p50);
  writer.field("p90", entry.intensity.p90);
  writer.field("p95", entry.intensity.p95);
  writer.field("pAboveThreshold", entry.intensity.p_above_threshold);
  writer.key("min");
  if (entry.intensity.sample_count > 0) {
    writer.value(entry.intensity.min);
  } else {
    writer.valueNull();
  }
  writer.key("max");
  if (entry.intensity.sample_count > 0) {
    writer.value(entry.intensity.max);
  } else {
    writer.valueNull();
  }
  writer.endObject();
  writer.field("conflictScore", entry.conflict.score);
  writer.field("conflictMagnitude", entry.conflict.magnitude);
  writer.key("conflictingAxes");
  writer.beginArray();
  for (const auto& axis : entry.conflict.axes) {
    writer.beginObject();
    writer.field("axis", axis.axis);
    writer.field("weight", axis.weight);
    writer.field("direction", axis.weight > 0.0 ? "positive" : "negative");
    writer.endObject();
  }
  writer.endArray();
  writer.field("exclusionCompatibility", entry.exclusion_compatibility);
  writer.endObject();
}

}  // namespace

void writeAffectContext(JsonWriter& writer, const AffectContext& ctx) {
  writer.beginObject();
  writeAffectState(writer, ctx.current);
  writer.key("previous");
  if (ctx.previous) {
    writer.beginObject();
    writeAffectState(writer, *ctx.previous);
    writer.endObject();
  } else {
    writer.valueNull();
  }
  writer.endObject();
}

std::string searchResultToJson(const SearchResult& result, bool pretty) {
  JsonWriter writer;
  writer.beginObject();
  writer.field("status", searchStatusToString(result.status));
  writer.field("found", result.found);
  writer.field("bestFitness", result.best_fitness);
  writeCount(writer, "iterationsUsed", result.iterations_used);
  writeCount(writer, "restarts", result.restarts);

  writer.key("witness");
  if (result.witness) {
    writeAffectContext(writer, *result.witness);
  } else {
    writer.valueNull();
  }
  writer.key("nearestMiss");
  if (result.nearest_miss) {
    writeAffectContext(writer, *result.nearest_miss);
  } else {
    writer.valueNull();
  }

  writer.key("violatedClauses");
  writer.beginArray();
  for (const auto& violation : result.violated_clauses) {
    writer.beginObject();
    writeCount(writer, "clauseIndex", violation.clause_index);
    writer.field("clause", violation.clause);
    writer.field("score", violation.score);
    writer.endObject();
  }
  writer.endArray();

  writer.key("fitnessTrace");
  writer.beginArray();
  for (double fitness : result.fitness_trace) writer.value(fitness);
  writer.endArray();

  writer.endObject();
  return finish(writer, pretty);
}

std::string feasibilityResultsToJson(const std::vector<FeasibilityResult>& results,
                                     bool pretty) {
  JsonWriter writer;
  writer.beginArray();
  for (const auto& result : results) {
    writer.beginObject();
    writer.field("expressionId", result.expression_id);
    writer.field("clauseId", result.clause_id);
    writer.field("signal", clauseSignalToString(result.signal));
    writer.field("variablePath", result.variable_path);
    writer.field("operator", logicOpToString(result.op));
    writer.field("threshold", result.threshold);
    writer.field("passRate", result.pass_rate);
    writer.field("maxValue", result.max_value);
    writer.field("minValue", result.min_value);
    writeCount(writer, "sampleCount", result.sample_count);
    writer.field("classification", feasibilityClassToString(result.classification));
    writer.field("evidence", result.evidence);
    writer.endObject();
  }
  writer.endArray();
  return finish(writer, pretty);
}

std::string prototypeVectorsToJson(const std::map<std::string, PrototypeVector>& vectors,
                                   bool include_arrays, bool pretty) {
  JsonWriter writer;
  writer.beginObject();
  for (const auto& entry : vectors) {
    const PrototypeVector& vec = entry.second;
    writer.key(entry.first);
    writer.beginObject();
    writeCount(writer, "passCount", vec.pass_count);
    writer.field("activationRate", vec.activation_rate);
    writer.field("meanIntensity", vec.mean_intensity);
    writer.field("stdIntensity", vec.std_intensity);
    writeGateParseInfo(writer, "gateParseInfo", vec.gate_parse_info);
    if (include_arrays) {
      writer.key("gateResults");
      writer.beginArray();
      for (uint8_t pass : vec.gate_results) writer.value(pass != 0);
      writer.endArray();
      writer.key("intensities");
      writer.beginArray();
      for (double intensity : vec.intensities) writer.value(intensity);
      writer.endArray();
    }
    writer.endObject();
  }
  writer.endObject();
  return finish(writer, pretty);
}

std::string fitRankingToJson(const PrototypeFitRanking& ranking, bool pretty) {
  JsonWriter writer;
  writer.beginObject();
  writer.field("status", fitRankingStatusToString(ranking.status));
  writer.field("expressionId", ranking.expression_id);
  writeCount(writer, "sampleCount", ranking.sample_count);
  writeCount(writer, "regimeSampleCount", ranking.regime_sample_count);
  writer.key("axisConstraints");
  writer.beginObject();
  for (const auto& entry : ranking.constraints) {
    writer.key(entry.first);
    writer.beginObject();
    writer.field("min", entry.second.min);
    writer.field("max", entry.second.max);
    writer.endObject();
  }
  writer.endObject();

  writer.key("leaderboard");
  writer.beginArray();
  for (const auto& entry : ranking.leaderboard) writeFitEntry(writer, entry);
  writer.endArray();

  writer.key("currentPrototype");
  if (ranking.current) {
    writeFitEntry(writer, *ranking.current);
  } else {
    writer.valueNull();
  }
  writer.key("bestAlternative");
  if (ranking.best_alternative.empty()) {
    writer.valueNull();
  } else {
    writer.value(ranking.best_alternative);
  }
  writer.field("improvementFactor", ranking.improvement_factor);
  writer.endObject();
  return finish(writer, pretty);
}

std::string simulationResultToJson(const SimulationResult& result, bool pretty) {
  JsonWriter writer;
  writer.beginObject();
  writer.field("status", simulationStatusToString(result.status));
  writeCount(writer, "sampleCount", result.sample_count);
  writeCount(writer, "triggerCount", result.trigger_count);
  writer.field("triggerRate", result.trigger_rate);
  writer.field("confidenceLevel", result.confidence_level);
  writer.key("confidenceInterval");
  writer.beginObject();
  writer.field("low", result.confidence_interval.low);
  writer.field("high", result.confidence_interval.high);
  writer.endObject();

  writer.key("clauseFailures");
  writer.beginArray();
  for (const auto& failure : result.clause_failures) {
    writer.beginObject();
    writeCount(writer, "clauseIndex", failure.clause_index);
    writer.field("clause", failure.clause);
    writeCount(writer, "failureCount", failure.failure_count);
    writer.field("failureRate", failure.failure_rate);
    writer.endObject();
  }
  writer.endArray();

  writer.key("witnesses");
  writer.beginArray();
  for (const auto& witness : result.witnesses) writeAffectContext(writer, witness);
  writer.endArray();

  writer.key("nearestMiss");
  if (result.nearest_miss) {
    writer.beginObject();
    writeCount(writer, "failedClauseCount", result.nearest_miss->failed_clause_count);
    writer.key("failedClauseIndices");
    writer.beginArray();
    for (size_t idx : result.nearest_miss->failed_clause_indices) {
      writer.value(static_cast<uint64_t>(idx));
    }
    writer.endArray();
    writer.key("context");
    writeAffectContext(writer, result.nearest_miss->context);
    writer.endObject();
  } else {
    writer.valueNull();
  }
  writeCount(writer, "storedSampleCount", result.stored_samples.size());

  writer.endObject();
  return finish(writer, pretty);
}

std::string overlapReportToJson(const OverlapReport& report, bool pretty) {
  JsonWriter writer;
  writer.beginObject();
  writer.field("status", overlapAnalysisStatusToString(report.status));
  if (!report.success()) {
    writer.field("error", report.error_message);
    writer.endObject();
    return finish(writer, pretty);
  }

  writer.field("prototypeFamily", report.prototype_family);
  writeCount(writer, "totalPrototypes", report.total_prototypes);
  writeCount(writer, "sampleCount", report.sample_count);

  writer.key("summaryInsight");
  writer.beginObject();
  writer.field("status", insightStatusToString(report.insight.status));
  writer.field("message", report.insight.message);
  writer.endObject();

  writer.key("closestPair");
  if (report.closest_pair) {
    const ClosestPairSummary& closest = *report.closest_pair;
    writer.beginObject();
    writer.field("prototypeA", closest.prototype_a_id);
    writer.field("prototypeB", closest.prototype_b_id);
    writer.field("compositeScore", closest.composite_score);
    writer.field("gateOverlapRatio", closest.gate_overlap_ratio);
    writer.field("pearsonCorrelation", closest.pearson_correlation);
    writer.field("globalMeanAbsDiff", closest.global_mean_abs_diff);
    writer.endObject();
  } else {
    writer.valueNull();
  }

  const ClassificationBreakdown& counts = report.breakdown;
  writer.key("classificationBreakdown");
  writer.beginObject();
  writeCount(writer, "merge_recommended", counts.merge_recommended);
  writeCount(writer, "subsumed_recommended", counts.subsumed_recommended);
  writeCount(writer, "convert_to_expression", counts.convert_to_expression);
  writeCount(writer, "nested_siblings", counts.nested_siblings);
  writeCount(writer, "needs_separation", counts.needs_separation);
  writeCount(writer, "keep_distinct", counts.keep_distinct);
  writer.endObject();

  const CandidateFilterStats& stats = report.filter_stats;
  writer.key("filterStats");
  writer.beginObject();
  writeCount(writer, "totalPrototypes", stats.total_prototypes);
  writeCount(writer, "skippedNoWeights", stats.skipped_no_weights);
  writeCount(writer, "skippedFamily", stats.skipped_family);
  writeCount(writer, "pairsEvaluated", stats.pairs_evaluated);
  writeCount(writer, "passed", stats.passed);
  writeCount(writer, "rejectedActiveAxisOverlap", stats.rejected_active_axis_overlap);
  writeCount(writer, "rejectedSignAgreement", stats.rejected_sign_agreement);
  writeCount(writer, "rejectedCosineSimilarity", stats.rejected_cosine_similarity);
  writeCount(writer, "droppedByCap", stats.dropped_by_cap);
  writer.endObject();

  writer.key("nearMisses");
  writer.beginArray();
  for (const auto& miss : report.near_misses) {
    writer.beginObject();
    writer.field("prototypeA", miss.prototype_a_id);
    writer.field("prototypeB", miss.prototype_b_id);
    writer.field("reason", miss.reason);
    writer.field("pearsonCorrelation", miss.pearson_correlation);
    writer.field("gateOverlapRatio", miss.gate_overlap_ratio);
    writer.endObject();
  }
  writer.endArray();

  writer.key("pairs");
  writer.beginArray();
  for (const auto& pair : report.pairs) {
    writer.beginObject();
    writer.field("prototypeA", pair.prototype_a_id);
    writer.field("prototypeB", pair.prototype_b_id);
    writer.field("compositeScore", pair.composite_score);
    writer.field("gateOverlapRatio", pair.gate_overlap_ratio);
    writer.key("candidateMetrics");
    writer.beginObject();
    writer.field("activeAxisOverlap", pair.candidate.active_axis_overlap);
    writer.field("signAgreement", pair.candidate.sign_agreement);
    writer.field("weightCosineSimilarity", pair.candidate.weight_cosine_similarity);
    writer.endObject();
    writeBehavior(writer, pair.behavior);
    writeClassification(writer, pair.classification);
    if (pair.near_miss.is_near_miss) {
      writer.field("nearMissReason", pair.near_miss.reason);
    }
    writer.endObject();
  }
  writer.endArray();

  writer.endObject();
  return finish(writer, pretty);
}

}  // namespace affect
