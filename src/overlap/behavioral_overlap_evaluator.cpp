// Behavioral overlap evaluator implementation.

#include "overlap/behavioral_overlap_evaluator.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <initializer_list>
#include <set>
#include <utility>

#include "core/axis_normalizer.h"
#include "core/diag_log.h"

namespace affect {

double pearsonCorrelation(const std::vector<double>& xs, const std::vector<double>& ys) {
  const size_t n = xs.size();
  if (n < 2 || n != ys.size()) return kNaN;

  double sum_x = 0.0;
  double sum_y = 0.0;
  for (size_t idx = 0; idx < n; ++idx) {
    sum_x += xs[idx];
    sum_y += ys[idx];
  }
  double mean_x = sum_x / static_cast<double>(n);
  double mean_y = sum_y / static_cast<double>(n);

  double cov = 0.0;
  double var_x = 0.0;
  double var_y = 0.0;
  for (size_t idx = 0; idx < n; ++idx) {
    double dx = xs[idx] - mean_x;
    double dy = ys[idx] - mean_y;
    cov += dx * dy;
    var_x += dx * dx;
    var_y += dy * dy;
  }
  if (var_x <= 0.0 || var_y <= 0.0) return kNaN;

  double corr = cov / (std::sqrt(var_x) * std::sqrt(var_y));
  return std::max(-1.0, std::min(1.0, corr));
}

namespace {

struct ThresholdCounter {
  double threshold = 0.0;
  size_t high_a = 0;
  size_t high_b = 0;
  size_t high_both = 0;
  size_t either_high = 0;
  size_t agreement = 0;
};

double ratio(size_t num, size_t den) {
  return den > 0 ? static_cast<double>(num) / static_cast<double>(den) : 0.0;
}

}  // namespace

BehavioralMetrics BehavioralOverlapEvaluator::evaluate(const Prototype& proto_a,
                                                       const Prototype& proto_b,
                                                       const PrototypeVector& vec_a,
                                                       const PrototypeVector& vec_b,
                                                       const std::vector<AffectContext>& pool) const {
  BehavioralMetrics metrics;
  const size_t sample_count = std::min(vec_a.gate_results.size(), vec_b.gate_results.size());
  if (vec_a.gate_results.size() != vec_b.gate_results.size()) {
    logWarn("BehavioralOverlapEvaluator", "%s/%s: vector lengths differ (%zu vs %zu)",
            proto_a.id.c_str(), proto_b.id.c_str(), vec_a.gate_results.size(),
            vec_b.gate_results.size());
  }
  metrics.sample_count = sample_count;

  size_t on_either = 0;
  size_t on_both = 0;
  size_t p_only = 0;
  size_t q_only = 0;
  size_t dominance_p = 0;
  size_t dominance_q = 0;
  double global_abs_sum = 0.0;
  double global_sq_sum = 0.0;
  std::vector<double> co_a;
  std::vector<double> co_b;
  std::vector<double> out_a(sample_count, 0.0);
  std::vector<double> out_b(sample_count, 0.0);
  std::vector<DivergenceExample> divergences;

  std::vector<ThresholdCounter> counters;
  for (double threshold : config_.high_thresholds) {
    ThresholdCounter counter;
    counter.threshold = threshold;
    counters.push_back(counter);
  }

  for (size_t idx = 0; idx < sample_count; ++idx) {
    const bool pass_a = vec_a.gate_results[idx] != 0;
    const bool pass_b = vec_b.gate_results[idx] != 0;
    const double val_a = pass_a ? vec_a.intensities[idx] : 0.0;
    const double val_b = pass_b ? vec_b.intensities[idx] : 0.0;

    out_a[idx] = val_a;
    out_b[idx] = val_b;
    double diff = val_a - val_b;
    global_abs_sum += std::fabs(diff);
    global_sq_sum += diff * diff;

    if (pass_a || pass_b) {
      ++on_either;
      for (auto& counter : counters) {
        bool high_a = val_a >= counter.threshold;
        bool high_b = val_b >= counter.threshold;
        if (high_a) ++counter.high_a;
        if (high_b) ++counter.high_b;
        if (high_a && high_b) ++counter.high_both;
        if (high_a || high_b) ++counter.either_high;
        if (high_a == high_b) ++counter.agreement;
      }
    }
    if (pass_a && !pass_b) ++p_only;
    if (pass_b && !pass_a) ++q_only;
    if (!(pass_a && pass_b)) continue;

    ++on_both;
    co_a.push_back(val_a);
    co_b.push_back(val_b);
    if (val_a > val_b + config_.dominance_delta) ++dominance_p;
    if (val_b > val_a + config_.dominance_delta) ++dominance_q;

    DivergenceExample example;
    example.context_index = idx;
    example.intensity_a = val_a;
    example.intensity_b = val_b;
    example.abs_diff = std::fabs(diff);
    divergences.push_back(example);
  }

  // Gate co-occurrence.
  GateOverlapStats& gates = metrics.gate_overlap;
  gates.on_either_rate = ratio(on_either, sample_count);
  gates.on_both_rate = ratio(on_both, sample_count);
  gates.p_only_rate = ratio(p_only, sample_count);
  gates.q_only_rate = ratio(q_only, sample_count);

  // Intensity agreement.
  IntensityStats& intensity = metrics.intensity;
  const size_t joint = co_a.size();
  if (joint >= config_.min_co_pass_samples && joint > 0) {
    intensity.pearson_correlation = pearsonCorrelation(co_a, co_b);
    double abs_sum = 0.0;
    double sq_sum = 0.0;
    size_t within_eps = 0;
    for (size_t idx = 0; idx < joint; ++idx) {
      double diff = co_a[idx] - co_b[idx];
      abs_sum += std::fabs(diff);
      sq_sum += diff * diff;
      if (std::fabs(diff) <= config_.intensity_eps) ++within_eps;
    }
    intensity.mean_abs_diff = abs_sum / static_cast<double>(joint);
    intensity.rmse = std::sqrt(sq_sum / static_cast<double>(joint));
    intensity.pct_within_eps = ratio(within_eps, joint);
  }
  intensity.dominance_p = ratio(dominance_p, joint);
  intensity.dominance_q = ratio(dominance_q, joint);
  if (sample_count > 0) {
    intensity.global_mean_abs_diff = global_abs_sum / static_cast<double>(sample_count);
    intensity.global_l2_distance = std::sqrt(global_sq_sum / static_cast<double>(sample_count));
  }
  intensity.global_output_correlation = pearsonCorrelation(out_a, out_b);

  // Pass rates.
  PassRates& rates = metrics.pass_rates;
  rates.pass_a_count = on_both + p_only;
  rates.pass_b_count = on_both + q_only;
  rates.co_pass_count = on_both;
  rates.pass_a_rate = ratio(rates.pass_a_count, sample_count);
  rates.pass_b_rate = ratio(rates.pass_b_count, sample_count);
  if (rates.pass_b_count > 0 && rates.pass_b_count >= config_.min_pass_samples_for_conditional) {
    rates.p_a_given_b = ratio(on_both, rates.pass_b_count);
  }
  if (rates.pass_a_count > 0 && rates.pass_a_count >= config_.min_pass_samples_for_conditional) {
    rates.p_b_given_a = ratio(on_both, rates.pass_a_count);
  }

  for (const auto& counter : counters) {
    HighCoactivationEntry entry;
    entry.threshold = counter.threshold;
    entry.p_high_a = ratio(counter.high_a, on_either);
    entry.p_high_b = ratio(counter.high_b, on_either);
    entry.p_high_both = ratio(counter.high_both, on_either);
    entry.high_jaccard = ratio(counter.high_both, counter.either_high);
    entry.high_agreement = ratio(counter.agreement, on_either);
    metrics.high_coactivation.push_back(entry);
  }

  // Top-K divergence, largest difference first, earlier context on ties.
  std::sort(divergences.begin(), divergences.end(),
            [](const DivergenceExample& lhs, const DivergenceExample& rhs) {
              if (lhs.abs_diff != rhs.abs_diff) return lhs.abs_diff > rhs.abs_diff;
              return lhs.context_index < rhs.context_index;
            });
  if (divergences.size() > config_.divergence_examples_k) {
    divergences.resize(config_.divergence_examples_k);
  }
  if (pool.size() == sample_count) {
    for (auto& example : divergences) {
      example.context_summary = summarizeContext(pool[example.context_index], proto_a, proto_b);
    }
  }
  metrics.divergence_examples = std::move(divergences);

  // Deterministic implication only from fully parsed gates.
  ParsedGateSet parsed_a = parseGates(proto_a.gates);
  ParsedGateSet parsed_b = parseGates(proto_b.gates);
  metrics.gate_parse_info_a = parsed_a.info;
  metrics.gate_parse_info_b = parsed_b.info;
  if (parsed_a.info.parse_status == GateParseStatus::Complete &&
      parsed_b.info.parse_status == GateParseStatus::Complete) {
    metrics.gate_implication = evaluateGateImplication(buildGateIntervals(parsed_a.gates),
                                                       buildGateIntervals(parsed_b.gates));
  }

  logDebug(config_.verbose, "BehavioralOverlapEvaluator",
           "%s/%s: %zu samples, onBoth %.4f, pearson %.4f, implication %s", proto_a.id.c_str(),
           proto_b.id.c_str(), sample_count, gates.on_both_rate, intensity.pearson_correlation,
           metrics.gate_implication
               ? implicationRelationToString(metrics.gate_implication->relation)
               : "none");
  return metrics;
}

std::string BehavioralOverlapEvaluator::summarizeContext(const AffectContext& context,
                                                         const Prototype& proto_a,
                                                         const Prototype& proto_b) const {
  std::set<std::string> relevant;
  for (const Prototype* proto : {&proto_a, &proto_b}) {
    for (const auto& entry : proto->weights) relevant.insert(entry.first);
    ParsedGateSet parsed = parseGates(proto->gates);
    for (const auto& gate : parsed.gates) relevant.insert(gate.axis);
  }

  NormalizedAxes axes = normalizeState(context.current);
  std::vector<std::pair<std::string, double>> entries;
  for (const auto& name : relevant) {
    if (!isKnownAxis(name)) continue;
    entries.emplace_back(name, resolveAxis(axes, name));
  }
  std::stable_sort(entries.begin(), entries.end(),
                   [](const std::pair<std::string, double>& lhs,
                      const std::pair<std::string, double>& rhs) {
                     return std::fabs(lhs.second) > std::fabs(rhs.second);
                   });

  std::string summary;
  for (size_t idx = 0; idx < entries.size() && idx < 3; ++idx) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "%s%s: %.2f", idx > 0 ? ", " : "",
                  entries[idx].first.c_str(), entries[idx].second);
    summary += buf;
  }
  return summary;
}

}  // namespace affect
