// Prototype vector evaluator implementation.

#include "overlap/prototype_vector_evaluator.h"

#include <cmath>
#include <utility>

#include "core/axis_normalizer.h"
#include "core/diag_log.h"
#include "scoring/intensity_calculator.h"

namespace affect {

const char* vectorEvalStatusToString(VectorEvalStatus status) {
  switch (status) {
    case VectorEvalStatus::Ok:               return "ok";
    case VectorEvalStatus::InvalidPrototype: return "invalid_prototype";
    case VectorEvalStatus::Cancelled:        return "cancelled";
  }
  return "unknown";
}

PrototypeVectorEvaluator::PrototypeVectorEvaluator(IScheduler* scheduler, bool verbose)
    : scheduler_(scheduler ? scheduler : &default_scheduler_), verbose_(verbose) {}

PrototypeVector PrototypeVectorEvaluator::buildVector(
    const std::string& prototype_id, const std::vector<uint8_t>& gate_pass,
    const std::vector<double>& raw_intensities) {
  PrototypeVector vec;
  vec.prototype_id = prototype_id;
  vec.gate_results = gate_pass;
  vec.intensities.assign(gate_pass.size(), 0.0);

  double sum = 0.0;
  for (size_t idx = 0; idx < gate_pass.size(); ++idx) {
    if (!gate_pass[idx]) continue;
    vec.intensities[idx] = raw_intensities[idx];
    sum += raw_intensities[idx];
    ++vec.pass_count;
  }

  if (!gate_pass.empty()) {
    vec.activation_rate =
        static_cast<double>(vec.pass_count) / static_cast<double>(gate_pass.size());
  }
  if (vec.pass_count > 0) {
    double count = static_cast<double>(vec.pass_count);
    vec.mean_intensity = sum / count;
    double sq_sum = 0.0;
    for (size_t idx = 0; idx < gate_pass.size(); ++idx) {
      if (!gate_pass[idx]) continue;
      double diff = vec.intensities[idx] - vec.mean_intensity;
      sq_sum += diff * diff;
    }
    vec.std_intensity = std::sqrt(sq_sum / count);
  }
  return vec;
}

VectorEvaluationResult PrototypeVectorEvaluator::evaluateAll(
    const std::vector<Prototype>& prototypes, const std::vector<AffectContext>& pool,
    const ProgressFn& on_progress, const CancellationToken* cancel) {
  VectorEvaluationResult result;
  for (size_t idx = 0; idx < prototypes.size(); ++idx) {
    if (prototypes[idx].id.empty()) {
      result.status = VectorEvalStatus::InvalidPrototype;
      result.error_message = "invalid prototype at index " + std::to_string(idx) + ": missing id";
      logWarn("PrototypeVectorEvaluator", "%s", result.error_message.c_str());
      return result;
    }
  }

  std::vector<NormalizedAxes> normalized;
  normalized.reserve(pool.size());
  for (const auto& ctx : pool) {
    normalized.push_back(normalizeState(ctx.current));
  }

  const bool yield_inside = pool.size() > kYieldPoolThreshold;
  for (size_t proto_idx = 0; proto_idx < prototypes.size(); ++proto_idx) {
    const Prototype& proto = prototypes[proto_idx];
    ParsedGateSet gates = parseGates(proto.gates, proto.id);

    std::vector<uint8_t> gate_pass(pool.size(), 0);
    std::vector<double> raw(pool.size(), 0.0);
    size_t failed_contexts = 0;
    for (size_t ctx_idx = 0; ctx_idx < pool.size(); ++ctx_idx) {
      if (yield_inside && ctx_idx > 0 && ctx_idx % kYieldInterval == 0 &&
          scheduler_->yieldControl(cancel) == YieldStatus::Cancelled) {
        result.status = VectorEvalStatus::Cancelled;
        result.error_message = "evaluation cancelled";
        result.vectors.clear();
        return result;
      }

      if (!checkAllGatesPassNormalized(gates.gates, normalized[ctx_idx])) continue;
      double intensity = computeIntensityNormalized(proto.weights, normalized[ctx_idx]);
      if (!std::isfinite(intensity)) {
        ++failed_contexts;
        logWarn("PrototypeVectorEvaluator", "%s: non-finite intensity at context %zu",
                proto.id.c_str(), ctx_idx);
        continue;
      }
      gate_pass[ctx_idx] = 1;
      raw[ctx_idx] = intensity;
    }

    PrototypeVector vec = buildVector(proto.id, gate_pass, raw);
    vec.gate_parse_info = gates.info;
    logDebug(verbose_, "PrototypeVectorEvaluator",
             "%s: activation %.4f mean %.4f std %.4f (%zu failed contexts)", proto.id.c_str(),
             vec.activation_rate, vec.mean_intensity, vec.std_intensity, failed_contexts);
    result.vectors[proto.id] = std::move(vec);

    if (on_progress) on_progress(proto_idx + 1, prototypes.size());
  }
  return result;
}

}  // namespace affect
