// Random context generator implementation.

#include "sampling/random_context_generator.h"

#include <cmath>

#include "core/rng_util.h"

namespace affect {

const char* samplingDistributionToString(SamplingDistribution dist) {
  switch (dist) {
    case SamplingDistribution::Uniform:  return "uniform";
    case SamplingDistribution::Gaussian: return "gaussian";
  }
  return "unknown";
}

const char* samplingModeToString(SamplingMode mode) {
  switch (mode) {
    case SamplingMode::Static:  return "static";
    case SamplingMode::Dynamic: return "dynamic";
  }
  return "unknown";
}

RandomContextGenerator::RandomContextGenerator(uint32_t seed, const SamplingConfig& config)
    : rng_(seed), config_(config) {}

double RandomContextGenerator::sampleAxis(const AxisRange& range) {
  double value = 0.0;
  switch (config_.distribution) {
    case SamplingDistribution::Uniform:
      value = rng::rollDouble(rng_, range.min, range.max);
      break;
    case SamplingDistribution::Gaussian:
      value = rng::rollGaussianClamped(rng_, (range.min + range.max) / 2.0,
                                       range.span() / 6.0, range.min, range.max);
      break;
  }
  return std::round(value);
}

AffectState RandomContextGenerator::sampleState() {
  AffectState state;
  for (const auto& name : moodAxisNames()) {
    state.mood[name] = sampleAxis({kMoodAxisMin, kMoodAxisMax});
  }
  state.sexual[axis::kSexExcitation] = sampleAxis({kSexualAxisMin, kSexualAxisMax});
  state.sexual[axis::kSexInhibition] = sampleAxis({kSexualAxisMin, kSexualAxisMax});
  state.sexual[axis::kBaselineLibido] = sampleAxis({kLibidoMin, kLibidoMax});
  for (const auto& name : affectTraitNames()) {
    state.traits[name] = sampleAxis({kTraitMin, kTraitMax});
  }
  return state;
}

AffectState RandomContextGenerator::perturb(const AffectState& base, double scale) {
  AffectState out = base;
  for (auto& entry : out.mood) {
    entry.second = std::round(rng::rollGaussianClamped(
        rng_, entry.second, config_.mood_delta_sigma * scale, kMoodAxisMin, kMoodAxisMax));
  }
  for (auto& entry : out.sexual) {
    bool is_libido = entry.first == axis::kBaselineLibido;
    double sigma = (is_libido ? config_.libido_delta_sigma : config_.sexual_delta_sigma) * scale;
    double lo = is_libido ? kLibidoMin : kSexualAxisMin;
    double hi = is_libido ? kLibidoMax : kSexualAxisMax;
    entry.second = std::round(rng::rollGaussianClamped(rng_, entry.second, sigma, lo, hi));
  }
  return out;
}

AffectContext RandomContextGenerator::generate() {
  AffectContext ctx;
  if (!config_.include_previous) {
    ctx.current = sampleState();
    return ctx;
  }

  AffectState previous = sampleState();
  switch (config_.mode) {
    case SamplingMode::Static:
      ctx.current = sampleState();
      ctx.current.traits = previous.traits;
      break;
    case SamplingMode::Dynamic:
      ctx.current = perturb(previous);
      break;
  }
  ctx.previous = previous;
  return ctx;
}

std::vector<AffectContext> RandomContextGenerator::generatePool(size_t count) {
  std::vector<AffectContext> pool;
  pool.reserve(count);
  for (size_t idx = 0; idx < count; ++idx) {
    pool.push_back(generate());
  }
  return pool;
}

}  // namespace affect
