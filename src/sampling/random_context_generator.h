// Randomized affect context sampling within domain bounds.

#ifndef AFFECT_SAMPLING_RANDOM_CONTEXT_GENERATOR_H
#define AFFECT_SAMPLING_RANDOM_CONTEXT_GENERATOR_H

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

#include "core/basic_types.h"

namespace affect {

/// @brief Per-axis value distribution.
enum class SamplingDistribution : uint8_t {
  Uniform,
  Gaussian  ///< mean = range midpoint, sd = range / 6, clamped.
};

/// @brief How the current state relates to the previous one.
enum class SamplingMode : uint8_t {
  Static,  ///< Previous and current sampled independently.
  Dynamic  ///< Current = previous + gaussian delta.
};

const char* samplingDistributionToString(SamplingDistribution dist);
const char* samplingModeToString(SamplingMode mode);

/// @brief Sampling options.
struct SamplingConfig {
  SamplingDistribution distribution = SamplingDistribution::Uniform;
  SamplingMode mode = SamplingMode::Static;
  bool include_previous = true;
  double mood_delta_sigma = 15.0;
  double sexual_delta_sigma = 12.0;
  double libido_delta_sigma = 8.0;
};

/// @brief Seeded generator of AffectContext samples.
///
/// Values are rounded to integers as authored states are. Traits are shared
/// between the previous and current state.
class RandomContextGenerator {
 public:
  explicit RandomContextGenerator(uint32_t seed, const SamplingConfig& config = SamplingConfig());

  /// @brief Sample one context (current plus previous when configured).
  AffectContext generate();

  /// @brief Sample count contexts.
  std::vector<AffectContext> generatePool(size_t count);

  /// @brief Sample a standalone state.
  AffectState sampleState();

  /// @brief Gaussian perturbation of a state, clamped to domain.
  /// @param base State to perturb.
  /// @param scale Multiplier on the configured sigmas.
  AffectState perturb(const AffectState& base, double scale = 1.0);

  std::mt19937& rng() { return rng_; }
  const SamplingConfig& config() const { return config_; }

 private:
  double sampleAxis(const AxisRange& range);

  std::mt19937 rng_;
  SamplingConfig config_;
};

}  // namespace affect

#endif  // AFFECT_SAMPLING_RANDOM_CONTEXT_GENERATOR_H
