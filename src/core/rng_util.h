// Random number generation utilities for reproducible state sampling.

#ifndef AFFECT_CORE_RNG_UTIL_H
#define AFFECT_CORE_RNG_UTIL_H

#include <algorithm>
#include <cstdint>
#include <random>

namespace affect {
namespace rng {

/// @brief Roll a probability check against a threshold.
/// @param rng Mersenne Twister RNG instance.
/// @param threshold Probability threshold in [0.0, 1.0].
/// @return True if the random roll is below threshold.
inline bool rollProbability(std::mt19937& rng, double threshold) {
  std::uniform_real_distribution<double> dist(0.0, 1.0);
  return dist(rng) < threshold;
}

/// @brief Generate a random double in [min, max).
/// @param rng Mersenne Twister RNG instance.
/// @param min Minimum value.
/// @param max Maximum value.
/// @return Random double in the specified range.
inline double rollDouble(std::mt19937& rng, double min, double max) {
  if (max <= min) return min;
  std::uniform_real_distribution<double> dist(min, max);
  return dist(rng);
}

/// @brief Draw a normal sample clamped into [min, max].
/// @param rng Mersenne Twister RNG instance.
/// @param mean Distribution mean.
/// @param stddev Standard deviation (<= 0 returns the clamped mean).
/// @param min Lower clamp.
/// @param max Upper clamp.
inline double rollGaussianClamped(std::mt19937& rng, double mean, double stddev,
                                  double min, double max) {
  double sample = mean;
  if (stddev > 0.0) {
    std::normal_distribution<double> dist(mean, stddev);
    sample = dist(rng);
  }
  return std::clamp(sample, min, max);
}

/// @brief Generate a random seed using the system random device.
/// @return A non-zero random seed (suitable for seeding mt19937).
inline uint32_t generateRandomSeed() {
  std::random_device device;
  uint32_t result = device();
  if (result == 0) result = 1;
  return result;
}

}  // namespace rng
}  // namespace affect

#endif  // AFFECT_CORE_RNG_UTIL_H
