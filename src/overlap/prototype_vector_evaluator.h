// Batch gate/intensity evaluation of prototypes over a shared context pool.

#ifndef AFFECT_OVERLAP_PROTOTYPE_VECTOR_EVALUATOR_H
#define AFFECT_OVERLAP_PROTOTYPE_VECTOR_EVALUATOR_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "core/cooperative_scheduler.h"
#include "gate/gate_checker.h"

namespace affect {

/// @brief Sparse per-context activation record of one prototype.
///
/// gate_results and intensities are parallel arrays indexed by context
/// position. intensities holds 0 wherever the gate failed. Mean and std are
/// taken over gate-passing positions only.
struct PrototypeVector {
  std::string prototype_id;
  std::vector<uint8_t> gate_results;  ///< 1 = all gates pass.
  std::vector<double> intensities;
  size_t pass_count = 0;
  double activation_rate = 0.0;
  double mean_intensity = 0.0;
  double std_intensity = 0.0;         ///< Population standard deviation.
  GateParseInfo gate_parse_info;
};

/// @brief Outcome code of evaluateAll.
enum class VectorEvalStatus : uint8_t {
  Ok,
  InvalidPrototype,
  Cancelled
};

/// @brief Convert VectorEvalStatus to lowercase string.
const char* vectorEvalStatusToString(VectorEvalStatus status);

/// @brief Result of evaluateAll. vectors is empty unless status is Ok.
struct VectorEvaluationResult {
  VectorEvalStatus status = VectorEvalStatus::Ok;
  std::string error_message;
  std::map<std::string, PrototypeVector> vectors;

  bool success() const { return status == VectorEvalStatus::Ok; }
};

/// @brief Evaluates many prototypes against one context pool.
class PrototypeVectorEvaluator {
 public:
  /// Pools larger than this yield to the scheduler inside the context loop.
  static constexpr size_t kYieldPoolThreshold = 1000;

  /// Contexts between inner-loop yields.
  static constexpr size_t kYieldInterval = 1000;

  /// @param scheduler Yield hook; nullptr uses a ThreadYieldScheduler.
  /// @param verbose Emit per-prototype debug lines.
  explicit PrototypeVectorEvaluator(IScheduler* scheduler = nullptr, bool verbose = false);
  PrototypeVectorEvaluator(const PrototypeVectorEvaluator&) = delete;
  PrototypeVectorEvaluator& operator=(const PrototypeVectorEvaluator&) = delete;

  /// @brief Evaluate every prototype over the pool.
  ///
  /// A prototype without an id fails the whole call with InvalidPrototype
  /// before any work. on_progress(i, n) fires once per prototype with
  /// 1-based i, also for an empty pool. A context whose intensity is not
  /// finite is logged and recorded as non-pass with zero intensity.
  ///
  /// @param prototypes Prototypes to evaluate.
  /// @param pool Shared context pool (current state is scored).
  /// @param on_progress Optional progress callback.
  /// @param cancel Optional cancellation token checked at yield points.
  VectorEvaluationResult evaluateAll(const std::vector<Prototype>& prototypes,
                                     const std::vector<AffectContext>& pool,
                                     const ProgressFn& on_progress = ProgressFn(),
                                     const CancellationToken* cancel = nullptr);

  /// @brief Build a sparse vector from a gate pattern and raw intensities.
  ///
  /// Both arrays must have the same length; failing positions store 0.
  static PrototypeVector buildVector(const std::string& prototype_id,
                                     const std::vector<uint8_t>& gate_pass,
                                     const std::vector<double>& raw_intensities);

 private:
  ThreadYieldScheduler default_scheduler_;
  IScheduler* scheduler_;
  bool verbose_;
};

}  // namespace affect

#endif  // AFFECT_OVERLAP_PROTOTYPE_VECTOR_EVALUATOR_H
