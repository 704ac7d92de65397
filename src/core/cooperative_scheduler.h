// Cooperative yield points and cancellation for long-running analysis loops.

#ifndef AFFECT_CORE_COOPERATIVE_SCHEDULER_H
#define AFFECT_CORE_COOPERATIVE_SCHEDULER_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace affect {

/// @brief Outcome of a yield point.
enum class YieldStatus : uint8_t {
  Continue,
  Cancelled
};

/// @brief Cancellation flag shared between a caller and a running analysis.
///
/// cancel() may be called from any thread; a pending waitFor() wakes up
/// immediately.
class CancellationToken {
 public:
  CancellationToken() = default;
  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  /// @brief Request cancellation and wake any waiter.
  void cancel();

  /// @brief True once cancel() has been called.
  bool isCancelled() const { return cancelled_.load(); }

  /// @brief Sleep up to delay, returning early on cancellation.
  /// @return True if cancelled before or during the wait.
  bool waitFor(std::chrono::milliseconds delay) const;

 private:
  std::atomic<bool> cancelled_{false};
  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
};

/// @brief Host scheduler hook invoked between chunks of work.
class IScheduler {
 public:
  virtual ~IScheduler() = default;

  /// @brief Hand control back to the host.
  /// @param token Optional cancellation token (may be nullptr).
  /// @return Cancelled if the token was cancelled at this point.
  virtual YieldStatus yieldControl(const CancellationToken* token) = 0;
};

/// @brief Default scheduler: std::this_thread::yield plus an optional delay.
class ThreadYieldScheduler : public IScheduler {
 public:
  explicit ThreadYieldScheduler(std::chrono::milliseconds delay = std::chrono::milliseconds(0))
      : delay_(delay) {}

  YieldStatus yieldControl(const CancellationToken* token) override;

 private:
  std::chrono::milliseconds delay_;
};

}  // namespace affect

#endif  // AFFECT_CORE_COOPERATIVE_SCHEDULER_H
