// Cooperative scheduler implementation.

#include "core/cooperative_scheduler.h"

#include <thread>

namespace affect {

void CancellationToken::cancel() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    cancelled_ = true;
  }
  cv_.notify_all();
}

bool CancellationToken::waitFor(std::chrono::milliseconds delay) const {
  std::unique_lock<std::mutex> lock(mu_);
  return cv_.wait_for(lock, delay, [this]() { return cancelled_.load(); });
}

YieldStatus ThreadYieldScheduler::yieldControl(const CancellationToken* token) {
  if (token && token->isCancelled()) return YieldStatus::Cancelled;

  if (delay_.count() > 0) {
    if (token) {
      if (token->waitFor(delay_)) return YieldStatus::Cancelled;
    } else {
      std::this_thread::sleep_for(delay_);
    }
  } else {
    std::this_thread::yield();
  }

  if (token && token->isCancelled()) return YieldStatus::Cancelled;
  return YieldStatus::Continue;
}

}  // namespace affect
