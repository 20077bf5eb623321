#pragma once

#include <atomic>

namespace dfs_core {

// Cooperative stop signal. Long-running batches poll it between lineup
// solves and between simulation chunk waves.
class CancellationToken {
public:
  CancellationToken() = default;
  CancellationToken(const CancellationToken &) = delete;
  CancellationToken &operator=(const CancellationToken &) = delete;

  void cancel() { flag_.store(true, std::memory_order_relaxed); }
  void reset() { flag_.store(false, std::memory_order_relaxed); }
  bool cancelled() const { return flag_.load(std::memory_order_relaxed); }

private:
  std::atomic<bool> flag_{false};
};

inline bool is_cancelled(const CancellationToken *token) {
  return token != nullptr && token->cancelled();
}

} // namespace dfs_core
