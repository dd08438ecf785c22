#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include <rocksdb/status.h>

#include <verity/internal.hpp>

namespace trantor {
class EventLoopThreadPool;
}  // namespace trantor

namespace verity {

/**
 * Cancellation and deadline for bulk operations.
 *
 * Bulk calls poll Check() between units of work. A set cancel flag yields
 * Aborted, an expired deadline TimedOut. Default-constructed: no limits.
 */
struct RunControl {
  const std::atomic<bool>* cancelled = nullptr;
  uint64_t deadline_us = 0;  // internal::NowMicros() based; 0 = none

  static RunControl WithTimeout(std::chrono::milliseconds timeout,
                                const std::atomic<bool>* cancel_flag = nullptr) {
    RunControl rc;
    rc.cancelled = cancel_flag;
    if (timeout.count() > 0) {
      rc.deadline_us = internal::NowMicros() + static_cast<uint64_t>(timeout.count()) * 1000;
    }
    return rc;
  }

  rocksdb::Status Check() const {
    if (cancelled && cancelled->load(std::memory_order_relaxed)) {
      return rocksdb::Status::Aborted("operation cancelled");
    }
    if (deadline_us != 0 && internal::NowMicros() >= deadline_us) {
      return rocksdb::Status::TimedOut("operation deadline exceeded");
    }
    return rocksdb::Status::OK();
  }
};

namespace internal {

/**
 * Bounded worker pool for collaborator calls (embedders, image hashers).
 *
 * Call() runs `fn` on one of `threads` event-loop threads, choosing the one
 * with the fewest calls in flight, and waits at most `timeout` for the
 * result. A call that times out is abandoned: it keeps its thread until it
 * returns and the result is discarded, so `fn` must own everything it
 * touches. While `max_abandoned` abandoned calls are still running, new calls
 * are rejected without being queued.
 *
 * The destructor stops the threads and waits for calls still running.
 */
class CollaboratorPool {
 public:
  enum class Outcome { kFinished, kTimedOut, kRejected };

  CollaboratorPool(size_t threads, size_t max_abandoned);
  ~CollaboratorPool();

  CollaboratorPool(const CollaboratorPool&) = delete;
  CollaboratorPool& operator=(const CollaboratorPool&) = delete;

  /**
   * A zero timeout calls `fn` inline. Exceptions thrown by `fn` propagate to
   * the caller when the call finishes in time.
   */
  template <typename Result, typename Fn>
  Outcome Call(Fn fn, std::chrono::milliseconds timeout, Result* out) {
    if (timeout.count() <= 0) {
      *out = fn();
      return Outcome::kFinished;
    }
    auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
    std::future<Result> result = task->get_future();
    auto call = std::make_shared<CallState>();
    if (!Submit([task] { (*task)(); }, call)) return Outcome::kRejected;
    if (result.wait_for(timeout) != std::future_status::ready && Abandon(call)) {
      return Outcome::kTimedOut;
    }
    *out = result.get();
    return Outcome::kFinished;
  }

  /** Abandoned calls that have not returned yet. */
  size_t Abandoned() const;

  size_t Threads() const { return load_.size(); }

 private:
  struct CallState {
    bool done = false;
    bool abandoned = false;
  };

  bool Submit(std::function<void()> work, std::shared_ptr<CallState> call);
  void Finish(size_t loop, const std::shared_ptr<CallState>& call);
  // False when the call finished between the timeout and this check.
  bool Abandon(const std::shared_ptr<CallState>& call);

  mutable std::mutex mu_;
  const size_t max_abandoned_;
  size_t abandoned_ = 0;
  std::vector<size_t> load_;  // calls queued or running, per loop

  // Declared last: destroyed (and joined) before the state above.
  std::unique_ptr<trantor::EventLoopThreadPool> loops_;
};

}  // namespace internal
}  // namespace verity
