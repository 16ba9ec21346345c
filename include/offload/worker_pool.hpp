/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file offload/worker_pool.hpp
 * @brief WorkerPool - fixed set of Workers with load-balanced submission
 *        and a single-thread drain point for callbacks.
 *
 * Architecture:
 *   Submit() ---> SelectWorker() ---> Worker[i].TryEnqueue()
 *                 (first idle,          |
 *                  else shortest queue) v
 *                                   WorkerThread[i] -- executes job body
 *                                       |
 *                                       v  callback actions
 *   Drain() <-------------------- Worker[i].MainThreadUpdate()
 *   (bound drain thread only)
 *
 * Features:
 * - Typed one-shot and streaming submissions (no void* result casts)
 * - Batch submission onto the best worker with fallback re-selection
 * - Cancellation of queued and running jobs by id
 * - Bounded, idempotent shutdown (cancel, wait, detach on timeout)
 * - Optional process-wide default instance, never created implicitly
 *
 * Usage:
 * @code
 *   offload::WorkerPoolConfig cfg;
 *   cfg.name = "bg";
 *   cfg.worker_num = 2;
 *   offload::WorkerPool pool(cfg);
 *   pool.Initialize();  // binds the calling thread as drain thread
 *
 *   pool.Submit(std::make_shared<MyJob>(),
 *               [](int v) { printf("result %d\n", v); });
 *
 *   while (running) {
 *     pool.Drain();     // once per frame / tick
 *   }
 *   pool.Shutdown();
 * @endcode
 */

#ifndef OFFLOAD_WORKER_POOL_HPP_
#define OFFLOAD_WORKER_POOL_HPP_

#include "offload/envelope.hpp"
#include "offload/job.hpp"
#include "offload/log.hpp"
#include "offload/pool_config.hpp"
#include "offload/vocabulary.hpp"
#include "offload/worker.hpp"

#include <cstdint>
#include <cstdio>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace offload {

// ============================================================================
// PoolStats / BatchResult
// ============================================================================

struct PoolStats {
  uint32_t active_workers{0U};     ///< Workers currently executing a job body
  uint32_t running_workers{0U};    ///< Workers whose loop is alive
  uint32_t queued_jobs{0U};        ///< Envelopes waiting in worker queues
  uint32_t pending_callbacks{0U};  ///< Actions waiting for Drain()
  uint32_t pool_size{0U};
  uint64_t submitted{0U};  ///< Accepted submissions
  uint64_t rejected{0U};   ///< Refused submissions
  uint64_t executed{0U};   ///< Job bodies that returned normally
  uint64_t failed{0U};
  uint64_t cancelled{0U};
};

struct BatchResult {
  std::vector<JobId> ids;  ///< Accepted ids, in submission order
  uint32_t rejected{0U};

  bool AllEnqueued() const noexcept { return rejected == 0U; }
};

// ============================================================================
// WorkerPool
// ============================================================================

class WorkerPool final {
 public:
  explicit WorkerPool(const WorkerPoolConfig& cfg = WorkerPoolConfig())
      : cfg_(cfg) {
    if (cfg_.worker_num == 0U) {
      cfg_.worker_num = 1U;
    }
    if (cfg_.queue_capacity == 0U) {
      cfg_.queue_capacity = 1U;
    }
    workers_.reserve(cfg_.worker_num);
    for (uint32_t i = 0U; i < cfg_.worker_num; ++i) {
      workers_.push_back(std::make_unique<Worker>(i, cfg_.name.c_str(), cfg_.queue_capacity));
    }
  }

  ~WorkerPool() { Shutdown(); }

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

  // ======================== Lifecycle ========================

  /**
   * @brief Start all workers and bind the calling thread as drain thread.
   * @return false if already initialized or shut down.
   */
  bool Initialize() {
    if (shutting_down_.load(std::memory_order_acquire)) {
      return false;
    }
    bool expected_init = false;
    if (!initialized_.compare_exchange_strong(expected_init, true, std::memory_order_acq_rel)) {
      return false;
    }
    BindDrainThread();
    for (auto& w : workers_) {
      (void)w->Start();
    }
    OFFLOAD_LOG_INFO("WorkerPool", "[%s] started %u worker(s), queue capacity %u",
                     cfg_.name.c_str(), cfg_.worker_num, cfg_.queue_capacity);
    return true;
  }

  /// @brief Re-bind Drain() to the calling thread.
  void BindDrainThread() {
    std::lock_guard<std::mutex> lk(drain_mtx_);
    drain_thread_ = std::this_thread::get_id();
  }

  /**
   * @brief Cancel outstanding work and wait (bounded) for every worker.
   *
   * Idempotent. Queued jobs are abandoned (on_error(kCancelled) only for
   * notify_cancel submissions, delivered by later Drain() calls); running
   * jobs observe cancellation through their token. Workers still busy at
   * the deadline are detached and logged. A worker whose cancel or join
   * throws is logged and counted as not exited; the rest still shut down.
   *
   * @return true if every worker thread exited in time.
   */
  bool Shutdown(std::chrono::milliseconds timeout) {
    bool expected_down = false;
    if (!shutting_down_.compare_exchange_strong(expected_down, true, std::memory_order_acq_rel)) {
      return true;
    }

    std::vector<bool> failed(workers_.size(), false);
    for (size_t i = 0; i < workers_.size(); ++i) {
      try {
        workers_[i]->Cancel();
      } catch (const std::exception& e) {
        failed[i] = true;
        OFFLOAD_LOG_ERROR("WorkerPool", "[%s] cancelling %s failed: %s", cfg_.name.c_str(),
                          workers_[i]->Name(), e.what());
      } catch (...) {
        failed[i] = true;
        OFFLOAD_LOG_ERROR("WorkerPool", "[%s] cancelling %s failed: non-standard exception",
                          cfg_.name.c_str(), workers_[i]->Name());
      }
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    uint32_t abandoned = 0U;
    for (size_t i = 0; i < workers_.size(); ++i) {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      if (left.count() < 0) {
        left = std::chrono::milliseconds(0);
      }
      try {
        if (!workers_[i]->Join(left)) {
          failed[i] = true;
        }
      } catch (const std::exception& e) {
        failed[i] = true;
        OFFLOAD_LOG_ERROR("WorkerPool", "[%s] joining %s failed: %s", cfg_.name.c_str(),
                          workers_[i]->Name(), e.what());
      } catch (...) {
        failed[i] = true;
        OFFLOAD_LOG_ERROR("WorkerPool", "[%s] joining %s failed: non-standard exception",
                          cfg_.name.c_str(), workers_[i]->Name());
      }
      if (failed[i]) {
        ++abandoned;
      }
    }

    if (abandoned > 0U) {
      OFFLOAD_LOG_WARN("WorkerPool",
                       "[%s] %s: %u worker(s) still running after %lld ms",
                       cfg_.name.c_str(), JobErrorCodeName(JobErrorCode::kShutdownTimeout),
                       abandoned, static_cast<long long>(timeout.count()));
    } else {
      OFFLOAD_LOG_INFO("WorkerPool", "[%s] shut down", cfg_.name.c_str());
    }
    return abandoned == 0U;
  }

  bool Shutdown() { return Shutdown(std::chrono::milliseconds(cfg_.shutdown_timeout_ms)); }

  // ======================== Submit API ========================

  /**
   * @brief Submit a one-shot job (kSync / kAsync).
   *
   * on_result and options.on_complete run on the drain thread. Every
   * rejection is also reported to @p on_error synchronously, before this
   * call returns.
   */
  template <typename JobT>
  expected<JobId, SubmitError> Submit(std::shared_ptr<JobT> job,
                                      ResultFn<typename JobT::ValueType> on_result,
                                      ErrorFn on_error = ErrorFn(),
                                      SubmitOptions options = SubmitOptions()) {
    using T = typename JobT::ValueType;
    static_assert(std::is_base_of<Job<T>, JobT>::value, "JobT must derive from offload::Job<T>");

    const SubmitError* early = CheckSubmit(job.get());
    if (early != nullptr) {
      return RejectEarly(*early, on_error);
    }
    if (job->IsStreaming()) {
      return RejectEarly(SubmitError::kInvalidMode, on_error);
    }
    std::unique_ptr<JobEnvelope> env = std::make_unique<OneShotEnvelope<T>>(
        std::shared_ptr<Job<T>>(std::move(job)), std::move(on_result), std::move(on_error),
        std::move(options));
    return Place(env);
  }

  /**
   * @brief Submit a streaming job (kSyncStreaming / kAsyncStreaming).
   *
   * Progress values are delivered in emission order, followed by exactly
   * one on_complete on success, or one on_error.
   */
  template <typename JobT>
  expected<JobId, SubmitError> SubmitStreaming(std::shared_ptr<JobT> job,
                                               ProgressFn<typename JobT::ValueType> on_progress,
                                               CompleteFn on_complete,
                                               ErrorFn on_error = ErrorFn(),
                                               SubmitOptions options = SubmitOptions()) {
    using T = typename JobT::ValueType;
    static_assert(std::is_base_of<Job<T>, JobT>::value, "JobT must derive from offload::Job<T>");

    const SubmitError* early = CheckSubmit(job.get());
    if (early != nullptr) {
      return RejectEarly(*early, on_error);
    }
    if (!job->IsStreaming()) {
      return RejectEarly(SubmitError::kInvalidMode, on_error);
    }
    std::unique_ptr<JobEnvelope> env = std::make_unique<StreamingEnvelope<T>>(
        std::shared_ptr<Job<T>>(std::move(job)), std::move(on_progress), std::move(on_complete),
        std::move(on_error), std::move(options));
    return Place(env);
  }

  /**
   * @brief Submit a batch of one-shot jobs sharing the same callbacks.
   *
   * Jobs go to the best worker at the time of the call; when it refuses a
   * job a new worker is selected. Jobs that cannot be placed anywhere are
   * reported through @p on_error and counted in BatchResult::rejected.
   */
  template <typename JobT>
  BatchResult SubmitBatch(const std::vector<std::shared_ptr<JobT>>& jobs,
                          ResultFn<typename JobT::ValueType> on_result,
                          ErrorFn on_error = ErrorFn()) {
    using T = typename JobT::ValueType;
    BatchResult result;
    result.ids.reserve(jobs.size());

    int32_t target = SelectWorker();
    for (const auto& job : jobs) {
      const SubmitError* early = CheckSubmit(job.get());
      if (early == nullptr && job->IsStreaming()) {
        static const SubmitError kMode = SubmitError::kInvalidMode;
        early = &kMode;
      }
      if (early != nullptr) {
        (void)RejectEarly(*early, on_error);
        ++result.rejected;
        continue;
      }

      std::unique_ptr<JobEnvelope> env = std::make_unique<OneShotEnvelope<T>>(
          std::shared_ptr<Job<T>>(job), on_result, on_error, SubmitOptions());
      const JobId id = env->Id();
      std::shared_ptr<JobTicket> ticket = env->Ticket();

      bool placed = (target >= 0) && workers_[static_cast<uint32_t>(target)]->TryEnqueue(env);
      if (!placed) {
        target = SelectWorker();
        placed = (target >= 0) && workers_[static_cast<uint32_t>(target)]->TryEnqueue(env);
      }
      if (!placed) {
        const SubmitError reason =
            (target < 0) ? SubmitError::kNoWorkersAvailable : SubmitError::kQueueFull;
        env->InvokeErrorNow(JobError::Rejected(id, reason));
        rejected_.fetch_add(1U, std::memory_order_relaxed);
        ++result.rejected;
        continue;
      }
      Track(id, std::move(ticket));
      result.ids.push_back(id);
    }

    if (result.rejected > 0U) {
      OFFLOAD_LOG_WARN("WorkerPool", "[%s] batch: %u of %u job(s) rejected", cfg_.name.c_str(),
                       result.rejected, static_cast<uint32_t>(jobs.size()));
    }
    return result;
  }

  // ======================== Cancellation ========================

  /**
   * @brief Cancel a job by id.
   *
   * A queued job is removed without running. A running job has its
   * cancellation token raised; it stops only if its body cooperates.
   *
   * @return true if the job was found in a non-terminal state.
   */
  bool Cancel(JobId id) {
    std::shared_ptr<JobTicket> ticket = FindTicket(id);
    if (!ticket) {
      return false;
    }
    switch (ticket->State()) {
      case TicketState::kQueued: {
        if (ticket->Transition(TicketState::kQueued, TicketState::kCancelled)) {
          ticket->RequestCancel();
          const uint32_t idx = ticket->WorkerIndex();
          // A miss means the worker already took the envelope; it skips it.
          if (idx < workers_.size()) {
            (void)workers_[idx]->CancelJob(id);
          }
          Untrack(id);
          return true;
        }
        // Started between the state read and the transition.
        ticket->RequestCancel();
        return !ticket->IsTerminal();
      }
      case TicketState::kRunning:
        ticket->RequestCancel();
        OFFLOAD_LOG_DEBUG("WorkerPool", "[%s] cancellation requested for running job %llu",
                          cfg_.name.c_str(), static_cast<unsigned long long>(id));
        return true;
      case TicketState::kDone:
      case TicketState::kCancelled:
        break;
    }
    Untrack(id);
    return false;
  }

  /// @brief true while the job is queued or running.
  bool IsJobActive(JobId id) const {
    std::shared_ptr<JobTicket> ticket = FindTicket(id);
    return ticket && !ticket->IsTerminal();
  }

  /// @brief Ids of all queued or running jobs (purges finished entries).
  std::vector<JobId> GetActiveJobIds() {
    std::vector<JobId> ids;
    std::lock_guard<std::mutex> lk(index_mtx_);
    for (auto it = index_.begin(); it != index_.end();) {
      if (it->second->IsTerminal()) {
        it = index_.erase(it);
      } else {
        ids.push_back(it->first);
        ++it;
      }
    }
    return ids;
  }

  // ======================== Drain ========================

  /**
   * @brief Run pending callbacks of every worker on the calling thread.
   *
   * Only effective on the bound drain thread; anywhere else it does
   * nothing and returns 0.
   *
   * @param max_per_worker Callbacks run per worker by this call (0 = all).
   * @return Number of callbacks run.
   */
  uint32_t Drain(uint32_t max_per_worker) {
    if (!IsDrainThread()) {
      bool warned = false;
      if (off_thread_warned_.compare_exchange_strong(warned, true, std::memory_order_relaxed)) {
        OFFLOAD_LOG_WARN("WorkerPool", "[%s] Drain() called off the drain thread; ignored",
                         cfg_.name.c_str());
      }
      return 0U;
    }
    uint32_t total = 0U;
    for (auto& w : workers_) {
      total += w->MainThreadUpdate(max_per_worker);
    }
    PurgeFinished();
    return total;
  }

  uint32_t Drain() { return Drain(cfg_.drain_cap); }

  // ======================== Query ========================

  PoolStats GetStats() const noexcept {
    PoolStats s;
    s.pool_size = static_cast<uint32_t>(workers_.size());
    for (const auto& w : workers_) {
      if (w->IsBusy()) {
        ++s.active_workers;
      }
      if (w->IsRunning()) {
        ++s.running_workers;
      }
      s.queued_jobs += w->PendingJobCount();
      s.pending_callbacks += w->PendingActionCount();
      const WorkerStats ws = w->GetStats();
      s.executed += ws.completed;
      s.failed += ws.failed;
      s.cancelled += ws.cancelled;
    }
    s.submitted = submitted_.load(std::memory_order_relaxed);
    s.rejected = rejected_.load(std::memory_order_relaxed);
    return s;
  }

  /**
   * @brief One-line summary, e.g.
   *        "Threads: 1/4, Queued: 3, Pending: 2, Running: 4".
   * @return snprintf result.
   */
  int FormatStats(char* buf, size_t size) const noexcept {
    const PoolStats s = GetStats();
    return std::snprintf(buf, size, "Threads: %u/%u, Queued: %u, Pending: %u, Running: %u",
                         s.active_workers, s.pool_size, s.queued_jobs, s.pending_callbacks,
                         s.running_workers);
  }

  bool IsInitialized() const noexcept { return initialized_.load(std::memory_order_acquire); }
  bool IsShuttingDown() const noexcept { return shutting_down_.load(std::memory_order_acquire); }
  uint32_t Size() const noexcept { return static_cast<uint32_t>(workers_.size()); }
  const WorkerPoolConfig& GetConfig() const noexcept { return cfg_; }

  /// @brief Direct access for diagnostics and tests.
  Worker& WorkerAt(uint32_t index) { return *workers_[index]; }

 private:
  /// @return nullptr when the submission may proceed.
  const SubmitError* CheckSubmit(const void* job) const noexcept {
    static const SubmitError kNotInit = SubmitError::kNotInitialized;
    static const SubmitError kDown = SubmitError::kPoolShuttingDown;
    static const SubmitError kNull = SubmitError::kNullJob;
    if (shutting_down_.load(std::memory_order_acquire)) {
      return &kDown;
    }
    if (!initialized_.load(std::memory_order_acquire)) {
      return &kNotInit;
    }
    if (job == nullptr) {
      return &kNull;
    }
    return nullptr;
  }

  expected<JobId, SubmitError> RejectEarly(SubmitError reason, const ErrorFn& on_error) {
    rejected_.fetch_add(1U, std::memory_order_relaxed);
    OFFLOAD_LOG_DEBUG("WorkerPool", "[%s] submission rejected: %s", cfg_.name.c_str(),
                      SubmitErrorName(reason));
    if (on_error) {
      on_error(JobError::Rejected(kInvalidJobId, reason));
    }
    return expected<JobId, SubmitError>::error(reason);
  }

  /**
   * @brief First running idle worker, else the running worker with the
   *        shortest queue (first found on ties).
   * @return Worker index, or -1 if no worker is running.
   */
  int32_t SelectWorker() const noexcept {
    int32_t best = -1;
    uint32_t best_len = 0U;
    for (uint32_t i = 0U; i < workers_.size(); ++i) {
      const Worker& w = *workers_[i];
      if (!w.IsRunning()) {
        continue;
      }
      if (!w.IsBusy()) {
        return static_cast<int32_t>(i);
      }
      const uint32_t len = w.PendingJobCount();
      if (best < 0 || len < best_len) {
        best = static_cast<int32_t>(i);
        best_len = len;
      }
    }
    return best;
  }

  expected<JobId, SubmitError> Place(std::unique_ptr<JobEnvelope>& env) {
    const JobId id = env->Id();
    std::shared_ptr<JobTicket> ticket = env->Ticket();

    const int32_t target = SelectWorker();
    SubmitError reason = SubmitError::kNoWorkersAvailable;
    if (target >= 0) {
      if (workers_[static_cast<uint32_t>(target)]->TryEnqueue(env)) {
        Track(id, std::move(ticket));
        return expected<JobId, SubmitError>::success(id);
      }
      reason = SubmitError::kQueueFull;
    }

    rejected_.fetch_add(1U, std::memory_order_relaxed);
    OFFLOAD_LOG_DEBUG("WorkerPool", "[%s] job %llu rejected: %s", cfg_.name.c_str(),
                      static_cast<unsigned long long>(id), SubmitErrorName(reason));
    env->InvokeErrorNow(JobError::Rejected(id, reason));
    return expected<JobId, SubmitError>::error(reason);
  }

  void Track(JobId id, std::shared_ptr<JobTicket> ticket) {
    submitted_.fetch_add(1U, std::memory_order_relaxed);
    std::lock_guard<std::mutex> lk(index_mtx_);
    index_.emplace(id, std::move(ticket));
  }

  void Untrack(JobId id) {
    std::lock_guard<std::mutex> lk(index_mtx_);
    index_.erase(id);
  }

  std::shared_ptr<JobTicket> FindTicket(JobId id) const {
    std::lock_guard<std::mutex> lk(index_mtx_);
    auto it = index_.find(id);
    return (it != index_.end()) ? it->second : std::shared_ptr<JobTicket>();
  }

  void PurgeFinished() {
    std::lock_guard<std::mutex> lk(index_mtx_);
    for (auto it = index_.begin(); it != index_.end();) {
      if (it->second->IsTerminal()) {
        it = index_.erase(it);
      } else {
        ++it;
      }
    }
  }

  bool IsDrainThread() const {
    std::lock_guard<std::mutex> lk(drain_mtx_);
    return initialized_.load(std::memory_order_acquire) &&
           drain_thread_ == std::this_thread::get_id();
  }

  // ======================== Data members ========================

  WorkerPoolConfig cfg_;
  std::vector<std::unique_ptr<Worker>> workers_;

  std::atomic<bool> initialized_{false};
  std::atomic<bool> shutting_down_{false};
  std::atomic<bool> off_thread_warned_{false};

  mutable std::mutex drain_mtx_;
  std::thread::id drain_thread_;

  mutable std::mutex index_mtx_;
  std::unordered_map<JobId, std::shared_ptr<JobTicket>> index_;

  alignas(kCacheLineSize) std::atomic<uint64_t> submitted_{0U};
  std::atomic<uint64_t> rejected_{0U};
};

// ============================================================================
// Default instance
// ============================================================================

namespace detail {

struct DefaultPoolSlot {
  std::mutex mtx;
  std::unique_ptr<WorkerPool> pool;
};

/// Function-local static for C++14 compatibility (no inline variables).
inline DefaultPoolSlot& GetDefaultPoolSlot() {
  static DefaultPoolSlot slot;
  return slot;
}

}  // namespace detail

/**
 * @brief Create and initialize the process-wide default pool.
 *
 * The calling thread becomes its drain thread.
 *
 * @return false if a default pool already exists.
 */
inline bool InitDefaultPool(const WorkerPoolConfig& cfg = WorkerPoolConfig()) {
  detail::DefaultPoolSlot& slot = detail::GetDefaultPoolSlot();
  std::lock_guard<std::mutex> lk(slot.mtx);
  if (slot.pool) {
    return false;
  }
  slot.pool = std::make_unique<WorkerPool>(cfg);
  return slot.pool->Initialize();
}

/// @return The default pool, or nullptr if InitDefaultPool() was not called.
inline WorkerPool* DefaultPool() {
  detail::DefaultPoolSlot& slot = detail::GetDefaultPoolSlot();
  std::lock_guard<std::mutex> lk(slot.mtx);
  return slot.pool.get();
}

/// @brief Shut down and destroy the default pool. No-op if none exists.
inline void ShutdownDefaultPool() {
  std::unique_ptr<WorkerPool> pool;
  {
    detail::DefaultPoolSlot& slot = detail::GetDefaultPoolSlot();
    std::lock_guard<std::mutex> lk(slot.mtx);
    pool = std::move(slot.pool);
  }
  if (pool) {
    (void)pool->Shutdown();
  }
}

}  // namespace offload

#endif  // OFFLOAD_WORKER_POOL_HPP_
