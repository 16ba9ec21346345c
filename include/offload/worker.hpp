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
 * @file offload/worker.hpp
 * @brief Worker - one dedicated thread draining one bounded job queue.
 *
 * Architecture:
 *   TryEnqueue() --> JobQueue (bounded, MPSC) --> WorkerThread
 *                                                    |
 *                         +--------------------------+-------------+
 *                         | callback actions                       | trace lines
 *                         v                                        v
 *                 action queue (mutex)                  SpscRingbuffer<LogEntry>
 *                         |                                        |
 *                         +------------ MainThreadUpdate() --------+
 *                                      (drain thread only)
 *
 * The worker executes one envelope at a time, in FIFO order. Job callbacks
 * are never run on the worker thread; they are queued as actions and run by
 * MainThreadUpdate() on the host's drain thread.
 *
 * Shutdown is cooperative. Dispose() raises the loop cancellation flag,
 * abandons queued envelopes and waits a bounded time for the thread. A job
 * body that ignores its CancelToken can outlive the wait: the thread is then
 * detached and keeps the worker state alive (shared ownership) until the
 * body returns. That thread and its state are orphaned, not reclaimed.
 */

#ifndef OFFLOAD_WORKER_HPP_
#define OFFLOAD_WORKER_HPP_

#include "offload/envelope.hpp"
#include "offload/job_queue.hpp"
#include "offload/log.hpp"
#include "offload/pool_config.hpp"
#include "offload/spsc_ringbuffer.hpp"
#include "offload/vocabulary.hpp"

#include <cstdarg>
#include <cstdint>
#include <cstdio>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>

#ifdef OFFLOAD_PLATFORM_LINUX
#include <pthread.h>
#endif

#ifndef OFFLOAD_WORKER_TRACE_DEPTH
#define OFFLOAD_WORKER_TRACE_DEPTH 256U
#endif

namespace offload {

// ============================================================================
// WorkerStats
// ============================================================================

struct WorkerStats {
  uint64_t completed{0U};      ///< Envelopes that finished successfully
  uint64_t failed{0U};         ///< Envelopes whose body threw
  uint64_t cancelled{0U};      ///< Removed while queued, abandoned, or cancelled mid-run
  uint64_t rejected{0U};       ///< TryEnqueue refusals
  uint64_t trace_dropped{0U};  ///< Trace lines lost to a full trace queue
};

// ============================================================================
// Worker
// ============================================================================

class Worker final {
 public:
  Worker(uint32_t index, const char* pool_name,
         uint32_t queue_capacity = kDefaultQueueCapacity)
      : state_(std::make_shared<State>(index, pool_name, queue_capacity)) {}

  ~Worker() { Dispose(std::chrono::milliseconds(kDefaultShutdownTimeoutMs)); }

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;
  Worker(Worker&&) = delete;
  Worker& operator=(Worker&&) = delete;

  // ======================== Lifecycle ========================

  /**
   * @brief Spawn the processing thread.
   * @return false if the worker was already started (workers do not restart).
   */
  bool Start() {
    if (started_) {
      return false;
    }
    started_ = true;
    state_->running.store(true, std::memory_order_release);
    thread_ = std::thread(&Worker::Loop, state_);
    return true;
  }

  /**
   * @brief Stop accepting envelopes. Already queued envelopes still run,
   *        then the loop exits.
   */
  void Stop() { state_->queue.CompleteAdding(); }

  /**
   * @brief Raise the loop cancellation flag and abandon queued envelopes.
   *
   * The running envelope (if any) sees cancellation through its CancelToken.
   * Abandoned envelopes report on_error(kCancelled) when submitted with
   * notify_cancel. Safe to call from any thread, more than once.
   */
  void Cancel() {
    State& st = *state_;
    st.loop_cancel->store(true, std::memory_order_release);
    st.queue.CompleteAdding();

    auto abandoned = st.queue.RemoveAll();
    for (auto& env : abandoned) {
      try {
        AbandonQueued(st, *env, "abandoned at shutdown");
      } catch (const std::exception& e) {
        OFFLOAD_LOG_ERROR("Worker", "[%s] job %llu: posting cancellation failed: %s",
                          st.name.c_str(), static_cast<unsigned long long>(env->Id()),
                          e.what());
      }
    }
    if (!abandoned.empty()) {
      OFFLOAD_LOG_WARN("Worker", "[%s] abandoned %u queued job(s)", st.name.c_str(),
                       static_cast<uint32_t>(abandoned.size()));
    }
  }

  /**
   * @brief Wait up to @p timeout for the loop to exit.
   * @return true if the thread exited and was joined; false if it is still
   *         running, in which case it has been detached.
   */
  bool Join(std::chrono::milliseconds timeout) {
    if (!thread_.joinable()) {
      return true;
    }
    State& st = *state_;
    bool exited = false;
    {
      std::unique_lock<std::mutex> lk(st.exit_mtx);
      exited = st.exit_cv.wait_for(lk, timeout, [&st] { return st.exited; });
    }
    if (exited) {
      thread_.join();
      return true;
    }
    OFFLOAD_LOG_WARN("Worker",
                     "[%s] loop did not exit within %lld ms; detaching thread "
                     "(the running job keeps its resources until it returns)",
                     st.name.c_str(), static_cast<long long>(timeout.count()));
    thread_.detach();
    return false;
  }

  /**
   * @brief Cancel(), then Join() with a bounded wait.
   * @return Whether the thread exited within @p timeout.
   */
  bool Dispose(std::chrono::milliseconds timeout) {
    Cancel();
    return Join(timeout);
  }

  // ======================== Producer side ========================

  /**
   * @brief Non-blocking enqueue.
   *
   * On success ownership of @p env moves into the queue. On failure (queue
   * at capacity, or worker stopping/not running) @p env stays with the
   * caller so it can try another worker.
   */
  bool TryEnqueue(std::unique_ptr<JobEnvelope>& env) {
    State& st = *state_;
    if (!env) {
      return false;
    }
    if (!st.running.load(std::memory_order_acquire) || st.queue.IsAddingCompleted()) {
      st.rejected.fetch_add(1U, std::memory_order_relaxed);
      return false;
    }
    const JobId id = env->Id();
    env->Ticket()->SetWorkerIndex(st.index);
    if (!st.queue.TryPush(env)) {
      st.rejected.fetch_add(1U, std::memory_order_relaxed);
      OFFLOAD_LOG_WARN("Worker", "[%s] job queue full (%u); rejecting job %llu",
                       st.name.c_str(), st.queue.Capacity(),
                       static_cast<unsigned long long>(id));
      return false;
    }
    return true;
  }

  /**
   * @brief Remove a still-queued envelope without running it.
   * @return true if the envelope was found in the queue.
   */
  bool CancelJob(JobId id) {
    State& st = *state_;
    auto env = st.queue.Remove(id);
    if (!env) {
      return false;
    }
    AbandonQueued(st, *env, "cancelled while queued");
    OFFLOAD_LOG_DEBUG("Worker", "[%s] job %llu removed from queue", st.name.c_str(),
                      static_cast<unsigned long long>(id));
    return true;
  }

  // ======================== Drain side ========================

  /**
   * @brief Run queued callback actions and flush trace lines.
   *
   * Must only be called from the drain thread. A callback that throws is
   * logged and draining continues.
   *
   * @param max_actions Upper bound on actions run by this call (0 = all).
   * @return Number of actions run.
   */
  uint32_t MainThreadUpdate(uint32_t max_actions = 0U) {
    State& st = *state_;
    uint32_t invoked = 0U;
    while (max_actions == 0U || invoked < max_actions) {
      Action action;
      {
        std::lock_guard<std::mutex> lk(st.action_mtx);
        if (st.actions.empty()) {
          break;
        }
        action = std::move(st.actions.front());
        st.actions.pop_front();
        st.pending_actions.store(static_cast<uint32_t>(st.actions.size()),
                                 std::memory_order_release);
      }
      ++invoked;
      try {
        action();
      } catch (const std::exception& e) {
        OFFLOAD_LOG_ERROR("Worker", "[%s] callback action threw: %s", st.name.c_str(),
                          e.what());
      } catch (...) {
        OFFLOAD_LOG_ERROR("Worker", "[%s] callback action threw a non-standard exception",
                          st.name.c_str());
      }
    }

    static constexpr size_t kTraceBatch = 16U;
    log::LogEntry batch[kTraceBatch];
    size_t n = 0;
    while ((n = st.trace.PopBatch(batch, kTraceBatch)) > 0U) {
      for (size_t i = 0; i < n; ++i) {
        log::WriteEntry(batch[i]);
      }
    }
    return invoked;
  }

  // ======================== Query ========================

  bool IsBusy() const noexcept { return state_->busy.load(std::memory_order_acquire); }
  bool IsRunning() const noexcept { return state_->running.load(std::memory_order_acquire); }
  uint32_t PendingJobCount() const noexcept { return state_->queue.Size(); }
  uint32_t QueueCapacity() const noexcept { return state_->queue.Capacity(); }
  uint32_t PendingActionCount() const noexcept {
    return state_->pending_actions.load(std::memory_order_acquire);
  }
  uint32_t Index() const noexcept { return state_->index; }
  const char* Name() const noexcept { return state_->name.c_str(); }

  WorkerStats GetStats() const noexcept {
    const State& st = *state_;
    WorkerStats s;
    s.completed = st.completed.load(std::memory_order_relaxed);
    s.failed = st.failed.load(std::memory_order_relaxed);
    s.cancelled = st.cancelled.load(std::memory_order_relaxed);
    s.rejected = st.rejected.load(std::memory_order_relaxed);
    s.trace_dropped = st.trace_dropped.load(std::memory_order_relaxed);
    return s;
  }

 private:
  // ======================== Shared state ========================

  /// Owned jointly by the Worker and its thread.
  struct State final : public ActionSink {
    State(uint32_t idx, const char* pool_name, uint32_t capacity)
        : index(idx), queue(capacity) {
      char buf[48];
      (void)std::snprintf(buf, sizeof(buf), "%s-%u",
                          (pool_name != nullptr) ? pool_name : "pool", idx);
      name = buf;
    }

    void PostAction(Action action) override {
      if (!action) {
        return;
      }
      std::lock_guard<std::mutex> lk(action_mtx);
      actions.push_back(std::move(action));
      pending_actions.store(static_cast<uint32_t>(actions.size()), std::memory_order_release);
    }

    /// Worker thread only (single producer of the trace queue).
    void Trace(log::Level level, int line, const char* fmt, ...) noexcept {
      if (static_cast<uint8_t>(level) < static_cast<uint8_t>(log::GetLevel())) {
        return;
      }
      log::LogEntry entry;
      va_list args;
      va_start(args, fmt);
      log::FormatEntryVa(entry, level, "Worker", __FILE__, line, fmt, args);
      va_end(args);
      if (!trace.Push(entry)) {
        trace_dropped.fetch_add(1U, std::memory_order_relaxed);
      }
    }

    const uint32_t index;
    FixedString<47> name;
    JobQueue queue;

    std::mutex action_mtx;
    std::deque<Action> actions;
    std::atomic<uint32_t> pending_actions{0U};

    SpscRingbuffer<log::LogEntry, OFFLOAD_WORKER_TRACE_DEPTH> trace;

    std::atomic<bool> running{false};
    std::atomic<bool> busy{false};
    CancelFlag loop_cancel{MakeCancelFlag()};

    std::mutex exit_mtx;
    std::condition_variable exit_cv;
    bool exited{false};

    alignas(kCacheLineSize) std::atomic<uint64_t> completed{0U};
    std::atomic<uint64_t> failed{0U};
    std::atomic<uint64_t> cancelled{0U};
    std::atomic<uint64_t> rejected{0U};
    std::atomic<uint64_t> trace_dropped{0U};
  };

  // ======================== Worker thread ========================

  static void Loop(std::shared_ptr<State> st) noexcept {
    SetThreadName(st->name.c_str());
    st->Trace(log::Level::kDebug, __LINE__, "[%s] processing loop started", st->name.c_str());

    JobQueue::Item env;
    while (st->queue.Take(env, *st->loop_cancel)) {
      RunEnvelope(*st, *env);
      env.reset();
    }

    st->Trace(log::Level::kInfo, __LINE__, "[%s] processing loop has exited", st->name.c_str());
    st->running.store(false, std::memory_order_release);
    {
      std::lock_guard<std::mutex> lk(st->exit_mtx);
      st->exited = true;
    }
    st->exit_cv.notify_all();
  }

  static void RunEnvelope(State& st, JobEnvelope& env) noexcept {
    const std::shared_ptr<JobTicket>& ticket = env.Ticket();
    const unsigned long long id = static_cast<unsigned long long>(env.Id());
    if (!ticket->Transition(TicketState::kQueued, TicketState::kRunning)) {
      // Cancelled after it left the queue but before it started.
      AbandonQueued(st, env, "cancelled while queued");
      st.Trace(log::Level::kDebug, __LINE__, "[%s] job %llu skipped (cancelled)",
               st.name.c_str(), id);
      return;
    }

    st.busy.store(true, std::memory_order_release);
    const CancelToken token(ticket->Flag(), st.loop_cancel);
    const uint64_t t0 = SteadyNowUs();
    const uint64_t queued_us = t0 - env.CreatedAtUs();
    try {
      env.Execute(token, st);
      ticket->SetState(TicketState::kDone);
      st.completed.fetch_add(1U, std::memory_order_relaxed);
      st.Trace(log::Level::kDebug, __LINE__,
               "[%s] job %llu (%s) completed in %llu us after %llu us queued",
               st.name.c_str(), id, JobModeName(env.Mode()),
               static_cast<unsigned long long>(SteadyNowUs() - t0),
               static_cast<unsigned long long>(queued_us));
    } catch (const OperationCancelled& e) {
      ticket->SetState(TicketState::kCancelled);
      st.cancelled.fetch_add(1U, std::memory_order_relaxed);
      st.PostAction(env.MakeErrorAction(JobError::Cancelled(env.Id(), e.what())));
      st.Trace(log::Level::kWarn, __LINE__, "[%s] job %llu cancelled", st.name.c_str(), id);
    } catch (const std::exception& e) {
      ticket->SetState(TicketState::kDone);
      st.failed.fetch_add(1U, std::memory_order_relaxed);
      st.PostAction(env.MakeErrorAction(
          JobError::Failed(env.Id(), std::current_exception(), e.what())));
      st.Trace(log::Level::kWarn, __LINE__, "[%s] job %llu encountered an error: %s",
               st.name.c_str(), id, e.what());
    } catch (...) {
      ticket->SetState(TicketState::kDone);
      st.failed.fetch_add(1U, std::memory_order_relaxed);
      st.PostAction(env.MakeErrorAction(
          JobError::Failed(env.Id(), std::current_exception(), "non-standard exception")));
      st.Trace(log::Level::kWarn, __LINE__, "[%s] job %llu threw a non-standard exception",
               st.name.c_str(), id);
    }
    st.busy.store(false, std::memory_order_release);
  }

  /// Any thread. Envelope has already been removed from the queue.
  static void AbandonQueued(State& st, JobEnvelope& env, const char* reason) {
    (void)env.Ticket()->Transition(TicketState::kQueued, TicketState::kCancelled);
    env.Ticket()->RequestCancel();
    st.cancelled.fetch_add(1U, std::memory_order_relaxed);
    if (env.NotifyOnCancel()) {
      st.PostAction(env.MakeErrorAction(JobError::Cancelled(env.Id(), reason)));
    }
  }

  static void SetThreadName(const char* name) noexcept {
#ifdef OFFLOAD_PLATFORM_LINUX
    char buf[16];
    (void)std::snprintf(buf, sizeof(buf), "%s", name);
    (void)pthread_setname_np(pthread_self(), buf);
#else
    (void)name;
#endif
  }

  // ======================== Data members ========================

  std::shared_ptr<State> state_;
  std::thread thread_;
  bool started_{false};
};

}  // namespace offload

#endif  // OFFLOAD_WORKER_HPP_
