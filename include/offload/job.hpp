/**
 * @file job.hpp
 * @brief Job<T> -- unit of work executed on a worker thread.
 *
 * A job declares one of four execution shapes (JobMode) and overrides the
 * matching virtual:
 *
 *   kSync           -> Execute(token)                      -> T
 *   kAsync          -> ExecuteAsync(token)                 -> std::future<T>
 *   kSyncStreaming  -> ExecuteStreaming(token, on_progress, on_complete)
 *   kAsyncStreaming -> ExecuteStreamingAsync(token, ...)   -> std::future<void>
 *
 * Async futures are awaited by the worker before it takes its next job, so
 * an async job occupies its worker exactly like a synchronous one.
 *
 * Cancellation is cooperative: a body that wants to be cancellable polls
 * CancelToken::IsCancellationRequested() or calls ThrowIfCancelled().
 *
 * Usage:
 * @code
 *   class Multiply final : public offload::Job<int> {
 *    public:
 *     int Execute(const offload::CancelToken&) override { return 21 * 2; }
 *   };
 * @endcode
 */

#ifndef OFFLOAD_JOB_HPP_
#define OFFLOAD_JOB_HPP_

#include "offload/vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace offload {

// ============================================================================
// Identity
// ============================================================================

using JobId = uint64_t;

static constexpr JobId kInvalidJobId = 0U;

namespace detail {

/// @brief Process-unique, monotonically increasing job id (never 0).
inline JobId NextJobId() noexcept {
  static std::atomic<JobId> counter{0U};
  return counter.fetch_add(1U, std::memory_order_relaxed) + 1U;
}

}  // namespace detail

// ============================================================================
// JobMode
// ============================================================================

enum class JobMode : uint8_t {
  kSync = 0,
  kAsync,
  kSyncStreaming,
  kAsyncStreaming,
};

inline bool IsStreamingMode(JobMode mode) noexcept {
  return mode == JobMode::kSyncStreaming || mode == JobMode::kAsyncStreaming;
}

inline bool IsAsyncMode(JobMode mode) noexcept {
  return mode == JobMode::kAsync || mode == JobMode::kAsyncStreaming;
}

inline const char* JobModeName(JobMode mode) noexcept {
  switch (mode) {
    case JobMode::kSync:
      return "sync";
    case JobMode::kAsync:
      return "async";
    case JobMode::kSyncStreaming:
      return "sync-streaming";
    case JobMode::kAsyncStreaming:
      return "async-streaming";
  }
  return "?";
}

// ============================================================================
// Cancellation
// ============================================================================

/// @brief Thrown by cooperative job bodies to report cancellation.
class OperationCancelled : public std::runtime_error {
 public:
  OperationCancelled() : std::runtime_error("job cancelled") {}
  explicit OperationCancelled(const std::string& what) : std::runtime_error(what) {}
};

using CancelFlag = std::shared_ptr<std::atomic<bool>>;

inline CancelFlag MakeCancelFlag() {
  return std::make_shared<std::atomic<bool>>(false);
}

/**
 * @brief Read-only view of the cancellation state of one running job.
 *
 * Reports cancellation when either the job itself was cancelled or the
 * worker running it is shutting down.
 */
class CancelToken final {
 public:
  CancelToken() = default;
  CancelToken(CancelFlag job_flag, CancelFlag worker_flag)
      : job_flag_(std::move(job_flag)), worker_flag_(std::move(worker_flag)) {}

  bool IsCancellationRequested() const noexcept {
    return (job_flag_ && job_flag_->load(std::memory_order_acquire)) ||
           (worker_flag_ && worker_flag_->load(std::memory_order_acquire));
  }

  void ThrowIfCancelled() const {
    if (IsCancellationRequested()) {
      throw OperationCancelled();
    }
  }

 private:
  CancelFlag job_flag_;
  CancelFlag worker_flag_;
};

// ============================================================================
// JobError
// ============================================================================

enum class JobErrorCode : uint8_t {
  kExecutionFailed = 0,  ///< Job body threw
  kCancelled,            ///< Cancelled while queued, mid-run, or at shutdown
  kRejected,             ///< Submission refused (see submit_error)
  kShutdownTimeout,      ///< Worker outlived the shutdown wait (logged only)
};

inline const char* JobErrorCodeName(JobErrorCode code) noexcept {
  switch (code) {
    case JobErrorCode::kExecutionFailed:
      return "ExecutionFailed";
    case JobErrorCode::kCancelled:
      return "Cancelled";
    case JobErrorCode::kRejected:
      return "Rejected";
    case JobErrorCode::kShutdownTimeout:
      return "ShutdownTimeout";
  }
  return "?";
}

/**
 * @brief Error value delivered to on_error on the drain thread.
 *
 * For kExecutionFailed, @c cause holds the exception thrown by the job and
 * can be rethrown with std::rethrow_exception to inspect its type.
 */
struct JobError {
  JobId id{kInvalidJobId};
  JobErrorCode code{JobErrorCode::kExecutionFailed};
  SubmitError submit_error{SubmitError::kQueueFull};  ///< Valid for kRejected
  std::exception_ptr cause;
  std::string message;

  static JobError Failed(JobId id, std::exception_ptr cause, std::string msg) {
    JobError e;
    e.id = id;
    e.code = JobErrorCode::kExecutionFailed;
    e.cause = std::move(cause);
    e.message = std::move(msg);
    return e;
  }

  static JobError Cancelled(JobId id, std::string msg = "job cancelled") {
    JobError e;
    e.id = id;
    e.code = JobErrorCode::kCancelled;
    e.message = std::move(msg);
    return e;
  }

  static JobError Rejected(JobId id, SubmitError reason) {
    JobError e;
    e.id = id;
    e.code = JobErrorCode::kRejected;
    e.submit_error = reason;
    e.message = SubmitErrorName(reason);
    return e;
  }
};

// ============================================================================
// Callback signatures
// ============================================================================

template <typename T>
using ResultFn = std::function<void(T)>;

template <typename T>
using ProgressFn = std::function<void(T)>;

using CompleteFn = std::function<void()>;
using ErrorFn = std::function<void(const JobError&)>;

// ============================================================================
// Job<T>
// ============================================================================

/**
 * @brief Abstract unit of work producing values of type T.
 *
 * Derived jobs override Mode() and the execution virtual for that mode.
 * The base implementations of the other shapes throw std::logic_error,
 * which the worker reports as kExecutionFailed.
 *
 * @tparam T Result type (one-shot) or progress value type (streaming).
 */
template <typename T>
class Job {
 public:
  using ValueType = T;

  virtual ~Job() = default;

  virtual JobMode Mode() const noexcept { return JobMode::kSync; }

  bool IsAsync() const noexcept { return IsAsyncMode(Mode()); }
  bool IsStreaming() const noexcept { return IsStreamingMode(Mode()); }

  virtual T Execute(const CancelToken& /*token*/) {
    throw std::logic_error("Execute not implemented for this job");
  }

  /// Default: run Execute() and hand back an already-satisfied future.
  virtual std::future<T> ExecuteAsync(const CancelToken& token) {
    std::promise<T> promise;
    try {
      promise.set_value(Execute(token));
    } catch (...) {
      promise.set_exception(std::current_exception());
    }
    return promise.get_future();
  }

  virtual void ExecuteStreaming(const CancelToken& /*token*/,
                                const ProgressFn<T>& /*on_progress*/,
                                const CompleteFn& /*on_complete*/) {
    throw std::logic_error("ExecuteStreaming not implemented for this job");
  }

  virtual std::future<void> ExecuteStreamingAsync(const CancelToken& /*token*/,
                                                  const ProgressFn<T>& /*on_progress*/,
                                                  const CompleteFn& /*on_complete*/) {
    throw std::logic_error("ExecuteStreamingAsync not implemented for this job");
  }
};

}  // namespace offload

#endif  // OFFLOAD_JOB_HPP_
