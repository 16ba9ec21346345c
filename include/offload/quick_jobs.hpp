/**
 * @file quick_jobs.hpp
 * @brief Adapters turning plain callables into jobs, plus one-call
 *        submission helpers.
 *
 * Usage:
 * @code
 *   offload::RunFunction<int>(pool, [] { return 6 * 7; },
 *                             [](int v) { printf("%d\n", v); });
 *
 *   offload::RunProgressLoop(pool, 100, [](uint32_t i) { Step(i); },
 *                            [](float p) { bar.Set(p); });
 * @endcode
 */

#ifndef OFFLOAD_QUICK_JOBS_HPP_
#define OFFLOAD_QUICK_JOBS_HPP_

#include "offload/job.hpp"
#include "offload/worker_pool.hpp"

#include <cstdint>

#include <functional>
#include <future>
#include <memory>
#include <utility>

namespace offload {

// ============================================================================
// Callable adapters
// ============================================================================

/// @brief Synchronous one-shot job wrapping `T()`.
template <typename T>
class FunctionJob final : public Job<T> {
 public:
  explicit FunctionJob(std::function<T()> fn) : fn_(std::move(fn)) {}

  T Execute(const CancelToken& /*token*/) override { return fn_(); }

 private:
  std::function<T()> fn_;
};

/// @brief Asynchronous one-shot job wrapping `std::future<T>()`.
template <typename T>
class AsyncFunctionJob final : public Job<T> {
 public:
  explicit AsyncFunctionJob(std::function<std::future<T>()> fn) : fn_(std::move(fn)) {}

  JobMode Mode() const noexcept override { return JobMode::kAsync; }

  std::future<T> ExecuteAsync(const CancelToken& /*token*/) override { return fn_(); }

 private:
  std::function<std::future<T>()> fn_;
};

/// @brief Fire-and-forget action; the result is always true.
class ActionJob final : public Job<bool> {
 public:
  explicit ActionJob(std::function<void()> fn) : fn_(std::move(fn)) {}

  bool Execute(const CancelToken& /*token*/) override {
    fn_();
    return true;
  }

 private:
  std::function<void()> fn_;
};

/// @brief Asynchronous action; resolves to true once the inner future does.
class AsyncActionJob final : public Job<bool> {
 public:
  explicit AsyncActionJob(std::function<std::future<void>()> fn) : fn_(std::move(fn)) {}

  JobMode Mode() const noexcept override { return JobMode::kAsync; }

  std::future<bool> ExecuteAsync(const CancelToken& /*token*/) override {
    auto inner = std::make_shared<std::future<void>>(fn_());
    return std::async(std::launch::deferred, [inner]() {
      inner->get();
      return true;
    });
  }

 private:
  std::function<std::future<void>()> fn_;
};

template <typename T>
using StreamBody = std::function<void(const ProgressFn<T>&, const CompleteFn&)>;

template <typename T>
using AsyncStreamBody = std::function<std::future<void>(const ProgressFn<T>&, const CompleteFn&)>;

/// @brief Synchronous streaming job wrapping a body that reports progress.
template <typename T>
class StreamingFunctionJob final : public Job<T> {
 public:
  explicit StreamingFunctionJob(StreamBody<T> body) : body_(std::move(body)) {}

  JobMode Mode() const noexcept override { return JobMode::kSyncStreaming; }

  void ExecuteStreaming(const CancelToken& /*token*/, const ProgressFn<T>& on_progress,
                        const CompleteFn& on_complete) override {
    body_(on_progress, on_complete);
  }

 private:
  StreamBody<T> body_;
};

/// @brief Asynchronous streaming job; the returned future marks the end.
template <typename T>
class AsyncStreamingFunctionJob final : public Job<T> {
 public:
  explicit AsyncStreamingFunctionJob(AsyncStreamBody<T> body) : body_(std::move(body)) {}

  JobMode Mode() const noexcept override { return JobMode::kAsyncStreaming; }

  std::future<void> ExecuteStreamingAsync(const CancelToken& /*token*/,
                                          const ProgressFn<T>& on_progress,
                                          const CompleteFn& on_complete) override {
    return body_(on_progress, on_complete);
  }

 private:
  AsyncStreamBody<T> body_;
};

/**
 * @brief Runs @c step(i) for i in [0, iterations) and reports the fraction
 *        done after each step. Checks for cancellation before every step.
 */
class ProgressLoopJob final : public Job<float> {
 public:
  ProgressLoopJob(uint32_t iterations, std::function<void(uint32_t)> step)
      : iterations_(iterations), step_(std::move(step)) {}

  JobMode Mode() const noexcept override { return JobMode::kSyncStreaming; }

  void ExecuteStreaming(const CancelToken& token, const ProgressFn<float>& on_progress,
                        const CompleteFn& on_complete) override {
    for (uint32_t i = 0U; i < iterations_; ++i) {
      token.ThrowIfCancelled();
      if (step_) {
        step_(i);
      }
      on_progress(static_cast<float>(i + 1U) / static_cast<float>(iterations_));
    }
    on_complete();
  }

 private:
  const uint32_t iterations_;
  std::function<void(uint32_t)> step_;
};

// ============================================================================
// Submission helpers
// ============================================================================

template <typename T>
inline expected<JobId, SubmitError> RunFunction(WorkerPool& pool, std::function<T()> fn,
                                                ResultFn<T> on_result,
                                                ErrorFn on_error = ErrorFn()) {
  return pool.Submit(std::make_shared<FunctionJob<T>>(std::move(fn)), std::move(on_result),
                     std::move(on_error));
}

template <typename T>
inline expected<JobId, SubmitError> RunFunctionAsync(WorkerPool& pool,
                                                     std::function<std::future<T>()> fn,
                                                     ResultFn<T> on_result,
                                                     ErrorFn on_error = ErrorFn()) {
  return pool.Submit(std::make_shared<AsyncFunctionJob<T>>(std::move(fn)), std::move(on_result),
                     std::move(on_error));
}

inline expected<JobId, SubmitError> RunAction(WorkerPool& pool, std::function<void()> fn,
                                              CompleteFn on_complete = CompleteFn(),
                                              ErrorFn on_error = ErrorFn()) {
  return pool.Submit(std::make_shared<ActionJob>(std::move(fn)),
                     [on_complete](bool /*done*/) {
                       if (on_complete) {
                         on_complete();
                       }
                     },
                     std::move(on_error));
}

inline expected<JobId, SubmitError> RunActionAsync(WorkerPool& pool,
                                                   std::function<std::future<void>()> fn,
                                                   CompleteFn on_complete = CompleteFn(),
                                                   ErrorFn on_error = ErrorFn()) {
  return pool.Submit(std::make_shared<AsyncActionJob>(std::move(fn)),
                     [on_complete](bool /*done*/) {
                       if (on_complete) {
                         on_complete();
                       }
                     },
                     std::move(on_error));
}

template <typename T>
inline expected<JobId, SubmitError> RunStreamingFunction(WorkerPool& pool, StreamBody<T> body,
                                                         ProgressFn<T> on_progress,
                                                         CompleteFn on_complete = CompleteFn(),
                                                         ErrorFn on_error = ErrorFn()) {
  return pool.SubmitStreaming(std::make_shared<StreamingFunctionJob<T>>(std::move(body)),
                              std::move(on_progress), std::move(on_complete),
                              std::move(on_error));
}

template <typename T>
inline expected<JobId, SubmitError> RunStreamingFunctionAsync(
    WorkerPool& pool, AsyncStreamBody<T> body, ProgressFn<T> on_progress,
    CompleteFn on_complete = CompleteFn(), ErrorFn on_error = ErrorFn()) {
  return pool.SubmitStreaming(std::make_shared<AsyncStreamingFunctionJob<T>>(std::move(body)),
                              std::move(on_progress), std::move(on_complete),
                              std::move(on_error));
}

/**
 * @brief Submit a ProgressLoopJob; @p on_complete receives 1.0 on success.
 */
inline expected<JobId, SubmitError> RunProgressLoop(WorkerPool& pool, uint32_t iterations,
                                                    std::function<void(uint32_t)> step,
                                                    ProgressFn<float> on_progress,
                                                    std::function<void(float)> on_complete =
                                                        std::function<void(float)>(),
                                                    ErrorFn on_error = ErrorFn()) {
  return pool.SubmitStreaming(std::make_shared<ProgressLoopJob>(iterations, std::move(step)),
                              std::move(on_progress),
                              [on_complete]() {
                                if (on_complete) {
                                  on_complete(1.0F);
                                }
                              },
                              std::move(on_error));
}

}  // namespace offload

#endif  // OFFLOAD_QUICK_JOBS_HPP_
