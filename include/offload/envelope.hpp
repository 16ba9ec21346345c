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
 * @file offload/envelope.hpp
 * @brief JobEnvelope - a submitted job plus its identity and callbacks.
 *
 * Type erasure happens here: the worker queue holds
 * std::unique_ptr<JobEnvelope>, while the callbacks stay strongly typed in
 * OneShotEnvelope<T> / StreamingEnvelope<T>. Callback shape follows the
 * envelope type, so a streaming job can never reach on_result and a
 * one-shot job can never reach on_progress.
 *
 * Envelopes never invoke user callbacks directly. Every outcome is turned
 * into an Action and handed to an ActionSink (the worker's outbound queue);
 * the drain thread runs it later.
 */

#ifndef OFFLOAD_ENVELOPE_HPP_
#define OFFLOAD_ENVELOPE_HPP_

#include "offload/job.hpp"
#include "offload/log.hpp"
#include "offload/platform.hpp"

#include <cstdint>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>

namespace offload {

/// @brief Deferred callback invocation, executed on the drain thread.
using Action = std::function<void()>;

// ============================================================================
// SubmitOptions
// ============================================================================

struct SubmitOptions {
  /// Deliver on_error(kCancelled) when the job is cancelled before it runs
  /// or abandoned at shutdown. Silent otherwise.
  bool notify_cancel{false};
  /// One-shot only: fired right after on_result, in the same action.
  CompleteFn on_complete;
};

// ============================================================================
// JobTicket
// ============================================================================

enum class TicketState : uint8_t {
  kQueued = 0,
  kRunning,
  kDone,
  kCancelled,
};

/**
 * @brief Lifecycle record shared by the pool's cancellation index and the
 *        envelope. The owning worker is the only writer after placement,
 *        except for the kQueued -> kCancelled transition.
 */
class JobTicket final {
 public:
  explicit JobTicket(JobId id) noexcept : id_(id), cancel_flag_(MakeCancelFlag()) {}

  JobTicket(const JobTicket&) = delete;
  JobTicket& operator=(const JobTicket&) = delete;

  JobId Id() const noexcept { return id_; }

  uint32_t WorkerIndex() const noexcept {
    return worker_index_.load(std::memory_order_acquire);
  }
  void SetWorkerIndex(uint32_t idx) noexcept {
    worker_index_.store(idx, std::memory_order_release);
  }

  TicketState State() const noexcept { return state_.load(std::memory_order_acquire); }
  void SetState(TicketState s) noexcept { state_.store(s, std::memory_order_release); }

  /// @brief Atomic state transition; false if the current state is not @p from.
  bool Transition(TicketState from, TicketState to) noexcept {
    return state_.compare_exchange_strong(from, to, std::memory_order_acq_rel,
                                          std::memory_order_acquire);
  }

  bool IsTerminal() const noexcept {
    const TicketState s = State();
    return s == TicketState::kDone || s == TicketState::kCancelled;
  }

  /// @brief Raise the cooperative cancellation flag seen by the job body.
  void RequestCancel() noexcept { cancel_flag_->store(true, std::memory_order_release); }

  const CancelFlag& Flag() const noexcept { return cancel_flag_; }

 private:
  const JobId id_;
  std::atomic<uint32_t> worker_index_{0U};
  std::atomic<TicketState> state_{TicketState::kQueued};
  CancelFlag cancel_flag_;
};

// ============================================================================
// ActionSink
// ============================================================================

/**
 * @brief Receiver of deferred callback actions (the worker's outbound
 *        queue). Must accept posts from any thread: async streaming bodies
 *        may report progress from threads of their own.
 */
class ActionSink {
 public:
  virtual ~ActionSink() = default;
  virtual void PostAction(Action action) = 0;
};

// ============================================================================
// JobEnvelope
// ============================================================================

class JobEnvelope {
 public:
  JobEnvelope(JobMode mode, SubmitOptions options)
      : id_(detail::NextJobId()),
        created_at_us_(SteadyNowUs()),
        mode_(mode),
        notify_cancel_(options.notify_cancel),
        ticket_(std::make_shared<JobTicket>(id_)) {}

  virtual ~JobEnvelope() = default;

  JobEnvelope(const JobEnvelope&) = delete;
  JobEnvelope& operator=(const JobEnvelope&) = delete;

  JobId Id() const noexcept { return id_; }
  JobMode Mode() const noexcept { return mode_; }
  uint64_t CreatedAtUs() const noexcept { return created_at_us_; }
  bool NotifyOnCancel() const noexcept { return notify_cancel_; }
  const std::shared_ptr<JobTicket>& Ticket() const noexcept { return ticket_; }

  /**
   * @brief Run the job body and post its outcome actions to @p sink.
   *
   * Runs on the worker thread. Exceptions from the job body propagate to
   * the caller, which converts them with MakeErrorAction().
   */
  virtual void Execute(const CancelToken& token, ActionSink& sink) = 0;

  /// @return Action delivering @p err to on_error; empty if none registered.
  virtual Action MakeErrorAction(const JobError& err) const = 0;

  /// @brief Deliver @p err immediately on the calling thread.
  virtual void InvokeErrorNow(const JobError& err) const = 0;

 private:
  const JobId id_;
  const uint64_t created_at_us_;
  const JobMode mode_;
  const bool notify_cancel_;
  std::shared_ptr<JobTicket> ticket_;
};

// ============================================================================
// OneShotEnvelope<T>
// ============================================================================

template <typename T>
class OneShotEnvelope final : public JobEnvelope {
 public:
  OneShotEnvelope(std::shared_ptr<Job<T>> job, ResultFn<T> on_result,
                  ErrorFn on_error, SubmitOptions options)
      : JobEnvelope(job->Mode(), options),
        job_(std::move(job)),
        on_result_(std::move(on_result)),
        on_complete_(std::move(options.on_complete)),
        on_error_(std::move(on_error)) {}

  void Execute(const CancelToken& token, ActionSink& sink) override {
    auto value = std::make_shared<T>(Mode() == JobMode::kAsync
                                         ? job_->ExecuteAsync(token).get()
                                         : job_->Execute(token));
    ResultFn<T> on_result = on_result_;
    CompleteFn on_complete = on_complete_;
    sink.PostAction([on_result, on_complete, value]() {
      if (on_result) {
        on_result(std::move(*value));
      }
      if (on_complete) {
        on_complete();
      }
    });
  }

  Action MakeErrorAction(const JobError& err) const override {
    if (!on_error_) {
      return Action();
    }
    ErrorFn on_error = on_error_;
    return [on_error, err]() { on_error(err); };
  }

  void InvokeErrorNow(const JobError& err) const override {
    if (on_error_) {
      on_error_(err);
    }
  }

 private:
  std::shared_ptr<Job<T>> job_;
  ResultFn<T> on_result_;
  CompleteFn on_complete_;
  ErrorFn on_error_;
};

// ============================================================================
// StreamingEnvelope<T>
// ============================================================================

/**
 * @brief Envelope for streaming jobs.
 *
 * Guarantees, whatever the body does:
 *   - progress actions are posted in emission order;
 *   - exactly one complete action is posted on success, and it is the last
 *     action of the envelope (a body returning without completing is
 *     completed by the envelope; extra completes are ignored);
 *   - progress reported after completion is dropped with a warning.
 */
template <typename T>
class StreamingEnvelope final : public JobEnvelope {
 public:
  StreamingEnvelope(std::shared_ptr<Job<T>> job, ProgressFn<T> on_progress,
                    CompleteFn on_complete, ErrorFn on_error, SubmitOptions options)
      : JobEnvelope(job->Mode(), options),
        job_(std::move(job)),
        on_progress_(std::move(on_progress)),
        on_complete_(std::move(on_complete)),
        on_error_(std::move(on_error)) {}

  void Execute(const CancelToken& token, ActionSink& sink) override {
    auto stream = std::make_shared<StreamState>();
    stream->sink = &sink;
    stream->id = Id();

    ProgressFn<T> on_progress = on_progress_;
    ProgressFn<T> progress = [stream, on_progress](T value) {
      std::lock_guard<std::mutex> lk(stream->mtx);
      if (stream->completed) {
        OFFLOAD_LOG_WARN("Worker", "job %llu: progress after completion dropped",
                         static_cast<unsigned long long>(stream->id));
        return;
      }
      auto held = std::make_shared<T>(std::move(value));
      stream->sink->PostAction([on_progress, held]() {
        if (on_progress) {
          on_progress(std::move(*held));
        }
      });
    };

    CompleteFn on_complete = on_complete_;
    CompleteFn complete = [stream, on_complete]() {
      std::lock_guard<std::mutex> lk(stream->mtx);
      if (stream->completed) {
        return;
      }
      stream->completed = true;
      stream->sink->PostAction([on_complete]() {
        if (on_complete) {
          on_complete();
        }
      });
    };

    try {
      if (Mode() == JobMode::kAsyncStreaming) {
        std::future<void> done = job_->ExecuteStreamingAsync(token, progress, complete);
        if (done.valid()) {
          done.get();
        }
      } else {
        job_->ExecuteStreaming(token, progress, complete);
      }
    } catch (const std::exception& e) {
      if (!MarkDetached(*stream)) {
        throw;
      }
      OFFLOAD_LOG_WARN("Worker", "job %llu: exception after completion ignored: %s",
                       static_cast<unsigned long long>(Id()), e.what());
      return;
    } catch (...) {
      if (!MarkDetached(*stream)) {
        throw;
      }
      OFFLOAD_LOG_WARN("Worker", "job %llu: non-standard exception after completion ignored",
                       static_cast<unsigned long long>(Id()));
      return;
    }

    complete();
    MarkDetached(*stream);
  }

  Action MakeErrorAction(const JobError& err) const override {
    if (!on_error_) {
      return Action();
    }
    ErrorFn on_error = on_error_;
    return [on_error, err]() { on_error(err); };
  }

  void InvokeErrorNow(const JobError& err) const override {
    if (on_error_) {
      on_error_(err);
    }
  }

 private:
  struct StreamState {
    std::mutex mtx;
    bool completed{false};
    ActionSink* sink{nullptr};
    JobId id{kInvalidJobId};
  };

  /**
   * @brief Seal the stream once Execute() is about to return.
   *
   * Marks the stream completed so that callbacks kept alive by a runaway
   * body can no longer post. Returns whether completion had already been
   * posted before sealing.
   */
  static bool MarkDetached(StreamState& stream) {
    std::lock_guard<std::mutex> lk(stream.mtx);
    const bool was_completed = stream.completed;
    stream.completed = true;
    return was_completed;
  }

  std::shared_ptr<Job<T>> job_;
  ProgressFn<T> on_progress_;
  CompleteFn on_complete_;
  ErrorFn on_error_;
};

}  // namespace offload

#endif  // OFFLOAD_ENVELOPE_HPP_
