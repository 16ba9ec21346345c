/**
 * @file test_worker_pool.cpp
 * @brief Catch2 tests for offload::WorkerPool.
 */

#include "offload/worker_pool.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstring>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

// ============================================================================
// Test jobs
// ============================================================================

namespace {

class MultiplyJob final : public offload::Job<int> {
 public:
  MultiplyJob(int a, int b) : a_(a), b_(b) {}
  int Execute(const offload::CancelToken&) override { return a_ * b_; }

 private:
  int a_;
  int b_;
};

class DivideByZero : public std::runtime_error {
 public:
  DivideByZero() : std::runtime_error("divide by zero") {}
};

class DivideJob final : public offload::Job<int> {
 public:
  DivideJob(int a, int b) : a_(a), b_(b) {}
  int Execute(const offload::CancelToken&) override {
    if (b_ == 0) {
      throw DivideByZero();
    }
    return a_ / b_;
  }

 private:
  int a_;
  int b_;
};

class CountingStream final : public offload::Job<int> {
 public:
  explicit CountingStream(int n) : n_(n) {}
  offload::JobMode Mode() const noexcept override { return offload::JobMode::kSyncStreaming; }
  void ExecuteStreaming(const offload::CancelToken&, const offload::ProgressFn<int>& progress,
                        const offload::CompleteFn& complete) override {
    for (int i = 1; i <= n_; ++i) {
      progress(i);
    }
    complete();
  }

 private:
  int n_;
};

/// Holds its worker until released (or cancelled, when cooperative).
class GateJob final : public offload::Job<int> {
 public:
  explicit GateJob(bool cooperative = false) : cooperative_(cooperative) {}

  int Execute(const offload::CancelToken& token) override {
    started.store(true);
    while (!release.load()) {
      if (cooperative_) {
        token.ThrowIfCancelled();
      }
      std::this_thread::sleep_for(1ms);
    }
    return 0;
  }

  std::atomic<bool> started{false};
  std::atomic<bool> release{false};

 private:
  bool cooperative_;
};

/// Records the peak number of concurrently running instances.
class ConcurrencyMeter final : public offload::Job<int> {
 public:
  ConcurrencyMeter(std::atomic<int>* running, std::atomic<int>* peak)
      : running_(running), peak_(peak) {}

  int Execute(const offload::CancelToken&) override {
    const int now = running_->fetch_add(1) + 1;
    int prev = peak_->load();
    while (now > prev && !peak_->compare_exchange_weak(prev, now)) {
    }
    std::this_thread::sleep_for(2ms);
    running_->fetch_sub(1);
    return now;
  }

 private:
  std::atomic<int>* running_;
  std::atomic<int>* peak_;
};

/// Async variant: the body runs on a std::async thread the worker waits on.
class AsyncConcurrencyMeter final : public offload::Job<int> {
 public:
  AsyncConcurrencyMeter(std::atomic<int>* running, std::atomic<int>* peak)
      : inner_(running, peak) {}

  offload::JobMode Mode() const noexcept override { return offload::JobMode::kAsync; }

  std::future<int> ExecuteAsync(const offload::CancelToken& token) override {
    return std::async(std::launch::async, [this, token]() { return inner_.Execute(token); });
  }

 private:
  ConcurrencyMeter inner_;
};

/// Streaming variant: reports the observed concurrency as progress.
class StreamingConcurrencyMeter final : public offload::Job<int> {
 public:
  StreamingConcurrencyMeter(std::atomic<int>* running, std::atomic<int>* peak)
      : inner_(running, peak) {}

  offload::JobMode Mode() const noexcept override { return offload::JobMode::kSyncStreaming; }

  void ExecuteStreaming(const offload::CancelToken& token, const offload::ProgressFn<int>& progress,
                        const offload::CompleteFn& complete) override {
    progress(inner_.Execute(token));
    complete();
  }

 private:
  ConcurrencyMeter inner_;
};

/// on_error whose copy throws once armed; posting its cancellation fails.
struct CopyBombErrorFn {
  static std::atomic<bool>& Armed() {
    static std::atomic<bool> armed{false};
    return armed;
  }

  CopyBombErrorFn() = default;
  CopyBombErrorFn(const CopyBombErrorFn&) {
    if (Armed().load()) {
      throw std::runtime_error("copy failed");
    }
  }
  CopyBombErrorFn& operator=(const CopyBombErrorFn&) = default;

  void operator()(const offload::JobError&) const {}
};

offload::WorkerPoolConfig MakeConfig(uint32_t workers, uint32_t capacity = 1000U) {
  offload::WorkerPoolConfig cfg;
  cfg.name = "test";
  cfg.worker_num = workers;
  cfg.queue_capacity = capacity;
  return cfg;
}

/// Drain repeatedly until @p pred holds or the timeout elapses.
template <typename Pred>
bool DrainUntil(offload::WorkerPool& pool, Pred pred, std::chrono::milliseconds timeout = 2000ms) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    pool.Drain();
    if (pred()) {
      return true;
    }
    if (std::chrono::steady_clock::now() > deadline) {
      return false;
    }
    std::this_thread::sleep_for(1ms);
  }
}

template <typename Pred>
bool WaitUntil(Pred pred, std::chrono::milliseconds timeout = 2000ms) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!pred()) {
    if (std::chrono::steady_clock::now() > deadline) {
      return false;
    }
    std::this_thread::sleep_for(1ms);
  }
  return true;
}

}  // namespace

// ============================================================================
// Scenarios
// ============================================================================

TEST_CASE("WorkerPool: sync job result delivered on one drain", "[worker_pool][scenario]") {
  offload::WorkerPool pool(MakeConfig(2));
  REQUIRE(pool.Initialize());

  int calls = 0;
  int value = 0;
  auto r = pool.Submit(std::make_shared<MultiplyJob>(21, 2), [&](int v) {
    ++calls;
    value = v;
  });
  REQUIRE(r.has_value());
  REQUIRE(r.value() != offload::kInvalidJobId);

  REQUIRE(WaitUntil([&pool] { return pool.GetStats().pending_callbacks > 0U; }));
  pool.Drain();
  REQUIRE(calls == 1);
  REQUIRE(value == 42);

  pool.Drain();
  REQUIRE(calls == 1);
}

TEST_CASE("WorkerPool: third submission to a full worker is QueueFull", "[worker_pool][scenario]") {
  offload::WorkerPool pool(MakeConfig(1, 2));
  REQUIRE(pool.Initialize());

  auto gate = std::make_shared<GateJob>();
  REQUIRE(pool.Submit(gate, nullptr).has_value());
  REQUIRE(WaitUntil([&gate] { return gate->started.load(); }));

  std::vector<offload::JobError> errors;
  auto on_error = [&errors](const offload::JobError& e) { errors.push_back(e); };
  REQUIRE(pool.Submit(std::make_shared<MultiplyJob>(1, 1), nullptr, on_error).has_value());
  REQUIRE(pool.Submit(std::make_shared<MultiplyJob>(2, 2), nullptr, on_error).has_value());
  auto third = pool.Submit(std::make_shared<MultiplyJob>(3, 3), nullptr, on_error);

  REQUIRE_FALSE(third.has_value());
  REQUIRE(third.get_error() == offload::SubmitError::kQueueFull);
  REQUIRE(errors.size() == 1U);
  REQUIRE(errors[0].code == offload::JobErrorCode::kRejected);
  REQUIRE(errors[0].submit_error == offload::SubmitError::kQueueFull);
  REQUIRE(pool.GetStats().rejected == 1U);

  gate->release.store(true);
}

TEST_CASE("WorkerPool: streaming callbacks keep emission order", "[worker_pool][scenario]") {
  offload::WorkerPool pool(MakeConfig(2));
  REQUIRE(pool.Initialize());

  std::vector<std::string> events;
  auto r = pool.SubmitStreaming(
      std::make_shared<CountingStream>(3),
      [&events](int v) { events.push_back("progress(" + std::to_string(v) + ")"); },
      [&events]() { events.push_back("complete()"); });
  REQUIRE(r.has_value());

  REQUIRE(DrainUntil(pool, [&events] { return events.size() == 4U; }));
  REQUIRE(events == std::vector<std::string>{"progress(1)", "progress(2)", "progress(3)",
                                             "complete()"});
}

TEST_CASE("WorkerPool: job cancelled before running never reports a result",
          "[worker_pool][scenario]") {
  offload::WorkerPool pool(MakeConfig(1));
  REQUIRE(pool.Initialize());

  auto gate = std::make_shared<GateJob>();
  REQUIRE(pool.Submit(gate, nullptr).has_value());
  REQUIRE(WaitUntil([&gate] { return gate->started.load(); }));

  bool result_called = false;
  bool complete_called = false;
  offload::SubmitOptions opts;
  opts.on_complete = [&complete_called]() { complete_called = true; };
  auto r = pool.Submit(std::make_shared<MultiplyJob>(6, 7),
                       [&result_called](int) { result_called = true; }, nullptr, opts);
  REQUIRE(r.has_value());
  REQUIRE(pool.IsJobActive(r.value()));

  REQUIRE(pool.Cancel(r.value()));
  REQUIRE_FALSE(pool.IsJobActive(r.value()));
  REQUIRE_FALSE(pool.Cancel(r.value()));

  gate->release.store(true);
  pool.Shutdown();
  pool.Drain();
  REQUIRE_FALSE(result_called);
  REQUIRE_FALSE(complete_called);
}

TEST_CASE("WorkerPool: thrown error reported once, worker stays usable",
          "[worker_pool][scenario]") {
  offload::WorkerPool pool(MakeConfig(1));
  REQUIRE(pool.Initialize());

  int error_calls = 0;
  bool was_divide_by_zero = false;
  auto bad = pool.Submit(std::make_shared<DivideJob>(1, 0), nullptr,
                         [&](const offload::JobError& e) {
                           ++error_calls;
                           REQUIRE(e.code == offload::JobErrorCode::kExecutionFailed);
                           try {
                             std::rethrow_exception(e.cause);
                           } catch (const DivideByZero&) {
                             was_divide_by_zero = true;
                           }
                         });
  REQUIRE(bad.has_value());
  REQUIRE(DrainUntil(pool, [&error_calls] { return error_calls > 0; }));

  int value = 0;
  REQUIRE(pool.Submit(std::make_shared<DivideJob>(10, 2), [&value](int v) { value = v; })
              .has_value());
  REQUIRE(DrainUntil(pool, [&value] { return value != 0; }));

  REQUIRE(error_calls == 1);
  REQUIRE(was_divide_by_zero);
  REQUIRE(value == 5);
  REQUIRE(pool.GetStats().failed == 1U);
}

// ============================================================================
// Submission rules
// ============================================================================

TEST_CASE("WorkerPool: synchronous rejections", "[worker_pool]") {
  offload::WorkerPool pool(MakeConfig(1));
  std::vector<offload::SubmitError> seen;
  auto on_error = [&seen](const offload::JobError& e) {
    REQUIRE(e.code == offload::JobErrorCode::kRejected);
    seen.push_back(e.submit_error);
  };

  SECTION("before Initialize") {
    auto r = pool.Submit(std::make_shared<MultiplyJob>(1, 1), nullptr, on_error);
    REQUIRE(r.get_error() == offload::SubmitError::kNotInitialized);
    REQUIRE(seen.size() == 1U);
  }

  SECTION("null job") {
    REQUIRE(pool.Initialize());
    auto r = pool.Submit(std::shared_ptr<MultiplyJob>(), nullptr, on_error);
    REQUIRE(r.get_error() == offload::SubmitError::kNullJob);
    REQUIRE(seen.size() == 1U);
  }

  SECTION("shape mismatch") {
    REQUIRE(pool.Initialize());
    auto a = pool.Submit(std::make_shared<CountingStream>(1), nullptr, on_error);
    REQUIRE(a.get_error() == offload::SubmitError::kInvalidMode);
    auto b = pool.SubmitStreaming(std::make_shared<MultiplyJob>(1, 1), nullptr, nullptr, on_error);
    REQUIRE(b.get_error() == offload::SubmitError::kInvalidMode);
    REQUIRE(seen.size() == 2U);
  }

  SECTION("after Shutdown") {
    REQUIRE(pool.Initialize());
    pool.Shutdown();
    auto r = pool.Submit(std::make_shared<MultiplyJob>(1, 1), nullptr, on_error);
    REQUIRE(r.get_error() == offload::SubmitError::kPoolShuttingDown);
    REQUIRE(pool.GetStats().running_workers == 0U);
    REQUIRE(seen.size() == 1U);
  }
}

TEST_CASE("WorkerPool: Initialize is single-shot", "[worker_pool]") {
  offload::WorkerPool pool(MakeConfig(0, 0));
  REQUIRE(pool.Size() == 1U);
  REQUIRE(pool.GetConfig().queue_capacity == 1U);
  REQUIRE_FALSE(pool.IsInitialized());
  REQUIRE(pool.Initialize());
  REQUIRE_FALSE(pool.Initialize());
  REQUIRE(pool.IsInitialized());
}

TEST_CASE("WorkerPool: placement prefers idle, then shortest queue", "[worker_pool]") {
  offload::WorkerPool pool(MakeConfig(2));
  REQUIRE(pool.Initialize());

  auto gate_a = std::make_shared<GateJob>();
  REQUIRE(pool.Submit(gate_a, nullptr).has_value());
  REQUIRE(WaitUntil([&gate_a] { return gate_a->started.load(); }));
  REQUIRE(pool.WorkerAt(0).IsBusy());

  auto gate_b = std::make_shared<GateJob>();
  REQUIRE(pool.Submit(gate_b, nullptr).has_value());
  REQUIRE(WaitUntil([&gate_b] { return gate_b->started.load(); }));
  REQUIRE(pool.WorkerAt(1).IsBusy());

  for (int i = 0; i < 3; ++i) {
    REQUIRE(pool.Submit(std::make_shared<MultiplyJob>(i, i), nullptr).has_value());
  }
  REQUIRE(pool.WorkerAt(0).PendingJobCount() == 2U);
  REQUIRE(pool.WorkerAt(1).PendingJobCount() == 1U);

  const auto stats = pool.GetStats();
  REQUIRE(stats.active_workers == 2U);
  REQUIRE(stats.queued_jobs == 3U);

  char line[128];
  pool.FormatStats(line, sizeof(line));
  REQUIRE(std::strstr(line, "Threads: 2/2") != nullptr);
  REQUIRE(std::strstr(line, "Queued: 3") != nullptr);

  gate_a->release.store(true);
  gate_b->release.store(true);
}

TEST_CASE("WorkerPool: concurrency never exceeds worker count", "[worker_pool]") {
  static constexpr uint32_t kWorkers = 3U;
  offload::WorkerPool pool(MakeConfig(kWorkers));
  REQUIRE(pool.Initialize());

  std::atomic<int> running{0};
  std::atomic<int> peak{0};
  int results = 0;
  for (int i = 0; i < 30; ++i) {
    REQUIRE(pool.Submit(std::make_shared<ConcurrencyMeter>(&running, &peak),
                        [&results](int) { ++results; })
                .has_value());
  }
  REQUIRE(DrainUntil(pool, [&results] { return results == 30; }, 5000ms));
  REQUIRE(peak.load() >= 1);
  REQUIRE(peak.load() <= static_cast<int>(kWorkers));
  REQUIRE(pool.GetStats().executed == 30U);
  REQUIRE(pool.GetStats().submitted == 30U);
}

TEST_CASE("WorkerPool: concurrency bound holds for mixed modes", "[worker_pool]") {
  static constexpr uint32_t kWorkers = 3U;
  offload::WorkerPool pool(MakeConfig(kWorkers));
  REQUIRE(pool.Initialize());

  std::atomic<int> running{0};
  std::atomic<int> peak{0};
  int results = 0;
  int completes = 0;
  for (int i = 0; i < 30; ++i) {
    switch (i % 3) {
      case 0:
        REQUIRE(pool.Submit(std::make_shared<ConcurrencyMeter>(&running, &peak),
                            [&results](int) { ++results; })
                    .has_value());
        break;
      case 1:
        REQUIRE(pool.Submit(std::make_shared<AsyncConcurrencyMeter>(&running, &peak),
                            [&results](int) { ++results; })
                    .has_value());
        break;
      default:
        REQUIRE(pool.SubmitStreaming(std::make_shared<StreamingConcurrencyMeter>(&running, &peak),
                                     [](int) {}, [&completes] { ++completes; })
                    .has_value());
        break;
    }
  }
  REQUIRE(DrainUntil(pool, [&] { return results == 20 && completes == 10; }, 5000ms));
  REQUIRE(peak.load() >= 1);
  REQUIRE(peak.load() <= static_cast<int>(kWorkers));
  REQUIRE(pool.GetStats().executed == 30U);
}

TEST_CASE("WorkerPool: per-worker FIFO", "[worker_pool]") {
  offload::WorkerPool pool(MakeConfig(1));
  REQUIRE(pool.Initialize());

  std::vector<int> order;
  for (int i = 0; i < 50; ++i) {
    REQUIRE(pool.Submit(std::make_shared<MultiplyJob>(i, 1), [&order](int v) { order.push_back(v); })
                .has_value());
  }
  REQUIRE(DrainUntil(pool, [&order] { return order.size() == 50U; }));
  REQUIRE(std::is_sorted(order.begin(), order.end()));
}

// ============================================================================
// Cancellation
// ============================================================================

TEST_CASE("WorkerPool: cancelling a running cooperative job", "[worker_pool][cancel]") {
  offload::WorkerPool pool(MakeConfig(1));
  REQUIRE(pool.Initialize());

  auto gate = std::make_shared<GateJob>(true);
  offload::JobErrorCode code = offload::JobErrorCode::kExecutionFailed;
  int errors = 0;
  auto r = pool.Submit(gate, nullptr, [&](const offload::JobError& e) {
    code = e.code;
    ++errors;
  });
  REQUIRE(r.has_value());
  REQUIRE(WaitUntil([&gate] { return gate->started.load(); }));

  const std::vector<offload::JobId> active = pool.GetActiveJobIds();
  REQUIRE(active.size() == 1U);
  REQUIRE(active[0] == r.value());

  REQUIRE(pool.Cancel(r.value()));
  REQUIRE(DrainUntil(pool, [&errors] { return errors > 0; }));
  REQUIRE(code == offload::JobErrorCode::kCancelled);
  REQUIRE(errors == 1);
  REQUIRE(pool.GetActiveJobIds().empty());
  REQUIRE_FALSE(pool.Cancel(r.value()));
}

TEST_CASE("WorkerPool: notify_cancel reports queued cancellation", "[worker_pool][cancel]") {
  offload::WorkerPool pool(MakeConfig(1));
  REQUIRE(pool.Initialize());

  auto gate = std::make_shared<GateJob>();
  REQUIRE(pool.Submit(gate, nullptr).has_value());
  REQUIRE(WaitUntil([&gate] { return gate->started.load(); }));

  int silent_errors = 0;
  int loud_errors = 0;
  offload::SubmitOptions loud;
  loud.notify_cancel = true;
  auto silent = pool.Submit(std::make_shared<MultiplyJob>(1, 1), nullptr,
                            [&silent_errors](const offload::JobError&) { ++silent_errors; });
  auto noisy = pool.Submit(std::make_shared<MultiplyJob>(1, 1), nullptr,
                           [&loud_errors](const offload::JobError& e) {
                             REQUIRE(e.code == offload::JobErrorCode::kCancelled);
                             ++loud_errors;
                           },
                           loud);
  REQUIRE(pool.Cancel(silent.value()));
  REQUIRE(pool.Cancel(noisy.value()));
  pool.Drain();

  REQUIRE(silent_errors == 0);
  REQUIRE(loud_errors == 1);
  REQUIRE_FALSE(pool.Cancel(12345678U));
  gate->release.store(true);
}

// ============================================================================
// Drain
// ============================================================================

TEST_CASE("WorkerPool: drain cap bounds callbacks per worker", "[worker_pool][drain]") {
  offload::WorkerPoolConfig cfg = MakeConfig(1);
  cfg.drain_cap = 2;
  offload::WorkerPool pool(cfg);
  REQUIRE(pool.Initialize());

  int delivered = 0;
  for (int i = 0; i < 5; ++i) {
    REQUIRE(pool.Submit(std::make_shared<MultiplyJob>(i, 1), [&delivered](int) { ++delivered; })
                .has_value());
  }
  REQUIRE(WaitUntil([&pool] { return pool.GetStats().pending_callbacks == 5U; }));

  REQUIRE(pool.Drain() == 2U);
  REQUIRE(delivered == 2);
  REQUIRE(pool.Drain(0) == 3U);
  REQUIRE(delivered == 5);
}

TEST_CASE("WorkerPool: drain from another thread does nothing", "[worker_pool][drain]") {
  offload::WorkerPool pool(MakeConfig(1));
  REQUIRE(pool.Initialize());

  int delivered = 0;
  REQUIRE(pool.Submit(std::make_shared<MultiplyJob>(2, 3), [&delivered](int) { ++delivered; })
              .has_value());
  REQUIRE(WaitUntil([&pool] { return pool.GetStats().pending_callbacks == 1U; }));

  uint32_t off_thread = 99U;
  std::thread other([&pool, &off_thread] { off_thread = pool.Drain(); });
  other.join();
  REQUIRE(off_thread == 0U);
  REQUIRE(delivered == 0);

  REQUIRE(pool.Drain() == 1U);
  REQUIRE(delivered == 1);
}

// ============================================================================
// Batch
// ============================================================================

TEST_CASE("WorkerPool: SubmitBatch", "[worker_pool][batch]") {
  SECTION("all jobs enqueued") {
    offload::WorkerPool pool(MakeConfig(2));
    REQUIRE(pool.Initialize());
    std::vector<std::shared_ptr<MultiplyJob>> jobs;
    for (int i = 1; i <= 5; ++i) {
      jobs.push_back(std::make_shared<MultiplyJob>(i, 10));
    }
    int sum = 0;
    int results = 0;
    auto batch = pool.SubmitBatch(jobs, [&](int v) {
      sum += v;
      ++results;
    });
    REQUIRE(batch.AllEnqueued());
    REQUIRE(batch.ids.size() == 5U);
    REQUIRE(DrainUntil(pool, [&results] { return results == 5; }));
    REQUIRE(sum == 150);
  }

  SECTION("overflow is reported per job") {
    offload::WorkerPool pool(MakeConfig(1, 2));
    REQUIRE(pool.Initialize());
    auto gate = std::make_shared<GateJob>();
    REQUIRE(pool.Submit(gate, nullptr).has_value());
    REQUIRE(WaitUntil([&gate] { return gate->started.load(); }));

    std::vector<std::shared_ptr<MultiplyJob>> jobs;
    for (int i = 0; i < 4; ++i) {
      jobs.push_back(std::make_shared<MultiplyJob>(i, 1));
    }
    int rejected = 0;
    auto batch = pool.SubmitBatch(jobs, nullptr, [&rejected](const offload::JobError& e) {
      REQUIRE(e.submit_error == offload::SubmitError::kQueueFull);
      ++rejected;
    });
    REQUIRE_FALSE(batch.AllEnqueued());
    REQUIRE(batch.ids.size() == 2U);
    REQUIRE(batch.rejected == 2U);
    REQUIRE(rejected == 2);
    gate->release.store(true);
  }
}

// ============================================================================
// Shutdown
// ============================================================================

TEST_CASE("WorkerPool: Shutdown is idempotent", "[worker_pool][shutdown]") {
  offload::WorkerPool pool(MakeConfig(2));
  REQUIRE(pool.Initialize());
  REQUIRE(pool.Shutdown());
  REQUIRE(pool.IsShuttingDown());
  REQUIRE(pool.Shutdown());
  REQUIRE(pool.GetStats().running_workers == 0U);
}

TEST_CASE("WorkerPool: Shutdown is bounded with an uncooperative job", "[worker_pool][shutdown]") {
  auto gate = std::make_shared<GateJob>(false);
  {
    offload::WorkerPool pool(MakeConfig(1));
    REQUIRE(pool.Initialize());
    REQUIRE(pool.Submit(gate, nullptr).has_value());
    REQUIRE(WaitUntil([&gate] { return gate->started.load(); }));

    const auto t0 = std::chrono::steady_clock::now();
    REQUIRE_FALSE(pool.Shutdown(50ms));
    REQUIRE(std::chrono::steady_clock::now() - t0 < 1000ms);
  }
  gate->release.store(true);
  std::this_thread::sleep_for(20ms);
}

TEST_CASE("WorkerPool: Shutdown abandons queued jobs", "[worker_pool][shutdown]") {
  offload::WorkerPool pool(MakeConfig(1));
  REQUIRE(pool.Initialize());

  auto gate = std::make_shared<GateJob>(true);
  REQUIRE(pool.Submit(gate, nullptr).has_value());
  REQUIRE(WaitUntil([&gate] { return gate->started.load(); }));

  offload::SubmitOptions opts;
  opts.notify_cancel = true;
  int cancelled = 0;
  bool ran = false;
  REQUIRE(pool.Submit(std::make_shared<MultiplyJob>(1, 1), [&ran](int) { ran = true; },
                      [&cancelled](const offload::JobError& e) {
                        if (e.code == offload::JobErrorCode::kCancelled) {
                          ++cancelled;
                        }
                      },
                      opts)
              .has_value());

  REQUIRE(pool.Shutdown(2000ms));
  pool.Drain();
  REQUIRE_FALSE(ran);
  REQUIRE(cancelled == 1);
}

TEST_CASE("WorkerPool: Shutdown tolerates a failing cancellation post", "[worker_pool][shutdown]") {
  offload::WorkerPool pool(MakeConfig(2));
  REQUIRE(pool.Initialize());

  auto gate_a = std::make_shared<GateJob>(true);
  auto gate_b = std::make_shared<GateJob>(true);
  REQUIRE(pool.Submit(gate_a, nullptr).has_value());
  REQUIRE(WaitUntil([&gate_a] { return gate_a->started.load(); }));
  REQUIRE(pool.Submit(gate_b, nullptr).has_value());
  REQUIRE(WaitUntil([&gate_b] { return gate_b->started.load(); }));

  offload::SubmitOptions opts;
  opts.notify_cancel = true;
  int cancelled = 0;
  auto count_cancel = [&cancelled](const offload::JobError& e) {
    if (e.code == offload::JobErrorCode::kCancelled) {
      ++cancelled;
    }
  };

  // Placement by shortest queue: worker 0 gets the failing job and the third
  // job, worker 1 the second.
  auto bomb = pool.Submit(std::make_shared<MultiplyJob>(1, 1), nullptr, CopyBombErrorFn(), opts);
  REQUIRE(bomb.has_value());
  REQUIRE(pool.Submit(std::make_shared<MultiplyJob>(2, 2), nullptr, count_cancel, opts)
              .has_value());
  REQUIRE(pool.Submit(std::make_shared<MultiplyJob>(3, 3), nullptr, count_cancel, opts)
              .has_value());
  REQUIRE(pool.WorkerAt(0).PendingJobCount() == 2U);
  REQUIRE(pool.WorkerAt(1).PendingJobCount() == 1U);

  CopyBombErrorFn::Armed().store(true);
  bool all_joined = false;
  REQUIRE_NOTHROW(all_joined = pool.Shutdown(2000ms));
  CopyBombErrorFn::Armed().store(false);

  REQUIRE(all_joined);
  REQUIRE(pool.GetStats().running_workers == 0U);
  REQUIRE_FALSE(pool.IsJobActive(bomb.value()));
  pool.Drain();
  REQUIRE(cancelled == 2);
}

// ============================================================================
// Default instance
// ============================================================================

TEST_CASE("WorkerPool: default instance is explicit", "[worker_pool][default]") {
  REQUIRE(offload::DefaultPool() == nullptr);
  REQUIRE(offload::InitDefaultPool(MakeConfig(1)));
  REQUIRE_FALSE(offload::InitDefaultPool(MakeConfig(1)));

  offload::WorkerPool* pool = offload::DefaultPool();
  REQUIRE(pool != nullptr);
  int value = 0;
  REQUIRE(pool->Submit(std::make_shared<MultiplyJob>(4, 4), [&value](int v) { value = v; })
              .has_value());
  REQUIRE(DrainUntil(*pool, [&value] { return value == 16; }));

  offload::ShutdownDefaultPool();
  REQUIRE(offload::DefaultPool() == nullptr);
  offload::ShutdownDefaultPool();
}
