// Copyright (c) 2024 liudegui. MIT License.
//
// frame_loop_demo.cpp -- WorkerPool driven from a simulated host frame loop.
//
// Demonstrates:
//   1. One-shot sync and async jobs with typed results
//   2. Streaming progress delivered in order on the frame thread
//   3. Per-frame drain cap protecting the frame budget
//   4. Cancelling a long job by id
//   5. Statistics line and bounded shutdown

#include "offload/job.hpp"
#include "offload/log.hpp"
#include "offload/quick_jobs.hpp"
#include "offload/worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <future>
#include <memory>
#include <string>
#include <thread>

// ============================================================================
// Jobs
// ============================================================================

/// Sums the primes below a limit; polls for cancellation every 1024 numbers.
class PrimeSumJob final : public offload::Job<uint64_t> {
 public:
  explicit PrimeSumJob(uint32_t limit) : limit_(limit) {}

  uint64_t Execute(const offload::CancelToken& token) override {
    uint64_t sum = 0;
    for (uint32_t n = 2; n < limit_; ++n) {
      if ((n & 1023U) == 0U) {
        token.ThrowIfCancelled();
      }
      bool prime = true;
      for (uint32_t d = 2; d * d <= n; ++d) {
        if (n % d == 0U) {
          prime = false;
          break;
        }
      }
      if (prime) {
        sum += n;
      }
    }
    return sum;
  }

 private:
  uint32_t limit_;
};

/// Pretends to load an asset in chunks, reporting bytes loaded.
class ChunkLoadJob final : public offload::Job<uint32_t> {
 public:
  explicit ChunkLoadJob(uint32_t chunks) : chunks_(chunks) {}

  offload::JobMode Mode() const noexcept override { return offload::JobMode::kSyncStreaming; }

  void ExecuteStreaming(const offload::CancelToken& token,
                        const offload::ProgressFn<uint32_t>& on_progress,
                        const offload::CompleteFn& on_complete) override {
    for (uint32_t i = 1; i <= chunks_; ++i) {
      token.ThrowIfCancelled();
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
      on_progress(i * 4096U);
    }
    on_complete();
  }

 private:
  uint32_t chunks_;
};

// ============================================================================
// Frame loop
// ============================================================================

static void ReportSubmit(const offload::expected<offload::JobId, offload::SubmitError>& r,
                         const char* what) {
  if (!r.has_value()) {
    std::printf("[frame] %s rejected: %s\n", what, offload::SubmitErrorName(r.get_error()));
  }
}

int main() {
  offload::log::Init();

  offload::WorkerPoolConfig cfg;
  cfg.name = "frame";
  cfg.worker_num = 3;
  cfg.drain_cap = 4;  // at most 4 callbacks per worker per frame
  offload::WorkerPool pool(cfg);
  if (!pool.Initialize()) {
    std::fprintf(stderr, "pool initialization failed\n");
    return 1;
  }

  std::atomic<bool> prime_done{false};
  std::atomic<bool> load_done{false};

  auto prime = pool.Submit(
      std::make_shared<PrimeSumJob>(200000U),
      [&prime_done](uint64_t sum) {
        std::printf("[frame] prime sum = %llu\n", static_cast<unsigned long long>(sum));
        prime_done.store(true);
      },
      [&prime_done](const offload::JobError& e) {
        std::printf("[frame] prime job failed: %s\n", e.message.c_str());
        prime_done.store(true);
      });
  ReportSubmit(prime, "prime job");

  auto load = pool.SubmitStreaming(
      std::make_shared<ChunkLoadJob>(8U),
      [](uint32_t bytes) { std::printf("[frame] loaded %u bytes\n", bytes); },
      [&load_done]() {
        std::printf("[frame] asset ready\n");
        load_done.store(true);
      });
  ReportSubmit(load, "load job");

  auto fetch = offload::RunFunctionAsync<std::string>(
      pool,
      [] {
        return std::async(std::launch::async, [] { return std::string("config fetched"); });
      },
      [](std::string s) { std::printf("[frame] %s\n", s.c_str()); });
  ReportSubmit(fetch, "fetch job");

  // A long job that will be cancelled while it runs.
  auto slow = pool.Submit(
      std::make_shared<PrimeSumJob>(50000000U),
      [](uint64_t) { std::printf("[frame] slow job finished (unexpected)\n"); },
      [](const offload::JobError& e) {
        std::printf("[frame] slow job ended: %s\n", offload::JobErrorCodeName(e.code));
      });
  ReportSubmit(slow, "slow job");

  char stats[128];
  for (uint32_t frame = 0; frame < 600U; ++frame) {
    const uint32_t ran = pool.Drain();
    if (frame == 10U && slow.has_value()) {
      (void)pool.Cancel(slow.value());
    }
    if (ran > 0U || (frame % 60U) == 0U) {
      pool.FormatStats(stats, sizeof(stats));
      std::printf("[frame %3u] callbacks=%u  %s\n", frame, ran, stats);
    }
    if (prime_done.load() && load_done.load() && !pool.IsJobActive(slow.value_or(0U))) {
      pool.Drain(0U);
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(16));
  }

  const bool clean = pool.Shutdown();
  std::printf("shutdown %s\n", clean ? "clean" : "timed out");
  offload::log::Shutdown();
  return 0;
}
