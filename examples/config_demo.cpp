// Copyright (c) 2024 liudegui. MIT License.
//
// config_demo.cpp -- Build a WorkerPool from a configuration file.
//
// Usage: config_demo [path]   (.ini / .json / .yaml, depending on build)
//
// Without a path, a built-in buffer in the first enabled format is used.

#include "offload/config.hpp"
#include "offload/log.hpp"
#include "offload/quick_jobs.hpp"
#include "offload/worker_pool.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <thread>

#ifdef OFFLOAD_CONFIG_HAS_BACKEND

static offload::expected<void, offload::ConfigError> LoadDefault(offload::MultiConfig& cfg) {
#if defined(OFFLOAD_CONFIG_INI_ENABLED)
  static const char kText[] =
      "[pool]\nname = cfg\nworkers = 2\nqueue_capacity = 16\n[log]\nlevel = info\n";
  return cfg.LoadBuffer(kText, sizeof(kText) - 1U, offload::ConfigFormat::kIni);
#elif defined(OFFLOAD_CONFIG_JSON_ENABLED)
  static const char kText[] =
      R"({"pool": {"name": "cfg", "workers": 2, "queue_capacity": 16}, "log": {"level": "info"}})";
  return cfg.LoadBuffer(kText, sizeof(kText) - 1U, offload::ConfigFormat::kJson);
#else
  static const char kText[] =
      "pool:\n  name: cfg\n  workers: 2\n  queue_capacity: 16\nlog:\n  level: info\n";
  return cfg.LoadBuffer(kText, sizeof(kText) - 1U, offload::ConfigFormat::kYaml);
#endif
}

int main(int argc, char* argv[]) {
  offload::log::Init();

  offload::MultiConfig cfg;
  auto loaded = (argc > 1) ? cfg.LoadFile(argv[1]) : LoadDefault(cfg);
  if (!loaded.has_value()) {
    std::fprintf(stderr, "config load failed (error %u)\n",
                 static_cast<uint32_t>(loaded.get_error()));
    return 1;
  }
  (void)offload::ApplyLogConfig(cfg);

  auto pool_cfg = offload::LoadPoolConfig(cfg);
  if (!pool_cfg.has_value()) {
    std::fprintf(stderr, "invalid [pool] section\n");
    return 1;
  }
  std::printf("pool '%s': %u workers, capacity %u, drain cap %u, shutdown %u ms\n",
              pool_cfg.value().name.c_str(), pool_cfg.value().worker_num,
              pool_cfg.value().queue_capacity, pool_cfg.value().drain_cap,
              pool_cfg.value().shutdown_timeout_ms);

  if (!offload::InitDefaultPool(pool_cfg.value())) {
    std::fprintf(stderr, "default pool already initialized\n");
    return 1;
  }
  offload::WorkerPool& pool = *offload::DefaultPool();

  uint32_t done = 0;
  for (uint32_t i = 1; i <= 8U; ++i) {
    (void)offload::RunFunction<uint32_t>(
        pool, [i] { return i * i; },
        [&done](uint32_t v) {
          std::printf("  square = %u\n", v);
          ++done;
        },
        [&done](const offload::JobError& e) {
          std::printf("  rejected: %s\n", e.message.c_str());
          ++done;
        });
  }

  for (uint32_t tick = 0; tick < 200U && done < 8U; ++tick) {
    pool.Drain();
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }

  char stats[128];
  pool.FormatStats(stats, sizeof(stats));
  std::printf("%s\n", stats);

  offload::ShutdownDefaultPool();
  offload::log::Shutdown();
  return 0;
}

#else

int main() {
  std::fprintf(stderr, "config_demo: no configuration backend enabled in this build\n");
  return 1;
}

#endif
