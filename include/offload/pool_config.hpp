/**
 * @file pool_config.hpp
 * @brief WorkerPool configuration and defaults.
 */

#ifndef OFFLOAD_POOL_CONFIG_HPP_
#define OFFLOAD_POOL_CONFIG_HPP_

#include "offload/vocabulary.hpp"

#include <cstdint>

namespace offload {

static constexpr uint32_t kDefaultWorkerNum = 4U;
static constexpr uint32_t kDefaultQueueCapacity = 1000U;
static constexpr uint32_t kDefaultShutdownTimeoutMs = 2000U;

/**
 * @brief WorkerPool configuration.
 *
 * drain_cap bounds the callbacks run per worker by one Drain() call
 * (0 = run everything pending).
 */
struct WorkerPoolConfig {
  FixedString<32> name{"pool"};
  uint32_t worker_num{kDefaultWorkerNum};
  uint32_t queue_capacity{kDefaultQueueCapacity};
  uint32_t drain_cap{0U};
  uint32_t shutdown_timeout_ms{kDefaultShutdownTimeoutMs};
};

}  // namespace offload

#endif  // OFFLOAD_POOL_CONFIG_HPP_
