/**
 * @file job_queue.hpp
 * @brief Bounded FIFO of job envelopes feeding one worker.
 *
 * Many producers (submitting threads) and exactly one consumer (the worker
 * loop). Insertion never blocks: a full queue or a queue that has been
 * closed with CompleteAdding() rejects the envelope and leaves it with the
 * caller. Take() blocks only while the queue is empty.
 */

#ifndef OFFLOAD_JOB_QUEUE_HPP_
#define OFFLOAD_JOB_QUEUE_HPP_

#include "offload/envelope.hpp"
#include "offload/pool_config.hpp"

#include <cstdint>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <vector>

namespace offload {

class JobQueue final {
 public:
  using Item = std::unique_ptr<JobEnvelope>;

  explicit JobQueue(uint32_t capacity = kDefaultQueueCapacity) noexcept
      : capacity_(capacity > 0U ? capacity : 1U) {}

  JobQueue(const JobQueue&) = delete;
  JobQueue& operator=(const JobQueue&) = delete;

  /**
   * @brief Non-blocking insert.
   * @return true if @p item was moved into the queue; false if the queue is
   *         full or closed, in which case @p item is untouched.
   */
  bool TryPush(Item& item) {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      if (adding_completed_ || items_.size() >= capacity_) {
        return false;
      }
      items_.push_back(std::move(item));
      size_.store(static_cast<uint32_t>(items_.size()), std::memory_order_release);
    }
    cv_.notify_one();
    return true;
  }

  /**
   * @brief Block until an item is available, the queue is closed and
   *        empty, or @p cancel is raised.
   * @return true with @p out set, false when the consumer should exit.
   */
  bool Take(Item& out, const std::atomic<bool>& cancel) {
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait(lk, [&] {
      return !items_.empty() || adding_completed_ || cancel.load(std::memory_order_acquire);
    });
    if (cancel.load(std::memory_order_acquire) || items_.empty()) {
      return false;
    }
    out = std::move(items_.front());
    items_.pop_front();
    size_.store(static_cast<uint32_t>(items_.size()), std::memory_order_release);
    return true;
  }

  /// @brief Remove the queued envelope with @p id, if still present.
  Item Remove(JobId id) {
    std::lock_guard<std::mutex> lk(mtx_);
    for (auto it = items_.begin(); it != items_.end(); ++it) {
      if ((*it)->Id() == id) {
        Item found = std::move(*it);
        items_.erase(it);
        size_.store(static_cast<uint32_t>(items_.size()), std::memory_order_release);
        return found;
      }
    }
    return Item();
  }

  /// @brief Remove and return every queued envelope, in FIFO order.
  std::vector<Item> RemoveAll() {
    std::vector<Item> out;
    std::lock_guard<std::mutex> lk(mtx_);
    out.reserve(items_.size());
    for (auto& item : items_) {
      out.push_back(std::move(item));
    }
    items_.clear();
    size_.store(0U, std::memory_order_release);
    return out;
  }

  /// @brief Refuse further insertions and wake the consumer.
  void CompleteAdding() {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      adding_completed_ = true;
    }
    cv_.notify_all();
  }

  bool IsAddingCompleted() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return adding_completed_;
  }

  /// @brief Lock-free snapshot of the queue length.
  uint32_t Size() const noexcept { return size_.load(std::memory_order_acquire); }

  uint32_t Capacity() const noexcept { return capacity_; }

 private:
  const uint32_t capacity_;
  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::deque<Item> items_;
  bool adding_completed_{false};
  std::atomic<uint32_t> size_{0U};
};

}  // namespace offload

#endif  // OFFLOAD_JOB_QUEUE_HPP_
