/**
 * @file spsc_ringbuffer.hpp
 * @brief Lock-free, wait-free SPSC ring buffer.
 *
 * Backs each worker's trace queue: the worker loop is the only producer,
 * the drain thread the only consumer. Trivially copyable element types use
 * a memcpy batch path; other types are moved element by element.
 */

#ifndef OFFLOAD_SPSC_RINGBUFFER_HPP_
#define OFFLOAD_SPSC_RINGBUFFER_HPP_

#include "offload/platform.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cstdint>
#include <cstring>
#include <type_traits>
#include <utility>

namespace offload {

/// @brief Lock-free SPSC ring buffer.
///
/// @tparam T           Element type.
/// @tparam BufferSize  Capacity (must be a power of 2).
///
/// Thread safety:
///   - Exactly ONE producer thread may call Push.
///   - Exactly ONE consumer thread may call Pop / PopBatch.
///   - Size / IsEmpty / IsFull / Capacity may be called from any thread.
template <typename T, size_t BufferSize = 256>
class SpscRingbuffer {
 public:
  static_assert(BufferSize != 0, "Buffer size cannot be zero.");
  static_assert((BufferSize & (BufferSize - 1)) == 0,
                "Buffer size must be a power of 2.");

  static constexpr bool kTriviallyCopyable = std::is_trivially_copyable<T>::value;

  SpscRingbuffer() noexcept = default;

  SpscRingbuffer(const SpscRingbuffer&) = delete;
  SpscRingbuffer& operator=(const SpscRingbuffer&) = delete;

  // ==== Producer API ====

  /// @return true if pushed, false if the buffer is full.
  bool Push(const T& data) noexcept { return PushImpl(data); }
  bool Push(T&& data) noexcept { return PushImpl(std::move(data)); }

  // ==== Consumer API ====

  /// @return true if an element was popped, false if empty.
  bool Pop(T& data) noexcept {
    const size_t cur_tail = tail_.value.load(std::memory_order_relaxed);
    const size_t cur_head = head_.value.load(std::memory_order_acquire);
    if (cur_tail == cur_head) {
      return false;
    }
    if constexpr (kTriviallyCopyable) {
      data = data_buff_[cur_tail & kMask];
    } else {
      data = std::move(data_buff_[cur_tail & kMask]);
    }
    tail_.value.store(cur_tail + 1, std::memory_order_release);
    return true;
  }

  /// @brief Pop up to @p count elements into @p buf.
  /// @return Number of elements popped.
  size_t PopBatch(T* buf, size_t count) noexcept {
    const size_t cur_tail = tail_.value.load(std::memory_order_relaxed);
    const size_t cur_head = head_.value.load(std::memory_order_acquire);
    const size_t to_read = std::min(count, cur_head - cur_tail);
    if (to_read == 0) {
      return 0;
    }
    const size_t tail_offset = cur_tail & kMask;
    if constexpr (kTriviallyCopyable) {
      const size_t first_part = std::min(to_read, BufferSize - tail_offset);
      std::memcpy(buf, &data_buff_[tail_offset], first_part * sizeof(T));
      if (to_read > first_part) {
        std::memcpy(buf + first_part, &data_buff_[0],
                    (to_read - first_part) * sizeof(T));
      }
    } else {
      for (size_t i = 0; i < to_read; ++i) {
        buf[i] = std::move(data_buff_[(tail_offset + i) & kMask]);
      }
    }
    tail_.value.store(cur_tail + to_read, std::memory_order_release);
    return to_read;
  }

  // ==== Query API (either side) ====

  size_t Size() const noexcept {
    return head_.value.load(std::memory_order_acquire) -
           tail_.value.load(std::memory_order_acquire);
  }

  bool IsEmpty() const noexcept { return Size() == 0; }
  bool IsFull() const noexcept { return Size() == BufferSize; }
  static constexpr size_t Capacity() noexcept { return BufferSize; }

 private:
  template <typename U>
  bool PushImpl(U&& data) noexcept {
    const size_t cur_head = head_.value.load(std::memory_order_relaxed);
    const size_t cur_tail = tail_.value.load(std::memory_order_acquire);
    if ((cur_head - cur_tail) == BufferSize) {
      return false;
    }
    data_buff_[cur_head & kMask] = std::forward<U>(data);
    head_.value.store(cur_head + 1, std::memory_order_release);
    return true;
  }

  static constexpr size_t kMask = BufferSize - 1U;

  // Cache-line padded indices to avoid false sharing.
  struct alignas(kCacheLineSize) PaddedIndex {
    std::atomic<size_t> value{0};
  };

  PaddedIndex head_;  // Producer writes
  PaddedIndex tail_;  // Consumer writes
  alignas(kCacheLineSize) std::array<T, BufferSize> data_buff_{};
};

}  // namespace offload

#endif  // OFFLOAD_SPSC_RINGBUFFER_HPP_
