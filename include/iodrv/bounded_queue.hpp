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
 * @file iodrv/bounded_queue.hpp
 * @brief Fixed-capacity multi-producer multi-consumer work queue.
 *
 * Producers never block: TryPush() either stores the item or reports why
 * it could not (full vs. closed). Consumers remove up to N items in one
 * critical section with DrainTo(), optionally waiting a bounded time for
 * the first item to arrive.
 *
 *   Producer 0 --TryPush()--+
 *   Producer 1 --TryPush()--+--> [ ring buffer, capacity C ] --DrainTo(N)--> Worker[0..W-1]
 *   Producer P --TryPush()--+
 *
 * Items are moved in and out, so T may own heap memory (e.g. a vector).
 */

#ifndef IODRV_BOUNDED_QUEUE_HPP_
#define IODRV_BOUNDED_QUEUE_HPP_

#include "iodrv/platform.hpp"

#include <cstdint>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <utility>
#include <vector>

namespace iodrv {

enum class PushResult : uint8_t {
  kAccepted = 0,
  kFull,
  kClosed
};

/**
 * @brief Bounded blocking queue with atomic batch drain.
 *
 * Capacity is exact (not rounded): Size() never exceeds Capacity().
 *
 * @tparam T Element type (must be default constructible and movable)
 */
template <typename T>
class BoundedQueue final {
 public:
  explicit BoundedQueue(uint32_t capacity)
      : capacity_(capacity > 0U ? capacity : 1U), buffer_(capacity_) {}

  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;
  BoundedQueue(BoundedQueue&&) = delete;
  BoundedQueue& operator=(BoundedQueue&&) = delete;

  /**
   * @brief Enqueue without blocking.
   * @return kAccepted, kFull when Size() == Capacity(), kClosed after Close().
   *         The item is left untouched unless accepted.
   */
  PushResult TryPush(T&& item) {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      if (closed_) {
        return PushResult::kClosed;
      }
      if (count_ >= capacity_) {
        return PushResult::kFull;
      }
      buffer_[(head_ + count_) % capacity_] = std::move(item);
      ++count_;
    }
    not_empty_.notify_one();
    return PushResult::kAccepted;
  }

  /**
   * @brief Move up to @p max items into @p out, oldest first.
   *
   * If the queue is empty, waits up to @p timeout_us for an item (0 = no
   * wait). Returns immediately with 0 when the queue is closed and empty.
   * The whole transfer happens under one lock, so concurrent drains never
   * see the same item.
   *
   * @return Number of items written to out[0..n).
   */
  uint32_t DrainTo(T* out, uint32_t max, uint32_t timeout_us) {
    IODRV_ASSERT(out != nullptr);
    if (max == 0U) {
      return 0U;
    }
    std::unique_lock<std::mutex> lk(mtx_);
    if (count_ == 0U && !closed_ && timeout_us > 0U) {
      not_empty_.wait_for(lk, std::chrono::microseconds(timeout_us),
                          [this] { return count_ > 0U || closed_; });
    }
    const uint32_t n = (count_ < max) ? count_ : max;
    for (uint32_t i = 0U; i < n; ++i) {
      out[i] = std::move(buffer_[head_]);
      buffer_[head_] = T();
      head_ = (head_ + 1U) % capacity_;
    }
    count_ -= n;
    return n;
  }

  /**
   * @brief Discard every queued item.
   * @return Number of items discarded.
   */
  uint32_t Clear() {
    std::lock_guard<std::mutex> lk(mtx_);
    const uint32_t n = count_;
    for (uint32_t i = 0U; i < n; ++i) {
      buffer_[(head_ + i) % capacity_] = T();
    }
    head_ = 0U;
    count_ = 0U;
    return n;
  }

  /**
   * @brief Reject all further pushes and wake every waiting consumer.
   *
   * Items already queued stay drainable until Clear().
   */
  void Close() {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      closed_ = true;
    }
    not_empty_.notify_all();
  }

  /**
   * @brief Close() and Clear() in one critical section.
   *
   * No consumer can drain an item between the two steps.
   * @return Number of items discarded.
   */
  uint32_t CloseAndClear() {
    uint32_t n = 0U;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      closed_ = true;
      n = count_;
      for (uint32_t i = 0U; i < n; ++i) {
        buffer_[(head_ + i) % capacity_] = T();
      }
      head_ = 0U;
      count_ = 0U;
    }
    not_empty_.notify_all();
    return n;
  }

  bool IsClosed() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return closed_;
  }

  uint32_t Size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return count_;
  }

  uint32_t Capacity() const noexcept { return capacity_; }

 private:
  const uint32_t capacity_;
  mutable std::mutex mtx_;
  std::condition_variable not_empty_;
  std::vector<T> buffer_;
  uint32_t head_{0U};
  uint32_t count_{0U};
  bool closed_{false};
};

}  // namespace iodrv

#endif  // IODRV_BOUNDED_QUEUE_HPP_
