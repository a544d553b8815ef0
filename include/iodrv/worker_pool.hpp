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
 * @file iodrv/worker_pool.hpp
 * @brief WorkerPool - fixed worker group draining one shared bounded queue.
 *
 * Architecture:
 *   TrySubmit() -> BoundedQueue<T> (capacity C, non-blocking push)
 *                       | DrainTo(batch_size)   (one lock per drain)
 *                  Worker[0..N-1]
 *                       | n == 1 -> ItemFn(item)
 *                       | n >  1 -> BatchFn(items, n)
 *
 * Features:
 * - No per-worker queues: whichever worker is free takes the next batch
 * - Opportunistic batching of items that arrived close together
 * - Non-blocking admission: full (retry later) vs. closed (stop submitting)
 * - Shutdown discards queued items; in-flight drains complete
 * - ShutdownNow raises an interrupt flag hooks can poll
 * - Handler exceptions of any type are logged and never kill a worker
 * - Thread naming, priority and CPU affinity per WorkerThreadPolicy (Linux)
 *
 * Workers read the owner's LifecycleCell on every iteration:
 *   kInitial / kStarted -> keep draining
 *   kShutdown           -> exit once a drain comes back empty
 *   anything else       -> execute what was already drained, then exit
 *
 * Usage:
 *   iodrv::LifecycleCell state(iodrv::LifecycleState::kStarted);
 *   iodrv::WorkerPoolConfig cfg;
 *   cfg.worker_num = 4U;
 *   cfg.batch_size = 16U;
 *   iodrv::WorkerPool<Job> pool(cfg, state, &RunOne, &RunMany, &ctx);
 *   pool.Start();
 *   pool.TrySubmit(Job{...});
 *   state.Store(iodrv::LifecycleState::kShutdown);
 *   pool.Shutdown();
 *   pool.Await(1000U);
 */

#ifndef IODRV_WORKER_POOL_HPP_
#define IODRV_WORKER_POOL_HPP_

#include "iodrv/bounded_queue.hpp"
#include "iodrv/lifecycle.hpp"
#include "iodrv/log.hpp"
#include "iodrv/platform.hpp"
#include "iodrv/vocabulary.hpp"

#include <cstdint>
#include <cstdio>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

#ifdef __linux__
#include <pthread.h>
#include <sched.h>
#endif

namespace iodrv {

// ============================================================================
// Configuration
// ============================================================================

static constexpr uint32_t kDefaultQueueCapacity = 1000U;

/// Upper bound of a single idle wait inside the drain loop.
static constexpr uint32_t kIdlePollUs = 1000U;

/**
 * @brief How worker threads are named and scheduled.
 *
 * Threads are named "<name_prefix>-<index>" (truncated to the 15 characters
 * Linux allows). priority > 0 selects SCHED_FIFO, < 0 selects SCHED_IDLE.
 */
struct WorkerThreadPolicy {
  FixedString<32> name_prefix{"io"};
  int32_t priority{0};
#ifdef __linux__
  uint32_t cpu_set_size{0U};
  const cpu_set_t* cpu_set{nullptr};
#endif
};

/**
 * @brief WorkerPool configuration.
 */
struct WorkerPoolConfig {
  FixedString<32> name{"pool"};
  uint32_t worker_num{1U};
  uint32_t queue_capacity{kDefaultQueueCapacity};
  uint32_t batch_size{1U};
  WorkerThreadPolicy thread_policy{};
};

// ============================================================================
// WorkerInterrupted
// ============================================================================

/**
 * @brief Thrown by a handler to terminate the worker running it.
 *
 * Unlike any other exception escaping a handler, this one is not
 * swallowed: the worker finishes its bookkeeping and exits.
 */
class WorkerInterrupted : public std::exception {
 public:
  const char* what() const noexcept override { return "worker interrupted"; }
};

// ============================================================================
// WorkerPool
// ============================================================================

/**
 * @brief Fixed-size worker group with drain-and-batch dispatch.
 *
 * @tparam T Work item type (default constructible, movable).
 */
template <typename T>
class WorkerPool final {
 public:
  using ItemFn = void (*)(T& item, void* ctx);
  using BatchFn = void (*)(T* items, uint32_t count, void* ctx);

  WorkerPool(const WorkerPoolConfig& cfg, const LifecycleCell& state, ItemFn item_fn,
             BatchFn batch_fn, void* ctx)
      : name_(cfg.name),
        worker_num_(cfg.worker_num > 0U ? cfg.worker_num : 1U),
        batch_size_(cfg.batch_size > 0U ? cfg.batch_size : 1U),
        policy_(cfg.thread_policy),
        state_(state),
        item_fn_(item_fn),
        batch_fn_(batch_fn),
        ctx_(ctx),
        queue_(cfg.queue_capacity > 0U ? cfg.queue_capacity : kDefaultQueueCapacity) {
    IODRV_ASSERT(item_fn_ != nullptr && batch_fn_ != nullptr);
  }

  ~WorkerPool() {
    if (started_.load(std::memory_order_acquire)) {
      (void)ShutdownNow();
    }
    Join();
  }

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

  // ======================== Lifecycle ========================

  /**
   * @brief Start all worker threads at once.
   * @return false if already started or already shut down.
   */
  bool Start() {
    if (shutdown_.load(std::memory_order_acquire)) {
      return false;
    }
    bool expected = false;
    if (!started_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
      return false;
    }
    {
      std::lock_guard<std::mutex> lk(term_mtx_);
      live_workers_ = worker_num_;
    }
    threads_.reserve(worker_num_);
    for (uint32_t i = 0U; i < worker_num_; ++i) {
      threads_.emplace_back(&WorkerPool::WorkerLoop, this, i);
    }
    return true;
  }

  /**
   * @brief Stop accepting items and discard everything still queued.
   *
   * Items already drained by a worker are still executed.
   * @return Number of discarded items.
   */
  uint32_t Shutdown() {
    shutdown_.store(true, std::memory_order_release);
    const uint32_t dropped = queue_.CloseAndClear();
    {
      std::lock_guard<std::mutex> lk(term_mtx_);
    }
    term_cv_.notify_all();
    return dropped;
  }

  /**
   * @brief Shutdown() plus raise the interrupt flag.
   * @return Number of discarded items.
   */
  uint32_t ShutdownNow() {
    interrupted_.store(true, std::memory_order_release);
    return Shutdown();
  }

  /**
   * @brief Wait until every worker has exited after a shutdown.
   * @param timeout_ms Maximum wait.
   * @return true if terminated within the timeout.
   */
  bool Await(uint32_t timeout_ms) {
    std::unique_lock<std::mutex> lk(term_mtx_);
    return term_cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms), [this] {
      return shutdown_.load(std::memory_order_acquire) && live_workers_ == 0U;
    });
  }

  /// @brief Join all worker threads. Blocks until they exit.
  void Join() {
    for (auto& t : threads_) {
      if (t.joinable()) {
        t.join();
      }
    }
    threads_.clear();
  }

  // ======================== Submit ========================

  /**
   * @brief Enqueue an item without blocking.
   * @return kAccepted, kFull (retry later) or kClosed (stop submitting).
   */
  PushResult TrySubmit(T&& item) {
    const PushResult r = queue_.TryPush(std::move(item));
    if (r == PushResult::kAccepted) {
      scheduled_.fetch_add(1U, std::memory_order_relaxed);
    }
    return r;
  }

  // ======================== Query ========================

  const char* Name() const noexcept { return name_.c_str(); }

  uint32_t ActiveCount() const noexcept { return active_.load(std::memory_order_acquire); }

  uint64_t ScheduledCount() const noexcept { return scheduled_.load(std::memory_order_relaxed); }

  uint64_t CompletedCount() const noexcept { return completed_.load(std::memory_order_acquire); }

  uint32_t QueueSize() const { return queue_.Size(); }

  uint32_t QueueCapacity() const noexcept { return queue_.Capacity(); }

  uint32_t WorkerCount() const noexcept { return worker_num_; }

  uint32_t BatchSize() const noexcept { return batch_size_; }

  bool IsStarted() const noexcept { return started_.load(std::memory_order_acquire); }

  bool IsShutdown() const noexcept { return shutdown_.load(std::memory_order_acquire); }

  bool IsInterrupted() const noexcept { return interrupted_.load(std::memory_order_acquire); }

  /// Workers started and not yet exited.
  uint32_t LiveCount() const {
    std::lock_guard<std::mutex> lk(term_mtx_);
    return live_workers_;
  }

  bool IsTerminated() const {
    std::lock_guard<std::mutex> lk(term_mtx_);
    return shutdown_.load(std::memory_order_acquire) && live_workers_ == 0U;
  }

 private:
  // ======================== Worker thread ========================

  void WorkerLoop(uint32_t worker_id) {
    char thread_name[48];
    (void)std::snprintf(thread_name, sizeof(thread_name), "%s-%u", policy_.name_prefix.c_str(),
                        worker_id);
    ApplyThreadPolicy(thread_name);
    IODRV_LOG_DEBUG("Pool", "%s: started", thread_name);

    std::vector<T> items(batch_size_);
    while (true) {
      const LifecycleState state = state_.Load();
      const uint32_t n = queue_.DrainTo(items.data(), batch_size_, kIdlePollUs);
      bool exit_after = false;
      if (state == LifecycleState::kShutdown || shutdown_.load(std::memory_order_acquire)) {
        if (n == 0U) {
          IODRV_LOG_DEBUG("Pool", "%s: the state is shutdown and nothing to do more, exit",
                          thread_name);
          break;
        }
      }
      if (!IsDraining(state)) {
        IODRV_LOG_DEBUG("Pool", "%s: the state is %s, exit", thread_name,
                        LifecycleStateName(state));
        exit_after = true;
      }
      if (n > 0U && !Dispatch(items.data(), n, thread_name)) {
        exit_after = true;
      }
      if (exit_after) {
        break;
      }
    }

    {
      std::lock_guard<std::mutex> lk(term_mtx_);
      --live_workers_;
    }
    term_cv_.notify_all();
    IODRV_LOG_DEBUG("Pool", "%s: finished", thread_name);
  }

  /**
   * @brief Run the drained slice through the handlers.
   * @return false if the worker must terminate.
   */
  bool Dispatch(T* items, uint32_t n, const char* thread_name) {
    active_.fetch_add(1U, std::memory_order_acq_rel);
    bool keep_running = true;
    try {
      if (n == 1U) {
        item_fn_(items[0], ctx_);
      } else {
        batch_fn_(items, n, ctx_);
      }
    } catch (const WorkerInterrupted&) {
      IODRV_LOG_DEBUG("Pool", "%s: interrupted", thread_name);
      keep_running = false;
    } catch (const std::exception& e) {
      IODRV_LOG_WARN("Pool", "%s: unexpected worker failure: %s", thread_name, e.what());
    } catch (...) {
      IODRV_LOG_WARN("Pool", "%s: unexpected worker failure of unknown type", thread_name);
    }
    for (uint32_t i = 0U; i < n; ++i) {
      items[i] = T();
    }
    completed_.fetch_add(n, std::memory_order_acq_rel);
    active_.fetch_sub(1U, std::memory_order_acq_rel);
    return keep_running;
  }

  // ======================== Platform helpers ========================

  void ApplyThreadPolicy(const char* thread_name) const noexcept {
#ifdef __linux__
    char short_name[16];
    (void)std::snprintf(short_name, sizeof(short_name), "%s", thread_name);
    (void)pthread_setname_np(pthread_self(), short_name);
    if (policy_.cpu_set != nullptr && policy_.cpu_set_size > 0U) {
      (void)pthread_setaffinity_np(pthread_self(), policy_.cpu_set_size, policy_.cpu_set);
    }
    if (policy_.priority > 0) {
      struct sched_param param{};
      param.sched_priority = (policy_.priority > 99) ? 99 : policy_.priority;
      (void)pthread_setschedparam(pthread_self(), SCHED_FIFO, &param);
    } else if (policy_.priority < 0) {
      struct sched_param param{};
      param.sched_priority = 0;
      (void)pthread_setschedparam(pthread_self(), SCHED_IDLE, &param);
    }
#else
    (void)thread_name;
#endif
  }

  // ======================== Data members ========================

  FixedString<32> name_;
  const uint32_t worker_num_;
  const uint32_t batch_size_;
  const WorkerThreadPolicy policy_;
  const LifecycleCell& state_;
  const ItemFn item_fn_;
  const BatchFn batch_fn_;
  void* const ctx_;

  BoundedQueue<T> queue_;

  std::atomic<bool> started_{false};
  std::atomic<bool> shutdown_{false};
  std::atomic<bool> interrupted_{false};

  alignas(kCacheLineSize) std::atomic<uint32_t> active_{0U};
  alignas(kCacheLineSize) std::atomic<uint64_t> scheduled_{0U};
  alignas(kCacheLineSize) std::atomic<uint64_t> completed_{0U};

  mutable std::mutex term_mtx_;
  std::condition_variable term_cv_;
  uint32_t live_workers_{0U};

  std::vector<std::thread> threads_;
};

}  // namespace iodrv

#endif  // IODRV_WORKER_POOL_HPP_
