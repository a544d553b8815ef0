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
 * @file iodrv/storage_driver.hpp
 * @brief StorageDriver - preemptive batching dispatcher for storage operations.
 *
 * Architecture:
 *   Submit(op)            -> Prepare -> WorkItem{single | prepare-failed} --+
 *   Submit(ops, from, to) -> IsBatch ? WorkItem{owned batch copy}          --+--> WorkerPool
 *                                    : one WorkItem per op                  --+       |
 *                                                                                     v
 *                                  drained slice -> singles coalesced -> Execute / ExecuteBatch
 *
 * The protocol-specific parts (prepare, batch eligibility, execution,
 * thread naming) come from a DriverHooks<Op> implementation passed in at
 * construction; the driver owns queueing, batching, lifecycle and counters.
 *
 * Result contract of Submit():
 *   value true / full count  -> accepted
 *   value false / short count -> queue full, retry the rest later
 *   error kClosed            -> driver is not accepting, stop submitting
 *
 * Usage:
 *   class S3Hooks : public iodrv::DriverHooks<iodrv::Operation> { ... };
 *
 *   S3Hooks hooks;
 *   iodrv::StorageDriver<> driver(cfg, hooks);
 *   driver.Start();
 *   auto r = driver.Submit(&op);
 *   ...
 *   driver.Shutdown();
 *   driver.Stop();
 *   driver.Close();
 */

#ifndef IODRV_STORAGE_DRIVER_HPP_
#define IODRV_STORAGE_DRIVER_HPP_

#include "iodrv/config.hpp"
#include "iodrv/lifecycle.hpp"
#include "iodrv/log.hpp"
#include "iodrv/operation.hpp"
#include "iodrv/platform.hpp"
#include "iodrv/vocabulary.hpp"
#include "iodrv/worker_pool.hpp"

#include <cstdint>
#include <cstdio>

#include <exception>
#include <utility>
#include <vector>

namespace iodrv {

// ============================================================================
// DriverError
// ============================================================================

enum class DriverError : uint8_t {
  kClosed = 0,      ///< Not accepting submissions (not started or shut down).
  kInvalidState,    ///< Lifecycle transition not allowed from current state.
  kInvalidRange,    ///< Submission range out of bounds.
  kInterrupted      ///< Workers had to be interrupted to stop.
};

inline const char* DriverErrorName(DriverError err) noexcept {
  switch (err) {
    case DriverError::kClosed:       return "closed";
    case DriverError::kInvalidState: return "invalid state";
    case DriverError::kInvalidRange: return "invalid range";
    case DriverError::kInterrupted:  return "interrupted";
  }
  return "unknown";
}

/// Bounded wait used by Stop() before forcing interruption.
static constexpr uint32_t kStopTimeoutMs = 1000U;

// ============================================================================
// DriverHooks
// ============================================================================

/**
 * @brief Protocol-specific collaborator of a StorageDriver.
 *
 * Execute/ExecuteBatch run on worker threads and must set a terminal
 * status on every operation they receive. Expected failures are reported
 * through the status; an exception escaping them is logged and the worker
 * carries on. Throwing WorkerInterrupted terminates the calling worker.
 */
template <typename OpT>
class DriverHooks {
 public:
  virtual ~DriverHooks() = default;

  /// Validate and prime an operation. false: do not execute, mark it failed.
  virtual bool Prepare(OpT& op) = 0;

  /// Whether ops[0..count) submitted together should run as one batch.
  virtual bool IsBatch(OpT* const* ops, uint32_t count) = 0;

  virtual void Execute(OpT& op) = 0;

  virtual void ExecuteBatch(OpT* const* ops, uint32_t count) = 0;

  /// Worker thread naming and scheduling. Default: "<driver>-io-<n>".
  virtual WorkerThreadPolicy ThreadPolicy(const char* driver_name) const {
    WorkerThreadPolicy policy;
    char prefix[40];
    (void)std::snprintf(prefix, sizeof(prefix), "%s-io", driver_name);
    policy.name_prefix.assign(TruncateToCapacity, prefix);
    return policy;
  }
};

// ============================================================================
// StorageDriver
// ============================================================================

/**
 * @brief Bounded, batching worker pool front-end for storage operations.
 *
 * @tparam OpT Operation type; must provide `void SetStatus(OpStatus)`.
 *             The producer keeps ownership of every OpT.
 */
template <typename OpT = Operation>
class StorageDriver final {
 public:
  /**
   * @param cfg   Capacity parameters. Overflow risks are logged, not rejected.
   * @param hooks Protocol collaborator; must outlive the driver.
   */
  StorageDriver(const DriverConfig& cfg, DriverHooks<OpT>& hooks)
      : cfg_(cfg),
        hooks_(hooks),
        pool_(MakePoolConfig(cfg, hooks), state_, &RunOne, &RunSlice, this) {
    const uint64_t max_op_count =
        static_cast<uint64_t>(cfg_.input_queue_capacity) * static_cast<uint64_t>(cfg_.batch_size);
    if (max_op_count > cfg_.output_queue_capacity) {
      IODRV_LOG_WARN("Driver",
                     "%s: the product of the batch size and input queue size (%llu) is greater "
                     "than the output queue size (%u) which may cause the load operation results "
                     "handling failures, please consider tuning",
                     Name(), static_cast<unsigned long long>(max_op_count),
                     cfg_.output_queue_capacity);
    }
    if (max_op_count > kBatchModeInputOpCountLimit) {
      IODRV_LOG_WARN("Driver",
                     "%s: the product of the batch size and input queue size is %llu which may "
                     "cause out of memory, please consider tuning",
                     Name(), static_cast<unsigned long long>(max_op_count));
    }
  }

  ~StorageDriver() {
    if (state_.Load() != LifecycleState::kClosed) {
      auto r = Close();
      if (!r.has_value()) {
        IODRV_LOG_WARN("Driver", "%s: close on destruction failed: %s", Name(),
                       DriverErrorName(r.get_error()));
      }
    }
  }

  StorageDriver(const StorageDriver&) = delete;
  StorageDriver& operator=(const StorageDriver&) = delete;
  StorageDriver(StorageDriver&&) = delete;
  StorageDriver& operator=(StorageDriver&&) = delete;

  // ======================== Lifecycle ========================

  /// @brief kInitial -> kStarted; starts every worker.
  expected<void, DriverError> Start() {
    if (state_.Load() != LifecycleState::kInitial || !pool_.Start()) {
      return expected<void, DriverError>::error(DriverError::kInvalidState);
    }
    if (!state_.CompareAndSet(LifecycleState::kInitial, LifecycleState::kStarted)) {
      return expected<void, DriverError>::error(DriverError::kInvalidState);
    }
    IODRV_LOG_DEBUG("Driver", "%s: started", Name());
    return expected<void, DriverError>::success();
  }

  /**
   * @brief Stop accepting submissions and drop every queued operation.
   *
   * Dropped operations are never executed and their status is untouched.
   * Operations already drained by a worker still run to completion.
   */
  expected<void, DriverError> Shutdown() {
    const LifecycleState s = state_.Load();
    if (s == LifecycleState::kShutdown) {
      return expected<void, DriverError>::success();
    }
    if ((s != LifecycleState::kStarted && s != LifecycleState::kInitial) ||
        !state_.CompareAndSet(s, LifecycleState::kShutdown)) {
      return (state_.Load() == LifecycleState::kShutdown)
                 ? expected<void, DriverError>::success()
                 : expected<void, DriverError>::error(DriverError::kInvalidState);
    }
    const uint32_t dropped = pool_.Shutdown();
    IODRV_LOG_DEBUG("Driver", "%s: shut down, %u queued work items dropped", Name(), dropped);
    return expected<void, DriverError>::success();
  }

  /**
   * @brief Shut down (if needed) and wait for the workers to finish.
   *
   * If they do not finish within @p timeout_ms, every worker is interrupted
   * and kInterrupted is returned. Either way the state ends as kStopped.
   */
  expected<void, DriverError> Stop(uint32_t timeout_ms = kStopTimeoutMs) {
    const LifecycleState s = state_.Load();
    if (s == LifecycleState::kStopped) {
      return expected<void, DriverError>::success();
    }
    if (s == LifecycleState::kClosed) {
      return expected<void, DriverError>::error(DriverError::kInvalidState);
    }
    if (s != LifecycleState::kShutdown) {
      auto r = Shutdown();
      if (!r.has_value()) {
        return r;
      }
    }

    IODRV_LOG_DEBUG("Driver", "%s: interrupting...", Name());
    const uint64_t begin_us = SteadyNowUs();
    const bool finished = pool_.Await(timeout_ms);
    state_.Store(LifecycleState::kStopped);
    if (finished) {
      IODRV_LOG_DEBUG("Driver", "%s: interrupting finished in %llu ms", Name(),
                      static_cast<unsigned long long>((SteadyNowUs() - begin_us) / 1000U));
      IODRV_LOG_DEBUG("Driver", "%s: interrupted", Name());
      return expected<void, DriverError>::success();
    }
    IODRV_LOG_WARN("Driver", "%s: interrupting did not finish in %u ms, forcing", Name(),
                   timeout_ms);
    (void)pool_.ShutdownNow();
    IODRV_LOG_DEBUG("Driver", "%s: interrupted", Name());
    return expected<void, DriverError>::error(DriverError::kInterrupted);
  }

  /**
   * @brief Wait until every worker has exited.
   * @return true if that happened within @p timeout_ms. Never true before
   *         Shutdown().
   */
  bool Await(uint32_t timeout_ms) { return pool_.Await(timeout_ms); }

  /**
   * @brief Stop (if needed), join every worker thread and enter kClosed.
   *
   * A forced stop is logged and does not fail the close.
   */
  expected<void, DriverError> Close() {
    const LifecycleState s = state_.Load();
    if (s == LifecycleState::kClosed) {
      return expected<void, DriverError>::success();
    }
    if (s != LifecycleState::kStopped) {
      auto r = Stop();
      if (!r.has_value()) {
        IODRV_LOG_WARN("Driver", "%s: stop before close: %s", Name(),
                       DriverErrorName(r.get_error()));
      }
    }
    pool_.Join();
    state_.Store(LifecycleState::kClosed);
    IODRV_LOG_DEBUG("Driver", "%s: closed", Name());
    return expected<void, DriverError>::success();
  }

  // ======================== Submit API ========================

  /**
   * @brief Submit one operation.
   *
   * An operation rejected by Prepare() is still accepted: when its turn
   * comes its status is set to kFailUnknown instead of executing it.
   *
   * @return true if queued, false if the queue is full; kClosed if the
   *         driver is not accepting submissions.
   */
  expected<bool, DriverError> Submit(OpT* op) {
    IODRV_ASSERT(op != nullptr);
    if (!IsAccepting()) {
      return expected<bool, DriverError>::error(DriverError::kClosed);
    }
    switch (pool_.TrySubmit(Wrap(*op))) {
      case PushResult::kAccepted:
        return expected<bool, DriverError>::success(true);
      case PushResult::kFull:
        if (IsAccepting()) {
          return expected<bool, DriverError>::success(false);
        }
        break;
      case PushResult::kClosed:
        break;
    }
    return expected<bool, DriverError>::error(DriverError::kClosed);
  }

  /**
   * @brief Submit ops[from..to).
   *
   * If IsBatch() accepts the range it is copied and queued as one batch,
   * so the caller may reuse its buffer as soon as this returns. Otherwise
   * every op is queued on its own until the first rejection.
   *
   * @return Number of accepted operations, counted from @p from. The
   *         terminal-state check (kClosed) is done once, before any work.
   */
  expected<uint32_t, DriverError> Submit(OpT* const* ops, uint32_t from, uint32_t to) {
    if (!IsAccepting()) {
      return expected<uint32_t, DriverError>::error(DriverError::kClosed);
    }
    if (from > to || (ops == nullptr && from != to)) {
      return expected<uint32_t, DriverError>::error(DriverError::kInvalidRange);
    }
    if (from == to) {
      return expected<uint32_t, DriverError>::success(0U);
    }

    const uint32_t count = to - from;
    if (hooks_.IsBatch(ops + from, count)) {
      const PushResult r = pool_.TrySubmit(WrapBatch(ops + from, count));
      return expected<uint32_t, DriverError>::success(r == PushResult::kAccepted ? count : 0U);
    }

    uint32_t i = from;
    while (i < to && pool_.TrySubmit(Wrap(*ops[i])) == PushResult::kAccepted) {
      ++i;
    }
    return expected<uint32_t, DriverError>::success(i - from);
  }

  expected<uint32_t, DriverError> Submit(const std::vector<OpT*>& ops, uint32_t from, uint32_t to) {
    if (to > ops.size()) {
      return expected<uint32_t, DriverError>::error(DriverError::kInvalidRange);
    }
    return Submit(ops.data(), from, to);
  }

  expected<uint32_t, DriverError> Submit(const std::vector<OpT*>& ops) {
    if (ops.size() > UINT32_MAX) {
      return expected<uint32_t, DriverError>::error(DriverError::kInvalidRange);
    }
    return Submit(ops.data(), 0U, static_cast<uint32_t>(ops.size()));
  }

  // ======================== Query ========================

  /// Workers currently executing a drained slice.
  uint32_t ActiveOpCount() const noexcept { return pool_.ActiveCount(); }

  /// Work items accepted since construction.
  uint64_t ScheduledOpCount() const noexcept { return pool_.ScheduledCount(); }

  /// Work items finished (executed or failed) since construction.
  uint64_t CompletedOpCount() const noexcept { return pool_.CompletedCount(); }

  /// Work items waiting in the queue.
  uint32_t QueuedOpCount() const { return pool_.QueueSize(); }

  /// No worker is executing; queued items are not considered.
  bool IsIdle() const noexcept { return pool_.ActiveCount() == 0U; }

  bool IsStarted() const noexcept { return state_.Load() == LifecycleState::kStarted; }

  /// Set once Stop() had to force the workers; long-running hooks should bail out.
  bool IsInterrupted() const noexcept { return pool_.IsInterrupted(); }

  LifecycleState State() const noexcept { return state_.Load(); }

  const char* Name() const noexcept { return cfg_.name.c_str(); }

  const DriverConfig& Config() const noexcept { return cfg_; }

 private:
  // ======================== Work items ========================

  struct WorkItem {
    enum class Kind : uint8_t { kNone = 0, kSingle, kPrepareFailed, kBatch };

    Kind kind{Kind::kNone};
    OpT* op{nullptr};
    std::vector<OpT*> batch;   ///< Owned copy of a submitted range.
    std::vector<OpT*> failed;  ///< Range members rejected by Prepare().
  };

  WorkItem Wrap(OpT& op) {
    WorkItem item;
    item.kind = hooks_.Prepare(op) ? WorkItem::Kind::kSingle : WorkItem::Kind::kPrepareFailed;
    item.op = &op;
    return item;
  }

  WorkItem WrapBatch(OpT* const* ops, uint32_t count) {
    WorkItem item;
    item.kind = WorkItem::Kind::kBatch;
    item.batch.reserve(count);
    for (uint32_t i = 0U; i < count; ++i) {
      if (hooks_.Prepare(*ops[i])) {
        item.batch.push_back(ops[i]);
      } else {
        item.failed.push_back(ops[i]);
      }
    }
    return item;
  }

  void Run(WorkItem& item) {
    switch (item.kind) {
      case WorkItem::Kind::kSingle:
        hooks_.Execute(*item.op);
        break;
      case WorkItem::Kind::kPrepareFailed:
        item.op->SetStatus(OpStatus::kFailUnknown);
        break;
      case WorkItem::Kind::kBatch:
        for (OpT* op : item.failed) {
          op->SetStatus(OpStatus::kFailUnknown);
        }
        if (!item.batch.empty()) {
          hooks_.ExecuteBatch(item.batch.data(), static_cast<uint32_t>(item.batch.size()));
        }
        break;
      case WorkItem::Kind::kNone:
        break;
    }
  }

  // ======================== Pool callbacks ========================

  static void RunOne(WorkItem& item, void* ctx) { static_cast<StorageDriver*>(ctx)->Run(item); }

  /**
   * Single-op items drained together are coalesced into one batch, in queue
   * order. Every work item keeps its own failure boundary: a throwing hook
   * never skips the rest of the slice. WorkerInterrupted is re-raised once
   * the whole slice has run.
   */
  static void RunSlice(WorkItem* items, uint32_t count, void* ctx) {
    auto* self = static_cast<StorageDriver*>(ctx);
    std::vector<OpT*> singles;
    singles.reserve(count);
    bool interrupted = false;
    for (uint32_t i = 0U; i < count; ++i) {
      if (items[i].kind == WorkItem::Kind::kSingle) {
        singles.push_back(items[i].op);
      } else if (!self->RunGuarded([self, &items, i] { self->Run(items[i]); })) {
        interrupted = true;
      }
    }
    if (singles.size() == 1U) {
      interrupted |= !self->RunGuarded([self, &singles] { self->hooks_.Execute(*singles[0]); });
    } else if (singles.size() > 1U) {
      interrupted |= !self->RunGuarded([self, &singles] {
        self->hooks_.ExecuteBatch(singles.data(), static_cast<uint32_t>(singles.size()));
      });
    }
    if (interrupted) {
      throw WorkerInterrupted();
    }
  }

  /// @return false if @p fn raised WorkerInterrupted.
  template <typename Fn>
  bool RunGuarded(Fn&& fn) {
    try {
      fn();
    } catch (const WorkerInterrupted&) {
      return false;
    } catch (const std::exception& e) {
      IODRV_LOG_WARN("Driver", "%s: operation hook failed: %s", Name(), e.what());
    } catch (...) {
      IODRV_LOG_WARN("Driver", "%s: operation hook failed with a non-standard exception", Name());
    }
    return true;
  }

  static WorkerPoolConfig MakePoolConfig(const DriverConfig& cfg, const DriverHooks<OpT>& hooks) {
    WorkerPoolConfig pc;
    pc.name = cfg.name;
    pc.worker_num = cfg.worker_count;
    pc.queue_capacity = cfg.input_queue_capacity;
    pc.batch_size = cfg.batch_size;
    pc.thread_policy = hooks.ThreadPolicy(cfg.name.c_str());
    return pc;
  }

  /// Not accepting once every worker has been interrupted away.
  bool IsAccepting() const {
    return state_.Load() == LifecycleState::kStarted && !pool_.IsShutdown() &&
           pool_.LiveCount() > 0U;
  }

  // ======================== Data members ========================

  const DriverConfig cfg_;
  DriverHooks<OpT>& hooks_;
  LifecycleCell state_;
  WorkerPool<WorkItem> pool_;
};

}  // namespace iodrv

#endif  // IODRV_STORAGE_DRIVER_HPP_
