// Copyright (c) 2024 liudegui. MIT License.
//
// mock_driver_demo.cpp -- StorageDriver end-to-end demo with an in-memory backend.
//
// Demonstrates:
//   1. Driver configuration from settings + "--section-key=value" overrides
//   2. Single submissions with backpressure retry
//   3. Range submissions executed as one batch
//   4. Shutdown / Stop / Close and the driver counters
//
// Usage:
//   mock_driver_demo [--storage-driver-threads=4] [--load-batch-size=32]
//                    [--storage-driver-limit-queue-input=64] [--load-op-count=10000]

#include "iodrv/config.hpp"
#include "iodrv/log.hpp"
#include "iodrv/storage_driver.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <deque>
#include <thread>
#include <vector>

// ============================================================================
// In-memory storage hooks
// ============================================================================

class MockHooks : public iodrv::DriverHooks<iodrv::Operation> {
 public:
  explicit MockHooks(uint32_t latency_us) : latency_us_(latency_us) {}

  bool Prepare(iodrv::Operation& op) override {
    if (op.ItemName().empty()) {
      return false;
    }
    op.StartRequest();
    return true;
  }

  // Creates of small objects are grouped; everything else goes one by one.
  bool IsBatch(iodrv::Operation* const* ops, uint32_t count) override {
    for (uint32_t i = 0U; i < count; ++i) {
      if (ops[i]->Type() != iodrv::OpType::kCreate) return false;
    }
    return count > 1U;
  }

  void Execute(iodrv::Operation& op) override {
    std::this_thread::sleep_for(std::chrono::microseconds(latency_us_));
    Finish(op);
    singles_.fetch_add(1U, std::memory_order_relaxed);
  }

  void ExecuteBatch(iodrv::Operation* const* ops, uint32_t count) override {
    std::this_thread::sleep_for(std::chrono::microseconds(latency_us_));
    for (uint32_t i = 0U; i < count; ++i) {
      Finish(*ops[i]);
    }
    batches_.fetch_add(1U, std::memory_order_relaxed);
    batched_ops_.fetch_add(count, std::memory_order_relaxed);
  }

  uint64_t Singles() const { return singles_.load(); }
  uint64_t Batches() const { return batches_.load(); }
  uint64_t BatchedOps() const { return batched_ops_.load(); }
  uint64_t Finished() const { return finished_.load(); }

 private:
  void Finish(iodrv::Operation& op) {
    op.FinishRequest(op.Type() == iodrv::OpType::kDelete ? iodrv::OpStatus::kRespFailNotFound
                                                         : iodrv::OpStatus::kSuccess);
    finished_.fetch_add(1U, std::memory_order_relaxed);
  }

  const uint32_t latency_us_;
  std::atomic<uint64_t> singles_{0U};
  std::atomic<uint64_t> batches_{0U};
  std::atomic<uint64_t> batched_ops_{0U};
  std::atomic<uint64_t> finished_{0U};
};

// ============================================================================
// Helpers
// ============================================================================

using Clock = std::chrono::steady_clock;

static uint64_t ElapsedMs(Clock::time_point t0) {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - t0).count());
}

/// Submit one op, spinning on backpressure. Returns false once the driver is closed.
static bool SubmitWithRetry(iodrv::StorageDriver<>& driver, iodrv::Operation* op,
                            uint64_t* retries) {
  while (true) {
    auto r = driver.Submit(op);
    if (!r.has_value()) return false;
    if (r.value()) return true;
    ++*retries;
    std::this_thread::yield();
  }
}

// ============================================================================
// main
// ============================================================================

int main(int argc, char* argv[]) {
  iodrv::log::SetLevel(iodrv::log::Level::kInfo);

  iodrv::SettingsStore settings;
  (void)settings.Set("storage", "driver-name", "mock");
  (void)settings.Set("storage", "driver-threads", "4");
  (void)settings.Set("storage", "driver-limit-queue-input", "64");
  (void)settings.Set("load", "batch-size", "32");
  auto applied = settings.ApplyArgs(argc, argv);
  if (!applied.has_value()) {
    IODRV_LOG_ERROR("Demo", "bad arguments: %s", iodrv::ConfigErrorName(applied.get_error()));
    return 1;
  }

  auto cfg = iodrv::LoadDriverConfig(settings);
  if (!cfg.has_value()) {
    IODRV_LOG_ERROR("Demo", "bad configuration: %s", iodrv::ConfigErrorName(cfg.get_error()));
    return 1;
  }
  const uint32_t op_count = static_cast<uint32_t>(settings.GetInt("load", "op-count", 10000));

  printf("=== mock storage driver ===\n");
  printf("  threads=%u queue=%u batch=%u ops=%u\n", cfg.value().worker_count,
         cfg.value().input_queue_capacity, cfg.value().batch_size, op_count);

  MockHooks hooks(50U);
  iodrv::StorageDriver<> driver(cfg.value(), hooks);
  auto started = driver.Start();
  if (!started.has_value()) {
    IODRV_LOG_ERROR("Demo", "start failed: %s", iodrv::DriverErrorName(started.get_error()));
    return 1;
  }

  // Phase 1: mixed single submissions.
  std::deque<iodrv::Operation> singles;
  for (uint32_t i = 0U; i < op_count; ++i) {
    const auto type = (i % 10U == 9U) ? iodrv::OpType::kDelete : iodrv::OpType::kRead;
    singles.emplace_back(i, type, "object");
  }
  uint64_t retries = 0U;
  auto t0 = Clock::now();
  for (auto& op : singles) {
    if (!SubmitWithRetry(driver, &op, &retries)) break;
  }
  while (hooks.Finished() < singles.size() && ElapsedMs(t0) < 10000U) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  printf("  singles : %zu ops in %lu ms, %lu backpressure retries\n", singles.size(),
         static_cast<unsigned long>(ElapsedMs(t0)), static_cast<unsigned long>(retries));

  // Phase 2: ranges of creates, each executed as one batch.
  std::deque<iodrv::Operation> creates;
  for (uint32_t i = 0U; i < op_count; ++i) {
    creates.emplace_back(op_count + i, iodrv::OpType::kCreate, "new-object");
  }
  std::vector<iodrv::Operation*> range;
  const uint32_t step = cfg.value().batch_size;
  t0 = Clock::now();
  for (uint32_t from = 0U; from < op_count;) {
    const uint32_t to = (from + step < op_count) ? from + step : op_count;
    range.clear();
    for (uint32_t i = from; i < to; ++i) range.push_back(&creates[i]);
    auto r = driver.Submit(range);
    if (!r.has_value()) break;
    if (r.value() == 0U) {
      std::this_thread::yield();
      continue;
    }
    from = to;
  }
  while (hooks.Finished() < singles.size() + creates.size() && ElapsedMs(t0) < 10000U) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  printf("  batches : %lu batches carrying %lu ops in %lu ms\n",
         static_cast<unsigned long>(hooks.Batches()), static_cast<unsigned long>(hooks.BatchedOps()),
         static_cast<unsigned long>(ElapsedMs(t0)));

  // Phase 3: lifecycle.
  auto stopped = driver.Stop();
  if (!stopped.has_value()) {
    IODRV_LOG_WARN("Demo", "stop: %s", iodrv::DriverErrorName(stopped.get_error()));
  }
  auto late = driver.Submit(&singles[0]);
  printf("  after stop: submit -> %s\n",
         late.has_value() ? "accepted?" : iodrv::DriverErrorName(late.get_error()));
  printf("  counters: scheduled=%lu completed=%lu active=%u idle=%s\n",
         static_cast<unsigned long>(driver.ScheduledOpCount()),
         static_cast<unsigned long>(driver.CompletedOpCount()), driver.ActiveOpCount(),
         driver.IsIdle() ? "yes" : "no");
  printf("  singles executed one by one: %lu\n", static_cast<unsigned long>(hooks.Singles()));

  auto closed = driver.Close();
  if (!closed.has_value()) {
    IODRV_LOG_WARN("Demo", "close: %s", iodrv::DriverErrorName(closed.get_error()));
  }
  printf("  state: %s\n", iodrv::LifecycleStateName(driver.State()));
  return 0;
}
