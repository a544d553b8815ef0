/**
 * @file lifecycle.hpp
 * @brief Driver lifecycle states and the shared state cell.
 *
 *   kInitial --Start()--> kStarted --Shutdown()--> kShutdown --Stop()--> kStopped
 *       |                                                                  |
 *       +----------------------------- Close() ----------------------------+--> kClosed
 *
 * Only kStarted accepts submissions. Workers keep draining in kInitial,
 * kStarted and kShutdown; any later state makes them exit.
 */

#ifndef IODRV_LIFECYCLE_HPP_
#define IODRV_LIFECYCLE_HPP_

#include <cstdint>

#include <atomic>

namespace iodrv {

enum class LifecycleState : uint8_t {
  kInitial = 0,
  kStarted,
  kShutdown,
  kStopped,
  kClosed
};

inline const char* LifecycleStateName(LifecycleState state) noexcept {
  switch (state) {
    case LifecycleState::kInitial:  return "INITIAL";
    case LifecycleState::kStarted:  return "STARTED";
    case LifecycleState::kShutdown: return "SHUTDOWN";
    case LifecycleState::kStopped:  return "STOPPED";
    case LifecycleState::kClosed:   return "CLOSED";
  }
  return "UNKNOWN";
}

/// @brief States in which a worker keeps looping.
inline bool IsDraining(LifecycleState state) noexcept {
  return state == LifecycleState::kInitial || state == LifecycleState::kStarted ||
         state == LifecycleState::kShutdown;
}

/**
 * @brief Single shared lifecycle variable.
 *
 * Reads are relaxed snapshots: a worker may observe a transition one loop
 * iteration late. Transitions go through CompareAndSet so that two
 * concurrent callers cannot both perform the same transition.
 */
class LifecycleCell final {
 public:
  explicit LifecycleCell(LifecycleState initial = LifecycleState::kInitial) noexcept
      : state_(initial) {}

  LifecycleCell(const LifecycleCell&) = delete;
  LifecycleCell& operator=(const LifecycleCell&) = delete;

  LifecycleState Load() const noexcept { return state_.load(std::memory_order_relaxed); }

  void Store(LifecycleState state) noexcept { state_.store(state, std::memory_order_release); }

  bool CompareAndSet(LifecycleState expected, LifecycleState desired) noexcept {
    return state_.compare_exchange_strong(expected, desired, std::memory_order_acq_rel,
                                          std::memory_order_relaxed);
  }

 private:
  std::atomic<LifecycleState> state_;
};

}  // namespace iodrv

#endif  // IODRV_LIFECYCLE_HPP_
