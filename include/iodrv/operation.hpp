/**
 * @file operation.hpp
 * @brief Storage load operation: the unit of work handed to a driver.
 *
 * The producer owns every Operation. The driver only writes the status
 * (kFailUnknown when preparation fails); execution hooks write the final
 * status and timings. Status is atomic because it is written on a worker
 * thread and polled by the producer.
 */

#ifndef IODRV_OPERATION_HPP_
#define IODRV_OPERATION_HPP_

#include "iodrv/platform.hpp"
#include "iodrv/vocabulary.hpp"

#include <cstdint>

#include <atomic>

namespace iodrv {

// ============================================================================
// OpType / OpStatus
// ============================================================================

enum class OpType : uint8_t {
  kNoop = 0,
  kCreate,
  kRead,
  kUpdate,
  kDelete,
  kList
};

enum class OpStatus : uint8_t {
  kPending = 0,
  kActive,
  kInterrupted,
  kFailUnknown,
  kSuccess,
  kFailIo,
  kFailTimeout,
  kRespFailUnknown,
  kRespFailClient,
  kRespFailSvc,
  kRespFailNotFound,
  kRespFailAuth,
  kRespFailCorrupt,
  kRespFailSpace
};

inline const char* OpTypeName(OpType type) noexcept {
  switch (type) {
    case OpType::kNoop:   return "NOOP";
    case OpType::kCreate: return "CREATE";
    case OpType::kRead:   return "READ";
    case OpType::kUpdate: return "UPDATE";
    case OpType::kDelete: return "DELETE";
    case OpType::kList:   return "LIST";
  }
  return "UNKNOWN";
}

inline const char* OpStatusName(OpStatus status) noexcept {
  switch (status) {
    case OpStatus::kPending:          return "PENDING";
    case OpStatus::kActive:           return "ACTIVE";
    case OpStatus::kInterrupted:      return "INTERRUPTED";
    case OpStatus::kFailUnknown:      return "FAIL_UNKNOWN";
    case OpStatus::kSuccess:          return "SUCC";
    case OpStatus::kFailIo:           return "FAIL_IO";
    case OpStatus::kFailTimeout:      return "FAIL_TIMEOUT";
    case OpStatus::kRespFailUnknown:  return "RESP_FAIL_UNKNOWN";
    case OpStatus::kRespFailClient:   return "RESP_FAIL_CLIENT";
    case OpStatus::kRespFailSvc:      return "RESP_FAIL_SVC";
    case OpStatus::kRespFailNotFound: return "RESP_FAIL_NOT_FOUND";
    case OpStatus::kRespFailAuth:     return "RESP_FAIL_AUTH";
    case OpStatus::kRespFailCorrupt:  return "RESP_FAIL_CORRUPT";
    case OpStatus::kRespFailSpace:    return "RESP_FAIL_SPACE";
  }
  return "UNKNOWN";
}

/// @brief True for every status an operation can finish with.
inline bool IsTerminal(OpStatus status) noexcept {
  return status != OpStatus::kPending && status != OpStatus::kActive;
}

// ============================================================================
// Operation
// ============================================================================

static constexpr uint32_t kMaxItemNameLen = 64U;

/**
 * @brief Default operation type accepted by StorageDriver.
 *
 * Any type with `void SetStatus(OpStatus)` may be used instead.
 */
class Operation {
 public:
  Operation() noexcept = default;

  Operation(uint64_t id, OpType type, const char* item_name) noexcept
      : id_(id), type_(type), item_name_(TruncateToCapacity, item_name) {}

  Operation(const Operation&) = delete;
  Operation& operator=(const Operation&) = delete;

  uint64_t Id() const noexcept { return id_; }
  OpType Type() const noexcept { return type_; }
  const FixedString<kMaxItemNameLen>& ItemName() const noexcept { return item_name_; }

  OpStatus Status() const noexcept { return status_.load(std::memory_order_acquire); }
  void SetStatus(OpStatus status) noexcept { status_.store(status, std::memory_order_release); }

  void StartRequest() noexcept {
    req_start_us_ = SteadyNowUs();
    SetStatus(OpStatus::kActive);
  }

  void FinishRequest(OpStatus status) noexcept {
    resp_end_us_ = SteadyNowUs();
    SetStatus(status);
  }

  /// @brief Request-to-response latency, 0 until finished.
  uint64_t DurationUs() const noexcept {
    return (resp_end_us_ >= req_start_us_ && resp_end_us_ != 0U) ? resp_end_us_ - req_start_us_
                                                                 : 0U;
  }

  /// @brief Return to kPending so the producer can recycle the object.
  void Reset() noexcept {
    req_start_us_ = 0U;
    resp_end_us_ = 0U;
    SetStatus(OpStatus::kPending);
  }

 private:
  uint64_t id_{0U};
  OpType type_{OpType::kNoop};
  FixedString<kMaxItemNameLen> item_name_;
  std::atomic<OpStatus> status_{OpStatus::kPending};
  uint64_t req_start_us_{0U};
  uint64_t resp_end_us_{0U};
};

}  // namespace iodrv

#endif  // IODRV_OPERATION_HPP_
