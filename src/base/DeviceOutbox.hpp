#ifndef __RAS_DEVICE_OUTBOX__
#define __RAS_DEVICE_OUTBOX__

#include "Headers.hpp"

namespace ras {
/**
 * @brief Result of handing an event to a device outbox.
 */
enum class OutboxWriteState {
  /** @brief The outbox was full and the event was discarded. */
  DROPPED = 0,
  /** @brief Queued behind a drain that is already running. */
  QUEUED = 1,
  /** @brief Queued, and the caller must schedule a drain. */
  QUEUED_START_DRAIN = 2
};

/**
 * @brief Bounded FIFO of serialized events waiting to be sent to one device.
 *
 * At most one drain runs per outbox, so events reach a device in the order
 * they were queued. When the device cannot keep up, the outbox fills and new
 * events are dropped; the device notices the sequence discontinuity and
 * re-attaches from its last seen sequence.
 */
class DeviceOutbox {
 public:
  static constexpr size_t DEFAULT_MAX_PENDING = 1024;

  explicit DeviceOutbox(const string &_deviceId,
                        size_t _maxPending = DEFAULT_MAX_PENDING)
      : deviceId(_deviceId),
        maxPending(_maxPending),
        draining(false),
        overflowing(false),
        droppedCount(0) {}

  OutboxWriteState enqueue(const string &event) {
    lock_guard<std::mutex> guard(outboxMutex);
    if (pending.size() >= maxPending) {
      droppedCount++;
      if (!overflowing) {
        overflowing = true;
        LOG(WARNING) << "Outbox for device " << deviceId
                     << " is full, dropping events";
      }
      return OutboxWriteState::DROPPED;
    }
    if (overflowing) {
      overflowing = false;
      LOG(INFO) << "Outbox for device " << deviceId << " recovered after "
                << droppedCount << " dropped events";
    }
    pending.push_back(event);
    if (draining) {
      return OutboxWriteState::QUEUED;
    }
    draining = true;
    return OutboxWriteState::QUEUED_START_DRAIN;
  }

  /**
   * @brief Takes the next event for the running drain.
   * @return false when the outbox is empty, which also ends the drain.
   */
  bool popForDrain(string *event) {
    lock_guard<std::mutex> guard(outboxMutex);
    if (pending.empty()) {
      draining = false;
      return false;
    }
    *event = std::move(pending.front());
    pending.pop_front();
    return true;
  }

  size_t size() const {
    lock_guard<std::mutex> guard(outboxMutex);
    return pending.size();
  }

  bool isDraining() const {
    lock_guard<std::mutex> guard(outboxMutex);
    return draining;
  }

  uint64_t getDroppedCount() const {
    lock_guard<std::mutex> guard(outboxMutex);
    return droppedCount;
  }

  void clear() {
    lock_guard<std::mutex> guard(outboxMutex);
    pending.clear();
  }

  const string &getDeviceId() const { return deviceId; }

 private:
  string deviceId;
  mutable std::mutex outboxMutex;
  std::deque<string> pending;
  size_t maxPending;
  bool draining;
  bool overflowing;
  uint64_t droppedCount;
};
}  // namespace ras

#endif  // __RAS_DEVICE_OUTBOX__
