#ifndef __RAS_DEVICE_TRANSPORT_HPP__
#define __RAS_DEVICE_TRANSPORT_HPP__

#include "Headers.hpp"

namespace ras {
/**
 * @brief Delivers serialized `TerminalEvent`s to remote devices.
 *
 * Both calls may throw std::runtime_error when the device is unreachable.
 */
class DeviceTransport {
 public:
  virtual ~DeviceTransport() {}

  virtual void send(const string& deviceId, const string& event) = 0;
  /** @brief Sends `event` to every connected device. */
  virtual void broadcast(const string& event) = 0;
};
}  // namespace ras

#endif
