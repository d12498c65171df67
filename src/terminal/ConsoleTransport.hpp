#ifndef __RAS_CONSOLE_TRANSPORT__
#define __RAS_CONSOLE_TRANSPORT__

#include "DeviceTransport.hpp"
#include "Headers.hpp"

namespace ras {
/**
 * @brief Transport for running the daemon standalone: events are printed on
 * the stdout logger instead of being sent to a phone.
 */
class ConsoleTransport : public DeviceTransport {
 public:
  virtual void send(const string& deviceId, const string& event);
  virtual void broadcast(const string& event);

 protected:
  void printEvent(const string& target, const string& event);
  std::mutex printMutex;
};
}  // namespace ras

#endif  // __RAS_CONSOLE_TRANSPORT__
