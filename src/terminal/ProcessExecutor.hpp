#ifndef __RAS_PROCESS_EXECUTOR_HPP__
#define __RAS_PROCESS_EXECUTOR_HPP__

#include "Headers.hpp"

namespace ras {
/**
 * @brief Delivers keystrokes and window sizes to the multiplexer.
 */
class ProcessExecutor {
 public:
  virtual ~ProcessExecutor() {}

  /**
   * @brief Types `keys` into the session literally.
   * @returns false if the multiplexer rejected the keys.
   */
  virtual bool sendKeys(const string& multiplexerName, const string& keys) = 0;
  /** @brief Resizes the session's window. */
  virtual bool resize(const string& multiplexerName, int cols, int rows) = 0;
};
}  // namespace ras

#endif
