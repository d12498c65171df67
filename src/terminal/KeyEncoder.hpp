#ifndef __RAS_KEY_ENCODER__
#define __RAS_KEY_ENCODER__

#include "Headers.hpp"

namespace ras {
/**
 * @brief Translates logical keys into the bytes an xterm-compatible terminal
 * emits for them.
 *
 * Modified keys follow the xterm convention where the parameter embedded in
 * the control sequence is `1 + modifiers`.
 */
class KeyEncoder {
 public:
  static constexpr uint32_t MOD_SHIFT = 1;
  static constexpr uint32_t MOD_ALT = 2;
  static constexpr uint32_t MOD_CTRL = 4;
  static constexpr uint32_t MOD_MASK = MOD_SHIFT | MOD_ALT | MOD_CTRL;

  /**
   * @brief Encodes `key` with the given modifier bitmask.
   * @return The bytes to send, or an empty string for unknown keys.
   */
  static string encode(KeyType key, uint32_t modifiers);

  /** @brief The unmodified sequence for `key`, or empty if unknown. */
  static string baseSequence(KeyType key);

 protected:
  static string applyModifiers(const string& base, uint32_t modifiers);
};
}  // namespace ras

#endif  // __RAS_KEY_ENCODER__
