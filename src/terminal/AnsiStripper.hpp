#ifndef __RAS_ANSI_STRIPPER__
#define __RAS_ANSI_STRIPPER__

#include "Headers.hpp"

namespace ras {
/**
 * @brief Removes terminal control sequences from raw output so that plain
 * text patterns can be matched against it.
 *
 * Cursor movement is replaced by a line break (vertical or absolute moves)
 * or a space (horizontal moves) so text drawn at different positions does
 * not run together. CR and CRLF become LF. An escape sequence cut off at
 * the end of the input is dropped.
 */
class AnsiStripper {
 public:
  static string strip(const string& raw);

  /**
   * @brief Strips `raw` and reports where `rawOffset` lands in the output.
   * @param cleanOffset Receives the offset in the returned text of the first
   * byte produced at or after `rawOffset`.
   */
  static string strip(const string& raw, size_t rawOffset, size_t* cleanOffset);
};
}  // namespace ras

#endif  // __RAS_ANSI_STRIPPER__
