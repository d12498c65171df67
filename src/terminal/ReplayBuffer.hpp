#ifndef __RAS_REPLAY_BUFFER__
#define __RAS_REPLAY_BUFFER__

#include "Headers.hpp"

namespace ras {
/**
 * @brief One delivery of terminal output, tagged with its sequence number.
 */
struct Chunk {
  uint64_t sequence;
  string data;
};

/**
 * @brief Snapshot returned by `ReplayBuffer::getFrom`.
 */
struct ReplayRange {
  vector<Chunk> chunks;
  /**
   * @brief Set to the requested sequence when part of the requested range
   * has already been evicted.
   */
  optional<uint64_t> gapMarker;
};

/**
 * @brief Bounded, sequence-numbered history of a session's output.
 *
 * Devices that reconnect ask for everything after the last sequence they
 * saw. When that data has been evicted the result carries a gap marker so
 * the device can be told that output was lost.
 */
class ReplayBuffer {
 public:
  static constexpr size_t DEFAULT_MAX_SIZE = 100 * 1024;

  explicit ReplayBuffer(size_t _maxSize = DEFAULT_MAX_SIZE);

  /**
   * @brief Stores a chunk and evicts the oldest ones while over budget.
   *
   * The most recent chunk is always kept, even if it alone exceeds the
   * budget.
   * @return The sequence number assigned to `data`.
   */
  uint64_t append(const string& data);

  /**
   * @brief Returns every retained chunk with a sequence >= `fromSequence`.
   */
  ReplayRange getFrom(uint64_t fromSequence) const;

  /** @brief Drops all chunks. Sequence numbers keep counting up. */
  void clear();

  /** @brief Oldest retained sequence, or the next sequence when empty. */
  uint64_t getStartSequence() const;

  /** @brief The sequence that the next append will receive. */
  uint64_t getCurrentSequence() const;

  /** @brief Number of bytes currently buffered. */
  size_t getSize() const;

  size_t getChunkCount() const;

  size_t getMaxSize() const { return maxSize; }

 protected:
  size_t maxSize;
  std::deque<Chunk> chunks;
  size_t totalSize;
  uint64_t nextSequence;
  mutable std::mutex bufferMutex;
};
}  // namespace ras

#endif  // __RAS_REPLAY_BUFFER__
