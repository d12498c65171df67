#include "ReplayBuffer.hpp"

namespace ras {
ReplayBuffer::ReplayBuffer(size_t _maxSize)
    : maxSize(_maxSize), totalSize(0), nextSequence(0) {}

uint64_t ReplayBuffer::append(const string& data) {
  lock_guard<std::mutex> guard(bufferMutex);
  uint64_t sequence = nextSequence++;
  chunks.push_back(Chunk{sequence, data});
  totalSize += data.size();

  while (totalSize > maxSize && chunks.size() > 1) {
    totalSize -= chunks.front().data.size();
    chunks.pop_front();
  }
  return sequence;
}

ReplayRange ReplayBuffer::getFrom(uint64_t fromSequence) const {
  lock_guard<std::mutex> guard(bufferMutex);
  ReplayRange range;
  if (chunks.empty()) {
    return range;
  }

  if (fromSequence < chunks.front().sequence) {
    range.chunks.assign(chunks.begin(), chunks.end());
    range.gapMarker = fromSequence;
    return range;
  }

  for (const auto& chunk : chunks) {
    if (chunk.sequence >= fromSequence) {
      range.chunks.push_back(chunk);
    }
  }
  return range;
}

void ReplayBuffer::clear() {
  lock_guard<std::mutex> guard(bufferMutex);
  chunks.clear();
  totalSize = 0;
}

uint64_t ReplayBuffer::getStartSequence() const {
  lock_guard<std::mutex> guard(bufferMutex);
  if (chunks.empty()) {
    return nextSequence;
  }
  return chunks.front().sequence;
}

uint64_t ReplayBuffer::getCurrentSequence() const {
  lock_guard<std::mutex> guard(bufferMutex);
  return nextSequence;
}

size_t ReplayBuffer::getSize() const {
  lock_guard<std::mutex> guard(bufferMutex);
  return totalSize;
}

size_t ReplayBuffer::getChunkCount() const {
  lock_guard<std::mutex> guard(bufferMutex);
  return chunks.size();
}
}  // namespace ras
