#ifndef __SSP_SEND_QUEUE__
#define __SSP_SEND_QUEUE__

#include "Headers.hpp"

namespace ssp {
/**
 * @brief Bounded queue of encoded packets waiting for the congestion window
 * to open.
 *
 * Packets leave in the order they arrived. By limiting the queue size, a
 * stalled path pushes back on the producer instead of growing without bound.
 */
class SendQueue {
 public:
  /** @brief Maximum bytes to queue before refusing new packets. */
  static constexpr size_t MAX_QUEUE_BYTES = 256 * 1024;  // 256KB

  struct Entry {
    uint64_t sequence;
    string data;
  };

  SendQueue() : totalBytes(0) {}

  /**
   * @brief Returns true if the queue has room for `bytes` more.
   */
  bool canAccept(size_t bytes) const {
    return totalBytes + bytes <= MAX_QUEUE_BYTES;
  }

  bool hasPendingData() const { return !pending.empty(); }

  /** @brief Total queued bytes. */
  size_t size() const { return totalBytes; }

  size_t count() const { return pending.size(); }

  /**
   * @brief Adds a packet to the back of the queue.
   * @return false (and queues nothing) if the packet does not fit.
   */
  bool enqueue(uint64_t sequence, const string &data) {
    if (!canAccept(data.size())) {
      return false;
    }
    pending.push_back(Entry{sequence, data});
    totalBytes += data.size();
    return true;
  }

  /** @brief Returns the oldest queued packet, or nullptr if empty. */
  const Entry *peek() const {
    if (pending.empty()) {
      return nullptr;
    }
    return &pending.front();
  }

  /** @brief Removes the oldest queued packet. */
  void pop() {
    if (pending.empty()) return;
    totalBytes -= pending.front().data.size();
    pending.pop_front();
  }

  void clear() {
    pending.clear();
    totalBytes = 0;
  }

 private:
  std::deque<Entry> pending;
  size_t totalBytes;
};
}  // namespace ssp

#endif  // __SSP_SEND_QUEUE__
