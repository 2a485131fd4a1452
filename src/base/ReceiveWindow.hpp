#ifndef __SSP_RECEIVE_WINDOW__
#define __SSP_RECEIVE_WINDOW__

#include "Headers.hpp"

namespace ssp {
/**
 * @brief Tracks which sequence numbers of one stream were already received.
 *
 * Everything below `floor` counts as received. Sequence numbers above the
 * floor are remembered individually until the gap below them closes. At most
 * `capacity` of them are kept: when the set overflows, the floor jumps past
 * the oldest one, and anything older that shows up later is treated as a
 * duplicate.
 */
class ReceiveWindow {
 public:
  static constexpr size_t DEFAULT_CAPACITY = 1024;

  explicit ReceiveWindow(size_t _capacity = DEFAULT_CAPACITY)
      : capacity(_capacity), floor(0) {}

  /**
   * @brief Marks `sequence` as received.
   * @return false if it was received before.
   */
  bool accept(uint64_t sequence) {
    if (sequence < floor || !above.insert(sequence).second) {
      return false;
    }
    while (above.size() > capacity) {
      floor = *above.begin() + 1;
      above.erase(above.begin());
    }
    while (!above.empty() && *above.begin() == floor) {
      above.erase(above.begin());
      floor++;
    }
    return true;
  }

  uint64_t getFloor() const { return floor; }

  /** @brief Sequence numbers remembered above the floor. */
  size_t tracked() const { return above.size(); }

 private:
  size_t capacity;
  uint64_t floor;
  set<uint64_t> above;
};
}  // namespace ssp

#endif  // __SSP_RECEIVE_WINDOW__
