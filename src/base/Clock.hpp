#ifndef __SSP_CLOCK__
#define __SSP_CLOCK__

#include "Headers.hpp"

namespace ssp {
/**
 * @brief Millisecond time source shared by every protocol component.
 *
 * Components never read the system clock directly so that the simulator and
 * the tests can drive time by hand.
 */
class Clock {
 public:
  virtual ~Clock() {}

  /** @brief Current time in milliseconds. */
  virtual double now() = 0;
};

/** @brief Monotonic clock backed by std::chrono::steady_clock. */
class SteadyClock : public Clock {
 public:
  SteadyClock() : start(std::chrono::steady_clock::now()) {}
  virtual ~SteadyClock() {}

  virtual double now() {
    auto elapsed = std::chrono::steady_clock::now() - start;
    return std::chrono::duration<double, std::milli>(elapsed).count();
  }

 protected:
  std::chrono::steady_clock::time_point start;
};

/** @brief Clock that only moves when told to. */
class ManualClock : public Clock {
 public:
  explicit ManualClock(double _start = 0) : current(_start) {}
  virtual ~ManualClock() {}

  virtual double now() { return current; }

  inline void advance(double ms) { current += ms; }
  inline void set(double ms) { current = ms; }

 protected:
  double current;
};
}  // namespace ssp

#endif  // __SSP_CLOCK__
