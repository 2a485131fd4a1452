#ifndef __SSP_TIMER_HANDLER__
#define __SSP_TIMER_HANDLER__

#include "Clock.hpp"
#include "Headers.hpp"

namespace ssp {
/**
 * @brief Provides an abstract API for one-shot delayed callbacks.
 *
 * The protocol only schedules; firing is owned by whoever hosts the session
 * (an event loop, a timer wheel, a test).
 */
class TimerHandler {
 public:
  virtual ~TimerHandler() {}

  /**
   * @brief Runs `callback` once, no earlier than `delayMs` from now.
   */
  virtual void schedule(double delayMs, std::function<void()> callback) = 0;
};

/**
 * @brief Timer queue driven by a Clock, fired explicitly by an event loop.
 *
 * Callbacks fire in deadline order; callbacks with equal deadlines fire in
 * the order they were scheduled.
 */
class EventLoopTimerHandler : public TimerHandler {
 public:
  explicit EventLoopTimerHandler(shared_ptr<Clock> _clock)
      : clock(_clock), nextId(0) {}
  virtual ~EventLoopTimerHandler() {}

  virtual void schedule(double delayMs, std::function<void()> callback);

  /**
   * @brief Fires every callback whose deadline has passed.
   * @return The number of callbacks fired.
   */
  int runExpired();

  /** @brief Deadline of the earliest pending callback, or -1 if none. */
  double nextDeadline() const;

  inline bool empty() const { return timers.empty(); }
  inline size_t size() const { return timers.size(); }

 protected:
  shared_ptr<Clock> clock;
  /** @brief Pending callbacks keyed by (deadline, insertion id). */
  map<pair<double, uint64_t>, std::function<void()>> timers;
  uint64_t nextId;
};
}  // namespace ssp

#endif  // __SSP_TIMER_HANDLER__
