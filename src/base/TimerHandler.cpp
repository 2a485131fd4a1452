#include "TimerHandler.hpp"

namespace ssp {
void EventLoopTimerHandler::schedule(double delayMs,
                                     std::function<void()> callback) {
  double deadline = clock->now() + std::max(0.0, delayMs);
  timers.insert(make_pair(make_pair(deadline, nextId++), callback));
}

int EventLoopTimerHandler::runExpired() {
  int fired = 0;
  while (!timers.empty()) {
    auto it = timers.begin();
    if (it->first.first > clock->now()) {
      break;
    }
    // The callback may schedule new timers, so take it out first.
    auto callback = it->second;
    timers.erase(it);
    callback();
    fired++;
  }
  return fired;
}

double EventLoopTimerHandler::nextDeadline() const {
  if (timers.empty()) {
    return -1;
  }
  return timers.begin()->first.first;
}
}  // namespace ssp
