#include "runtime/scheduler.hpp"

#include <limits>
#include <stdexcept>
#include <utility>

namespace fixread {

TimerId TimerQueue::schedule(Handler handler, double interval_seconds) {
  return schedule_from(now_, std::move(handler), interval_seconds);
}

TimerId TimerQueue::schedule_from(double start, Handler handler, double interval_seconds) {
  if (!(interval_seconds > 0.0)) {
    throw std::invalid_argument("TimerQueue: interval must be > 0");
  }
  if (!handler) {
    throw std::invalid_argument("TimerQueue: handler must not be empty");
  }
  const TimerId id = next_id_++;
  timers_[id] = Timer{interval_seconds, start + interval_seconds, std::move(handler)};
  return id;
}

void TimerQueue::cancel(TimerId id) {
  timers_.erase(id);
}

void TimerQueue::advance(double seconds) {
  if (seconds > 0.0) advance_to(now_ + seconds);
}

void TimerQueue::advance_to(double t) {
  while (true) {
    // Earliest due timer; std::map order breaks ties by schedule order.
    auto due = timers_.end();
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
      if (due == timers_.end() || it->second.next_due < due->second.next_due) due = it;
    }
    if (due == timers_.end() || due->second.next_due > t) break;

    const TimerId id = due->first;
    if (due->second.next_due > now_) now_ = due->second.next_due;
    // The handler may cancel this timer, so call a copy.
    Handler handler = due->second.handler;
    handler();

    auto still = timers_.find(id);
    if (still != timers_.end()) still->second.next_due += still->second.interval;
  }
  if (t > now_) now_ = t;
}

double TimerQueue::next_due() const {
  double best = std::numeric_limits<double>::infinity();
  for (const auto& [id, timer] : timers_) {
    if (timer.next_due < best) best = timer.next_due;
  }
  return best;
}

}  // namespace fixread
