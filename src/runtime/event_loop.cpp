#include "runtime/event_loop.hpp"

#include <thread>
#include <utility>

namespace fixread {

EventLoop::EventLoop() : origin_(std::chrono::steady_clock::now()) {}

double EventLoop::now() const {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - origin_).count();
}

TimerId EventLoop::schedule(Handler handler, double interval_seconds) {
  // First tick is relative to the wall clock, not to the last tick fired.
  return queue_.schedule_from(now(), std::move(handler), interval_seconds);
}

void EventLoop::cancel(TimerId id) {
  queue_.cancel(id);
}

void EventLoop::run() {
  stopped_ = false;
  while (!stopped_ && !queue_.empty()) {
    const double due = queue_.next_due();
    std::this_thread::sleep_until(
        origin_ + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                      std::chrono::duration<double>(due)));
    queue_.advance_to(due);
  }
}

}  // namespace fixread
