#pragma once

#include <chrono>

#include "runtime/scheduler.hpp"

namespace fixread {

/// Real-time scheduler: a TimerQueue paced against std::chrono::steady_clock.
///
/// run() sleeps until the next tick is due, fires it, and returns once no
/// timer is left (or stop() was called from a handler).
class EventLoop : public Scheduler {
public:
  EventLoop();

  /// Seconds since the loop was created.
  double now() const override;
  TimerId schedule(Handler handler, double interval_seconds) override;
  void cancel(TimerId id) override;

  void run();
  void stop() { stopped_ = true; }

private:
  std::chrono::steady_clock::time_point origin_;
  TimerQueue queue_;
  bool stopped_{false};
};

}  // namespace fixread
