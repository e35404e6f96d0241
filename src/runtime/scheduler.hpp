#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>

namespace fixread {

using TimerId = std::uint64_t;

/// Id never returned by Scheduler::schedule().
constexpr TimerId kNoTimer = 0;

/// Repeating-timer source used by the playback controller.
///
/// Everything runs on one thread: handlers are invoked from whatever drives
/// the scheduler (TimerQueue::advance() or EventLoop::run()), never
/// concurrently.  A handler may cancel any timer, including its own; a
/// cancelled timer is never invoked again.
class Scheduler {
public:
  using Handler = std::function<void()>;

  virtual ~Scheduler() = default;

  /// Current time in seconds on the scheduler's clock.
  virtual double now() const = 0;

  /// Invoke `handler` every `interval_seconds`, first one interval from now.
  /// Throws std::invalid_argument for a non-positive interval.
  virtual TimerId schedule(Handler handler, double interval_seconds) = 0;

  /// Stop a timer.  Unknown or already cancelled ids are ignored.
  virtual void cancel(TimerId id) = 0;
};

/// Scheduler on a virtual clock that only moves when advance() is called.
///
/// Due timers fire in time order; timers due at the same instant fire in
/// the order they were scheduled.  Deterministic, so tests drive playback
/// with it directly.
class TimerQueue : public Scheduler {
public:
  double now() const override { return now_; }
  TimerId schedule(Handler handler, double interval_seconds) override;
  void cancel(TimerId id) override;

  /// Like schedule(), but the first tick falls due at `start + interval_seconds`
  /// instead of relative to the queue's own clock.
  TimerId schedule_from(double start, Handler handler, double interval_seconds);

  /// Move the clock forward by `seconds`, firing every tick that falls due.
  void advance(double seconds);

  /// Move the clock to absolute time `t` (never backwards).
  void advance_to(double t);

  /// Number of live timers.
  std::size_t size() const { return timers_.size(); }
  bool empty() const { return timers_.empty(); }

  /// Due time of the earliest live timer, or +infinity when there is none.
  double next_due() const;

private:
  struct Timer {
    double interval = 0.0;
    double next_due = 0.0;
    Handler handler;
  };

  std::map<TimerId, Timer> timers_;
  TimerId next_id_{1};
  double now_{0.0};
};

}  // namespace fixread
