#include <gtest/gtest.h>

#include <chrono>
#include <cmath>
#include <stdexcept>
#include <string>
#include <thread>

#include "runtime/event_loop.hpp"
#include "runtime/scheduler.hpp"

using fixread::TimerId;
using fixread::TimerQueue;

// ---------------------------------------------------------------------------
// TimerQueue
// ---------------------------------------------------------------------------

TEST(TimerQueue, FiresOncePerInterval) {
  TimerQueue q;
  int ticks = 0;
  q.schedule([&] { ++ticks; }, 1.0);

  q.advance(0.5);
  EXPECT_EQ(ticks, 0);
  q.advance(0.5);
  EXPECT_EQ(ticks, 1);
  q.advance(2.0);
  EXPECT_EQ(ticks, 3);
  EXPECT_DOUBLE_EQ(q.now(), 3.0);
}

TEST(TimerQueue, ClockReadsDueTimeInsideHandler) {
  TimerQueue q;
  double seen = -1.0;
  q.schedule([&] { seen = q.now(); }, 2.5);
  q.advance(4.0);
  EXPECT_DOUBLE_EQ(seen, 2.5);
  EXPECT_DOUBLE_EQ(q.now(), 4.0);
}

TEST(TimerQueue, CancelStopsFutureTicks) {
  TimerQueue q;
  int ticks = 0;
  TimerId id = q.schedule([&] { ++ticks; }, 1.0);
  q.advance(2.0);
  q.cancel(id);
  q.advance(5.0);
  EXPECT_EQ(ticks, 2);
  EXPECT_TRUE(q.empty());
}

TEST(TimerQueue, HandlerMayCancelItself) {
  TimerQueue q;
  int ticks = 0;
  TimerId id = fixread::kNoTimer;
  id = q.schedule([&] {
    if (++ticks == 2) q.cancel(id);
  }, 1.0);
  q.advance(10.0);
  EXPECT_EQ(ticks, 2);
  EXPECT_TRUE(q.empty());
}

TEST(TimerQueue, SimultaneousTicksFireInScheduleOrder) {
  TimerQueue q;
  std::string order;
  q.schedule([&] { order += 'a'; }, 1.0);
  q.schedule([&] { order += 'b'; }, 1.0);
  q.schedule([&] { order += 'c'; }, 0.5);
  q.advance(1.0);
  EXPECT_EQ(order, "cabc");
}

TEST(TimerQueue, CancellingUnknownIdIsHarmless) {
  TimerQueue q;
  q.cancel(42);
  q.cancel(fixread::kNoTimer);
  EXPECT_TRUE(q.empty());
}

TEST(TimerQueue, RejectsNonPositiveInterval) {
  TimerQueue q;
  EXPECT_THROW(q.schedule([] {}, 0.0), std::invalid_argument);
  EXPECT_THROW(q.schedule([] {}, -1.0), std::invalid_argument);
}

TEST(TimerQueue, NextDue) {
  TimerQueue q;
  EXPECT_TRUE(std::isinf(q.next_due()));
  q.schedule([] {}, 3.0);
  q.schedule([] {}, 1.5);
  EXPECT_DOUBLE_EQ(q.next_due(), 1.5);
  EXPECT_EQ(q.size(), 2u);
}

TEST(TimerQueue, ScheduleFromAnchorsFirstTick) {
  TimerQueue q;
  int ticks = 0;
  q.schedule_from(3.0, [&] { ++ticks; }, 1.0);
  EXPECT_DOUBLE_EQ(q.next_due(), 4.0);
  q.advance_to(3.5);
  EXPECT_EQ(ticks, 0);
  q.advance_to(4.0);
  EXPECT_EQ(ticks, 1);
  EXPECT_DOUBLE_EQ(q.next_due(), 5.0);
}

// ---------------------------------------------------------------------------
// EventLoop
// ---------------------------------------------------------------------------

TEST(EventLoop, RunsUntilLastTimerIsCancelled) {
  fixread::EventLoop loop;
  int ticks = 0;
  TimerId id = fixread::kNoTimer;
  id = loop.schedule([&] {
    if (++ticks == 3) loop.cancel(id);
  }, 0.01);
  loop.run();
  EXPECT_EQ(ticks, 3);
  EXPECT_GE(loop.now(), 0.03);
}

TEST(EventLoop, TimerArmedWhileOverdueWaitsFullInterval) {
  fixread::EventLoop loop;
  double armed_at = 0.0;
  double fired_at = 0.0;
  TimerId first = fixread::kNoTimer;
  TimerId second = fixread::kNoTimer;
  first = loop.schedule([&] {
    // Fall behind the first timer's next tick before arming the second.
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    armed_at = loop.now();
    second = loop.schedule([&] {
      fired_at = loop.now();
      loop.cancel(second);
    }, 0.05);
    loop.cancel(first);
  }, 0.01);
  loop.run();
  EXPECT_GE(fired_at - armed_at, 0.049);
}

TEST(EventLoop, StopEndsRun) {
  fixread::EventLoop loop;
  int ticks = 0;
  loop.schedule([&] {
    ++ticks;
    loop.stop();
  }, 0.01);
  loop.run();
  EXPECT_EQ(ticks, 1);
}
