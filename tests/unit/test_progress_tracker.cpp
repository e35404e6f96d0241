#include <gtest/gtest.h>

#include "runtime/progress_tracker.hpp"

using fixread::calculate_comprehension_score;
using fixread::calculate_wpm;

TEST(ProgressTracker, WpmIsZeroWithoutWordsOrTime) {
  EXPECT_EQ(calculate_wpm(0, 12.0), 0);
  EXPECT_EQ(calculate_wpm(0, 0.0), 0);
  EXPECT_EQ(calculate_wpm(50, 0.0), 0);
  EXPECT_EQ(calculate_wpm(50, -3.0), 0);
}

TEST(ProgressTracker, WpmIsRounded) {
  EXPECT_EQ(calculate_wpm(10, 30.0), 20);
  EXPECT_EQ(calculate_wpm(7, 4.0), 105);
  EXPECT_EQ(calculate_wpm(1, 7.0), 9);      // 8.57
  EXPECT_EQ(calculate_wpm(9, 8.0), 68);     // 67.5
}

TEST(ProgressTracker, ComprehensionPenalties) {
  EXPECT_EQ(calculate_comprehension_score(0, 0), 100);
  EXPECT_EQ(calculate_comprehension_score(3, 2), 84);
  EXPECT_EQ(calculate_comprehension_score(30, 10), 0);
}
