#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace fixread {

/// Words per minute from a word count and elapsed seconds.
/// Returns 0 when no time has elapsed (or the clock went backwards).
inline int calculate_wpm(std::size_t words_read, double elapsed_seconds) {
  if (!(elapsed_seconds > 0.0)) return 0;
  return static_cast<int>(std::lround(static_cast<double>(words_read) / elapsed_seconds * 60.0));
}

/// Rough comprehension heuristic: 100, minus 2 per pause and 5 per
/// backtrack, never below 0.
inline int calculate_comprehension_score(int pause_count, int backtrack_count) {
  return std::max(0, 100 - 2 * pause_count - 5 * backtrack_count);
}

}  // namespace fixread
