#pragma once

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <string>
#include <utility>

#include "text/utf8.hpp"

namespace fixread {

/// Computes the fixation point of a word: the number of leading characters
/// that are rendered in bold to anchor the reader's eye.
///
/// The point starts at ceil(length * level) and is then pulled earlier by
/// common English prefixes and suffixes so the emphasis does not run into a
/// morpheme boundary.  Very short words always get a single bold character,
/// long words get one extra.  The result is always within [1, length - 1]
/// for words longer than one character.
///
/// Example (level 0.5):
///   "reading"  -> 2   (prefix "re")
///   "quickly"  -> 4   (base ceil(3.5) = 4, suffix "ly" allows up to 5)
///   "the"      -> 1
inline std::size_t calculate_fixation(const std::string& word, double fixation_level) {
  static const char* const kPrefixes[] = {
      "un", "re", "pre", "dis", "in", "im", "ir", "il", "anti", "auto",
      "bio", "co", "de", "ex", "fore", "inter", "micro", "mid", "mono", "non",
      "over", "post", "pro", "sub", "super", "trans", "tri", "under"};
  static const char* const kSuffixes[] = {
      "ing", "ed", "ly", "tion", "sion", "able", "ible", "al", "ent",
      "ence", "ive", "ize", "ise", "ment", "ness", "ous", "ful", "less"};

  const std::size_t len = utf8::length(word);
  if (len <= 1) return len;

  // Prefix and suffix lists are ASCII, so a byte-wise lowercase is enough.
  std::string lower = word;
  for (auto& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

  auto point = static_cast<std::size_t>(std::ceil(static_cast<double>(len) * fixation_level));

  for (const char* prefix : kPrefixes) {
    const std::string p(prefix);
    if (lower.compare(0, p.size(), p) == 0 && len > p.size()) {
      point = std::min(point, p.size());
      break;
    }
  }

  for (const char* suffix : kSuffixes) {
    const std::string s(suffix);
    if (lower.size() >= s.size() &&
        lower.compare(lower.size() - s.size(), s.size(), s) == 0 && len > s.size()) {
      point = std::min(point, len - s.size());
      break;
    }
  }

  if (len <= 3) {
    point = 1;
  } else if (len > 8) {
    point = std::min(point + 1, len - 1);
  }

  return std::max<std::size_t>(1, std::min(point, len - 1));
}

/// Split a word at its fixation point into {bold, normal}.
/// The split never falls inside a multi-byte UTF-8 sequence.
inline std::pair<std::string, std::string> split_fixation(const std::string& word,
                                                          double fixation_level) {
  const std::size_t point = calculate_fixation(word, fixation_level);
  const std::size_t cut = utf8::byte_offset(word, point);
  return {word.substr(0, cut), word.substr(cut)};
}

}  // namespace fixread
