#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace fixread {

enum class TokenType {
  Word,
  Space,
  Punctuation
};

/// One lexical unit of a paragraph.
///
/// For words, `bold` + `normal` always equals `content`: `bold` is the prefix
/// up to the fixation point and `normal` is the rest, including any
/// punctuation merged onto the word.  Spaces carry only `content`.
struct Token {
  TokenType type = TokenType::Word;
  std::string content;
  std::string bold;
  std::string normal;
  double opacity = 1.0;

  bool is_word() const { return type == TokenType::Word; }
  bool is_space() const { return type == TokenType::Space; }
  bool is_punctuation() const { return type == TokenType::Punctuation; }
};

/// A reading unit: the tokens shown together during playback.
///
/// A chunk with `paragraph_break` set is a sentinel between paragraphs.  It
/// has no tokens and an empty `original_content`.
struct Chunk {
  std::vector<Token> tokens;
  std::string original_content;
  std::size_t chunk_index = 0;
  bool paragraph_break = false;

  static Chunk paragraph_marker() {
    Chunk c;
    c.paragraph_break = true;
    return c;
  }

  std::size_t word_count() const {
    std::size_t n = 0;
    for (const auto& t : tokens) {
      if (t.is_word()) ++n;
    }
    return n;
  }

  /// Concatenated token content (equal to original_content once built).
  std::string text() const {
    std::string out;
    for (const auto& t : tokens) out += t.content;
    return out;
  }
};

using Paragraph = std::vector<Chunk>;

}  // namespace fixread
