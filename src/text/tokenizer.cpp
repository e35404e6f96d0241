#include "text/tokenizer.hpp"

#include <cctype>
#include <cstddef>
#include <utility>

#include "text/utf8.hpp"

namespace fixread {

namespace {

constexpr char32_t kEmDash = 0x2014;

const char* const kAbbreviations[] = {
    "mr", "mrs", "ms", "dr", "prof", "sr", "jr",
    "st", "ave", "blvd", "rd", "apt", "dept",
    "vs", "etc", "inc", "ltd", "corp",
    "jan", "feb", "apr", "jun", "jul",
    "aug", "sept", "oct", "nov", "dec",
    "vol", "approx", "govt",
    nullptr
};

bool is_word_char(char32_t cp) {
  if (cp < 0x80) {
    return std::isalnum(static_cast<unsigned char>(cp)) || cp == '_';
  }
  // Latin-1 letters (minus the multiplication and division signs), Latin
  // Extended, then the alphabetic scripts up to the punctuation blocks.
  if (cp >= 0xC0 && cp <= 0x24F) return cp != 0xD7 && cp != 0xF7;
  if (cp >= 0x370 && cp < 0x2000) return true;
  if (cp >= 0x3040 && cp <= 0x9FFF) return true;
  if (cp >= 0xAC00 && cp <= 0xD7AF) return true;
  return false;
}

bool is_punct_char(char32_t cp) {
  switch (cp) {
    case '.': case ',': case '!': case '?': case ';': case ':': case '-':
    case kEmDash:
      return true;
    default:
      return false;
  }
}

bool is_space_char(char32_t cp) {
  if (cp < 0x80) return std::isspace(static_cast<unsigned char>(cp)) != 0;
  return cp == 0xA0 || (cp >= 0x2000 && cp <= 0x200A) || cp == 0x2028 || cp == 0x2029 ||
         cp == 0x202F || cp == 0x205F || cp == 0x3000 || cp == 0xFEFF;
}

/// Byte length of a line break at `pos` ("\n" or "\r\n"), or 0.
std::size_t line_break_at(const std::string& text, std::size_t pos) {
  if (text[pos] == '\n') return 1;
  if (text[pos] == '\r' && pos + 1 < text.size() && text[pos + 1] == '\n') return 2;
  return 0;
}

bool is_blank(const std::string& s) {
  std::size_t len = 0;
  for (std::size_t pos = 0; pos < s.size(); pos += len) {
    if (!is_space_char(utf8::decode(s, pos, len))) return false;
  }
  return true;
}

bool is_single_letter(const std::string& word) {
  return word.size() == 1 && std::isalpha(static_cast<unsigned char>(word[0]));
}

/// True if the text at `pos`, after optional spaces, is a single letter
/// followed by a period ("J. R." or "e.g.").
bool initial_at(const std::string& text, std::size_t pos) {
  while (pos < text.size() && text[pos] == ' ') ++pos;
  if (pos + 1 >= text.size()) return false;
  if (!std::isalpha(static_cast<unsigned char>(text[pos])) || text[pos + 1] != '.') return false;
  std::size_t len = 0;
  return pos + 2 == text.size() || !is_word_char(utf8::decode(text, pos + 2, len));
}

/// Last code point of a non-empty string.
char32_t last_code_point(const std::string& s) {
  std::size_t pos = s.size() - 1;
  while (pos > 0 && (static_cast<unsigned char>(s[pos]) & 0xC0) == 0x80) --pos;
  std::size_t len = 0;
  return utf8::decode(s, pos, len);
}

}  // namespace

std::vector<std::string> split_paragraphs(const std::string& text) {
  std::vector<std::string> paragraphs;
  std::string current;

  std::size_t pos = 0;
  while (pos < text.size()) {
    std::size_t run_end = pos;
    int breaks = 0;
    while (run_end < text.size()) {
      const std::size_t n = line_break_at(text, run_end);
      if (n == 0) break;
      run_end += n;
      ++breaks;
    }

    if (breaks >= 2) {
      if (!is_blank(current)) paragraphs.push_back(current);
      current.clear();
      pos = run_end;
    } else if (breaks == 1) {
      current.append(text, pos, run_end - pos);
      pos = run_end;
    } else {
      current.push_back(text[pos]);
      ++pos;
    }
  }
  if (!is_blank(current)) paragraphs.push_back(current);

  return paragraphs;
}

std::vector<Token> tokenize(const std::string& paragraph) {
  std::vector<Token> tokens;
  const std::size_t n = paragraph.size();
  std::size_t pos = 0;

  while (pos < n) {
    std::size_t len = 0;
    const char32_t cp = utf8::decode(paragraph, pos, len);

    if (is_word_char(cp)) {
      std::size_t end = pos + len;
      bool apostrophe_used = false;
      while (end < n) {
        std::size_t next_len = 0;
        const char32_t next = utf8::decode(paragraph, end, next_len);
        if (is_word_char(next)) {
          end += next_len;
          continue;
        }
        // A single internal apostrophe joins a contraction ("don't").
        if (next == '\'' && !apostrophe_used && end + 1 < n) {
          std::size_t after_len = 0;
          if (is_word_char(utf8::decode(paragraph, end + 1, after_len))) {
            apostrophe_used = true;
            end += 1 + after_len;
            continue;
          }
        }
        break;
      }

      std::string word = paragraph.substr(pos, end - pos);
      // A lowercase letter, "I" or "A" is only an initial inside a run of
      // initials ("e.g.", "I. M. Pei").
      const bool in_initials =
          is_single_letter(word) &&
          ((!tokens.empty() && tokens.back().is_word() && tokens.back().content.size() == 2 &&
            tokens.back().content.back() == '.') ||
           initial_at(paragraph, end + 1));
      if (end < n && paragraph[end] == '.' && (is_known_abbreviation(word) || in_initials)) {
        word.push_back('.');
        ++end;
      }
      tokens.push_back(Token{.type = TokenType::Word, .content = std::move(word)});
      pos = end;
      continue;
    }

    if (is_punct_char(cp) || is_space_char(cp)) {
      const bool punct = is_punct_char(cp);
      std::size_t end = pos + len;
      while (end < n) {
        std::size_t next_len = 0;
        const char32_t next = utf8::decode(paragraph, end, next_len);
        if (punct ? !is_punct_char(next) : !is_space_char(next)) break;
        end += next_len;
      }
      tokens.push_back(Token{.type = punct ? TokenType::Punctuation : TokenType::Space,
                             .content = paragraph.substr(pos, end - pos)});
      pos = end;
      continue;
    }

    // Unmatched character: dropped.
    pos += len;
  }

  return tokens;
}

bool is_known_abbreviation(const std::string& word) {
  if (word.empty()) return false;
  std::string lower = word;
  for (auto& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  for (const char* const* p = kAbbreviations; *p; ++p) {
    if (lower == *p) return true;
  }
  // Capital initials ("J. R. R. Tolkien", "U.S."), except the words "I" and "A".
  const char c = word[0];
  return word.size() == 1 && std::isupper(static_cast<unsigned char>(c)) && c != 'I' && c != 'A';
}

bool ends_sentence(const std::string& token) {
  if (token.empty()) return false;
  const char last = token.back();
  return last == '.' || last == '!' || last == '?';
}

bool ends_clause(const std::string& token) {
  if (token.empty()) return false;
  const char32_t last = last_code_point(token);
  return last == ',' || last == ';' || last == kEmDash;
}

}  // namespace fixread
