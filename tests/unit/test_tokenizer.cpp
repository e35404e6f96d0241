#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "text/tokenizer.hpp"

using fixread::Token;
using fixread::TokenType;

namespace {

std::vector<std::string> contents(const std::vector<Token>& tokens) {
  std::vector<std::string> out;
  for (const auto& t : tokens) out.push_back(t.content);
  return out;
}

}  // namespace

// ---------------------------------------------------------------------------
// Paragraph splitting
// ---------------------------------------------------------------------------

TEST(SplitParagraphs, SplitsOnBlankLines) {
  auto p = fixread::split_paragraphs("First.\n\nSecond.\n\n\nThird.");
  ASSERT_EQ(p.size(), 3u);
  EXPECT_EQ(p[0], "First.");
  EXPECT_EQ(p[1], "Second.");
  EXPECT_EQ(p[2], "Third.");
}

TEST(SplitParagraphs, SingleLineBreakStaysInParagraph) {
  auto p = fixread::split_paragraphs("line one\nline two");
  ASSERT_EQ(p.size(), 1u);
  EXPECT_EQ(p[0], "line one\nline two");
}

TEST(SplitParagraphs, HandlesWindowsLineEndings) {
  auto p = fixread::split_paragraphs("One.\r\n\r\nTwo.");
  ASSERT_EQ(p.size(), 2u);
  EXPECT_EQ(p[0], "One.");
  EXPECT_EQ(p[1], "Two.");
}

TEST(SplitParagraphs, DropsBlankParagraphsButKeepsText) {
  auto p = fixread::split_paragraphs("\n\n\n  A.\n\n   \n\nB.  ");
  ASSERT_EQ(p.size(), 2u);
  EXPECT_EQ(p[0], "  A.");
  EXPECT_EQ(p[1], "B.  ");
}

TEST(SplitParagraphs, EmptyTextHasNoParagraphs) {
  EXPECT_TRUE(fixread::split_paragraphs("").empty());
  EXPECT_TRUE(fixread::split_paragraphs(" \n\n \t ").empty());
}

// ---------------------------------------------------------------------------
// Token classification
// ---------------------------------------------------------------------------

TEST(Tokenize, WordsSpacesAndPunctuation) {
  auto tokens = fixread::tokenize("Dr. Smith said hello.");
  std::vector<std::string> expected = {"Dr.", " ", "Smith", " ", "said", " ", "hello", "."};
  EXPECT_EQ(contents(tokens), expected);
  EXPECT_EQ(tokens[0].type, TokenType::Word);
  EXPECT_EQ(tokens[1].type, TokenType::Space);
  EXPECT_EQ(tokens[7].type, TokenType::Punctuation);
}

TEST(Tokenize, KeepsContractionsTogether) {
  auto tokens = fixread::tokenize("don't stop");
  std::vector<std::string> expected = {"don't", " ", "stop"};
  EXPECT_EQ(contents(tokens), expected);
}

TEST(Tokenize, TrailingApostropheIsDropped) {
  auto tokens = fixread::tokenize("dogs' bones");
  std::vector<std::string> expected = {"dogs", " ", "bones"};
  EXPECT_EQ(contents(tokens), expected);
}

TEST(Tokenize, PunctuationRunsStayTogether) {
  auto tokens = fixread::tokenize("Wait...what?!");
  std::vector<std::string> expected = {"Wait", "...", "what", "?!"};
  EXPECT_EQ(contents(tokens), expected);
  EXPECT_EQ(tokens[1].type, TokenType::Punctuation);
  EXPECT_EQ(tokens[3].type, TokenType::Punctuation);
}

TEST(Tokenize, EmDashIsPunctuation) {
  auto tokens = fixread::tokenize("yes—no");
  ASSERT_EQ(tokens.size(), 3u);
  EXPECT_EQ(tokens[1].type, TokenType::Punctuation);
  EXPECT_EQ(tokens[1].content, "—");
}

TEST(Tokenize, DropsUnmatchedCharacters) {
  auto tokens = fixread::tokenize("\"Hi\" (there)");
  std::vector<std::string> expected = {"Hi", " ", "there"};
  EXPECT_EQ(contents(tokens), expected);
}

TEST(Tokenize, WhitespaceKeptVerbatim) {
  auto tokens = fixread::tokenize("a \t\n b");
  ASSERT_EQ(tokens.size(), 3u);
  EXPECT_EQ(tokens[1].content, " \t\n ");
}

TEST(Tokenize, InitialsKeepTheirPeriod) {
  auto tokens = fixread::tokenize("J. R. R. Tolkien");
  std::vector<std::string> expected = {"J.", " ", "R.", " ", "R.", " ", "Tolkien"};
  EXPECT_EQ(contents(tokens), expected);
}

TEST(Tokenize, LowercaseInitialsInsideARun) {
  auto tokens = fixread::tokenize("e.g. this");
  std::vector<std::string> expected = {"e.", "g.", " ", "this"};
  EXPECT_EQ(contents(tokens), expected);
}

TEST(Tokenize, PronounIKeepsPeriodOnlyBeforeAnotherInitial) {
  std::vector<std::string> sentence = {"So", " ", "did", " ", "I", ".", " ", "Then"};
  EXPECT_EQ(contents(fixread::tokenize("So did I. Then")), sentence);

  std::vector<std::string> name = {"I.", " ", "M.", " ", "Pei"};
  EXPECT_EQ(contents(fixread::tokenize("I. M. Pei")), name);
}

TEST(Tokenize, UnicodeLettersFormWords) {
  auto tokens = fixread::tokenize("über café");
  std::vector<std::string> expected = {"über", " ", "café"};
  EXPECT_EQ(contents(tokens), expected);
  EXPECT_EQ(tokens[0].type, TokenType::Word);
}

// ---------------------------------------------------------------------------
// Terminators and abbreviations
// ---------------------------------------------------------------------------

TEST(Terminators, SentenceAndClauseEndings) {
  EXPECT_TRUE(fixread::ends_sentence("."));
  EXPECT_TRUE(fixread::ends_sentence("?!"));
  EXPECT_FALSE(fixread::ends_sentence(".,"));
  EXPECT_TRUE(fixread::ends_clause(","));
  EXPECT_TRUE(fixread::ends_clause(";"));
  EXPECT_TRUE(fixread::ends_clause("—"));
  EXPECT_FALSE(fixread::ends_clause(":"));
  EXPECT_FALSE(fixread::ends_clause("-"));
}

TEST(Abbreviations, KnownListIsCaseInsensitive) {
  EXPECT_TRUE(fixread::is_known_abbreviation("Dr"));
  EXPECT_TRUE(fixread::is_known_abbreviation("ETC"));
  EXPECT_TRUE(fixread::is_known_abbreviation("X"));
  EXPECT_FALSE(fixread::is_known_abbreviation("x"));
  EXPECT_FALSE(fixread::is_known_abbreviation("I"));
  EXPECT_FALSE(fixread::is_known_abbreviation("A"));
  EXPECT_FALSE(fixread::is_known_abbreviation("hello"));
  EXPECT_FALSE(fixread::is_known_abbreviation("7"));
  EXPECT_FALSE(fixread::is_known_abbreviation(""));
}

TEST(Abbreviations, OrdinaryWordsAreNotAbbreviations) {
  for (const char* w : {"no", "co", "est", "mar", "fig", "So"}) {
    EXPECT_FALSE(fixread::is_known_abbreviation(w)) << w;
  }
}
