#pragma once

#include <string>
#include <vector>

#include "text/chunk.hpp"

namespace fixread {

/// Split a document into paragraphs on runs of two or more line breaks
/// ("\n" or "\r\n").  Paragraphs that are blank after trimming are dropped;
/// the text of the remaining paragraphs is returned untrimmed.
std::vector<std::string> split_paragraphs(const std::string& text);

/// Split one paragraph into word, space and punctuation tokens.
///
/// - Words are runs of letters, digits and '_' (UTF-8 letters included)
///   with at most one internal apostrophe ("don't").  A known abbreviation
///   or initial keeps its trailing period ("Dr.", "J.", "e.g."), so it
///   does not end the sentence.
/// - Punctuation is a run of . , ! ? ; : - and the em dash.
/// - Whitespace runs are kept verbatim.
/// Any other character (quotes, brackets, symbols) is dropped.
///
/// Only `type` and `content` are filled in; fixation is applied later by
/// the chunk builder.
std::vector<Token> tokenize(const std::string& paragraph);

/// True for words that conventionally end in a period without ending a
/// sentence ("Dr", "etc", "Jan").  Case-insensitive, except that single
/// capital letters other than "I" and "A" count as initials.
bool is_known_abbreviation(const std::string& word);

/// True if `token` ends with a sentence terminator (. ! ?).
bool ends_sentence(const std::string& token);

/// True if `token` ends with a clause terminator (, ; em dash).
bool ends_clause(const std::string& token);

}  // namespace fixread
