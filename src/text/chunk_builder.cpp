#include "text/chunk_builder.hpp"

#include <utility>

#include "text/fixation.hpp"
#include "text/tokenizer.hpp"

namespace fixread {

namespace {

/// Running state of the stage 1 fold: finished chunks plus the open one.
struct ChunkAccumulator {
  std::vector<Chunk> done;
  Chunk open;

  void close() {
    if (open.tokens.empty()) return;
    done.push_back(std::move(open));
    open = Chunk{};
  }
};

bool has_visible_token(const Chunk& chunk) {
  for (const auto& t : chunk.tokens) {
    if (!t.is_space()) return true;
  }
  return false;
}

std::size_t count_words(const std::vector<Token>& tokens, std::size_t end) {
  std::size_t n = 0;
  for (std::size_t i = 0; i < end; ++i) {
    if (tokens[i].is_word()) ++n;
  }
  return n;
}

/// Cut the next piece of `source`.  Punctuation merged across a space
/// reorders token text but never moves it past a split point, so the
/// piece's original text is the next run of the same byte length.
Chunk take_piece(const Chunk& source, std::vector<Token> tokens, std::size_t& consumed) {
  Chunk c;
  c.tokens = std::move(tokens);
  const std::size_t len = c.text().size();
  c.original_content = source.original_content.substr(consumed, len);
  consumed += len;
  return c;
}

}  // namespace

ChunkBuilder::ChunkBuilder(const Settings& settings) : settings_(clamp_settings(settings)) {}

std::vector<Chunk> ChunkBuilder::build(const std::string& text) const {
  auto chunks = split_oversized(build_natural_chunks(split_paragraphs(text)));
  assign_chunk_indices(chunks);
  return chunks;
}

Token ChunkBuilder::make_word(const std::string& text) const {
  // Abbreviations keep their period; fixation is computed on the letters.
  std::string stem = text;
  std::string tail;
  if (stem.size() > 1 && stem.back() == '.') {
    stem.pop_back();
    tail = ".";
  }
  auto [bold, normal] = split_fixation(stem, settings_.fixation);
  return Token{.type = TokenType::Word,
               .content = text,
               .bold = std::move(bold),
               .normal = normal + tail,
               .opacity = settings_.opacity};
}

std::vector<Chunk> ChunkBuilder::build_natural_chunks(
    const std::vector<std::string>& paragraphs) const {
  ChunkAccumulator acc;

  for (std::size_t p = 0; p < paragraphs.size(); ++p) {
    const std::size_t paragraph_start = acc.done.size();

    for (const Token& token : tokenize(paragraphs[p])) {
      switch (token.type) {
        case TokenType::Word:
          acc.open.tokens.push_back(make_word(token.content));
          break;
        case TokenType::Space:
          acc.open.tokens.push_back(token);
          break;
        case TokenType::Punctuation: {
          Token punct = token;
          punct.opacity = settings_.opacity;
          acc.open.tokens = attach_punctuation(std::move(acc.open.tokens), punct);
          break;
        }
      }
      acc.open.original_content += token.content;

      if (token.is_punctuation() && (ends_sentence(token.content) || ends_clause(token.content))) {
        acc.close();
      }
    }

    // Trailing whitespace belongs to the paragraph's last chunk.
    if (!acc.open.tokens.empty() && !has_visible_token(acc.open) &&
        acc.done.size() > paragraph_start) {
      Chunk& last = acc.done.back();
      for (auto& t : acc.open.tokens) last.tokens.push_back(std::move(t));
      last.original_content += acc.open.original_content;
      acc.open = Chunk{};
    } else if (has_visible_token(acc.open)) {
      acc.close();
    } else {
      acc.open = Chunk{};
    }

    if (p + 1 < paragraphs.size()) {
      acc.done.push_back(Chunk::paragraph_marker());
    }
  }

  return std::move(acc.done);
}

std::vector<Chunk> ChunkBuilder::split_oversized(const std::vector<Chunk>& chunks) const {
  const auto max_words = static_cast<std::size_t>(settings_.max_words_per_chunk);
  std::vector<Chunk> out;
  out.reserve(chunks.size());

  for (const Chunk& chunk : chunks) {
    if (chunk.paragraph_break || chunk.word_count() <= max_words) {
      out.push_back(chunk);
      continue;
    }

    std::vector<Token> piece;
    std::size_t words = 0;
    std::size_t consumed = 0;
    for (const Token& token : chunk.tokens) {
      if (token.is_word() && words == max_words) {
        // Split after the nearest space that still leaves words in the head;
        // without one, split right before this word.
        std::size_t split = piece.size();
        for (std::size_t i = piece.size(); i-- > 0;) {
          if (piece[i].is_space()) {
            if (count_words(piece, i) > 0) split = i + 1;
            break;
          }
        }
        std::vector<Token> rest(piece.begin() + static_cast<std::ptrdiff_t>(split), piece.end());
        piece.resize(split);
        out.push_back(take_piece(chunk, std::move(piece), consumed));
        piece = std::move(rest);
        words = count_words(piece, piece.size());
      }
      piece.push_back(token);
      if (token.is_word()) ++words;
    }
    if (!piece.empty()) out.push_back(take_piece(chunk, std::move(piece), consumed));
  }

  return out;
}

std::vector<Token> attach_punctuation(std::vector<Token> buffer, const Token& punctuation) {
  for (std::size_t i = buffer.size(); i-- > 0;) {
    Token& candidate = buffer[i];
    if (candidate.is_word()) {
      candidate.content += punctuation.content;
      candidate.normal += punctuation.content;
      return buffer;
    }
    if (!candidate.is_space()) break;
  }
  Token standalone = punctuation;
  standalone.type = TokenType::Punctuation;
  standalone.bold.clear();
  standalone.normal = standalone.content;
  buffer.push_back(std::move(standalone));
  return buffer;
}

void assign_chunk_indices(std::vector<Chunk>& chunks) {
  for (std::size_t i = 0; i < chunks.size(); ++i) {
    chunks[i].chunk_index = i;
  }
}

std::vector<Chunk> build_chunks(const std::string& text, const Settings& settings) {
  return ChunkBuilder(settings).build(text);
}

}  // namespace fixread
