#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "config/settings.hpp"
#include "text/chunk.hpp"

namespace fixread {

/// Turns raw document text into the finalized chunk sequence.
///
/// Stage 1 walks the tokens of every paragraph and closes a chunk after
/// each sentence (. ! ?) or clause (, ; em dash) terminator, inserting a
/// paragraph-break marker between paragraphs.  Stage 2 re-splits any chunk
/// holding more than `max_words_per_chunk` words on the nearest preceding
/// whitespace.  Finally every chunk, markers included, gets its position as
/// `chunk_index`.
///
/// Concatenating `original_content` over the result reproduces the
/// concatenated paragraphs, minus characters the tokenizer drops.
class ChunkBuilder {
public:
  explicit ChunkBuilder(const Settings& settings);

  /// Full pipeline: paragraphs -> natural chunks -> size split -> indices.
  std::vector<Chunk> build(const std::string& text) const;

  /// Stage 1 over already split paragraphs.
  std::vector<Chunk> build_natural_chunks(const std::vector<std::string>& paragraphs) const;

  /// Stage 2.  Markers and chunks within the limit pass through unchanged.
  std::vector<Chunk> split_oversized(const std::vector<Chunk>& chunks) const;

  /// Word token with bold/normal split and the configured opacity.
  Token make_word(const std::string& text) const;

  const Settings& settings() const { return settings_; }

private:
  Settings settings_;
};

/// Merge a punctuation token onto the nearest preceding word in `buffer`,
/// skipping spaces.  If a non-word, non-space token (or the start of the
/// buffer) is reached first, the punctuation is appended as its own token.
std::vector<Token> attach_punctuation(std::vector<Token> buffer, const Token& punctuation);

/// Assign contiguous 0-based `chunk_index` values by position.
void assign_chunk_indices(std::vector<Chunk>& chunks);

/// Convenience wrapper around ChunkBuilder(settings).build(text).
std::vector<Chunk> build_chunks(const std::string& text, const Settings& settings);

}  // namespace fixread
