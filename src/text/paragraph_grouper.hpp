#pragma once

#include <cstddef>
#include <utility>
#include <vector>

#include "text/chunk.hpp"

namespace fixread {

/// Regroup a finalized chunk sequence into paragraphs.
/// Paragraph-break markers close the running paragraph; empty paragraphs
/// are never produced.
inline std::vector<Paragraph> group_paragraphs(const std::vector<Chunk>& chunks) {
  std::vector<Paragraph> paragraphs;
  Paragraph current;
  for (const auto& chunk : chunks) {
    if (chunk.paragraph_break) {
      if (!current.empty()) paragraphs.push_back(std::move(current));
      current = Paragraph{};
    } else {
      current.push_back(chunk);
    }
  }
  if (!current.empty()) paragraphs.push_back(std::move(current));
  return paragraphs;
}

/// The chunks a reader actually steps through: everything but markers.
inline std::vector<Chunk> readable_chunks(const std::vector<Chunk>& chunks) {
  std::vector<Chunk> out;
  out.reserve(chunks.size());
  for (const auto& chunk : chunks) {
    if (!chunk.paragraph_break) out.push_back(chunk);
  }
  return out;
}

inline std::size_t count_words(const Paragraph& paragraph) {
  std::size_t n = 0;
  for (const auto& chunk : paragraph) n += chunk.word_count();
  return n;
}

}  // namespace fixread
