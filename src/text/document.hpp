#pragma once

#include <cstddef>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

#include "text/tokenizer.hpp"

namespace fixread {

/// Plain text handed to the reader, loaded from a file or from memory.
///
/// The text is expected to be extracted and sanitized already; no markup
/// is stripped here.  An empty document is valid and yields no chunks.
class Document {
public:
  explicit Document(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
      throw std::runtime_error("Document: cannot open file: " + path);
    }
    text_ = std::string((std::istreambuf_iterator<char>(f)),
                        std::istreambuf_iterator<char>());
    path_ = path;
  }

  /// Construct from an in-memory string (useful for tests).
  static Document from_string(const std::string& text) {
    Document doc;
    doc.text_ = text;
    doc.path_ = "<memory>";
    return doc;
  }

  /// Paragraphs as the chunk builder sees them.
  std::vector<std::string> paragraphs() const { return split_paragraphs(text_); }

  bool empty() const { return paragraphs().empty(); }
  std::size_t size() const { return text_.size(); }

  /// The file path (or "<memory>" for from_string).
  const std::string& path() const { return path_; }

  const std::string& text() const { return text_; }

private:
  Document() = default;

  std::string text_;
  std::string path_;
};

}  // namespace fixread
