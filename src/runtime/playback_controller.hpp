#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "config/settings.hpp"
#include "runtime/scheduler.hpp"
#include "text/chunk.hpp"

namespace fixread {

enum class PlaybackStatus {
  Idle,
  Playing,
  Paused
};

/// Where the reader is.  `chunk_cursor` indexes readable (non-marker)
/// chunks, `paragraph_cursor` indexes paragraphs; which one is live
/// depends on `mode`.
struct PlaybackState {
  ReadingMode mode = ReadingMode::Chunk;
  PlaybackStatus status = PlaybackStatus::Idle;
  std::size_t chunk_cursor = 0;
  std::size_t paragraph_cursor = 0;
  std::optional<double> start_time;   ///< Scheduler time of the first Play.

  bool is_playing() const { return status == PlaybackStatus::Playing; }
  std::size_t cursor() const {
    return mode == ReadingMode::Chunk ? chunk_cursor : paragraph_cursor;
  }
};

struct ReadingStats {
  std::size_t words_read = 0;
  int wpm = 0;
  double time_elapsed_seconds = 0.0;
  int pause_count = 0;
  int backtrack_count = 0;
};

/// Emitted on every accepted tick and paragraph navigation.
struct ProgressEvent {
  std::size_t words_read = 0;
  int wpm = 0;
  double progress_percent = 0.0;   ///< 0..100
};

/// Drives a reader through the chunks of one text.
///
/// In chunk mode play() arms a repeating timer on the Scheduler that moves
/// the cursor one readable chunk every `settings.speed` seconds.  In
/// paragraph mode the reader steps manually with next_paragraph() and
/// previous_paragraph().  Requests outside the valid bounds, or for the
/// other mode, are silently ignored.
///
/// The controller owns its state and statistics; callers get copies via
/// state()/stats() or through the progress listener.  The timer is
/// cancelled on every exit from Playing (pause, reset, reload, end of text
/// and destruction).
class PlaybackController {
public:
  using ProgressListener = std::function<void(const ProgressEvent&)>;

  explicit PlaybackController(Scheduler& scheduler);
  PlaybackController(Scheduler& scheduler, const std::string& text, const Settings& settings);
  ~PlaybackController();

  PlaybackController(const PlaybackController&) = delete;
  PlaybackController& operator=(const PlaybackController&) = delete;

  /// Replace text and settings, rebuild all chunks and return to Idle with
  /// zeroed statistics.  Settings are clamped first.
  void load(const std::string& text, const Settings& settings);
  void set_text(const std::string& text) { load(text, settings_); }
  void set_settings(const Settings& settings) { load(text_, settings); }

  // --- Commands ---
  void play();
  void pause();
  /// Play when stopped, pause when playing.
  void toggle();
  void reset();
  /// Returns false when the request was out of bounds or in chunk mode.
  bool next_paragraph();
  bool previous_paragraph();

  // --- Snapshots ---
  PlaybackState state() const { return state_; }
  ReadingStats stats() const { return stats_; }
  double progress_percent() const;
  int comprehension_score() const;

  const Settings& settings() const { return settings_; }
  const std::string& text() const { return text_; }

  /// Finalized chunk sequence, paragraph-break markers included.
  const std::vector<Chunk>& chunks() const { return chunks_; }
  const std::vector<Chunk>& readable() const { return readable_; }
  const std::vector<Paragraph>& paragraphs() const { return paragraphs_; }

  /// Tokens to display now: the current chunk, or every chunk of the
  /// current paragraph in paragraph mode.
  std::vector<Token> current_tokens() const;

  void set_progress_listener(ProgressListener listener) { listener_ = std::move(listener); }

  /// Enable/disable per-event logging on stdout.
  void set_log(bool enabled) { log_ = enabled; }

private:
  void on_tick();
  void stop_timer();
  void emit(const ProgressEvent& event);
  /// The first few words of the current unit, for log lines.
  std::string current_preview() const;

  Scheduler& scheduler_;
  Settings settings_;
  std::string text_;

  std::vector<Chunk> chunks_;
  std::vector<Chunk> readable_;
  std::vector<Paragraph> paragraphs_;

  PlaybackState state_;
  ReadingStats stats_;
  TimerId timer_{kNoTimer};
  ProgressListener listener_;
  bool log_{false};
};

std::string to_string(PlaybackStatus status);

}  // namespace fixread
