#include "runtime/playback_controller.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

#include "runtime/progress_tracker.hpp"
#include "text/chunk_builder.hpp"
#include "text/paragraph_grouper.hpp"

namespace fixread {

PlaybackController::PlaybackController(Scheduler& scheduler) : scheduler_(scheduler) {}

PlaybackController::PlaybackController(Scheduler& scheduler, const std::string& text,
                                       const Settings& settings)
    : scheduler_(scheduler) {
  load(text, settings);
}

PlaybackController::~PlaybackController() {
  stop_timer();
}

void PlaybackController::load(const std::string& text, const Settings& settings) {
  // Tear down first so no tick can run against the new chunks.
  stop_timer();

  settings_ = clamp_settings(settings);
  text_ = text;
  chunks_ = build_chunks(text_, settings_);
  readable_ = readable_chunks(chunks_);
  paragraphs_ = group_paragraphs(chunks_);

  state_ = PlaybackState{};
  state_.mode = settings_.reading_mode;
  stats_ = ReadingStats{};
}

void PlaybackController::play() {
  if (state_.mode != ReadingMode::Chunk) return;
  if (readable_.empty() || state_.is_playing()) return;

  if (!state_.start_time) state_.start_time = scheduler_.now();
  state_.status = PlaybackStatus::Playing;
  timer_ = scheduler_.schedule([this] { on_tick(); }, settings_.speed);

  if (log_) {
    std::cout << "[playback] " << to_string(state_.status) << "  chunk=" << state_.chunk_cursor
              << "/" << readable_.size() << "  speed=" << settings_.speed << "s" << std::endl;
  }
}

void PlaybackController::pause() {
  if (!state_.is_playing()) return;
  stop_timer();
  ++stats_.pause_count;
  state_.status = PlaybackStatus::Paused;

  if (log_) {
    std::cout << "[playback] " << to_string(state_.status) << "  chunk=" << state_.chunk_cursor
              << "  pauses=" << stats_.pause_count << std::endl;
  }
}

void PlaybackController::toggle() {
  if (state_.is_playing()) {
    pause();
  } else {
    play();
  }
}

void PlaybackController::reset() {
  stop_timer();
  const ReadingMode mode = state_.mode;
  state_ = PlaybackState{};
  state_.mode = mode;
  stats_ = ReadingStats{};
}

bool PlaybackController::next_paragraph() {
  if (state_.mode != ReadingMode::Paragraph) return false;
  if (paragraphs_.empty() || state_.paragraph_cursor + 1 >= paragraphs_.size()) return false;

  // The paragraph just finished counts as read.
  stats_.words_read += count_words(paragraphs_[state_.paragraph_cursor]);
  ++state_.paragraph_cursor;
  emit(ProgressEvent{stats_.words_read, stats_.wpm, progress_percent()});
  return true;
}

bool PlaybackController::previous_paragraph() {
  if (state_.mode != ReadingMode::Paragraph) return false;
  if (state_.paragraph_cursor == 0) return false;

  --state_.paragraph_cursor;
  ++stats_.backtrack_count;
  emit(ProgressEvent{stats_.words_read, stats_.wpm, progress_percent()});
  return true;
}

double PlaybackController::progress_percent() const {
  if (state_.mode == ReadingMode::Chunk) {
    if (readable_.empty()) return 0.0;
    return 100.0 * static_cast<double>(state_.chunk_cursor) / static_cast<double>(readable_.size());
  }
  if (paragraphs_.empty()) return 0.0;
  return 100.0 * static_cast<double>(state_.paragraph_cursor) /
         static_cast<double>(paragraphs_.size());
}

int PlaybackController::comprehension_score() const {
  return calculate_comprehension_score(stats_.pause_count, stats_.backtrack_count);
}

std::vector<Token> PlaybackController::current_tokens() const {
  if (state_.mode == ReadingMode::Chunk) {
    if (state_.chunk_cursor >= readable_.size()) return {};
    return readable_[state_.chunk_cursor].tokens;
  }
  if (state_.paragraph_cursor >= paragraphs_.size()) return {};
  std::vector<Token> tokens;
  for (const auto& chunk : paragraphs_[state_.paragraph_cursor]) {
    tokens.insert(tokens.end(), chunk.tokens.begin(), chunk.tokens.end());
  }
  return tokens;
}

void PlaybackController::on_tick() {
  if (!state_.is_playing()) return;

  const std::size_t next = state_.chunk_cursor + 1;
  if (next >= readable_.size()) {
    // End of text: stay on the last chunk and stop.
    stop_timer();
    state_.status = PlaybackStatus::Idle;
    if (log_) {
      std::cout << "[playback] end of text, " << to_string(state_.status)
                << "  words=" << stats_.words_read << "  wpm=" << stats_.wpm << std::endl;
    }
    return;
  }

  std::size_t words = 0;
  for (std::size_t i = 0; i < next; ++i) words += readable_[i].word_count();

  const double elapsed = scheduler_.now() - state_.start_time.value_or(scheduler_.now());
  state_.chunk_cursor = next;
  stats_.words_read = words;
  stats_.time_elapsed_seconds = elapsed;
  stats_.wpm = calculate_wpm(words, elapsed);

  emit(ProgressEvent{words, stats_.wpm, progress_percent()});
}

void PlaybackController::stop_timer() {
  if (timer_ != kNoTimer) {
    scheduler_.cancel(timer_);
    timer_ = kNoTimer;
  }
}

void PlaybackController::emit(const ProgressEvent& event) {
  if (log_) {
    std::ostringstream percent;
    percent << std::fixed << std::setprecision(1) << event.progress_percent;
    std::cout << "[playback] " << to_string(state_.mode) << "=" << state_.cursor()
              << "  words=" << event.words_read << "  wpm=" << event.wpm
              << "  progress=" << percent.str() << "%  | " << current_preview() << std::endl;
  }
  if (listener_) listener_(event);
}

std::string PlaybackController::current_preview() const {
  const int max_words = 6;
  std::string result;
  int words = 0;
  for (const auto& token : current_tokens()) {
    if (token.is_word() && ++words > max_words) {
      result += "...";
      break;
    }
    // Collapse line breaks and tabs so the log stays on one line.
    result += token.is_space() ? std::string(" ") : token.content;
  }
  return result;
}

std::string to_string(PlaybackStatus status) {
  switch (status) {
    case PlaybackStatus::Playing:
      return "playing";
    case PlaybackStatus::Paused:
      return "paused";
    case PlaybackStatus::Idle:
      break;
  }
  return "idle";
}

}  // namespace fixread
