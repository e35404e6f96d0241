#pragma once

#include <string>
#include <vector>

namespace fixread {

enum class ReadingMode {
  Chunk,
  Paragraph
};

/// Reader configuration.  Every numeric field has a documented range and is
/// clamped into it before use (see clamp_settings()).
struct Settings {
  double fixation = 0.5;          ///< Fraction of each word rendered bold [0.2, 0.8].
  double saccade = 1.0;           ///< Gaze-width hint for renderers [0.5, 1.5].
  double opacity = 1.0;           ///< Opacity applied to word tokens [0.3, 1.0].
  double speed = 2.5;             ///< Seconds per chunk during playback [0.5, 10.0].
  int max_words_per_chunk = 10;   ///< Upper bound on words per chunk [3, 20].
  ReadingMode reading_mode = ReadingMode::Chunk;
};

bool operator==(const Settings& a, const Settings& b);
bool operator!=(const Settings& a, const Settings& b);

/// Copy of `s` with every numeric field clamped to its range.
/// NaN values fall back to the defaults.
Settings clamp_settings(const Settings& s);

/// Update one field from its textual value.
///
/// Keys: fixation, saccade, opacity, speed, max_words_per_chunk,
/// reading_mode.  Numeric values are clamped (max_words_per_chunk is
/// rounded to the nearest integer); a value that does not parse, or an
/// unknown reading mode, leaves the field untouched.  Returns false when
/// the key is unknown or the value was rejected.
bool apply_setting(Settings& settings, const std::string& key, const std::string& value);

/// Names accepted by apply_preset(): "default", "dyslexia", "adhd".
std::vector<std::string> preset_names();

/// Overwrite fixation, saccade, opacity, speed and max_words_per_chunk
/// with a named preset.  The reading mode is kept.  Returns false (and
/// leaves `settings` unchanged) for an unknown name.
bool apply_preset(Settings& settings, const std::string& name);

/// Load settings from a YAML file on top of `base`.
///
/// Recognised layout:
///   preset: dyslexia          # optional, applied first
///   reading:
///     fixation: 0.6
///     speed: 2.0
///     reading_mode: paragraph
///
/// A missing or malformed file, or a rejected value, is reported as a
/// warning on stderr; the affected fields keep their `base` values.
Settings load_settings(const std::string& path, const Settings& base = Settings{});

std::string to_string(ReadingMode mode);

}  // namespace fixread
