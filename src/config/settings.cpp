#include "config/settings.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iostream>

#include <yaml-cpp/yaml.h>

namespace fixread {

namespace {

struct Preset {
  const char* name;
  double fixation;
  double saccade;
  double opacity;
  double speed;
  int max_words_per_chunk;
};

const Preset kPresets[] = {
    {"default", 0.5, 1.0, 1.0, 2.5, 10},
    {"dyslexia", 0.7, 1.2, 0.9, 3.0, 5},
    {"adhd", 0.6, 0.8, 1.0, 1.8, 8},
};

double clamp_or(double value, double lo, double hi, double fallback) {
  if (std::isnan(value)) return fallback;
  return std::max(lo, std::min(hi, value));
}

/// Parse a complete number; surrounding whitespace is allowed.
bool parse_number(const std::string& text, double& out) {
  const char* begin = text.c_str();
  char* end = nullptr;
  const double value = std::strtod(begin, &end);
  if (end == begin) return false;
  while (*end != '\0' && std::isspace(static_cast<unsigned char>(*end))) ++end;
  if (*end != '\0' || !std::isfinite(value)) return false;
  out = value;
  return true;
}

std::string lowercase(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

}  // namespace

bool operator==(const Settings& a, const Settings& b) {
  return a.fixation == b.fixation && a.saccade == b.saccade && a.opacity == b.opacity &&
         a.speed == b.speed && a.max_words_per_chunk == b.max_words_per_chunk &&
         a.reading_mode == b.reading_mode;
}

bool operator!=(const Settings& a, const Settings& b) { return !(a == b); }

Settings clamp_settings(const Settings& s) {
  const Settings defaults;
  Settings out = s;
  out.fixation = clamp_or(s.fixation, 0.2, 0.8, defaults.fixation);
  out.saccade = clamp_or(s.saccade, 0.5, 1.5, defaults.saccade);
  out.opacity = clamp_or(s.opacity, 0.3, 1.0, defaults.opacity);
  out.speed = clamp_or(s.speed, 0.5, 10.0, defaults.speed);
  out.max_words_per_chunk = std::max(3, std::min(20, s.max_words_per_chunk));
  return out;
}

bool apply_setting(Settings& settings, const std::string& key, const std::string& value) {
  if (key == "reading_mode") {
    const std::string mode = lowercase(value);
    if (mode == "chunk") {
      settings.reading_mode = ReadingMode::Chunk;
      return true;
    }
    if (mode == "paragraph") {
      settings.reading_mode = ReadingMode::Paragraph;
      return true;
    }
    return false;
  }

  double number = 0.0;
  const bool parsed = parse_number(value, number);

  if (key == "fixation") {
    if (parsed) settings.fixation = clamp_or(number, 0.2, 0.8, settings.fixation);
  } else if (key == "saccade") {
    if (parsed) settings.saccade = clamp_or(number, 0.5, 1.5, settings.saccade);
  } else if (key == "opacity") {
    if (parsed) settings.opacity = clamp_or(number, 0.3, 1.0, settings.opacity);
  } else if (key == "speed") {
    if (parsed) settings.speed = clamp_or(number, 0.5, 10.0, settings.speed);
  } else if (key == "max_words_per_chunk") {
    if (parsed) {
      const double rounded = std::round(clamp_or(number, 3.0, 20.0, 10.0));
      settings.max_words_per_chunk = static_cast<int>(rounded);
    }
  } else {
    return false;
  }
  return parsed;
}

std::vector<std::string> preset_names() {
  std::vector<std::string> names;
  for (const auto& p : kPresets) names.emplace_back(p.name);
  return names;
}

bool apply_preset(Settings& settings, const std::string& name) {
  const std::string wanted = lowercase(name);
  for (const auto& p : kPresets) {
    if (wanted != p.name) continue;
    settings.fixation = p.fixation;
    settings.saccade = p.saccade;
    settings.opacity = p.opacity;
    settings.speed = p.speed;
    settings.max_words_per_chunk = p.max_words_per_chunk;
    return true;
  }
  return false;
}

Settings load_settings(const std::string& path, const Settings& base) {
  Settings settings = base;

  try {
    YAML::Node root = YAML::LoadFile(path);
    if (root["preset"]) {
      const auto name = root["preset"].as<std::string>();
      if (!apply_preset(settings, name)) {
        std::cerr << "Warning: unknown preset '" << name << "' in " << path << "\n";
      }
    }
    if (root["reading"]) {
      for (const auto& entry : root["reading"]) {
        const auto key = entry.first.as<std::string>();
        const auto value = entry.second.as<std::string>();
        if (!apply_setting(settings, key, value)) {
          std::cerr << "Warning: ignoring reading." << key << "='" << value << "' in " << path
                    << "\n";
        }
      }
    }
  } catch (const YAML::Exception& e) {
    std::cerr << "Warning: could not parse settings file " << path << ": " << e.what() << "\n";
  }

  return clamp_settings(settings);
}

std::string to_string(ReadingMode mode) {
  return mode == ReadingMode::Paragraph ? "paragraph" : "chunk";
}

}  // namespace fixread
