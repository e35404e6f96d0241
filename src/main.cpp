#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "config/settings.hpp"
#include "runtime/event_loop.hpp"
#include "runtime/playback_controller.hpp"
#include "text/document.hpp"

namespace {

void usage(const char* prog) {
  std::cerr
      << "Usage:\n"
      << "  " << prog << " --input FILE [options]\n\n"
      << "Required:\n"
      << "  --input  FILE     Path to a plain text file to read\n\n"
      << "Options:\n"
      << "  --config FILE     YAML settings file (see configs/)\n"
      << "  --preset NAME     Apply a preset: default, dyslexia, adhd\n"
      << "  --set KEY=VALUE   Override one setting (repeatable), e.g. --set speed=1.5\n"
      << "  --dump            Print the chunk sequence and exit (default)\n"
      << "  --play            Play the text: timed in chunk mode, stepped in paragraph mode\n"
      << "  --no-color        Do not emphasize fixation prefixes with terminal bold\n"
      << "  --log             Print per-event playback logging\n"
      << "  -h, --help        Show this help message\n\n"
      << "Examples:\n"
      << "  " << prog << " --input data/article.txt --dump\n"
      << "  " << prog << " --input data/article.txt --config configs/default.yaml --play\n"
      << "  " << prog << " --input data/article.txt --preset dyslexia --set reading_mode=paragraph --play\n";
}

/// Render tokens with the fixation prefix of each word in bold.
std::string render(const std::vector<fixread::Token>& tokens, bool color) {
  std::string out;
  for (const auto& token : tokens) {
    if (token.is_space()) {
      out += ' ';
    } else if (token.is_word() && color) {
      out += "\033[1m" + token.bold + "\033[0m" + token.normal;
    } else {
      out += token.content;
    }
  }
  return out;
}

void dump(const fixread::PlaybackController& controller, bool color) {
  std::size_t words = 0;
  for (const auto& chunk : controller.chunks()) {
    if (chunk.paragraph_break) {
      std::cout << "     --- paragraph break ---\n";
      continue;
    }
    words += chunk.word_count();
    std::cout << (chunk.chunk_index < 10 ? "   " : chunk.chunk_index < 100 ? "  " : " ")
              << chunk.chunk_index << " [" << chunk.word_count() << "] "
              << render(chunk.tokens, color) << "\n";
  }
  std::cout << "\n" << controller.readable().size() << " chunks, "
            << controller.paragraphs().size() << " paragraphs, " << words << " words\n";
}

void print_summary(const fixread::PlaybackController& controller) {
  const auto stats = controller.stats();
  std::cout << "\nWords read:    " << stats.words_read << "\n"
            << "WPM:           " << stats.wpm << "\n"
            << "Time:          " << static_cast<int>(stats.time_elapsed_seconds + 0.5) << "s\n"
            << "Pauses:        " << stats.pause_count << "\n"
            << "Backtracks:    " << stats.backtrack_count << "\n"
            << "Comprehension: " << controller.comprehension_score() << "\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string input_file;
  std::string config_file;
  std::string preset;
  std::vector<std::string> overrides;
  bool play = false;
  bool color = true;
  bool log = false;

  // --- Parse arguments ---
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      usage(argv[0]);
      return 0;
    }
    if (arg == "--input") {
      if (i + 1 >= argc) { std::cerr << "--input requires a file path\n"; return 2; }
      input_file = argv[++i];
      continue;
    }
    if (arg == "--config") {
      if (i + 1 >= argc) { std::cerr << "--config requires a file path\n"; return 2; }
      config_file = argv[++i];
      continue;
    }
    if (arg == "--preset") {
      if (i + 1 >= argc) { std::cerr << "--preset requires a name\n"; return 2; }
      preset = argv[++i];
      continue;
    }
    if (arg == "--set") {
      if (i + 1 >= argc) { std::cerr << "--set requires KEY=VALUE\n"; return 2; }
      overrides.emplace_back(argv[++i]);
      continue;
    }
    if (arg == "--dump") { play = false; continue; }
    if (arg == "--play") { play = true; continue; }
    if (arg == "--no-color") { color = false; continue; }
    if (arg == "--log") { log = true; continue; }

    std::cerr << "Unknown argument: " << arg << "\n";
    usage(argv[0]);
    return 2;
  }

  if (input_file.empty()) {
    std::cerr << "Error: --input is required.\n\n";
    usage(argv[0]);
    return 2;
  }

  // --- Settings: file, then preset, then individual overrides ---
  fixread::Settings settings;
  if (!config_file.empty()) {
    settings = fixread::load_settings(config_file, settings);
  }
  if (!preset.empty() && !fixread::apply_preset(settings, preset)) {
    std::cerr << "Warning: unknown preset '" << preset << "', keeping current settings\n";
  }
  for (const auto& kv : overrides) {
    const auto eq = kv.find('=');
    if (eq == std::string::npos || !fixread::apply_setting(settings, kv.substr(0, eq), kv.substr(eq + 1))) {
      std::cerr << "Warning: ignoring --set " << kv << "\n";
    }
  }

  // --- Load text ---
  std::string text;
  try {
    text = fixread::Document(input_file).text();
  } catch (const std::exception& e) {
    std::cerr << "Error loading text file: " << e.what() << "\n";
    return 1;
  }

  fixread::EventLoop loop;
  fixread::PlaybackController controller(loop, text, settings);
  controller.set_log(log);

  const auto& s = controller.settings();
  std::cout << "Input:    " << input_file << " (" << text.size() << " bytes)\n";
  std::cout << "Settings: fixation=" << s.fixation << " opacity=" << s.opacity
            << " speed=" << s.speed << "s max_words=" << s.max_words_per_chunk
            << " mode=" << fixread::to_string(s.reading_mode) << "\n\n";

  if (controller.readable().empty()) {
    std::cout << "No text content available for reading.\n";
    return 0;
  }

  if (!play) {
    dump(controller, color);
    return 0;
  }

  // --- Paragraph mode: step through every paragraph ---
  if (s.reading_mode == fixread::ReadingMode::Paragraph) {
    do {
      std::cout << "[" << (controller.state().paragraph_cursor + 1) << "/"
                << controller.paragraphs().size() << "] "
                << render(controller.current_tokens(), color) << "\n\n";
    } while (controller.next_paragraph());
    print_summary(controller);
    return 0;
  }

  // --- Chunk mode: timed playback ---
  auto show = [&]() {
    std::cout << render(controller.current_tokens(), color) << std::endl;
  };
  controller.set_progress_listener([&](const fixread::ProgressEvent&) { show(); });

  show();
  controller.play();
  loop.run();

  print_summary(controller);
  return 0;
}
