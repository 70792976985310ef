#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#if defined(__clang__) || defined(__GNUC__)
#define BALE_TUI_PRINTF(idx, first) __attribute__((format(printf, idx, first)))
#else
#define BALE_TUI_PRINTF(idx, first)
#endif

namespace bale::tui {

enum class level { TUI_DEBUG, TUI_INFO, TUI_WARN, TUI_ERROR };

void init();
void set_output_handler(std::function<void(std::string_view)> handler);
void run(std::optional<level> threshold = std::nullopt, bool decorated_logging = false);
void shutdown();

void debug(char const *fmt, ...) BALE_TUI_PRINTF(1, 2);
void info(char const *fmt, ...) BALE_TUI_PRINTF(1, 2);
void warn(char const *fmt, ...) BALE_TUI_PRINTF(1, 2);
void error(char const *fmt, ...) BALE_TUI_PRINTF(1, 2);

// Command results (digests, inspect output) go to stdout, never through the log queue.
void print_stdout(char const *fmt, ...) BALE_TUI_PRINTF(1, 2);

struct scope {  // raii helper
  explicit scope(std::optional<level> threshold, bool decorated_logging);
  ~scope();

 private:
  bool active{ false };
};

// Live status lines on stderr, one section per running operation. Redrawn in place
// on a terminal, printed on change (at most every two seconds) otherwise.
using section_handle = unsigned;

struct progress_data {
  double percent;
  std::string status;
};

struct text_stream_data {
  std::vector<std::string> lines;
  std::size_t line_limit{ 0 };  // 0 shows every line, N the last N
  std::chrono::steady_clock::time_point start_time;
  std::string header_text;
};

struct spinner_data {
  std::string text;
  std::chrono::steady_clock::time_point start_time;
  std::chrono::milliseconds frame_duration{ 100 };
};

struct static_text_data {
  std::string text;
};

struct section_frame {
  std::string label;
  std::variant<progress_data, text_stream_data, spinner_data, static_text_data> content;
  std::vector<section_frame> children;  // rendered indented under the parent
};

section_handle section_create();
void section_set_content(section_handle h, section_frame const &frame);
void section_release(section_handle h);

#ifdef BALE_UNIT_TEST
namespace test {
extern int g_terminal_width;
extern bool g_isatty;
extern std::chrono::steady_clock::time_point g_now;

// The lines the worker would draw for `frame` in the current test terminal.
std::vector<std::string> render_lines(section_frame const &frame);
}  // namespace test
#endif

}  // namespace bale::tui

#undef BALE_TUI_PRINTF
