#include "tui.h"

#include "platform.h"
#include "util.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <queue>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

#include <sys/ioctl.h>
#include <unistd.h>

using bale::tui::level;
using bale::tui::section_frame;

namespace {

constexpr std::chrono::milliseconds kRefreshInterval{ 33 };
constexpr std::chrono::seconds kPlainThrottle{ 2 };
constexpr char const *kSpinnerFrames[]{ "|", "/", "-", "\\" };

struct log_event {
  level severity;
  std::string message;
};

struct section_state {
  bale::tui::section_handle handle;
  std::optional<section_frame> frame;
  std::string last_plain;
  std::chrono::steady_clock::time_point last_plain_time;
};

struct tui_state {
  std::queue<log_event> messages;
  std::function<void(std::string_view)> output_handler;
  std::thread worker;
  std::mutex mutex;         // messages, sections, drawn_lines
  std::mutex stdout_mutex;  // print_stdout writes
  std::condition_variable cv;
  std::atomic_bool stop_requested{ false };
  std::optional<level> threshold;
  bool decorated{ false };
  bool initialized{ false };

  std::vector<section_state> sections;
  bale::tui::section_handle next_handle{ 1 };
  std::size_t label_width{ 0 };
  int drawn_lines{ 0 };
} s_tui{};

}  // namespace

#ifdef BALE_UNIT_TEST
namespace bale::tui::test {
int g_terminal_width{ 0 };
bool g_isatty{ true };
std::chrono::steady_clock::time_point g_now{};
}  // namespace bale::tui::test
#endif

namespace {

int terminal_width() {
#ifdef BALE_UNIT_TEST
  if (bale::tui::test::g_terminal_width > 0) { return bale::tui::test::g_terminal_width; }
#endif

  struct winsize ws;
  if (ioctl(STDERR_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) { return ws.ws_col; }
  return 80;
}

bool ansi_supported() {
#ifdef BALE_UNIT_TEST
  return bale::tui::test::g_isatty;
#else
  if (!bale::platform::is_tty()) { return false; }

  char const *const term{ std::getenv("TERM") };
  return term && std::strcmp(term, "dumb") != 0;
#endif
}

std::chrono::steady_clock::time_point steady_now() {
#ifdef BALE_UNIT_TEST
  if (bale::tui::test::g_now.time_since_epoch().count() > 0) {
    return bale::tui::test::g_now;
  }
#endif
  return std::chrono::steady_clock::now();
}

std::size_t label_width(section_frame const &frame, std::size_t indent = 0) {
  std::size_t width{ indent + frame.label.size() };
  for (auto const &child : frame.children) {
    width = std::max(width, label_width(child, indent + 2));
  }
  return width;
}

struct render_context {
  std::size_t label_width;
  bool ansi;
  std::chrono::steady_clock::time_point now;
};

char const *spinner_glyph(std::chrono::steady_clock::time_point start,
                          std::chrono::milliseconds step,
                          std::chrono::steady_clock::time_point now) {
  auto const elapsed{ std::max<std::int64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(now - start).count(),
      0) };
  auto const step_ms{ std::max<std::int64_t>(step.count(), 1) };
  return kSpinnerFrames[(elapsed / step_ms) % 4];
}

std::string progress_bar(double percent) {
  constexpr int kBarChars{ 20 };
  int const filled{ static_cast<int>((percent / 100.0) * kBarChars) };

  std::string bar{ "[" };
  for (int i{ 0 }; i < kBarChars; ++i) {
    bar.push_back(i < filled ? '=' : (i == filled ? '>' : ' '));
  }
  bar.push_back(']');
  return bar;
}

// Terminal mode pads labels into one column and animates; plain mode prints only
// what changes so redirected output stays readable.
void render_frame(section_frame const &frame,
                  std::string const &label,
                  render_context const &ctx,
                  std::vector<std::string> &out) {
  std::string head{ label };
  if (ctx.ansi && head.size() < ctx.label_width) {
    head.append(ctx.label_width - head.size(), ' ');
  }

  std::visit(
      bale::match{
          [&](bale::tui::progress_data const &data) {
            std::ostringstream oss;
            if (ctx.ansi) {
              oss << head << " " << std::setw(3) << static_cast<int>(data.percent) << "% "
                  << progress_bar(data.percent);
              if (!data.status.empty()) { oss << " " << data.status; }
            } else {
              oss << head << " " << data.status << ": " << std::fixed
                  << std::setprecision(1) << data.percent << "%";
            }
            out.push_back(oss.str());
          },
          [&](bale::tui::spinner_data const &data) {
            out.push_back(ctx.ansi ? head + " " +
                                         spinner_glyph(data.start_time,
                                                       data.frame_duration,
                                                       ctx.now) +
                                         " " + data.text
                                   : head + " " + data.text);
          },
          [&](bale::tui::text_stream_data const &data) {
            std::string const header{ data.header_text.empty() ? "output:"
                                                               : data.header_text };
            out.push_back(ctx.ansi ? head + " " +
                                         spinner_glyph(data.start_time,
                                                       std::chrono::milliseconds{ 100 },
                                                       ctx.now) +
                                         " " + header
                                   : head + " " + header);

            std::size_t first{ 0 };
            if (data.line_limit > 0 && data.lines.size() > data.line_limit) {
              first = data.lines.size() - data.line_limit;
            }
            for (std::size_t i{ first }; i < data.lines.size(); ++i) {
              out.push_back("   " + data.lines[i]);
            }
          },
          [&](bale::tui::static_text_data const &data) {
            out.push_back(head + " " + data.text);
          } },
      frame.content);

  for (auto const &child : frame.children) {
    render_frame(child, "  " + child.label, ctx, out);
  }
}

std::vector<std::string> render_sections(std::vector<section_state> const &sections,
                                         render_context const &ctx,
                                         int width) {
  std::vector<std::string> lines;
  for (auto const &sec : sections) {
    if (sec.frame) { render_frame(*sec.frame, sec.frame->label, ctx, lines); }
  }
  // Auto-wrap is off while drawing, so a long line would smear across redraws.
  for (auto &line : lines) {
    if (width > 0 && line.size() > static_cast<std::size_t>(width)) {
      line.resize(static_cast<std::size_t>(width));
    }
  }
  return lines;
}

// Redraws the section block over the previous one. Returns the lines now on screen.
int draw_ansi(std::vector<std::string> const &lines, int previous) {
  std::fprintf(stderr, "\r");
  if (previous > 1) { std::fprintf(stderr, "\x1b[%dF", previous - 1); }

  int drawn{ 0 };
  for (auto const &line : lines) {
    if (drawn > 0) { std::fprintf(stderr, "\n"); }
    std::fprintf(stderr, "%s\x1b[K", line.c_str());
    ++drawn;
  }

  if (drawn < previous) {
    std::fprintf(stderr, "\n\x1b[0J");
    ++drawn;
  }

  std::fflush(stderr);
  return drawn;
}

struct plain_update {
  bale::tui::section_handle handle;
  std::string output;
};

std::vector<plain_update> draw_plain(std::vector<section_state> const &sections,
                                     std::chrono::steady_clock::time_point now,
                                     bool force) {
  render_context const ctx{ .label_width = 0, .ansi = false, .now = now };

  std::vector<plain_update> updates;
  for (auto const &sec : sections) {
    if (!sec.frame) { continue; }

    std::vector<std::string> lines;
    render_frame(*sec.frame, sec.frame->label, ctx, lines);
    std::string output;
    for (auto const &line : lines) { output += line + "\n"; }

    if (output == sec.last_plain) { continue; }
    if (!force && now - sec.last_plain_time < kPlainThrottle) { continue; }

    std::fputs(output.c_str(), stderr);
    updates.push_back(plain_update{ .handle = sec.handle, .output = std::move(output) });
  }

  std::fflush(stderr);
  return updates;
}

std::string_view level_to_string(level value) {
  switch (value) {
    case level::TUI_DEBUG: return "DBG";
    case level::TUI_INFO: return "INF";
    case level::TUI_WARN: return "WRN";
    case level::TUI_ERROR: return "ERR";
  }
  return "UNKNOWN";
}

std::string format_prefix(level severity) {
  auto const now{ std::chrono::system_clock::now() };
  auto const seconds{ std::chrono::time_point_cast<std::chrono::seconds>(now) };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(now - seconds).count()
  };

  std::time_t const timestamp{ std::chrono::system_clock::to_time_t(now) };
  std::tm local_tm{};
  localtime_r(&timestamp, &local_tm);

  char timestamp_buf[32]{};
  if (std::strftime(timestamp_buf, sizeof timestamp_buf, "%Y-%m-%d %H:%M:%S", &local_tm) ==
      0) {
    return {};
  }

  std::ostringstream oss;
  oss << '[' << timestamp_buf << '.' << std::setfill('0') << std::setw(3) << millis
      << "] [" << level_to_string(severity) << "] ";
  return oss.str();
}

void flush_messages(std::queue<log_event> &pending,
                    std::function<void(std::string_view)> const &handler) {
  while (!pending.empty()) {
    auto ev{ std::move(pending.front()) };
    pending.pop();

    std::string output{ s_tui.decorated ? format_prefix(ev.severity) : std::string{} };
    output.append(ev.message);
    output.push_back('\n');

    if (handler) {
      handler(output);
    } else {
      std::fwrite(output.data(), 1, output.size(), stderr);
    }
  }

  if (!handler) { std::fflush(stderr); }
}

// One refresh: draw the sections, then the queued log lines. Called with the lock
// held; drops it while writing.
void refresh(std::unique_lock<std::mutex> &lock, bool final) {
  std::queue<log_event> pending;
  pending.swap(s_tui.messages);
  auto const sections{ s_tui.sections };
  auto const previous{ s_tui.drawn_lines };
  auto const width{ s_tui.label_width };

  lock.unlock();

  bool const ansi{ ansi_supported() };
  auto const now{ steady_now() };
  int drawn{ 0 };
  std::vector<plain_update> updates;

  if (ansi) {
    render_context const ctx{ .label_width = width, .ansi = true, .now = now };
    drawn = draw_ansi(render_sections(sections, ctx, terminal_width()), previous);
  } else {
    updates = draw_plain(sections, now, final);
  }

  flush_messages(pending, s_tui.output_handler);

  lock.lock();

  if (ansi) { s_tui.drawn_lines = drawn; }
  for (auto &upd : updates) {
    if (auto it{ std::ranges::find_if(
            s_tui.sections,
            [&](section_state const &sec) { return sec.handle == upd.handle; }) };
        it != s_tui.sections.end()) {
      it->last_plain = std::move(upd.output);
      it->last_plain_time = now;
    }
  }
}

void worker_thread() {
  std::unique_lock<std::mutex> lock{ s_tui.mutex };

  while (!s_tui.stop_requested) {
    try {
      refresh(lock, false);
      s_tui.cv.wait_for(lock, kRefreshInterval, [] { return s_tui.stop_requested.load(); });
    } catch (std::exception const &e) {
      if (!lock.owns_lock()) { lock.lock(); }
      std::fprintf(stderr, "[tui worker exception: %s]\n", e.what());
      std::fflush(stderr);
    }
  }

  try {
    refresh(lock, true);
  } catch (std::exception const &e) {
    std::fprintf(stderr, "[tui final flush exception: %s]\n", e.what());
    std::fflush(stderr);
  }
}

void log_formatted(level severity, char const *fmt, va_list args) {
  if (!s_tui.initialized || fmt == nullptr) { return; }
  if (s_tui.threshold && severity < *s_tui.threshold) { return; }

  va_list args_copy;
  va_copy(args_copy, args);
  int const needed{ std::vsnprintf(nullptr, 0, fmt, args_copy) };
  va_end(args_copy);
  if (needed <= 0) { return; }

  std::string buffer(static_cast<std::size_t>(needed) + 1, '\0');
  std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
  buffer.resize(static_cast<std::size_t>(needed));

  {
    std::lock_guard<std::mutex> lock{ s_tui.mutex };
    s_tui.messages.push(log_event{ .severity = severity, .message = std::move(buffer) });
  }

  s_tui.cv.notify_one();
}

}  // namespace

namespace bale::tui {

void init() {
  if (s_tui.initialized) {
    throw std::logic_error{ "bale::tui::init called more than once" };
  }

  s_tui.threshold = std::nullopt;
  s_tui.decorated = false;
  s_tui.initialized = true;
}

void run(std::optional<level> threshold, bool decorated_logging) {
  if (!s_tui.initialized) {
    throw std::logic_error{ "bale::tui::run called before init" };
  }

  if (s_tui.worker.joinable()) {
    throw std::logic_error{ "bale::tui::run called while already running" };
  }

  s_tui.threshold = threshold;
  s_tui.decorated = decorated_logging;
  s_tui.stop_requested = false;
  s_tui.worker = std::thread{ worker_thread };
}

void shutdown() {
  if (!s_tui.worker.joinable()) {
    throw std::logic_error{ "bale::tui::shutdown called while not running" };
  }

  s_tui.stop_requested = true;
  s_tui.cv.notify_all();
  s_tui.worker.join();
  s_tui.worker = std::thread{};
  s_tui.stop_requested = false;
}

void set_output_handler(std::function<void(std::string_view)> handler) {
  if (!s_tui.initialized) {
    throw std::logic_error{ "bale::tui::set_output_handler called before init" };
  }

  if (s_tui.worker.joinable()) {
    throw std::logic_error{ "bale::tui::set_output_handler called while running" };
  }

  std::lock_guard<std::mutex> lock{ s_tui.mutex };
  s_tui.output_handler = std::move(handler);
}

void debug(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_formatted(level::TUI_DEBUG, fmt, args);
  va_end(args);
}

void info(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_formatted(level::TUI_INFO, fmt, args);
  va_end(args);
}

void warn(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_formatted(level::TUI_WARN, fmt, args);
  va_end(args);
}

void error(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_formatted(level::TUI_ERROR, fmt, args);
  va_end(args);
}

void print_stdout(char const *fmt, ...) {
  if (!fmt) { return; }

  std::lock_guard<std::mutex> lock{ s_tui.stdout_mutex };

  va_list args;
  va_start(args, fmt);
  int const written{ std::vprintf(fmt, args) };
  va_end(args);

  if (written > 0) { std::fflush(stdout); }
}

section_handle section_create() {
  std::lock_guard lock{ s_tui.mutex };
  section_handle const handle{ s_tui.next_handle++ };
  s_tui.sections.push_back(section_state{ .handle = handle,
                                          .frame = std::nullopt,
                                          .last_plain = {},
                                          .last_plain_time = {} });
  return handle;
}

void section_set_content(section_handle h, section_frame const &frame) {
  std::lock_guard lock{ s_tui.mutex };
  if (auto it{ std::ranges::find_if(
          s_tui.sections,
          [h](section_state const &sec) { return sec.handle == h; }) };
      it != s_tui.sections.end()) {
    it->frame = frame;
    s_tui.label_width = std::max(s_tui.label_width, label_width(frame));
  }
}

void section_release(section_handle h) {
  std::lock_guard lock{ s_tui.mutex };
  std::erase_if(s_tui.sections, [h](section_state const &sec) { return sec.handle == h; });
}

scope::scope(std::optional<level> threshold, bool decorated_logging) {
  if (!s_tui.initialized) { return; }
  run(threshold, decorated_logging);
  active = true;

  // Hide the cursor and disable auto-wrap while sections are drawn in place
  if (ansi_supported()) {
    std::fprintf(stderr, "\x1b[?25l\x1b[?7l");
    std::fflush(stderr);
  }
}

scope::~scope() {
  if (!active) { return; }

  shutdown();

  if (ansi_supported()) {
    std::fprintf(stderr, "\x1b[?7h\x1b[?25h");
    std::fflush(stderr);
  }
}

#ifdef BALE_UNIT_TEST
namespace test {
std::vector<std::string> render_lines(section_frame const &frame) {
  render_context const ctx{ .label_width = ::label_width(frame),
                            .ansi = g_isatty,
                            .now = steady_now() };
  std::vector<std::string> lines;
  render_frame(frame, frame.label, ctx, lines);
  return lines;
}
}  // namespace test
#endif

}  // namespace bale::tui
