#pragma once

#include "fetch_progress.h"
#include "tui.h"
#include "util.h"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace bale {

// Owns one tui section for the lifetime of a long-running operation. Operations
// take a progress_reporter * and stay silent when it is null.
class progress_reporter : unmovable {
 public:
  explicit progress_reporter(std::string label);
  ~progress_reporter();

  void spin(std::string text);
  void update(double percent, std::string status);
  void note(std::string text);
  void set_frame(tui::section_frame frame);  // label is replaced with ours

  std::string const &label() const { return label_; }
  std::chrono::steady_clock::time_point start_time() const { return start_time_; }

 private:
  tui::section_handle section_;
  std::string label_;
  std::chrono::steady_clock::time_point start_time_;
};

// Byte-level download or clone progress for one source. Returns false from the
// callback once `stop` is requested, which aborts the transfer.
class transfer_tracker {
 public:
  transfer_tracker(progress_reporter *reporter, std::string what, std::stop_token stop = {});

  bool operator()(fetch_progress_t const &prog);

 private:
  progress_reporter *reporter_;
  std::string what_;
  std::stop_token stop_;
};

// Per-layer status for multi-layer copies. Updated once per layer state change,
// not per byte; safe to call from worker threads.
class layer_tracker {
 public:
  layer_tracker(progress_reporter *reporter, std::vector<std::string> const &labels);

  void start(std::size_t slot);
  void complete(std::size_t slot, std::uint64_t bytes);
  void skip(std::size_t slot);

  std::size_t completed() const;

 private:
  void render();

  progress_reporter *reporter_;
  mutable std::mutex mutex_;
  std::vector<tui::section_frame> children_;
  std::size_t completed_{ 0 };
};

// Streams the tail of an action's output under its command line.
class run_output {
 public:
  explicit run_output(progress_reporter *reporter);

  void on_command_start(std::string_view cmd);
  void on_output_line(std::string_view line);

 private:
  progress_reporter *reporter_;
  std::vector<std::string> lines_;
  std::string header_text_;
};

}  // namespace bale
