#include "progress.h"

#include "util.h"

#include <algorithm>
#include <sstream>
#include <utility>
#include <variant>

namespace bale {

// ==== progress_reporter ====

progress_reporter::progress_reporter(std::string label)
    : section_{ tui::section_create() },
      label_{ "[" + std::move(label) + "]" },
      start_time_{ std::chrono::steady_clock::now() } {}

progress_reporter::~progress_reporter() { tui::section_release(section_); }

void progress_reporter::spin(std::string text) {
  tui::section_set_content(
      section_,
      tui::section_frame{ .label = label_,
                          .content = tui::spinner_data{ .text = std::move(text),
                                                        .start_time = start_time_ } });
}

void progress_reporter::update(double percent, std::string status) {
  tui::section_set_content(
      section_,
      tui::section_frame{
          .label = label_,
          .content = tui::progress_data{ .percent = std::clamp(percent, 0.0, 100.0),
                                         .status = std::move(status) } });
}

void progress_reporter::note(std::string text) {
  tui::section_set_content(
      section_,
      tui::section_frame{ .label = label_,
                          .content = tui::static_text_data{ .text = std::move(text) } });
}

void progress_reporter::set_frame(tui::section_frame frame) {
  frame.label = label_;
  tui::section_set_content(section_, frame);
}

// ==== transfer_tracker ====

transfer_tracker::transfer_tracker(progress_reporter *reporter,
                                   std::string what,
                                   std::stop_token stop)
    : reporter_{ reporter }, what_{ std::move(what) }, stop_{ std::move(stop) } {
  if (reporter_) { reporter_->spin("fetching " + what_); }
}

bool transfer_tracker::operator()(fetch_progress_t const &prog) {
  if (stop_.stop_requested()) { return false; }
  if (!reporter_) { return true; }

  std::visit(
      match{
          [&](fetch_transfer_progress const &p) {
            double percent{ 0.0 };
            if (p.total && *p.total > 0) {
              percent = (p.transferred / static_cast<double>(*p.total)) * 100.0;
            }

            std::ostringstream status;
            status << util_format_bytes(p.transferred);
            if (p.total) { status << "/" << util_format_bytes(*p.total); }
            status << " " << what_;
            reporter_->update(percent, status.str());
          },
          [&](fetch_git_progress const &p) {
            double percent{ 0.0 };
            if (p.total_objects > 0) {
              percent =
                  (p.received_objects / static_cast<double>(p.total_objects)) * 100.0;
            }

            std::ostringstream status;
            status << p.received_objects;
            if (p.total_objects > 0) { status << "/" << p.total_objects; }
            status << " objects";
            if (p.received_bytes > 0) {
              status << " " << util_format_bytes(p.received_bytes);
            }
            status << " " << what_;
            reporter_->update(percent, status.str());
          } },
      prog);

  return true;
}

// ==== layer_tracker ====

layer_tracker::layer_tracker(progress_reporter *reporter,
                             std::vector<std::string> const &labels)
    : reporter_{ reporter } {
  children_.reserve(labels.size());
  for (auto const &label : labels) {
    children_.push_back(
        tui::section_frame{ .label = label,
                            .content = tui::static_text_data{ .text = "pending" } });
  }

  std::lock_guard const lock{ mutex_ };
  render();
}

void layer_tracker::start(std::size_t slot) {
  std::lock_guard const lock{ mutex_ };
  if (slot >= children_.size()) { return; }
  children_[slot].content =
      tui::spinner_data{ .text = "copying", .start_time = std::chrono::steady_clock::now() };
  render();
}

void layer_tracker::complete(std::size_t slot, std::uint64_t bytes) {
  std::lock_guard const lock{ mutex_ };
  if (slot >= children_.size()) { return; }
  children_[slot].content = tui::static_text_data{ .text = util_format_bytes(bytes) };
  ++completed_;
  render();
}

void layer_tracker::skip(std::size_t slot) {
  std::lock_guard const lock{ mutex_ };
  if (slot >= children_.size()) { return; }
  children_[slot].content = tui::static_text_data{ .text = "exists" };
  ++completed_;
  render();
}

std::size_t layer_tracker::completed() const {
  std::lock_guard const lock{ mutex_ };
  return completed_;
}

void layer_tracker::render() {
  if (!reporter_) { return; }

  double const percent{ children_.empty() ? 100.0
                                          : (completed_ * 100.0) /
                                                static_cast<double>(children_.size()) };
  std::ostringstream status;
  status << completed_ << "/" << children_.size() << " layers";

  reporter_->set_frame(tui::section_frame{
      .label = {},
      .content = tui::progress_data{ .percent = percent, .status = status.str() },
      .children = children_ });
}

// ==== run_output ====

run_output::run_output(progress_reporter *reporter) : reporter_{ reporter } {}

void run_output::on_command_start(std::string_view cmd) {
  header_text_ = std::string{ util_trim(cmd) };
  std::replace(header_text_.begin(), header_text_.end(), '\n', ';');
  lines_.clear();
  if (reporter_) { reporter_->spin(header_text_); }
}

void run_output::on_output_line(std::string_view line) {
  lines_.emplace_back(line);
  if (!reporter_) { return; }

  reporter_->set_frame(
      tui::section_frame{ .label = {},
                          .content = tui::text_stream_data{
                              .lines = lines_,
                              .line_limit = 3,
                              .start_time = reporter_->start_time(),
                              .header_text = header_text_ } });
}

}  // namespace bale
