#include "images.h"

#include "concurrency.h"
#include "error.h"
#include "progress.h"
#include "tui.h"
#include "util.h"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <set>
#include <stdexcept>
#include <stop_token>
#include <utility>

namespace bale {
namespace {

namespace fs = std::filesystem;

oci::descriptor select_platform(std::vector<oci::descriptor> const &entries,
                                std::vector<std::string> const &archs,
                                image_ref const &ref) {
  auto const linux_entry{ [](oci::descriptor const &d, std::string const *arch) {
    if (!d.platform || d.platform->os != "linux") { return false; }
    return !arch || d.platform->architecture == *arch;
  } };

  for (auto const &arch : archs) {
    for (auto const &entry : entries) {
      if (linux_entry(entry, &arch)) { return entry; }
    }
  }
  if (archs.empty()) {
    for (auto const &entry : entries) {
      if (linux_entry(entry, nullptr)) { return entry; }
    }
  }

  std::string wanted;
  for (auto const &arch : archs) { wanted += (wanted.empty() ? "" : ", ") + arch; }
  throw config_error("image " + ref.str() + " has no linux manifest for [" + wanted + "]");
}

// False when `stop` ends the wait early.
bool wait_for_retry(std::chrono::milliseconds delay, std::stop_token const &stop) {
  std::mutex mutex;
  std::condition_variable_any cv;
  std::unique_lock lock{ mutex };
  cv.wait_for(lock, stop, delay, [] { return false; });
  return !stop.stop_requested();
}

std::string join_refs(std::vector<image_ref> const &images) {
  std::string out;
  for (auto const &ref : images) { out += (out.empty() ? "" : ", ") + ref.str(); }
  return out;
}

}  // namespace

registry_overrides images_parse_registry_overrides(std::vector<std::string> const &entries) {
  registry_overrides out;
  for (auto const &entry : entries) {
    auto const eq{ entry.find('=') };
    if (eq == std::string::npos || eq == 0 || eq + 1 == entry.size()) {
      throw config_error("registry override \"" + entry + "\" must have the form from=to");
    }
    out[entry.substr(0, eq)] = entry.substr(eq + 1);
  }
  return out;
}

image_ref images_pull_source(image_ref const &ref, registry_overrides const &overrides) {
  auto const name{ ref.name() };
  registry_overrides::value_type const *best{ nullptr };
  for (auto const &entry : overrides) {
    auto const &from{ entry.first };
    if (!name.starts_with(from)) { continue; }
    if (name.size() != from.size() && name[from.size()] != '/') { continue; }
    if (!best || from.size() > best->first.size()) { best = &entry; }
  }
  if (!best) { return ref; }

  auto const full{ ref.str() };
  return image_ref_parse(best->second + full.substr(best->first.size()));
}

registry_image_puller::registry_image_puller(oci::remote_factory factory,
                                             int concurrency,
                                             progress_reporter *reporter)
    : factory_{ std::move(factory) }, concurrency_{ concurrency }, reporter_{ reporter } {}

std::vector<pulled_image> registry_image_puller::pull(std::vector<image_ref> const &images,
                                                      fs::path const &images_dir,
                                                      image_pull_options const &options,
                                                      std::stop_token stop) {
  auto const blobs{ images_dir / "blobs" / "sha256" };
  fs::create_directories(blobs);

  std::vector<pulled_image> results(images.size());
  run_bounded(images.size(), concurrency_, stop, [&](std::size_t i, std::stop_token task_stop) {
    auto const &ref{ images[i] };
    auto const source{ images_pull_source(ref, options.overrides) };
    if (source.str() != ref.str()) {
      tui::debug("images: pulling %s from %s", ref.str().c_str(), source.str().c_str());
    }
    auto const remote{ factory_(source) };

    auto desc{ remote->resolve(source.reference()) };
    if (oci::is_index_media_type(desc.media_type)) {
      desc = select_platform(oci::index_parse(oci::fetch_manifest_verified(*remote, desc)),
                             options.archs,
                             ref);
    }

    auto const body{ oci::fetch_manifest_verified(*remote, desc) };
    if (!fs::exists(blobs / desc.encoded())) { util_write_file(blobs / desc.encoded(), body); }
    auto const m{ oci::manifest_parse(body, desc.media_type) };

    std::vector<oci::descriptor> content{ m.layers };
    if (!m.config.empty()) { content.insert(content.begin(), m.config); }
    for (auto const &blob : content) {
      if (task_stop.stop_requested()) { throw std::runtime_error("image pull cancelled"); }
      auto const dest{ blobs / blob.encoded() };
      if (fs::exists(dest)) { continue; }
      oci::copy_blob(*remote, blob, dest, transfer_tracker{ reporter_, ref.str(), task_stop });
    }

    desc.annotations[std::string{ kAnnotationRefName }] = ref.str();
    tui::debug("images: pulled %s (%zu layers)", ref.str().c_str(), m.layers.size());
    results[i] = pulled_image{ .ref = ref, .manifest = desc, .has_layers = !m.layers.empty() };
  });
  return results;
}

std::vector<image_ref> images_collect(std::vector<component> const &components) {
  std::vector<image_ref> out;
  std::set<std::string> seen;
  for (auto const &c : components) {
    for (auto const &image : c.images) {
      auto ref{ image_ref_parse(image) };
      if (seen.insert(ref.str()).second) { out.push_back(std::move(ref)); }
    }
  }
  return out;
}

std::vector<pulled_image> images_aggregate(image_puller &puller,
                                           std::vector<image_ref> const &images,
                                           fs::path const &images_dir,
                                           aggregate_options const &options) {
  if (images.empty()) { return {}; }

  std::exception_ptr last;
  for (int attempt{ 1 }; attempt <= options.attempts; ++attempt) {
    try {
      auto results{ puller.pull(images,
                                images_dir,
                                { .archs = options.archs, .overrides = options.overrides },
                                options.stop) };
      images_write_layout(images_dir, results);
      return results;
    } catch (std::exception const &e) {
      // Another attempt cannot fix a definition problem
      if (error_has_cause<config_error>(e) || options.stop.stop_requested()) { throw; }
      last = std::current_exception();
      tui::warn("image pull attempt %d/%d failed: %s",
                attempt,
                options.attempts,
                error_describe(e).c_str());
    }
    if (attempt < options.attempts && !wait_for_retry(options.delay, options.stop)) {
      std::rethrow_exception(last);
    }
  }

  if (!last) { throw std::invalid_argument("images_aggregate: attempts must be positive"); }
  try {
    std::rethrow_exception(last);
  } catch (std::exception const &) {
    error_rethrow_with_context("unable to pull images after " + std::to_string(options.attempts) +
                               " attempts (" + join_refs(images) + ")");
  }
}

void images_write_layout(fs::path const &images_dir, std::vector<pulled_image> const &images) {
  std::vector<oci::descriptor> manifests;
  manifests.reserve(images.size());
  for (auto const &image : images) { manifests.push_back(image.manifest); }

  util_write_file(images_dir / "index.json", oci::index_serialize(manifests));
  util_write_file(images_dir / "oci-layout", R"({"imageLayoutVersion":"1.0.0"})");
}

}  // namespace bale
