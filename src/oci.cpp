#include "oci.h"

#include "concurrency.h"
#include "error.h"
#include "layout.h"
#include "package.h"
#include "platform.h"
#include "progress.h"
#include "sha256.h"
#include "tui.h"
#include "util.h"

#include "nlohmann/json.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace bale::oci {
namespace {

using json = nlohmann::json;

json descriptor_to_json(descriptor const &d) {
  json j{ { "mediaType", d.media_type }, { "digest", d.digest }, { "size", d.size } };
  if (!d.annotations.empty()) { j["annotations"] = d.annotations; }
  if (d.platform) {
    json p{ { "os", d.platform->os }, { "architecture", d.platform->architecture } };
    if (!d.platform->variant.empty()) { p["variant"] = d.platform->variant; }
    j["platform"] = p;
  }
  return j;
}

descriptor descriptor_from_json(json const &j) {
  descriptor d{ .media_type = j.value("mediaType", ""),
                .digest = j.value("digest", ""),
                .size = j.value("size", std::int64_t{ 0 }),
                .annotations = {},
                .platform = std::nullopt };
  if (auto const it{ j.find("annotations") }; it != j.end() && it->is_object()) {
    d.annotations = it->get<std::map<std::string, std::string>>();
  }
  if (auto const it{ j.find("platform") }; it != j.end() && it->is_object()) {
    d.platform = platform{ .os = it->value("os", ""),
                           .architecture = it->value("architecture", ""),
                           .variant = it->value("variant", "") };
  }
  return d;
}

json parse_json(std::string_view body, char const *func) {
  try {
    return json::parse(body);
  } catch (json::exception const &e) {
    throw std::runtime_error(std::string{ func } + ": invalid JSON: " + e.what());
  }
}

// Layer titles become paths below the destination; refuse anything that could
// escape it.
std::filesystem::path safe_title_path(std::filesystem::path const &root,
                                      descriptor const &layer) {
  auto const title{ layer.title() };
  std::filesystem::path const rel{ title };
  if (title.empty() || rel.is_absolute()) {
    throw std::runtime_error("oci::pull: layer " + layer.digest + " has invalid title '" +
                             title + "'");
  }
  for (auto const &part : rel) {
    if (part == "..") {
      throw std::runtime_error("oci::pull: layer title escapes destination: " + title);
    }
  }
  return root / rel;
}

std::string short_digest(descriptor const &d) { return d.encoded().substr(0, 12); }

std::map<std::string, std::string> package_annotations(package_definition const &pkg) {
  std::map<std::string, std::string> annotations;
  auto const add{ [&](char const *key, std::string const &value) {
    if (!value.empty()) { annotations[key] = value; }
  } };
  add("org.opencontainers.image.title", pkg.metadata.name);
  add("org.opencontainers.image.description", pkg.metadata.description);
  add("org.opencontainers.image.url", pkg.metadata.url);
  add("org.opencontainers.image.authors", pkg.metadata.authors);
  add("org.opencontainers.image.documentation", pkg.metadata.documentation);
  add("org.opencontainers.image.source", pkg.metadata.source);
  add("org.opencontainers.image.vendor", pkg.metadata.vendor);
  return annotations;
}

}  // namespace

std::string descriptor::title() const {
  if (auto const it{ annotations.find(std::string{ kAnnotationTitle }) };
      it != annotations.end()) {
    return it->second;
  }
  return {};
}

std::string descriptor::encoded() const {
  auto const colon{ digest.find(':') };
  return colon == std::string::npos ? digest : digest.substr(colon + 1);
}

descriptor manifest::locate(std::string_view title) const {
  for (auto const &layer : layers) {
    if (layer.title() == title) { return layer; }
  }
  return {};
}

manifest manifest_parse(std::string_view body, std::string_view media_type) {
  auto const j{ parse_json(body, "oci::manifest_parse") };
  if (!j.is_object()) { throw std::runtime_error("oci::manifest_parse: not an object"); }

  manifest m{ .media_type = media_type.empty() ? j.value("mediaType", "")
                                               : std::string{ media_type },
              .config = {},
              .layers = {},
              .annotations = {} };

  if (auto const it{ j.find("config") }; it != j.end() && it->is_object()) {
    m.config = descriptor_from_json(*it);
  }

  // artifact manifests list their content under "blobs"
  char const *const key{ m.media_type == kMediaTypeArtifactManifest || j.contains("blobs")
                             ? "blobs"
                             : "layers" };
  if (auto const it{ j.find(key) }; it != j.end() && it->is_array()) {
    for (auto const &entry : *it) { m.layers.push_back(descriptor_from_json(entry)); }
  }

  if (auto const it{ j.find("annotations") }; it != j.end() && it->is_object()) {
    m.annotations = it->get<std::map<std::string, std::string>>();
  }
  return m;
}

std::string manifest_serialize(manifest const &m) {
  json j{ { "schemaVersion", 2 },
          { "mediaType", m.media_type },
          { "config", descriptor_to_json(m.config) } };
  j["layers"] = json::array();
  for (auto const &layer : m.layers) { j["layers"].push_back(descriptor_to_json(layer)); }
  if (!m.annotations.empty()) { j["annotations"] = m.annotations; }
  return j.dump();
}

std::vector<descriptor> index_parse(std::string_view body) {
  auto const j{ parse_json(body, "oci::index_parse") };
  std::vector<descriptor> entries;
  if (auto const it{ j.find("manifests") }; it != j.end() && it->is_array()) {
    for (auto const &entry : *it) { entries.push_back(descriptor_from_json(entry)); }
  }
  return entries;
}

std::string index_serialize(std::vector<descriptor> const &manifests) {
  json j{ { "schemaVersion", 2 },
          { "mediaType", kMediaTypeImageIndex },
          { "manifests", json::array() } };
  for (auto const &m : manifests) { j["manifests"].push_back(descriptor_to_json(m)); }
  return j.dump();
}

bool is_index_media_type(std::string_view media_type) {
  return media_type == kMediaTypeImageIndex || media_type == kMediaTypeDockerManifestList;
}

descriptor descriptor_for_bytes(std::string_view media_type, std::string_view bytes) {
  return descriptor{ .media_type = std::string{ media_type },
                     .digest = "sha256:" + sha256_hex(bytes),
                     .size = static_cast<std::int64_t>(bytes.size()),
                     .annotations = {},
                     .platform = std::nullopt };
}

descriptor descriptor_for_file(std::string_view media_type,
                               std::filesystem::path const &file) {
  std::error_code ec;
  auto const size{ std::filesystem::file_size(file, ec) };
  if (ec) {
    throw std::runtime_error("oci::descriptor_for_file: " + file.string() + ": " +
                             ec.message());
  }
  return descriptor{ .media_type = std::string{ media_type },
                     .digest = "sha256:" + sha256_hex(sha256(file)),
                     .size = static_cast<std::int64_t>(size),
                     .annotations = {},
                     .platform = std::nullopt };
}

std::string layer_media_type(std::filesystem::path const &file) {
  auto const ext{ file.extension().string() };
  if (ext == ".zst") { return "application/vnd.bale.layer.v1.tar+zstd"; }
  if (ext == ".gz") { return "application/vnd.bale.layer.v1.tar+gzip"; }
  if (ext == ".yaml") { return "application/vnd.bale.layer.v1.yaml"; }
  if (ext == ".json") { return "application/vnd.bale.layer.v1.json"; }
  if (ext == ".txt") { return "application/vnd.bale.layer.v1.txt"; }
  return "application/vnd.bale.layer.v1.unknown";
}

platform platform_for_arch(std::string_view arch) {
  if (arch == kSkeletonArch) {
    return platform{ .os = "multi", .architecture = std::string{ arch }, .variant = {} };
  }
  return platform{ .os = "linux", .architecture = std::string{ arch }, .variant = {} };
}

void copy_blob(remote &r,
               descriptor const &desc,
               std::filesystem::path const &destination,
               fetch_progress_cb_t const &progress) {
  if (auto const parent{ destination.parent_path() }; !parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw std::runtime_error("oci::copy_blob: failed to create " + parent.string() + ": " +
                               ec.message());
    }
  }

  scoped_path_cleanup partial{ util_partial_path(destination) };
  r.fetch_blob(desc, partial.path(), progress);

  std::error_code ec;
  auto const size{ std::filesystem::file_size(partial.path(), ec) };
  if (ec) {
    throw std::runtime_error("oci::copy_blob: " + desc.digest + " was not written: " +
                             ec.message());
  }
  if (static_cast<std::int64_t>(size) != desc.size) {
    throw integrity_error("blob " + desc.digest + ": expected " + std::to_string(desc.size) +
                          " bytes but got " + std::to_string(size));
  }

  try {
    sha256_verify(desc.encoded(), sha256(partial.path()));
  } catch (integrity_error const &e) {
    throw integrity_error("blob " + desc.digest + ": " + e.what());
  }

  ::bale::platform::atomic_rename(partial.path(), destination);
  partial.reset();
}

descriptor resolve_root(remote &r, platform const &target) {
  auto const reference{ r.ref().reference() };
  if (reference.empty()) {
    throw config_error("oci::resolve_root: " + r.ref().name() + " has no tag or digest");
  }

  auto const desc{ r.resolve(reference) };
  if (!is_index_media_type(desc.media_type)) { return desc; }

  auto const entries{ index_parse(fetch_manifest_verified(r, desc)) };
  for (auto const &entry : entries) {
    if (!entry.platform) { continue; }
    if (entry.platform->architecture != target.architecture) { continue; }
    if (!target.os.empty() && !entry.platform->os.empty() && entry.platform->os != target.os) {
      continue;
    }
    return entry;
  }

  throw std::runtime_error("oci::resolve_root: " + r.ref().str() + " has no manifest for " +
                           target.os + "/" + target.architecture);
}

std::string fetch_manifest_verified(remote &r, descriptor const &desc) {
  auto body{ r.fetch_manifest(desc) };
  if (auto const actual{ "sha256:" + sha256_hex(std::string_view{ body }) };
      actual != desc.digest) {
    throw integrity_error("manifest " + desc.digest + " of " + r.ref().str() +
                          " does not match its content (" + actual + ")");
  }
  return body;
}

manifest fetch_root(remote &r, platform const &target) {
  auto const desc{ resolve_root(r, target) };
  return manifest_parse(fetch_manifest_verified(r, desc), desc.media_type);
}

pull_result pull(remote &r,
                 std::filesystem::path const &destination,
                 platform const &target,
                 copy_options const &options) {
  pull_result result{ .root = fetch_root(r, target), .written = {}, .skipped = {} };

  std::vector<descriptor> selected;
  for (auto const &layer : result.root.layers) {
    if (!options.only_titles.empty() &&
        std::ranges::find(options.only_titles, layer.title()) == options.only_titles.end()) {
      continue;
    }
    selected.push_back(layer);
  }

  std::vector<std::string> labels;
  for (auto const &layer : selected) {
    labels.push_back(short_digest(layer) + " " + layer.title());
  }
  layer_tracker tracker{ options.reporter, labels };

  std::vector<std::size_t> pending;
  for (std::size_t i{ 0 }; i < selected.size(); ++i) {
    auto const path{ safe_title_path(destination, selected[i]) };
    std::error_code ec;
    if (auto const size{ std::filesystem::file_size(path, ec) };
        !ec && static_cast<std::int64_t>(size) == selected[i].size) {
      tui::debug("oci::pull: %s %s already present", short_digest(selected[i]).c_str(),
                 selected[i].title().c_str());
      tracker.skip(i);
      result.skipped.push_back(path);
      continue;
    }
    pending.push_back(i);
  }

  run_bounded(pending.size(), options.concurrency, options.stop,
              [&](std::size_t n, std::stop_token stop) {
                auto const &layer{ selected[pending[n]] };
                tracker.start(pending[n]);
                copy_blob(r, layer, safe_title_path(destination, layer),
                          [stop](fetch_progress_t const &) { return !stop.stop_requested(); });
                tracker.complete(pending[n], static_cast<std::uint64_t>(layer.size));
              });

  for (auto const idx : pending) {
    result.written.push_back(safe_title_path(destination, selected[idx]));
  }
  return result;
}

std::string package_tag(package_definition const &pkg) {
  if (pkg.metadata.version.empty()) {
    throw config_error("oci::package_tag: package " + pkg.metadata.name +
                       " needs metadata.version to be published");
  }
  auto const arch{ pkg.is_skeleton() ? std::string{ kSkeletonArch }
                                     : (pkg.build.architecture.empty()
                                            ? pkg.metadata.architecture
                                            : pkg.build.architecture) };
  if (arch.empty()) {
    throw config_error("oci::package_tag: package " + pkg.metadata.name +
                       " has no architecture");
  }

  // '+' is legal in semver build metadata but not in an OCI tag
  auto tag{ pkg.metadata.version + "-" + arch };
  std::ranges::replace(tag, '+', '_');
  return tag;
}

descriptor publish(remote &r,
                   package_paths const &paths,
                   package_definition const &pkg,
                   copy_options const &options) {
  auto const tag{ package_tag(pkg) };
  auto const files{ util_list_files(paths.base()) };

  std::vector<descriptor> layers;
  layers.reserve(files.size());
  for (auto const &rel : files) {
    auto desc{ descriptor_for_file(layer_media_type(rel), paths.base() / rel) };
    desc.annotations[std::string{ kAnnotationTitle }] = rel;
    layers.push_back(std::move(desc));
  }

  json config{ { "architecture",
                 pkg.is_skeleton() ? std::string{ kSkeletonArch } : pkg.metadata.architecture },
               { "ociVersion", "1.0.1" },
               { "annotations", package_annotations(pkg) } };
  auto const config_bytes{ config.dump() };
  auto const config_desc{ descriptor_for_bytes(kMediaTypePackageConfig, config_bytes) };

  std::vector<std::string> labels;
  for (auto const &layer : layers) { labels.push_back(short_digest(layer) + " " + layer.title()); }
  layer_tracker tracker{ options.reporter, labels };

  run_bounded(layers.size(), options.concurrency, options.stop,
              [&](std::size_t i, std::stop_token) {
                if (r.exists(layers[i])) {
                  tracker.skip(i);
                  return;
                }
                tracker.start(i);
                r.push_blob(layers[i], paths.base() / layers[i].title());
                tracker.complete(i, static_cast<std::uint64_t>(layers[i].size));
              });

  if (!r.exists(config_desc)) {
    scoped_path_cleanup const staged{ util_partial_path(paths.base() / "config.json") };
    util_write_file(staged.path(), config_bytes);
    r.push_blob(config_desc, staged.path());
  }

  manifest const m{ .media_type = std::string{ kMediaTypeImageManifest },
                    .config = config_desc,
                    .layers = layers,
                    .annotations = package_annotations(pkg) };
  auto const body{ manifest_serialize(m) };
  r.push_manifest(tag, m.media_type, body);

  tui::info("published %s:%s (%zu layers)", r.ref().name().c_str(), tag.c_str(), layers.size());
  return descriptor_for_bytes(kMediaTypeImageManifest, body);
}

}  // namespace bale::oci
