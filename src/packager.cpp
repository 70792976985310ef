#include "packager.h"

#include "archiver.h"
#include "assembler.h"
#include "checksums.h"
#include "composer.h"
#include "differential.h"
#include "error.h"
#include "extract.h"
#include "images.h"
#include "layout.h"
#include "platform.h"
#include "sbom.h"
#include "sign.h"
#include "tui.h"
#include "util.h"
#include "version.h"

#include <algorithm>
#include <array>
#include <ctime>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

namespace bale {
namespace {

namespace fs = std::filesystem;

constexpr std::string_view kSignatureName{ "bale.yaml.sig" };
constexpr std::string_view kSbomArchiveName{ "sboms.tar" };

// "Mon, 02 Jan 2006 15:04:05 -0700"
std::string rfc1123_now() {
  auto const now{ std::time(nullptr) };
  std::tm local{};
  ::localtime_r(&now, &local);
  std::array<char, 64> buf{};
  auto const n{ std::strftime(buf.data(), buf.size(), "%a, %d %b %Y %H:%M:%S %z", &local) };
  return std::string{ buf.data(), n };
}

void stamp_build(package_definition &pkg, std::string const &flavor) {
  pkg.build.terminal = platform::hostname();
  pkg.build.user = platform::user_name();
  pkg.build.architecture = pkg.metadata.architecture;
  pkg.build.timestamp = rfc1123_now();
  pkg.build.version = std::string{ version_string() };
  pkg.build.flavor = flavor;
}

std::vector<std::string> target_archs(package_definition const &pkg) {
  std::vector<std::string> archs;
  for (auto const *arch : { &pkg.metadata.architecture, &pkg.build.architecture }) {
    if (!arch->empty() && std::ranges::find(archs, *arch) == archs.end()) {
      archs.push_back(*arch);
    }
  }
  return archs;
}

package_definition load_definition(fs::path const &base_dir) {
  auto const definition{ base_dir / kPackageFileName };
  if (!fs::exists(definition)) {
    throw config_error("package definition " + definition.string() + " does not exist");
  }
  auto pkg{ package_load(definition) };
  package_validate(pkg);
  return pkg;
}

void write_sboms(package_definition const &pkg,
                 package_paths const &paths,
                 std::vector<pulled_image> const &pulled,
                 sbom_cataloger &cataloger) {
  sbom_request request{ .output_dir = paths.sboms_dir(), .components = {}, .images = {} };
  for (auto const &c : pkg.components) {
    auto const cp{ paths.component(c.name) };
    if (!fs::exists(cp.base)) { continue; }
    auto files{ assemble_sbom_files(c, cp) };
    if (files.empty()) { continue; }
    request.components.push_back({ .name = c.name, .root = cp.base, .files = std::move(files) });
  }
  for (auto const &image : pulled) {
    if (image.has_layers) { request.images.push_back(image.ref.str()); }
  }
  if (request.components.empty() && request.images.empty()) { return; }

  cataloger.catalog(request);
  archive_create(paths.sboms_dir(), paths.sboms_archive());
  fs::remove_all(paths.sboms_dir());
}

// Checksums, finalized manifest and optional signature; returns the aggregate.
std::string seal(package_definition &pkg,
                 package_paths const &paths,
                 std::optional<fs::path> const &signing_key,
                 std::string const &password) {
  auto const checksums{ checksums_generate(paths) };
  archive_finalize(pkg, paths, checksums.aggregate);
  if (signing_key) { sign_file(paths.manifest(), paths.signature(), *signing_key, password); }
  return checksums.aggregate;
}

oci::copy_options copy_options_for(packager_services const &services) {
  return { .concurrency = services.concurrency,
           .reporter = services.reporter,
           .stop = services.stop,
           .only_titles = {} };
}

std::unique_ptr<oci::remote> open_remote(packager_services const &services, image_ref const &ref) {
  if (!services.remotes) {
    throw std::invalid_argument("packager: no registry access configured for " + ref.str());
  }
  return services.remotes(ref);
}

oci::descriptor publish_build(package_paths const &paths,
                              package_definition const &pkg,
                              std::string const &url,
                              packager_services const &services) {
  auto const ref{ package_publish_ref(url, pkg) };
  auto const remote{ open_remote(services, ref) };
  auto const desc{ oci::publish(*remote, paths, pkg, copy_options_for(services)) };
  tui::info("published %s (%s)", ref.str().c_str(), desc.digest.c_str());
  return desc;
}

oci::descriptor publish_skeleton(publish_options const &options,
                                 packager_services const &services,
                                 fs::path const &temp) {
  auto pkg{ load_definition(options.source) };
  auto composed{ compose_package(pkg,
                                 { .base_dir = options.source,
                                   .arch = {},
                                   .flavor = {},
                                   .remotes = services.remotes,
                                   .cache = services.cache }) };
  pkg.components = std::move(composed.components);
  pkg.variables = std::move(composed.variables);
  pkg.constants = std::move(composed.constants);
  package_validate_unique_components(pkg);
  pkg.metadata.architecture = std::string{ kSkeletonArch };
  stamp_build(pkg, {});

  package_paths paths{ temp / "build" };
  fs::create_directories(paths.base());
  for (auto &c : pkg.components) { assemble_skeleton(c, paths, options.source); }
  archive_components(paths, pkg.components);
  seal(pkg, paths, options.signing_key, options.signing_key_password);
  return publish_build(paths, pkg, options.url, services);
}

oci::descriptor publish_archive(publish_options const &options,
                                packager_services const &services,
                                fs::path const &temp) {
  auto const joined{ archive_join_parts(options.source, temp / "join") };
  package_paths const paths{ temp / "build" };
  extract(joined, paths.base());

  auto const pkg{ package_load(paths.manifest()) };
  if (options.signing_key) {
    sign_file(paths.manifest(), paths.signature(), *options.signing_key,
              options.signing_key_password);
  }
  return publish_build(paths, pkg, options.url, services);
}

}  // namespace

create_result package_create(create_options const &options, packager_services const &services) {
  auto pkg{ load_definition(options.base_dir) };
  if (!options.architecture.empty()) { pkg.metadata.architecture = options.architecture; }
  if (pkg.metadata.architecture.empty()) {
    pkg.metadata.architecture = std::string{ platform::arch_name() };
  }

  auto const overrides{ images_parse_registry_overrides(options.registry_overrides) };
  scoped_path_cleanup const temp{ platform::make_temp_dir("bale-create") };

  std::optional<differential_reference> reference;
  if (options.differential) {
    reference = differential_load(*options.differential, temp.path() / "differential");
    differential_validate(reference->version, pkg.metadata.version);
  }

  tui::info("creating package %s %s (%s)",
            pkg.metadata.name.c_str(),
            pkg.metadata.version.c_str(),
            pkg.metadata.architecture.c_str());

  package_paths paths{ temp.path() / "build" };
  create_result result;
  try {
    fs::create_directories(paths.base());
    stamp_build(pkg, options.flavor);
    pkg.build.registry_overrides = options.registry_overrides;

    auto composed{ compose_package(pkg,
                                   { .base_dir = options.base_dir,
                                     .arch = pkg.metadata.architecture,
                                     .flavor = options.flavor,
                                     .remotes = services.remotes,
                                     .cache = services.cache }) };
    pkg.components = std::move(composed.components);
    pkg.variables = std::move(composed.variables);
    pkg.constants = std::move(composed.constants);
    package_validate_unique_components(pkg);
    if (reference) { differential_filter(pkg, *reference); }

    assemble_context ctx{ .base_dir = options.base_dir,
                          .charts = services.charts,
                          .kustomize = services.kustomize,
                          .git = services.git,
                          .reporter = services.reporter,
                          .stop = services.stop,
                          .variables = {} };
    for (auto const &c : pkg.components) { assemble_component(c, paths, ctx); }

    std::vector<pulled_image> pulled;
    if (auto const images{ images_collect(pkg.components) }; !images.empty()) {
      if (!services.images) {
        throw std::invalid_argument("package_create: images are declared but no puller is set");
      }
      pulled = images_aggregate(*services.images,
                                images,
                                paths.images_dir(),
                                { .attempts = 3,
                                  .delay = services.image_retry_delay,
                                  .archs = target_archs(pkg),
                                  .overrides = overrides,
                                  .stop = services.stop });
    }

    if (services.sbom) { write_sboms(pkg, paths, pulled, *services.sbom); }
    archive_components(paths, pkg.components);
    result.aggregate = seal(pkg, paths, options.signing_key, options.signing_key_password);
  } catch (std::exception const &) { error_rethrow_with_context("unable to create package"); }

  if (!options.publish_url.empty()) {
    try {
      result.published = publish_build(paths, pkg, options.publish_url, services);
    } catch (std::exception const &) { error_rethrow_with_context("unable to publish package"); }
  } else {
    try {
      result.archive =
          archive_package(paths, pkg, options.output_dir, options.max_package_size_mb);
    } catch (std::exception const &) { error_rethrow_with_context("unable to archive package"); }
    tui::info("package written to %s", result.archive.string().c_str());
  }

  result.pkg = std::move(pkg);
  return result;
}

image_ref package_publish_ref(std::string const &url, package_definition const &pkg) {
  auto ref{ oci_ref_parse(url) };
  if (!ref.tag.empty() || !ref.digest.empty()) {
    throw config_error("publish destination " + url +
                       " must name a registry namespace without a tag or digest");
  }
  ref.repository = ref.repository.empty() ? pkg.metadata.name
                                          : ref.repository + "/" + pkg.metadata.name;
  ref.tag = oci::package_tag(pkg);
  return ref;
}

oci::descriptor package_publish(publish_options const &options,
                                packager_services const &services) {
  scoped_path_cleanup const temp{ platform::make_temp_dir("bale-publish") };
  try {
    if (fs::is_directory(options.source)) {
      return publish_skeleton(options, services, temp.path());
    }
    return publish_archive(options, services, temp.path());
  } catch (std::exception const &) { error_rethrow_with_context("unable to publish package"); }
}

package_definition package_pull(pull_options const &options, packager_services const &services) {
  auto const ref{ oci_ref_parse(options.url) };
  auto const arch{ options.architecture.empty() ? std::string{ platform::arch_name() }
                                                : options.architecture };
  try {
    auto const remote{ open_remote(services, ref) };
    fs::create_directories(options.output_dir);
    auto const pulled{ oci::pull(*remote,
                                 options.output_dir,
                                 oci::platform_for_arch(arch),
                                 copy_options_for(services)) };
    tui::info("pulled %zu layers (%zu already present)",
              pulled.written.size(),
              pulled.skipped.size());

    auto pkg{ package_load(options.output_dir / kPackageFileName) };
    if (pkg.metadata.aggregate_checksum.empty()) {
      throw integrity_error("package " + pkg.metadata.name + " has no aggregate checksum");
    }
    checksums_verify(options.output_dir, pkg.metadata.aggregate_checksum);
    return pkg;
  } catch (std::exception const &) {
    error_rethrow_with_context("unable to pull package " + options.url);
  }
}

std::string package_inspect(inspect_options const &options, packager_services const &services) {
  scoped_path_cleanup const temp{ platform::make_temp_dir("bale-inspect") };
  package_paths const paths{ temp.path() / "package" };
  fs::create_directories(paths.base());

  std::vector<std::string> const wanted{ std::string{ kPackageFileName },
                                         std::string{ kSignatureName },
                                         std::string{ kSbomArchiveName } };
  if (is_oci_url(options.source)) {
    auto const remote{ open_remote(services, oci_ref_parse(options.source)) };
    auto copy{ copy_options_for(services) };
    copy.only_titles = wanted;
    auto const arch{ options.architecture.empty() ? std::string{ platform::arch_name() }
                                                  : options.architecture };
    oci::pull(*remote, paths.base(), oci::platform_for_arch(arch), copy);
  } else {
    auto const joined{ archive_join_parts(options.source, temp.path() / "join") };
    for (auto const &name : wanted) {
      if (auto const content{ extract_read_member(joined, name) }) {
        util_write_file(paths.base() / name, *content);
      }
    }
  }

  if (!fs::exists(paths.manifest())) {
    throw std::runtime_error("package_inspect: " + options.source + " has no " +
                             std::string{ kPackageFileName });
  }
  if (options.key) { sign_verify(paths.manifest(), paths.signature(), *options.key); }
  if (options.sbom_out) {
    if (!fs::exists(paths.sboms_archive())) {
      throw std::runtime_error("package_inspect: " + options.source + " has no SBOMs");
    }
    extract(paths.sboms_archive(), *options.sbom_out);
    tui::info("SBOMs written to %s", options.sbom_out->string().c_str());
  }
  return util_load_text(paths.manifest());
}

package_definition package_generate(std::string const &name, fs::path const &file) {
  if (name.empty()) { throw config_error("package_generate: a package name is required"); }

  package_definition pkg;
  if (fs::exists(file)) { pkg = package_load(file); }
  pkg.kind = std::string{ kPackageKind };
  pkg.metadata.name = name;
  package_save(pkg, file);
  return pkg;
}

}  // namespace bale
