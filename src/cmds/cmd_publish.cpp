#include "cmd_publish.h"

#include "cmd_common.h"
#include "image_ref.h"
#include "tui.h"

#include "CLI11.hpp"

#include <memory>
#include <string>

namespace bale {

void cmd_publish::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand(
      "publish",
      "Publish a package archive, or a definition directory as a skeleton, to a registry") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("source", cfg_ptr->source, "Package archive or definition directory")
      ->required()
      ->check(CLI::ExistingPath);
  sub->add_option("url", cfg_ptr->url, "Destination, oci://registry/namespace")
      ->required()
      ->check(
          [](std::string const &value) {
            return is_oci_url(value) ? std::string{} : "must start with oci://";
          },
          "OCI URL");
  sub->add_option("--signing-key", cfg_ptr->signing_key, "PEM private key to sign bale.yaml")
      ->check(CLI::ExistingFile);
  sub->add_option("--signing-key-pass",
                  cfg_ptr->signing_key_password,
                  "Password of the signing key");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_publish::cmd_publish(cmd_publish::cfg cfg, cmd_globals const &globals)
    : cfg_{ std::move(cfg) }, globals_{ globals } {}

void cmd_publish::execute() {
  cmd_services const owned{ globals_, "publish" };
  auto const desc{ package_publish({ .source = cfg_.source,
                                     .url = cfg_.url,
                                     .signing_key = cfg_.signing_key,
                                     .signing_key_password = cfg_.signing_key_password },
                                   owned.get()) };
  tui::print_stdout("%s\n", desc.digest.c_str());
}

}  // namespace bale
