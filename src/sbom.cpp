#include "sbom.h"

#include "sha256.h"
#include "tui.h"
#include "util.h"

#include "nlohmann/json.hpp"

#include <algorithm>

namespace bale {

void json_sbom_cataloger::catalog(sbom_request const &request) {
  std::filesystem::create_directories(request.output_dir);

  for (auto const &component : request.components) {
    std::vector<std::pair<std::string, std::filesystem::path>> entries;
    entries.reserve(component.files.size());
    for (auto const &file : component.files) {
      entries.emplace_back(file.lexically_relative(component.root).generic_string(), file);
    }
    std::ranges::sort(entries);

    auto files{ nlohmann::json::array() };
    for (auto const &[rel, abs] : entries) {
      files.push_back({ { "path", rel },
                        { "sha256", sha256_hex(sha256(abs)) },
                        { "size", std::filesystem::file_size(abs) } });
    }

    nlohmann::json const doc{ { "component", component.name }, { "files", files } };
    util_write_file(request.output_dir / (component.name + ".json"), doc.dump(2) + "\n");
    tui::debug("sbom: %s lists %zu files", component.name.c_str(), entries.size());
  }

  if (!request.images.empty()) {
    auto images{ request.images };
    std::ranges::sort(images);
    nlohmann::json const doc{ { "images", images } };
    util_write_file(request.output_dir / "images.json", doc.dump(2) + "\n");
  }
}

}  // namespace bale
