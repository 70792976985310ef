#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace bale {

struct sbom_component {
  std::string name;
  std::filesystem::path root;               // paths are recorded relative to this
  std::vector<std::filesystem::path> files;  // absolute, regular files only
};

struct sbom_request {
  std::filesystem::path output_dir;  // one document per component plus images.json
  std::vector<sbom_component> components;
  std::vector<std::string> images;  // references with content to describe
};

class sbom_cataloger {
 public:
  virtual ~sbom_cataloger() = default;
  virtual void catalog(sbom_request const &request) = 0;
};

// JSON inventories: sha256 and size for every file, and the image list.
// Output is sorted and carries no timestamps so identical inputs produce
// identical documents.
class json_sbom_cataloger : public sbom_cataloger {
 public:
  void catalog(sbom_request const &request) override;
};

}  // namespace bale
