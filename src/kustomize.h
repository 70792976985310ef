#pragma once

#include <filesystem>
#include <string>

namespace bale {

// Renders a kustomization (local directory or remote URL) into one YAML file.
class kustomize_builder {
 public:
  virtual ~kustomize_builder() = default;
  virtual void build(std::string const &source,
                     std::filesystem::path const &output,
                     bool allow_any_directory) = 0;
};

// Runs `kustomize build` through the shell.
class shell_kustomize_builder : public kustomize_builder {
 public:
  explicit shell_kustomize_builder(std::string executable = "kustomize");

  void build(std::string const &source,
             std::filesystem::path const &output,
             bool allow_any_directory) override;

 private:
  std::string executable_;
};

}  // namespace bale
