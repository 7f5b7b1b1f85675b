#pragma once

#include "cmd.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace packup {

// Resolves dependencies once, then runs each requested generator in order.
class cmd_package : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_package> {
    std::vector<std::string> generators;
    std::filesystem::path config_path{ "packup.ini" };
    std::optional<std::filesystem::path> output_dir;  // defaults to the working dir
    std::optional<std::filesystem::path> working_dir;  // defaults to the process cwd
  };

  cmd_package(cfg cfg, std::optional<std::filesystem::path> const &cli_cache_root);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

  // Artifacts produced by the last execute(), in generator order.
  std::vector<std::filesystem::path> const &artifacts() const { return artifacts_; }

 private:
  cfg cfg_;
  std::optional<std::filesystem::path> cli_cache_root_;
  std::vector<std::filesystem::path> artifacts_;
};

// Requested generator names with later duplicates dropped.
std::vector<std::string> cmd_package_unique_generators(std::vector<std::string> const &names);

}  // namespace packup
