#include "cmd_package.h"

#include "cache.h"
#include "config.h"
#include "errors.h"
#include "generator.h"
#include "layout.h"
#include "manifest.h"
#include "tui.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

namespace packup {

std::vector<std::string> cmd_package_unique_generators(std::vector<std::string> const &names) {
  std::vector<std::string> unique;
  for (auto const &name : names) {
    if (std::find(unique.begin(), unique.end(), name) == unique.end()) {
      unique.push_back(name);
    }
  }
  return unique;
}

cmd_package::cmd_package(cfg cfg,
                         std::optional<std::filesystem::path> const &cli_cache_root)
    : cfg_{ std::move(cfg) }, cli_cache_root_{ cli_cache_root } {}

void cmd_package::execute() {
  artifacts_.clear();

  auto const generators{ cmd_package_unique_generators(cfg_.generators) };
  if (generators.empty()) {
    throw std::runtime_error("package: at least one generator is required");
  }

  // Validate every name before any work is done.
  std::vector<generator::ptr_t> backends;
  for (auto const &name : generators) { backends.push_back(generator::create(name)); }

  auto const work_dir{ cfg_.working_dir ? fs::absolute(*cfg_.working_dir)
                                        : fs::current_path() };
  auto const config_path{ cfg_.config_path.is_absolute() ? cfg_.config_path
                                                         : work_dir / cfg_.config_path };

  deploy_config const config{ config_load(config_path) };
  tui::debug("package: loaded %s (name %s)", config_path.c_str(), config.name.c_str());

  auto const executable{ (config.executable.is_absolute() ? config.executable
                                                          : work_dir / config.executable)
                             .lexically_normal() };
  auto output_dir{ cfg_.output_dir ? *cfg_.output_dir : work_dir };
  if (output_dir.is_relative()) { output_dir = work_dir / output_dir; }
  output_dir = output_dir.lexically_normal();

  cache c{ cli_cache_root_ };
  tui::debug("package: cache root %s", c.root().c_str());

  auto const deps{ manifest_resolve(work_dir, c) };
  tui::info("Resolved %zu dependencies", deps.size());
  auto const deps_layout{ layout_derive(deps) };

  std::error_code ec;
  fs::create_directories(output_dir, ec);
  if (ec) {
    throw staging_error{ "package: cannot create output directory " + output_dir.string() +
                         ": " + ec.message() };
  }

  deploy_context const ctx{ .config = config,
                            .deps_layout = deps_layout,
                            .executable = executable,
                            .output_dir = output_dir,
                            .tools = c };

  for (auto &backend : backends) {
    tui::info("Generating %.*s",
              static_cast<int>(backend->name().size()),
              backend->name().data());
    artifacts_.push_back(backend->run(ctx));
  }
}

}  // namespace packup
