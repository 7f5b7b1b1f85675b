#pragma once

#include "config.h"
#include "layout.h"
#include "util.h"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace packup {

class cache;

// Everything a backend needs, computed once per run and shared read-only.
struct deploy_context {
  deploy_config const &config;
  layout const &deps_layout;
  std::filesystem::path executable;  // absolute
  std::filesystem::path output_dir;  // absolute
  cache &tools;
};

class generator : unmovable {
 public:
  using ptr_t = std::unique_ptr<generator>;

  virtual ~generator() = default;

  virtual std::string_view name() const = 0;

  // Produces the artifact and returns its path. Throws on failure.
  virtual std::filesystem::path run(deploy_context const &ctx) = 0;

  // Throws std::invalid_argument for unknown names.
  static ptr_t create(std::string_view name);

  // Registered names in registration order.
  static std::vector<std::string> const &names();

 protected:
  generator() = default;
};

// Where a backend wants the shared bundle contents placed.
struct bundle_layout {
  std::filesystem::path root;           // receives dependency dirs and the executable
  std::filesystem::path launcher_path;  // full path of the generated <name>.sh
  std::string base_var;
  std::string prelude;
};

// Stages dependencies and the executable under layout.root and writes the
// launcher. Shared by every backend.
void generator_stage_bundle(deploy_context const &ctx, bundle_layout const &layout);

}  // namespace packup
