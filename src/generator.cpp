#include "generator.h"

#include "archiver.h"
#include "generators/gen_appimage.h"
#include "generators/gen_archive.h"
#include "generators/gen_dir.h"
#include "generators/gen_flatpak.h"
#include "generators/gen_makeself.h"
#include "launcher.h"
#include "stage.h"
#include "tui.h"

#include <stdexcept>

namespace packup {

std::vector<std::string> const &generator::names() {
  static std::vector<std::string> const registered{
    "dir", "zip", "tar", "gztar", "bztar", "xztar", "makeself", "appimage", "flatpak",
  };
  return registered;
}

generator::ptr_t generator::create(std::string_view name) {
  if (name == "dir") { return std::make_unique<gen_dir>(); }
  if (auto const fmt{ archive_format_parse(name) }) {
    return std::make_unique<gen_archive>(*fmt);
  }
  if (name == "makeself") { return std::make_unique<gen_makeself>(); }
  if (name == "appimage") { return std::make_unique<gen_appimage>(); }
  if (name == "flatpak") { return std::make_unique<gen_flatpak>(); }
  throw std::invalid_argument("unknown generator: " + std::string{ name });
}

void generator_stage_bundle(deploy_context const &ctx, bundle_layout const &layout) {
  tui::debug("staging bundle into %s", layout.root.c_str());
  stage(ctx.deps_layout.copies, layout.root);
  auto const staged_exe{ stage_executable(ctx.executable, layout.root) };

  launcher_spec const spec{
    .lib_dirs = ctx.deps_layout.lib_dirs,
    .bin_dirs = ctx.deps_layout.bin_dirs,
    .base_var = layout.base_var,
    .executable_rel_path = staged_exe.lexically_relative(layout.root),
    .prelude = layout.prelude,
  };
  launcher_write(spec, layout.launcher_path);
}

}  // namespace packup
