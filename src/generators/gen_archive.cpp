#include "gen_archive.h"

#include "launcher.h"
#include "tui.h"
#include "util.h"

#include <string>

namespace packup {

std::filesystem::path gen_archive::run(deploy_context const &ctx) {
  scoped_temp_dir staging{ name() };
  auto const root{ staging.path() / ctx.config.name };

  generator_stage_bundle(ctx,
                         { .root = root,
                           .launcher_path = root / (ctx.config.name + ".sh"),
                           .base_var = "$APPDIR",
                           .prelude = kLauncherAppdirPrelude });

  auto const artifact{ ctx.output_dir /
                       (ctx.config.name + std::string{ archive_format_extension(format_) }) };
  archive_directory(root, artifact, { .format = format_, .prefix = ctx.config.name });

  tui::info("%.*s: %s", static_cast<int>(name().size()), name().data(), artifact.c_str());
  return artifact;
}

}  // namespace packup
