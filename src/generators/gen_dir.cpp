#include "gen_dir.h"

#include "launcher.h"
#include "tui.h"
#include "util.h"

namespace packup {

std::filesystem::path gen_dir::run(deploy_context const &ctx) {
  auto const dest{ ctx.output_dir / ctx.config.name };

  // A directory created by this run is removed again if staging fails.
  std::error_code ec;
  bool const existed{ std::filesystem::exists(dest, ec) };
  scoped_path_cleanup cleanup{ existed ? std::filesystem::path{} : dest };

  generator_stage_bundle(ctx,
                         { .root = dest,
                           .launcher_path = dest / (ctx.config.name + ".sh"),
                           .base_var = "$APPDIR",
                           .prelude = kLauncherAppdirPrelude });

  cleanup.release();
  tui::info("dir: %s", dest.c_str());
  return dest;
}

}  // namespace packup
