#include "gen_makeself.h"

#include "errors.h"
#include "launcher.h"
#include "shell.h"
#include "tools.h"
#include "tui.h"
#include "util.h"

namespace packup {

std::vector<std::string> makeself_command(std::filesystem::path const &makeself_sh,
                                          std::filesystem::path const &stage_dir,
                                          std::filesystem::path const &artifact,
                                          std::string const &app_name) {
  return { makeself_sh.string(), stage_dir.string(), artifact.string(), app_name,
           "./" + app_name + ".sh" };
}

std::filesystem::path gen_makeself::run(deploy_context const &ctx) {
  scoped_temp_dir staging{ "makeself" };
  auto const root{ staging.path() / ctx.config.name };

  generator_stage_bundle(ctx,
                         { .root = root,
                           .launcher_path = root / (ctx.config.name + ".sh"),
                           .base_var = "$APPDIR",
                           .prelude = kLauncherAppdirPrelude });

  auto const tool_dir{ tool_ensure(ctx.tools, kMakeselfTool) };
  auto const artifact{ ctx.output_dir / (ctx.config.name + ".run") };
  auto const makeself_sh{ tool_dir / "makeself.sh" };
  if (!util_make_executable(makeself_sh)) {
    throw staging_error{ "makeself: cannot mark " + makeself_sh.string() + " executable" };
  }
  shell_run_tool(makeself_command(makeself_sh, root, artifact, ctx.config.name));

  tui::info("makeself: %s", artifact.c_str());
  return artifact;
}

}  // namespace packup
