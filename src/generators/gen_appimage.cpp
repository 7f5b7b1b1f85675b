#include "gen_appimage.h"

#include "errors.h"
#include "shell.h"
#include "tools.h"
#include "tui.h"
#include "util.h"

#include <sstream>
#include <utility>
#include <system_error>

namespace fs = std::filesystem;

namespace packup {

std::string appimage_desktop_entry(deploy_config const &cfg) {
  std::ostringstream out;
  out << "[Desktop Entry]\n"
      << "Type=Application\n"
      << "Name=" << cfg.name << '\n'
      << "Exec=" << cfg.name << ".sh\n"
      << "Icon=" << cfg.name << '\n'
      << "Categories=" << cfg.appimage.categories << '\n'
      << "Terminal=true\n";
  return out.str();
}

std::string appimage_default_icon_svg(std::string const &app_name) {
  char const initial{ app_name.empty() ? '?' : app_name.front() };
  std::ostringstream out;
  out << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"256\" height=\"256\" "
         "viewBox=\"0 0 256 256\">\n"
      << "  <rect width=\"256\" height=\"256\" rx=\"32\" fill=\"#3465a4\"/>\n"
      << "  <text x=\"128\" y=\"168\" font-family=\"sans-serif\" font-size=\"128\" "
         "text-anchor=\"middle\" fill=\"#ffffff\">"
      << initial << "</text>\n"
      << "</svg>\n";
  return out.str();
}

void appimage_prepare_appdir(deploy_context const &ctx,
                             fs::path const &appdir,
                             fs::path const &apprun) {
  auto const &name{ ctx.config.name };
  auto const bin_dir{ appdir / "usr" / "bin" };

  generator_stage_bundle(ctx,
                         { .root = bin_dir,
                           .launcher_path = bin_dir / (name + ".sh"),
                           .base_var = "$APPDIR/usr/bin",
                           .prelude = {} });

  std::error_code ec;
  fs::copy_file(apprun, appdir / "AppRun", fs::copy_options::overwrite_existing, ec);
  if (ec) {
    throw staging_error{ "appimage: failed to copy AppRun: " + ec.message() };
  }
  if (!util_make_executable(appdir / "AppRun")) {
    throw staging_error{ "appimage: failed to mark AppRun executable" };
  }

  util_write_file(appdir / (name + ".desktop"), appimage_desktop_entry(ctx.config));

  if (auto const &icon{ ctx.config.appimage.icon }) {
    auto const ext{ icon->extension().string() };
    fs::copy_file(*icon, appdir / (name + ext), fs::copy_options::overwrite_existing, ec);
    if (ec) {
      throw staging_error{ "appimage: failed to copy icon " + icon->string() + ": " +
                           ec.message() };
    }
  } else {
    util_write_file(appdir / (name + ".svg"), appimage_default_icon_svg(name));
  }
}

fs::path gen_appimage::run(deploy_context const &ctx) {
  scoped_temp_dir staging{ "appimage" };
  auto const appdir{ staging.path() / (ctx.config.name + ".AppDir") };

  auto const apprun_dir{ tool_ensure(ctx.tools, kAppRunTool) };
  appimage_prepare_appdir(ctx, appdir, apprun_dir / kAppRunTool.file_name);

  auto const tool_dir{ tool_ensure(ctx.tools, kAppImageTool) };
  auto const artifact{ ctx.output_dir / (ctx.config.name + "-x86_64.AppImage") };

  shell_run_tool({ (tool_dir / kAppImageTool.file_name).string(),
                   appdir.string(),
                   artifact.string() },
                 { .cwd = staging.path(),
                   .env = { { "APPIMAGE_EXTRACT_AND_RUN", "1" }, { "ARCH", "x86_64" } } });

  tui::info("appimage: %s", artifact.c_str());
  return artifact;
}

}  // namespace packup
