#pragma once

#include "generator.h"

#include <string>

namespace packup {

// <out>/<name>-x86_64.AppImage built with appimagetool from a temporary AppDir.
class gen_appimage : public generator {
 public:
  std::string_view name() const override { return "appimage"; }
  std::filesystem::path run(deploy_context const &ctx) override;
};

std::string appimage_desktop_entry(deploy_config const &cfg);

// Placeholder icon used when [appimage] icon is not set.
std::string appimage_default_icon_svg(std::string const &app_name);

// Fills appdir: bundle under usr/bin, AppRun, desktop entry and icon.
void appimage_prepare_appdir(deploy_context const &ctx,
                             std::filesystem::path const &appdir,
                             std::filesystem::path const &apprun);

}  // namespace packup
