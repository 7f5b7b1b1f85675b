#pragma once

#include <filesystem>
#include <set>
#include <string>

namespace packup {

struct launcher_spec {
  std::set<std::filesystem::path> lib_dirs;
  std::set<std::filesystem::path> bin_dirs;
  std::string base_var;                      // emitted verbatim, e.g. "$APPDIR"
  std::filesystem::path executable_rel_path;  // relative to base_var
  std::string prelude;                        // shell lines placed after the shebang
};

// Prelude that points APPDIR at the directory holding the script.
inline constexpr char kLauncherAppdirPrelude[]{
  "APPDIR=\"$(cd \"$(dirname \"$0\")\" && pwd)\""
};

std::string launcher_render(launcher_spec const &spec);

// Writes the rendered script and marks it executable.
void launcher_write(launcher_spec const &spec, std::filesystem::path const &output_path);

}  // namespace packup
