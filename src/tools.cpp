#include "tools.h"

#include "cache.h"
#include "libcurl_util.h"
#include "shell.h"
#include "tui.h"
#include "util.h"

#include <stdexcept>
#include <string>

namespace packup {

tool_spec const kMakeselfTool{
  .name = "makeself",
  .version = "2.4.5",
  .url = "https://github.com/megastep/makeself/releases/download/release-2.4.5/"
         "makeself-2.4.5.run",
  .file_name = "makeself-2.4.5.run",
  .self_extracting = true,
};

tool_spec const kAppRunTool{
  .name = "AppRun",
  .version = "13",
  .url = "https://github.com/AppImage/AppImageKit/releases/download/13/AppRun-x86_64",
  .file_name = "AppRun-x86_64",
  .self_extracting = false,
};

tool_spec const kAppImageTool{
  .name = "appimagetool",
  .version = "13",
  .url = "https://github.com/AppImage/AppImageKit/releases/download/13/"
         "appimagetool-x86_64.AppImage",
  .file_name = "appimagetool-x86_64.AppImage",
  .self_extracting = false,
};

std::filesystem::path tool_ensure(cache &c, tool_spec const &spec) {
  auto entry{ c.ensure_tool(spec.name, spec.version) };
  if (!entry.lock) { return entry.payload_path; }

  std::string const name{ spec.name };
  std::string const version{ spec.version };
  tui::info("Downloading %s %s", name.c_str(), version.c_str());

  auto const download_dir{ spec.self_extracting ? entry.lock->work_dir()
                                                : entry.lock->install_dir() };
  auto const downloaded{ libcurl_download(spec.url, download_dir / spec.file_name) };

  if (!util_make_executable(downloaded)) {
    throw std::runtime_error("tool_ensure: failed to mark " + downloaded.string() +
                             " executable");
  }

  if (spec.self_extracting) {
    shell_run_tool({ "/bin/sh",
                     downloaded.string(),
                     "--noexec",
                     "--target",
                     entry.lock->install_dir().string() });
  }

  entry.lock->mark_complete();
  return entry.payload_path;
}

}  // namespace packup
