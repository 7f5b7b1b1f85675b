#pragma once

#include <filesystem>
#include <string_view>

namespace packup {

class cache;

// A third-party packaging tool fetched on first use and kept in the cache.
struct tool_spec {
  std::string_view name;
  std::string_view version;
  std::string_view url;
  std::string_view file_name;  // name of the downloaded file inside the payload
  bool self_extracting;        // makeself .run archive, unpacked with --noexec --target
};

extern tool_spec const kMakeselfTool;
extern tool_spec const kAppRunTool;
extern tool_spec const kAppImageTool;

// Returns the tool's payload directory, downloading it into the cache when
// missing. Downloaded files are marked executable.
std::filesystem::path tool_ensure(cache &c, tool_spec const &spec);

}  // namespace packup
