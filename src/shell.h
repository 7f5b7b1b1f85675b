#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace packup {

// Variables set on top of the inherited environment.
using shell_env_t = std::map<std::string, std::string>;

struct shell_options {
  std::optional<std::filesystem::path> cwd;
  shell_env_t env;
};

struct shell_result {
  int exit_code;  // 128 + signal number when the child was killed
  std::string out;
  std::string err;
};

// Runs argv directly, never through a shell. A bare argv[0] is looked up on
// PATH. stdin is /dev/null; stdout and stderr are captured whole.
shell_result shell_run(std::vector<std::string> const &argv, shell_options const &opts = {});

// shell_run for an external packaging tool. Output goes to the debug log and
// a non-zero exit throws external_tool_error carrying the tail of stderr.
shell_result shell_run_tool(std::vector<std::string> const &argv,
                            shell_options const &opts = {});

// Last max_lines lines of text, without a trailing newline.
std::string shell_tail(std::string_view text, std::size_t max_lines);

// Single-quotes s for /bin/sh.
std::string shell_quote(std::string_view s);

}  // namespace packup
