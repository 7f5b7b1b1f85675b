#include "launcher.h"

#include "errors.h"
#include "shell.h"
#include "tui.h"
#include "util.h"

#include <sstream>
#include <stdexcept>
#include <string_view>

namespace packup {

namespace {

bool is_shell_safe(std::string_view word) {
  for (char const c : word) {
    bool const ok{ (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                   std::string_view{ "/._+,@%=:-" }.find(c) != std::string_view::npos };
    if (!ok) { return false; }
  }
  return true;
}

// Relative part of a path word, quoted only when the shell would mangle it.
std::string shell_word(std::string const &s) { return is_shell_safe(s) ? s : shell_quote(s); }

std::string join_base(std::string const &base_var, std::filesystem::path const &rel) {
  auto const generic{ rel.generic_string() };
  if (generic.empty() || generic == ".") { return base_var; }
  return base_var + "/" + shell_word(generic);
}

// cd target: the base stays double-quoted so variables expand.
std::string cd_target(std::string const &base_var, std::filesystem::path const &rel) {
  auto const generic{ rel.generic_string() };
  if (generic.empty() || generic == ".") { return "\"" + base_var + "\""; }
  if (is_shell_safe(generic)) { return "\"" + base_var + "/" + generic + "\""; }
  return "\"" + base_var + "\"/" + shell_quote(generic);
}

void emit_export(std::ostringstream &out,
                 char const *var,
                 std::string const &base_var,
                 std::set<std::filesystem::path> const &dirs) {
  if (dirs.empty()) { return; }
  out << "export " << var << "=$" << var;
  for (auto const &dir : dirs) { out << ':' << join_base(base_var, dir); }
  out << '\n';
}

}  // namespace

std::string launcher_render(launcher_spec const &spec) {
  auto const exe_name{ spec.executable_rel_path.filename().string() };
  if (exe_name.empty()) {
    throw std::invalid_argument("launcher_render: executable path has no file name");
  }

  std::ostringstream out;
  out << "#!/bin/sh\n";
  if (!spec.prelude.empty()) {
    out << spec.prelude;
    if (spec.prelude.back() != '\n') { out << '\n'; }
  }

  emit_export(out, "PATH", spec.base_var, spec.bin_dirs);
  emit_export(out, "LD_LIBRARY_PATH", spec.base_var, spec.lib_dirs);

  out << "PACKUP_PREV_DIR=\"$(pwd)\"\n"
      << "cd " << cd_target(spec.base_var, spec.executable_rel_path.parent_path())
      << " || exit 1\n"
      << "./" << shell_word(exe_name) << " \"$@\"\n"
      << "PACKUP_STATUS=$?\n"
      << "cd \"$PACKUP_PREV_DIR\" || true\n"
      << "exit $PACKUP_STATUS\n";
  return out.str();
}

void launcher_write(launcher_spec const &spec, std::filesystem::path const &output_path) {
  try {
    util_write_file(output_path, launcher_render(spec));
  } catch (std::runtime_error const &e) {
    throw staging_error{ "launcher: " + std::string{ e.what() } };
  }

  if (!util_make_executable(output_path)) {
    tui::warn("launcher: failed to mark %s executable", output_path.c_str());
  }
  tui::debug("launcher: wrote %s", output_path.c_str());
}

}  // namespace packup
