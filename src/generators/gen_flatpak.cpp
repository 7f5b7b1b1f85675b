#include "gen_flatpak.h"

#include "cache.h"
#include "errors.h"
#include "launcher.h"
#include "shell.h"
#include "tui.h"
#include "util.h"

#include <algorithm>
#include <cstdio>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace packup {

namespace {

std::string octal_mode(fs::perms p) {
  char buf[8];
  std::snprintf(buf, sizeof buf, "%o", static_cast<unsigned>(p & fs::perms::mask));
  return buf;
}

[[noreturn]] void throw_flatpak(std::string const &what,
                                fs::path const &path,
                                std::error_code const &ec) {
  throw staging_error{ "flatpak: " + what + " " + path.string() + ": " + ec.message() };
}

std::vector<fs::path> sorted_entries(fs::path const &root) {
  std::vector<fs::path> entries;
  std::error_code ec;
  fs::recursive_directory_iterator it{ root, ec };
  if (ec) { throw_flatpak("failed to read", root, ec); }

  for (fs::recursive_directory_iterator const end{}; it != end; it.increment(ec)) {
    if (ec) { throw_flatpak("failed to iterate", root, ec); }
    if (it->is_symlink(ec) || it->is_regular_file(ec)) {
      entries.push_back(it->path().lexically_relative(root));
    }
  }
  if (ec) { throw_flatpak("failed to iterate", root, ec); }

  std::sort(entries.begin(), entries.end());
  return entries;
}

}  // namespace

nlohmann::json flatpak_manifest(deploy_config const &cfg, fs::path const &files_dir) {
  auto const files_rel{ files_dir.filename() };

  nlohmann::json sources = nlohmann::json::array();
  nlohmann::json commands = nlohmann::json::array();

  size_t index{ 0 };
  for (auto const &rel : sorted_entries(files_dir)) {
    auto const full{ files_dir / rel };
    auto const dest{ "/app/" + rel.generic_string() };

    std::error_code ec;
    if (fs::is_symlink(fs::symlink_status(full, ec))) {
      auto const link{ fs::read_symlink(full, ec) };
      if (ec) { throw_flatpak("failed to read symlink", full, ec); }
      auto const target{ link.generic_string() };
      auto const parent{ "/app/" + rel.parent_path().generic_string() };
      commands.push_back("mkdir -p " + shell_quote(parent));
      commands.push_back("ln -sf " + shell_quote(target) + " " + shell_quote(dest));
      continue;
    }

    auto const st{ fs::status(full, ec) };
    if (ec) { throw_flatpak("failed to stat", full, ec); }

    // dest-filename must be unique across the module's sources.
    auto const dest_filename{ std::to_string(index++) + "-" + rel.filename().string() };
    sources.push_back({ { "type", "file" },
                        { "path", (files_rel / rel).generic_string() },
                        { "dest-filename", dest_filename } });
    commands.push_back("install -Dm" + octal_mode(st.permissions()) + " " +
                       shell_quote(dest_filename) + " " + shell_quote(dest));
  }

  return {
    { "app-id", cfg.flatpak.app_id },
    { "runtime", cfg.flatpak.runtime },
    { "runtime-version", cfg.flatpak.runtime_version },
    { "sdk", cfg.flatpak.sdk },
    { "command", cfg.name + ".sh" },
    { "finish-args", { "--share=ipc", "--socket=x11", "--socket=wayland" } },
    { "modules",
      nlohmann::json::array({ { { "name", cfg.name },
                                { "buildsystem", "simple" },
                                { "sources", sources },
                                { "build-commands", commands } } }) },
  };
}

bool flatpak_remote_add_succeeded(int exit_code, std::string_view stderr_text) {
  return exit_code == 0 || stderr_text.find("already exists") != std::string_view::npos;
}

fs::path gen_flatpak::run(deploy_context const &ctx) {
  auto const &cfg{ ctx.config };
  scoped_temp_dir staging{ "flatpak" };
  auto const files_dir{ staging.path() / "files" };

  // The launcher lands in /app/bin so the manifest command is found on PATH.
  generator_stage_bundle(ctx,
                         { .root = files_dir,
                           .launcher_path = files_dir / "bin" / (cfg.name + ".sh"),
                           .base_var = "/app",
                           .prelude = {} });

  auto const manifest_path{ staging.path() / (cfg.flatpak.app_id + ".json") };
  util_write_file(manifest_path, flatpak_manifest(cfg, files_dir).dump(2) + "\n");

  // The repo outlives this run so the user remote added below stays valid.
  auto const repo_dir{ ctx.tools.root() / "flatpak" / cfg.flatpak.app_id / "repo" };
  std::error_code ec;
  fs::create_directories(repo_dir, ec);
  if (ec) { throw_flatpak("failed to create directory", repo_dir, ec); }

  shell_run_tool({ "flatpak-builder",
                   "--force-clean",
                   "--repo=" + repo_dir.string(),
                   (staging.path() / "build").string(),
                   manifest_path.string() },
                 { .cwd = staging.path(), .env = {} });

  auto const artifact{ ctx.output_dir / (cfg.name + ".flatpak") };
  shell_run_tool({ "flatpak", "build-bundle", repo_dir.string(), artifact.string(),
                   cfg.flatpak.app_id });
  tui::info("flatpak: %s", artifact.c_str());

  if (!cfg.flatpak.install) { return artifact; }

  auto const remote{ "packup-" + cfg.name };
  auto const added{ shell_run({ "flatpak", "remote-add", "--user", "--no-gpg-verify", remote,
                                repo_dir.string() }) };
  if (!flatpak_remote_add_succeeded(added.exit_code, added.err)) {
    throw external_tool_error{ "flatpak", added.exit_code, shell_tail(added.err, 20) };
  }
  if (added.exit_code != 0) { tui::debug("flatpak: remote %s already exists", remote.c_str()); }

  shell_run_tool({ "flatpak", "install", "--user", "-y", "--reinstall", remote,
                   cfg.flatpak.app_id });
  tui::info("flatpak: installed %s for the current user", cfg.flatpak.app_id.c_str());
  return artifact;
}

}  // namespace packup
