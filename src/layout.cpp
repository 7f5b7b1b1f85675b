#include "layout.h"

#include "tui.h"

#include <system_error>

namespace packup {

namespace {

bool is_nonempty_dir(std::filesystem::path const &dir) {
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) { return false; }
  std::filesystem::directory_iterator it{ dir, ec };
  if (ec) { return false; }
  return it != std::filesystem::directory_iterator{};
}

std::filesystem::path relative_to_root(std::filesystem::path const &dir,
                                       std::filesystem::path const &root) {
  auto rel{ dir.lexically_relative(root) };
  if (rel.empty()) { rel = dir.filename(); }
  return rel;
}

void add_dirs(dependency const &dep,
              std::set<std::filesystem::path> const &paths,
              char const *kind,
              std::set<std::filesystem::path> &rel_dirs,
              layout &out) {
  for (auto const &path : paths) {
    if (!is_nonempty_dir(path)) {
      tui::debug("%s: skipping empty or missing %s dir %s",
                 dep.name.c_str(),
                 kind,
                 path.c_str());
      continue;
    }

    auto const rel{ relative_to_root(path, dep.root_path) };
    if (!rel.empty() && *rel.begin() == "..") {
      tui::warn("%s: %s dir %s is outside the package root",
                dep.name.c_str(),
                kind,
                path.c_str());
    }

    rel_dirs.insert(rel);
    out.copies[path] = rel;
  }
}

}  // namespace

layout layout_derive(std::vector<dependency> const &deps) {
  layout out;
  for (auto const &dep : deps) {
    add_dirs(dep, dep.lib_paths, "lib", out.lib_dirs, out);
    add_dirs(dep, dep.bin_paths, "bin", out.bin_dirs, out);
  }

  tui::debug("layout: %zu lib dirs, %zu bin dirs, %zu copies",
             out.lib_dirs.size(),
             out.bin_dirs.size(),
             out.copies.size());
  return out;
}

}  // namespace packup
