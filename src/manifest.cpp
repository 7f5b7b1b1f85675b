#include "manifest.h"

#include "cache.h"
#include "errors.h"
#include "sha256.h"
#include "shell.h"
#include "tui.h"
#include "util.h"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <utility>

namespace packup {

namespace {

constexpr char kBuildInfoFile[]{ "conanbuildinfo.json" };

std::set<std::filesystem::path> parse_path_array(nlohmann::json const &entry,
                                                 char const *field,
                                                 std::filesystem::path const &root,
                                                 std::string_view source_name) {
  std::set<std::filesystem::path> paths;

  auto const it{ entry.find(field) };
  if (it == entry.end() || it->is_null()) { return paths; }
  if (!it->is_array()) {
    throw resolution_error{ std::string{ source_name } + ": '" + field +
                            "' must be an array" };
  }

  for (auto const &value : *it) {
    if (!value.is_string()) {
      throw resolution_error{ std::string{ source_name } + ": '" + field +
                              "' entries must be strings" };
    }
    std::filesystem::path p{ value.get<std::string>() };
    if (p.is_relative()) { p = root / p; }
    p = p.lexically_normal();
    if (!p.has_filename() && p.has_parent_path()) { p = p.parent_path(); }
    paths.insert(std::move(p));
  }

  return paths;
}

dependency parse_dependency(nlohmann::json const &entry, std::string_view source_name) {
  if (!entry.is_object()) {
    throw resolution_error{ std::string{ source_name } + ": dependency must be an object" };
  }

  auto const root_it{ entry.find("rootpath") };
  if (root_it == entry.end() || !root_it->is_string() ||
      root_it->get<std::string>().empty()) {
    throw resolution_error{ std::string{ source_name } +
                            ": dependency is missing 'rootpath'" };
  }

  dependency dep;
  dep.root_path = std::filesystem::path{ root_it->get<std::string>() }.lexically_normal();
  if (!dep.root_path.has_filename() && dep.root_path.has_parent_path()) {
    dep.root_path = dep.root_path.parent_path();
  }

  if (auto const name_it{ entry.find("name") };
      name_it != entry.end() && !name_it->is_null()) {
    if (!name_it->is_string()) {
      throw resolution_error{ std::string{ source_name } + ": 'name' must be a string" };
    }
    dep.name = name_it->get<std::string>();
  }
  if (dep.name.empty()) { dep.name = dep.root_path.filename().string(); }

  dep.lib_paths = parse_path_array(entry, "lib_paths", dep.root_path, source_name);
  dep.bin_paths = parse_path_array(entry, "bin_paths", dep.root_path, source_name);
  return dep;
}

}  // namespace

std::vector<dependency> manifest_parse(std::string_view json_text,
                                       std::string_view source_name) {
  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(json_text);
  } catch (nlohmann::json::parse_error const &e) {
    throw resolution_error{ std::string{ source_name } + ": invalid JSON: " + e.what() };
  }

  if (!doc.is_object()) {
    throw resolution_error{ std::string{ source_name } + ": top level must be an object" };
  }

  auto const deps_it{ doc.find("dependencies") };
  if (deps_it == doc.end() || !deps_it->is_array()) {
    throw resolution_error{ std::string{ source_name } +
                            ": missing 'dependencies' array" };
  }

  std::vector<dependency> result;
  result.reserve(deps_it->size());
  for (auto const &entry : *deps_it) {
    result.push_back(parse_dependency(entry, source_name));
  }
  return result;
}

std::vector<dependency> manifest_load(std::filesystem::path const &path) {
  std::string text;
  try {
    text = util_load_text(path);
  } catch (std::runtime_error const &e) {
    throw resolution_error{ "failed to read dependency manifest " + path.string() + ": " +
                            e.what() };
  }
  return manifest_parse(text, path.string());
}

std::filesystem::path manifest_find_project_file(std::filesystem::path const &project_dir) {
  for (char const *candidate : { "conanfile.py", "conanfile.txt" }) {
    auto const p{ project_dir / candidate };
    std::error_code ec;
    if (std::filesystem::is_regular_file(p, ec)) { return p; }
  }
  throw resolution_error{ "no conanfile.py or conanfile.txt in " + project_dir.string() };
}

std::string manifest_cache_key(std::vector<std::string> const &resolver_args,
                               std::filesystem::path const &project_file) {
  sha256_builder builder;
  for (auto const &arg : resolver_args) {
    builder.update(arg);
    builder.update(std::string_view{ "\0", 1 });
  }
  builder.update(project_file.filename().string());
  builder.update(std::string_view{ "\0", 1 });
  builder.update_file(project_file);
  return sha256_hex(builder.finish());
}

std::vector<dependency> manifest_resolve(std::filesystem::path const &project_dir,
                                         cache &c) {
  auto const abs_project{ std::filesystem::absolute(project_dir).lexically_normal() };
  auto const project_file{ manifest_find_project_file(abs_project) };

  std::vector<std::string> const key_args{ "conan", "install", abs_project.string(),
                                           "-g", "json" };
  auto const key{ manifest_cache_key(key_args, project_file) };

  auto entry{ c.ensure_manifest(key) };
  if (entry.lock) {
    tui::info("Resolving dependencies in %s", abs_project.c_str());

    auto argv{ key_args };
    argv.push_back("-if");
    argv.push_back(entry.lock->work_dir().string());

    try {
      shell_run_tool(argv, { .cwd = abs_project, .env = {} });
    } catch (external_tool_error const &e) {
      throw resolution_error{ "dependency resolution failed (exit code " +
                              std::to_string(e.exit_code()) + "): " + e.what() };
    }

    auto const produced{ entry.lock->work_dir() / kBuildInfoFile };
    std::error_code ec;
    if (!std::filesystem::is_regular_file(produced, ec)) {
      throw resolution_error{ "resolver did not produce " + produced.string() };
    }

    auto deps{ manifest_load(produced) };
    std::filesystem::copy_file(produced, entry.lock->install_dir() / kBuildInfoFile);
    entry.lock->mark_complete();
    return deps;
  }

  tui::debug("Using cached dependency manifest %s", key.c_str());
  return manifest_load(entry.payload_path / kBuildInfoFile);
}

}  // namespace packup
