#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace packup {

class cache;

// One resolved dependency. Path sets are absolute, sorted and unique.
struct dependency {
  std::string name;
  std::filesystem::path root_path;
  std::set<std::filesystem::path> lib_paths;
  std::set<std::filesystem::path> bin_paths;
};

// Parses conanbuildinfo.json text. Throws resolution_error on malformed input.
std::vector<dependency> manifest_parse(std::string_view json_text,
                                       std::string_view source_name = "<memory>");

std::vector<dependency> manifest_load(std::filesystem::path const &path);

// Finds conanfile.py or conanfile.txt in project_dir. Throws resolution_error
// when neither exists.
std::filesystem::path manifest_find_project_file(std::filesystem::path const &project_dir);

// Staleness key for a resolver run: SHA-256 over the argument list and the
// project description file.
std::string manifest_cache_key(std::vector<std::string> const &resolver_args,
                               std::filesystem::path const &project_file);

// Runs the resolver for project_dir unless a cached manifest for the same inputs
// exists, then parses the result.
std::vector<dependency> manifest_resolve(std::filesystem::path const &project_dir,
                                         cache &c);

}  // namespace packup
