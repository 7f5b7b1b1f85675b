#include "test_support.h"

#include "util.h"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <random>
#include <stdexcept>
#include <utility>

namespace packup::test {

std::filesystem::path make_temp_dir(std::string_view tag) {
  static std::mt19937_64 rng{ std::random_device{}() };
  auto const dir{ std::filesystem::temp_directory_path() /
                  ("packup-test-" + std::string{ tag } + "-" + std::to_string(rng())) };
  std::filesystem::create_directories(dir);
  return dir;
}

std::vector<std::string> collect_files_recursive(std::filesystem::path const &root) {
  std::vector<std::string> files;
  for (auto const &entry : std::filesystem::recursive_directory_iterator(root)) {
    if (entry.is_symlink() || entry.is_regular_file()) {
      files.push_back(entry.path().lexically_relative(root).generic_string());
    }
  }
  std::ranges::sort(files);
  return files;
}

std::string read_file(std::filesystem::path const &path) {
  std::ifstream in{ path, std::ios::binary };
  return { std::istreambuf_iterator<char>{ in }, std::istreambuf_iterator<char>{} };
}

dependency make_package(std::filesystem::path const &root,
                        std::string name,
                        std::initializer_list<std::string_view> files,
                        std::initializer_list<std::string_view> lib_dirs,
                        std::initializer_list<std::string_view> bin_dirs) {
  std::filesystem::create_directories(root);
  for (auto const file : files) { util_write_file(root / file, file); }

  dependency dep{ .name = std::move(name), .root_path = root, .lib_paths = {}, .bin_paths = {} };
  for (auto const dir : lib_dirs) {
    std::filesystem::create_directories(root / dir);
    dep.lib_paths.insert(root / dir);
  }
  for (auto const dir : bin_dirs) {
    std::filesystem::create_directories(root / dir);
    dep.bin_paths.insert(root / dir);
  }
  return dep;
}

std::filesystem::path seed_tool(cache &c,
                                std::string_view name,
                                std::string_view version,
                                std::string_view file_name,
                                std::string const &script) {
  auto entry{ c.ensure_tool(name, version) };
  if (!entry.lock) { throw std::runtime_error("seed_tool: entry already complete"); }

  auto const file{ entry.lock->install_dir() / file_name };
  util_write_file(file, script);
  if (!util_make_executable(file)) {
    throw std::runtime_error("seed_tool: cannot mark " + file.string() + " executable");
  }
  entry.lock->mark_complete();
  entry.lock.reset();
  return entry.payload_path;
}

fake_tool_on_path::fake_tool_on_path(std::filesystem::path const &bin_dir,
                                     std::string const &tool,
                                     std::string const &script) {
  util_write_file(bin_dir / tool, script);
  if (!util_make_executable(bin_dir / tool)) {
    throw std::runtime_error("fake_tool_on_path: cannot mark " + tool + " executable");
  }

  if (char const *path{ std::getenv("PATH") }) { saved_path_ = path; }
  std::string const new_path{ bin_dir.string() + ":" + saved_path_.value_or("/usr/bin:/bin") };
  ::setenv("PATH", new_path.c_str(), 1);
}

fake_tool_on_path::~fake_tool_on_path() {
  if (saved_path_) {
    ::setenv("PATH", saved_path_->c_str(), 1);
  } else {
    ::unsetenv("PATH");
  }
}

deploy_fixture::deploy_fixture() : root{ make_temp_dir("deploy") }, out_dir{ root / "out" } {
  auto const zlib{ make_package(root / "pkgs" / "zlib",
                                "zlib",
                                { "lib/libz.so.1", "include/zlib.h" },
                                { "lib" }) };
  auto const tools_pkg{ make_package(root / "pkgs" / "tools",
                                     "tools",
                                     { "lib/libtool.so", "bin/helper" },
                                     { "lib" },
                                     { "bin" }) };
  deps_layout = layout_derive({ zlib, tools_pkg });

  util_write_file(root / "build" / "hello", "#!/bin/sh\necho hello\n");
  config.name = "hello";
  config.executable = root / "build" / "hello";
  config.flatpak.app_id = "org.packup.hello";

  std::filesystem::create_directories(out_dir);
  tools = std::make_unique<cache>(root / "cache");
}

deploy_fixture::~deploy_fixture() {
  tools.reset();
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
}

deploy_context deploy_fixture::context() {
  return { .config = config,
           .deps_layout = deps_layout,
           .executable = config.executable,
           .output_dir = out_dir,
           .tools = *tools };
}

}  // namespace packup::test
