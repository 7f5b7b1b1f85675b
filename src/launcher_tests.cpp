#include "launcher.h"

#include "shell.h"
#include "test_support.h"
#include "util.h"

#include "doctest/doctest.h"

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

packup::launcher_spec make_spec() {
  return { .lib_dirs = { "lib" },
           .bin_dirs = { "bin" },
           .base_var = "$APPDIR",
           .executable_rel_path = "bin/myapp",
           .prelude = {} };
}

std::vector<std::string> split_lines(std::string const &text) {
  std::vector<std::string> lines;
  std::string::size_type start{ 0 };
  while (start < text.size()) {
    auto const nl{ text.find('\n', start) };
    if (nl == std::string::npos) {
      lines.push_back(text.substr(start));
      break;
    }
    lines.push_back(text.substr(start, nl - start));
    start = nl + 1;
  }
  return lines;
}

bool contains(std::string const &haystack, std::string const &needle) {
  return haystack.find(needle) != std::string::npos;
}

}  // namespace

TEST_CASE("launcher_render exports bin and lib dirs under the base variable") {
  auto const script{ packup::launcher_render(make_spec()) };

  CHECK(script.rfind("#!/bin/sh\n", 0) == 0);
  CHECK(contains(script, "export PATH=$PATH:$APPDIR/bin\n"));
  CHECK(contains(script, "export LD_LIBRARY_PATH=$LD_LIBRARY_PATH:$APPDIR/lib\n"));
  CHECK(contains(script, "cd \"$APPDIR/bin\""));
  CHECK(contains(script, "./myapp \"$@\"\n"));
  CHECK(script.size() > 0);
  CHECK(script.back() == '\n');
}

TEST_CASE("launcher_render runs the executable before returning to the prior dir") {
  auto const script{ packup::launcher_render(make_spec()) };
  auto const cd_pos{ script.find("cd \"$APPDIR/bin\"") };
  auto const run_pos{ script.find("./myapp") };
  auto const back_pos{ script.find("cd \"$PACKUP_PREV_DIR\"") };
  auto const exit_pos{ script.find("exit $PACKUP_STATUS") };

  REQUIRE(cd_pos != std::string::npos);
  REQUIRE(back_pos != std::string::npos);
  CHECK(cd_pos < run_pos);
  CHECK(run_pos < back_pos);
  CHECK(back_pos < exit_pos);
}

TEST_CASE("launcher_render is deterministic") {
  packup::launcher_spec spec{ make_spec() };
  spec.lib_dirs = { "lib64", "lib", "plugins/lib" };
  spec.bin_dirs = { "tools", "bin" };
  CHECK(packup::launcher_render(spec) == packup::launcher_render(spec));

  packup::launcher_spec reordered{ make_spec() };
  reordered.lib_dirs = { "plugins/lib", "lib", "lib64" };
  reordered.bin_dirs = { "bin", "tools" };
  CHECK(packup::launcher_render(spec) == packup::launcher_render(reordered));
  CHECK(contains(packup::launcher_render(spec),
                 "export LD_LIBRARY_PATH=$LD_LIBRARY_PATH:$APPDIR/lib:$APPDIR/lib64:"
                 "$APPDIR/plugins/lib\n"));
}

TEST_CASE("launcher_render omits exports for empty dir sets") {
  packup::launcher_spec spec{ make_spec() };
  spec.lib_dirs.clear();
  spec.bin_dirs.clear();
  auto const script{ packup::launcher_render(spec) };
  CHECK_FALSE(contains(script, "export PATH"));
  CHECK_FALSE(contains(script, "export LD_LIBRARY_PATH"));
}

TEST_CASE("launcher_render emits the base variable verbatim") {
  packup::launcher_spec spec{ make_spec() };
  spec.base_var = "/app";
  spec.executable_rel_path = "myapp";
  auto const script{ packup::launcher_render(spec) };
  CHECK(contains(script, "export PATH=$PATH:/app/bin\n"));
  CHECK(contains(script, "cd \"/app\""));
}

TEST_CASE("launcher_render places the prelude after the shebang") {
  packup::launcher_spec spec{ make_spec() };
  spec.prelude = packup::kLauncherAppdirPrelude;
  auto const script{ packup::launcher_render(spec) };
  CHECK(script.rfind(std::string{ "#!/bin/sh\n" } + packup::kLauncherAppdirPrelude + "\n", 0) ==
        0);
}

TEST_CASE("launcher_render rejects an executable without a file name") {
  packup::launcher_spec spec{ make_spec() };
  spec.executable_rel_path = "";
  CHECK_THROWS_AS(packup::launcher_render(spec), std::invalid_argument);
}

TEST_CASE("launcher_write produces a runnable relocatable script") {
  auto const tmp{ packup::test::make_temp_dir("launcher-run") };
  packup::scoped_path_cleanup cleanup{ tmp };

  auto const bundle{ tmp / "bundle" };
  packup::util_write_file(bundle / "bin" / "myapp",
                          "#!/bin/sh\n"
                          "echo \"cwd=$(basename \"$(pwd)\")\"\n"
                          "echo \"args=$*\"\n"
                          "case \"$LD_LIBRARY_PATH\" in *\"/lib\") echo lib-ok ;; esac\n"
                          "exit 5\n");
  REQUIRE(packup::util_make_executable(bundle / "bin" / "myapp"));

  packup::launcher_spec spec{ make_spec() };
  spec.prelude = packup::kLauncherAppdirPrelude;
  packup::launcher_write(spec, bundle / "myapp.sh");

  auto const result{ packup::shell_run({ (bundle / "myapp.sh").string(), "a", "b" },
                                       { .cwd = tmp, .env = {} }) };
  auto const lines{ split_lines(result.out) };

  CHECK(result.exit_code == 5);
  REQUIRE(lines.size() == 3);
  CHECK(lines[0] == "cwd=bin");
  CHECK(lines[1] == "args=a b");
  CHECK(lines[2] == "lib-ok");
}

TEST_CASE("launcher_render quotes names the shell would split") {
  packup::launcher_spec spec{ make_spec() };
  spec.executable_rel_path = "my bin/my app";
  spec.lib_dirs = { "lib $x" };
  auto const script{ packup::launcher_render(spec) };
  CHECK(contains(script, "cd \"$APPDIR\"/'my bin' || exit 1\n"));
  CHECK(contains(script, "./'my app' \"$@\"\n"));
  CHECK(contains(script, ":$APPDIR/'lib $x'\n"));
}

TEST_CASE("launcher_render escapes single quotes in names") {
  packup::launcher_spec spec{ make_spec() };
  spec.executable_rel_path = "bin/it's";
  auto const script{ packup::launcher_render(spec) };
  CHECK(contains(script, "./'it'\\''s' \"$@\"\n"));
}

TEST_CASE("launcher_write runs an executable whose name contains spaces") {
  auto const tmp{ packup::test::make_temp_dir("launcher-spaces") };
  packup::scoped_path_cleanup cleanup{ tmp };

  auto const bundle{ tmp / "bundle" };
  auto const exe{ bundle / "my bin" / "my app" };
  packup::util_write_file(exe,
                          "#!/bin/sh\n"
                          "echo \"cwd=$(basename \"$(pwd)\")\"\n"
                          "echo \"argc=$#\"\n"
                          "exit 3\n");
  REQUIRE(packup::util_make_executable(exe));

  packup::launcher_spec spec{ make_spec() };
  spec.executable_rel_path = "my bin/my app";
  spec.prelude = packup::kLauncherAppdirPrelude;
  packup::launcher_write(spec, bundle / "run.sh");

  auto const result{ packup::shell_run({ (bundle / "run.sh").string(), "one arg", "$HOME" },
                                       { .cwd = tmp, .env = {} }) };
  CHECK(result.exit_code == 3);
  auto const lines{ split_lines(result.out) };
  REQUIRE(lines.size() == 2);
  CHECK(lines[0] == "cwd=my bin");
  CHECK(lines[1] == "argc=2");
}
