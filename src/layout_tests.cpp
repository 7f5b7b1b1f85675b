#include "layout.h"

#include "test_support.h"
#include "util.h"

#include "doctest/doctest.h"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

TEST_CASE("layout_derive maps dependency dirs relative to their roots") {
  auto const tmp{ packup::test::make_temp_dir("layout-basic") };
  packup::scoped_path_cleanup cleanup{ tmp };

  auto const dep{ packup::test::make_package(tmp / "zlib",
                                             "zlib",
                                             { "lib/libz.so", "bin/zpipe" },
                                             { "lib" },
                                             { "bin" }) };
  auto const out{ packup::layout_derive({ dep }) };

  CHECK(out.lib_dirs == std::set<fs::path>{ "lib" });
  CHECK(out.bin_dirs == std::set<fs::path>{ "bin" });
  REQUIRE(out.copies.size() == 2);
  CHECK(out.copies.at(tmp / "zlib" / "lib") == fs::path{ "lib" });
  CHECK(out.copies.at(tmp / "zlib" / "bin") == fs::path{ "bin" });
}

TEST_CASE("layout_derive collapses overlapping relative dirs") {
  auto const tmp{ packup::test::make_temp_dir("layout-overlap") };
  packup::scoped_path_cleanup cleanup{ tmp };

  auto const a{ packup::test::make_package(tmp / "a", "a", { "lib/liba.so" }, { "lib" }) };
  auto const b{ packup::test::make_package(
      tmp / "b", "b", { "lib/libb.so", "lib64/libb64.so" }, { "lib", "lib64" }) };
  auto const out{ packup::layout_derive({ a, b }) };

  CHECK(out.lib_dirs == std::set<fs::path>{ "lib", "lib64" });
  CHECK(out.bin_dirs.empty());
  CHECK(out.copies.size() == 3);
  CHECK(out.copies.at(tmp / "a" / "lib") == fs::path{ "lib" });
  CHECK(out.copies.at(tmp / "b" / "lib") == fs::path{ "lib" });
}

TEST_CASE("layout_derive skips empty and missing dirs") {
  auto const tmp{ packup::test::make_temp_dir("layout-empty") };
  packup::scoped_path_cleanup cleanup{ tmp };

  auto dep{ packup::test::make_package(tmp / "p", "p", {}, { "lib" }, { "bin" }) };
  dep.lib_paths.insert(tmp / "p" / "does-not-exist");
  auto const out{ packup::layout_derive({ dep }) };

  CHECK(out.lib_dirs.empty());
  CHECK(out.bin_dirs.empty());
  CHECK(out.copies.empty());
}

TEST_CASE("layout_derive keeps dirs outside the root verbatim") {
  auto const tmp{ packup::test::make_temp_dir("layout-outside") };
  packup::scoped_path_cleanup cleanup{ tmp };

  packup::util_write_file(tmp / "shared" / "lib" / "libx.so", "x");
  packup::dependency dep{ .name = "p",
                          .root_path = tmp / "p",
                          .lib_paths = { tmp / "shared" / "lib" },
                          .bin_paths = {} };
  fs::create_directories(dep.root_path);

  auto const out{ packup::layout_derive({ dep }) };
  CHECK(out.lib_dirs == std::set<fs::path>{ fs::path{ "../shared/lib" } });
}

TEST_CASE("layout_derive is independent of dependency order") {
  auto const tmp{ packup::test::make_temp_dir("layout-order") };
  packup::scoped_path_cleanup cleanup{ tmp };

  auto const a{ packup::test::make_package(tmp / "a", "a", { "lib/a.so" }, { "lib" }) };
  auto const b{ packup::test::make_package(tmp / "b", "b", { "bin/b" }, {}, { "bin" }) };

  auto const ab{ packup::layout_derive({ a, b }) };
  auto const ba{ packup::layout_derive({ b, a }) };
  CHECK(ab.lib_dirs == ba.lib_dirs);
  CHECK(ab.bin_dirs == ba.bin_dirs);
  CHECK(ab.copies == ba.copies);
}
