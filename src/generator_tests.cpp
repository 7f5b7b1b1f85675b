#include "generator.h"

#include "test_support.h"
#include "util.h"

#include "doctest/doctest.h"

#include <filesystem>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

TEST_CASE("generator registry creates every registered backend") {
  for (auto const &name : packup::generator::names()) {
    CAPTURE(name);
    auto const gen{ packup::generator::create(name) };
    REQUIRE(gen != nullptr);
    CHECK(gen->name() == name);
  }
  CHECK(packup::generator::names().size() == 9);
}

TEST_CASE("generator registry rejects unknown names") {
  CHECK_THROWS_AS(packup::generator::create("deb"), std::invalid_argument);
  CHECK_THROWS_AS(packup::generator::create(""), std::invalid_argument);
}

TEST_CASE_FIXTURE(packup::test::deploy_fixture,
                  "generator_stage_bundle stages deps, executable and launcher") {
  auto const bundle{ root / "bundle" };
  packup::generator_stage_bundle(context(),
                                 { .root = bundle,
                                   .launcher_path = bundle / "hello.sh",
                                   .base_var = "$APPDIR",
                                   .prelude = {} });

  auto const files{ packup::test::collect_files_recursive(bundle) };
  CHECK(files == std::vector<std::string>{ "bin/helper",
                                           "hello",
                                           "hello.sh",
                                           "lib/libtool.so",
                                           "lib/libz.so.1" });

  auto const script{ packup::test::read_file(bundle / "hello.sh") };
  CHECK(script.find("export PATH=$PATH:$APPDIR/bin\n") != std::string::npos);
  CHECK(script.find("export LD_LIBRARY_PATH=$LD_LIBRARY_PATH:$APPDIR/lib\n") !=
        std::string::npos);
  CHECK(script.find("cd \"$APPDIR\"") != std::string::npos);
  CHECK(script.find("./hello \"$@\"") != std::string::npos);
}
