#include "sha256.h"

#include "doctest/doctest.h"

#include <filesystem>
#include <fstream>
#include <string>

namespace {

std::filesystem::path write_temp_file(char const *name, std::string const &content) {
  auto const path{ std::filesystem::temp_directory_path() / name };
  std::ofstream out{ path, std::ios::binary };
  out << content;
  return path;
}

}  // namespace

TEST_CASE("sha256 of empty input") {
  CHECK(packup::sha256_hex(packup::sha256_builder{}.finish()) ==
        "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_CASE("sha256 of known string") {
  auto const digest{ packup::sha256_builder{}
                         .update("The quick brown fox jumps over the lazy dog")
                         .finish() };
  CHECK(packup::sha256_hex(digest) ==
        "d7a8fbb307d7809469ca9abcb0082e4f8d5651e46d3cdb762d02d0bf37c9e592");
}

TEST_CASE("sha256 incremental updates match single update") {
  auto const whole{ packup::sha256_builder{}.update("hello world").finish() };
  auto const split{ packup::sha256_builder{}.update("hello ").update("world").finish() };
  CHECK(whole == split);
}

TEST_CASE("sha256 of file matches string digest") {
  auto const path{ write_temp_file("packup-sha256-test.txt", "abc") };
  CHECK(packup::sha256_hex(packup::sha256(path)) ==
        "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  std::filesystem::remove(path);
}

TEST_CASE("sha256 of missing file throws") {
  CHECK_THROWS_AS(packup::sha256("/nonexistent/packup/file"), std::runtime_error);
}

TEST_CASE("sha256 builder rejects reuse after finish") {
  packup::sha256_builder builder;
  builder.update("x");
  static_cast<void>(builder.finish());
  CHECK_THROWS_AS(builder.update("y"), std::logic_error);
}
