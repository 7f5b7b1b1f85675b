#include "generators/gen_archive.h"

#include "test_support.h"
#include "util.h"

#include "archive.h"
#include "archive_entry.h"
#include "doctest/doctest.h"

#include <filesystem>
#include <set>
#include <string>

namespace fs = std::filesystem;

namespace {

std::set<std::string> list_archive(fs::path const &path) {
  archive *reader{ archive_read_new() };
  REQUIRE(reader != nullptr);
  archive_read_support_filter_all(reader);
  archive_read_support_format_all(reader);
  REQUIRE(archive_read_open_filename(reader, path.c_str(), 10240) == ARCHIVE_OK);

  std::set<std::string> names;
  archive_entry *entry{ nullptr };
  while (archive_read_next_header(reader, &entry) == ARCHIVE_OK) {
    if (archive_entry_filetype(entry) == AE_IFREG) {
      names.insert(archive_entry_pathname(entry));
    }
  }
  archive_read_close(reader);
  archive_read_free(reader);
  return names;
}

}  // namespace

TEST_CASE_FIXTURE(packup::test::deploy_fixture, "gen_archive writes each archive format") {
  for (auto const fmt : { packup::archive_format::zip,
                          packup::archive_format::tar,
                          packup::archive_format::gztar,
                          packup::archive_format::bztar,
                          packup::archive_format::xztar }) {
    packup::gen_archive gen{ fmt };
    CAPTURE(gen.name());

    auto const artifact{ gen.run(context()) };
    CHECK(artifact ==
          out_dir / ("hello" + std::string{ packup::archive_format_extension(fmt) }));
    REQUIRE(fs::exists(artifact));

    CHECK(list_archive(artifact) == std::set<std::string>{ "hello/bin/helper",
                                                           "hello/hello",
                                                           "hello/hello.sh",
                                                           "hello/lib/libtool.so",
                                                           "hello/lib/libz.so.1" });
  }
}

TEST_CASE_FIXTURE(packup::test::deploy_fixture, "gen_archive discards its staging tree") {
  auto const tmp{ fs::temp_directory_path() };
  auto const count_staging_dirs = [&tmp] {
    size_t count{ 0 };
    for (auto const &entry : fs::directory_iterator(tmp)) {
      if (entry.path().filename().string().rfind("packup-gztar-", 0) == 0) { ++count; }
    }
    return count;
  };

  auto const before{ count_staging_dirs() };
  packup::gen_archive gen{ packup::archive_format::gztar };
  static_cast<void>(gen.run(context()));
  CHECK(count_staging_dirs() == before);
}
