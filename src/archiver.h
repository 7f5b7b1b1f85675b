#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>

namespace packup {

enum class archive_format { zip, tar, gztar, bztar, xztar };

std::optional<archive_format> archive_format_parse(std::string_view name);
std::string_view archive_format_name(archive_format fmt);
std::string_view archive_format_extension(archive_format fmt);  // ".zip", ".tar.gz", ...

struct archive_options {
  archive_format format{ archive_format::zip };
  std::string_view prefix;  // top-level directory for every entry; empty for none
};

// Writes the contents of source_dir to archive_path in sorted path order.
// Symlinks are stored as links. Returns the number of entries written. Throws
// staging_error on failure and removes the partial archive.
std::uint64_t archive_directory(std::filesystem::path const &source_dir,
                                std::filesystem::path const &archive_path,
                                archive_options const &options);

}  // namespace packup
