#include "archiver.h"

#include "errors.h"
#include "tui.h"
#include "util.h"

#include "archive.h"
#include "archive_entry.h"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace packup {
namespace {

constexpr size_t kCopyChunkSize{ 64 * 1024 };

struct archive_file_writer : unmovable {
  explicit archive_file_writer(archive_format fmt) : handle(archive_write_new()) {
    if (!handle) { throw staging_error{ "archive: archive_write_new failed" }; }

    int rc{ ARCHIVE_OK };
    switch (fmt) {
      case archive_format::zip: rc = archive_write_set_format_zip(handle); break;
      case archive_format::tar:
        rc = archive_write_set_format_pax_restricted(handle);
        break;
      case archive_format::gztar:
        rc = archive_write_set_format_pax_restricted(handle);
        if (rc == ARCHIVE_OK) { rc = archive_write_add_filter_gzip(handle); }
        break;
      case archive_format::bztar:
        rc = archive_write_set_format_pax_restricted(handle);
        if (rc == ARCHIVE_OK) { rc = archive_write_add_filter_bzip2(handle); }
        break;
      case archive_format::xztar:
        rc = archive_write_set_format_pax_restricted(handle);
        if (rc == ARCHIVE_OK) { rc = archive_write_add_filter_xz(handle); }
        break;
    }
    if (rc != ARCHIVE_OK) { fail("failed to configure format"); }
  }

  ~archive_file_writer() {
    if (handle) {
      if (opened) { archive_write_close(handle); }
      archive_write_free(handle);
    }
  }

  void open(fs::path const &path) {
    if (archive_write_open_filename(handle, path.c_str()) != ARCHIVE_OK) {
      fail("failed to open " + path.string());
    }
    opened = true;
  }

  // Flushes compressed trailers; errors here mean a truncated archive.
  void close() {
    opened = false;
    if (archive_write_close(handle) != ARCHIVE_OK) { fail("failed to finish archive"); }
  }

  [[noreturn]] void fail(std::string const &what) const {
    char const *detail{ archive_error_string(handle) };
    throw staging_error{ "archive: " + what + (detail ? std::string{ ": " } + detail : "") };
  }

  archive *handle{ nullptr };
  bool opened{ false };
};

using entry_ptr_t = std::unique_ptr<archive_entry, decltype(&archive_entry_free)>;

std::vector<fs::path> collect_entries(fs::path const &root) {
  std::vector<fs::path> entries;
  std::error_code ec;
  fs::recursive_directory_iterator it{ root, ec };
  if (ec) {
    throw staging_error{ "archive: failed to read " + root.string() + ": " + ec.message() };
  }

  for (fs::recursive_directory_iterator const end{}; it != end; it.increment(ec)) {
    if (ec) { break; }
    entries.push_back(it->path().lexically_relative(root));
  }
  if (ec) {
    throw staging_error{ "archive: failed to iterate " + root.string() + ": " + ec.message() };
  }

  std::sort(entries.begin(), entries.end());
  return entries;
}

void write_file_data(archive_file_writer &writer, fs::path const &path) {
  file_ptr_t file{ util_open_file(path, "rb") };
  if (!file) { throw staging_error{ "archive: failed to open " + path.string() }; }

  std::vector<char> buffer(kCopyChunkSize);
  while (true) {
    size_t const n{ std::fread(buffer.data(), 1, buffer.size(), file.get()) };
    if (n > 0 && archive_write_data(writer.handle, buffer.data(), n) < 0) {
      writer.fail("failed to write data for " + path.string());
    }
    if (n < buffer.size()) {
      if (std::ferror(file.get())) {
        throw staging_error{ "archive: failed to read " + path.string() };
      }
      break;
    }
  }
}

// Returns false for entries that cannot be archived (sockets, fifos).
bool write_entry(archive_file_writer &writer,
                 fs::path const &source_dir,
                 fs::path const &rel,
                 std::string_view prefix) {
  auto const full{ source_dir / rel };
  std::error_code ec;
  auto const st{ fs::symlink_status(full, ec) };
  if (ec) {
    throw staging_error{ "archive: failed to stat " + full.string() + ": " + ec.message() };
  }

  std::string name{ rel.generic_string() };
  if (!prefix.empty()) { name = std::string{ prefix } + "/" + name; }

  entry_ptr_t entry{ archive_entry_new(), &archive_entry_free };
  if (!entry) { throw staging_error{ "archive: archive_entry_new failed" }; }

  auto const mode{ static_cast<int>(st.permissions() & fs::perms::mask) };
  archive_entry_set_perm(entry.get(), static_cast<mode_t>(mode));

  auto const mtime{ fs::last_write_time(full, ec) };
  if (!ec && st.type() != fs::file_type::symlink) {
    auto const secs{ std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::file_clock::to_sys(mtime).time_since_epoch()) };
    archive_entry_set_mtime(entry.get(), static_cast<time_t>(secs.count()), 0);
  }

  bool has_data{ false };
  switch (st.type()) {
    case fs::file_type::directory:
      archive_entry_set_filetype(entry.get(), AE_IFDIR);
      name.push_back('/');
      break;
    case fs::file_type::symlink: {
      auto const target{ fs::read_symlink(full, ec) };
      if (ec) {
        throw staging_error{ "archive: failed to read link " + full.string() + ": " +
                             ec.message() };
      }
      archive_entry_set_filetype(entry.get(), AE_IFLNK);
      archive_entry_set_symlink(entry.get(), target.c_str());
      break;
    }
    case fs::file_type::regular:
      archive_entry_set_filetype(entry.get(), AE_IFREG);
      archive_entry_set_size(entry.get(), static_cast<la_int64_t>(fs::file_size(full)));
      has_data = true;
      break;
    default:
      tui::debug("archive: skipping special file %s", full.c_str());
      return false;
  }

  archive_entry_set_pathname(entry.get(), name.c_str());
  if (archive_write_header(writer.handle, entry.get()) != ARCHIVE_OK) {
    writer.fail("failed to write header for " + name);
  }
  if (has_data) { write_file_data(writer, full); }
  return true;
}

}  // namespace

std::optional<archive_format> archive_format_parse(std::string_view name) {
  if (name == "zip") { return archive_format::zip; }
  if (name == "tar") { return archive_format::tar; }
  if (name == "gztar") { return archive_format::gztar; }
  if (name == "bztar") { return archive_format::bztar; }
  if (name == "xztar") { return archive_format::xztar; }
  return std::nullopt;
}

std::string_view archive_format_name(archive_format fmt) {
  switch (fmt) {
    case archive_format::zip: return "zip";
    case archive_format::tar: return "tar";
    case archive_format::gztar: return "gztar";
    case archive_format::bztar: return "bztar";
    case archive_format::xztar: return "xztar";
  }
  return "unknown";
}

std::string_view archive_format_extension(archive_format fmt) {
  switch (fmt) {
    case archive_format::zip: return ".zip";
    case archive_format::tar: return ".tar";
    case archive_format::gztar: return ".tar.gz";
    case archive_format::bztar: return ".tar.bz2";
    case archive_format::xztar: return ".tar.xz";
  }
  return "";
}

std::uint64_t archive_directory(fs::path const &source_dir,
                                fs::path const &archive_path,
                                archive_options const &options) {
  auto const entries{ collect_entries(source_dir) };

  std::error_code ec;
  if (auto const parent{ archive_path.parent_path() }; !parent.empty()) {
    fs::create_directories(parent, ec);
    if (ec) {
      throw staging_error{ "archive: failed to create " + parent.string() + ": " +
                           ec.message() };
    }
  }

  scoped_path_cleanup partial{ archive_path };
  std::uint64_t written{ 0 };
  {
    archive_file_writer writer{ options.format };
    writer.open(archive_path);

    if (!options.prefix.empty()) {
      entry_ptr_t root{ archive_entry_new(), &archive_entry_free };
      if (!root) { throw staging_error{ "archive: archive_entry_new failed" }; }
      std::string const root_name{ std::string{ options.prefix } + "/" };
      archive_entry_set_pathname(root.get(), root_name.c_str());
      archive_entry_set_filetype(root.get(), AE_IFDIR);
      archive_entry_set_perm(root.get(), 0755);
      if (archive_write_header(writer.handle, root.get()) != ARCHIVE_OK) {
        writer.fail("failed to write header for " + root_name);
      }
      ++written;
    }

    for (auto const &rel : entries) {
      if (write_entry(writer, source_dir, rel, options.prefix)) { ++written; }
    }
    writer.close();
  }
  partial.release();

  tui::debug("archive: wrote %llu entries to %s",
             static_cast<unsigned long long>(written),
             archive_path.c_str());
  return written;
}

}  // namespace packup
