#include "stage.h"

#include "errors.h"
#include "tui.h"
#include "util.h"

#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace packup {

namespace {

[[noreturn]] void throw_staging(std::string const &what,
                                fs::path const &path,
                                std::error_code const &ec) {
  throw staging_error{ "stage: " + what + " " + path.string() + ": " + ec.message() };
}

void ensure_dir(fs::path const &dir) {
  std::error_code ec;
  if (fs::is_directory(fs::symlink_status(dir, ec))) { return; }
  if (fs::exists(fs::symlink_status(dir, ec))) { fs::remove(dir, ec); }
  fs::create_directories(dir, ec);
  if (ec) { throw_staging("failed to create directory", dir, ec); }
}

void copy_symlink_entry(fs::path const &src, fs::path const &dst) {
  std::error_code ec;
  auto const target{ fs::read_symlink(src, ec) };
  if (ec) { throw_staging("failed to read symlink", src, ec); }

  if (fs::exists(fs::symlink_status(dst, ec))) {
    fs::remove(dst, ec);
    if (ec) { throw_staging("failed to replace", dst, ec); }
  }

  fs::create_symlink(target, dst, ec);
  if (ec) { throw_staging("failed to create symlink", dst, ec); }
}

void copy_file_entry(fs::path const &src, fs::path const &dst) {
  // A previous copy may be read-only; unlink it instead of writing through it.
  std::error_code ec;
  auto const existing{ fs::symlink_status(dst, ec) };
  if (fs::exists(existing) && !fs::is_directory(existing)) {
    fs::remove(dst, ec);
    if (ec) { throw_staging("failed to replace", dst, ec); }
  }

  fs::copy_file(src, dst, ec);
  if (ec) { throw_staging("failed to copy " + src.string() + " to", dst, ec); }
}

void copy_tree(fs::path const &source, fs::path const &dest) {
  ensure_dir(dest);

  std::error_code ec;
  fs::recursive_directory_iterator it{ source, ec };
  if (ec) { throw_staging("failed to read", source, ec); }

  for (fs::recursive_directory_iterator const end{}; it != end; it.increment(ec)) {
    if (ec) { throw_staging("failed to iterate", source, ec); }

    auto const &entry{ *it };
    auto const target{ dest / entry.path().lexically_relative(source) };

    if (entry.is_symlink(ec)) {
      copy_symlink_entry(entry.path(), target);
    } else if (entry.is_directory(ec)) {
      ensure_dir(target);
    } else if (entry.is_regular_file(ec)) {
      copy_file_entry(entry.path(), target);
    } else {
      tui::debug("stage: skipping special file %s", entry.path().c_str());
    }
  }
  if (ec) { throw_staging("failed to iterate", source, ec); }
}

}  // namespace

void stage(std::map<fs::path, fs::path> const &copies, fs::path const &destination) {
  ensure_dir(destination);

  for (auto const &[source, rel] : copies) {
    auto const dest{ (destination / rel).lexically_normal() };
    tui::debug("stage: %s -> %s", source.c_str(), dest.c_str());
    copy_tree(source, dest);
  }
}

fs::path stage_executable(fs::path const &executable, fs::path const &destination) {
  std::error_code ec;
  if (!fs::is_regular_file(executable, ec)) {
    throw staging_error{ "stage: executable not found: " + executable.string() };
  }

  ensure_dir(destination);
  auto const target{ destination / executable.filename() };
  copy_file_entry(executable, target);

  if (!util_make_executable(target)) {
    tui::warn("stage: failed to mark %s executable", target.c_str());
  }
  return target;
}

}  // namespace packup
