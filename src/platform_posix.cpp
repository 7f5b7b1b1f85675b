#include "platform.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace packup::platform {

namespace {

[[noreturn]] void throw_errno(int err, std::string const &what) {
  throw std::system_error(err, std::generic_category(), what);
}

}  // namespace

// flock locks belong to the open file description, so each file_lock gets its
// own open() and two threads of one process exclude each other.
file_lock::file_lock(std::filesystem::path const &path) {
  int const fd{ ::open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644) };
  if (fd < 0) { throw_errno(errno, "file_lock: open " + path.string()); }

  while (::flock(fd, LOCK_EX) != 0) {
    if (errno == EINTR) { continue; }
    int const err{ errno };
    ::close(fd);
    throw_errno(err, "file_lock: flock " + path.string());
  }
  fd_ = fd;
}

file_lock::~file_lock() {
  if (fd_ >= 0) { ::close(fd_); }
}

file_lock::file_lock(file_lock &&other) noexcept : fd_{ std::exchange(other.fd_, -1) } {}

file_lock &file_lock::operator=(file_lock &&other) noexcept {
  if (this != &other) {
    if (fd_ >= 0) { ::close(fd_); }
    fd_ = std::exchange(other.fd_, -1);
  }
  return *this;
}

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to) {
  if (::rename(from.c_str(), to.c_str()) != 0) {
    throw_errno(errno, "atomic_rename: " + from.string() + " -> " + to.string());
  }
}

void touch_file(std::filesystem::path const &path) {
  int const fd{ ::open(path.c_str(), O_CREAT | O_WRONLY | O_CLOEXEC, 0644) };
  if (fd < 0) { throw_errno(errno, "touch_file: " + path.string()); }
  ::close(fd);
}

std::optional<std::filesystem::path> get_default_cache_root() {
  if (char const *root{ std::getenv("PACKUP_CACHE_ROOT") }) {
    return std::filesystem::path{ root };
  }
  if (char const *xdg{ std::getenv("XDG_CACHE_HOME") }) {
    return std::filesystem::path{ xdg } / "packup";
  }
  if (char const *home{ std::getenv("HOME") }) {
    return std::filesystem::path{ home } / ".cache" / "packup";
  }
  return std::nullopt;
}

char const *get_default_cache_root_env_vars() {
  return "PACKUP_CACHE_ROOT, XDG_CACHE_HOME or HOME";
}

std::filesystem::path get_exe_path() {
  std::error_code ec;
  auto exe{ std::filesystem::read_symlink("/proc/self/exe", ec) };
  if (ec) { throw std::system_error(ec, "get_exe_path: /proc/self/exe"); }
  return exe;
}

}  // namespace packup::platform
