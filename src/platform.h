#pragma once

#include <filesystem>
#include <optional>

namespace packup::platform {

// Exclusive advisory lock on a file, held until destruction. The file is
// created when missing. Threads contend for it like separate processes do.
class file_lock {
 public:
  explicit file_lock(std::filesystem::path const &path);
  ~file_lock();

  file_lock(file_lock &&other) noexcept;
  file_lock &operator=(file_lock &&other) noexcept;
  file_lock(file_lock const &) = delete;
  file_lock &operator=(file_lock const &) = delete;

  explicit operator bool() const { return fd_ >= 0; }

 private:
  int fd_{ -1 };
};

// rename(2): replaces an existing file or empty directory at to.
void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to);

void touch_file(std::filesystem::path const &path);

// PACKUP_CACHE_ROOT, else $XDG_CACHE_HOME/packup, else $HOME/.cache/packup.
std::optional<std::filesystem::path> get_default_cache_root();
char const *get_default_cache_root_env_vars();

std::filesystem::path get_exe_path();

}  // namespace packup::platform
