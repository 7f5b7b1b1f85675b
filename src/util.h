#pragma once

#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace packup {

struct unmovable {
  unmovable() = default;
  unmovable(unmovable const &) = delete;
  unmovable &operator=(unmovable const &) = delete;
};

// Convert bytes to lowercase hex string
std::string util_bytes_to_hex(void const *data, size_t length);

// RAII file pointer with custom deleter
struct file_deleter {
  void operator()(std::FILE *file) const noexcept;
};
using file_ptr_t = std::unique_ptr<std::FILE, file_deleter>;

// Open file with RAII wrapper. Returns nullptr on failure.
file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode);

// Load entire file into memory as bytes.
// Throws std::runtime_error if file cannot be opened or read.
std::vector<unsigned char> util_load_file(std::filesystem::path const &path);

// Load entire file as text. Throws std::runtime_error on failure.
std::string util_load_text(std::filesystem::path const &path);

// Write content to path, truncating. Creates parent directories.
// Throws std::runtime_error on failure.
void util_write_file(std::filesystem::path const &path, std::string_view content);

// Strip leading and trailing spaces, tabs and line terminators.
std::string_view util_trim(std::string_view s);

// Add execute permission for user, group and other. Returns false on failure.
bool util_make_executable(std::filesystem::path const &path);

// Removes the path (recursively) on destruction unless released.
class scoped_path_cleanup : public unmovable {
 public:
  explicit scoped_path_cleanup(std::filesystem::path path);
  ~scoped_path_cleanup();

  void reset(std::filesystem::path path = {});
  std::filesystem::path release();
  std::filesystem::path const &path() const { return path_; }

 private:
  void cleanup();

  std::filesystem::path path_;
};

// Creates a uniquely named directory under the system temp directory and
// removes it with everything inside when the scope ends. release() hands the
// directory to the caller instead.
class scoped_temp_dir : public unmovable {
 public:
  explicit scoped_temp_dir(std::string_view tag);

  std::filesystem::path const &path() const { return cleanup_.path(); }
  std::filesystem::path release() { return cleanup_.release(); }

 private:
  scoped_path_cleanup cleanup_;
};

}  // namespace packup
