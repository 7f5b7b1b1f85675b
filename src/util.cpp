#include "util.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace packup {

std::string util_bytes_to_hex(void const *data, size_t length) {
  static constexpr char hex_chars[] = "0123456789abcdef";

  auto const bytes = static_cast<unsigned char const *>(data);
  std::string result;
  result.reserve(length * 2);

  for (size_t i{}; i < length; ++i) {
    result += hex_chars[(bytes[i] >> 4) & 0xf];
    result += hex_chars[bytes[i] & 0xf];
  }

  return result;
}

void file_deleter::operator()(std::FILE *file) const noexcept {
  if (file) { static_cast<void>(std::fclose(file)); }
}

file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode) {
  return file_ptr_t{ std::fopen(path.c_str(), mode) };
}

std::vector<unsigned char> util_load_file(std::filesystem::path const &path) {
  auto file{ util_open_file(path, "rb") };
  if (!file) {
    throw std::runtime_error("util_load_file: failed to open file: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_END) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to end: " + path.string());
  }

  long const file_size{ std::ftell(file.get()) };
  if (file_size < 0) {
    throw std::runtime_error("util_load_file: failed to get file size: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_SET) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to start: " + path.string());
  }

  std::vector<unsigned char> buffer(static_cast<size_t>(file_size));
  if (file_size > 0) {
    size_t const bytes_read{ std::fread(buffer.data(), 1, buffer.size(), file.get()) };
    if (bytes_read != buffer.size()) {
      throw std::runtime_error("util_load_file: failed to read entire file: " +
                               path.string());
    }
  }

  return buffer;
}

std::string util_load_text(std::filesystem::path const &path) {
  auto const bytes{ util_load_file(path) };
  return std::string{ reinterpret_cast<char const *>(bytes.data()), bytes.size() };
}

void util_write_file(std::filesystem::path const &path, std::string_view content) {
  if (auto const parent{ path.parent_path() }; !parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw std::runtime_error("util_write_file: failed to create directory " +
                               parent.string() + ": " + ec.message());
    }
  }

  auto file{ util_open_file(path, "wb") };
  if (!file) {
    throw std::runtime_error("util_write_file: failed to open file: " + path.string() +
                             ": " + std::strerror(errno));
  }

  if (!content.empty() &&
      std::fwrite(content.data(), 1, content.size(), file.get()) != content.size()) {
    throw std::runtime_error("util_write_file: failed to write file: " + path.string());
  }

  if (std::fflush(file.get()) != 0) {
    throw std::runtime_error("util_write_file: failed to flush file: " + path.string());
  }
}

std::string_view util_trim(std::string_view s) {
  auto const start{ s.find_first_not_of(" \t\r\n") };
  if (start == std::string_view::npos) { return {}; }
  return s.substr(start, s.find_last_not_of(" \t\r\n") - start + 1);
}

bool util_make_executable(std::filesystem::path const &path) {
  std::error_code ec;
  std::filesystem::permissions(path,
                               std::filesystem::perms::owner_exec |
                                   std::filesystem::perms::group_exec |
                                   std::filesystem::perms::others_exec,
                               std::filesystem::perm_options::add,
                               ec);
  return !ec;
}

scoped_path_cleanup::scoped_path_cleanup(std::filesystem::path path)
    : path_{ std::move(path) } {}

scoped_path_cleanup::~scoped_path_cleanup() { cleanup(); }

void scoped_path_cleanup::reset(std::filesystem::path path) {
  cleanup();
  path_ = std::move(path);
}

std::filesystem::path scoped_path_cleanup::release() { return std::exchange(path_, {}); }

void scoped_path_cleanup::cleanup() {
  if (path_.empty()) { return; }
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  path_.clear();
}

namespace {

std::filesystem::path make_unique_temp_dir(std::string_view tag) {
  auto const tmp_dir{ std::filesystem::temp_directory_path() };
  std::string pattern{ (tmp_dir / ("packup-" + std::string{ tag } + "-XXXXXX")).string() };

  std::vector<char> path_buffer{ pattern.begin(), pattern.end() };
  path_buffer.push_back('\0');

  if (::mkdtemp(path_buffer.data()) == nullptr) {
    throw std::system_error(errno, std::generic_category(), "mkdtemp failed");
  }

  return std::filesystem::path{ path_buffer.data() };
}

}  // namespace

scoped_temp_dir::scoped_temp_dir(std::string_view tag)
    : cleanup_{ make_unique_temp_dir(tag) } {}

}  // namespace packup
