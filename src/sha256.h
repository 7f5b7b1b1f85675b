#pragma once

#include <array>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace packup {

using sha256_t = std::array<unsigned char, 32>;

sha256_t sha256(std::filesystem::path const &file_path);

// Incremental hasher over several inputs, used to build cache keys.
class sha256_builder {
 public:
  sha256_builder();
  ~sha256_builder();
  sha256_builder(sha256_builder const &) = delete;
  sha256_builder &operator=(sha256_builder const &) = delete;

  sha256_builder &update(std::string_view data);
  sha256_builder &update_file(std::filesystem::path const &file_path);
  sha256_t finish();

 private:
  struct impl;
  std::unique_ptr<impl> m;
};

std::string sha256_hex(sha256_t const &digest);

}  // namespace packup
