#include "sha256.h"

#include "mbedtls/sha256.h"
#include "util.h"

#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace packup {

struct sha256_builder::impl {
  mbedtls_sha256_context ctx;
  bool finished{ false };

  impl() { mbedtls_sha256_init(&ctx); }
  ~impl() { mbedtls_sha256_free(&ctx); }
};

sha256_builder::sha256_builder() : m{ std::make_unique<impl>() } {
  if (mbedtls_sha256_starts(&m->ctx, 0)) {
    throw std::runtime_error("sha256: mbedtls_sha256_starts failed");
  }
}

sha256_builder::~sha256_builder() = default;

sha256_builder &sha256_builder::update(std::string_view data) {
  if (m->finished) { throw std::logic_error("sha256: update after finish"); }
  if (!data.empty() &&
      mbedtls_sha256_update(&m->ctx,
                            reinterpret_cast<unsigned char const *>(data.data()),
                            data.size())) {
    throw std::runtime_error("sha256: mbedtls_sha256_update failed");
  }
  return *this;
}

sha256_builder &sha256_builder::update_file(std::filesystem::path const &file_path) {
  if (m->finished) { throw std::logic_error("sha256: update after finish"); }

  file_ptr_t file{ util_open_file(file_path, "rb") };
  if (!file) {
    throw std::runtime_error("sha256: failed to open file: " + file_path.string());
  }

  std::vector<unsigned char> buffer(1024 * 1024);
  while (true) {
    auto const read_bytes{
      std::fread(buffer.data(), sizeof(unsigned char), buffer.size(), file.get())
    };

    if (read_bytes > 0) {
      if (mbedtls_sha256_update(&m->ctx, buffer.data(), read_bytes)) {
        throw std::runtime_error("sha256: mbedtls_sha256_update failed");
      }
    }

    if (read_bytes < buffer.size()) {
      if (std::ferror(file.get())) { throw std::runtime_error("sha256: fread failed"); }
      break;
    }
  }

  return *this;
}

sha256_t sha256_builder::finish() {
  if (m->finished) { throw std::logic_error("sha256: finish called twice"); }
  m->finished = true;

  sha256_t digest{};
  if (mbedtls_sha256_finish(&m->ctx, digest.data())) {
    throw std::runtime_error("sha256: mbedtls_sha256_finish failed");
  }
  return digest;
}

sha256_t sha256(std::filesystem::path const &file_path) {
  if (!std::filesystem::exists(file_path)) {
    throw std::runtime_error("sha256: file does not exist: " + file_path.string());
  }
  return sha256_builder{}.update_file(file_path).finish();
}

std::string sha256_hex(sha256_t const &digest) {
  return util_bytes_to_hex(digest.data(), digest.size());
}

}  // namespace packup
