#include "libcurl_util.h"

#include "platform.h"
#include "tui.h"
#include "util.h"

#include <curl/curl.h>

#include <cstdio>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace packup {

namespace {

struct curl_easy_deleter {
  void operator()(CURL *handle) const noexcept { curl_easy_cleanup(handle); }
};
using curl_ptr_t = std::unique_ptr<CURL, curl_easy_deleter>;

size_t write_to_file(char *data, size_t size, size_t count, void *userdata) {
  return std::fwrite(data, size, count, static_cast<std::FILE *>(userdata)) * size;
}

}  // namespace

void libcurl_ensure_initialized() {
  static std::once_flag once;
  std::call_once(once, [] {
    if (auto const rc{ curl_global_init(CURL_GLOBAL_DEFAULT) }; rc != CURLE_OK) {
      throw std::runtime_error(std::string{ "curl_global_init: " } + curl_easy_strerror(rc));
    }
  });
}

// The body lands in <destination>.part and is renamed into place once the
// transfer and the final flush have both succeeded.
fs::path libcurl_download(std::string_view url, fs::path const &destination) {
  if (destination.empty()) { throw std::invalid_argument("libcurl_download: empty destination"); }
  libcurl_ensure_initialized();

  std::string const source{ url };
  auto const dest{ fs::absolute(destination).lexically_normal() };
  auto part{ dest };
  part += ".part";

  std::error_code ec;
  fs::create_directories(dest.parent_path(), ec);
  if (ec) {
    throw std::runtime_error("libcurl_download: " + dest.parent_path().string() + ": " +
                             ec.message());
  }

  scoped_path_cleanup part_cleanup{ part };
  auto file{ util_open_file(part, "wb") };
  if (!file) { throw std::runtime_error("libcurl_download: cannot write " + part.string()); }

  curl_ptr_t curl{ curl_easy_init() };
  if (!curl) { throw std::runtime_error("libcurl_download: curl_easy_init failed"); }

  char errbuf[CURL_ERROR_SIZE]{};
  curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
  curl_easy_setopt(curl.get(), CURLOPT_URL, source.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "packup/" PACKUP_VERSION_STR);
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_file);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, file.get());

  tui::debug("download: %s", source.c_str());
  if (auto const rc{ curl_easy_perform(curl.get()) }; rc != CURLE_OK) {
    long status{ 0 };
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    std::string detail{ errbuf[0] ? errbuf : curl_easy_strerror(rc) };
    if (status >= 400) { detail += " (HTTP " + std::to_string(status) + ")"; }
    throw std::runtime_error("libcurl_download: " + source + ": " + detail);
  }

  if (std::fflush(file.get()) != 0) {
    throw std::runtime_error("libcurl_download: failed to flush " + part.string());
  }
  file.reset();

  platform::atomic_rename(part, dest);
  part_cleanup.release();
  tui::debug("download: saved %s", dest.c_str());
  return dest;
}

}  // namespace packup
