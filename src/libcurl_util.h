#pragma once

#include <filesystem>
#include <string_view>

namespace packup {

void libcurl_ensure_initialized();

// Downloads url to destination, replacing any existing file. Returns the absolute
// destination path. A failed transfer leaves no partial file behind.
std::filesystem::path libcurl_download(std::string_view url,
                                       std::filesystem::path const &destination);

}  // namespace packup
