#include "cmd_version.h"

#include "platform.h"
#include "tui.h"

#include "CLI/CLI.hpp"
#include "archive.h"
#include "curl/curl.h"
#include "mbedtls/version.h"
#include <nlohmann/json.hpp>

#include <array>
#include <string>
#include <vector>

#ifndef PACKUP_VERSION_STR
#error "PACKUP_VERSION_STR must be defined by the build system"
#endif

namespace packup {

std::vector<std::pair<std::string, std::string>> cmd_version_components() {
  std::vector<std::pair<std::string, std::string>> components;

  curl_version_info_data const *curl_info{ curl_version_info(CURLVERSION_NOW) };
  std::string curl_version{ curl_info->version };
  std::vector<std::string> curl_features;
  if (curl_info->features & CURL_VERSION_SSL) { curl_features.push_back("ssl"); }
  if (curl_info->features & CURL_VERSION_LIBZ) { curl_features.push_back("zlib"); }
  if (!curl_features.empty()) {
    curl_version.append(" (");
    for (size_t i{ 0 }; i < curl_features.size(); ++i) {
      if (i > 0) curl_version.append(", ");
      curl_version.append(curl_features[i]);
    }
    curl_version.push_back(')');
  }
  components.emplace_back("libcurl", std::move(curl_version));

  std::array<char, 32> mbedtls_version{};
  mbedtls_version_get_string_full(mbedtls_version.data());
  components.emplace_back("mbedTLS", mbedtls_version.data());

  components.emplace_back("libarchive", archive_version_details());
  components.emplace_back("nlohmann_json",
                          std::to_string(NLOHMANN_JSON_VERSION_MAJOR) + "." +
                              std::to_string(NLOHMANN_JSON_VERSION_MINOR) + "." +
                              std::to_string(NLOHMANN_JSON_VERSION_PATCH));
  components.emplace_back("CLI11", CLI11_VERSION);
  return components;
}

cmd_version::cmd_version(cmd_version::cfg cfg,
                         std::optional<std::filesystem::path> const & /*cli_cache_root*/)
    : cfg_{ std::move(cfg) } {}

void cmd_version::execute() {
  tui::info("packup version %s (%s)",
            PACKUP_VERSION_STR,
            platform::get_exe_path().string().c_str());
  tui::info("");
  tui::info("Third-party component versions:");
  for (auto const &[name, version] : cmd_version_components()) {
    tui::info("  %s: %s", name.c_str(), version.c_str());
  }
}

}  // namespace packup
