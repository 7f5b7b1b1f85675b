#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace packup {

// Parsed INI text: section -> key -> value. Keys and section names keep their
// case; later duplicates overwrite earlier ones.
struct ini_document {
  std::map<std::string, std::map<std::string, std::string>> sections;

  std::optional<std::string> get(std::string_view section, std::string_view key) const;
};

// Throws config_error on a line that is neither blank, a comment, a [section]
// header nor a key = value pair.
ini_document ini_parse(std::string_view text, std::string_view source_name = "<memory>");

struct appimage_options {
  std::optional<std::filesystem::path> icon;
  std::string categories{ "Utility;" };
};

struct flatpak_options {
  std::string app_id;  // defaults to org.packup.<name>
  std::string runtime{ "org.freedesktop.Platform" };
  std::string runtime_version{ "23.08" };
  std::string sdk{ "org.freedesktop.Sdk" };
  bool install{ true };
};

struct deploy_config {
  std::string name;
  std::filesystem::path executable;  // relative to the working directory
  appimage_options appimage;
  flatpak_options flatpak;
};

deploy_config config_parse(std::string_view text, std::string_view source_name = "<memory>");
deploy_config config_load(std::filesystem::path const &path);

}  // namespace packup
