#pragma once

#include "generator.h"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace packup {

// <out>/<name>.flatpak, built with flatpak-builder and optionally installed for
// the current user.
class gen_flatpak : public generator {
 public:
  std::string_view name() const override { return "flatpak"; }
  std::filesystem::path run(deploy_context const &ctx) override;
};

// Manifest for a staged tree. File sources are given relative to the manifest,
// which is expected beside files_dir.
nlohmann::json flatpak_manifest(deploy_config const &cfg,
                                std::filesystem::path const &files_dir);

// remote-add reports an existing remote on stderr; that is not an error here.
bool flatpak_remote_add_succeeded(int exit_code, std::string_view stderr_text);

}  // namespace packup
