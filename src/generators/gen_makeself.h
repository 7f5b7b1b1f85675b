#pragma once

#include "generator.h"

#include <string>
#include <vector>

namespace packup {

// <out>/<name>.run, a self-extracting installer built by makeself.sh.
class gen_makeself : public generator {
 public:
  std::string_view name() const override { return "makeself"; }
  std::filesystem::path run(deploy_context const &ctx) override;
};

std::vector<std::string> makeself_command(std::filesystem::path const &makeself_sh,
                                          std::filesystem::path const &stage_dir,
                                          std::filesystem::path const &artifact,
                                          std::string const &app_name);

}  // namespace packup
