#pragma once

#include "generator.h"

namespace packup {

// <out>/<name>/ holding the staged tree and its launcher. Re-running merges
// into the existing directory.
class gen_dir : public generator {
 public:
  std::string_view name() const override { return "dir"; }
  std::filesystem::path run(deploy_context const &ctx) override;
};

}  // namespace packup
