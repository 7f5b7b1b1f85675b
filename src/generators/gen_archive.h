#pragma once

#include "archiver.h"
#include "generator.h"

namespace packup {

// <out>/<name><ext>, with every entry under a top-level <name>/ directory.
class gen_archive : public generator {
 public:
  explicit gen_archive(archive_format fmt) : format_{ fmt } {}

  std::string_view name() const override { return archive_format_name(format_); }
  std::filesystem::path run(deploy_context const &ctx) override;

 private:
  archive_format format_;
};

}  // namespace packup
