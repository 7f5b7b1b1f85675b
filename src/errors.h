#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace packup {

// Missing, unreadable or malformed configuration file.
struct config_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Dependency resolver failed or produced an unusable manifest.
struct resolution_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Filesystem failure while building a staging tree.
struct staging_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// An external packaging tool exited non-zero.
class external_tool_error : public std::runtime_error {
 public:
  external_tool_error(std::string tool, int exit_code, std::string const &detail = {})
      : std::runtime_error{ tool + " failed with exit code " + std::to_string(exit_code) +
                            (detail.empty() ? std::string{} : ": " + detail) },
        tool_{ std::move(tool) },
        exit_code_{ exit_code } {}

  std::string const &tool() const { return tool_; }
  int exit_code() const { return exit_code_; }

 private:
  std::string tool_;
  int exit_code_;
};

}  // namespace packup
