#pragma once

#include "platform.h"
#include "util.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace packup {

// On-disk store for resolved manifests and downloaded tools.
//
//   <root>/manifests/<key>/
//   <root>/tools/<tool>/<version>/
//   <root>/locks/{manifest.<key>,tool.<tool>.<version>}.lock
//
// An entry is usable once its packup-complete marker exists; payload/ then
// holds the published files. Fills happen under the entry's lock file.
class cache : unmovable {
 public:
  // Exclusive right to fill one entry. install/ and work/ start empty. On
  // destruction install/ becomes payload/ if mark_complete() was called;
  // otherwise both are discarded and the entry stays incomplete.
  class entry_lock : unmovable {
   public:
    entry_lock(std::filesystem::path entry_dir, platform::file_lock lock, std::string label);
    ~entry_lock();

    void mark_complete() { complete_ = true; }
    bool is_complete() const { return complete_; }

    std::filesystem::path install_dir() const { return entry_dir_ / "install"; }
    std::filesystem::path work_dir() const { return entry_dir_ / "work"; }

   private:
    void publish();

    std::filesystem::path entry_dir_;
    platform::file_lock lock_;
    std::string label_;
    bool complete_{ false };
  };

  struct ensure_result {
    std::filesystem::path entry_path;
    std::filesystem::path payload_path;  // entry_path / "payload"
    std::unique_ptr<entry_lock> lock;    // set when the caller must fill the entry
  };

  // Throws std::runtime_error when no root is given and none can be derived
  // from the environment.
  explicit cache(std::optional<std::filesystem::path> root = std::nullopt);

  std::filesystem::path const &root() const { return root_; }

  ensure_result ensure_manifest(std::string_view key);
  ensure_result ensure_tool(std::string_view tool, std::string_view version);

  static bool is_entry_complete(std::filesystem::path const &entry_dir);

 private:
  ensure_result ensure(std::filesystem::path const &entry_dir, std::string const &label);

  std::filesystem::path root_;
};

}  // namespace packup
