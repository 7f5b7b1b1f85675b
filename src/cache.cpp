#include "cache.h"

#include "tui.h"

#include <stdexcept>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace packup {

namespace {

constexpr char kCompleteMarker[]{ "packup-complete" };

fs::path resolve_root(std::optional<fs::path> root) {
  if (root) { return *root; }
  if (auto env_root{ platform::get_default_cache_root() }) { return *env_root; }
  throw std::runtime_error(std::string{ "cache: no cache root, set one of " } +
                           platform::get_default_cache_root_env_vars());
}

// Identifiers become single path components.
void check_component(char const *what, std::string_view value) {
  if (value.empty() || value == "." || value == ".." ||
      value.find('/') != std::string_view::npos) {
    throw std::invalid_argument("cache: invalid " + std::string{ what } + " '" +
                                std::string{ value } + "'");
  }
}

void create_dirs(fs::path const &dir) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    throw std::runtime_error("cache: failed to create " + dir.string() + ": " + ec.message());
  }
}

// Used from destructors, so failures are logged rather than thrown.
void remove_quietly(fs::path const &target) {
  std::error_code ec;
  fs::remove_all(target, ec);
  if (ec) { tui::warn("cache: failed to remove %s: %s", target.c_str(), ec.message().c_str()); }
}

}  // namespace

cache::entry_lock::entry_lock(fs::path entry_dir, platform::file_lock lock, std::string label)
    : entry_dir_{ std::move(entry_dir) }, lock_{ std::move(lock) }, label_{ std::move(label) } {
  // An interrupted fill may have left files behind.
  remove_quietly(install_dir());
  remove_quietly(work_dir());
  create_dirs(install_dir());
  create_dirs(work_dir());
}

cache::entry_lock::~entry_lock() {
  if (complete_) {
    try {
      publish();
      tui::debug("cache: published %s", label_.c_str());
    } catch (std::exception const &e) {
      tui::error("cache: failed to publish %s: %s", label_.c_str(), e.what());
    }
  } else {
    tui::debug("cache: abandoned %s", label_.c_str());
  }
  remove_quietly(install_dir());
  remove_quietly(work_dir());
}

void cache::entry_lock::publish() {
  auto const payload{ entry_dir_ / "payload" };
  std::error_code ec;
  fs::remove_all(payload, ec);
  if (ec) { throw std::runtime_error("remove " + payload.string() + ": " + ec.message()); }

  platform::atomic_rename(install_dir(), payload);
  platform::touch_file(entry_dir_ / kCompleteMarker);
}

cache::cache(std::optional<fs::path> root) : root_{ resolve_root(std::move(root)) } {}

bool cache::is_entry_complete(fs::path const &entry_dir) {
  std::error_code ec;
  return fs::is_regular_file(entry_dir / kCompleteMarker, ec);
}

cache::ensure_result cache::ensure_manifest(std::string_view key) {
  check_component("manifest key", key);
  std::string const k{ key };
  return ensure(root_ / "manifests" / k, "manifest." + k);
}

cache::ensure_result cache::ensure_tool(std::string_view tool, std::string_view version) {
  check_component("tool name", tool);
  check_component("tool version", version);
  std::string const t{ tool };
  std::string const v{ version };
  return ensure(root_ / "tools" / t / v, "tool." + t + "." + v);
}

cache::ensure_result cache::ensure(fs::path const &entry_dir, std::string const &label) {
  ensure_result result{ .entry_path = entry_dir,
                        .payload_path = entry_dir / "payload",
                        .lock = nullptr };
  if (is_entry_complete(entry_dir)) {
    tui::debug("cache: hit %s", label.c_str());
    return result;
  }

  auto const locks_dir{ root_ / "locks" };
  create_dirs(locks_dir);
  create_dirs(entry_dir);
  platform::file_lock lock{ locks_dir / (label + ".lock") };

  // Another filler may have finished while this one waited.
  if (is_entry_complete(entry_dir)) {
    tui::debug("cache: hit %s after waiting", label.c_str());
    return result;
  }

  tui::debug("cache: miss %s", label.c_str());
  result.lock = std::make_unique<entry_lock>(entry_dir, std::move(lock), label);
  return result;
}

}  // namespace packup
