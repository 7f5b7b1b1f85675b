#pragma once

#include <filesystem>
#include <map>

namespace packup {

// Copies each source directory's contents into destination/<relative dir>,
// merging with what is already there. Files with the same relative path are
// overwritten in copy-map order. Symlinks are recreated, not followed.
// Throws staging_error on I/O failure.
void stage(std::map<std::filesystem::path, std::filesystem::path> const &copies,
           std::filesystem::path const &destination);

// Copies the executable into destination and marks it executable. Returns the
// staged path.
std::filesystem::path stage_executable(std::filesystem::path const &executable,
                                       std::filesystem::path const &destination);

}  // namespace packup
