#pragma once

#include "manifest.h"

#include <filesystem>
#include <map>
#include <set>
#include <vector>

namespace packup {

// Where dependency files land inside a staging tree. Every collection is
// sorted, so anything derived from a layout is reproducible.
struct layout {
  std::set<std::filesystem::path> lib_dirs;  // relative to the staging root
  std::set<std::filesystem::path> bin_dirs;
  std::map<std::filesystem::path, std::filesystem::path> copies;  // abs source -> rel dest
};

// Missing and empty directories are skipped. A directory outside its dependency
// root keeps its ".." relative path.
layout layout_derive(std::vector<dependency> const &deps);

}  // namespace packup
