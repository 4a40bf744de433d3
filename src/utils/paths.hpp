#ifndef PATHS_HPP
#define PATHS_HPP

#include <algorithm>
#include <filesystem>
#include <iterator>

// Lexical check that `path` is `base` or lies below it. Both paths should
// already be normalized the same way.
inline bool path_is_within(const std::filesystem::path &path,
                           const std::filesystem::path &base) {
  auto path_end = path.end();
  auto base_end = base.end();
  // A trailing separator shows up as an empty last element.
  if (base_end != base.begin() && std::prev(base_end)->empty()) {
    --base_end;
  }
  auto mismatch = std::mismatch(base.begin(), base_end, path.begin(), path_end);
  return mismatch.first == base_end;
}

#endif
