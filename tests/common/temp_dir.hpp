#ifndef DISTRUN_TESTS_COMMON_TEMP_DIR_HPP_
#define DISTRUN_TESTS_COMMON_TEMP_DIR_HPP_

#include "assertions.hpp"

#include <chrono>
#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <system_error>

namespace distrun::tests::common {

inline std::filesystem::path CreateUniqueTempDir(std::string_view prefix) {
  static int sequence = 0;
  const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
  const std::filesystem::path root =
      std::filesystem::temp_directory_path() /
      (std::string(prefix) + "-" + std::to_string(now_ms) + "-" + std::to_string(sequence++));

  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root, ec);
  if (ec) {
    Fail("failed to create temp root: " + root.string());
  }
  return root;
}

inline void RemovePathBestEffort(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove_all(path, ec);
}

// Relative paths of everything under `root`, for before/after comparisons.
inline std::set<std::string> SnapshotTree(const std::filesystem::path& root) {
  std::set<std::string> entries;
  for (const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
    entries.insert(entry.path().lexically_relative(root).generic_string());
  }
  return entries;
}

} // namespace distrun::tests::common

#endif // DISTRUN_TESTS_COMMON_TEMP_DIR_HPP_
