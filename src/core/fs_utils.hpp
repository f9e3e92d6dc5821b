#ifndef DISTRUN_CORE_FS_UTILS_HPP_
#define DISTRUN_CORE_FS_UTILS_HPP_

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fnmatch.h>

namespace distrun::core {

namespace detail {

inline std::filesystem::path BuildAtomicTempPath(const std::filesystem::path& output_path) {
  static std::atomic<std::uint64_t> counter{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::uint64_t suffix = counter.fetch_add(1U, std::memory_order_relaxed);
  return output_path.string() + ".tmp." + std::to_string(tick) + "." + std::to_string(suffix);
}

} // namespace detail

// Sibling path used to stage a file before it is published under its final
// name.
inline std::filesystem::path MakeTempSiblingPath(const std::filesystem::path& output_path) {
  return detail::BuildAtomicTempPath(output_path);
}

// Moves `from` onto `to`, replacing any existing `to`.
//
// On filesystems where rename-overwrite is restricted we retry after removing
// the destination.
inline bool RenameReplacing(const std::filesystem::path& from, const std::filesystem::path& to,
                            std::string& error) {
  std::error_code rename_ec;
  std::filesystem::rename(from, to, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code remove_ec;
  (void)std::filesystem::remove(to, remove_ec);
  rename_ec.clear();
  std::filesystem::rename(from, to, rename_ec);
  if (!rename_ec) {
    return true;
  }

  error = "failed to rename '" + from.string() + "' to '" + to.string() +
          "': " + rename_ec.message();
  return false;
}

// Recursively removes `path`. A path that does not exist is not an error;
// `removed` reports whether anything was deleted.
inline bool RemovePathIfExists(const std::filesystem::path& path, bool& removed,
                               std::string& error) {
  removed = false;
  std::error_code ec;
  const std::filesystem::file_status status = std::filesystem::symlink_status(path, ec);
  if (status.type() == std::filesystem::file_type::not_found) {
    return true;
  }
  if (ec) {
    error = "failed to stat '" + path.string() + "': " + ec.message();
    return false;
  }

  std::filesystem::remove_all(path, ec);
  if (ec) {
    error = "failed to remove '" + path.string() + "': " + ec.message();
    return false;
  }
  removed = true;
  return true;
}

// Rotation: if `path` exists it becomes `backup_path`, overwriting any older
// backup. Only one generation is kept.
inline bool RotateToBackup(const std::filesystem::path& path,
                           const std::filesystem::path& backup_path, bool& rotated,
                           std::string& error) {
  rotated = false;
  std::error_code ec;
  const std::filesystem::file_status status = std::filesystem::status(path, ec);
  if (status.type() == std::filesystem::file_type::not_found) {
    return true;
  }
  if (ec) {
    error = "failed to stat '" + path.string() + "': " + ec.message();
    return false;
  }
  if (!std::filesystem::is_regular_file(status)) {
    error = "cannot rotate '" + path.string() + "': not a regular file";
    return false;
  }

  if (!RenameReplacing(path, backup_path, error)) {
    return false;
  }
  rotated = true;
  return true;
}

// Copies `source` into `dest_dir` under its file name only.
inline bool CopyFileFlat(const std::filesystem::path& source,
                         const std::filesystem::path& dest_dir, std::string& error) {
  const std::filesystem::path target = dest_dir / source.filename();
  std::error_code ec;
  std::filesystem::copy_file(source, target, std::filesystem::copy_options::overwrite_existing,
                             ec);
  if (ec) {
    error = "failed to copy '" + source.string() + "' to '" + target.string() +
            "': " + ec.message();
    return false;
  }
  return true;
}

// Removes non-directory entries directly inside `dir` whose file name matches
// any of the shell-style `patterns`. Subdirectories are not descended into.
// Matching nothing is success.
inline bool RemoveMatchingFiles(const std::filesystem::path& dir,
                                const std::vector<std::string>& patterns,
                                std::vector<std::filesystem::path>& removed, std::string& error) {
  removed.clear();
  if (patterns.empty()) {
    return true;
  }

  std::error_code ec;
  std::vector<std::filesystem::path> matches;
  for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
    std::error_code type_ec;
    if (entry.is_directory(type_ec)) {
      continue;
    }
    const std::string name = entry.path().filename().string();
    for (const auto& pattern : patterns) {
      if (fnmatch(pattern.c_str(), name.c_str(), FNM_PERIOD) == 0) {
        matches.push_back(entry.path());
        break;
      }
    }
  }
  if (ec) {
    error = "failed to enumerate directory '" + dir.string() + "': " + ec.message();
    return false;
  }

  std::sort(matches.begin(), matches.end());
  for (const auto& path : matches) {
    std::filesystem::remove(path, ec);
    if (ec) {
      error = "failed to remove '" + path.string() + "': " + ec.message();
      return false;
    }
    removed.push_back(path);
  }
  return true;
}

// Owns a directory for the lifetime of the guard. Create() makes it fresh;
// the destructor removes it on every exit path once it has been created.
// Release() is the path that reports removal errors; the destructor is
// best-effort and cannot surface them.
class ScopedDirectory {
public:
  explicit ScopedDirectory(std::filesystem::path path) : path_(std::move(path)) {}

  ~ScopedDirectory() {
    if (!armed_) {
      return;
    }
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  bool Create(std::string& error) {
    std::error_code ec;
    if (!std::filesystem::create_directory(path_, ec)) {
      if (ec) {
        error = "failed to create directory '" + path_.string() + "': " + ec.message();
      } else {
        error = "directory already exists: " + path_.string();
      }
      return false;
    }
    armed_ = true;
    return true;
  }

  // Removes the directory now rather than at scope exit so the caller can
  // observe removal failures.
  bool Release(std::string& error) {
    if (!armed_) {
      return true;
    }
    armed_ = false;
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
      error = "failed to remove directory '" + path_.string() + "': " + ec.message();
      return false;
    }
    return true;
  }

  const std::filesystem::path& Path() const {
    return path_;
  }

  ScopedDirectory(const ScopedDirectory&) = delete;
  ScopedDirectory& operator=(const ScopedDirectory&) = delete;

private:
  std::filesystem::path path_;
  bool armed_ = false;
};

} // namespace distrun::core

#endif // DISTRUN_CORE_FS_UTILS_HPP_
