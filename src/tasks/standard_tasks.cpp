#include "tasks/standard_tasks.hpp"

#include "core/fs_utils.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace distrun::tasks {

namespace {

bool FailWith(TaskErrorCode code, std::string message, TaskError& error) {
  error.code = code;
  error.message = std::move(message);
  return false;
}

void LogDebug(const TaskContext& context, std::string_view message, std::string_view path) {
  if (context.logger != nullptr) {
    context.logger->Debug(message, {{"path", path}});
  }
}

bool RemovePatternMatches(const TaskContext& context, const std::vector<std::string>& patterns,
                          std::size_t& removed_count, TaskError& error) {
  std::vector<fs::path> removed;
  std::string fs_error;
  if (!core::RemoveMatchingFiles(context.work_dir, patterns, removed, fs_error)) {
    return FailWith(TaskErrorCode::kFilesystem, fs_error, error);
  }
  for (const auto& path : removed) {
    LogDebug(context, "removed file", path.string());
  }
  removed_count = removed.size();
  return true;
}

bool CheckArtifact(const TaskContext& context, const std::string& entry, TaskError& error) {
  std::error_code ec;
  if (!fs::is_regular_file(context.work_dir / entry, ec)) {
    return FailWith(TaskErrorCode::kMissingArtifact, "missing artifact: " + entry, error);
  }
  return true;
}

// Steps 3-5 of dist. The staging guard is owned by the caller so removal
// happens on every path out of here.
bool StageAndArchive(TaskContext& context, core::ScopedDirectory& staging,
                     const fs::path& archive_path, TaskError& error) {
  std::string fs_error;
  if (!staging.Create(fs_error)) {
    return FailWith(TaskErrorCode::kFilesystem, fs_error, error);
  }
  LogDebug(context, "created staging directory", staging.Path().string());

  for (const auto& entry : context.project.Manifest()) {
    if (!CheckArtifact(context, entry, error)) {
      return false;
    }
    if (!core::CopyFileFlat(context.work_dir / entry, staging.Path(), fs_error)) {
      return FailWith(TaskErrorCode::kFilesystem, fs_error, error);
    }
    LogDebug(context, "staged artifact", entry);
  }

  std::string archive_error;
  if (!context.archiver->CreateArchive(staging.Path(), archive_path, archive_error)) {
    return FailWith(TaskErrorCode::kPackaging, archive_error, error);
  }
  return true;
}

} // namespace

bool CleanAction(TaskContext& context, TaskError& error) {
  std::size_t removed_count = 0;
  if (!RemovePatternMatches(context, context.project.clean_patterns, removed_count, error)) {
    return false;
  }
  if (context.logger != nullptr) {
    context.logger->Info("removed transient files",
                         {{"count", std::to_string(removed_count)}});
  }
  return true;
}

bool InstallAction(TaskContext& context, TaskError& error) {
  if (context.installer == nullptr) {
    return FailWith(TaskErrorCode::kInstall, "no installer configured", error);
  }

  std::string install_error;
  if (!context.installer->Install(context.work_dir, install_error)) {
    return FailWith(TaskErrorCode::kInstall, install_error, error);
  }
  return true;
}

bool DistcleanAction(TaskContext& context, TaskError& error) {
  for (const auto& dir : context.project.build_dirs) {
    const fs::path path = context.work_dir / dir;
    bool removed = false;
    std::string fs_error;
    if (!core::RemovePathIfExists(path, removed, fs_error)) {
      return FailWith(TaskErrorCode::kFilesystem, fs_error, error);
    }
    if (removed) {
      LogDebug(context, "removed build output", path.string());
    }
  }

  std::size_t removed_count = 0;
  if (!RemovePatternMatches(context, context.project.cache_patterns, removed_count, error)) {
    return false;
  }
  if (context.logger != nullptr) {
    context.logger->Info("removed cache files", {{"count", std::to_string(removed_count)}});
  }
  return true;
}

bool DistAction(TaskContext& context, TaskError& error) {
  if (context.archiver == nullptr) {
    return FailWith(TaskErrorCode::kPackaging, "no archiver configured", error);
  }

  const fs::path staging_path = context.work_dir / context.project.StagingDirName();
  const fs::path archive_path = context.work_dir / context.project.ArchiveFileName();
  const fs::path backup_path = context.work_dir / context.project.BackupArchiveFileName();

  // A staging directory from an interrupted run goes first, whatever the
  // outcome of this run.
  std::string fs_error;
  bool removed = false;
  if (!core::RemovePathIfExists(staging_path, removed, fs_error)) {
    return FailWith(TaskErrorCode::kFilesystem, fs_error, error);
  }
  if (removed && context.logger != nullptr) {
    context.logger->Warn("removed leftover staging directory",
                         {{"path", staging_path.string()}});
  }

  // Checked before rotation so a bad manifest never costs the previous
  // archive its slot.
  for (const auto& entry : context.project.Manifest()) {
    if (!CheckArtifact(context, entry, error)) {
      return false;
    }
  }

  bool rotated = false;
  if (!core::RotateToBackup(archive_path, backup_path, rotated, fs_error)) {
    return FailWith(TaskErrorCode::kFilesystem, fs_error, error);
  }
  if (rotated && context.logger != nullptr) {
    context.logger->Info("rotated previous archive", {{"backup", backup_path.string()}});
  }

  core::ScopedDirectory staging(staging_path);
  const bool archived = StageAndArchive(context, staging, archive_path, error);

  std::string release_error;
  if (!staging.Release(release_error)) {
    if (archived) {
      return FailWith(TaskErrorCode::kFilesystem, release_error, error);
    }
    if (context.logger != nullptr) {
      context.logger->Warn("staging cleanup failed after error", {{"error", release_error}});
    }
    return false;
  }
  if (!archived) {
    return false;
  }

  if (context.logger != nullptr) {
    context.logger->Info("wrote distribution archive", {{"path", archive_path.string()}});
  }
  return true;
}

bool BuildStandardTaskRegistry(TaskRegistry& registry, std::string& error) {
  std::vector<TaskDescriptor> descriptors;
  descriptors.push_back({std::string(kTaskClean), {}, CleanAction});
  descriptors.push_back({std::string(kTaskInstall), {std::string(kTaskClean)}, InstallAction});
  descriptors.push_back({std::string(kTaskDistclean), {std::string(kTaskClean)}, DistcleanAction});
  descriptors.push_back({std::string(kTaskDist), {std::string(kTaskDistclean)}, DistAction});
  return TaskRegistry::Create(std::move(descriptors), registry, error);
}

} // namespace distrun::tasks
