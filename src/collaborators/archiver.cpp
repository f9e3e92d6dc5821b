#include "collaborators/archiver.hpp"

#include "collaborators/zip_writer.hpp"
#include "core/process/command_runner.hpp"

#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace distrun::collaborators {

CommandArchiver::CommandArchiver(std::vector<std::string> command)
    : command_(std::move(command)) {}

bool CommandArchiver::CreateArchive(const fs::path& source_dir, const fs::path& archive_path,
                                    std::string& error) {
  std::error_code ec;
  if (!fs::is_directory(source_dir, ec)) {
    error = "archive source is not a directory: " + source_dir.string();
    return false;
  }

  const fs::path absolute_archive = fs::absolute(archive_path, ec);
  if (ec) {
    error = "failed to resolve archive path '" + archive_path.string() + "': " + ec.message();
    return false;
  }

  std::vector<std::string> argv = command_;
  argv.push_back(absolute_archive.string());
  argv.push_back(source_dir.filename().string());

  int exit_code = -1;
  if (!core::process::RunCommand(argv, source_dir.parent_path(), exit_code, error)) {
    return false;
  }
  if (exit_code != 0) {
    error = "archive command exited with status " + std::to_string(exit_code) + ": " +
            core::process::BuildCommandLine(argv, {});
    return false;
  }
  if (!fs::is_regular_file(absolute_archive, ec)) {
    error = "archive command reported success but produced no file: " +
            absolute_archive.string();
    return false;
  }
  return true;
}

bool BuiltinZipArchiver::CreateArchive(const fs::path& source_dir, const fs::path& archive_path,
                                       std::string& error) {
  return WriteZipArchive(source_dir, archive_path, error);
}

std::unique_ptr<Archiver> MakeArchiver(const project::ProjectDescriptor& descriptor) {
  switch (descriptor.archiver) {
  case project::ArchiverKind::kZipCommand:
    return std::make_unique<CommandArchiver>(descriptor.archive_command);
  case project::ArchiverKind::kBuiltin:
    return std::make_unique<BuiltinZipArchiver>();
  }
  return std::make_unique<CommandArchiver>(descriptor.archive_command);
}

} // namespace distrun::collaborators
