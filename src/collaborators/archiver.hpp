#pragma once

#include "project/descriptor.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace distrun::collaborators {

// Packs a directory into an archive file.
//
// Contract:
// - On success `archive_path` holds an archive of every file under
//   `source_dir`, stored below the single top-level folder named after
//   `source_dir`.
// - On failure returns false and sets `error`.
class Archiver {
public:
  virtual ~Archiver() = default;

  virtual bool CreateArchive(const std::filesystem::path& source_dir,
                             const std::filesystem::path& archive_path, std::string& error) = 0;
};

// Delegates to an external archiving tool. The tool runs in the parent of
// `source_dir` as `<command...> <archive_path> <source_dir name>`, which
// matches `zip -9r out.zip dir`.
class CommandArchiver final : public Archiver {
public:
  explicit CommandArchiver(std::vector<std::string> command);

  bool CreateArchive(const std::filesystem::path& source_dir,
                     const std::filesystem::path& archive_path, std::string& error) override;

private:
  std::vector<std::string> command_;
};

// In-process zip writer for hosts without a `zip` binary.
class BuiltinZipArchiver final : public Archiver {
public:
  bool CreateArchive(const std::filesystem::path& source_dir,
                     const std::filesystem::path& archive_path, std::string& error) override;
};

std::unique_ptr<Archiver> MakeArchiver(const project::ProjectDescriptor& descriptor);

} // namespace distrun::collaborators
