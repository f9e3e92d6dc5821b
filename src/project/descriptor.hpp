#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace distrun::project {

inline constexpr std::string_view kDescriptorFileName = "distrun.json";

enum class ArchiverKind {
  kZipCommand,
  kBuiltin,
};

// Everything the standard tasks need to know about the project they manage.
// Defaults reproduce the KMeans module's original build script.
struct ProjectDescriptor {
  std::string name = "kmeans";
  // Manifest, in staging order: implementation files first, then the
  // metadata/build files shipped alongside them.
  std::vector<std::string> sources = {"KMeans.py"};
  std::vector<std::string> other_files = {"Makefile", "setup.py"};

  std::vector<std::string> clean_patterns = {"*~"};
  std::vector<std::string> build_dirs = {"build"};
  std::vector<std::string> cache_patterns = {"*.pyc"};

  std::vector<std::string> install_command = {"python", "setup.py", "install"};

  ArchiverKind archiver = ArchiverKind::kZipCommand;
  std::vector<std::string> archive_command = {"zip", "-9r"};

  std::vector<std::string> Manifest() const;

  std::string StagingDirName() const {
    return name;
  }
  std::string ArchiveFileName() const {
    return name + ".zip";
  }
  std::string BackupArchiveFileName() const {
    return name + "-old.zip";
  }
};

const char* ToString(ArchiverKind kind);

// Parses descriptor JSON on top of the defaults.
//
// Contract:
// - Keys that are absent keep their default value.
// - Unknown keys, wrong value types and unsafe names are rejected; `error`
//   names the offending key.
bool ParseProjectDescriptor(std::string_view json_text, ProjectDescriptor& descriptor,
                            std::string& error);

// Loads and parses a descriptor file.
bool LoadProjectDescriptor(const std::filesystem::path& path, ProjectDescriptor& descriptor,
                           std::string& error);

// Resolves the descriptor for a working directory:
// - an explicit `descriptor_path` must exist and parse;
// - otherwise `<work_dir>/distrun.json` is used when present;
// - otherwise the built-in defaults apply.
// `source` reports which of these was used ("defaults" or the file path).
bool ResolveProjectDescriptor(const std::filesystem::path& work_dir,
                              const std::filesystem::path& descriptor_path,
                              ProjectDescriptor& descriptor, std::string& source,
                              std::string& error);

} // namespace distrun::project
