#include "project/descriptor.hpp"

#include "core/json_dom.hpp"

#include <fstream>
#include <iterator>
#include <set>
#include <system_error>

namespace fs = std::filesystem;

namespace distrun::project {

namespace {

using JsonValue = core::json::Value;

constexpr std::string_view kKeyProject = "project";
constexpr std::string_view kKeySources = "sources";
constexpr std::string_view kKeyOther = "other";
constexpr std::string_view kKeyCleanPatterns = "clean_patterns";
constexpr std::string_view kKeyBuildDirs = "build_dirs";
constexpr std::string_view kKeyCachePatterns = "cache_patterns";
constexpr std::string_view kKeyInstallCommand = "install_command";
constexpr std::string_view kKeyArchiver = "archiver";
constexpr std::string_view kKeyArchiveCommand = "archive_command";

bool IsKnownKey(std::string_view key) {
  return key == kKeyProject || key == kKeySources || key == kKeyOther ||
         key == kKeyCleanPatterns || key == kKeyBuildDirs || key == kKeyCachePatterns ||
         key == kKeyInstallCommand || key == kKeyArchiver || key == kKeyArchiveCommand;
}

bool ReadString(const JsonValue& root, std::string_view key, std::string& out,
                std::string& error) {
  const JsonValue* value = core::json::FindMember(root, key);
  if (value == nullptr) {
    return true;
  }
  if (value->type != JsonValue::Type::kString) {
    error = std::string(key) + ": expected string, got " + core::json::TypeName(value->type);
    return false;
  }
  out = value->string_value;
  return true;
}

bool ReadStringArray(const JsonValue& root, std::string_view key, std::vector<std::string>& out,
                     std::string& error) {
  const JsonValue* value = core::json::FindMember(root, key);
  if (value == nullptr) {
    return true;
  }
  if (value->type != JsonValue::Type::kArray) {
    error = std::string(key) + ": expected array of strings, got " +
            core::json::TypeName(value->type);
    return false;
  }

  std::vector<std::string> parsed;
  parsed.reserve(value->array_value.size());
  for (std::size_t i = 0; i < value->array_value.size(); ++i) {
    const JsonValue& item = value->array_value[i];
    if (item.type != JsonValue::Type::kString) {
      error = std::string(key) + "[" + std::to_string(i) + "]: expected string, got " +
              core::json::TypeName(item.type);
      return false;
    }
    if (item.string_value.empty()) {
      error = std::string(key) + "[" + std::to_string(i) + "]: must not be empty";
      return false;
    }
    parsed.push_back(item.string_value);
  }
  out = std::move(parsed);
  return true;
}

// Project names become a directory and two file names at the working
// directory root.
bool IsSafeProjectName(std::string_view name) {
  if (name.empty() || name == "." || name == ".." || name.front() == '-') {
    return false;
  }
  for (const char c : name) {
    const bool allowed = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                         (c >= '0' && c <= '9') || c == '_' || c == '-' || c == '.';
    if (!allowed) {
      return false;
    }
  }
  return true;
}

// Accepts paths that normalize to something strictly below the working
// directory. "", ".", "a/.." and anything escaping via ".." are rejected.
bool IsContainedRelativePath(std::string_view raw) {
  const fs::path path(raw);
  if (path.empty() || path.is_absolute() || path.has_root_path()) {
    return false;
  }
  const fs::path normal = path.lexically_normal();
  if (normal.empty() || normal == ".") {
    return false;
  }
  return *normal.begin() != "..";
}

// dist owns `<project>/`, `<project>.zip` and `<project>-old.zip` at the top
// of the working directory and deletes or replaces them. Returns the reserved
// name `raw` falls under, or an empty string.
std::string ReservedOutputFor(const ProjectDescriptor& descriptor, std::string_view raw) {
  const fs::path normal = fs::path(raw).lexically_normal();
  if (normal.empty()) {
    return {};
  }
  const std::string first = normal.begin()->string();
  for (const std::string& reserved :
       {descriptor.StagingDirName(), descriptor.ArchiveFileName(),
        descriptor.BackupArchiveFileName()}) {
    if (first == reserved) {
      return reserved;
    }
  }
  return {};
}

bool ValidateDescriptor(const ProjectDescriptor& descriptor, std::string& error) {
  if (!IsSafeProjectName(descriptor.name)) {
    error = std::string(kKeyProject) + ": '" + descriptor.name +
            "' is not a valid project name (allowed: letters, digits, '_', '-', '.')";
    return false;
  }

  const std::vector<std::string> manifest = descriptor.Manifest();
  if (manifest.empty()) {
    error = "manifest is empty: at least one of sources/other must list a file";
    return false;
  }

  // Staging flattens paths, so two entries sharing a file name would
  // silently overwrite each other.
  std::set<std::string> staged_names;
  for (const auto& entry : manifest) {
    if (!IsContainedRelativePath(entry)) {
      error = "manifest entry '" + entry + "' must be a relative path inside the project";
      return false;
    }
    const std::string reserved = ReservedOutputFor(descriptor, entry);
    if (!reserved.empty()) {
      error = "manifest entry '" + entry + "' lies under '" + reserved +
              "', which dist reserves for its own output";
      return false;
    }
    const std::string file_name = fs::path(entry).filename().string();
    if (file_name.empty()) {
      error = "manifest entry '" + entry + "' does not name a file";
      return false;
    }
    if (!staged_names.insert(file_name).second) {
      error = "manifest entries share the file name '" + file_name + "'";
      return false;
    }
  }

  for (const auto& dir : descriptor.build_dirs) {
    if (!IsContainedRelativePath(dir)) {
      error = std::string(kKeyBuildDirs) + ": '" + dir +
              "' must be a relative path inside the project";
      return false;
    }
    const std::string reserved = ReservedOutputFor(descriptor, dir);
    if (!reserved.empty()) {
      error = std::string(kKeyBuildDirs) + ": '" + dir + "' lies under '" + reserved +
              "', which dist reserves for its own output";
      return false;
    }
  }

  if (descriptor.install_command.empty()) {
    error = std::string(kKeyInstallCommand) + ": must not be empty";
    return false;
  }
  if (descriptor.archiver == ArchiverKind::kZipCommand && descriptor.archive_command.empty()) {
    error = std::string(kKeyArchiveCommand) + ": must not be empty when archiver is 'zip'";
    return false;
  }
  return true;
}

} // namespace

std::vector<std::string> ProjectDescriptor::Manifest() const {
  std::vector<std::string> manifest;
  manifest.reserve(sources.size() + other_files.size());
  manifest.insert(manifest.end(), sources.begin(), sources.end());
  manifest.insert(manifest.end(), other_files.begin(), other_files.end());
  return manifest;
}

const char* ToString(ArchiverKind kind) {
  switch (kind) {
  case ArchiverKind::kZipCommand:
    return "zip";
  case ArchiverKind::kBuiltin:
    return "builtin";
  }
  return "zip";
}

bool ParseProjectDescriptor(std::string_view json_text, ProjectDescriptor& descriptor,
                            std::string& error) {
  JsonValue root;
  if (!core::json::Parse(json_text, root, error)) {
    return false;
  }
  if (root.type != JsonValue::Type::kObject) {
    error = "project descriptor must be a JSON object";
    return false;
  }
  for (const auto& [key, value] : root.object_value) {
    (void)value;
    if (!IsKnownKey(key)) {
      error = "unknown key '" + key + "'";
      return false;
    }
  }

  ProjectDescriptor parsed = descriptor;
  if (!ReadString(root, kKeyProject, parsed.name, error) ||
      !ReadStringArray(root, kKeySources, parsed.sources, error) ||
      !ReadStringArray(root, kKeyOther, parsed.other_files, error) ||
      !ReadStringArray(root, kKeyCleanPatterns, parsed.clean_patterns, error) ||
      !ReadStringArray(root, kKeyBuildDirs, parsed.build_dirs, error) ||
      !ReadStringArray(root, kKeyCachePatterns, parsed.cache_patterns, error) ||
      !ReadStringArray(root, kKeyInstallCommand, parsed.install_command, error) ||
      !ReadStringArray(root, kKeyArchiveCommand, parsed.archive_command, error)) {
    return false;
  }

  std::string archiver = ToString(parsed.archiver);
  if (!ReadString(root, kKeyArchiver, archiver, error)) {
    return false;
  }
  if (archiver == "zip") {
    parsed.archiver = ArchiverKind::kZipCommand;
  } else if (archiver == "builtin") {
    parsed.archiver = ArchiverKind::kBuiltin;
  } else {
    error = std::string(kKeyArchiver) + ": expected 'zip' or 'builtin', got '" + archiver + "'";
    return false;
  }

  if (!ValidateDescriptor(parsed, error)) {
    return false;
  }
  descriptor = std::move(parsed);
  return true;
}

bool LoadProjectDescriptor(const fs::path& path, ProjectDescriptor& descriptor,
                           std::string& error) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    error = "unable to open project descriptor: " + path.string();
    return false;
  }
  const std::string text((std::istreambuf_iterator<char>(input)),
                         std::istreambuf_iterator<char>());
  if (input.bad()) {
    error = "failed while reading project descriptor: " + path.string();
    return false;
  }

  if (!ParseProjectDescriptor(text, descriptor, error)) {
    error = path.string() + ": " + error;
    return false;
  }
  return true;
}

bool ResolveProjectDescriptor(const fs::path& work_dir, const fs::path& descriptor_path,
                              ProjectDescriptor& descriptor, std::string& source,
                              std::string& error) {
  descriptor = ProjectDescriptor{};
  if (!descriptor_path.empty()) {
    source = descriptor_path.string();
    return LoadProjectDescriptor(descriptor_path, descriptor, error);
  }

  const fs::path implicit_path = work_dir / kDescriptorFileName;
  std::error_code ec;
  if (fs::is_regular_file(implicit_path, ec)) {
    source = implicit_path.string();
    return LoadProjectDescriptor(implicit_path, descriptor, error);
  }

  source = "defaults";
  return true;
}

} // namespace distrun::project
