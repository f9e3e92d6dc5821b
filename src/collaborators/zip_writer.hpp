#pragma once

#include <filesystem>
#include <string>

namespace distrun::collaborators {

// Writes `source_dir` as a zip32 archive at `archive_path`.
//
// Contract:
// - Every regular file under `source_dir` becomes one entry named
//   `<source_dir name>/<relative path>`, in sorted order.
// - Entries are stored uncompressed with zeroed timestamps, so the same
//   inputs always give byte-identical archives.
// - The archive is written to a temporary sibling and renamed into place;
//   a failed write never leaves a partial file at `archive_path`.
// - Returns false and sets `error` on failure.
bool WriteZipArchive(const std::filesystem::path& source_dir,
                     const std::filesystem::path& archive_path, std::string& error);

} // namespace distrun::collaborators
