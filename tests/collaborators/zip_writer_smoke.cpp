#include "collaborators/archiver.hpp"
#include "collaborators/zip_writer.hpp"

#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "../common/zip_reader.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
using distrun::tests::common::AssertMissing;
using distrun::tests::common::Fail;
using distrun::tests::common::ReadFileToString;
using distrun::tests::common::WriteFile;

int main() {
  const fs::path root = distrun::tests::common::CreateUniqueTempDir("distrun-zip-writer");
  const fs::path staging = root / "kmeans";
  fs::create_directories(staging);

  const std::string binary_payload("\x00\x01\xff\r\n", 5);
  WriteFile(staging / "KMeans.py", "def kmeans():\n    pass\n");
  WriteFile(staging / "setup.py", "from distutils.core import setup\n");
  WriteFile(staging / "blob.bin", binary_payload);

  std::string error;
  const fs::path archive = root / "kmeans.zip";
  if (!distrun::collaborators::WriteZipArchive(staging, archive, error)) {
    Fail("WriteZipArchive failed: " + error);
  }

  const std::string zip_bytes = ReadFileToString(archive);
  if (zip_bytes.size() < 4U || zip_bytes.compare(0, 4, std::string("PK\x03\x04", 4)) != 0) {
    Fail("archive does not start with a local file header");
  }

  const auto entries = distrun::tests::common::ReadStoredZip(archive);
  if (entries.size() != 3U) {
    Fail("expected 3 entries, got " + std::to_string(entries.size()));
  }
  if (entries.at("kmeans/KMeans.py") != "def kmeans():\n    pass\n" ||
      entries.at("kmeans/setup.py") != "from distutils.core import setup\n" ||
      entries.at("kmeans/blob.bin") != binary_payload) {
    Fail("archived entry contents differ from the source files");
  }

  {
    // Same inputs, same bytes.
    const fs::path again = root / "again.zip";
    distrun::collaborators::BuiltinZipArchiver archiver;
    if (!archiver.CreateArchive(staging, again, error)) {
      Fail("BuiltinZipArchiver failed: " + error);
    }
    if (ReadFileToString(again) != zip_bytes) {
      Fail("archives of identical inputs must be byte-identical");
    }
  }

  {
    const fs::path empty_dir = root / "empty";
    fs::create_directories(empty_dir);
    if (!distrun::collaborators::WriteZipArchive(empty_dir, root / "empty.zip", error)) {
      Fail("an empty directory still yields a valid archive: " + error);
    }
    if (!distrun::tests::common::ReadStoredZip(root / "empty.zip").empty()) {
      Fail("empty directory archive should have no entries");
    }
  }

  {
    if (distrun::collaborators::WriteZipArchive(root / "missing", root / "missing.zip", error)) {
      Fail("archiving a missing directory must fail");
    }
    AssertMissing(root / "missing.zip");
    for (const auto& entry : fs::directory_iterator(root)) {
      if (entry.path().filename().string().find(".tmp.") != std::string::npos) {
        Fail("temporary archive left behind: " + entry.path().string());
      }
    }
  }

  distrun::tests::common::RemovePathBestEffort(root);
  std::cout << "zip_writer_smoke: ok\n";
  return 0;
}
