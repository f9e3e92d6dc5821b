#include "tasks_fixture.hpp"

#include "collaborators/archiver.hpp"

#include "../common/assertions.hpp"
#include "../common/project_fixtures.hpp"
#include "../common/temp_dir.hpp"
#include "../common/zip_reader.hpp"

#include <filesystem>
#include <iostream>
#include <map>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using distrun::tasks::TaskContext;
using distrun::tests::common::AssertExists;
using distrun::tests::common::AssertMissing;
using distrun::tests::common::Fail;
using distrun::tests::common::ReadFileToString;
using distrun::tests::common::WriteFile;
using distrun::tests::tasks::RunStandardTask;

int main() {
  const fs::path root = distrun::tests::common::CreateUniqueTempDir("distrun-dist");
  distrun::tests::common::WriteKMeansProject(root);
  WriteFile(root / "KMeans.pyc", "bytecode");
  fs::create_directories(root / "build");

  distrun::collaborators::BuiltinZipArchiver archiver;
  TaskContext context;
  context.work_dir = root;
  context.project = distrun::tests::common::BuiltinArchiverProject();
  context.archiver = &archiver;

  const fs::path archive = root / "kmeans.zip";
  const fs::path backup = root / "kmeans-old.zip";
  const fs::path staging = root / "kmeans";

  {
    const auto outcome = RunStandardTask(context, "dist");
    if (!outcome.ok) {
      Fail("first dist failed: " + outcome.error.Describe());
    }
    if (outcome.result.executed != std::vector<std::string>{"clean", "distclean", "dist"}) {
      Fail("dist runs clean, distclean, dist in that order");
    }
    AssertExists(archive);
    AssertMissing(backup);
    AssertMissing(staging);
    AssertMissing(root / "build");
    AssertMissing(root / "KMeans.pyc");

    // Exactly the manifest, flattened under one top-level folder, byte for
    // byte.
    const std::map<std::string, std::string> expected = {
        {"kmeans/KMeans.py", distrun::tests::common::kKMeansSource},
        {"kmeans/Makefile", distrun::tests::common::kMakefileSource},
        {"kmeans/setup.py", distrun::tests::common::kSetupSource},
    };
    if (distrun::tests::common::ReadStoredZip(archive) != expected) {
      Fail("archive contents must equal the manifest files");
    }
  }

  const std::string first_archive = ReadFileToString(archive);

  {
    // Second run: previous archive moves to the backup slot, the new archive
    // reflects the current sources.
    WriteFile(root / "KMeans.py", "def kmeans(data, k):\n    return [data]\n");
    const auto outcome = RunStandardTask(context, "dist");
    if (!outcome.ok) {
      Fail("second dist failed: " + outcome.error.Describe());
    }
    AssertMissing(staging);
    if (ReadFileToString(backup) != first_archive) {
      Fail("backup archive must equal the first run's archive");
    }
    const auto entries = distrun::tests::common::ReadStoredZip(archive);
    if (entries.at("kmeans/KMeans.py") != "def kmeans(data, k):\n    return [data]\n") {
      Fail("new archive must reflect the second run's sources");
    }
  }

  {
    // Third run keeps a single backup generation.
    const std::string second_archive = ReadFileToString(archive);
    if (!RunStandardTask(context, "dist").ok) {
      Fail("third dist failed");
    }
    if (ReadFileToString(backup) != second_archive) {
      Fail("backup slot holds only the immediately preceding archive");
    }
    for (const auto& entry : fs::directory_iterator(root)) {
      const std::string name = entry.path().filename().string();
      if (name.rfind("kmeans", 0) == 0U && name != "kmeans.zip" && name != "kmeans-old.zip") {
        Fail("unexpected extra output: " + name);
      }
    }
  }

  {
    // Manifest entries in subdirectories are staged by file name only.
    fs::create_directories(root / "docs");
    WriteFile(root / "docs" / "README", "readme");
    context.project.other_files.push_back("docs/README");
    if (!RunStandardTask(context, "dist").ok) {
      Fail("dist with nested manifest entry failed");
    }
    const auto entries = distrun::tests::common::ReadStoredZip(archive);
    if (entries.count("kmeans/README") != 1U || entries.count("kmeans/docs/README") != 0U) {
      Fail("nested manifest entries must be flattened");
    }
  }

  distrun::tests::common::RemovePathBestEffort(root);
  std::cout << "dist_task_smoke: ok\n";
  return 0;
}
