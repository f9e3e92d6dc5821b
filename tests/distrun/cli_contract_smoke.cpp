#include "core/errors/exit_codes.hpp"

#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/project_fixtures.hpp"
#include "../common/temp_dir.hpp"
#include "../common/zip_reader.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>

namespace fs = std::filesystem;
using distrun::core::errors::ExitCode;
using distrun::core::errors::ToInt;
using distrun::tests::common::AssertContains;
using distrun::tests::common::AssertExists;
using distrun::tests::common::AssertMissing;
using distrun::tests::common::DispatchCaptured;
using distrun::tests::common::Fail;
using distrun::tests::common::WriteFile;

namespace {

void ExpectExit(const distrun::tests::common::CapturedDispatch& captured, ExitCode expected,
                std::string_view context) {
  if (captured.exit_code != ToInt(expected)) {
    Fail(std::string(context) + ": expected exit " + std::to_string(ToInt(expected)) + ", got " +
         std::to_string(captured.exit_code) + "\nstderr: " + captured.stderr_text);
  }
}

} // namespace

int main() {
  const fs::path root = distrun::tests::common::CreateUniqueTempDir("distrun-cli");
  const std::string dir = root.string();
  distrun::tests::common::WriteKMeansProject(root);
  WriteFile(root / "distrun.json", "{\"archiver\": \"builtin\"}\n");

  {
    const auto captured = DispatchCaptured({"distrun"});
    ExpectExit(captured, ExitCode::kUsage, "no arguments");
    AssertContains(captured.stderr_text, "usage:");
  }

  {
    WriteFile(root / "KMeans.py~", "backup");
    const auto before = distrun::tests::common::SnapshotTree(root);
    const auto captured = DispatchCaptured({"distrun", "package", "--dir", dir});
    ExpectExit(captured, ExitCode::kUsage, "unknown task");
    AssertContains(captured.stderr_text, "unknown task 'package'");
    AssertContains(captured.stderr_text, "clean, install, distclean, dist");
    if (distrun::tests::common::SnapshotTree(root) != before) {
      Fail("an unknown task must not touch the working directory");
    }
  }

  ExpectExit(DispatchCaptured({"distrun", "dist", "--frobnicate"}), ExitCode::kUsage,
             "unknown flag");
  ExpectExit(DispatchCaptured({"distrun", "dist", "clean"}), ExitCode::kUsage, "two tasks");
  ExpectExit(DispatchCaptured({"distrun", "--dir", dir}), ExitCode::kUsage, "flags, no task");
  ExpectExit(DispatchCaptured({"distrun", "dist", "--log-level", "loud"}), ExitCode::kUsage,
             "bad log level");
  ExpectExit(DispatchCaptured({"distrun", "clean", "--dir", (root / "nope").string()}),
             ExitCode::kUsage, "missing working directory");

  {
    const auto captured = DispatchCaptured({"distrun", "version"});
    ExpectExit(captured, ExitCode::kSuccess, "version");
    AssertContains(captured.stdout_text, "distrun ");
    ExpectExit(DispatchCaptured({"distrun", "--help"}), ExitCode::kSuccess, "help");
  }

  {
    const auto captured = DispatchCaptured({"distrun", "dist", "--dir", dir, "--dry-run"});
    ExpectExit(captured, ExitCode::kSuccess, "dry run");
    if (captured.stdout_text != "clean\ndistclean\ndist\n") {
      Fail("dry run prints the execution order, got: " + captured.stdout_text);
    }
    AssertExists(root / "KMeans.py~");
    AssertMissing(root / "kmeans.zip");
  }

  {
    const auto captured = DispatchCaptured({"distrun", "dist", "--dir", dir});
    ExpectExit(captured, ExitCode::kSuccess, "dist");
    AssertContains(captured.stdout_text, "dist: ok (ran clean, distclean, dist)");
    AssertMissing(root / "KMeans.py~");
    AssertMissing(root / "kmeans");
    if (distrun::tests::common::ReadStoredZip(root / "kmeans.zip").size() != 3U) {
      Fail("cli dist should archive the three manifest files");
    }
  }

  {
    const fs::path descriptor = root / "missing-artifact.json";
    WriteFile(descriptor, "{\"archiver\": \"builtin\", \"other\": [\"Makefile\", \"setup.cfg\"]}");
    const auto captured = DispatchCaptured(
        {"distrun", "dist", "--dir", dir, "--project", descriptor.string()});
    ExpectExit(captured, ExitCode::kMissingArtifact, "missing artifact");
    AssertContains(captured.stderr_text, "task 'dist' failed: missing artifact: setup.cfg");
  }

  {
    const fs::path descriptor = root / "failing-install.json";
    WriteFile(descriptor, "{\"install_command\": [\"sh\", \"-c\", \"exit 4\"]}");
    const auto captured = DispatchCaptured(
        {"distrun", "install", "--dir", dir, "--project", descriptor.string()});
    ExpectExit(captured, ExitCode::kInstallFailed, "install failure");
    AssertContains(captured.stderr_text, "task 'install' failed: install command exited with "
                                         "status 4");
  }

  {
    const fs::path descriptor = root / "working-install.json";
    WriteFile(descriptor, "{\"install_command\": [\"sh\", \"-c\", \"touch installed.marker\"]}");
    const auto captured = DispatchCaptured(
        {"distrun", "install", "--dir", dir, "--project", descriptor.string()});
    ExpectExit(captured, ExitCode::kSuccess, "install");
    AssertExists(root / "installed.marker");
  }

  {
    const fs::path descriptor = root / "failing-zip.json";
    WriteFile(descriptor, "{\"archiver\": \"zip\", \"archive_command\": [\"false\"]}");
    const auto captured = DispatchCaptured(
        {"distrun", "dist", "--dir", dir, "--project", descriptor.string()});
    ExpectExit(captured, ExitCode::kPackagingFailed, "packaging failure");
    AssertMissing(root / "kmeans");
  }

  {
    const fs::path descriptor = root / "invalid.json";
    WriteFile(descriptor, "{\"project\": \"a/b\"}");
    const auto captured = DispatchCaptured(
        {"distrun", "clean", "--dir", dir, "--project", descriptor.string()});
    ExpectExit(captured, ExitCode::kProjectInvalid, "invalid descriptor");
    AssertContains(captured.stderr_text, "invalid project descriptor");
  }

  distrun::tests::common::RemovePathBestEffort(root);
  std::cout << "cli_contract_smoke: ok\n";
  return 0;
}
