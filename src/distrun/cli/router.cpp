#include "distrun/cli/router.hpp"

#include "collaborators/archiver.hpp"
#include "collaborators/installer.hpp"
#include "core/errors/exit_codes.hpp"
#include "project/descriptor.hpp"
#include "tasks/registry.hpp"
#include "tasks/runner.hpp"
#include "tasks/standard_tasks.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace distrun::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitProjectInvalid = core::errors::ToInt(core::errors::ExitCode::kProjectInvalid);
constexpr int kExitMissingArtifact =
    core::errors::ToInt(core::errors::ExitCode::kMissingArtifact);
constexpr int kExitInstallFailed = core::errors::ToInt(core::errors::ExitCode::kInstallFailed);
constexpr int kExitPackagingFailed =
    core::errors::ToInt(core::errors::ExitCode::kPackagingFailed);

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  distrun <clean|install|distclean|dist> [--dir <path>] [--project <distrun.json>] "
         "[--log-level <debug|info|warn|error>] [--dry-run]\n"
      << "  distrun version\n"
      << "  distrun --help\n";
}

int ExitCodeFor(tasks::TaskErrorCode code) {
  switch (code) {
  case tasks::TaskErrorCode::kNone:
    return kExitSuccess;
  case tasks::TaskErrorCode::kUnknownTask:
    return kExitUsage;
  case tasks::TaskErrorCode::kFilesystem:
    return kExitFailure;
  case tasks::TaskErrorCode::kInstall:
    return kExitInstallFailed;
  case tasks::TaskErrorCode::kMissingArtifact:
    return kExitMissingArtifact;
  case tasks::TaskErrorCode::kPackaging:
    return kExitPackagingFailed;
  }
  return kExitFailure;
}

std::string JoinNames(const std::vector<std::string>& names) {
  std::string joined;
  for (const auto& name : names) {
    if (!joined.empty()) {
      joined += ", ";
    }
    joined += name;
  }
  return joined;
}

// Parse task args with an explicit contract:
// - exactly one positional task name
// - optional `--dir`, `--project`, `--log-level`, `--dry-run`
// Unknown flags and extra positionals are usage errors.
bool ParseRunOptions(const std::vector<std::string_view>& args, RunOptions& options,
                     std::string& error) {
  bool has_task = false;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    const bool has_value = i + 1U < args.size();

    if (token == "--dir") {
      if (!has_value || args[i + 1U].empty()) {
        error = "missing value for --dir";
        return false;
      }
      options.work_dir = fs::path(std::string(args[++i]));
      continue;
    }
    if (token == "--project") {
      if (!has_value || args[i + 1U].empty()) {
        error = "missing value for --project";
        return false;
      }
      options.project_path = fs::path(std::string(args[++i]));
      continue;
    }
    if (token == "--log-level") {
      const std::string_view value = has_value ? args[++i] : std::string_view{};
      if (!core::logging::ParseLogLevel(value, options.log_level, error)) {
        return false;
      }
      continue;
    }
    if (token == "--dry-run") {
      options.dry_run = true;
      continue;
    }
    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    if (has_task) {
      error = "unexpected extra argument: " + std::string(token);
      return false;
    }
    options.task = std::string(token);
    has_task = true;
  }

  if (!has_task) {
    error = "missing task name";
    return false;
  }
  return true;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }
  std::cout << "distrun 1.0.0\n";
  return kExitSuccess;
}

} // namespace

int ExecuteTask(const RunOptions& options) {
  core::logging::Logger logger(options.log_level);

  tasks::TaskRegistry registry;
  std::string error;
  if (!tasks::BuildStandardTaskRegistry(registry, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  // Reject unknown names before touching the project or the filesystem.
  if (!registry.Contains(options.task)) {
    std::cerr << "error: unknown task '" << options.task << "' (expected "
              << JoinNames(registry.Names()) << ")\n";
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  std::error_code ec;
  if (!fs::is_directory(options.work_dir, ec)) {
    std::cerr << "error: working directory not found: " << options.work_dir.string() << '\n';
    return kExitUsage;
  }

  tasks::TaskContext context;
  context.work_dir = options.work_dir;
  context.logger = &logger;

  std::string descriptor_source;
  if (!project::ResolveProjectDescriptor(options.work_dir, options.project_path, context.project,
                                         descriptor_source, error)) {
    std::cerr << "error: invalid project descriptor: " << error << '\n';
    return kExitProjectInvalid;
  }
  logger.Debug("project descriptor resolved",
               {{"source", descriptor_source},
                {"project", context.project.name},
                {"archiver", project::ToString(context.project.archiver)}});

  std::unique_ptr<collaborators::Installer> installer =
      collaborators::MakeCommandInstaller(context.project.install_command);
  std::unique_ptr<collaborators::Archiver> archiver = collaborators::MakeArchiver(context.project);
  context.installer = installer.get();
  context.archiver = archiver.get();

  tasks::TaskRunner runner(registry, context);
  tasks::TaskError task_error;

  if (options.dry_run) {
    std::vector<std::string> order;
    if (!runner.Plan(options.task, order, task_error)) {
      std::cerr << "error: " << task_error.Describe() << '\n';
      return ExitCodeFor(task_error.code);
    }
    for (const auto& name : order) {
      std::cout << name << '\n';
    }
    return kExitSuccess;
  }

  tasks::RunResult result;
  if (!runner.Run(options.task, result, task_error)) {
    std::cerr << "error: " << task_error.Describe() << '\n';
    return ExitCodeFor(task_error.code);
  }

  std::cout << options.task << ": ok (ran " << JoinNames(result.executed) << ")\n";
  return kExitSuccess;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view first(argv[1]);
  std::vector<std::string_view> args;
  for (int i = 2; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }

  if (first == "--help" || first == "-h" || first == "help") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }
  if (first == "version" || first == "--version") {
    return CommandVersion(args);
  }

  std::vector<std::string_view> all_args;
  all_args.reserve(args.size() + 1U);
  all_args.push_back(first);
  all_args.insert(all_args.end(), args.begin(), args.end());

  RunOptions options;
  std::string error;
  if (!ParseRunOptions(all_args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  return ExecuteTask(options);
}

} // namespace distrun::cli
