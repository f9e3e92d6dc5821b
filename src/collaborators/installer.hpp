#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace distrun::collaborators {

// Installs the project into the active runtime environment. Installation
// mechanics belong to the implementation; the task layer only sees success or
// a failure message.
class Installer {
public:
  virtual ~Installer() = default;

  // Returns false and sets `error` when installation did not succeed.
  virtual bool Install(const std::filesystem::path& work_dir, std::string& error) = 0;
};

// Runs a fixed command line (for example `python setup.py install`) inside the
// working directory. Non-zero exit status is a failure; it is reported as-is
// and never retried.
class CommandInstaller final : public Installer {
public:
  explicit CommandInstaller(std::vector<std::string> command);

  bool Install(const std::filesystem::path& work_dir, std::string& error) override;

  const std::vector<std::string>& Command() const {
    return command_;
  }

private:
  std::vector<std::string> command_;
};

std::unique_ptr<Installer> MakeCommandInstaller(std::vector<std::string> command);

} // namespace distrun::collaborators
