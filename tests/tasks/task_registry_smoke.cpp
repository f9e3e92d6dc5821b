#include "tasks/registry.hpp"
#include "tasks/standard_tasks.hpp"

#include "../common/assertions.hpp"

#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using distrun::tasks::TaskContext;
using distrun::tasks::TaskDescriptor;
using distrun::tasks::TaskError;
using distrun::tasks::TaskRegistry;
using distrun::tests::common::AssertContains;
using distrun::tests::common::Fail;

namespace {

bool Noop(TaskContext&, TaskError&) {
  return true;
}

void ExpectRejected(std::vector<TaskDescriptor> descriptors, std::string_view expected_error) {
  TaskRegistry registry;
  std::string error;
  if (TaskRegistry::Create(std::move(descriptors), registry, error)) {
    Fail("registry should have been rejected");
  }
  AssertContains(error, expected_error);
}

} // namespace

int main() {
  ExpectRejected({{"", {}, Noop}}, "task name cannot be empty");
  ExpectRejected({{"a", {}, Noop}, {"a", {}, Noop}}, "duplicate task name 'a'");
  ExpectRejected({{"a", {}, {}}}, "task 'a' has no action");
  // Forward references are how a cycle would have to start.
  ExpectRejected({{"a", {"b"}, Noop}, {"b", {}, Noop}}, "depends on 'b'");
  ExpectRejected({{"a", {"a"}, Noop}}, "depends on 'a'");
  ExpectRejected({{"a", {"ghost"}, Noop}}, "depends on 'ghost'");

  {
    TaskRegistry registry;
    std::string error;
    if (!distrun::tasks::BuildStandardTaskRegistry(registry, error)) {
      Fail("standard registry failed to build: " + error);
    }
    if (registry.Names() != std::vector<std::string>{"clean", "install", "distclean", "dist"}) {
      Fail("standard tasks are registered in declaration order");
    }

    const auto prerequisites_of = [&registry](std::string_view name) {
      const TaskDescriptor* task = registry.Find(name);
      if (task == nullptr) {
        Fail("standard task missing: " + std::string(name));
      }
      return task->prerequisites;
    };
    if (!prerequisites_of("clean").empty() ||
        prerequisites_of("install") != std::vector<std::string>{"clean"} ||
        prerequisites_of("distclean") != std::vector<std::string>{"clean"} ||
        prerequisites_of("dist") != std::vector<std::string>{"distclean"}) {
      Fail("standard prerequisite graph mismatch");
    }
    if (registry.Contains("build") || registry.Find("Dist") != nullptr) {
      Fail("task lookup is exact");
    }
  }

  std::cout << "task_registry_smoke: ok\n";
  return 0;
}
