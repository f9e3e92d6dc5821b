#include "tasks/registry.hpp"

#include <set>
#include <utility>

namespace distrun::tasks {

bool TaskRegistry::Create(std::vector<TaskDescriptor> descriptors, TaskRegistry& registry,
                          std::string& error) {
  std::set<std::string> registered;
  for (const auto& descriptor : descriptors) {
    if (descriptor.name.empty()) {
      error = "task name cannot be empty";
      return false;
    }
    if (registered.count(descriptor.name) != 0U) {
      error = "duplicate task name '" + descriptor.name + "'";
      return false;
    }
    if (!descriptor.action) {
      error = "task '" + descriptor.name + "' has no action";
      return false;
    }
    for (const auto& prerequisite : descriptor.prerequisites) {
      if (registered.count(prerequisite) == 0U) {
        error = "task '" + descriptor.name + "' depends on '" + prerequisite +
                "', which is not registered before it";
        return false;
      }
    }
    registered.insert(descriptor.name);
  }

  registry = TaskRegistry(std::move(descriptors));
  return true;
}

const TaskDescriptor* TaskRegistry::Find(std::string_view name) const {
  for (const auto& descriptor : descriptors_) {
    if (descriptor.name == name) {
      return &descriptor;
    }
  }
  return nullptr;
}

std::vector<std::string> TaskRegistry::Names() const {
  std::vector<std::string> names;
  names.reserve(descriptors_.size());
  for (const auto& descriptor : descriptors_) {
    names.push_back(descriptor.name);
  }
  return names;
}

} // namespace distrun::tasks
