#pragma once

#include <memory>

#include "internal/registry/task_registry.hpp"

namespace proposal::llm {
class GenerationBackend;
}

namespace proposal::tasks {

// Registers every task of registry::kTaskDescriptors against `backend`.
std::shared_ptr<registry::TaskRegistry> BuildTaskRegistry(std::shared_ptr<llm::GenerationBackend> backend);

} // namespace proposal::tasks
