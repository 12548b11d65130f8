#include "task/task_key.hpp"

#include <fmt/core.h>

std::string TaskKey::toString() const {
    return fmt::format("{}/{}", ClusterID, TaskID);
}
