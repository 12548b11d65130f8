// task_key.hpp
#pragma once
#include <cstdint>
#include <functional>
#include <string>

// 节点内任务的唯一标识：来源集群 + 任务 ID，两类任务共用
struct TaskKey {
    std::string ClusterID;
    int64_t     TaskID{};

    bool operator==(const TaskKey& other) const {
        return TaskID == other.TaskID && ClusterID == other.ClusterID;
    }
    bool operator!=(const TaskKey& other) const { return !(*this == other); }

    // 形如 "cluster-a/100"，日志用
    std::string toString() const;
};

namespace std {
template <>
struct hash<TaskKey> {
    size_t operator()(const TaskKey& key) const noexcept {
        size_t h1 = hash<string>{}(key.ClusterID);
        size_t h2 = hash<int64_t>{}(key.TaskID);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};
}  // namespace std
