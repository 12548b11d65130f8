// task_info.hpp
#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

#include "task/task_key.hpp"

// 与协调节点协议保持一致的编号
enum class IndexState : int32_t {
    None       = 0,   // 注册表里查不到时返回，不会被存储
    Unissued   = 1,
    InProgress = 2,
    Finished   = 3,
    Failed     = 4,
    Retry      = 5
};

const char* toString(IndexState state);

// 取消句柄，对应外部任务的取消通道
using CancelFunc = std::function<void()>;

// 构建任务的统计信息，值类型，拷贝即深拷贝
struct JobInfo {
    int64_t                                          NumRows{};
    int64_t                                          Dim{};
    int64_t                                          StartTime{};
    int64_t                                          EndTime{};
    std::vector<std::pair<std::string, std::string>> IndexParams;
    int64_t                                          PodID{};
};

struct IndexTaskInfo {
    CancelFunc                              Cancel;
    IndexState                              State{IndexState::None};
    std::vector<std::string>                FileKeys;
    uint64_t                                SerializedSize{};
    std::string                             FailReason;
    int32_t                                 CurrentIndexVersion{};
    int64_t                                 IndexStoreVersion{};
    std::optional<JobInfo>                  Statistic;
    std::chrono::system_clock::time_point   CreateTime{std::chrono::system_clock::now()};
};

struct AnalysisTaskInfo {
    CancelFunc                              Cancel;
    IndexState                              State{IndexState::None};
    std::string                             FailReason;
    std::string                             CentroidsFile;
    std::unordered_map<int64_t, std::string> SegmentsOffsetMapping;
    int64_t                                 IndexStoreVersion{};
    std::chrono::system_clock::time_point   CreateTime{std::chrono::system_clock::now()};
};

// "%F %T" 格式的 UTC 时间
std::string formatTime(std::chrono::system_clock::time_point tp);

// 诊断输出用，取消句柄只输出是否存在
void to_json(nlohmann::json& j, const JobInfo& info);
void to_json(nlohmann::json& j, const IndexTaskInfo& info);
void to_json(nlohmann::json& j, const AnalysisTaskInfo& info);

class TaskRegistry;

// 从注册表中删除后交还给调用方的记录。
// 只能移动，注册表不再持有它；调用方负责在锁外调用 cancel()。
template <typename Info>
class DetachedTask {
public:
    DetachedTask(DetachedTask&&) noexcept            = default;
    DetachedTask& operator=(DetachedTask&&) noexcept = default;
    DetachedTask(const DetachedTask&)                = delete;
    DetachedTask& operator=(const DetachedTask&)     = delete;

    const TaskKey& key() const { return key_; }

    // 被移走之后为 false，此时不能再调用 info() / operator->
    bool valid() const { return info_ != nullptr; }
    explicit operator bool() const { return valid(); }

    const Info& info() const { return *info_; }
    const Info* operator->() const { return info_.get(); }

    // 已被移走或没有取消句柄时什么都不做
    void cancel() const {
        if (info_ && info_->Cancel) info_->Cancel();
    }

private:
    friend class TaskRegistry;
    DetachedTask(TaskKey key, std::unique_ptr<Info> info)
        : key_(std::move(key)), info_(std::move(info)) {}

    TaskKey               key_;
    std::unique_ptr<Info> info_;
};

using DetachedIndexTask    = DetachedTask<IndexTaskInfo>;
using DetachedAnalysisTask = DetachedTask<AnalysisTaskInfo>;
