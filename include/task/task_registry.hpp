// task_registry.hpp
#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

#include "task/task_info.hpp"
#include "task/task_key.hpp"

// 节点上构建任务与分析任务的状态表。
//
// 两张表共用一把互斥锁，保证 hasInProgressTask() 这类跨表查询是原子的。
// 所有操作在整个执行期间持锁；key 不存在时一律静默处理（no-op、返回
// IndexState::None / nullopt / 空列表），因为删除和迟到的状态更新并发
// 是正常情况。注册表从不调用记录上的取消句柄。
class TaskRegistry {
public:
    using IndexTaskFn    = std::function<void(const TaskKey&, IndexTaskInfo&)>;
    using AnalysisTaskFn = std::function<void(const TaskKey&, AnalysisTaskInfo&)>;

    TaskRegistry() = default;
    ~TaskRegistry() = default;

    // 禁止拷贝
    TaskRegistry(const TaskRegistry&)            = delete;
    TaskRegistry& operator=(const TaskRegistry&) = delete;

    /*---------------- 构建任务 ----------------*/

    // 先注册者胜出：key 已存在时不覆盖，返回已有记录的副本；否则插入并返回 nullopt
    std::optional<IndexTaskInfo> loadOrStoreIndexTask(const TaskKey& key, IndexTaskInfo info);
    IndexState loadIndexTaskState(const TaskKey& key) const;
    void storeIndexTaskState(const TaskKey& key, IndexState state, const std::string& failReason);
    std::optional<IndexTaskInfo> getIndexTaskInfo(const TaskKey& key) const;

    // fn 在锁内执行，不能重入注册表
    void foreachIndexTaskInfo(const IndexTaskFn& fn);

    // fileKeys 与 statistic 会被拷贝；indexStoreVersion 为空时保留原值（旧版协调节点不下发）
    void storeIndexFilesAndStatistic(const TaskKey& key,
                                     const std::vector<std::string>& fileKeys,
                                     uint64_t serializedSize,
                                     const JobInfo& statistic,
                                     int32_t currentIndexVersion,
                                     std::optional<int64_t> indexStoreVersion = std::nullopt);

    std::vector<DetachedIndexTask> deleteIndexTaskInfos(const std::vector<TaskKey>& keys);
    std::vector<DetachedIndexTask> deleteAllIndexTasks();

    /*---------------- 分析任务 ----------------*/

    std::optional<AnalysisTaskInfo> loadOrStoreAnalysisTask(const TaskKey& key, AnalysisTaskInfo info);
    IndexState loadAnalysisTaskState(const TaskKey& key) const;
    void storeAnalysisTaskState(const TaskKey& key, IndexState state, const std::string& failReason);
    std::optional<AnalysisTaskInfo> getAnalysisTaskInfo(const TaskKey& key) const;
    void foreachAnalysisTaskInfo(const AnalysisTaskFn& fn);

    // segmentsOffsetMapping 直接移入记录，不做额外拷贝
    void storeAnalysisStatistic(const TaskKey& key,
                                std::string centroidsFile,
                                std::unordered_map<int64_t, std::string> segmentsOffsetMapping);

    std::vector<DetachedAnalysisTask> deleteAnalysisTaskInfos(const std::vector<TaskKey>& keys);
    std::vector<DetachedAnalysisTask> deleteAllAnalysisTasks();

    /*---------------- 聚合查询 ----------------*/

    // 全表扫描两张表，只在关闭路径上调用
    bool hasInProgressTask() const;

    std::size_t indexTaskCount() const;
    std::size_t analysisTaskCount() const;

    // 所有记录的 JSON 副本：{"index_tasks": [...], "analysis_tasks": [...]}
    nlohmann::json snapshot() const;

private:
    using IndexTaskMap    = std::unordered_map<TaskKey, std::unique_ptr<IndexTaskInfo>>;
    using AnalysisTaskMap = std::unordered_map<TaskKey, std::unique_ptr<AnalysisTaskInfo>>;

    mutable std::mutex mtx_;
    IndexTaskMap       indexTasks_;
    AnalysisTaskMap    analysisTasks_;
};
