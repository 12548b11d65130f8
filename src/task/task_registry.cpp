// task_registry.cpp
#include "task/task_registry.hpp"
#include <spdlog/spdlog.h>

namespace {

// 以下辅助函数都要求调用方已持有注册表的锁

template <typename Map>
auto loadOrStoreLocked(Map& tasks, const TaskKey& key,
                       typename Map::mapped_type::element_type info)
    -> std::optional<typename Map::mapped_type::element_type>
{
    using Info = typename Map::mapped_type::element_type;
    auto it = tasks.find(key);
    if (it != tasks.end()) {
        return *it->second;
    }
    tasks.emplace(key, std::make_unique<Info>(std::move(info)));
    return std::nullopt;
}

template <typename Map>
IndexState loadStateLocked(const Map& tasks, const TaskKey& key) {
    auto it = tasks.find(key);
    if (it == tasks.end()) return IndexState::None;
    return it->second->State;
}

template <typename Map>
bool anyInProgressLocked(const Map& tasks) {
    for (const auto& [key, info] : tasks) {
        if (info->State == IndexState::InProgress) return true;
    }
    return false;
}

template <typename Map>
nlohmann::json dumpLocked(const Map& tasks) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& [key, info] : tasks) {
        nlohmann::json j = *info;
        j["cluster_id"] = key.ClusterID;
        j["task_id"]    = key.TaskID;
        arr.push_back(std::move(j));
    }
    return arr;
}

}  // namespace

/*==========================================================
 * 构建任务
 *=========================================================*/
std::optional<IndexTaskInfo> TaskRegistry::loadOrStoreIndexTask(const TaskKey& key, IndexTaskInfo info) {
    std::lock_guard lg(mtx_);
    return loadOrStoreLocked(indexTasks_, key, std::move(info));
}

IndexState TaskRegistry::loadIndexTaskState(const TaskKey& key) const {
    std::lock_guard lg(mtx_);
    return loadStateLocked(indexTasks_, key);
}

void TaskRegistry::storeIndexTaskState(const TaskKey& key, IndexState state, const std::string& failReason) {
    {
        std::lock_guard lg(mtx_);
        auto it = indexTasks_.find(key);
        if (it == indexTasks_.end()) return;   // 已被删除，迟到的更新直接丢弃
        it->second->State      = state;
        it->second->FailReason = failReason;
    }
    spdlog::debug("TaskRegistry: store index task state, clusterID {}, buildID {}, state {}, fail reason '{}'",
                  key.ClusterID, key.TaskID, toString(state), failReason);
}

std::optional<IndexTaskInfo> TaskRegistry::getIndexTaskInfo(const TaskKey& key) const {
    std::lock_guard lg(mtx_);
    auto it = indexTasks_.find(key);
    if (it == indexTasks_.end()) return std::nullopt;
    return *it->second;
}

void TaskRegistry::foreachIndexTaskInfo(const IndexTaskFn& fn) {
    std::lock_guard lg(mtx_);
    for (auto& [key, info] : indexTasks_) {
        fn(key, *info);
    }
}

void TaskRegistry::storeIndexFilesAndStatistic(const TaskKey& key,
                                               const std::vector<std::string>& fileKeys,
                                               uint64_t serializedSize,
                                               const JobInfo& statistic,
                                               int32_t currentIndexVersion,
                                               std::optional<int64_t> indexStoreVersion)
{
    std::lock_guard lg(mtx_);
    auto it = indexTasks_.find(key);
    if (it == indexTasks_.end()) return;
    auto& info = *it->second;
    info.FileKeys            = fileKeys;
    info.SerializedSize      = serializedSize;
    info.Statistic           = statistic;
    info.CurrentIndexVersion = currentIndexVersion;
    if (indexStoreVersion) {
        info.IndexStoreVersion = *indexStoreVersion;
    }
}

std::vector<DetachedIndexTask> TaskRegistry::deleteIndexTaskInfos(const std::vector<TaskKey>& keys) {
    std::vector<DetachedIndexTask> deleted;
    deleted.reserve(keys.size());
    {
        std::lock_guard lg(mtx_);
        for (const auto& key : keys) {
            auto it = indexTasks_.find(key);
            if (it == indexTasks_.end()) continue;
            deleted.push_back(DetachedIndexTask(it->first, std::move(it->second)));
            indexTasks_.erase(it);
        }
    }
    // 日志放在锁外
    for (const auto& task : deleted) {
        spdlog::info("TaskRegistry: delete index task info, clusterID {}, buildID {}",
                     task.key().ClusterID, task.key().TaskID);
    }
    return deleted;
}

std::vector<DetachedIndexTask> TaskRegistry::deleteAllIndexTasks() {
    IndexTaskMap old;
    {
        std::lock_guard lg(mtx_);
        old.swap(indexTasks_);
    }

    std::vector<DetachedIndexTask> deleted;
    deleted.reserve(old.size());
    for (auto& [key, info] : old) {
        deleted.push_back(DetachedIndexTask(key, std::move(info)));
    }
    if (!deleted.empty()) {
        spdlog::info("TaskRegistry: delete all index tasks, count {}", deleted.size());
    }
    return deleted;
}

/*==========================================================
 * 分析任务
 *=========================================================*/
std::optional<AnalysisTaskInfo> TaskRegistry::loadOrStoreAnalysisTask(const TaskKey& key, AnalysisTaskInfo info) {
    std::lock_guard lg(mtx_);
    return loadOrStoreLocked(analysisTasks_, key, std::move(info));
}

IndexState TaskRegistry::loadAnalysisTaskState(const TaskKey& key) const {
    std::lock_guard lg(mtx_);
    return loadStateLocked(analysisTasks_, key);
}

void TaskRegistry::storeAnalysisTaskState(const TaskKey& key, IndexState state, const std::string& failReason) {
    {
        std::lock_guard lg(mtx_);
        auto it = analysisTasks_.find(key);
        if (it == analysisTasks_.end()) return;   // 已被删除，迟到的更新直接丢弃
        it->second->State      = state;
        it->second->FailReason = failReason;
    }
    spdlog::info("TaskRegistry: store analysis task state, clusterID {}, taskID {}, state {}, fail reason '{}'",
                 key.ClusterID, key.TaskID, toString(state), failReason);
}

std::optional<AnalysisTaskInfo> TaskRegistry::getAnalysisTaskInfo(const TaskKey& key) const {
    std::lock_guard lg(mtx_);
    auto it = analysisTasks_.find(key);
    if (it == analysisTasks_.end()) return std::nullopt;
    return *it->second;
}

void TaskRegistry::foreachAnalysisTaskInfo(const AnalysisTaskFn& fn) {
    std::lock_guard lg(mtx_);
    for (auto& [key, info] : analysisTasks_) {
        fn(key, *info);
    }
}

void TaskRegistry::storeAnalysisStatistic(const TaskKey& key,
                                          std::string centroidsFile,
                                          std::unordered_map<int64_t, std::string> segmentsOffsetMapping)
{
    std::lock_guard lg(mtx_);
    auto it = analysisTasks_.find(key);
    if (it == analysisTasks_.end()) return;
    it->second->CentroidsFile         = std::move(centroidsFile);
    it->second->SegmentsOffsetMapping = std::move(segmentsOffsetMapping);
}

std::vector<DetachedAnalysisTask> TaskRegistry::deleteAnalysisTaskInfos(const std::vector<TaskKey>& keys) {
    std::vector<DetachedAnalysisTask> deleted;
    deleted.reserve(keys.size());
    {
        std::lock_guard lg(mtx_);
        for (const auto& key : keys) {
            auto it = analysisTasks_.find(key);
            if (it == analysisTasks_.end()) continue;
            deleted.push_back(DetachedAnalysisTask(it->first, std::move(it->second)));
            analysisTasks_.erase(it);
        }
    }
    for (const auto& task : deleted) {
        spdlog::info("TaskRegistry: delete analysis task info, clusterID {}, taskID {}",
                     task.key().ClusterID, task.key().TaskID);
    }
    return deleted;
}

std::vector<DetachedAnalysisTask> TaskRegistry::deleteAllAnalysisTasks() {
    AnalysisTaskMap old;
    {
        std::lock_guard lg(mtx_);
        old.swap(analysisTasks_);
    }

    std::vector<DetachedAnalysisTask> deleted;
    deleted.reserve(old.size());
    for (auto& [key, info] : old) {
        deleted.push_back(DetachedAnalysisTask(key, std::move(info)));
    }
    if (!deleted.empty()) {
        spdlog::info("TaskRegistry: delete all analysis tasks, count {}", deleted.size());
    }
    return deleted;
}

/*==========================================================
 * 聚合查询
 *=========================================================*/
bool TaskRegistry::hasInProgressTask() const {
    std::lock_guard lg(mtx_);
    return anyInProgressLocked(indexTasks_) || anyInProgressLocked(analysisTasks_);
}

std::size_t TaskRegistry::indexTaskCount() const {
    std::lock_guard lg(mtx_);
    return indexTasks_.size();
}

std::size_t TaskRegistry::analysisTaskCount() const {
    std::lock_guard lg(mtx_);
    return analysisTasks_.size();
}

nlohmann::json TaskRegistry::snapshot() const {
    std::lock_guard lg(mtx_);
    return nlohmann::json{
        {"index_tasks",    dumpLocked(indexTasks_)},
        {"analysis_tasks", dumpLocked(analysisTasks_)}
    };
}
