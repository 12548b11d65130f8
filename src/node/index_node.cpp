#include "node/index_node.hpp"

#include <stdexcept>
#include <spdlog/spdlog.h>

/*==========================================================
 * Options
 *=========================================================*/
IndexNode::Options IndexNode::Options::fromConfig(const Config& config) {
    Options opt;
    opt.nodeName = config.getOr("node_config", "node_name", opt.nodeName);

    auto timeout_sec = config.getOr("node_config", "graceful_stop_timeout",
        static_cast<int>(std::chrono::duration_cast<std::chrono::seconds>(opt.gracefulStopTimeout).count()));
    if (timeout_sec < 0) {
        throw std::runtime_error("Config: [node_config][graceful_stop_timeout] must not be negative");
    }
    opt.gracefulStopTimeout = std::chrono::seconds(timeout_sec);

    auto interval_ms = config.getOr("node_config", "drain_poll_interval_ms",
        static_cast<int>(opt.drainPollInterval.count()));
    if (interval_ms <= 0) {
        throw std::runtime_error("Config: [node_config][drain_poll_interval_ms] must be positive");
    }
    opt.drainPollInterval = std::chrono::milliseconds(interval_ms);
    return opt;
}

/*==========================================================
 * 构造/析构
 *=========================================================*/
IndexNode::IndexNode(Options opt) : opt_(std::move(opt)) {
    spdlog::info("IndexNode: {} created, graceful stop timeout {}ms, drain poll interval {}ms",
                 opt_.nodeName, opt_.gracefulStopTimeout.count(), opt_.drainPollInterval.count());
}

IndexNode::~IndexNode() { stop(); }

/*==========================================================
 * 查询
 *=========================================================*/
std::vector<TaskKey> IndexNode::makeKeys(const std::string& clusterID,
                                         const std::vector<int64_t>& taskIDs) {
    std::vector<TaskKey> keys;
    keys.reserve(taskIDs.size());
    for (auto id : taskIDs) keys.push_back(TaskKey{clusterID, id});
    return keys;
}

std::vector<IndexNode::JobStateResult> IndexNode::queryJobs(const std::string& clusterID,
                                                            const std::vector<int64_t>& taskIDs) const {
    std::vector<JobStateResult> results;
    results.reserve(taskIDs.size());
    for (auto id : taskIDs) {
        JobStateResult r;
        r.TaskID = id;
        if (auto info = registry_.getIndexTaskInfo(TaskKey{clusterID, id})) {
            r.State               = info->State;
            r.FailReason          = std::move(info->FailReason);
            r.FileKeys            = std::move(info->FileKeys);
            r.SerializedSize      = info->SerializedSize;
            r.CurrentIndexVersion = info->CurrentIndexVersion;
            r.IndexStoreVersion   = info->IndexStoreVersion;
        }
        results.push_back(std::move(r));
    }
    spdlog::debug("IndexNode: query {} jobs of cluster {}", taskIDs.size(), clusterID);
    return results;
}

std::vector<IndexNode::AnalysisStateResult> IndexNode::queryAnalysisJobs(const std::string& clusterID,
                                                                         const std::vector<int64_t>& taskIDs) const {
    std::vector<AnalysisStateResult> results;
    results.reserve(taskIDs.size());
    for (auto id : taskIDs) {
        AnalysisStateResult r;
        r.TaskID = id;
        if (auto info = registry_.getAnalysisTaskInfo(TaskKey{clusterID, id})) {
            r.State                 = info->State;
            r.FailReason            = std::move(info->FailReason);
            r.CentroidsFile         = std::move(info->CentroidsFile);
            r.SegmentsOffsetMapping = std::move(info->SegmentsOffsetMapping);
        }
        results.push_back(std::move(r));
    }
    spdlog::debug("IndexNode: query {} analysis jobs of cluster {}", taskIDs.size(), clusterID);
    return results;
}

/*==========================================================
 * 删除
 *=========================================================*/
template <typename Detached>
void IndexNode::cancelAll(const std::vector<Detached>& tasks, const char* kind) {
    for (const auto& task : tasks) {
        try {
            task.cancel();
        } catch (const std::exception& e) {
            spdlog::error("IndexNode: cancel {} task {} failed: {}", kind, task.key().toString(), e.what());
        }
    }
}

std::size_t IndexNode::dropJobs(const std::string& clusterID, const std::vector<int64_t>& taskIDs) {
    auto deleted = registry_.deleteIndexTaskInfos(makeKeys(clusterID, taskIDs));
    cancelAll(deleted, "index");
    spdlog::info("IndexNode: drop jobs of cluster {}, requested {}, dropped {}",
                 clusterID, taskIDs.size(), deleted.size());
    return deleted.size();
}

std::size_t IndexNode::dropAnalysisJobs(const std::string& clusterID, const std::vector<int64_t>& taskIDs) {
    auto deleted = registry_.deleteAnalysisTaskInfos(makeKeys(clusterID, taskIDs));
    cancelAll(deleted, "analysis");
    spdlog::info("IndexNode: drop analysis jobs of cluster {}, requested {}, dropped {}",
                 clusterID, taskIDs.size(), deleted.size());
    return deleted.size();
}

/*==========================================================
 * 统计
 *=========================================================*/
IndexNode::JobStats IndexNode::getJobStats() {
    // 只取一次快照，计数和 Snapshot 来自同一次加锁
    JobStats stats;
    stats.Snapshot = registry_.snapshot();

    const std::string inProgress = toString(IndexState::InProgress);
    auto countInProgress = [&inProgress](const nlohmann::json& tasks) {
        std::size_t n = 0;
        for (const auto& task : tasks) {
            if (task.at("state").get<std::string>() == inProgress) ++n;
        }
        return n;
    };

    const auto& indexTasks    = stats.Snapshot.at("index_tasks");
    const auto& analysisTasks = stats.Snapshot.at("analysis_tasks");
    stats.TotalIndexTasks         = indexTasks.size();
    stats.TotalAnalysisTasks      = analysisTasks.size();
    stats.InProgressIndexTasks    = countInProgress(indexTasks);
    stats.InProgressAnalysisTasks = countInProgress(analysisTasks);
    return stats;
}

/*==========================================================
 * 生命周期
 *=========================================================*/
bool IndexNode::stop() {
    std::lock_guard lg(stop_mtx_);
    if (stopped_) return drained_;

    spdlog::info("IndexNode: {} stopping", opt_.nodeName);
    DrainController drain(registry_, ctx_, {opt_.gracefulStopTimeout, opt_.drainPollInterval});
    drained_ = drain.wait();

    ctx_.cancel();
    auto indexTasks    = registry_.deleteAllIndexTasks();
    auto analysisTasks = registry_.deleteAllAnalysisTasks();
    cancelAll(indexTasks, "index");
    cancelAll(analysisTasks, "analysis");

    stopped_ = true;
    spdlog::info("IndexNode: {} stopped, released {} index tasks and {} analysis tasks",
                 opt_.nodeName, indexTasks.size(), analysisTasks.size());
    return drained_;
}
