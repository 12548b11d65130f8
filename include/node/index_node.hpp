#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/lifecycle_context.hpp"
#include "task/drain_controller.hpp"
#include "task/task_registry.hpp"

/*==========================================================
 * 索引节点：持有任务注册表和生命周期上下文，
 * 对 RPC 层提供查询 / 删除 / 统计接口以及关闭钩子
 *=========================================================*/
class IndexNode {
public:
    struct Options {
        std::string               nodeName{"indexnode"};
        std::chrono::milliseconds gracefulStopTimeout{std::chrono::seconds(30)};
        std::chrono::milliseconds drainPollInterval{std::chrono::seconds(1)};

        // 读取 node_config 段，缺省键使用上面的默认值
        static Options fromConfig(const Config& config);
    };

    struct JobStateResult {
        int64_t                  TaskID{};
        IndexState               State{IndexState::None};
        std::string              FailReason;
        std::vector<std::string> FileKeys;
        uint64_t                 SerializedSize{};
        int32_t                  CurrentIndexVersion{};
        int64_t                  IndexStoreVersion{};
    };

    struct AnalysisStateResult {
        int64_t                                  TaskID{};
        IndexState                               State{IndexState::None};
        std::string                              FailReason;
        std::string                              CentroidsFile;
        std::unordered_map<int64_t, std::string> SegmentsOffsetMapping;
    };

    struct JobStats {
        std::size_t    InProgressIndexTasks{};
        std::size_t    InProgressAnalysisTasks{};
        std::size_t    TotalIndexTasks{};
        std::size_t    TotalAnalysisTasks{};
        nlohmann::json Snapshot;
    };

    explicit IndexNode(Options opt);
    ~IndexNode();

    // 禁止拷贝
    IndexNode(const IndexNode&)            = delete;
    IndexNode& operator=(const IndexNode&) = delete;

    // 任务执行逻辑通过它注册 / 更新任务
    TaskRegistry&     registry() { return registry_; }
    LifecycleContext& context() { return ctx_; }
    const Options&    options() const { return opt_; }

    // 未知 ID 返回 IndexState::None
    std::vector<JobStateResult> queryJobs(const std::string& clusterID,
                                          const std::vector<int64_t>& taskIDs) const;
    std::vector<AnalysisStateResult> queryAnalysisJobs(const std::string& clusterID,
                                                       const std::vector<int64_t>& taskIDs) const;

    // 删除记录并在锁外调用取消句柄，返回实际删除的个数
    std::size_t dropJobs(const std::string& clusterID, const std::vector<int64_t>& taskIDs);
    std::size_t dropAnalysisJobs(const std::string& clusterID, const std::vector<int64_t>& taskIDs);

    JobStats getJobStats();

    // 关闭钩子：有界等待进行中的任务，然后清空注册表并取消剩余任务。
    // 可重复调用；返回 drain 是否在超时前完成
    bool stop();

private:
    template <typename Detached>
    static void cancelAll(const std::vector<Detached>& tasks, const char* kind);

    static std::vector<TaskKey> makeKeys(const std::string& clusterID,
                                         const std::vector<int64_t>& taskIDs);

    Options           opt_;
    TaskRegistry      registry_;
    LifecycleContext  ctx_;
    std::mutex        stop_mtx_;
    bool              stopped_ = false;   // stop_mtx_ 保护
    bool              drained_ = true;
};
