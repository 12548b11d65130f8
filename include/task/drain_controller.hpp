// drain_controller.hpp
#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE

#include <chrono>

#include "common/lifecycle_context.hpp"
#include "task/task_registry.hpp"

// 关闭路径上的有界等待：轮询注册表直到没有 InProgress 任务，
// 或超时 / 生命周期上下文被取消。超时只打告警日志，不取消任何任务。
class DrainController {
public:
    struct Options {
        std::chrono::milliseconds timeout{std::chrono::seconds(30)};
        std::chrono::milliseconds pollInterval{std::chrono::seconds(1)};
    };

    DrainController(TaskRegistry& registry, LifecycleContext& ctx, Options opt);

    // true: 所有任务已离开 InProgress；false: 超时或被取消
    bool wait();

private:
    void reportInProgressTasks();

    TaskRegistry&       registry_;
    LifecycleContext&   ctx_;
    Options             opt_;
};
