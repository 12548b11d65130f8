// drain_controller.cpp
#include "task/drain_controller.hpp"

#include <algorithm>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

using Clock = LifecycleContext::Clock;

DrainController::DrainController(TaskRegistry& registry, LifecycleContext& ctx, Options opt)
    : registry_(registry), ctx_(ctx), opt_(opt)
{
    if (opt_.pollInterval <= std::chrono::milliseconds::zero()) {
        spdlog::warn("DrainController: invalid poll interval {}ms, use 1000ms", opt_.pollInterval.count());
        opt_.pollInterval = std::chrono::seconds(1);
    }
}

bool DrainController::wait() {
    if (!registry_.hasInProgressTask()) {
        return true;
    }

    const auto start    = Clock::now();
    const auto deadline = start + opt_.timeout;
    spdlog::debug("DrainController: waiting for in-progress tasks, timeout {}ms", opt_.timeout.count());

    for (;;) {
        // 在上下文上睡眠，不持有注册表的锁
        auto next = std::min(Clock::now() + opt_.pollInterval, deadline);
        if (ctx_.waitUntil(next)) {
            spdlog::warn("DrainController: lifecycle context cancelled while draining");
            break;
        }
        if (!registry_.hasInProgressTask()) {
            auto cost = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
            spdlog::debug("DrainController: all tasks left InProgress after {}ms", cost.count());
            return true;
        }
        if (Clock::now() >= deadline) break;
    }

    spdlog::warn("DrainController: timeout, the index node has some progress task");
    reportInProgressTasks();
    return false;
}

void DrainController::reportInProgressTasks() {
    std::vector<std::string> lines;

    // 锁内只做格式化，日志在锁外输出
    registry_.foreachIndexTaskInfo([&lines](const TaskKey& key, IndexTaskInfo& info) {
        if (info.State != IndexState::InProgress) return;
        lines.push_back(fmt::format("index task {} created at {}, info {}",
                                    key.toString(), formatTime(info.CreateTime),
                                    nlohmann::json(info).dump()));
    });
    registry_.foreachAnalysisTaskInfo([&lines](const TaskKey& key, AnalysisTaskInfo& info) {
        if (info.State != IndexState::InProgress) return;
        lines.push_back(fmt::format("analysis task {} created at {}, info {}",
                                    key.toString(), formatTime(info.CreateTime),
                                    nlohmann::json(info).dump()));
    });

    for (const auto& line : lines) {
        spdlog::warn("DrainController: progress task, {}", line);
    }
}
