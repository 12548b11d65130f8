#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "common/lifecycle_context.hpp"
#include "task/drain_controller.hpp"
#include "task/task_registry.hpp"
#include "log_capture.hpp"

using namespace std::chrono_literals;
using SteadyClock = std::chrono::steady_clock;

namespace {

IndexTaskInfo inProgressIndexTask() {
    IndexTaskInfo info;
    info.State = IndexState::InProgress;
    return info;
}

AnalysisTaskInfo inProgressAnalysisTask() {
    AnalysisTaskInfo info;
    info.State = IndexState::InProgress;
    return info;
}

}  // namespace

class DrainControllerTest : public ::testing::Test {
 protected:
    TaskRegistry     registry;
    LifecycleContext ctx;
};

TEST_F(DrainControllerTest, ReturnsImmediatelyWhenNothingInProgress) {
    IndexTaskInfo finished;
    finished.State = IndexState::Finished;
    registry.loadOrStoreIndexTask({"C1", 1}, finished);

    DrainController drain(registry, ctx, {10s, 1s});
    auto start = SteadyClock::now();
    EXPECT_TRUE(drain.wait());
    EXPECT_LT(SteadyClock::now() - start, 500ms);
}

// 任务在第 2 个轮询周期结束，远早于超时
TEST_F(DrainControllerTest, ReturnsOnceTaskFinishesBeforeTimeout) {
    LogCapture capture;
    const TaskKey key{"C1", 100};
    registry.loadOrStoreIndexTask(key, inProgressIndexTask());

    std::thread runner([&] {
        std::this_thread::sleep_for(200ms);
        registry.storeIndexTaskState(key, IndexState::Finished, "");
    });

    DrainController drain(registry, ctx, {1s, 100ms});
    auto start = SteadyClock::now();
    bool drained = drain.wait();
    auto cost = SteadyClock::now() - start;
    runner.join();

    EXPECT_TRUE(drained);
    EXPECT_GE(cost, 200ms);
    EXPECT_LT(cost, 1s);
    EXPECT_TRUE(capture.str().empty()) << capture.str();
}

TEST_F(DrainControllerTest, TimeoutReportsStuckTask) {
    LogCapture capture;
    registry.loadOrStoreAnalysisTask({"C1", 200}, inProgressAnalysisTask());
    IndexTaskInfo finished;
    finished.State = IndexState::Finished;
    registry.loadOrStoreIndexTask({"C1", 300}, finished);

    DrainController drain(registry, ctx, {250ms, 100ms});
    auto start = SteadyClock::now();
    EXPECT_FALSE(drain.wait());
    EXPECT_GE(SteadyClock::now() - start, 250ms);

    auto logs = capture.str();
    EXPECT_NE(logs.find("timeout"), std::string::npos) << logs;
    EXPECT_NE(logs.find("analysis task C1/200"), std::string::npos) << logs;
    EXPECT_EQ(logs.find("C1/300"), std::string::npos) << logs;

    // 超时不会取消或删除任务
    EXPECT_EQ(registry.loadAnalysisTaskState({"C1", 200}), IndexState::InProgress);
}

TEST_F(DrainControllerTest, ContextCancelEndsWaitEarly) {
    LogCapture capture;
    registry.loadOrStoreIndexTask({"C1", 100}, inProgressIndexTask());

    std::thread canceller([&] {
        std::this_thread::sleep_for(100ms);
        ctx.cancel();
    });

    DrainController drain(registry, ctx, {10s, 1s});
    auto start = SteadyClock::now();
    EXPECT_FALSE(drain.wait());
    EXPECT_LT(SteadyClock::now() - start, 2s);
    canceller.join();

    EXPECT_NE(capture.str().find("index task C1/100"), std::string::npos) << capture.str();
}

TEST_F(DrainControllerTest, ZeroTimeoutReportsWithoutWaiting) {
    LogCapture capture;
    registry.loadOrStoreIndexTask({"C1", 100}, inProgressIndexTask());

    DrainController drain(registry, ctx, {0ms, 1s});
    auto start = SteadyClock::now();
    EXPECT_FALSE(drain.wait());
    EXPECT_LT(SteadyClock::now() - start, 500ms);
    EXPECT_NE(capture.str().find("C1/100"), std::string::npos);
}

TEST(LifecycleContextTest, WaitReturnsFalseOnDeadline) {
    LifecycleContext ctx;
    EXPECT_FALSE(ctx.waitFor(20ms));
    EXPECT_FALSE(ctx.cancelled());
    ctx.cancel();
    EXPECT_TRUE(ctx.cancelled());
    EXPECT_TRUE(ctx.waitFor(10s));
}
