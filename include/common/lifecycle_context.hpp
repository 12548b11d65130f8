#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

// 节点级生命周期上下文：cancel() 之后所有 waitUntil/waitFor 立即返回
class LifecycleContext {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    LifecycleContext() = default;

    // 禁止拷贝
    LifecycleContext(const LifecycleContext&)            = delete;
    LifecycleContext& operator=(const LifecycleContext&) = delete;

    // 可重复调用
    void cancel();
    bool cancelled() const;

    // 睡到 deadline；返回 true 表示期间被 cancel
    bool waitUntil(TimePoint deadline);

    template <typename Rep, typename Period>
    bool waitFor(std::chrono::duration<Rep, Period> d) {
        return waitUntil(Clock::now() +
                         std::chrono::duration_cast<Clock::duration>(d));
    }

private:
    mutable std::mutex      mtx_;
    std::condition_variable cv_;
    std::atomic<bool>       cancelled_{false};
};
