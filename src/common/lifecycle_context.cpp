#include "common/lifecycle_context.hpp"

void LifecycleContext::cancel() {
    {
        std::lock_guard lg(mtx_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool LifecycleContext::cancelled() const {
    return cancelled_.load(std::memory_order_acquire);
}

bool LifecycleContext::waitUntil(TimePoint deadline) {
    std::unique_lock lk(mtx_);
    return cv_.wait_until(lk, deadline, [this] { return cancelled_.load(); });
}
