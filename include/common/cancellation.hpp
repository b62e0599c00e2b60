#pragma once

#include <atomic>

namespace grader {

/**
 * @brief 协作式取消标记
 * 等待方在超时后调用 cancel，执行方（runguard 的轮询循环、测试执行任务）
 * 周期性检查 is_cancelled 并尽快结束，runguard 会杀死整个子进程组。
 */
struct cancellation_token {
    void cancel() noexcept {
        cancelled.store(true);
    }

    bool is_cancelled() const noexcept {
        return cancelled.load();
    }

private:
    std::atomic<bool> cancelled{false};
};

}  // namespace grader
