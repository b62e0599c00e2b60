#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace grader {

/**
 * @brief 可关闭的并发任务队列
 * 关闭之后不再接受新元素，已经排队的元素仍然可以被取出，
 * 取空之后 pop 返回 std::nullopt，等待中的读者全部被唤醒。
 * @param <T> 队列元素类型
 */
template <typename T>
struct concurrent_queue {
    /**
     * @brief 阻塞等待直到队列非空或者队列被关闭
     * @return 队头元素，队列已关闭且为空时返回 std::nullopt
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> mlock(mut);
        cond.wait(mlock, [this] { return !q.empty() || closed; });
        if (q.empty()) return std::nullopt;
        T result = std::move(q.front());
        q.pop();
        return result;
    }

    /**
     * @return 队列已关闭时返回 false，元素被丢弃
     */
    bool push(T value) {
        {
            std::lock_guard<std::mutex> mlock(mut);
            if (closed) return false;
            q.push(std::move(value));
        }
        cond.notify_one();
        return true;
    }

    void close() {
        {
            std::lock_guard<std::mutex> mlock(mut);
            closed = true;
        }
        cond.notify_all();
    }

private:
    std::queue<T> q;
    bool closed = false;
    std::mutex mut;
    std::condition_variable cond;
};

}  // namespace grader
