#pragma once

#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>
#include "common/concurrent_queue.hpp"

/**
 * 固定大小的工作线程池
 * 每个 worker 循环从任务队列中取出任务并执行，任务的返回值和异常
 * 通过 std::future 交还给提交者。线程池析构时会先执行完已经排队的
 * 任务再退出，因此提交者必须保证任务本身能在有限时间内结束（比如
 * 通过取消令牌）。
 */
namespace grader {

struct worker_pool {
    /**
     * @brief 启动 worker 线程
     * @param size worker 数量，为 0 时使用 CPU 核心数
     * @param name 线程池名称，仅用于日志
     */
    worker_pool(size_t size, std::string name);

    worker_pool(const worker_pool &) = delete;
    worker_pool &operator=(const worker_pool &) = delete;

    /**
     * @brief 停止所有的 worker 并等待线程退出
     */
    ~worker_pool();

    /**
     * @brief 提交一个任务
     * @return 任务结果，任务抛出的异常会在 future::get 时重新抛出
     */
    template <typename F>
    std::future<std::invoke_result_t<std::decay_t<F>>> submit(F &&f) {
        using result_type = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<result_type()>>(std::forward<F>(f));
        std::future<result_type> result = task->get_future();
        if (!tasks.push([task]() { (*task)(); }))
            throw std::runtime_error("Worker pool " + pool_name + " is shutting down");
        return result;
    }

    size_t size() const;

    const std::string &name() const;

private:
    void worker_loop(size_t worker_id);

    std::string pool_name;
    concurrent_queue<std::function<void()>> tasks;
    std::vector<std::thread> workers;
};

}  // namespace grader
