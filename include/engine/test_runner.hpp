#pragma once

#include <chrono>
#include <filesystem>
#include <vector>
#include "common/worker_pool.hpp"
#include "config.hpp"
#include "engine/model.hpp"

namespace grader {

/**
 * @brief 测试执行引擎
 * 在独立的执行环境中把每个测试单元与学生代码的编译产物链接成测试程序，
 * 在 runguard 中逐个执行，并通过事件通道收集每个测试的结果。
 *
 * 所有测试单元的构建和执行作为一个整体提交到执行线程池，从任务开始运行起，调用者最多等待 timeout：
 * 1. 按时完成：completion 为 COMPLETED
 * 2. 超时：取消任务（runguard 会杀死测试程序的进程组），最多再等待 cancel_grace，
 *    保留已经收集到的结果，正在执行的测试记为出错，completion 为 TIMED_OUT
 * 3. 任务抛出异常：保留已经收集到的结果，completion 为 RUNNER_ERROR
 * 无论哪种情况，执行环境都会被删除。
 */
struct test_runner {
    /**
     * @param pool 执行线程池，必须与调用 run 的线程所在的线程池不同
     * @param toolchain 编译器和测试程序的资源限制
     * @param config 本次评测的配置，用于日志长度上限、文件大小上限和辅助头文件扩展名
     * @param workspace 执行环境的父目录，必须位于沙箱内
     */
    test_runner(worker_pool &pool, const toolchain_config &toolchain, const evaluation_config &config,
                std::filesystem::path workspace);

    /**
     * @brief 执行测试
     * 这个函数不会抛出异常，所有错误都体现在 completion 和执行日志中。
     * @param artifact 学生代码的编译产物，必须存在
     * @param tests 测试单元，至少有一个不是辅助头文件
     * @param timeout 构建和执行所有测试程序的时间上限
     */
    test_execution_outcome run(const std::filesystem::path &artifact, const std::vector<test_unit> &tests,
                               std::chrono::milliseconds timeout) const;

private:
    worker_pool &pool;
    toolchain_config toolchain;
    evaluation_config config;
    std::filesystem::path workspace;
};

}  // namespace grader
