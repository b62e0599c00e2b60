#pragma once

#include <functional>
#include <future>
#include <memory>
#include <vector>
#include "common/worker_pool.hpp"
#include "config.hpp"
#include "engine/model.hpp"
#include "monitor/monitor.hpp"

namespace grader {

/**
 * @brief 评测引擎的入口
 * 一次评测的流程：
 * 1. 校验学生编号和作业编号
 * 2. 检查是否提供了测试单元，没有则为配置错误
 * 3. 校验所有文件名和文件大小，此时还没有写入任何文件
 * 4. 检查学生代码的内容
 * 5. 创建沙箱并写入文件
 * 6. 编译学生代码
 * 7. 执行测试
 * 8. 计算分数
 * 评测结束后沙箱被删除。
 *
 * 评测引擎持有两个线程池：评测线程池执行 evaluate_async 提交的评测，
 * 执行线程池执行测试，因此评测任务等待测试执行时不会占用自己所在的线程池。
 * 除了这两个线程池和监控之外，评测之间不共享任何状态。
 */
struct evaluator {
    /**
     * @param toolchain 编译工具链配置，对所有评测生效
     * @param workers 每个线程池的线程数，为 0 时使用 CPU 核心数
     */
    explicit evaluator(const toolchain_config &toolchain, size_t workers = 0);

    evaluator(const evaluator &) = delete;
    evaluator &operator=(const evaluator &) = delete;

    /**
     * @brief 注册监控
     * 必须在开始评测之前注册
     */
    void register_monitor(std::unique_ptr<monitor> &&monitor);

    /**
     * @brief 同步评测一个提交
     * 通过输入校验之后这个函数不会抛出异常，评测引擎自身的错误会变成 RUNNER_ERROR。
     * @param submission 学生提交
     * @param tests 测试单元，按顺序执行
     * @param config 本次评测的配置
     * @return 评测报告，状态一定是终止状态
     */
    evaluation_report evaluate(const submission_unit &submission, const std::vector<test_unit> &tests, const evaluation_config &config) const;

    /**
     * @brief 将评测提交到评测线程池
     */
    std::future<evaluation_report> evaluate_async(submission_unit submission, std::vector<test_unit> tests, evaluation_config config);

private:
    void call_monitor(const std::function<void(monitor &)> &callback) const;

    toolchain_config toolchain;
    std::vector<std::unique_ptr<monitor>> monitors;

    // 评测线程池中的任务会使用执行线程池，因此评测线程池必须先析构
    mutable worker_pool execution_pool;
    worker_pool evaluation_pool;
};

}  // namespace grader
