#pragma once

#include <optional>
#include "engine/model.hpp"

namespace grader {

/**
 * @brief 根据编译结果和测试执行结果计算分数和评测状态
 */
struct scorer {
    explicit scorer(fixed_score max_score);

    /**
     * @brief 汇总评测结果
     * 1. 编译失败：COMPILE_FAILED，分数为 0，丢弃测试执行结果
     * 2. 编译成功但没有测试执行结果（比如找不到编译产物）：RUNNER_ERROR，分数为 0
     * 3. 否则状态与 completion 一致，分数为 passed / max(total, discovered) * max_score，
     *    没有任何测试时分数为 0。超时或出错时未执行的测试不会被算作通过。
     * 分数以有理数精确计算，四舍五入到两位小数。
     * evaluation_id、error 和时间戳由调用者填写。
     */
    evaluation_report aggregate(const compilation_outcome &compilation, const std::optional<test_execution_outcome> &execution) const;

    /**
     * @brief 按通过的测试数计算分数
     * @param passed 通过的测试数
     * @param total 测试总数，为 0 时分数为 0
     */
    fixed_score compute(int passed, int total) const;

private:
    fixed_score max_score;
};

}  // namespace grader
