#pragma once

namespace grader {

/**
 * @brief 表示一次评测在生命周期中所处的状态
 * 状态只会沿着 PENDING -> COMPILING -> TESTING -> 终止状态 的方向推进，
 * COMPILE_FAILED、COMPLETED、TIMED_OUT、RUNNER_ERROR、VALIDATION_FAILED 为终止状态。
 */
enum class evaluation_state {
    /**
     * @brief 评测已被接收，正在校验输入
     */
    PENDING = 0,

    /**
     * @brief 正在编译学生代码
     */
    COMPILING = 1,

    /**
     * @brief 编译通过，正在执行测试
     */
    TESTING = 2,

    /**
     * @brief 学生代码无法通过编译
     * 此时没有测试执行结果，分数为 0
     */
    COMPILE_FAILED = 3,

    /**
     * @brief 所有测试都在时间限制内执行完毕
     */
    COMPLETED = 4,

    /**
     * @brief 测试执行超时，已执行的测试结果被保留
     */
    TIMED_OUT = 5,

    /**
     * @brief 评测引擎无法完成评测
     * 比如找不到编译产物、没有可执行的测试单元、无法创建子进程。
     * 这不是学生代码的问题。
     */
    RUNNER_ERROR = 6,

    /**
     * @brief 提交的文件名、路径或大小不合法，没有任何文件被写入磁盘
     */
    VALIDATION_FAILED = 7
};

/**
 * @brief 测试执行的结束方式
 */
enum class completion_kind {
    COMPLETED = 0,
    TIMED_OUT = 1,
    RUNNER_ERROR = 2
};

/**
 * @brief 判断状态是否为终止状态
 */
bool is_terminal(evaluation_state state);

const char *get_display_message(evaluation_state state);

/**
 * @brief 状态的常量名，比如 "COMPILE_FAILED"，用于 JSON 报告
 */
const char *get_code_name(evaluation_state state);

const char *get_code_name(completion_kind kind);

}  // namespace grader
