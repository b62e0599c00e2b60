#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/status.hpp"

namespace grader {

/**
 * @brief 保留两位小数的定点分数
 * 以百分之一分为单位保存，避免浮点误差影响分数的确定性
 */
struct fixed_score {
    int64_t hundredths = 0;

    static fixed_score from_double(double value);

    double to_double() const;

    /**
     * @brief 格式化为两位小数，比如 "80.00"
     */
    std::string to_string() const;

    friend bool operator==(const fixed_score &a, const fixed_score &b) { return a.hundredths == b.hundredths; }
    friend bool operator!=(const fixed_score &a, const fixed_score &b) { return a.hundredths != b.hundredths; }
    friend bool operator<(const fixed_score &a, const fixed_score &b) { return a.hundredths < b.hundredths; }
    friend bool operator<=(const fixed_score &a, const fixed_score &b) { return a.hundredths <= b.hundredths; }
};

/**
 * @brief 学生提交的一个源文件
 * content 和 path 二选一：path 非空时从本地文件读取
 */
struct submission_unit {
    std::string student_id;
    std::string assignment_id;

    /**
     * @brief 学生声明的文件名，比如 "Calculator.cpp"
     * 未经校验，不可信
     */
    std::string name;

    std::string content;
    std::filesystem::path path;
};

/**
 * @brief 出题人提供的一个测试单元
 * 扩展名为头文件的测试单元只作为辅助头文件，不会单独编译
 */
struct test_unit {
    std::string assignment_id;
    std::string name;
    std::string content;
    std::filesystem::path path;
};

enum class severity {
    ERROR,
    WARNING,
    NOTE
};

const char *get_code_name(severity level);

/**
 * @brief 编译器输出的一条诊断信息
 */
struct diagnostic {
    severity level = severity::ERROR;
    std::string file;
    int line = 0;

    /**
     * @brief 列号，0 表示编译器没有给出列号
     */
    int column = 0;
    std::string message;
};

/**
 * @brief 编译结果
 * success 为真当且仅当编译器正常退出且没有 ERROR 级别的诊断信息
 */
struct compilation_outcome {
    bool success = false;
    std::vector<diagnostic> diagnostics;

    /**
     * @brief 编译器的原始输出
     */
    std::string log;

    /**
     * @brief 编译产物（目标文件）的路径，编译失败或找不到产物时为空
     */
    std::optional<std::filesystem::path> artifact;
};

struct test_passed {
};

struct test_failed {
    std::string message;
    std::string stack;
};

/**
 * @brief 测试因为未捕获的异常、崩溃、提前退出或超时而中断
 */
struct test_errored {
    std::string message;
    std::string stack;
};

using test_outcome = std::variant<test_passed, test_failed, test_errored>;

/**
 * @brief 测试结果的常量名，"PASSED"、"FAILED" 或 "ERRORED"
 */
const char *get_code_name(const test_outcome &outcome);

struct test_result {
    /**
     * @brief 测试名，格式为 "Suite.Test"
     */
    std::string name;
    test_outcome outcome;
    std::chrono::milliseconds duration{0};
};

struct test_execution_outcome {
    int total = 0;
    int passed = 0;
    int failed = 0;
    int errored = 0;

    /**
     * @brief 测试程序在开始执行前声明的测试数量
     * 超时或崩溃时可能大于 total，此时未执行的测试不会被计为通过
     */
    int discovered = 0;

    /**
     * @brief 按执行顺序排列的测试结果
     */
    std::vector<test_result> results;

    /**
     * @brief 有长度上限的执行日志
     */
    std::string log;
    std::chrono::milliseconds duration{0};
    completion_kind completion = completion_kind::COMPLETED;
};

struct evaluation_report {
    std::string evaluation_id;

    /**
     * @brief 编译结果，输入校验失败或配置错误时没有编译结果
     */
    std::optional<compilation_outcome> compilation;

    /**
     * @brief 测试执行结果，编译失败时没有测试执行结果
     */
    std::optional<test_execution_outcome> execution;
    fixed_score score;
    fixed_score max_score;
    evaluation_state status = evaluation_state::PENDING;

    /**
     * @brief 校验失败、配置错误、评测引擎错误时的错误信息
     */
    std::string error;
    std::chrono::system_clock::time_point started_at;
    std::chrono::system_clock::time_point finished_at;
};

/**
 * @brief 根据测试结果列表重新统计 total、passed、failed、errored
 */
void count_results(test_execution_outcome &outcome);

void to_json(nlohmann::json &j, const fixed_score &score);
void to_json(nlohmann::json &j, const diagnostic &diag);
void to_json(nlohmann::json &j, const compilation_outcome &outcome);
void to_json(nlohmann::json &j, const test_result &result);
void to_json(nlohmann::json &j, const test_execution_outcome &outcome);

/**
 * @brief 序列化评测报告
 * 结构化的结果（状态、分数、计数、时间）放在 "result" 中，
 * 编译器输出和执行日志这类自由文本放在 "logs" 中。
 */
void to_json(nlohmann::json &j, const evaluation_report &report);

}  // namespace grader
