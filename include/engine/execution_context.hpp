#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "common/bounded_log.hpp"
#include "common/cancellation.hpp"
#include "config.hpp"
#include "engine/model.hpp"

namespace grader {

/**
 * @brief 一次测试执行的隔离环境
 * 测试程序只能看到：学生代码的编译产物、测试单元（以及辅助头文件）、
 * 运行时支持库和 GoogleTest，不会与其他评测共享任何文件。
 * 析构时删除整个目录。
 *
 * context_[uuid]
 * ├── CalculatorTest.cpp // 测试单元和辅助头文件
 * ├── calculator.hpp
 * └── build
 *     └── 0_CalculatorTest // 每个测试单元的目标文件和测试程序
 *         ├── CalculatorTest.o
 *         └── CalculatorTest
 */
struct execution_context {
    /**
     * @param toolchain 编译器和资源限制
     * @param workspace 执行环境的父目录，一般是沙箱的 tests 目录
     * @param max_file_size 测试单元的大小上限
     */
    execution_context(const toolchain_config &toolchain, const std::filesystem::path &workspace, size_t max_file_size);

    execution_context(const execution_context &) = delete;
    execution_context &operator=(const execution_context &) = delete;

    ~execution_context();

    const std::filesystem::path &directory() const;

    /**
     * @brief 将测试单元复制进执行环境
     * @throw runner_error 测试单元的文件名会逃出执行环境
     * @throw std::system_error 无法读取或写入测试单元
     */
    void stage(const std::vector<test_unit> &tests);

    /**
     * @brief 编译测试单元并与学生代码的编译产物链接成测试程序
     * 失败原因（编译错误、链接错误、未定义的符号）会写入执行日志。
     * @param unit 已经通过 stage 复制进来的测试单元
     * @param artifact 学生代码的目标文件
     * @param log 执行日志
     * @param cancel 取消标记
     * @return 测试程序的路径，构建失败时为空
     */
    std::optional<std::filesystem::path> build(const test_unit &unit, const std::filesystem::path &artifact,
                                               bounded_log &log, const cancellation_token *cancel);

private:
    std::filesystem::path staged_path(const test_unit &unit) const;

    toolchain_config toolchain;
    std::filesystem::path dir;
    size_t max_file_size;
    int build_count = 0;
};

}  // namespace grader
