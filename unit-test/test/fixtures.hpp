#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "config.hpp"
#include "engine/model.hpp"

/**
 * 测试用的辅助函数
 * 测试代码（学生代码和测试单元）保存在 unit-test/gtest/test-code 中：
 * calculator/ 计算器作业，correct、partial、syntax_error、infinite_loop 为不同的学生提交
 * adder/ 加法器，子目录中是各种异常行为的测试单元
 */
namespace grader {

/**
 * @brief 测试代码目录下的文件路径
 */
std::filesystem::path test_code(const std::filesystem::path &relative);

/**
 * @brief 读取测试代码
 */
std::string load_test_code(const std::filesystem::path &relative);

/**
 * @brief 创建一个测试专用的临时目录
 */
std::filesystem::path make_test_directory(const std::string &prefix);

/**
 * @brief 测试使用的评测配置，沙箱创建在 sandbox_root 中
 */
evaluation_config make_test_config(const std::filesystem::path &sandbox_root);

submission_unit make_submission(const std::string &name, const std::string &content,
                                const std::string &student_id = "student1", const std::string &assignment_id = "calculator");

test_unit make_test_unit(const std::string &name, const std::string &content, const std::string &assignment_id = "calculator");

/**
 * @brief 计算器作业的测试单元：calculator.hpp 和 CalculatorTest.cpp（10 个测试）
 */
std::vector<test_unit> calculator_tests();

/**
 * @brief 统计目录中文件和子目录的数量
 */
size_t count_entries(const std::filesystem::path &dir);

}  // namespace grader
