#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <stdexcept>
#include <string>

namespace grader {

/**
 * @brief 评测引擎所有异常的基类
 * 构造时记录调用栈，输出到日志时会一并打印
 */
struct grader_exception : std::exception {
    grader_exception();
    explicit grader_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const grader_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示提交的文件名、路径、大小或内容不合法
 * 在写入沙箱之前由 input_sanitizer 抛出，评测结果为 VALIDATION_FAILED
 */
struct validation_error : public grader_exception {
    validation_error();
    explicit validation_error(const std::string &message);
};

/**
 * @brief 表示评测配置错误，比如没有提供任何测试单元
 * 这是出题人的问题，而不是学生代码的问题
 */
struct configuration_error : public grader_exception {
    configuration_error();
    explicit configuration_error(const std::string &message);
};

/**
 * @brief 表示评测引擎本身无法完成测试执行
 * 比如无法创建子进程、找不到编译产物、所有测试单元都无法构建
 */
struct runner_error : public grader_exception {
    runner_error();
    explicit runner_error(const std::string &message);
};

}  // namespace grader
