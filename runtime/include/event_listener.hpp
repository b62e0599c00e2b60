#pragma once

#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace grader::runtime {

/**
 * @brief 测试事件监听器，链接进每个测试程序
 * 把测试的发现、开始、结束以 JSON 行的形式写入评测引擎提供的事件通道。
 * 每个事件都带有评测引擎生成的令牌，评测引擎据此拒绝学生代码伪造的事件。
 */
class event_listener : public ::testing::EmptyTestEventListener {
public:
    event_listener(int fd, std::string token);

    /**
     * @brief 在执行任何测试之前上报所有将要执行的测试
     * 这样即使测试程序中途崩溃或超时，评测引擎也知道总共有多少个测试
     */
    void OnTestIterationStart(const ::testing::UnitTest &unit_test, int iteration) override;

    void OnTestStart(const ::testing::TestInfo &test_info) override;

    void OnTestPartResult(const ::testing::TestPartResult &result) override;

    void OnTestEnd(const ::testing::TestInfo &test_info) override;

private:
    void emit(nlohmann::json event);

    int fd;
    std::string token;
    std::vector<std::string> messages;
    std::vector<std::string> locations;
    bool exception_thrown = false;
};

/**
 * @brief 判断失败信息是否来自测试体中未捕获的异常
 */
bool is_uncaught_exception(const std::string &message);

}  // namespace grader::runtime
