#include <algorithm>
#include <cstdlib>
#include <string>
#include <gtest/gtest.h>
#include "event_listener.hpp"

/**
 * 测试程序的入口
 * 评测引擎把测试单元、学生代码的目标文件和本文件所在的运行时支持库链接成一个测试程序，
 * 并通过环境变量 GRADER_EVENT_FD、GRADER_EVENT_TOKEN 告知事件通道和令牌。
 */
int main(int argc, char *argv[]) {
    const char *fd_env = std::getenv("GRADER_EVENT_FD");
    char *token_env = std::getenv("GRADER_EVENT_TOKEN");
    std::string token = token_env ? token_env : "";
    // 令牌读取后立即从环境变量中删除，测试体中的学生代码无法再读到。
    // unsetenv 只修改 environ 指针数组，/proc/self/environ 仍然能读到原来的字符串，因此先原地清零
    if (token_env) std::fill(token_env, token_env + token.size(), '\0');
    unsetenv("GRADER_EVENT_TOKEN");

    ::testing::InitGoogleTest(&argc, argv);

    if (fd_env && !token.empty()) {
        ::testing::TestEventListeners &listeners = ::testing::UnitTest::GetInstance()->listeners();
        listeners.Append(new grader::runtime::event_listener(std::atoi(fd_env), token));
    }

    return RUN_ALL_TESTS();
}
