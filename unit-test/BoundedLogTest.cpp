#include <thread>
#include <vector>
#include "common/bounded_log.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace grader;

TEST(BoundedLogTest, AppendsLines) {
    bounded_log log(100);
    log.append_line("Starting test: CalculatorTest.AddsPositiveNumbers");
    log.append_line("PASSED: CalculatorTest.AddsPositiveNumbers (0ms)");
    EXPECT_EQ("Starting test: CalculatorTest.AddsPositiveNumbers\nPASSED: CalculatorTest.AddsPositiveNumbers (0ms)\n", log.str());
    EXPECT_FALSE(log.truncated());
}

TEST(BoundedLogTest, TruncatesOnceAtLimit) {
    bounded_log log(20);
    log.append_line("0123456789");  // 11 个字符
    log.append_line("0123456789");  // 超出上限
    log.append_line("more");

    string content = log.str();
    EXPECT_TRUE(log.truncated());
    EXPECT_EQ(string("0123456789\n") + bounded_log::TRUNCATION_MARKER, content);
    EXPECT_EQ(string::npos, content.find("more"));
}

TEST(BoundedLogTest, ExactLimitIsNotTruncated) {
    bounded_log log(11);
    log.append_line("0123456789");
    EXPECT_FALSE(log.truncated());
    EXPECT_EQ("0123456789\n", log.str());
}

TEST(BoundedLogTest, ConcurrentAppendsStayBounded) {
    bounded_log log(1000);
    vector<thread> threads;
    for (int i = 0; i < 8; ++i)
        threads.emplace_back([&log] {
            for (int j = 0; j < 100; ++j) log.append_line("line");
        });
    for (auto &th : threads) th.join();

    EXPECT_TRUE(log.truncated());
    EXPECT_LE(log.str().size(), 1000 + string(bounded_log::TRUNCATION_MARKER).size());
}
