#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "common/bounded_log.hpp"
#include "engine/model.hpp"

namespace grader {

/**
 * @brief 测试结果收集器
 * 测试程序中的事件监听器把每个测试的发现、开始、结束写成 JSON 行，
 * 收集器按行解析并维护一个只追加的测试结果序列。
 *
 * 事件格式：
 * {"token": "...", "event": "discovered", "name": "Suite.Test"}
 * {"token": "...", "event": "start", "name": "Suite.Test"}
 * {"token": "...", "event": "end", "name": "Suite.Test", "outcome": "passed|failed|errored|skipped",
 *  "message": "...", "stack": "...", "elapsed_ms": 12}
 *
 * 没有携带正确令牌的事件会被忽略，因此学生代码无法伪造测试结果。
 * 携带令牌的事件还必须符合测试的生命周期：
 * 1. start 只接受已经发现、尚未执行过的测试，且不能有正在执行的测试
 * 2. end 只接受正在执行的测试
 * 因此每个发现的测试最多产生一个结果，结果数不会超过发现的测试数。
 * 收集器的所有函数都不会抛出异常，格式错误的输入只会记录到执行日志中。
 * 可以被多个线程同时访问：执行任务写入事件，等待方在超时后读取快照。
 */
struct result_collector {
    /**
     * @param token 本次测试执行的事件令牌
     * @param max_line_length 单条事件的长度上限，超出的事件被丢弃
     * @param max_events 最多接收的事件数
     * @param log 执行日志
     */
    result_collector(std::string token, size_t max_line_length, size_t max_events, bounded_log &log);

    /**
     * @brief 接收事件通道的原始数据
     * 数据不需要按行对齐，不完整的行会被缓存到下一次调用
     */
    void feed(const char *data, size_t size);

    /**
     * @brief 一个测试程序结束
     * 缓存中不完整的最后一行被丢弃；如果有测试正在执行，则将其记为出错
     * @param reason 测试程序结束的原因，比如 "process terminated by signal 11"
     */
    void end_process(const std::string &reason);

    /**
     * @brief 停止收集
     * 正在执行的测试被记为出错，之后到达的事件全部被忽略
     */
    void seal(const std::string &reason);

    std::vector<test_result> results() const;

    /**
     * @brief 发现的不同测试名的个数
     */
    int discovered() const;

    /**
     * @brief 正在执行的测试名
     */
    std::optional<std::string> in_flight() const;

private:
    void handle_line(const std::string &line);
    void interrupt(const std::string &reason);

    std::string token;
    size_t max_line_length;
    size_t max_events;
    bounded_log &log;

    mutable std::mutex mut;
    std::string buffer;
    bool skipping_line = false;
    bool sealed = false;
    bool reported_forgery = false;
    bool reported_overflow = false;
    size_t event_count = 0;
    std::set<std::string> discovered_names;
    std::set<std::string> finished_names;
    std::vector<test_result> test_results;
    std::optional<std::string> running_test;
    std::chrono::steady_clock::time_point running_since;
};

}  // namespace grader
