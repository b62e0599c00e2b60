#pragma once

#include <string>
#include "common/status.hpp"
#include "engine/model.hpp"

namespace grader {

/**
 * @brief 执行监控行为
 * 评测引擎在评测开始、状态变化、评测结束时通知所有已注册的监控。
 * 监控可能被多个评测线程同时调用，实现需要自行保证线程安全。
 * 监控抛出的异常只会被记录到日志，不会影响评测结果。
 */
struct monitor {
    virtual ~monitor();

    /**
     * @brief 监控上报开始评测一个提交
     * @param evaluation_id 评测编号
     * @param submission 学生提交
     */
    virtual void start_evaluation(const std::string &evaluation_id, const submission_unit &submission);

    /**
     * @brief 监控上报评测状态发生变化
     * @param evaluation_id 评测编号
     * @param from 原状态
     * @param to 新状态
     */
    virtual void state_changed(const std::string &evaluation_id, evaluation_state from, evaluation_state to);

    /**
     * @brief 监控上报已经完成一个提交的评测
     * @param report 评测报告
     */
    virtual void end_evaluation(const evaluation_report &report);
};

}  // namespace grader
