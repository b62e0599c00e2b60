#pragma once

#include "monitor/monitor.hpp"

namespace grader {

/**
 * @brief 将评测过程输出到 glog 的监控
 */
struct logging_monitor : public monitor {
    void start_evaluation(const std::string &evaluation_id, const submission_unit &submission) override;

    void state_changed(const std::string &evaluation_id, evaluation_state from, evaluation_state to) override;

    void end_evaluation(const evaluation_report &report) override;
};

}  // namespace grader
