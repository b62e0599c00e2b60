#include "monitor/logging.hpp"
#include <glog/logging.h>

namespace grader {
using namespace std;

void logging_monitor::start_evaluation(const string &evaluation_id, const submission_unit &submission) {
    LOG(INFO) << "Evaluation " << evaluation_id << " started for student " << submission.student_id
              << ", assignment " << submission.assignment_id << ", file " << submission.name;
}

void logging_monitor::state_changed(const string &evaluation_id, evaluation_state from, evaluation_state to) {
    LOG(INFO) << "Evaluation " << evaluation_id << ": " << get_code_name(from) << " -> " << get_code_name(to);
}

void logging_monitor::end_evaluation(const evaluation_report &report) {
    if (report.status == evaluation_state::RUNNER_ERROR)
        LOG(WARNING) << "Evaluation " << report.evaluation_id << " finished with " << get_code_name(report.status)
                     << ": " << report.error;
    else
        LOG(INFO) << "Evaluation " << report.evaluation_id << " finished with " << get_code_name(report.status)
                  << ", score " << report.score.to_string() << "/" << report.max_score.to_string();
}

}  // namespace grader
