#include "monitor/monitor.hpp"

namespace grader {
using namespace std;

monitor::~monitor() {}

void monitor::start_evaluation(const string &, const submission_unit &) {}

void monitor::state_changed(const string &, evaluation_state, evaluation_state) {}

void monitor::end_evaluation(const evaluation_report &) {}

}  // namespace grader
