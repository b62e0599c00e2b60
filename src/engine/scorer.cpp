#include "engine/scorer.hpp"
#include <boost/rational.hpp>
#include <algorithm>

namespace grader {
using namespace std;

scorer::scorer(fixed_score max_score) : max_score(max_score) {}

fixed_score scorer::compute(int passed, int total) const {
    if (total <= 0 || passed <= 0) return fixed_score{0};
    passed = min(passed, total);

    boost::rational<int64_t> score(int64_t(passed) * max_score.hundredths, total);
    // 四舍五入：floor(score + 1/2)
    boost::rational<int64_t> rounded = score + boost::rational<int64_t>(1, 2);
    return fixed_score{rounded.numerator() / rounded.denominator()};
}

evaluation_report scorer::aggregate(const compilation_outcome &compilation, const optional<test_execution_outcome> &execution) const {
    evaluation_report report;
    report.compilation = compilation;
    report.max_score = max_score;
    report.score = fixed_score{0};

    if (!compilation.success) {
        report.status = evaluation_state::COMPILE_FAILED;
        return report;
    }

    if (!execution) {
        report.status = evaluation_state::RUNNER_ERROR;
        return report;
    }

    report.execution = execution;
    switch (execution->completion) {
        case completion_kind::COMPLETED: report.status = evaluation_state::COMPLETED; break;
        case completion_kind::TIMED_OUT: report.status = evaluation_state::TIMED_OUT; break;
        case completion_kind::RUNNER_ERROR: report.status = evaluation_state::RUNNER_ERROR; break;
    }

    int denominator = max(execution->total, execution->discovered);
    report.score = compute(execution->passed, denominator);
    return report;
}

}  // namespace grader
