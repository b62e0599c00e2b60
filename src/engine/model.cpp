#include "engine/model.hpp"
#include <fmt/chrono.h>
#include <fmt/core.h>
#include <cmath>
#include <cstdlib>

namespace grader {
using namespace std;
using namespace nlohmann;

fixed_score fixed_score::from_double(double value) {
    return fixed_score{static_cast<int64_t>(llround(value * 100))};
}

double fixed_score::to_double() const {
    return hundredths / 100.0;
}

string fixed_score::to_string() const {
    int64_t abs_value = llabs(hundredths);
    return fmt::format("{}{}.{:02d}", hundredths < 0 ? "-" : "", abs_value / 100, abs_value % 100);
}

const char *get_code_name(severity level) {
    switch (level) {
        case severity::ERROR: return "ERROR";
        case severity::WARNING: return "WARNING";
        case severity::NOTE: return "NOTE";
    }
    return "UNKNOWN";
}

const char *get_code_name(const test_outcome &outcome) {
    if (holds_alternative<test_passed>(outcome)) return "PASSED";
    if (holds_alternative<test_failed>(outcome)) return "FAILED";
    return "ERRORED";
}

void count_results(test_execution_outcome &outcome) {
    outcome.total = outcome.passed = outcome.failed = outcome.errored = 0;
    for (const test_result &result : outcome.results) {
        ++outcome.total;
        if (holds_alternative<test_passed>(result.outcome))
            ++outcome.passed;
        else if (holds_alternative<test_failed>(result.outcome))
            ++outcome.failed;
        else
            ++outcome.errored;
    }
}

static string format_timestamp(chrono::system_clock::time_point time) {
    auto millis = chrono::duration_cast<chrono::milliseconds>(time.time_since_epoch()).count() % 1000;
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03d}Z", fmt::gmtime(chrono::system_clock::to_time_t(time)), millis);
}

void to_json(json &j, const fixed_score &score) {
    j = score.to_string();
}

void to_json(json &j, const diagnostic &diag) {
    j = {{"severity", get_code_name(diag.level)},
         {"file", diag.file},
         {"line", diag.line},
         {"column", diag.column},
         {"message", diag.message}};
}

void to_json(json &j, const compilation_outcome &outcome) {
    j = {{"success", outcome.success},
         {"diagnostics", outcome.diagnostics}};
    if (outcome.artifact)
        j["artifact"] = outcome.artifact->filename().string();
}

void to_json(json &j, const test_result &result) {
    j = {{"name", result.name},
         {"outcome", get_code_name(result.outcome)},
         {"duration_ms", result.duration.count()}};
    if (auto failure = get_if<test_failed>(&result.outcome)) {
        j["message"] = failure->message;
        j["stack"] = failure->stack;
    } else if (auto error = get_if<test_errored>(&result.outcome)) {
        j["message"] = error->message;
        j["stack"] = error->stack;
    }
}

void to_json(json &j, const test_execution_outcome &outcome) {
    j = {{"total", outcome.total},
         {"passed", outcome.passed},
         {"failed", outcome.failed},
         {"errored", outcome.errored},
         {"discovered", outcome.discovered},
         {"completion", get_code_name(outcome.completion)},
         {"duration_ms", outcome.duration.count()},
         {"results", outcome.results}};
}

void to_json(json &j, const evaluation_report &report) {
    json result = {{"status", get_code_name(report.status)},
                   {"score", report.score},
                   {"max_score", report.max_score},
                   {"started_at", format_timestamp(report.started_at)},
                   {"finished_at", format_timestamp(report.finished_at)}};
    if (report.compilation) result["compilation"] = *report.compilation;
    if (report.execution) result["execution"] = *report.execution;
    if (!report.error.empty()) result["error"] = report.error;

    json logs = json::object();
    if (report.compilation) logs["compiler"] = report.compilation->log;
    if (report.execution) logs["execution"] = report.execution->log;

    j = {{"evaluation_id", report.evaluation_id},
         {"result", result},
         {"logs", logs}};
}

}  // namespace grader
