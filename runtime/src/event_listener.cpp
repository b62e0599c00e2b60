#include "event_listener.hpp"
#include <errno.h>
#include <unistd.h>

namespace grader::runtime {
using namespace std;
using namespace nlohmann;

event_listener::event_listener(int fd, string token) : fd(fd), token(move(token)) {}

static string full_name(const ::testing::TestInfo &test_info) {
    return string(test_info.test_suite_name()) + "." + test_info.name();
}

bool is_uncaught_exception(const string &message) {
    // GoogleTest 对未捕获异常的描述：
    // C++ exception with description "..." thrown in the test body.
    // Unknown C++ exception thrown in the test body.
    return message.find("C++ exception") != string::npos && message.find(" thrown in ") != string::npos;
}

void event_listener::OnTestIterationStart(const ::testing::UnitTest &unit_test, int iteration) {
    if (iteration > 0) return;
    for (int i = 0; i < unit_test.total_test_suite_count(); ++i) {
        const ::testing::TestSuite *suite = unit_test.GetTestSuite(i);
        for (int j = 0; j < suite->total_test_count(); ++j) {
            const ::testing::TestInfo *test_info = suite->GetTestInfo(j);
            if (test_info->should_run())
                emit({{"event", "discovered"}, {"name", full_name(*test_info)}});
        }
    }
}

void event_listener::OnTestStart(const ::testing::TestInfo &test_info) {
    messages.clear();
    locations.clear();
    exception_thrown = false;
    emit({{"event", "start"}, {"name", full_name(test_info)}});
}

void event_listener::OnTestPartResult(const ::testing::TestPartResult &result) {
    if (!result.failed()) return;

    string message = result.message();
    messages.push_back(message);
    if (result.file_name())
        locations.push_back(result.line_number() >= 0
                                ? string(result.file_name()) + ":" + to_string(result.line_number())
                                : string(result.file_name()));
    if (is_uncaught_exception(message))
        exception_thrown = true;
}

void event_listener::OnTestEnd(const ::testing::TestInfo &test_info) {
    const ::testing::TestResult *result = test_info.result();

    string outcome;
    if (result->Skipped())
        outcome = "skipped";
    else if (exception_thrown)
        outcome = "errored";
    else if (result->Failed())
        outcome = "failed";
    else
        outcome = "passed";

    string message, stack;
    for (size_t i = 0; i < messages.size(); ++i)
        message += (i ? "\n" : "") + messages[i];
    for (size_t i = 0; i < locations.size(); ++i)
        stack += (i ? "\n" : "") + locations[i];

    emit({{"event", "end"},
          {"name", full_name(test_info)},
          {"outcome", outcome},
          {"message", message},
          {"stack", stack},
          {"elapsed_ms", (int64_t)result->elapsed_time()}});
}

void event_listener::emit(json event) {
    if (fd < 0) return;

    event["token"] = token;
    // 学生代码输出的字符串不一定是合法的 UTF-8
    string line = event.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";

    const char *data = line.data();
    size_t remaining = line.size();
    while (remaining > 0) {
        ssize_t written = write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            // 评测引擎已经不再接收事件，之后的事件全部丢弃
            fd = -1;
            return;
        }
        data += written;
        remaining -= written;
    }
}

}  // namespace grader::runtime
