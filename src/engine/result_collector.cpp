#include "engine/result_collector.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <nlohmann/json.hpp>

namespace grader {
using namespace std;
using namespace nlohmann;

result_collector::result_collector(string token, size_t max_line_length, size_t max_events, bounded_log &log)
    : token(move(token)), max_line_length(max_line_length), max_events(max_events), log(log) {}

void result_collector::feed(const char *data, size_t size) {
    scoped_lock guard(mut);
    try {
        for (size_t i = 0; i < size; ++i) {
            char c = data[i];
            if (c == '\n') {
                if (!skipping_line) handle_line(buffer);
                buffer.clear();
                skipping_line = false;
            } else if (!skipping_line) {
                if (buffer.size() >= max_line_length) {
                    log.append_line(fmt::format("Discarding test event longer than {} bytes", max_line_length));
                    buffer.clear();
                    skipping_line = true;
                } else {
                    buffer.push_back(c);
                }
            }
        }
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unable to collect test events: " << ex.what();
    }
}

void result_collector::handle_line(const string &line) {
    if (sealed || line.empty()) return;

    if (event_count >= max_events) {
        if (!reported_overflow) {
            log.append_line(fmt::format("Too many test events, ignoring events after the first {}", max_events));
            reported_overflow = true;
        }
        return;
    }

    json j;
    try {
        j = json::parse(line);
    } catch (json::exception &) {
        log.append_line("Ignoring malformed test event: " + line.substr(0, 200));
        return;
    }

    if (!j.is_object() || !j.count("token") || !j.at("token").is_string() || j.at("token").get<string>() != token) {
        if (!reported_forgery) {
            log.append_line("Ignoring test event without a valid token");
            reported_forgery = true;
        }
        return;
    }
    ++event_count;

    try {
        string event = j.at("event").get<string>();
        string name = j.at("name").get<string>();
        if (event == "discovered") {
            discovered_names.insert(name);
        } else if (event == "start") {
            // 只接受已经发现、尚未执行过的测试，并且上一个测试必须已经结束
            if (running_test || !discovered_names.count(name) || finished_names.count(name)) {
                log.append_line("Ignoring unexpected test event: start " + name);
                return;
            }
            running_test = name;
            running_since = chrono::steady_clock::now();
            log.append_line("Starting test: " + name);
        } else if (event == "end") {
            if (!running_test || *running_test != name) {
                log.append_line("Ignoring unexpected test event: end " + name);
                return;
            }
            string outcome = j.at("outcome").get<string>();
            string message = j.value("message", "");
            string stack = j.value("stack", "");
            test_result result;
            result.name = name;
            result.duration = chrono::milliseconds(j.value("elapsed_ms", (int64_t)0));

            if (outcome == "passed") {
                result.outcome = test_passed{};
                log.append_line(fmt::format("PASSED: {} ({}ms)", name, result.duration.count()));
            } else if (outcome == "errored") {
                result.outcome = test_errored{message, stack};
                log.append_line(fmt::format("ERROR: {} ({}ms) - {}", name, result.duration.count(), message));
            } else {
                if (outcome == "skipped") message = "Test was skipped";
                result.outcome = test_failed{message, stack};
                log.append_line(fmt::format("FAILED: {} ({}ms) - {}", name, result.duration.count(), message));
            }
            test_results.push_back(move(result));
            finished_names.insert(name);
            running_test.reset();
        } else {
            log.append_line("Ignoring unknown test event: " + event);
        }
    } catch (json::exception &ex) {
        log.append_line(string("Ignoring incomplete test event: ") + ex.what());
    }
}

void result_collector::interrupt(const string &reason) {
    if (!running_test) return;

    test_result result;
    result.name = *running_test;
    result.duration = chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - running_since);
    result.outcome = test_errored{reason, ""};
    log.append_line(fmt::format("ERROR: {} ({}ms) - {}", result.name, result.duration.count(), reason));
    test_results.push_back(move(result));
    finished_names.insert(*running_test);
    running_test.reset();
}

void result_collector::end_process(const string &reason) {
    scoped_lock guard(mut);
    try {
        buffer.clear();
        skipping_line = false;
        if (!sealed) interrupt(reason);
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unable to collect test events: " << ex.what();
    }
}

void result_collector::seal(const string &reason) {
    scoped_lock guard(mut);
    try {
        if (!sealed) interrupt(reason);
        sealed = true;
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unable to collect test events: " << ex.what();
    }
}

vector<test_result> result_collector::results() const {
    scoped_lock guard(mut);
    return test_results;
}

int result_collector::discovered() const {
    scoped_lock guard(mut);
    return (int)discovered_names.size();
}

optional<string> result_collector::in_flight() const {
    scoped_lock guard(mut);
    return running_test;
}

}  // namespace grader
