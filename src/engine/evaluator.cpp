#include "engine/evaluator.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <set>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "engine/compiler.hpp"
#include "engine/scorer.hpp"
#include "engine/test_runner.hpp"
#include "sandbox/sandbox.hpp"
#include "sandbox/sanitizer.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

evaluator::evaluator(const toolchain_config &toolchain, size_t workers)
    : toolchain(toolchain), execution_pool(workers, "execution"), evaluation_pool(workers, "evaluation") {}

void evaluator::register_monitor(unique_ptr<monitor> &&monitor) {
    monitors.push_back(move(monitor));
}

void evaluator::call_monitor(const function<void(monitor &)> &callback) const {
    for (auto &monitor : monitors) {
        try {
            callback(*monitor);
        } catch (std::exception &ex) {
            LOG(ERROR) << "Monitor has crashed when reporting evaluation state, " << ex.what();
        }
    }
}

/**
 * @brief 文件的大小，content 为空时读取 path 指向的本地文件
 * @throw validation_error 本地文件不存在
 */
static size_t unit_size(const string &name, const string &content, const fs::path &path) {
    if (path.empty()) return content.size();
    error_code ec;
    size_t size = fs::file_size(path, ec);
    if (ec) throw validation_error(fmt::format("Unable to read {}: {}", name, ec.message()));
    return size;
}

static string unit_content(const string &name, const string &content, const fs::path &path) {
    if (path.empty()) return content;
    try {
        return read_file_content(path);
    } catch (std::system_error &ex) {
        throw validation_error(fmt::format("Unable to read {}: {}", name, ex.what()));
    }
}

evaluation_report evaluator::evaluate(const submission_unit &submission, const vector<test_unit> &tests, const evaluation_config &config) const {
    evaluation_report report;
    report.evaluation_id = random_uuid();
    report.started_at = chrono::system_clock::now();
    // 满分为负数的配置会在下面被拒绝，报告中不出现负数满分
    report.max_score = max(config.max_score, fixed_score{0});

    evaluation_state state = evaluation_state::PENDING;
    auto transition = [&](evaluation_state next) {
        call_monitor([&](monitor &m) { m.state_changed(report.evaluation_id, state, next); });
        state = next;
    };
    auto finish = [&](evaluation_report &&result) {
        result.evaluation_id = report.evaluation_id;
        result.started_at = report.started_at;
        result.max_score = report.max_score;
        result.finished_at = chrono::system_clock::now();
        transition(result.status);
        call_monitor([&](monitor &m) { m.end_evaluation(result); });
        return move(result);
    };
    auto fail = [&](evaluation_state status, const string &error) {
        report.status = status;
        report.error = error;
        report.score = fixed_score{0};
        return finish(move(report));
    };

    call_monitor([&](monitor &m) { m.start_evaluation(report.evaluation_id, submission); });

    input_sanitizer sanitizer(config);
    string submission_name = submission.name.empty() ? submission.path.filename().string() : submission.name;
    fs::path sandbox_dir, source_path;
    vector<fs::path> test_paths;
    string source_content;
    try {
        validate(config);
        sanitizer.validate_identifier(submission.student_id, "student_id");
        sanitizer.validate_identifier(submission.assignment_id, "assignment_id");

        if (tests.empty())
            throw configuration_error(fmt::format("No test units were provided for assignment {}", submission.assignment_id));

        sandbox_dir = sandbox::plan(config.sandbox_root, submission.student_id, submission.assignment_id);
        source_path = sanitizer.sanitize(submission_name, unit_size(submission_name, submission.content, submission.path),
                                         sandbox_dir / "src", file_kind::SOURCE);

        set<fs::path> seen;
        size_t source_units = 0;
        for (const test_unit &unit : tests) {
            string name = unit.name.empty() ? unit.path.filename().string() : unit.name;
            fs::path destination = sanitizer.sanitize(name, unit_size(name, unit.content, unit.path),
                                                      sandbox_dir / "tests", file_kind::TEST_UNIT);
            if (!seen.insert(destination).second)
                throw validation_error(fmt::format("Duplicate test unit {}", name));
            if (!sanitizer.is_header(destination)) ++source_units;
            test_paths.push_back(destination);
        }
        if (source_units == 0)
            throw configuration_error(fmt::format("Assignment {} has only support headers and no test units", submission.assignment_id));

        source_content = unit_content(submission_name, submission.content, submission.path);
        sanitizer.screen_content(source_content, submission_name);
    } catch (validation_error &ex) {
        LOG(INFO) << "Evaluation " << report.evaluation_id << " rejected: " << ex.what();
        return fail(evaluation_state::VALIDATION_FAILED, ex.what());
    } catch (configuration_error &ex) {
        LOG(WARNING) << "Evaluation " << report.evaluation_id << " is misconfigured: " << ex.what();
        return fail(evaluation_state::RUNNER_ERROR, ex.what());
    } catch (fs::filesystem_error &ex) {
        // 无法访问沙箱根目录等情况，与学生提交无关
        LOG(ERROR) << "Evaluation " << report.evaluation_id << " failed: " << ex.what();
        return fail(evaluation_state::RUNNER_ERROR, ex.what());
    }

    optional<compilation_outcome> compilation;
    try {
        sandbox box(sandbox_dir, config.keep_sandbox);
        box.write_file(source_path, source_content);

        vector<test_unit> staged;
        for (size_t i = 0; i < tests.size(); ++i) {
            const test_unit &unit = tests[i];
            box.write_file(test_paths[i], unit.path.empty() ? unit.content : read_file_content(unit.path));

            test_unit staged_unit;
            staged_unit.assignment_id = unit.assignment_id;
            staged_unit.name = test_paths[i].lexically_relative(box.tests_dir()).string();
            staged_unit.path = test_paths[i];
            staged.push_back(move(staged_unit));
        }

        transition(evaluation_state::COMPILING);

        // 辅助头文件对学生代码可见
        vector<fs::path> include_dirs{box.tests_dir()};
        include_dirs.insert(include_dirs.end(), toolchain.include_dirs.begin(), toolchain.include_dirs.end());
        compiler student_compiler(toolchain, box.root(), include_dirs, config.max_file_size_bytes);

        submission_unit source = submission;
        source.name = submission_name;
        source.content.clear();
        source.path = source_path;
        compilation = student_compiler.compile(source, box.output_dir());

        scorer aggregator(config.max_score);
        if (!compilation->success)
            return finish(aggregator.aggregate(*compilation, nullopt));

        if (!compilation->artifact) {
            evaluation_report result = aggregator.aggregate(*compilation, nullopt);
            result.error = fmt::format("Compilation of {} succeeded but the compiled artifact is missing", submission_name);
            return finish(move(result));
        }

        transition(evaluation_state::TESTING);

        test_runner runner(execution_pool, toolchain, config, box.tests_dir());
        test_execution_outcome execution = runner.run(*compilation->artifact, staged, config.timeout);

        evaluation_report result = aggregator.aggregate(*compilation, execution);
        if (result.status == evaluation_state::RUNNER_ERROR)
            result.error = "Test execution could not be completed, see the execution log";
        return finish(move(result));
    } catch (grader_exception &ex) {
        LOG(ERROR) << "Evaluation " << report.evaluation_id << " failed: " << ex;
        report.compilation = compilation;
        return fail(evaluation_state::RUNNER_ERROR, ex.what());
    } catch (std::exception &ex) {
        LOG(ERROR) << "Evaluation " << report.evaluation_id << " failed: " << ex.what();
        report.compilation = compilation;
        return fail(evaluation_state::RUNNER_ERROR, ex.what());
    }
}

future<evaluation_report> evaluator::evaluate_async(submission_unit submission, vector<test_unit> tests, evaluation_config config) {
    return evaluation_pool.submit([this, submission = move(submission), tests = move(tests), config = move(config)]() {
        return evaluate(submission, tests, config);
    });
}

}  // namespace grader
