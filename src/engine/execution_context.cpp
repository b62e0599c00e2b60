#include "engine/execution_context.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/trim.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "engine/compiler.hpp"
#include "run.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

execution_context::execution_context(const toolchain_config &toolchain, const fs::path &workspace, size_t max_file_size)
    : toolchain(toolchain), dir(fs::absolute(workspace) / ("context_" + random_uuid())), max_file_size(max_file_size) {
    create_private_directory(dir);
    DLOG(INFO) << "Created execution context " << dir;
}

execution_context::~execution_context() {
    error_code ec;
    fs::remove_all(dir, ec);
    if (ec)
        LOG(WARNING) << "Unable to remove execution context " << dir << ": " << ec.message();
}

const fs::path &execution_context::directory() const {
    return dir;
}

fs::path execution_context::staged_path(const test_unit &unit) const {
    fs::path name = unit.name.empty() ? unit.path.filename() : fs::path(unit.name);
    fs::path destination = (dir / name.relative_path()).lexically_normal();
    if (!is_subpath(destination, dir))
        throw runner_error(fmt::format("Test unit {} escapes the execution context", name.string()));
    return destination;
}

void execution_context::stage(const vector<test_unit> &tests) {
    for (const test_unit &unit : tests) {
        fs::path destination = staged_path(unit);
        string content = unit.path.empty() ? unit.content : read_file_content(unit.path);
        if (!fs::exists(destination.parent_path()))
            create_private_directory(destination.parent_path());
        write_file_content(destination, content, 0600);
    }
}

optional<fs::path> execution_context::build(const test_unit &unit, const fs::path &artifact,
                                            bounded_log &log, const cancellation_token *cancel) {
    fs::path source = staged_path(unit);
    fs::path output = dir / "build" / fmt::format("{}_{}", build_count++, source.stem().string());

    vector<fs::path> include_dirs{dir};
    if (!toolchain.gtest_include_dir.empty())
        include_dirs.push_back(toolchain.gtest_include_dir);
    for (const fs::path &include_dir : toolchain.include_dirs)
        include_dirs.push_back(include_dir);

    submission_unit test_source;
    test_source.assignment_id = unit.assignment_id;
    test_source.name = source.filename().string();
    test_source.path = source;

    compiler test_compiler(toolchain, dir, include_dirs, max_file_size);
    compilation_outcome compiled = test_compiler.compile(test_source, output, cancel);
    if (!compiled.success || !compiled.artifact) {
        log.append_line(fmt::format("WARNING: Skipping test unit {}, compilation failed", unit.name));
        for (const diagnostic &diag : compiled.diagnostics)
            if (diag.level == severity::ERROR)
                log.append_line(fmt::format("  {}:{}: {}", diag.file, diag.line, diag.message));
        return {};
    }

    fs::path program = output / source.stem();
    double time_limit = chrono::duration<double>(toolchain.compile_timeout).count();

    runguard_options opt;
    opt.work_dir = output.string();
    to_string_list(opt.command, toolchain.compiler, *compiled.artifact, fs::absolute(artifact),
                   toolchain.runtime_library, toolchain.gtest_library, toolchain.link_flags, "-o", program);
    opt.env = {"LANG=C", "LC_ALL=C", "TMPDIR=" + output.string()};
    opt.use_wall_limit = true;
    opt.wall_limit = {time_limit, time_limit};
    opt.memory_limit = toolchain.compile_memory_limit;
    opt.file_limit = toolchain.compile_file_limit;
    opt.stream_size = toolchain.stream_size;
    opt.no_core_dumps = true;
    opt.cancel = cancel;

    DLOG(INFO) << boost::algorithm::join(opt.command, " ");

    runguard_result result = runit(opt);
    if (result.cancelled) return {};
    if (result.exitcode != 0 || !fs::is_regular_file(program)) {
        // 链接失败一般是学生代码缺少测试单元需要的函数
        log.append_line(fmt::format("WARNING: Skipping test unit {}, linking failed", unit.name));
        string output_text = boost::algorithm::trim_copy(result.stdout_data + result.stderr_data);
        if (!output_text.empty()) log.append_line(output_text);
        if (result.wall_timeout) log.append_line(fmt::format("Linking timed out after {:.1f} seconds", time_limit));
        return {};
    }

    return program;
}

}  // namespace grader
