#include "engine/compiler.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <limits>
#include <regex>
#include <sstream>
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "run.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

compiler::compiler(const toolchain_config &toolchain, fs::path sandbox_root,
                   vector<fs::path> include_dirs, size_t max_file_size)
    : toolchain(toolchain), sandbox_root(move(sandbox_root)), include_dirs(move(include_dirs)), max_file_size(max_file_size) {}

static severity parse_severity(const string &text) {
    if (text == "warning") return severity::WARNING;
    if (text == "note") return severity::NOTE;
    return severity::ERROR;  // error, fatal error
}

/**
 * @brief 解析行号和列号，超出 int 范围时（比如 #line 99999999999）取 int 的最大值
 */
static int parse_position(const string &text) {
    int value = 0;
    if (boost::conversion::try_lexical_convert(text, value)) return value;
    return numeric_limits<int>::max();
}

vector<diagnostic> parse_diagnostics(const string &output) {
    static const regex with_column(R"(^(.*?):(\d+):(\d+): (fatal error|error|warning|note): (.*)$)");
    static const regex without_column(R"(^(.*?):(\d+): (fatal error|error|warning|note): (.*)$)");
    static const regex without_location(R"(^(\S+): (fatal error|error|warning|note): (.*)$)");

    vector<diagnostic> diagnostics;
    istringstream stream(output);
    string line;
    while (getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();

        smatch matches;
        diagnostic diag;
        if (regex_match(line, matches, with_column)) {
            diag.file = matches[1].str();
            diag.line = parse_position(matches[2].str());
            diag.column = parse_position(matches[3].str());
            diag.level = parse_severity(matches[4].str());
            diag.message = matches[5].str();
        } else if (regex_match(line, matches, without_column)) {
            diag.file = matches[1].str();
            diag.line = parse_position(matches[2].str());
            diag.level = parse_severity(matches[3].str());
            diag.message = matches[4].str();
        } else if (regex_match(line, matches, without_location)) {
            diag.file = matches[1].str();
            diag.level = parse_severity(matches[2].str());
            diag.message = matches[3].str();
        } else {
            continue;
        }
        diagnostics.push_back(move(diag));
    }
    return diagnostics;
}

fs::path find_artifact(const fs::path &dir, const string &filename) {
    error_code ec;
    if (!fs::is_directory(dir, ec)) return {};
    for (auto it = fs::recursive_directory_iterator(dir, ec); !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file(ec) && it->path().filename() == filename)
            return it->path();
    }
    return {};
}

static diagnostic synthetic_error(const string &file, const string &message) {
    diagnostic diag;
    diag.level = severity::ERROR;
    diag.file = file;
    diag.message = message;
    return diag;
}

compilation_outcome compiler::compile(const submission_unit &unit, const fs::path &output_dir, const cancellation_token *cancel) const {
    compilation_outcome outcome;
    string display_name = unit.name.empty() ? unit.path.filename().string() : unit.name;

    try {
        const fs::path &source = unit.path;
        if (source.empty() || !fs::is_regular_file(source)) {
            outcome.diagnostics.push_back(synthetic_error(display_name, "Source file does not exist"));
            return outcome;
        }
        if (fs::file_size(source) > max_file_size) {
            outcome.diagnostics.push_back(synthetic_error(display_name, fmt::format("Source file exceeds the size limit of {} bytes", max_file_size)));
            return outcome;
        }
        if (!is_subpath(source, sandbox_root) || !is_subpath(output_dir, sandbox_root)) {
            outcome.diagnostics.push_back(synthetic_error(display_name, "Source file or output directory is outside of the sandbox"));
            return outcome;
        }

        fs::create_directories(output_dir);
        fs::path object = fs::absolute(output_dir) / (source.stem().string() + ".o");

        vector<string> include_flags;
        for (const fs::path &dir : include_dirs)
            include_flags.push_back("-I" + fs::absolute(dir).string());

        double time_limit = chrono::duration<double>(toolchain.compile_timeout).count();

        runguard_options opt;
        // 在源文件所在目录编译，诊断信息中的文件名就是学生提交的文件名
        opt.work_dir = fs::absolute(source).parent_path().string();
        to_string_list(opt.command, toolchain.compiler, toolchain.compile_flags, include_flags,
                       "-c", source.filename(), "-o", object);
        // CPATH 等变量会改变头文件搜索路径，环境变量只保留 PATH
        opt.env = {"LANG=C", "LC_ALL=C", "TMPDIR=" + fs::absolute(output_dir).string()};
        opt.use_wall_limit = true;
        opt.wall_limit = {time_limit, time_limit};
        opt.use_cpu_limit = true;
        opt.cpu_limit = {time_limit, time_limit + 1};
        opt.memory_limit = toolchain.compile_memory_limit;
        opt.file_limit = toolchain.compile_file_limit;
        opt.stream_size = toolchain.stream_size;
        opt.no_core_dumps = true;
        opt.cancel = cancel;

        DLOG(INFO) << boost::algorithm::join(opt.command, " ");

        runguard_result result = runit(opt);
        outcome.log = result.stdout_data + result.stderr_data;
        if (result.stdout_truncated || result.stderr_truncated)
            outcome.log += "\n... [Compiler output truncated] ...";
        outcome.diagnostics = parse_diagnostics(outcome.log);

        bool has_error = false;
        for (const diagnostic &diag : outcome.diagnostics)
            if (diag.level == severity::ERROR) has_error = true;

        if (result.wall_timeout || result.cpu_timeout) {
            outcome.diagnostics.push_back(synthetic_error(display_name, fmt::format("Compilation timed out after {:.1f} seconds", time_limit)));
        } else if (result.cancelled) {
            outcome.diagnostics.push_back(synthetic_error(display_name, "Compilation was cancelled"));
        } else if (result.signal != -1 && !has_error) {
            outcome.diagnostics.push_back(synthetic_error(display_name, fmt::format("Compiler terminated with signal {}", result.signal)));
        } else if (result.exitcode != 0 && !has_error) {
            outcome.diagnostics.push_back(synthetic_error(display_name, fmt::format("Compiler exited with code {}", result.exitcode)));
        } else {
            outcome.success = result.exitcode == 0 && !has_error;
        }

        if (outcome.success) {
            fs::path artifact = find_artifact(output_dir, object.filename().string());
            if (!artifact.empty())
                outcome.artifact = artifact;
            else
                LOG(WARNING) << "Compilation of " << display_name << " succeeded but " << object.filename() << " is missing";
        }
    } catch (std::exception &ex) {
        LOG(WARNING) << "Unable to compile " << display_name << ": " << ex.what();
        outcome.success = false;
        outcome.artifact.reset();
        outcome.diagnostics.push_back(synthetic_error(display_name, string("Internal compiler error: ") + ex.what()));
    }
    return outcome;
}

}  // namespace grader
