#include "sandbox/sandbox.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

fs::path sandbox::plan(const fs::path &sandbox_root, const string &student_id, const string &assignment_id) {
    return fs::absolute(sandbox_root).lexically_normal() / "sandboxes" /
           fmt::format("sandbox_{}_{}_{}", student_id, assignment_id, random_uuid());
}

sandbox::sandbox(fs::path dir, bool keep) : directory(move(dir)), keep(keep) {
    create_private_directory(directory.parent_path());
    if (!fs::create_directory(directory))
        throw runner_error(fmt::format("Sandbox directory {} already exists", directory.string()));

    try {
        fs::permissions(directory, fs::perms::owner_all, fs::perm_options::replace);
        for (const fs::path &sub : {source_dir(), build_dir(), tests_dir(), output_dir()})
            create_private_directory(sub);
    } catch (...) {
        // 构造失败时析构函数不会执行，需要在这里清理已经创建的目录
        error_code ec;
        fs::remove_all(directory, ec);
        throw;
    }

    DLOG(INFO) << "Created sandbox " << directory;
}

sandbox::~sandbox() {
    if (keep) {
        LOG(INFO) << "Keeping sandbox " << directory;
        return;
    }

    error_code ec;
    fs::remove_all(directory, ec);
    if (ec)
        LOG(WARNING) << "Unable to remove sandbox " << directory << ": " << ec.message();
    else
        DLOG(INFO) << "Removed sandbox " << directory;
}

const fs::path &sandbox::root() const {
    return directory;
}

fs::path sandbox::source_dir() const {
    return directory / "src";
}

fs::path sandbox::build_dir() const {
    return directory / "build";
}

fs::path sandbox::tests_dir() const {
    return directory / "tests";
}

fs::path sandbox::output_dir() const {
    return directory / "output";
}

void sandbox::write_file(const fs::path &destination, const string &content) const {
    if (!is_subpath(destination, directory))
        throw runner_error(fmt::format("Refusing to write {} outside of sandbox {}", destination.string(), directory.string()));

    fs::path parent = destination.parent_path();
    if (!fs::exists(parent)) create_private_directory(parent);
    write_file_content(destination, content, 0600);
}

}  // namespace grader
