#include "common/utils.hpp"
#include <unistd.h>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cstdlib>
#include <mutex>

namespace grader {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

static bool is_executable_file(const filesystem::path &path) {
    error_code ec;
    return filesystem::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
}

filesystem::path find_executable(const string &name) {
    if (name.empty()) return {};
    if (name.find('/') != string::npos) {
        filesystem::path path(name);
        return is_executable_file(path) ? filesystem::absolute(path) : filesystem::path();
    }

    vector<string> dirs;
    string path = get_env("PATH", "/usr/local/bin:/usr/bin:/bin");
    boost::split(dirs, path, boost::is_any_of(":"));
    for (const string &dir : dirs) {
        if (dir.empty()) continue;
        filesystem::path fullpath = filesystem::path(dir) / name;
        if (is_executable_file(fullpath))
            return fullpath;
    }
    return {};
}

string random_uuid() {
    // random_generator 不是线程安全的
    static mutex generator_mutex;
    static boost::uuids::random_generator generator;
    scoped_lock guard(generator_mutex);
    return boost::uuids::to_string(generator());
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace grader
