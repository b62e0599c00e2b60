#include "common/io_utils.hpp"
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <fstream>
#include <iterator>
#include <system_error>
#include "common/defer.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(fs::path const &path) {
    ifstream fin(path.string(), ios::binary);
    if (!fin) throw system_error(errno, generic_category(), "unable to open " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const fs::path &path, const string &content, mode_t mode) {
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC | O_NOFOLLOW, mode);
    if (fd < 0) throw system_error(errno, generic_category(), "unable to create " + path.string());
    defer { close(fd); };

    // umask 可能去掉了部分权限，这里再显式设置一次
    if (fchmod(fd, mode) != 0)
        throw system_error(errno, generic_category(), "unable to set permissions of " + path.string());

    const char *data = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t written = write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            throw system_error(errno, generic_category(), "unable to write " + path.string());
        }
        data += written;
        remaining -= written;
    }
}

bool is_subpath(const fs::path &path, const fs::path &root) {
    fs::path normalized_root = fs::weakly_canonical(fs::absolute(root));
    fs::path normalized_path = fs::weakly_canonical(fs::absolute(path));

    auto root_it = normalized_root.begin(), path_it = normalized_path.begin();
    for (; root_it != normalized_root.end(); ++root_it, ++path_it) {
        // weakly_canonical 会给目录保留末尾的空段
        if (root_it->empty() && next(root_it) == normalized_root.end()) break;
        if (path_it == normalized_path.end() || *root_it != *path_it)
            return false;
    }
    for (; path_it != normalized_path.end(); ++path_it)
        if (!path_it->empty()) return true;
    return false;
}

void create_private_directory(const fs::path &dir, fs::perms mode) {
    fs::create_directories(dir);
    fs::permissions(dir, mode, fs::perm_options::replace);
}

}  // namespace grader
