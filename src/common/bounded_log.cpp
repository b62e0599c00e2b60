#include "common/bounded_log.hpp"

namespace grader {
using namespace std;

bounded_log::bounded_log(size_t max_chars) : max_chars(max_chars) {}

void bounded_log::append_line(const string &line) {
    scoped_lock guard(mut);
    if (is_truncated) return;

    if (content.size() + line.size() + 1 > max_chars) {
        content += TRUNCATION_MARKER;
        is_truncated = true;
        return;
    }
    content += line;
    content += '\n';
}

string bounded_log::str() const {
    scoped_lock guard(mut);
    return content;
}

bool bounded_log::truncated() const {
    scoped_lock guard(mut);
    return is_truncated;
}

}  // namespace grader
