#include "test/fixtures.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

fs::path test_code(const fs::path &relative) {
    return fs::path(GRADER_TEST_CODE_DIR) / relative;
}

string load_test_code(const fs::path &relative) {
    return read_file_content(test_code(relative));
}

fs::path make_test_directory(const string &prefix) {
    fs::path dir = fs::temp_directory_path() / "grader-test" / (prefix + "_" + random_uuid());
    fs::create_directories(dir);
    return dir;
}

evaluation_config make_test_config(const fs::path &sandbox_root) {
    evaluation_config config;
    config.sandbox_root = sandbox_root;
    config.timeout = chrono::milliseconds(60000);
    if (getenv("DEBUG")) config.keep_sandbox = true;
    return config;
}

submission_unit make_submission(const string &name, const string &content, const string &student_id, const string &assignment_id) {
    submission_unit submission;
    submission.student_id = student_id;
    submission.assignment_id = assignment_id;
    submission.name = name;
    submission.content = content;
    return submission;
}

test_unit make_test_unit(const string &name, const string &content, const string &assignment_id) {
    test_unit unit;
    unit.assignment_id = assignment_id;
    unit.name = name;
    unit.content = content;
    return unit;
}

vector<test_unit> calculator_tests() {
    return {make_test_unit("calculator.hpp", load_test_code("calculator/calculator.hpp")),
            make_test_unit("CalculatorTest.cpp", load_test_code("calculator/CalculatorTest.cpp"))};
}

size_t count_entries(const fs::path &dir) {
    error_code ec;
    if (!fs::is_directory(dir, ec)) return 0;
    size_t count = 0;
    for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec))
        ++count;
    return count;
}

}  // namespace grader
