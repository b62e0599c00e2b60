#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace grader {
using namespace std;

// clang-format off
static const unordered_map<evaluation_state, const char *> state_string = boost::assign::map_list_of
    (evaluation_state::PENDING, "Pending")
    (evaluation_state::COMPILING, "Compiling")
    (evaluation_state::TESTING, "Testing")
    (evaluation_state::COMPILE_FAILED, "Compile Failed")
    (evaluation_state::COMPLETED, "Completed")
    (evaluation_state::TIMED_OUT, "Timed Out")
    (evaluation_state::RUNNER_ERROR, "Runner Error")
    (evaluation_state::VALIDATION_FAILED, "Validation Failed");

static const unordered_map<evaluation_state, const char *> state_code = boost::assign::map_list_of
    (evaluation_state::PENDING, "PENDING")
    (evaluation_state::COMPILING, "COMPILING")
    (evaluation_state::TESTING, "TESTING")
    (evaluation_state::COMPILE_FAILED, "COMPILE_FAILED")
    (evaluation_state::COMPLETED, "COMPLETED")
    (evaluation_state::TIMED_OUT, "TIMED_OUT")
    (evaluation_state::RUNNER_ERROR, "RUNNER_ERROR")
    (evaluation_state::VALIDATION_FAILED, "VALIDATION_FAILED");

static const unordered_map<completion_kind, const char *> completion_code = boost::assign::map_list_of
    (completion_kind::COMPLETED, "COMPLETED")
    (completion_kind::TIMED_OUT, "TIMED_OUT")
    (completion_kind::RUNNER_ERROR, "RUNNER_ERROR");
// clang-format on

bool is_terminal(evaluation_state state) {
    return state != evaluation_state::PENDING &&
           state != evaluation_state::COMPILING &&
           state != evaluation_state::TESTING;
}

const char *get_display_message(evaluation_state state) {
    return state_string.at(state);
}

const char *get_code_name(evaluation_state state) {
    return state_code.at(state);
}

const char *get_code_name(completion_kind kind) {
    return completion_code.at(kind);
}

}  // namespace grader
