#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace grader {
using namespace std;

grader_exception::grader_exception()
    : grader_exception("") {}

grader_exception::grader_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *grader_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const grader_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

validation_error::validation_error()
    : grader_exception() {}

validation_error::validation_error(const string &message)
    : grader_exception(message) {}

configuration_error::configuration_error()
    : grader_exception() {}

configuration_error::configuration_error(const string &message)
    : grader_exception(message) {}

runner_error::runner_error()
    : grader_exception() {}

runner_error::runner_error(const string &message)
    : grader_exception(message) {}

}  // namespace grader
