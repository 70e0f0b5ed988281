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

internal_error::internal_error()
    : grader_exception() {}

internal_error::internal_error(const string &message)
    : grader_exception(message) {}

execution_error::execution_error()
    : grader_exception() {}

execution_error::execution_error(const string &message)
    : grader_exception(message) {}

project_error::project_error(const string &message)
    : grader_exception(message) {}

assembly_error::assembly_error(const string &message)
    : project_error(message) {}

build_error::build_error(int code)
    : project_error("Build failed with error code: " + boost::lexical_cast<string>(code)), exit_code(code) {}

int build_error::code() const {
    return exit_code;
}

run_error::run_error(const string &message)
    : project_error(message) {}

prove_error::prove_error(const string &message)
    : project_error(message) {}

submit_error::submit_error(const string &message)
    : project_error(message) {}

}  // namespace grader
