#include "common/exceptions.hpp"
#include <fmt/core.h>
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

setup_error::setup_error()
    : grader_exception() {}

setup_error::setup_error(const string &message)
    : grader_exception(message) {}

sandbox_error::sandbox_error()
    : setup_error() {}

sandbox_error::sandbox_error(const string &message)
    : setup_error(message) {}

configuration_error::configuration_error()
    : grader_exception() {}

configuration_error::configuration_error(const string &message)
    : grader_exception(message) {}

command_error::command_error(const string &command, int exit_code)
    : grader_exception(fmt::format("failed to execute: {} (exit code {})", command, exit_code)),
      command(command),
      exit_code(exit_code) {}

}  // namespace grader
