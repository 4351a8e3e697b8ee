#include "arbiter/common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace arbiter {
using namespace std;

judge_exception::judge_exception()
    : judge_exception("") {}

judge_exception::judge_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *judge_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const judge_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : judge_exception() {}

internal_error::internal_error(const string &message)
    : judge_exception(message) {}

process_error::process_error()
    : judge_exception() {}

process_error::process_error(const string &message)
    : judge_exception(message) {}

workspace_error::workspace_error()
    : judge_exception() {}

workspace_error::workspace_error(const string &message)
    : judge_exception(message) {}

config_error::config_error()
    : judge_exception() {}

config_error::config_error(const string &message)
    : judge_exception(message) {}

}  // namespace arbiter
