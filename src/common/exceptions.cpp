#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace arbiter {
using namespace std;

arbiter_exception::arbiter_exception()
    : arbiter_exception("") {}

arbiter_exception::arbiter_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *arbiter_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const arbiter_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : arbiter_exception() {}

internal_error::internal_error(const string &message)
    : arbiter_exception(message) {}

spawn_error::spawn_error()
    : arbiter_exception() {}

spawn_error::spawn_error(const string &message)
    : arbiter_exception(message) {}

configuration_error::configuration_error()
    : arbiter_exception() {}

configuration_error::configuration_error(const string &message)
    : arbiter_exception(message) {}

judge_cancelled::judge_cancelled()
    : arbiter_exception("judging cancelled") {}

}  // namespace arbiter
