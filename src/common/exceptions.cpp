#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace hjudge {
using namespace std;

judge_exception::judge_exception()
    : judge_exception("") {}

judge_exception::judge_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

void judge_exception::append(const string &text) {
    message += text;
}

const char *judge_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const judge_exception &ex) {
    os << boost::diagnostic_information(ex) << endl
       << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : judge_exception() {}

internal_error::internal_error(const string &message)
    : judge_exception(message) {}

network_error::network_error()
    : judge_exception() {}

network_error::network_error(const string &message)
    : judge_exception(message) {}

platform_error::platform_error()
    : judge_exception() {}

platform_error::platform_error(const string &message)
    : judge_exception(message) {}

protocol_error::protocol_error()
    : judge_exception() {}

protocol_error::protocol_error(const string &message)
    : judge_exception(message) {}

sandbox_error::sandbox_error()
    : judge_exception() {}

sandbox_error::sandbox_error(const string &message)
    : judge_exception(message) {}

checker_error::checker_error()
    : judge_exception() {}

checker_error::checker_error(const string &message)
    : judge_exception(message) {}

}  // namespace hjudge
