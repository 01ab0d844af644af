#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace arena {
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

unsupported_language::unsupported_language(const string &language)
    : judge_exception("Unsupported language: " + language), language(language) {}

grading_rejected::grading_rejected()
    : judge_exception() {}

grading_rejected::grading_rejected(const string &message)
    : judge_exception(message) {}

grading_cancelled::grading_cancelled()
    : judge_exception("Grading cancelled") {}

grading_cancelled::grading_cancelled(const string &message)
    : judge_exception(message) {}

store_error::store_error()
    : judge_exception() {}

store_error::store_error(const string &message)
    : judge_exception(message) {}

}  // namespace arena
