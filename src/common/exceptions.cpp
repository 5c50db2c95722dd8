#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>
#include <sstream>

namespace streamjudge {
using namespace std;

judge_exception::judge_exception()
    : judge_exception("") {}

judge_exception::judge_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *judge_exception::what() const noexcept {
    return message.c_str();
}

string judge_exception::stack_trace() const {
    stringstream ss;
    ss << *stacktrace;
    return ss.str();
}

std::ostream &operator<<(std::ostream &os, const judge_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
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

configuration_error::configuration_error(const string &message)
    : judge_exception(message) {}

invalid_problem_id::invalid_problem_id(const string &message)
    : judge_exception(message) {}

not_found_error::not_found_error(const string &message)
    : judge_exception(message) {}

problem_not_found::problem_not_found(const string &problem_id)
    : not_found_error("Problem " + problem_id + " not found") {}

test_data_not_found::test_data_not_found(const string &problem_id)
    : not_found_error("We don't have test data for this problem yet."), problem_id(problem_id) {}

}  // namespace streamjudge
