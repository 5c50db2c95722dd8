#include "stream/event_stream.hpp"
#include <boost/core/demangle.hpp>
#include <boost/stacktrace.hpp>
#include <sstream>
#include <typeinfo>
#include "common/exceptions.hpp"

namespace streamjudge::stream {
using namespace std;
using namespace nlohmann;

const char *event_name(event_type type) {
    switch (type) {
        case event_type::COMPILE: return "compile";
        case event_type::EXECUTE: return "execute";
        default: return "error";
    }
}

json compile_event_data(const backend::compile_result &result) {
    if (result.compile_output)
        return *result.compile_output;
    return json(result);
}

stream_event make_compile_event(const backend::compile_result &result) {
    return stream_event{event_type::COMPILE, compile_event_data(result)};
}

stream_event make_execute_event(const json &data) {
    return stream_event{event_type::EXECUTE, data};
}

stream_event make_error_event(const std::exception &ex) {
    string stacktrace;
    if (auto judge_ex = dynamic_cast<const judge_exception *>(&ex)) {
        stacktrace = judge_ex->stack_trace();
    } else {
        stringstream ss;
        ss << boost::stacktrace::stacktrace();
        stacktrace = ss.str();
    }

    json data = {{"error", ex.what()},
                 {"exception_type", boost::core::demangle(typeid(ex).name())},
                 {"stacktrace", stacktrace}};
    return stream_event{event_type::ERROR, data};
}

string encode(const stream_event &event) {
    // 选手程序的输出可能不是合法的 UTF-8，用替换字符代替非法字节
    return string("event: ") + event_name(event.type) + "\ndata: " +
           event.data.dump(-1, ' ', false, json::error_handler_t::replace) + "\n\n";
}

event_stream_writer::event_stream_writer(ostream &out) : out(out) {}

bool event_stream_writer::write(const stream_event &event) {
    if (!out) return false;
    out << encode(event);
    out.flush();
    if (!out) return false;
    ++count;
    return true;
}

size_t event_stream_writer::written() const {
    return count;
}

}  // namespace streamjudge::stream
